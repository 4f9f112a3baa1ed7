#pragma once

#include <string>

#include "model/Customization.hpp"
#include "nlohmann/json.hpp"

namespace io {

// Writers use the camelCase keys of the exported snapshot format.
// Readers throw std::runtime_error naming the offending path (`where`).

nlohmann::json color_scheme_to_json(const model::ColorScheme& s);
model::ColorScheme color_scheme_from_json(const nlohmann::json& j, const std::string& where);

nlohmann::json typography_to_json(const model::TypographySettings& t);
model::TypographySettings typography_from_json(const nlohmann::json& j, const std::string& where);

nlohmann::json layout_to_json(const model::LayoutSettings& l);
model::LayoutSettings layout_from_json(const nlohmann::json& j, const std::string& where);

// {"sections": {"<id>": {...}, ...}}; reader returns sections ordered by id.
nlohmann::json section_visibility_to_json(const model::SectionVisibility& v);
model::SectionVisibility section_visibility_from_json(const nlohmann::json& j, const std::string& where);

nlohmann::json customization_to_json(const model::TemplateCustomization& c);
model::TemplateCustomization customization_from_json(const nlohmann::json& j, const std::string& where);

} // namespace io
