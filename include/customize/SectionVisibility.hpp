#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "model/Customization.hpp"
#include "nlohmann/json.hpp"

namespace customize {

struct SectionOverride {
    std::optional<bool> visible;
    std::optional<int> order;
};

struct ContentValidation {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

struct SectionAnalytics {
    int total_sections = 0;
    int visible_sections = 0;
    int required_sections = 0;
    int optional_sections = 0;
    int content_completeness = 0; // 0..100
    int ats_score = 0;            // 0..100
    std::vector<std::string> recommendations;
};

// Twelve-section catalog in catalog order.
model::SectionVisibility default_sections();

// Required sections plus the role's recommended ones; unknown roles get only required.
model::SectionVisibility role_specific_sections(const std::string& role);

// Throws ValidationFailed if a required section would end hidden.
model::SectionVisibility create_custom_visibility(const std::map<std::string, SectionOverride>& overrides);

model::SectionVisibility toggle_section(const std::string& id, const model::SectionVisibility& current);

// Listed ids take orders 1..N; the rest follow in their existing relative order.
model::SectionVisibility reorder_sections(const std::vector<std::string>& ids,
                                          const model::SectionVisibility& current);

std::vector<model::SectionConfig> visible_sections(const model::SectionVisibility& v);

// `content` is the raw section payload: an array of items, an object or a string.
ContentValidation validate_section_content(const std::string& id,
                                           const nlohmann::json& content,
                                           const model::SectionVisibility& v);

model::SectionVisibility optimize_for_ats(const model::SectionVisibility& v);

// `content` maps section id -> payload.
SectionAnalytics section_analytics(const model::SectionVisibility& v, const nlohmann::json& content);

std::string export_configuration(const model::SectionVisibility& v);
model::SectionVisibility import_configuration(const std::string& config_json);

} // namespace customize
