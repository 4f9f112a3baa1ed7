#pragma once

#include <string>

#include "model/ResumeData.hpp"
#include "model/Template.hpp"
#include "nlohmann/json.hpp"

namespace io {

// Throws std::runtime_error naming the file, or the JSON path that failed validation.
nlohmann::json read_json_file(const std::string& path);
void write_json_file(const std::string& path, const nlohmann::json& j);

model::ResumeTemplate parse_template(const nlohmann::json& j);
model::ResumeData parse_resume(const nlohmann::json& j);

model::ResumeTemplate load_template(const std::string& path);
model::ResumeData load_resume(const std::string& path);

nlohmann::json resume_to_json(const model::ResumeData& r);

// Section id -> payload in the shape the section analytics and content checks read.
nlohmann::json section_content_from_resume(const model::ResumeData& r);

} // namespace io
