#include "render/DataBinder.hpp"

#include "io/JsonIO.hpp"
#include "util/TextUtil.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>

namespace render {

using nlohmann::json;

namespace {

bool is_empty_value(const json& v) {
    if (v.is_null()) return true;
    if (v.is_string()) return textutil::trim_copy(v.get<std::string>()).empty();
    if (v.is_array() || v.is_object()) return v.empty();
    return false;
}

std::string value_text(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_array()) {
        std::vector<std::string> parts;
        for (const auto& e : v) {
            if (e.is_string()) parts.push_back(e.get<std::string>());
        }
        return textutil::join(parts, ", ");
    }
    if (v.is_null()) return {};
    return v.dump();
}

bool valid_email(const std::string& s) {
    static const std::regex re(R"(^[^\s@]+@[^\s@]+\.[^\s@]+$)");
    return std::regex_match(s, re);
}

bool valid_phone(const std::string& s) {
    int digits = 0;
    for (char c : s) {
        const unsigned char u = static_cast<unsigned char>(c);
        if (std::isdigit(u)) {
            ++digits;
        } else if (c != '+' && c != '-' && c != '(' && c != ')' && c != '.' && c != ' ') {
            return false;
        }
    }
    return digits >= 7;
}

bool valid_url(const std::string& s) {
    const std::string lower = textutil::to_lower_copy(s);
    return (textutil::starts_with(lower, "http://") && lower.size() > 7) ||
           (textutil::starts_with(lower, "https://") && lower.size() > 8);
}

bool hidden_by(const model::TemplateCustomization* c, const std::string& catalog_id) {
    if (!c) return false;
    const model::SectionConfig* cfg = c->section_visibility.find(catalog_id);
    return cfg && !cfg->visible;
}

bool is_required(const model::FieldDefinition& f) {
    if (f.required) return true;
    return std::any_of(f.validation.begin(), f.validation.end(),
                       [](const model::ValidationRule& r) { return r.type == "required"; });
}

} // namespace

json section_data(const model::SectionDefinition& section, const model::ResumeData& resume) {
    const json all = io::resume_to_json(resume);

    json out;
    switch (section.type) {
        case model::SectionType::PersonalInfo:
            out = all.at("personalInfo");
            break;
        case model::SectionType::Summary:
            if (!textutil::trim_copy(resume.summary).empty()) out = {{"summary", resume.summary}};
            break;
        case model::SectionType::Experience:
            out = all.at("experience");
            break;
        case model::SectionType::Education:
            out = all.at("education");
            break;
        case model::SectionType::Skills:
            if (!resume.skills.empty()) out = all.at("skills");
            break;
        case model::SectionType::Certifications:
            out = all.at("certifications");
            break;
        case model::SectionType::Projects:
            out = all.at("projects");
            break;
        case model::SectionType::Languages:
            out = all.at("languages");
            break;
        case model::SectionType::Custom:
            if (resume.extras.is_object() && resume.extras.contains(section.id)) out = resume.extras.at(section.id);
            break;
    }

    if (is_empty_value(out)) return json();
    return out;
}

std::string check_rule(const model::ValidationRule& rule, const std::string& field_name, const std::string& value) {
    auto fail = [&](const std::string& def) { return rule.message.empty() ? def : rule.message; };

    if (rule.type == "email") {
        if (!valid_email(value)) return fail(field_name + " must be a valid email address");
    } else if (rule.type == "phone") {
        if (!valid_phone(value)) return fail(field_name + " must be a valid phone number");
    } else if (rule.type == "url") {
        if (!valid_url(value)) return fail(field_name + " must be a valid URL");
    } else if (rule.type == "min-length") {
        if (static_cast<double>(value.size()) < rule.value) {
            return fail(field_name + " must be at least " + textutil::format_number(rule.value) + " characters");
        }
    } else if (rule.type == "max-length") {
        if (static_cast<double>(value.size()) > rule.value) {
            return fail(field_name + " must be at most " + textutil::format_number(rule.value) + " characters");
        }
    } else if (rule.type == "pattern" && !rule.pattern.empty()) {
        try {
            if (!std::regex_search(value, std::regex(rule.pattern))) {
                return fail(field_name + " has an invalid format");
            }
        } catch (const std::regex_error& e) {
            return field_name + " has an unusable pattern rule: " + e.what();
        }
    }
    return {};
}

BindingResult ResumeDataBinder::bind(const model::ResumeTemplate& tmpl,
                                     const model::ResumeData& resume,
                                     const model::TemplateCustomization* customization) {
    BindingResult result;

    std::vector<const model::SectionDefinition*> sections;
    for (const auto& s : tmpl.sections) sections.push_back(&s);
    std::stable_sort(sections.begin(), sections.end(),
                     [](const model::SectionDefinition* a, const model::SectionDefinition* b) {
                         return a->order < b->order;
                     });

    for (const model::SectionDefinition* section : sections) {
        const std::string catalog_id = model::catalog_section_id(section->type, section->id);
        if (hidden_by(customization, catalog_id)) continue;

        json data = section_data(*section, resume);
        if (data.is_null()) {
            if (section->required) {
                result.errors.push_back({"REQUIRED_SECTION_EMPTY",
                                         "Required section '" + section->name + "' has no data",
                                         "", section->id, true});
            } else {
                result.warnings.push_back({"Section '" + section->name + "' has no data",
                                           "Section may appear incomplete", "", section->id});
            }
            continue;
        }

        // Object payloads are one item; arrays are bound item by item.
        std::vector<const json*> items;
        if (data.is_array()) {
            for (const auto& item : data) items.push_back(&item);
        } else {
            items.push_back(&data);
        }

        for (size_t i = 0; i < items.size(); ++i) {
            const json& item = *items[i];
            for (const auto& field : section->fields) {
                ++result.metadata.total_fields;

                json value;
                if (item.is_object()) {
                    if (item.contains(field.id)) value = item.at(field.id);
                } else {
                    value = item;
                }

                const std::string where = items.size() > 1 ? field.id + "[" + std::to_string(i) + "]" : field.id;

                if (is_empty_value(value)) {
                    if (is_required(field)) {
                        result.errors.push_back({"REQUIRED_FIELD_MISSING",
                                                 "Required field '" + field.name + "' is missing",
                                                 where, section->id, false});
                    }
                    continue;
                }

                ++result.metadata.bound_fields;
                const std::string text = value_text(value);

                if (field.max_length > 0 && static_cast<int>(text.size()) > field.max_length) {
                    result.errors.push_back({"FIELD_VALIDATION_ERROR",
                                             field.name + " exceeds " + std::to_string(field.max_length) +
                                                 " characters",
                                             where, section->id, true});
                }
                for (const auto& rule : field.validation) {
                    const std::string msg = check_rule(rule, field.name, text);
                    if (!msg.empty()) {
                        result.errors.push_back({"FIELD_VALIDATION_ERROR", msg, where, section->id, true});
                    }
                }
            }
        }

        result.data[section->id] = data;
    }

    if (result.metadata.total_fields > 0) {
        const double pct = 100.0 * result.metadata.bound_fields / result.metadata.total_fields;
        result.metadata.data_completeness = std::round(pct * 100.0) / 100.0;
    } else {
        result.metadata.data_completeness = result.data.empty() ? 0.0 : 100.0;
    }

    result.success = std::none_of(result.errors.begin(), result.errors.end(),
                                  [](const BindingError& e) { return !e.recoverable; });
    return result;
}

} // namespace render
