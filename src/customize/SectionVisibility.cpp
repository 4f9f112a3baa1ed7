#include "customize/SectionVisibility.hpp"

#include "errors/TemplateError.hpp"
#include "io/CustomizationJson.hpp"
#include "util/TextUtil.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace customize {

using model::SectionConfig;
using model::SectionVisibility;

namespace {

const std::vector<std::string>& ats_order() {
    static const std::vector<std::string> order = {
        "contact", "summary", "experience", "education", "skills", "certifications",
        "projects", "awards", "publications", "languages", "volunteer", "references"
    };
    return order;
}

const std::map<std::string, std::vector<std::string>>& role_table() {
    static const std::map<std::string, std::vector<std::string>> roles = {
        {"software-engineer", {"projects", "skills", "certifications"}},
        {"designer", {"projects", "skills", "awards"}},
        {"manager", {"summary", "skills", "awards", "certifications"}},
        {"consultant", {"summary", "skills", "certifications", "publications"}},
        {"academic", {"publications", "awards", "certifications"}},
        {"healthcare", {"certifications", "skills", "education"}},
        {"finance", {"certifications", "skills", "education"}},
        {"sales", {"awards", "skills", "summary"}},
        {"marketing", {"projects", "skills", "awards"}},
        {"entry-level", {"education", "skills", "projects", "volunteer"}},
    };
    return roles;
}

bool truthy(const nlohmann::json& j) {
    if (j.is_null()) return false;
    if (j.is_boolean()) return j.get<bool>();
    if (j.is_number()) return j.get<double>() != 0.0;
    if (j.is_string()) return !j.get<std::string>().empty();
    return true;
}

bool field_truthy(const nlohmann::json& obj, const char* key) {
    return obj.is_object() && obj.contains(key) && truthy(obj.at(key));
}

// Visible sections sorted by order; ties keep catalog order.
std::vector<const SectionConfig*> sorted_visible(const SectionVisibility& v) {
    std::vector<const SectionConfig*> out;
    for (const auto& s : v.sections) {
        if (s.visible) out.push_back(&s);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const SectionConfig* a, const SectionConfig* b) { return a->order < b->order; });
    return out;
}

// 0..1; each of the five leading sections is worth 20 points.
double section_order_fraction(const std::vector<const SectionConfig*>& visible) {
    static const std::vector<std::string> ideal = {"contact", "summary", "experience", "education", "skills"};
    double score = 0;
    double max_score = 0;

    for (size_t i = 0; i < ideal.size(); ++i) {
        max_score += 20;
        const int ideal_order = static_cast<int>(i) + 1;
        for (const SectionConfig* s : visible) {
            if (s->id != ideal[i]) continue;
            if (s->order == ideal_order) {
                score += 20;
            } else {
                score += std::max(0, 20 - std::abs(s->order - ideal_order) * 5);
            }
            break;
        }
    }
    return max_score > 0 ? score / max_score : 0.0;
}

} // namespace

SectionVisibility default_sections() {
    // id, name, visible, required, priority, order, min, max, description
    SectionVisibility v;
    v.sections = {
        {"contact", "Contact Information", true, true, 1, 1, 1, 1, "Essential contact details for the employer to reach you"},
        {"summary", "Professional Summary", true, false, 2, 2, 1, 1, "Brief overview of your professional background and goals"},
        {"experience", "Work Experience", true, true, 3, 3, 1, 10, "Professional work history and achievements"},
        {"education", "Education", true, false, 4, 4, 1, 5, "Academic qualifications and certifications"},
        {"skills", "Skills", true, false, 5, 5, 1, 20, "Technical and professional skills"},
        {"projects", "Projects", false, false, 6, 6, 1, 10, "Notable projects and achievements"},
        {"certifications", "Certifications", false, false, 7, 7, 1, 10, "Professional certifications and licenses"},
        {"awards", "Awards & Honors", false, false, 8, 8, 1, 10, "Professional awards and recognition"},
        {"publications", "Publications", false, false, 9, 9, 1, 10, "Academic and professional publications"},
        {"languages", "Languages", false, false, 10, 10, 1, 10, "Language proficiency"},
        {"volunteer", "Volunteer Experience", false, false, 11, 11, 1, 10, "Volunteer work and community involvement"},
        {"references", "References", false, false, 12, 12, 0, 5, "Professional references"},
    };
    return v;
}

SectionVisibility role_specific_sections(const std::string& role) {
    SectionVisibility v = default_sections();

    std::vector<std::string> recommended;
    auto it = role_table().find(textutil::to_lower_copy(textutil::trim_copy(role)));
    if (it != role_table().end()) recommended = it->second;

    for (auto& s : v.sections) {
        s.visible = s.required ||
                    std::find(recommended.begin(), recommended.end(), s.id) != recommended.end();
    }
    return v;
}

SectionVisibility create_custom_visibility(const std::map<std::string, SectionOverride>& overrides) {
    SectionVisibility v = default_sections();

    for (auto& s : v.sections) {
        auto it = overrides.find(s.id);
        if (it == overrides.end()) continue;
        if (it->second.visible) s.visible = *it->second.visible;
        if (it->second.order) s.order = *it->second.order;
    }

    std::vector<std::string> missing;
    for (const auto& s : v.sections) {
        if (s.required && !s.visible) missing.push_back(s.id);
    }
    if (!missing.empty()) {
        throw errors::validation_error("Required sections cannot be hidden: " + textutil::join(missing, ", "),
                                       {{"missingRequired", missing}});
    }

    const auto visible = sorted_visible(v);
    std::set<int> orders;
    for (const SectionConfig* s : visible) orders.insert(s->order);

    if (orders.size() != visible.size()) {
        std::vector<std::string> ordered_ids;
        for (const SectionConfig* s : visible) ordered_ids.push_back(s->id);
        return reorder_sections(ordered_ids, v);
    }
    return v;
}

SectionVisibility toggle_section(const std::string& id, const SectionVisibility& current) {
    SectionVisibility v = current;
    SectionConfig* s = v.find(id);
    if (!s) {
        throw errors::validation_error("Section '" + id + "' not found", {{"sectionId", id}});
    }
    if (s->required && s->visible) {
        throw errors::validation_error("Required section '" + s->name + "' cannot be hidden", {{"sectionId", id}});
    }
    s->visible = !s->visible;
    return v;
}

SectionVisibility reorder_sections(const std::vector<std::string>& ids, const SectionVisibility& current) {
    std::vector<std::string> missing;
    for (const auto& id : ids) {
        if (!current.find(id)) missing.push_back(id);
    }
    if (!missing.empty()) {
        throw errors::validation_error("Sections not found: " + textutil::join(missing, ", "),
                                       {{"missingSections", missing}});
    }

    SectionVisibility v = current;
    std::set<std::string> placed;
    int next = 1;
    for (const auto& id : ids) {
        if (!placed.insert(id).second) continue;
        v.find(id)->order = next++;
    }

    std::vector<SectionConfig*> rest;
    for (auto& s : v.sections) {
        if (!placed.count(s.id)) rest.push_back(&s);
    }
    std::stable_sort(rest.begin(), rest.end(), [&current](const SectionConfig* a, const SectionConfig* b) {
        return current.find(a->id)->order < current.find(b->id)->order;
    });
    for (SectionConfig* s : rest) s->order = next++;

    return v;
}

std::vector<SectionConfig> visible_sections(const SectionVisibility& v) {
    std::vector<SectionConfig> out;
    for (const SectionConfig* s : sorted_visible(v)) out.push_back(*s);
    return out;
}

ContentValidation validate_section_content(const std::string& id,
                                           const nlohmann::json& content,
                                           const SectionVisibility& v) {
    ContentValidation r;
    const SectionConfig* section = v.find(id);
    if (!section) {
        r.valid = false;
        r.errors.push_back("Section '" + id + "' not found");
        return r;
    }

    if (section->visible) {
        if (!truthy(content) || (content.is_array() && content.empty())) {
            r.errors.push_back("Visible section '" + section->name + "' has no content");
        }
        if (content.is_array()) {
            const int n = static_cast<int>(content.size());
            if (n < section->min_items) {
                r.errors.push_back("Section '" + section->name + "' requires at least " +
                                   std::to_string(section->min_items) + " items");
            }
            if (n > section->max_items) {
                r.warnings.push_back("Section '" + section->name + "' has more than " +
                                     std::to_string(section->max_items) + " items, consider reducing");
            }
        }

        if (id == "contact" && content.is_object()) {
            for (const char* field : {"name", "email", "phone"}) {
                if (!field_truthy(content, field)) {
                    r.errors.push_back(std::string("Contact information missing required field: ") + field);
                }
            }
        } else if (id == "experience" && content.is_array()) {
            for (size_t i = 0; i < content.size(); ++i) {
                const auto& item = content[i];
                const std::string n = std::to_string(i + 1);
                if (!field_truthy(item, "title") || !field_truthy(item, "company")) {
                    r.errors.push_back("Experience item " + n + " missing title or company");
                }
                if (!field_truthy(item, "startDate")) {
                    r.warnings.push_back("Experience item " + n + " missing start date");
                }
            }
        } else if (id == "education" && content.is_array()) {
            for (size_t i = 0; i < content.size(); ++i) {
                const auto& item = content[i];
                if (!field_truthy(item, "institution") || !field_truthy(item, "degree")) {
                    r.errors.push_back("Education item " + std::to_string(i + 1) + " missing institution or degree");
                }
            }
        } else if (id == "skills" && content.is_array() && content.size() < 3) {
            r.warnings.push_back("Consider adding more skills to showcase your abilities");
        }
    }

    r.valid = r.errors.empty();
    return r;
}

SectionVisibility optimize_for_ats(const SectionVisibility& v) {
    SectionVisibility out = v;
    const auto& order = ats_order();

    for (size_t i = 0; i < order.size(); ++i) {
        SectionConfig* s = out.find(order[i]);
        if (!s) continue;
        s->order = static_cast<int>(i) + 1;
        if (s->id == "contact" || s->id == "experience" || s->id == "education" || s->id == "skills") {
            s->visible = true;
        }
    }
    return out;
}

SectionAnalytics section_analytics(const SectionVisibility& v, const nlohmann::json& content) {
    SectionAnalytics a;
    const auto visible = sorted_visible(v);

    int required = 0;
    int visible_required = 0;
    double total = 0;
    double max_total = 0;

    for (const auto& s : v.sections) {
        if (s.required) {
            ++required;
            if (s.visible) ++visible_required;
        }

        max_total += 10;
        if (!s.visible || !content.is_object() || !content.contains(s.id)) continue;

        const auto& c = content.at(s.id);
        if (!truthy(c)) continue;
        if (c.is_array()) {
            total += s.min_items > 0
                ? std::min(10.0, static_cast<double>(c.size()) / s.min_items * 10.0)
                : 10.0;
        } else {
            total += 5;
        }
    }

    a.total_sections = static_cast<int>(v.sections.size());
    a.visible_sections = static_cast<int>(visible.size());
    a.required_sections = required;
    a.optional_sections = a.total_sections - required;
    a.content_completeness = max_total > 0 ? static_cast<int>(std::round(total / max_total * 100)) : 0;

    const double required_score = required > 0 ? static_cast<double>(visible_required) / required * 40 : 40;
    const double order_score = section_order_fraction(visible) * 30;
    const double content_score = a.content_completeness * 0.3;
    a.ats_score = static_cast<int>(std::round(required_score + order_score + content_score));

    if (visible_required < required) {
        a.recommendations.push_back("Ensure all required sections are visible");
    }
    if (a.content_completeness < 80) {
        a.recommendations.push_back("Add more content to improve completeness");
    }
    if (a.visible_sections < 5) {
        a.recommendations.push_back("Consider showing more sections to showcase your qualifications");
    }
    if (a.visible_sections > 8) {
        a.recommendations.push_back("Consider hiding some sections to maintain focus");
    }
    return a;
}

std::string export_configuration(const SectionVisibility& v) {
    nlohmann::json j = io::section_visibility_to_json(v);
    j["version"] = "1.0";
    j["timestamp"] = textutil::iso8601_now();
    return j.dump(2);
}

SectionVisibility import_configuration(const std::string& config_json) {
    nlohmann::json config;
    try {
        config = nlohmann::json::parse(config_json);
    } catch (const nlohmann::json::exception& e) {
        throw errors::validation_error("Failed to parse configuration", {{"error", e.what()}});
    }

    if (!config.is_object() || !config.contains("sections")) {
        throw errors::validation_error("Invalid configuration format");
    }

    SectionVisibility parsed;
    try {
        parsed = io::section_visibility_from_json(config, "configuration");
    } catch (const std::runtime_error& e) {
        throw errors::validation_error("Failed to parse configuration", {{"error", e.what()}});
    }

    std::map<std::string, SectionOverride> overrides;
    for (const auto& s : parsed.sections) {
        overrides[s.id] = SectionOverride{s.visible, s.order};
    }
    return create_custom_visibility(overrides);
}

} // namespace customize
