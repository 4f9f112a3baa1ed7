#include "io/JsonIO.hpp"

#include "io/JsonRequire.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace io {

using json = nlohmann::json;
using namespace detail;

static std::string index_path(const std::string& where, const char* key, size_t i) {
    std::ostringstream oss;
    oss << where << "." << key << "[" << i << "]";
    return oss.str();
}

static const json* optional_object(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return nullptr;
    require_object(j.at(key), where + "." + key);
    return &j.at(key);
}

static const json* optional_array(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return nullptr;
    require_array(j.at(key), where + "." + key);
    return &j.at(key);
}

json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open JSON file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }
    return j;
}

void write_json_file(const std::string& path, const json& j) {
    const fs::path p(path);
    if (p.has_parent_path()) fs::create_directories(p.parent_path());

    std::ofstream out(p);
    if (!out) {
        throw std::runtime_error("failed to write JSON file: " + path);
    }
    out << j.dump(2) << "\n";
}

// ---------- template ----------

static model::ValidationRule parse_rule(const json& j, const std::string& where) {
    require_object(j, where);

    model::ValidationRule r;
    r.type = require_string(j, "type", where);
    r.value = optional_number(j, "value", where, 0.0);
    r.pattern = optional_string(j, "pattern", where);
    r.message = optional_string(j, "message", where);
    return r;
}

static model::FieldDefinition parse_field(const json& j, const std::string& where) {
    require_object(j, where);

    model::FieldDefinition f;
    f.id = require_string(j, "id", where);
    f.name = optional_string(j, "name", where, f.id);
    f.type = optional_string(j, "type", where, "text");
    f.required = optional_bool(j, "required", where, false);
    f.placeholder = optional_string(j, "placeholder", where);
    f.max_length = static_cast<int>(optional_number(j, "maxLength", where, 0));

    if (const json* rules = optional_array(j, "validation", where)) {
        for (size_t i = 0; i < rules->size(); ++i) {
            f.validation.push_back(parse_rule(rules->at(i), index_path(where, "validation", i)));
        }
    }
    return f;
}

static model::SectionDefinition parse_section(const json& j, const std::string& where) {
    require_object(j, where);

    model::SectionDefinition s;
    s.id = require_string(j, "id", where);
    s.name = optional_string(j, "name", where, s.id);
    s.type = model::parse_section_type(require_string(j, "type", where));
    s.required = optional_bool(j, "required", where, false);
    s.order = static_cast<int>(require_number(j, "order", where));
    s.default_visible = optional_bool(j, "defaultVisible", where, true);
    s.alignment = optional_string(j, "alignment", where, "left");
    s.columns = static_cast<int>(optional_number(j, "columns", where, 1));

    if (const json* fields = optional_array(j, "fields", where)) {
        for (size_t i = 0; i < fields->size(); ++i) {
            s.fields.push_back(parse_field(fields->at(i), index_path(where, "fields", i)));
        }
    }
    return s;
}

static model::FontSpec parse_font(const json& j, const std::string& where) {
    require_object(j, where);

    model::FontSpec f;
    f.name = require_string(j, "name", where);
    f.stack = optional_string(j, "stack", where, f.name + ", sans-serif");
    f.weight = static_cast<int>(optional_number(j, "weight", where, 400));
    return f;
}

static model::TemplateLayout parse_layout(const json& j, const std::string& where) {
    require_object(j, where);

    model::TemplateLayout l;
    l.format = optional_string(j, "format", where, l.format);
    l.columns = static_cast<int>(optional_number(j, "columns", where, l.columns));

    if (const json* m = optional_object(j, "margins", where)) {
        const std::string w = where + ".margins";
        l.margins.top = optional_number(*m, "top", w, l.margins.top);
        l.margins.right = optional_number(*m, "right", w, l.margins.right);
        l.margins.bottom = optional_number(*m, "bottom", w, l.margins.bottom);
        l.margins.left = optional_number(*m, "left", w, l.margins.left);
    }
    if (const json* sp = optional_object(j, "spacing", where)) {
        const std::string w = where + ".spacing";
        l.section_spacing = optional_number(*sp, "section", w, l.section_spacing);
        l.item_spacing = optional_number(*sp, "item", w, l.item_spacing);
        l.line_spacing = optional_number(*sp, "line", w, l.line_spacing);
    }
    if (const json* bp = optional_object(j, "breakpoints", where)) {
        l.breakpoints.clear();
        for (auto it = bp->begin(); it != bp->end(); ++it) {
            if (!it.value().is_number()) {
                throw std::runtime_error(where + ".breakpoints." + it.key() + " must be a number");
            }
            l.breakpoints[it.key()] = it.value().get<int>();
        }
    }
    return l;
}

static model::TemplateStyling parse_styling(const json& j, const std::string& where) {
    require_object(j, where);

    model::TemplateStyling s;
    if (const json* f = optional_object(j, "headingFont", where)) s.heading_font = parse_font(*f, where + ".headingFont");
    if (const json* f = optional_object(j, "bodyFont", where)) s.body_font = parse_font(*f, where + ".bodyFont");

    if (const json* sizes = optional_object(j, "headingSizes", where)) {
        s.heading_sizes.clear();
        for (auto it = sizes->begin(); it != sizes->end(); ++it) {
            if (!it.value().is_number()) {
                throw std::runtime_error(where + ".headingSizes." + it.key() + " must be a number");
            }
            s.heading_sizes[it.key()] = it.value().get<double>();
        }
    }
    s.body_size = optional_number(j, "bodySize", where, s.body_size);

    if (const json* c = optional_object(j, "colors", where)) {
        const std::string w = where + ".colors";
        s.text_color = optional_string(*c, "text", w, s.text_color);
        s.secondary_color = optional_string(*c, "secondary", w, s.secondary_color);
        s.background_color = optional_string(*c, "background", w, s.background_color);
        s.border_color = optional_string(*c, "border", w, s.border_color);
        s.accent_color = optional_string(*c, "accent", w, s.accent_color);
    }
    return s;
}

static model::ATSOptimizationProfile parse_ats(const json& j, const std::string& where) {
    require_object(j, where);

    model::ATSOptimizationProfile a;
    a.required_section_order = optional_string_array(j, "requiredSectionOrder", where);
    a.prohibited_elements = optional_string_array(j, "prohibitedElements", where);
    a.approved_fonts = optional_string_array(j, "approvedFonts", where);
    a.prohibited_fonts = optional_string_array(j, "prohibitedFonts", where);
    a.min_margin = optional_number(j, "minMargin", where, a.min_margin);
    a.max_margin = optional_number(j, "maxMargin", where, a.max_margin);
    a.keyword_density = optional_number(j, "keywordDensity", where, a.keyword_density);
    return a;
}

model::ResumeTemplate parse_template(const json& j) {
    require_object(j, "template");

    model::ResumeTemplate t;
    t.id = require_string(j, "id", "template");
    t.name = require_string(j, "name", "template");
    t.description = optional_string(j, "description", "template");
    t.category = optional_string(j, "category", "template", t.category);
    t.version = optional_string(j, "version", "template", t.version);
    t.preview_thumbnail = optional_string(j, "previewThumbnail", "template");

    if (const json* l = optional_object(j, "layout", "template")) t.layout = parse_layout(*l, "template.layout");
    if (const json* s = optional_object(j, "styling", "template")) t.styling = parse_styling(*s, "template.styling");
    if (const json* a = optional_object(j, "atsOptimization", "template")) {
        t.ats = parse_ats(*a, "template.atsOptimization");
    }

    const json& sections = require_field(j, "sections", "template");
    require_array(sections, "template.sections");
    for (size_t i = 0; i < sections.size(); ++i) {
        t.sections.push_back(parse_section(sections.at(i), index_path("template", "sections", i)));
    }
    return t;
}

// ---------- resume ----------

static model::ExperienceItem parse_experience(const json& j, const std::string& where) {
    require_object(j, where);

    model::ExperienceItem e;
    e.id = optional_string(j, "id", where);
    e.position = require_string(j, "position", where);
    e.company = require_string(j, "company", where);
    e.location = optional_string(j, "location", where);
    e.start_date = optional_string(j, "startDate", where);
    e.end_date = optional_string(j, "endDate", where);
    e.current = optional_bool(j, "current", where, false);
    e.description = optional_string(j, "description", where);
    e.achievements = optional_string_array(j, "achievements", where);
    return e;
}

static model::EducationItem parse_education(const json& j, const std::string& where) {
    require_object(j, where);

    model::EducationItem e;
    e.id = optional_string(j, "id", where);
    e.degree = require_string(j, "degree", where);
    e.institution = require_string(j, "institution", where);
    e.location = optional_string(j, "location", where);
    e.graduation_year = optional_string(j, "graduationYear", where);
    e.gpa = optional_string(j, "gpa", where);
    return e;
}

static model::CertificationItem parse_certification(const json& j, const std::string& where) {
    require_object(j, where);

    model::CertificationItem c;
    c.name = require_string(j, "name", where);
    c.issuer = optional_string(j, "issuer", where);
    c.date = optional_string(j, "date", where);
    return c;
}

static model::ProjectItem parse_project(const json& j, const std::string& where) {
    require_object(j, where);

    model::ProjectItem p;
    p.name = require_string(j, "name", where);
    p.description = optional_string(j, "description", where);
    p.url = optional_string(j, "url", where);
    p.technologies = optional_string_array(j, "technologies", where);
    return p;
}

model::ResumeData parse_resume(const json& j) {
    require_object(j, "resume");

    model::ResumeData r;
    r.id = require_string(j, "id", "resume");
    r.user_id = optional_string(j, "userId", "resume");

    if (const json* p = optional_object(j, "personalInfo", "resume")) {
        const std::string w = "resume.personalInfo";
        r.personal.full_name = optional_string(*p, "fullName", w);
        r.personal.title = optional_string(*p, "title", w);
        r.personal.email = optional_string(*p, "email", w);
        r.personal.phone = optional_string(*p, "phone", w);
        r.personal.location = optional_string(*p, "location", w);
        r.personal.linkedin = optional_string(*p, "linkedin", w);
        r.personal.website = optional_string(*p, "website", w);
    }

    r.summary = optional_string(j, "summary", "resume");

    if (const json* arr = optional_array(j, "experience", "resume")) {
        for (size_t i = 0; i < arr->size(); ++i) {
            r.experience.push_back(parse_experience(arr->at(i), index_path("resume", "experience", i)));
        }
    }
    if (const json* arr = optional_array(j, "education", "resume")) {
        for (size_t i = 0; i < arr->size(); ++i) {
            r.education.push_back(parse_education(arr->at(i), index_path("resume", "education", i)));
        }
    }
    if (const json* s = optional_object(j, "skills", "resume")) {
        r.skills.technical = optional_string_array(*s, "technical", "resume.skills");
        r.skills.business = optional_string_array(*s, "business", "resume.skills");
        r.skills.leadership = optional_string_array(*s, "leadership", "resume.skills");
    }
    if (const json* arr = optional_array(j, "certifications", "resume")) {
        for (size_t i = 0; i < arr->size(); ++i) {
            r.certifications.push_back(parse_certification(arr->at(i), index_path("resume", "certifications", i)));
        }
    }
    if (const json* arr = optional_array(j, "projects", "resume")) {
        for (size_t i = 0; i < arr->size(); ++i) {
            r.projects.push_back(parse_project(arr->at(i), index_path("resume", "projects", i)));
        }
    }
    r.languages = optional_string_array(j, "languages", "resume");

    if (const json* extras = optional_object(j, "extras", "resume")) r.extras = *extras;
    return r;
}

model::ResumeTemplate load_template(const std::string& path) {
    return parse_template(read_json_file(path));
}

model::ResumeData load_resume(const std::string& path) {
    return parse_resume(read_json_file(path));
}

json resume_to_json(const model::ResumeData& r) {
    json j;
    j["id"] = r.id;
    j["userId"] = r.user_id;
    j["personalInfo"] = {
        {"fullName", r.personal.full_name},
        {"title", r.personal.title},
        {"email", r.personal.email},
        {"phone", r.personal.phone},
        {"location", r.personal.location},
        {"linkedin", r.personal.linkedin},
        {"website", r.personal.website},
    };
    j["summary"] = r.summary;

    j["experience"] = json::array();
    for (const auto& e : r.experience) {
        j["experience"].push_back({
            {"id", e.id}, {"position", e.position}, {"company", e.company}, {"location", e.location},
            {"startDate", e.start_date}, {"endDate", e.end_date}, {"current", e.current},
            {"description", e.description}, {"achievements", e.achievements},
        });
    }

    j["education"] = json::array();
    for (const auto& e : r.education) {
        j["education"].push_back({
            {"id", e.id}, {"degree", e.degree}, {"institution", e.institution}, {"location", e.location},
            {"graduationYear", e.graduation_year}, {"gpa", e.gpa},
        });
    }

    j["skills"] = {
        {"technical", r.skills.technical},
        {"business", r.skills.business},
        {"leadership", r.skills.leadership},
    };

    j["certifications"] = json::array();
    for (const auto& c : r.certifications) {
        j["certifications"].push_back({{"name", c.name}, {"issuer", c.issuer}, {"date", c.date}});
    }

    j["projects"] = json::array();
    for (const auto& p : r.projects) {
        j["projects"].push_back({
            {"name", p.name}, {"description", p.description}, {"url", p.url}, {"technologies", p.technologies},
        });
    }

    j["languages"] = r.languages;
    j["extras"] = r.extras;
    return j;
}

json section_content_from_resume(const model::ResumeData& r) {
    json content = json::object();

    content["contact"] = {
        {"name", r.personal.full_name},
        {"email", r.personal.email},
        {"phone", r.personal.phone},
        {"location", r.personal.location},
    };
    if (!r.summary.empty()) content["summary"] = r.summary;

    json exp = json::array();
    for (const auto& e : r.experience) {
        exp.push_back({{"title", e.position}, {"company", e.company}, {"startDate", e.start_date}});
    }
    content["experience"] = exp;

    json edu = json::array();
    for (const auto& e : r.education) {
        edu.push_back({{"institution", e.institution}, {"degree", e.degree}});
    }
    content["education"] = edu;

    content["skills"] = r.skills.all();

    if (!r.projects.empty()) {
        json arr = json::array();
        for (const auto& p : r.projects) arr.push_back({{"name", p.name}});
        content["projects"] = arr;
    }
    if (!r.certifications.empty()) {
        json arr = json::array();
        for (const auto& c : r.certifications) arr.push_back({{"name", c.name}, {"issuer", c.issuer}});
        content["certifications"] = arr;
    }
    if (!r.languages.empty()) content["languages"] = r.languages;

    for (auto it = r.extras.begin(); it != r.extras.end(); ++it) {
        if (!content.contains(it.key())) content[it.key()] = it.value();
    }
    return content;
}

} // namespace io
