#pragma once

#include <string>

#include "model/ResumeData.hpp"
#include "model/Template.hpp"

namespace test {

inline std::string data_path(const std::string& rel) {
    return std::string(TEMPLATER_DATA_DIR) + "/" + rel;
}

inline model::FieldDefinition field(const std::string& id, bool required = false) {
    model::FieldDefinition f;
    f.id = id;
    f.name = id;
    f.required = required;
    return f;
}

inline model::SectionDefinition section(const std::string& id, model::SectionType type, int order,
                                        bool required = false) {
    model::SectionDefinition s;
    s.id = id;
    s.name = id;
    s.type = type;
    s.order = order;
    s.required = required;
    return s;
}

// Contact, summary, experience and skills; ATS-clean fonts and margins.
inline model::ResumeTemplate make_template() {
    model::ResumeTemplate t;
    t.id = "tmpl-basic";
    t.name = "Basic";
    t.styling.heading_font = {"Arial", "Arial, Helvetica, sans-serif", 700};
    t.styling.body_font = {"Arial", "Arial, Helvetica, sans-serif", 400};
    t.ats.approved_fonts = {"Arial", "Calibri"};
    t.ats.prohibited_fonts = {"Comic Sans MS"};

    auto header = section("header", model::SectionType::PersonalInfo, 1, true);
    header.fields = {field("fullName", true), field("email", true)};
    model::ValidationRule email;
    email.type = "email";
    header.fields[1].validation.push_back(email);

    auto summary = section("summary", model::SectionType::Summary, 2);
    summary.fields = {field("summary")};

    auto experience = section("experience", model::SectionType::Experience, 3, true);
    experience.fields = {field("position", true), field("company", true)};

    auto skills = section("skills", model::SectionType::Skills, 4);
    skills.fields = {field("technical")};

    t.sections = {header, summary, experience, skills};
    return t;
}

inline model::ResumeData make_resume() {
    model::ResumeData r;
    r.id = "resume-1";
    r.user_id = "user-1";
    r.personal.full_name = "Alex Morgan";
    r.personal.email = "alex@example.com";
    r.personal.phone = "555-0100-22";
    r.summary = "Platform engineer focused on build systems.";

    model::ExperienceItem e;
    e.id = "e1";
    e.position = "Engineer";
    e.company = "Initech";
    e.start_date = "2020-01";
    r.experience.push_back(e);

    r.skills.technical = {"C++", "CMake", "Linux"};
    return r;
}

} // namespace test
