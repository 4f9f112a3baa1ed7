#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace model {

struct PersonalInfo {
    std::string full_name;
    std::string title;
    std::string email;
    std::string phone;
    std::string location;
    std::string linkedin;
    std::string website;
};

struct ExperienceItem {
    std::string id;
    std::string position;
    std::string company;
    std::string location;
    std::string start_date;
    std::string end_date;
    bool current = false;
    std::string description;
    std::vector<std::string> achievements;
};

struct EducationItem {
    std::string id;
    std::string degree;
    std::string institution;
    std::string location;
    std::string graduation_year;
    std::string gpa;
};

struct SkillGroups {
    std::vector<std::string> technical;
    std::vector<std::string> business;
    std::vector<std::string> leadership;

    std::vector<std::string> all() const;
    bool empty() const { return technical.empty() && business.empty() && leadership.empty(); }
};

struct CertificationItem {
    std::string name;
    std::string issuer;
    std::string date;
};

struct ProjectItem {
    std::string name;
    std::string description;
    std::string url;
    std::vector<std::string> technologies;
};

struct ResumeData {
    std::string id;
    std::string user_id;

    PersonalInfo personal;
    std::string summary;
    std::vector<ExperienceItem> experience;
    std::vector<EducationItem> education;
    SkillGroups skills;
    std::vector<CertificationItem> certifications;
    std::vector<ProjectItem> projects;
    std::vector<std::string> languages;

    // Free-form content for custom template sections, keyed by section id.
    nlohmann::json extras = nlohmann::json::object();
};

} // namespace model
