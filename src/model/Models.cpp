#include "model/Customization.hpp"
#include "model/ResumeData.hpp"
#include "model/Template.hpp"

#include <stdexcept>

namespace model {

const char* section_type_str(SectionType t) {
    switch (t) {
        case SectionType::PersonalInfo: return "personal-info";
        case SectionType::Summary: return "summary";
        case SectionType::Experience: return "experience";
        case SectionType::Education: return "education";
        case SectionType::Skills: return "skills";
        case SectionType::Projects: return "projects";
        case SectionType::Certifications: return "certifications";
        case SectionType::Languages: return "languages";
        default: return "custom";
    }
}

SectionType parse_section_type(const std::string& s) {
    if (s == "personal-info") return SectionType::PersonalInfo;
    if (s == "summary") return SectionType::Summary;
    if (s == "experience") return SectionType::Experience;
    if (s == "education") return SectionType::Education;
    if (s == "skills") return SectionType::Skills;
    if (s == "projects") return SectionType::Projects;
    if (s == "certifications") return SectionType::Certifications;
    if (s == "languages") return SectionType::Languages;
    return SectionType::Custom;
}

std::string catalog_section_id(SectionType t, const std::string& template_section_id) {
    if (t == SectionType::PersonalInfo) return "contact";
    if (t == SectionType::Custom) return template_section_id;
    return section_type_str(t);
}

std::vector<std::string> SkillGroups::all() const {
    std::vector<std::string> out;
    out.reserve(technical.size() + business.size() + leadership.size());
    out.insert(out.end(), technical.begin(), technical.end());
    out.insert(out.end(), business.begin(), business.end());
    out.insert(out.end(), leadership.begin(), leadership.end());
    return out;
}

const std::vector<ColorRole>& all_color_roles() {
    static const std::vector<ColorRole> roles = {
        ColorRole::Primary, ColorRole::Secondary, ColorRole::Accent,
        ColorRole::Background, ColorRole::Text, ColorRole::Muted,
        ColorRole::Border, ColorRole::Highlight, ColorRole::Link
    };
    return roles;
}

const char* color_role_str(ColorRole r) {
    switch (r) {
        case ColorRole::Primary: return "primary";
        case ColorRole::Secondary: return "secondary";
        case ColorRole::Accent: return "accent";
        case ColorRole::Background: return "background";
        case ColorRole::Text: return "text";
        case ColorRole::Muted: return "muted";
        case ColorRole::Border: return "border";
        case ColorRole::Highlight: return "highlight";
        case ColorRole::Link: return "link";
    }
    return "primary";
}

std::optional<ColorRole> parse_color_role(const std::string& s) {
    for (ColorRole r : all_color_roles()) {
        if (s == color_role_str(r)) return r;
    }
    return std::nullopt;
}

const std::string& ColorScheme::get(ColorRole r) const {
    switch (r) {
        case ColorRole::Primary: return primary;
        case ColorRole::Secondary: return secondary;
        case ColorRole::Accent: return accent;
        case ColorRole::Background: return background;
        case ColorRole::Text: return text;
        case ColorRole::Muted: return muted;
        case ColorRole::Border: return border;
        case ColorRole::Highlight: return highlight;
        case ColorRole::Link: return link;
    }
    throw std::logic_error("unhandled color role");
}

std::string& ColorScheme::get(ColorRole r) {
    return const_cast<std::string&>(static_cast<const ColorScheme&>(*this).get(r));
}

bool operator==(const ColorScheme& a, const ColorScheme& b) {
    if (a.name != b.name) return false;
    for (ColorRole r : all_color_roles()) {
        if (a.get(r) != b.get(r)) return false;
    }
    return true;
}

const SectionConfig* SectionVisibility::find(const std::string& id) const {
    for (const auto& s : sections) {
        if (s.id == id) return &s;
    }
    return nullptr;
}

SectionConfig* SectionVisibility::find(const std::string& id) {
    for (auto& s : sections) {
        if (s.id == id) return &s;
    }
    return nullptr;
}

} // namespace model
