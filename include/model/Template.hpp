#pragma once

#include <map>
#include <string>
#include <vector>

namespace model {

enum class SectionType {
    PersonalInfo,
    Summary,
    Experience,
    Education,
    Skills,
    Projects,
    Certifications,
    Languages,
    Custom
};

// "personal-info", "summary", ... ; unknown strings map to Custom.
const char* section_type_str(SectionType t);
SectionType parse_section_type(const std::string& s);

// Catalog id used by the customization layer ("personal-info" -> "contact").
std::string catalog_section_id(SectionType t, const std::string& template_section_id);

struct ValidationRule {
    std::string type; // required | min-length | max-length | pattern | email | phone | url
    double value = 0.0;
    std::string pattern;
    std::string message;
};

struct FieldDefinition {
    std::string id;
    std::string name;
    std::string type = "text";
    bool required = false;
    std::string placeholder;
    int max_length = 0; // 0 = unlimited
    std::vector<ValidationRule> validation;
};

struct SectionDefinition {
    std::string id;
    std::string name;
    SectionType type = SectionType::Custom;
    bool required = false;
    int order = 0;
    bool default_visible = true;
    std::string alignment = "left";
    int columns = 1;
    std::vector<FieldDefinition> fields;
};

struct Margins {
    double top = 0.75;
    double right = 0.75;
    double bottom = 0.75;
    double left = 0.75;
};

struct TemplateLayout {
    std::string format = "single-column";
    int columns = 1;
    Margins margins;       // inches
    double section_spacing = 12.0; // pt
    double item_spacing = 6.0;     // pt
    double line_spacing = 1.15;
    std::map<std::string, int> breakpoints{{"mobile", 768}, {"tablet", 1024}};
};

struct FontSpec {
    std::string name = "Arial";
    std::string stack = "Arial, sans-serif";
    int weight = 400;
};

struct TemplateStyling {
    FontSpec heading_font;
    FontSpec body_font;
    std::map<std::string, double> heading_sizes{{"h1", 24}, {"h2", 18}, {"h3", 14}};
    double body_size = 11;
    std::string text_color = "#1a1a1a";
    std::string secondary_color = "#4a4a4a";
    std::string background_color = "#ffffff";
    std::string border_color = "#d1d5db";
    std::string accent_color = "#2563eb";
};

struct ATSOptimizationProfile {
    std::vector<std::string> required_section_order;
    std::vector<std::string> prohibited_elements;
    std::vector<std::string> approved_fonts;
    std::vector<std::string> prohibited_fonts;
    double min_margin = 0.5;
    double max_margin = 1.5;
    double keyword_density = 0.02;
};

struct ResumeTemplate {
    std::string id;
    std::string name;
    std::string description;
    std::string category = "professional";
    std::string version = "1.0.0";
    std::string preview_thumbnail;

    TemplateLayout layout;
    TemplateStyling styling;
    std::vector<SectionDefinition> sections;
    ATSOptimizationProfile ats;
};

} // namespace model
