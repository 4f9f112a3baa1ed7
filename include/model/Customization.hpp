#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace model {

enum class ColorRole {
    Primary,
    Secondary,
    Accent,
    Background,
    Text,
    Muted,
    Border,
    Highlight,
    Link
};

const std::vector<ColorRole>& all_color_roles();
const char* color_role_str(ColorRole r);
std::optional<ColorRole> parse_color_role(const std::string& s);

struct ColorScheme {
    std::string name;
    std::string primary;
    std::string secondary;
    std::string accent;
    std::string background;
    std::string text;
    std::string muted;
    std::string border;
    std::string highlight;
    std::string link;

    const std::string& get(ColorRole r) const;
    std::string& get(ColorRole r);
};

bool operator==(const ColorScheme& a, const ColorScheme& b);

struct TextStyle {
    std::string font_family;
    int font_weight = 400;
    std::map<std::string, double> font_size;
    double line_height = 1.4;
    double letter_spacing = 0.0;
};

struct TypographySettings {
    TextStyle heading;
    TextStyle body;
    TextStyle accent;
    TextStyle monospace;
};

struct SectionSpacing {
    double before = 12.0;
    double after = 8.0;
};

struct LayoutMargins {
    double top = 0.75;
    double right = 0.75;
    double bottom = 0.75;
    double left = 0.75;
};

struct SectionLayoutAdjustment {
    std::optional<double> spacing;
    std::optional<std::string> alignment;
    std::optional<std::string> width;
    std::optional<int> columns;
    std::optional<int> priority;
};

struct LayoutSettings {
    LayoutMargins margins;
    SectionSpacing section_spacing;
    double item_spacing = 6.0;
    double line_height = 1.15;
    std::string alignment = "left";
    std::map<std::string, SectionLayoutAdjustment> custom_sections;
};

struct SectionConfig {
    std::string id;
    std::string name;
    bool visible = true;
    bool required = false;
    int priority = 0; // 1 = most important
    int order = 0;
    int min_items = 0;
    int max_items = 0;
    std::string description;
};

// Sections are kept in catalog order; `order` carries the display position.
struct SectionVisibility {
    std::vector<SectionConfig> sections;

    const SectionConfig* find(const std::string& id) const;
    SectionConfig* find(const std::string& id);
};

struct CustomizationMetadata {
    std::string created_at;
    std::string updated_at;
    std::string version = "1.0";
    int changes = 0;
};

struct TemplateCustomization {
    std::string id;
    std::string template_id;
    std::string name;
    ColorScheme color_scheme;
    TypographySettings typography;
    LayoutSettings layout;
    SectionVisibility section_visibility;
    CustomizationMetadata metadata;
};

} // namespace model
