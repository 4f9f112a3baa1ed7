#include "customize/Typography.hpp"

#include "errors/TemplateError.hpp"
#include "util/TextUtil.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace customize {

using model::TextStyle;
using model::TypographySettings;

namespace {

const FontInfo* find_font(const std::string& name) {
    for (const auto& f : ats_safe_fonts()) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

double size_or(const TextStyle& s, const std::string& key, double def) {
    auto it = s.font_size.find(key);
    return it == s.font_size.end() ? def : it->second;
}

void merge_style(TextStyle& target, const TextStyleOverrides& o, bool monospace) {
    if (o.font_family) {
        const bool ok = monospace ? is_valid_monospace_font(*o.font_family) : is_valid_font(*o.font_family);
        if (ok) target.font_family = *o.font_family;
    }
    if (o.font_weight) target.font_weight = *o.font_weight;
    for (const auto& kv : o.font_size) target.font_size[kv.first] = kv.second;
    if (o.line_height) target.line_height = *o.line_height;
    if (o.letter_spacing) target.letter_spacing = *o.letter_spacing;
}

void write_rule(std::ostringstream& css, const std::string& selector, const TextStyle& style, double size) {
    using textutil::format_number;
    css << selector << " {\n"
        << "  font-family: " << font_stack(style.font_family) << ";\n"
        << "  font-size: " << format_number(size) << "pt;\n"
        << "  font-weight: " << style.font_weight << ";\n"
        << "  line-height: " << format_number(style.line_height) << ";\n"
        << "  letter-spacing: " << format_number(style.letter_spacing) << "em;\n"
        << "}";
}

TextStyleOverrides family_weight(const std::string& family, int weight) {
    TextStyleOverrides o;
    o.font_family = family;
    o.font_weight = weight;
    return o;
}

} // namespace

const std::vector<FontInfo>& ats_safe_fonts() {
    static const std::vector<FontInfo> fonts = {
        {"Times New Roman", "\"Times New Roman\", Times, serif", "serif", 95},
        {"Georgia", "Georgia, \"Times New Roman\", serif", "serif", 93},
        {"Garamond", "Garamond, \"Times New Roman\", serif", "serif", 92},
        {"Cambria", "Cambria, Georgia, serif", "serif", 91},
        {"Arial", "Arial, Helvetica, sans-serif", "sans-serif", 94},
        {"Calibri", "Calibri, Arial, sans-serif", "sans-serif", 93},
        {"Helvetica", "Helvetica, Arial, sans-serif", "sans-serif", 95},
        {"Verdana", "Verdana, Arial, sans-serif", "sans-serif", 92},
        {"Tahoma", "Tahoma, Arial, sans-serif", "sans-serif", 91},
        {"Courier New", "\"Courier New\", Courier, monospace", "monospace", 88},
        {"Consolas", "Consolas, \"Courier New\", monospace", "monospace", 90},
    };
    return fonts;
}

std::vector<FontInfo> ats_safe_fonts(const std::string& category) {
    std::vector<FontInfo> out;
    for (const auto& f : ats_safe_fonts()) {
        if (f.category == category) out.push_back(f);
    }
    return out;
}

const std::vector<FontCombination>& professional_combinations() {
    static const std::vector<FontCombination> combos = {
        {"Corporate Classic", "Arial", "Arial", "Arial", "Consistent, professional, and ATS-friendly"},
        {"Executive Elegance", "Georgia", "Arial", "Georgia", "Sophisticated headings with readable body text"},
        {"Modern Minimal", "Helvetica", "Helvetica", "Helvetica", "Clean, contemporary, and professional"},
        {"Traditional Professional", "Times New Roman", "Arial", "Times New Roman", "Classic combination for traditional industries"},
        {"Contemporary Balance", "Calibri", "Calibri", "Calibri", "Modern and widely accepted in business"},
    };
    return combos;
}

bool is_valid_font(const std::string& name) {
    const FontInfo* f = find_font(name);
    return f && f->category != "monospace";
}

bool is_valid_monospace_font(const std::string& name) {
    const FontInfo* f = find_font(name);
    return f && f->category == "monospace";
}

std::string font_stack(const std::string& name) {
    const FontInfo* f = find_font(name);
    return f ? f->stack : std::string("\"Times New Roman\", Times, serif");
}

std::optional<std::string> font_category(const std::string& name) {
    const FontInfo* f = find_font(name);
    if (!f) return std::nullopt;
    return f->category;
}

bool validate_font_size(double size, TextRole role) {
    switch (role) {
        case TextRole::Heading: return size >= 11 && size <= 32;
        case TextRole::Body: return size >= 8 && size <= 18;
        default: return size >= 10 && size <= 16;
    }
}

double recommended_font_size(TextRole role, const std::string& context) {
    switch (role) {
        case TextRole::Heading:
            if (context == "name") return 28;
            if (context == "section") return 16;
            return 14;
        case TextRole::Body:
            return context == "contact" ? 10 : 12;
        case TextRole::Accent:
        case TextRole::Monospace:
            return 11;
    }
    return 12;
}

TypographySettings default_typography() {
    TypographySettings t;
    t.heading = {"Arial", 600, {{"h1", 28}, {"h2", 20}, {"h3", 16}, {"h4", 14}}, 1.2, 0.0};
    t.body = {"Arial", 400, {{"large", 16}, {"normal", 12}, {"small", 10}, {"caption", 9}}, 1.4, 0.0};
    t.accent = {"Arial", 500, {{"base", 14}}, 1.4, 0.5};
    t.monospace = {"Courier New", 400, {{"base", 11}}, 1.3, 0.0};
    return t;
}

TypographySettings create_custom_typography(const TypographyOverrides& overrides, const TypographySettings& base) {
    TypographySettings out = base;
    if (overrides.heading) merge_style(out.heading, *overrides.heading, false);
    if (overrides.body) merge_style(out.body, *overrides.body, false);
    if (overrides.accent) merge_style(out.accent, *overrides.accent, false);
    if (overrides.monospace) merge_style(out.monospace, *overrides.monospace, true);
    return out;
}

ReadabilityScore calculate_readability_score(const TypographySettings& typography) {
    ReadabilityScore r;
    double score = 0;

    const double body_size = size_or(typography.body, "normal", 12);
    if (body_size >= 11 && body_size <= 12) {
        r.factors.font_size = 25;
    } else if (body_size >= 10 && body_size <= 14) {
        r.factors.font_size = 20;
    } else {
        r.factors.font_size = 10;
        r.recommendations.push_back("Consider using 11-12pt font size for optimal readability");
    }
    score += r.factors.font_size;

    const double lh = typography.body.line_height;
    if (lh >= 1.4 && lh <= 1.6) {
        r.factors.line_height = 25;
    } else if (lh >= 1.2 && lh <= 1.8) {
        r.factors.line_height = 20;
    } else {
        r.factors.line_height = 10;
        r.recommendations.push_back("Consider using 1.4-1.6 line height for better readability");
    }
    score += r.factors.line_height;

    if (const FontInfo* f = find_font(typography.body.font_family)) {
        r.factors.font_family = f->readability;
        score += f->readability / 4.0;
    } else {
        r.factors.font_family = 50;
        score += 12.5;
        r.recommendations.push_back("Consider using an ATS-safe font family");
    }

    // no color input here; assume typical dark-on-light usage
    r.factors.contrast = 25;
    score += 25;

    r.score = static_cast<int>(std::round(score));
    return r;
}

TypographyOverrides industry_recommendations(const std::string& industry) {
    const std::string key = textutil::to_lower_copy(textutil::trim_copy(industry));
    TypographyOverrides o;

    if (key == "finance") {
        o.heading = family_weight("Georgia", 600);
        o.body = family_weight("Arial", 400);
    } else if (key == "tech") {
        o.heading = family_weight("Arial", 600);
        o.body = family_weight("Arial", 400);
        o.monospace = family_weight("Consolas", 400);
    } else if (key == "healthcare") {
        o.heading = family_weight("Times New Roman", 600);
        o.body = family_weight("Arial", 400);
    } else if (key == "legal") {
        o.heading = family_weight("Times New Roman", 600);
        o.body = family_weight("Georgia", 400);
    } else if (key == "creative") {
        o.heading = family_weight("Helvetica", 600);
        o.body = family_weight("Arial", 400);
    } else if (key == "education") {
        o.heading = family_weight("Georgia", 600);
        o.body = family_weight("Times New Roman", 400);
    }
    return o;
}

TypographySettings apply_professional_combination(const std::string& name) {
    for (const auto& c : professional_combinations()) {
        if (c.name != name) continue;

        TypographyOverrides o;
        o.heading = TextStyleOverrides{};
        o.heading->font_family = c.heading;
        o.body = TextStyleOverrides{};
        o.body->font_family = c.body;
        o.accent = TextStyleOverrides{};
        o.accent->font_family = c.accent;
        return create_custom_typography(o);
    }
    throw errors::validation_error("Invalid combination name", {{"combinationName", name}});
}

std::string typography_css(const TypographySettings& t) {
    std::ostringstream css;
    css << "/* Typography Styles */\n";
    write_rule(css, "h1, .resume-name", t.heading, size_or(t.heading, "h1", 28));
    css << "\n\n";
    write_rule(css, "h2, .section-title", t.heading, size_or(t.heading, "h2", 20));
    css << "\n\n";
    write_rule(css, "h3, .subsection-title", t.heading, size_or(t.heading, "h3", 16));
    css << "\n\n";
    write_rule(css, ".body-text, p, li", t.body, size_or(t.body, "normal", 12));
    css << "\n\n";
    write_rule(css, ".accent-text", t.accent, size_or(t.accent, "base", 14));
    css << "\n\n";
    write_rule(css, ".contact-info", t.body, size_or(t.body, "small", 10));
    css << "\n\n";
    write_rule(css, ".caption-text", t.body, size_or(t.body, "caption", 9));
    css << "\n\n";
    write_rule(css, ".code, .tech-skills", t.monospace, size_or(t.monospace, "base", 11));
    return css.str();
}

} // namespace customize
