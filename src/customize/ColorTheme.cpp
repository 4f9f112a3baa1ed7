#include "customize/ColorTheme.hpp"

#include "errors/TemplateError.hpp"
#include "util/TextUtil.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace customize {

using model::ColorRole;
using model::ColorScheme;

namespace {

struct ThemeEntry {
    const char* id;
    ColorScheme scheme;
};

const std::vector<ThemeEntry>& theme_table() {
    // name, primary, secondary, accent, background, text, muted, border, highlight, link
    static const std::vector<ThemeEntry> themes = {
        {"executive", {"Executive", "#1a1a1a", "#4a4a4a", "#2c5aa0", "#ffffff", "#1a1a1a", "#6b7280", "#e5e7eb", "#f3f4f6", "#2563eb"}},
        {"corporate", {"Corporate", "#0f172a", "#334155", "#0ea5e9", "#ffffff", "#0f172a", "#64748b", "#e2e8f0", "#f8fafc", "#0284c7"}},
        {"minimal", {"Minimal", "#111827", "#374151", "#6366f1", "#ffffff", "#111827", "#6b7280", "#f3f4f6", "#f9fafb", "#4f46e5"}},
        {"leadership", {"Leadership", "#1e293b", "#475569", "#7c3aed", "#ffffff", "#1e293b", "#64748b", "#e2e8f0", "#f8fafc", "#6d28d9"}},
        {"modern_blue", {"Modern Blue", "#1e3a8a", "#3730a3", "#3b82f6", "#ffffff", "#1e293b", "#64748b", "#e2e8f0", "#eff6ff", "#2563eb"}},
        {"modern_green", {"Modern Green", "#14532d", "#166534", "#22c55e", "#ffffff", "#1e293b", "#64748b", "#e2e8f0", "#f0fdf4", "#16a34a"}},
        {"modern_purple", {"Modern Purple", "#581c87", "#6b21a8", "#a855f7", "#ffffff", "#1e293b", "#64748b", "#e2e8f0", "#faf5ff", "#9333ea"}},
        {"creative_teal", {"Creative Teal", "#134e4a", "#0f766e", "#14b8a6", "#ffffff", "#1e293b", "#64748b", "#e2e8f0", "#f0fdfa", "#0d9488"}},
        {"creative_orange", {"Creative Orange", "#7c2d12", "#9a3412", "#f97316", "#ffffff", "#1e293b", "#64748b", "#e2e8f0", "#fff7ed", "#ea580c"}},
    };
    return themes;
}

bool is_hex_digit(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_strict_hex_color(const std::string& s) {
    if (s.size() != 7 || s[0] != '#') return false;
    return std::all_of(s.begin() + 1, s.end(), is_hex_digit);
}

double hue_to_rgb(double p, double q, double t) {
    if (t < 0) t += 1;
    if (t > 1) t -= 1;
    if (t < 1.0 / 6) return p + (q - p) * 6 * t;
    if (t < 1.0 / 2) return q;
    if (t < 2.0 / 3) return p + (q - p) * (2.0 / 3 - t) * 6;
    return p;
}

double luminance_or(const std::string& hex, double fallback) {
    auto rgb = hex_to_rgb(hex);
    return rgb ? relative_luminance(*rgb) : fallback;
}

} // namespace

std::optional<HarmonyRelation> parse_harmony_relation(const std::string& s) {
    const std::string k = textutil::to_lower_copy(textutil::trim_copy(s));
    if (k == "analogous") return HarmonyRelation::Analogous;
    if (k == "complementary") return HarmonyRelation::Complementary;
    if (k == "triadic") return HarmonyRelation::Triadic;
    if (k == "split-complementary" || k == "split_complementary") return HarmonyRelation::SplitComplementary;
    if (k == "tetradic") return HarmonyRelation::Tetradic;
    return std::nullopt;
}

int harmony_hue_offset(HarmonyRelation r) {
    switch (r) {
        case HarmonyRelation::Analogous: return 30;
        case HarmonyRelation::Complementary: return 180;
        case HarmonyRelation::Triadic: return 120;
        case HarmonyRelation::SplitComplementary: return 150;
        case HarmonyRelation::Tetradic: return 90;
    }
    return 30;
}

std::optional<Rgb> hex_to_rgb(const std::string& hex) {
    std::string h = hex;
    if (!h.empty() && h[0] == '#') h.erase(0, 1);
    if (h.size() != 6 || !std::all_of(h.begin(), h.end(), is_hex_digit)) return std::nullopt;

    Rgb rgb;
    rgb.r = std::stoi(h.substr(0, 2), nullptr, 16);
    rgb.g = std::stoi(h.substr(2, 2), nullptr, 16);
    rgb.b = std::stoi(h.substr(4, 2), nullptr, 16);
    return rgb;
}

std::string rgb_to_hex(int r, int g, int b) {
    static const char* digits = "0123456789abcdef";
    std::string out = "#";
    for (int c : {r, g, b}) {
        c = std::clamp(c, 0, 255);
        out.push_back(digits[c / 16]);
        out.push_back(digits[c % 16]);
    }
    return out;
}

std::optional<Hsl> hex_to_hsl(const std::string& hex) {
    auto rgb = hex_to_rgb(hex);
    if (!rgb) return std::nullopt;

    const double r = rgb->r / 255.0;
    const double g = rgb->g / 255.0;
    const double b = rgb->b / 255.0;

    const double mx = std::max({r, g, b});
    const double mn = std::min({r, g, b});
    double h = 0.0;
    double s = 0.0;
    const double l = (mx + mn) / 2;

    if (mx != mn) {
        const double d = mx - mn;
        s = l > 0.5 ? d / (2 - mx - mn) : d / (mx + mn);

        if (mx == r) {
            h = ((g - b) / d + (g < b ? 6 : 0)) / 6;
        } else if (mx == g) {
            h = ((b - r) / d + 2) / 6;
        } else {
            h = ((r - g) / d + 4) / 6;
        }
    }

    return Hsl{std::round(h * 360), std::round(s * 100), std::round(l * 100)};
}

std::string hsl_to_hex(const Hsl& hsl) {
    const double h = hsl.h / 360.0;
    const double s = hsl.s / 100.0;
    const double l = hsl.l / 100.0;

    double r = l, g = l, b = l;
    if (s != 0.0) {
        const double q = l < 0.5 ? l * (1 + s) : l + s - l * s;
        const double p = 2 * l - q;
        r = hue_to_rgb(p, q, h + 1.0 / 3);
        g = hue_to_rgb(p, q, h);
        b = hue_to_rgb(p, q, h - 1.0 / 3);
    }

    return rgb_to_hex(static_cast<int>(std::round(r * 255)),
                      static_cast<int>(std::round(g * 255)),
                      static_cast<int>(std::round(b * 255)));
}

double relative_luminance(const Rgb& rgb) {
    auto channel = [](int v) {
        const double c = v / 255.0;
        return c <= 0.03928 ? c / 12.92 : std::pow((c + 0.055) / 1.055, 2.4);
    };
    return 0.2126 * channel(rgb.r) + 0.7152 * channel(rgb.g) + 0.0722 * channel(rgb.b);
}

double contrast_ratio(const Rgb& a, const Rgb& b) {
    const double l1 = relative_luminance(a);
    const double l2 = relative_luminance(b);
    return (std::max(l1, l2) + 0.05) / (std::min(l1, l2) + 0.05);
}

const std::vector<std::string>& ats_safe_colors() {
    static const std::vector<std::string> colors = {
        // neutrals
        "#000000", "#1a1a1a", "#2d2d2d", "#404040", "#525252", "#666666", "#7a7a7a", "#8d8d8d",
        "#a0a0a0", "#b3b3b3", "#c6c6c6", "#d9d9d9", "#e6e6e6", "#f0f0f0", "#ffffff",
        // blues
        "#000080", "#0000cd", "#1e3a8a", "#1e40af", "#2563eb", "#3b82f6", "#60a5fa", "#93bbfc",
        // greens
        "#006400", "#008000", "#14532d", "#166534", "#16a34a", "#22c55e", "#4ade80", "#86efac",
        // conservative accents
        "#4b0082", "#6b21a8", "#7c3aed", "#8b5cf6", "#a78bfa", "#c4b5fd",
        "#8b4513", "#a0522d", "#d2691e", "#ff8c00", "#ff6347", "#ff4500"
    };
    return colors;
}

bool is_ats_safe(const std::string& color) {
    const std::string normalized = textutil::to_lower_copy(color);
    const auto& safe = ats_safe_colors();
    if (std::find(safe.begin(), safe.end(), normalized) != safe.end()) return true;

    if (!is_strict_hex_color(color)) return false;

    auto rgb = hex_to_rgb(color);
    if (!rgb) return false;

    const double lum = relative_luminance(*rgb);
    return lum >= 0.1 && lum <= 0.9;
}

const std::vector<std::string>& predefined_theme_ids() {
    static const std::vector<std::string> ids = [] {
        std::vector<std::string> out;
        for (const auto& t : theme_table()) out.push_back(t.id);
        return out;
    }();
    return ids;
}

std::optional<ColorScheme> predefined_theme(const std::string& id) {
    for (const auto& t : theme_table()) {
        if (id == t.id) return t.scheme;
    }
    return std::nullopt;
}

std::vector<ColorScheme> predefined_themes() {
    std::vector<ColorScheme> out;
    for (const auto& t : theme_table()) out.push_back(t.scheme);
    return out;
}

ColorScheme create_custom_theme(const std::map<ColorRole, std::string>& overrides, const std::string& name) {
    ColorScheme scheme = *predefined_theme("executive");
    scheme.name = name.empty() ? std::string("Custom Theme") : name;

    for (const auto& kv : overrides) {
        if (!kv.second.empty() && is_ats_safe(kv.second)) {
            scheme.get(kv.first) = kv.second;
        }
    }
    return scheme;
}

std::vector<std::string> generate_harmonious_colors(const std::string& base, HarmonyRelation relation) {
    if (!is_ats_safe(base)) {
        throw errors::validation_error("Base color must be ATS-safe", {{"baseColor", base}});
    }
    auto hsl = hex_to_hsl(base);
    if (!hsl) {
        throw errors::validation_error("Invalid color format", {{"baseColor", base}});
    }

    const double offset = harmony_hue_offset(relation);
    std::vector<std::string> out;

    for (int i = -2; i <= 2; ++i) {
        Hsl candidate;
        candidate.h = std::fmod(hsl->h + i * offset / 3 + 360, 360);
        candidate.s = std::clamp(hsl->s + i * 5, 20.0, 80.0);
        candidate.l = std::clamp(hsl->l + i * 5, 20.0, 80.0);

        const std::string hex = hsl_to_hex(candidate);
        if (is_ats_safe(hex)) out.push_back(hex);
    }
    return out;
}

ColorStates create_color_states(const std::string& base) {
    if (!is_ats_safe(base)) {
        throw errors::validation_error("Base color must be ATS-safe", {{"baseColor", base}});
    }
    auto hsl = hex_to_hsl(base);
    if (!hsl) {
        throw errors::validation_error("Invalid color format", {{"baseColor", base}});
    }

    ColorStates states;
    states.light = hsl_to_hex({hsl->h, hsl->s, std::min(90.0, hsl->l + 20)});
    states.normal = base;
    states.dark = hsl_to_hex({hsl->h, hsl->s, std::max(10.0, hsl->l - 20)});
    states.border = hsl_to_hex({hsl->h, hsl->s, std::max(30.0, hsl->l - 40)});
    states.background = hsl_to_hex({hsl->h, std::min(10.0, hsl->s), std::min(98.0, hsl->l + 35)});
    return states;
}

AccessibilityInfo color_accessibility_info(const std::string& foreground, const std::string& background) {
    auto fg = hex_to_rgb(foreground);
    auto bg = hex_to_rgb(background);
    if (!fg || !bg) {
        throw errors::validation_error("Invalid color format",
                                       {{"foregroundColor", foreground}, {"backgroundColor", background}});
    }

    AccessibilityInfo info;
    info.contrast_ratio = contrast_ratio(*fg, *bg);
    info.wcag_aa = info.contrast_ratio >= 4.5;
    info.wcag_aaa = info.contrast_ratio >= 7;

    if (info.contrast_ratio < 3) {
        info.recommendation = "Poor contrast - Consider using significantly different colors";
    } else if (info.contrast_ratio < 4.5) {
        info.recommendation = "Low contrast - Consider adjusting colors for better readability";
    } else if (info.contrast_ratio < 7) {
        info.recommendation = "Good contrast - Meets WCAG AA standards";
    } else {
        info.recommendation = "Excellent contrast - Meets WCAG AAA standards";
    }
    return info;
}

ColorScheme optimize_for_ats(const ColorScheme& scheme) {
    ColorScheme out = scheme;

    // Unparseable colors fail their check and get replaced.
    if (luminance_or(out.primary, 1.0) > 0.5) {
        out.primary = "#1a1a1a";
    }
    if (luminance_or(out.background, 0.0) < 0.8) {
        out.background = "#ffffff";
    }

    auto accent = hex_to_rgb(out.accent);
    auto bg = hex_to_rgb(out.background);
    if (!accent || !bg || contrast_ratio(*accent, *bg) < 3) {
        out.accent = "#2563eb";
    }
    return out;
}

std::string color_css(const ColorScheme& scheme) {
    std::ostringstream css;
    css << "/* Color Theme */\n:root {\n";
    for (ColorRole r : model::all_color_roles()) {
        css << "  --color-" << model::color_role_str(r) << ": " << scheme.get(r) << ";\n";
    }
    css << "}\n\n"
        << ".resume-container {\n  color: var(--color-text);\n  background-color: var(--color-background);\n}\n\n"
        << ".section-title {\n  color: var(--color-primary);\n  border-bottom: 2px solid var(--color-accent);\n}\n\n"
        << ".item-title {\n  color: var(--color-secondary);\n}\n\n"
        << ".accent-text {\n  color: var(--color-accent);\n}\n\n"
        << ".contact-info {\n  color: var(--color-muted);\n  border-bottom: 1px solid var(--color-border);\n}\n\n"
        << "a {\n  color: var(--color-link);\n}\n\n"
        << ".highlight {\n  background-color: var(--color-highlight);\n}";
    return css.str();
}

} // namespace customize
