#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "model/Customization.hpp"

namespace customize {

struct Rgb {
    int r = 0;
    int g = 0;
    int b = 0;
};

// h in degrees, s and l in percent.
struct Hsl {
    double h = 0.0;
    double s = 0.0;
    double l = 0.0;
};

enum class HarmonyRelation {
    Analogous,
    Complementary,
    Triadic,
    SplitComplementary,
    Tetradic
};

// Accepts "split-complementary" and "split_complementary".
std::optional<HarmonyRelation> parse_harmony_relation(const std::string& s);
int harmony_hue_offset(HarmonyRelation r);

struct ColorStates {
    std::string light;
    std::string normal;
    std::string dark;
    std::string border;
    std::string background;
};

struct AccessibilityInfo {
    double contrast_ratio = 1.0;
    bool wcag_aa = false;
    bool wcag_aaa = false;
    std::string recommendation;
};

std::optional<Rgb> hex_to_rgb(const std::string& hex);
std::string rgb_to_hex(int r, int g, int b);
// Components are rounded to whole degrees/percent.
std::optional<Hsl> hex_to_hsl(const std::string& hex);
std::string hsl_to_hex(const Hsl& hsl);

double relative_luminance(const Rgb& rgb);
double contrast_ratio(const Rgb& a, const Rgb& b);

const std::vector<std::string>& ats_safe_colors();

// True for an allow-listed color, or a #rrggbb color whose luminance is in [0.1, 0.9].
bool is_ats_safe(const std::string& color);

const std::vector<std::string>& predefined_theme_ids();
std::optional<model::ColorScheme> predefined_theme(const std::string& id);
std::vector<model::ColorScheme> predefined_themes();

// Executive theme with every ATS-safe override applied; unsafe overrides are ignored.
model::ColorScheme create_custom_theme(const std::map<model::ColorRole, std::string>& overrides,
                                       const std::string& name = "Custom Theme");

// Up to five ATS-safe variations around `base`. Throws ValidationFailed for an unsafe base.
std::vector<std::string> generate_harmonious_colors(const std::string& base,
                                                    HarmonyRelation relation = HarmonyRelation::Analogous);

ColorStates create_color_states(const std::string& base);

AccessibilityInfo color_accessibility_info(const std::string& foreground, const std::string& background);

// Dark primary, light background, accent readable on the background. Idempotent.
model::ColorScheme optimize_for_ats(const model::ColorScheme& scheme);

// :root custom properties plus the rules that consume them.
std::string color_css(const model::ColorScheme& scheme);

} // namespace customize
