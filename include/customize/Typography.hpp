#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "model/Customization.hpp"

namespace customize {

enum class TextRole { Heading, Body, Accent, Monospace };

struct FontInfo {
    std::string name;
    std::string stack;
    std::string category; // serif | sans-serif | monospace
    int readability = 0;
};

struct FontCombination {
    std::string name;
    std::string heading;
    std::string body;
    std::string accent;
    std::string description;
};

// Partial TextStyle; unset fields keep the base value.
struct TextStyleOverrides {
    std::optional<std::string> font_family;
    std::optional<int> font_weight;
    std::map<std::string, double> font_size;
    std::optional<double> line_height;
    std::optional<double> letter_spacing;
};

struct TypographyOverrides {
    std::optional<TextStyleOverrides> heading;
    std::optional<TextStyleOverrides> body;
    std::optional<TextStyleOverrides> accent;
    std::optional<TextStyleOverrides> monospace;

    bool empty() const { return !heading && !body && !accent && !monospace; }
};

struct ReadabilityFactors {
    double font_size = 0;
    double line_height = 0;
    double font_family = 0;
    double contrast = 0;
};

struct ReadabilityScore {
    int score = 0;
    ReadabilityFactors factors;
    std::vector<std::string> recommendations;
};

const std::vector<FontInfo>& ats_safe_fonts();
std::vector<FontInfo> ats_safe_fonts(const std::string& category);
const std::vector<FontCombination>& professional_combinations();

// Serif and sans-serif families.
bool is_valid_font(const std::string& name);
bool is_valid_monospace_font(const std::string& name);
std::string font_stack(const std::string& name);
std::optional<std::string> font_category(const std::string& name);

bool validate_font_size(double size, TextRole role);
double recommended_font_size(TextRole role, const std::string& context = "default");

model::TypographySettings default_typography();

// Merges overrides onto `base`. A family outside the role's allow-list is dropped.
model::TypographySettings create_custom_typography(const TypographyOverrides& overrides,
                                                   const model::TypographySettings& base = default_typography());

ReadabilityScore calculate_readability_score(const model::TypographySettings& typography);

// Empty overrides for an unknown industry.
TypographyOverrides industry_recommendations(const std::string& industry);

// Throws ValidationFailed for an unknown combination name.
model::TypographySettings apply_professional_combination(const std::string& name);

std::string typography_css(const model::TypographySettings& typography);

} // namespace customize
