#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "model/Customization.hpp"

namespace customize {

struct LayoutPreset {
    std::string id;
    std::string name;
    std::string description;
    model::LayoutSettings settings;
};

struct LayoutConstraints {
    double min_line_height = 1.0;
    double max_line_height = 2.0;
    double min_margin = 0.5;
    double max_margin = 1.5;
    double min_section_spacing = 6;
    double max_section_spacing = 24;
    double min_item_spacing = 2;
    double max_item_spacing = 12;
};

struct LayoutOverrides {
    std::optional<model::LayoutMargins> margins;
    std::optional<model::SectionSpacing> section_spacing;
    std::optional<double> item_spacing;
    std::optional<double> line_height;
    std::optional<std::string> alignment;
    std::optional<std::map<std::string, model::SectionLayoutAdjustment>> custom_sections;

    bool empty() const {
        return !margins && !section_spacing && !item_spacing && !line_height && !alignment && !custom_sections;
    }
};

struct LayoutEfficiency {
    int score = 0;
    int readability_score = 0;
    int density_score = 0;
    int ats_compliance = 100;
    std::vector<std::string> recommendations;
};

const LayoutConstraints& ats_layout_constraints();

const std::vector<LayoutPreset>& layout_presets();
std::optional<model::LayoutSettings> layout_preset(const std::string& id);

// The traditional preset.
model::LayoutSettings default_layout();

// Merges overrides onto `base` and clamps every value into the ATS constraints.
// Throws ValidationFailed for an unknown alignment.
model::LayoutSettings create_custom_layout(const LayoutOverrides& overrides,
                                          const model::LayoutSettings& base = default_layout());

// Loosens spacing for short content (< 200), tightens it for long content (> 800).
model::LayoutSettings adjust_layout_for_content(const model::LayoutSettings& layout, int content_length);

LayoutEfficiency calculate_layout_efficiency(const model::LayoutSettings& layout, int content_length);

model::SectionLayoutAdjustment create_section_adjustment(std::optional<double> spacing,
                                                         std::optional<std::string> alignment,
                                                         std::optional<std::string> width = std::nullopt,
                                                         std::optional<int> columns = std::nullopt,
                                                         std::optional<int> priority = std::nullopt);

model::LayoutSettings optimize_for_ats(const model::LayoutSettings& layout);

// entry | mid | senior | executive; empty overrides otherwise.
LayoutOverrides experience_based_recommendations(const std::string& level);

std::string layout_css(const model::LayoutSettings& layout);

} // namespace customize
