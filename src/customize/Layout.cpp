#include "customize/Layout.hpp"

#include "errors/TemplateError.hpp"
#include "util/TextUtil.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace customize {

using model::LayoutMargins;
using model::LayoutSettings;
using textutil::format_number;

namespace {

LayoutSettings make_layout(double margin, double before, double after, double item, double line_height) {
    LayoutSettings l;
    l.margins = {margin, margin, margin, margin};
    l.section_spacing = {before, after};
    l.item_spacing = item;
    l.line_height = line_height;
    l.alignment = "left";
    return l;
}

bool is_known_alignment(const std::string& a) {
    return a == "left" || a == "center" || a == "right" || a == "justify";
}

LayoutMargins clamp_margins(const LayoutMargins& m, double lo, double hi) {
    return {std::clamp(m.top, lo, hi), std::clamp(m.right, lo, hi),
            std::clamp(m.bottom, lo, hi), std::clamp(m.left, lo, hi)};
}

std::string margin_shorthand(const LayoutMargins& m) {
    return format_number(m.top) + "in " + format_number(m.right) + "in " +
           format_number(m.bottom) + "in " + format_number(m.left) + "in";
}

} // namespace

const LayoutConstraints& ats_layout_constraints() {
    static const LayoutConstraints c;
    return c;
}

const std::vector<LayoutPreset>& layout_presets() {
    static const std::vector<LayoutPreset> presets = {
        {"traditional", "Traditional", "Classic conservative layout suitable for traditional industries",
         make_layout(0.75, 12, 8, 6, 1.15)},
        {"modern", "Modern", "Contemporary layout with efficient use of space",
         make_layout(0.5, 10, 6, 4, 1.3)},
        {"compact", "Compact", "Space-efficient layout for experienced professionals",
         make_layout(0.5, 8, 4, 3, 1.1)},
        {"spacious", "Spacious", "Open layout with generous white space",
         make_layout(1.0, 16, 12, 8, 1.5)},
    };
    return presets;
}

std::optional<LayoutSettings> layout_preset(const std::string& id) {
    for (const auto& p : layout_presets()) {
        if (p.id == id) return p.settings;
    }
    return std::nullopt;
}

LayoutSettings default_layout() {
    return *layout_preset("traditional");
}

LayoutSettings create_custom_layout(const LayoutOverrides& o, const LayoutSettings& base) {
    const auto& c = ats_layout_constraints();
    LayoutSettings out = base;

    if (o.margins) out.margins = *o.margins;
    if (o.section_spacing) out.section_spacing = *o.section_spacing;
    if (o.item_spacing) out.item_spacing = *o.item_spacing;
    if (o.line_height) out.line_height = *o.line_height;
    if (o.alignment) {
        if (!is_known_alignment(*o.alignment)) {
            throw errors::validation_error("Invalid alignment: " + *o.alignment, {{"alignment", *o.alignment}});
        }
        out.alignment = *o.alignment;
    }
    if (o.custom_sections) out.custom_sections = *o.custom_sections;

    out.margins = clamp_margins(out.margins, c.min_margin, c.max_margin);
    out.section_spacing.before = std::round(std::clamp(out.section_spacing.before, c.min_section_spacing, c.max_section_spacing));
    out.section_spacing.after = std::round(std::clamp(out.section_spacing.after, c.min_section_spacing, c.max_section_spacing));
    out.item_spacing = std::round(std::clamp(out.item_spacing, c.min_item_spacing, c.max_item_spacing));
    out.line_height = std::clamp(out.line_height, c.min_line_height, c.max_line_height);
    return out;
}

LayoutSettings adjust_layout_for_content(const LayoutSettings& layout, int content_length) {
    const auto& c = ats_layout_constraints();
    LayoutSettings out = layout;

    if (content_length < 200) {
        out.section_spacing.before = std::min(layout.section_spacing.before + 4, c.max_section_spacing);
        out.section_spacing.after = std::min(layout.section_spacing.after + 2, c.max_section_spacing);
        out.item_spacing = std::min(layout.item_spacing + 2, c.max_item_spacing);
        out.line_height = std::min(layout.line_height + 0.1, c.max_line_height);
    } else if (content_length > 800) {
        out.section_spacing.before = std::max(layout.section_spacing.before - 2, c.min_section_spacing);
        out.section_spacing.after = std::max(layout.section_spacing.after - 2, c.min_section_spacing);
        out.item_spacing = std::max(layout.item_spacing - 1, c.min_item_spacing);
        out.line_height = std::max(layout.line_height - 0.05, c.min_line_height);
    }
    return out;
}

LayoutEfficiency calculate_layout_efficiency(const LayoutSettings& layout, int content_length) {
    LayoutEfficiency e;

    if (layout.line_height >= 1.2 && layout.line_height <= 1.5) {
        e.readability_score += 25;
    } else if (layout.line_height >= 1.0 && layout.line_height <= 1.8) {
        e.readability_score += 15;
    } else {
        e.readability_score += 5;
        e.recommendations.push_back("Consider using 1.2-1.5 line height for better readability");
    }

    if (layout.section_spacing.before >= 8 && layout.section_spacing.before <= 16) {
        e.readability_score += 25;
    } else {
        e.readability_score += 10;
        e.recommendations.push_back("Section spacing should be between 8-16 points");
    }

    if (layout.item_spacing >= 4 && layout.item_spacing <= 8) {
        e.readability_score += 25;
    } else {
        e.readability_score += 10;
        e.recommendations.push_back("Item spacing should be between 4-8 points");
    }

    const auto& m = layout.margins;
    const double avg_margin = (m.top + m.bottom + m.left + m.right) / 4;
    if (avg_margin >= 0.5 && avg_margin <= 1.0) {
        e.density_score += 50;
    } else if (avg_margin >= 0.75 && avg_margin <= 1.25) {
        e.density_score += 30;
    } else {
        e.density_score += 10;
        e.recommendations.push_back("Margins should be between 0.5-1.0 inches for optimal density");
    }

    // Letter page, ~60 characters per line, 12pt base.
    const double expected_lines = content_length / 60.0;
    const double available_height = 11 - (m.top + m.bottom);
    const double line_pt = layout.line_height * 12;
    const double max_lines = std::floor(available_height * 72 / line_pt);

    if (expected_lines <= max_lines * 0.8) {
        e.density_score += 25;
    } else if (expected_lines <= max_lines) {
        e.density_score += 15;
    } else {
        e.density_score += 5;
        e.recommendations.push_back("Consider reducing content or making layout more compact");
    }

    if (layout.line_height < 1.0) e.ats_compliance -= 20;
    if (avg_margin < 0.5) e.ats_compliance -= 20;
    if (layout.section_spacing.before < 6) e.ats_compliance -= 15;
    if (layout.item_spacing < 2) e.ats_compliance -= 15;

    const int total = static_cast<int>(std::round((e.readability_score + e.density_score) * 0.9 + e.ats_compliance * 0.1));
    e.score = std::min(100, total);
    return e;
}

model::SectionLayoutAdjustment create_section_adjustment(std::optional<double> spacing,
                                                         std::optional<std::string> alignment,
                                                         std::optional<std::string> width,
                                                         std::optional<int> columns,
                                                         std::optional<int> priority) {
    if (alignment && !is_known_alignment(*alignment)) {
        throw errors::validation_error("Invalid alignment: " + *alignment, {{"alignment", *alignment}});
    }
    model::SectionLayoutAdjustment a;
    a.spacing = spacing;
    a.alignment = std::move(alignment);
    a.width = std::move(width);
    a.columns = columns;
    a.priority = priority;
    return a;
}

LayoutSettings optimize_for_ats(const LayoutSettings& layout) {
    LayoutSettings out = layout;
    out.line_height = std::clamp(layout.line_height, 1.0, 1.5);
    out.margins = clamp_margins(layout.margins, 0.5, 1.0);
    out.section_spacing.before = std::clamp(layout.section_spacing.before, 6.0, 16.0);
    out.section_spacing.after = std::clamp(layout.section_spacing.after, 6.0, 16.0);
    out.item_spacing = std::clamp(layout.item_spacing, 2.0, 8.0);
    out.alignment = "left";
    return out;
}

LayoutOverrides experience_based_recommendations(const std::string& level) {
    const std::string key = textutil::to_lower_copy(textutil::trim_copy(level));
    LayoutOverrides o;

    auto fill = [&o](double margin, double before, double after, double item, double lh) {
        o.margins = LayoutMargins{margin, margin, margin, margin};
        o.section_spacing = model::SectionSpacing{before, after};
        o.item_spacing = item;
        o.line_height = lh;
    };

    if (key == "entry") {
        fill(1.0, 10, 6, 4, 1.3);
    } else if (key == "mid") {
        fill(0.75, 12, 8, 6, 1.2);
    } else if (key == "senior") {
        fill(0.5, 8, 6, 4, 1.15);
    } else if (key == "executive") {
        fill(0.75, 16, 12, 8, 1.25);
    }
    return o;
}

std::string layout_css(const LayoutSettings& l) {
    const std::string margin = margin_shorthand(l.margins);
    const std::string before = format_number(l.section_spacing.before);
    const std::string after = format_number(l.section_spacing.after);
    const std::string item = format_number(l.item_spacing);
    const std::string lh = format_number(l.line_height);

    std::ostringstream css;
    css << "/* Layout Styles */\n"
        << ".resume-container {\n  margin: " << margin << ";\n  line-height: " << lh
        << ";\n  text-align: " << l.alignment << ";\n}\n\n"
        << ".resume-section {\n  margin-top: " << before << "pt;\n  margin-bottom: " << after << "pt;\n}\n\n"
        << ".resume-item {\n  margin-bottom: " << item << "pt;\n}\n\n"
        << ".section-title {\n  margin-bottom: " << format_number(std::max(l.item_spacing - 2, 2.0)) << "pt;\n}\n\n"
        << ".item-title {\n  margin-bottom: " << format_number(std::max(l.item_spacing - 4, 1.0)) << "pt;\n}\n\n"
        << ".contact-info {\n  margin-bottom: " << before << "pt;\n}\n\n"
        << ".two-column-layout {\n  display: flex;\n  gap: " << format_number(l.item_spacing * 2) << "pt;\n}\n\n"
        << ".two-column-layout .sidebar {\n  flex: 0 0 35%;\n}\n\n"
        << ".two-column-layout .main-content {\n  flex: 1;\n}\n\n"
        << "@media print {\n"
        << "  .resume-container {\n    margin: " << margin << ";\n    line-height: " << lh << ";\n  }\n\n"
        << "  .resume-section {\n    page-break-inside: avoid;\n    margin-top: " << before
        << "pt;\n    margin-bottom: " << after << "pt;\n  }\n\n"
        << "  .resume-item {\n    margin-bottom: " << item << "pt;\n    page-break-inside: avoid;\n  }\n}";

    for (const auto& kv : l.custom_sections) {
        const auto& a = kv.second;
        css << "\n\n.custom-section-" << kv.first << " {\n"
            << "  margin-top: " << format_number(a.spacing.value_or(l.section_spacing.before)) << "pt;\n"
            << "  margin-bottom: " << format_number(a.spacing.value_or(l.section_spacing.after)) << "pt;\n";
        if (a.alignment) css << "  text-align: " << *a.alignment << ";\n";
        if (a.width) css << "  width: " << *a.width << ";\n";
        if (a.columns && *a.columns > 1) css << "  column-count: " << *a.columns << ";\n";
        css << "}";
    }
    return css.str();
}

} // namespace customize
