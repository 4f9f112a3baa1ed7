#include <gtest/gtest.h>

#include "customize/Layout.hpp"
#include "errors/TemplateError.hpp"

namespace customize {
namespace test {

TEST(LayoutTest, PresetsAndDefault) {
    EXPECT_EQ(layout_presets().size(), 4u);
    ASSERT_TRUE(layout_preset("compact").has_value());
    EXPECT_DOUBLE_EQ(layout_preset("compact")->item_spacing, 3);
    EXPECT_FALSE(layout_preset("cozy").has_value());

    const model::LayoutSettings d = default_layout();
    EXPECT_DOUBLE_EQ(d.margins.top, 0.75);
    EXPECT_DOUBLE_EQ(d.line_height, 1.15);
    EXPECT_EQ(d.alignment, "left");
}

TEST(LayoutTest, CustomLayoutClampsIntoConstraints) {
    LayoutOverrides o;
    o.margins = model::LayoutMargins{0.2, 2.0, 0.75, 0.75};
    o.section_spacing = model::SectionSpacing{30, 2};
    o.item_spacing = 20;
    o.line_height = 3.0;
    o.alignment = "justify";

    const model::LayoutSettings l = create_custom_layout(o);
    EXPECT_DOUBLE_EQ(l.margins.top, 0.5);
    EXPECT_DOUBLE_EQ(l.margins.right, 1.5);
    EXPECT_DOUBLE_EQ(l.section_spacing.before, 24);
    EXPECT_DOUBLE_EQ(l.section_spacing.after, 6);
    EXPECT_DOUBLE_EQ(l.item_spacing, 12);
    EXPECT_DOUBLE_EQ(l.line_height, 2.0);
    EXPECT_EQ(l.alignment, "justify");
}

TEST(LayoutTest, CustomLayoutRejectsUnknownAlignment) {
    LayoutOverrides o;
    o.alignment = "diagonal";
    EXPECT_THROW(create_custom_layout(o), errors::TemplateEngineError);
    EXPECT_THROW(create_section_adjustment(std::nullopt, std::string("upward")), errors::TemplateEngineError);
}

TEST(LayoutTest, AdjustForContentLength) {
    const model::LayoutSettings base = default_layout();

    const model::LayoutSettings loose = adjust_layout_for_content(base, 100);
    EXPECT_DOUBLE_EQ(loose.section_spacing.before, 16);
    EXPECT_DOUBLE_EQ(loose.item_spacing, 8);
    EXPECT_NEAR(loose.line_height, 1.25, 1e-9);

    const model::LayoutSettings tight = adjust_layout_for_content(base, 2000);
    EXPECT_DOUBLE_EQ(tight.section_spacing.before, 10);
    EXPECT_DOUBLE_EQ(tight.item_spacing, 5);

    const model::LayoutSettings same = adjust_layout_for_content(base, 500);
    EXPECT_DOUBLE_EQ(same.item_spacing, base.item_spacing);
}

TEST(LayoutTest, EfficiencyOfDefaultLayout) {
    const LayoutEfficiency e = calculate_layout_efficiency(default_layout(), 500);
    EXPECT_EQ(e.readability_score, 65);
    EXPECT_EQ(e.density_score, 75);
    EXPECT_EQ(e.ats_compliance, 100);
    EXPECT_EQ(e.score, 100);
}

TEST(LayoutTest, EfficiencyPenalizesCrampedLayout) {
    model::LayoutSettings l = default_layout();
    l.line_height = 0.9;
    l.margins = {0.25, 0.25, 0.25, 0.25};
    l.section_spacing.before = 4;
    l.item_spacing = 1;

    const LayoutEfficiency e = calculate_layout_efficiency(l, 500);
    EXPECT_EQ(e.ats_compliance, 30);
    EXPECT_FALSE(e.recommendations.empty());
}

TEST(LayoutTest, OptimizeForAts) {
    model::LayoutSettings l = default_layout();
    l.margins = {1.4, 1.4, 0.3, 0.3};
    l.line_height = 1.9;
    l.alignment = "center";

    const model::LayoutSettings o = optimize_for_ats(l);
    EXPECT_DOUBLE_EQ(o.margins.top, 1.0);
    EXPECT_DOUBLE_EQ(o.margins.left, 0.5);
    EXPECT_DOUBLE_EQ(o.line_height, 1.5);
    EXPECT_EQ(o.alignment, "left");
}

TEST(LayoutTest, ExperienceLevels) {
    const LayoutOverrides senior = experience_based_recommendations("senior");
    ASSERT_TRUE(senior.margins.has_value());
    EXPECT_DOUBLE_EQ(senior.margins->top, 0.5);
    EXPECT_TRUE(experience_based_recommendations("intern").empty());
}

TEST(LayoutTest, CssIncludesCustomSections) {
    model::LayoutSettings l = default_layout();
    l.custom_sections["skills"] = create_section_adjustment(10.0, std::string("center"), std::nullopt, 2);

    const std::string css = layout_css(l);
    EXPECT_NE(css.find("margin: 0.75in 0.75in 0.75in 0.75in;"), std::string::npos);
    EXPECT_NE(css.find(".custom-section-skills {"), std::string::npos);
    EXPECT_NE(css.find("column-count: 2;"), std::string::npos);
    EXPECT_NE(css.find("@media print"), std::string::npos);
}

} // namespace test
} // namespace customize
