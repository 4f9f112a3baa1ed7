#include <gtest/gtest.h>

#include <stdexcept>

#include "TestFixtures.hpp"
#include "customize/CustomizationEngine.hpp"
#include "errors/TemplateError.hpp"
#include "io/CustomizationJson.hpp"

namespace customize {
namespace test {

using nlohmann::json;

class CustomizationEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        tmpl_ = ::test::make_template();
    }

    model::ResumeTemplate tmpl_;
};

TEST_F(CustomizationEngineTest, StartsFromDefaults) {
    CustomizationEngine engine(tmpl_);
    const model::TemplateCustomization c = engine.current_customization();

    EXPECT_EQ(c.template_id, "tmpl-basic");
    EXPECT_EQ(c.name, "Basic (Custom)");
    EXPECT_EQ(c.color_scheme.name, "Executive");
    EXPECT_EQ(c.typography.heading.font_family, "Arial");
    EXPECT_EQ(c.section_visibility.sections.size(), 12u);
    EXPECT_EQ(c.metadata.changes, 0);
    EXPECT_TRUE(engine.history().empty());
}

TEST_F(CustomizationEngineTest, UnnamedTemplateGetsGenericName) {
    tmpl_.name.clear();
    CustomizationEngine engine(tmpl_);
    EXPECT_EQ(engine.current_customization().name, "Custom Resume");
}

TEST_F(CustomizationEngineTest, ApplyThemeRecordsChange) {
    CustomizationEngine engine(tmpl_);
    engine.apply_color_theme("modern_green");

    const model::TemplateCustomization c = engine.current_customization();
    EXPECT_EQ(c.color_scheme.name, "Modern Green");
    EXPECT_EQ(c.metadata.changes, 1);
    ASSERT_EQ(engine.history().size(), 1u);
    EXPECT_EQ(engine.history().latest()->kind, ChangeKind::Color);
    EXPECT_EQ(engine.history().latest()->property, "theme");

    EXPECT_THROW(engine.apply_color_theme("neon"), errors::TemplateEngineError);
    EXPECT_EQ(engine.history().size(), 1u);
}

TEST_F(CustomizationEngineTest, CustomizeColorRejectsUnsafe) {
    CustomizationEngine engine(tmpl_);
    engine.customize_color(model::ColorRole::Accent, "#7c3aed");
    EXPECT_EQ(engine.current_customization().color_scheme.accent, "#7c3aed");

    try {
        engine.customize_color(model::ColorRole::Primary, "#ffff00");
        FAIL() << "expected a validation error";
    } catch (const errors::TemplateEngineError& e) {
        EXPECT_EQ(e.type(), errors::ErrorType::ValidationFailed);
        EXPECT_EQ(e.details().at("property"), "primary");
    }
    EXPECT_EQ(engine.current_customization().color_scheme.primary, "#1a1a1a");
}

TEST_F(CustomizationEngineTest, UndoRestoresPreviousState) {
    CustomizationEngine engine(tmpl_);
    engine.apply_font_combination("Traditional Professional");
    engine.apply_layout_preset("compact");
    engine.toggle_section("projects");

    ASSERT_TRUE(engine.undo_last_change());
    EXPECT_FALSE(engine.current_customization().section_visibility.find("projects")->visible);

    ASSERT_TRUE(engine.undo_last_change());
    EXPECT_DOUBLE_EQ(engine.current_customization().layout.item_spacing, 6);

    ASSERT_TRUE(engine.undo_last_change());
    EXPECT_EQ(engine.current_customization().typography.heading.font_family, "Arial");

    EXPECT_FALSE(engine.undo_last_change());
}

TEST_F(CustomizationEngineTest, UndoOnFreshEngineReturnsFalse) {
    CustomizationEngine engine(tmpl_);
    EXPECT_FALSE(engine.undo_last_change());
}

TEST_F(CustomizationEngineTest, UndoKeepsCatalogOrder) {
    CustomizationEngine engine(tmpl_);
    engine.reorder_sections({"skills", "contact"});
    ASSERT_TRUE(engine.undo_last_change());

    const auto& sections = engine.current_customization().section_visibility.sections;
    ASSERT_EQ(sections.size(), 12u);
    EXPECT_EQ(sections[0].id, "contact");
    EXPECT_EQ(sections[1].id, "summary");
    EXPECT_EQ(sections[0].order, 1);
}

TEST_F(CustomizationEngineTest, ResetCannotBeUndone) {
    CustomizationEngine engine(tmpl_);
    engine.apply_color_theme("corporate");
    engine.reset_to_defaults();

    EXPECT_EQ(engine.history().size(), 1u);
    EXPECT_EQ(engine.current_customization().color_scheme.name, "Executive");

    EXPECT_FALSE(engine.undo_last_change());
    EXPECT_TRUE(engine.history().empty());
    EXPECT_EQ(engine.current_customization().color_scheme.name, "Executive");
}

TEST_F(CustomizationEngineTest, RequiredSectionsStayVisible) {
    CustomizationEngine engine(tmpl_);
    EXPECT_THROW(engine.toggle_section("experience"), errors::TemplateEngineError);
    EXPECT_THROW(engine.reorder_sections({"nowhere"}), errors::TemplateEngineError);
    EXPECT_TRUE(engine.history().empty());
}

TEST_F(CustomizationEngineTest, RoleCustomization) {
    CustomizationEngine engine(tmpl_);
    engine.apply_role_customization("software-engineer", "tech", "senior");

    const model::TemplateCustomization c = engine.current_customization();
    EXPECT_TRUE(c.section_visibility.find("projects")->visible);
    EXPECT_TRUE(c.section_visibility.find("education")->visible);
    EXPECT_EQ(c.typography.monospace.font_family, "Consolas");
    EXPECT_DOUBLE_EQ(c.layout.margins.top, 0.5);

    const CustomizationChange* last = engine.history().latest();
    ASSERT_NE(last, nullptr);
    EXPECT_EQ(last->kind, ChangeKind::Role);
    EXPECT_EQ(last->metadata.at("industry"), "tech");

    ASSERT_TRUE(engine.undo_last_change());
    EXPECT_FALSE(engine.current_customization().section_visibility.find("projects")->visible);
    EXPECT_DOUBLE_EQ(engine.current_customization().layout.margins.top, 0.75);
}

TEST_F(CustomizationEngineTest, CustomizeTypographyAndLayout) {
    CustomizationEngine engine(tmpl_);

    TypographyOverrides t;
    t.body = TextStyleOverrides{};
    t.body->font_family = "Verdana";
    engine.customize_typography(t);
    EXPECT_EQ(engine.current_customization().typography.body.font_family, "Verdana");

    LayoutOverrides l;
    l.line_height = 5.0;
    engine.customize_layout(l);
    EXPECT_DOUBLE_EQ(engine.current_customization().layout.line_height, 2.0);

    LayoutOverrides bad;
    bad.alignment = "sideways";
    EXPECT_THROW(engine.customize_layout(bad), errors::TemplateEngineError);
    EXPECT_EQ(engine.history().size(), 2u);
}

TEST_F(CustomizationEngineTest, AnalyticsScores) {
    CustomizationEngine engine(tmpl_);
    const CustomizationAnalytics a = engine.analytics();

    EXPECT_EQ(a.readability_score, 99);
    EXPECT_EQ(a.design_score, 100);
    EXPECT_EQ(a.content_completeness, 0);
    EXPECT_LE(a.recommendations.size(), 5u);
    EXPECT_FALSE(a.strengths.empty());
    EXPECT_FALSE(a.warnings.empty());

    const json j = a.to_json();
    EXPECT_EQ(j.at("readabilityScore"), 99);
}

TEST_F(CustomizationEngineTest, ExportImportRoundTrip) {
    CustomizationEngine source(tmpl_);
    source.apply_color_theme("leadership");
    source.toggle_section("certifications");
    const std::string exported = source.export_customization();

    const json j = json::parse(exported);
    EXPECT_EQ(j.at("baseTemplate"), "tmpl-basic");
    EXPECT_EQ(j.at("changeHistory").size(), 2u);

    CustomizationEngine target(tmpl_);
    target.import_customization(exported);

    const model::TemplateCustomization c = target.current_customization();
    EXPECT_EQ(c.color_scheme.primary, "#1e293b");
    EXPECT_TRUE(c.section_visibility.find("certifications")->visible);
    // imported history plus the import record
    EXPECT_EQ(target.history().size(), 3u);
    EXPECT_EQ(target.history().latest()->kind, ChangeKind::Import);
}

TEST_F(CustomizationEngineTest, ImportRejectsBadInput) {
    CustomizationEngine engine(tmpl_);
    EXPECT_THROW(engine.import_customization("{oops"), errors::TemplateEngineError);
    EXPECT_THROW(engine.import_customization("{\"colorScheme\": {}}"), errors::TemplateEngineError);

    json j = json::parse(engine.export_customization());
    j["colorScheme"]["accent"] = "teal";
    try {
        engine.import_customization(j.dump());
        FAIL() << "expected a validation error";
    } catch (const errors::TemplateEngineError& e) {
        EXPECT_STREQ(e.what(), "Invalid color format");
    }
    EXPECT_TRUE(engine.history().empty());
}

TEST_F(CustomizationEngineTest, ImportOptimizesForAts) {
    CustomizationEngine engine(tmpl_);
    json j = json::parse(engine.export_customization());
    j["colorScheme"]["background"] = "#333333";
    j["layout"]["alignment"] = "center";

    engine.import_customization(j.dump());
    const model::TemplateCustomization c = engine.current_customization();
    EXPECT_EQ(c.color_scheme.background, "#ffffff");
    EXPECT_EQ(c.layout.alignment, "left");
}

TEST_F(CustomizationEngineTest, ListenersSeeEveryChange) {
    CustomizationEngine engine(tmpl_);
    int calls = 0;
    std::string last_theme;

    const auto id = engine.add_listener([&](const model::TemplateCustomization& c) {
        ++calls;
        last_theme = c.color_scheme.name;
    });
    engine.add_listener([](const model::TemplateCustomization&) { throw std::runtime_error("boom"); });
    engine.add_listener([](const model::TemplateCustomization&) { throw 42; });
    int later = 0;
    engine.add_listener([&](const model::TemplateCustomization&) { ++later; });
    EXPECT_EQ(engine.listener_count(), 4u);

    EXPECT_NO_THROW(engine.apply_color_theme("minimal"));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(later, 1);
    EXPECT_EQ(last_theme, "Minimal");

    engine.undo_last_change();
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(last_theme, "Executive");

    engine.remove_listener(id);
    engine.apply_color_theme("corporate");
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(later, 3);
    EXPECT_EQ(engine.listener_count(), 3u);
}

TEST_F(CustomizationEngineTest, CssCoversEverySection) {
    CustomizationEngine engine(tmpl_);
    engine.toggle_section("projects");
    const std::string css = engine.generate_css();

    EXPECT_EQ(css.rfind("/* Resume Template Customization */", 0), 0u);
    EXPECT_NE(css.find(".resume-section[data-section=\"projects\"] {\n  display: block;"), std::string::npos);
    EXPECT_NE(css.find(".resume-section[data-section=\"awards\"] {\n  display: none;"), std::string::npos);
    EXPECT_NE(css.find("/* Typography Styles */"), std::string::npos);
    EXPECT_NE(css.find("/* Layout Styles */"), std::string::npos);
}

} // namespace test
} // namespace customize
