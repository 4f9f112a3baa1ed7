#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <thread>

#include "TestFixtures.hpp"
#include "customize/CustomizationEngine.hpp"
#include "errors/TemplateError.hpp"
#include "io/JsonIO.hpp"
#include "render/RenderingPipeline.hpp"

namespace render {
namespace test {

class RenderingPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        tmpl_ = io::load_template(::test::data_path("templates/professional.json"));
        resume_ = io::load_resume(::test::data_path("sample_resume.json"));
    }

    model::ResumeTemplate tmpl_;
    model::ResumeData resume_;
};

class ThrowingBinder final : public DataBinder {
public:
    BindingResult bind(const model::ResumeTemplate&, const model::ResumeData&,
                       const model::TemplateCustomization*) override {
        throw std::runtime_error("binder offline");
    }
};

TEST_F(RenderingPipelineTest, RendersSampleWithoutWarnings) {
    RenderingPipeline pipeline;
    const RenderedTemplate out = pipeline.render(tmpl_, resume_);

    EXPECT_TRUE(out.warnings.empty());
    EXPECT_EQ(out.template_id, "professional-classic");
    EXPECT_EQ(out.resume_id, "resume-001");
    EXPECT_EQ(out.id.rfind("rendered-professional-classic-", 0), 0u);

    // stylesheet is inlined by default
    EXPECT_NE(out.rendered.html.find("<style>"), std::string::npos);
    EXPECT_TRUE(out.rendered.css.empty());
    EXPECT_NE(out.rendered.html.find("Jordan Rivera"), std::string::npos);
    EXPECT_NE(out.rendered.html.find("data-section=\"experience\""), std::string::npos);
    EXPECT_FALSE(out.rendered.javascript.empty());
    ASSERT_EQ(out.rendered.assets.size(), 1u);
    EXPECT_EQ(out.rendered.assets[0], "previews/professional-classic.png");

    EXPECT_EQ(out.metadata.version, "1.0");
    EXPECT_EQ(out.metadata.checksum.size(), 8u);
    EXPECT_EQ(out.metadata.checksum, content_checksum(out.rendered.to_json().dump()));
    EXPECT_EQ(out.metadata.size.total,
              out.rendered.html.size() + out.rendered.css.size() + out.rendered.javascript.size());

    const auto metrics = pipeline.performance_metrics();
    EXPECT_EQ(metrics.size(), 6u);
    EXPECT_EQ(metrics.at("output").count, 1);
}

TEST_F(RenderingPipelineTest, UnsupportedFormatFallsBackToHtml) {
    RenderingOptions opts;
    opts.format = "xml";

    RenderingPipeline pipeline;
    const RenderedTemplate out = pipeline.render(tmpl_, resume_, opts);

    ASSERT_EQ(out.warnings.size(), 1u);
    EXPECT_EQ(out.warnings[0], "Unsupported format: xml, using html");
    EXPECT_NE(out.rendered.html.find("class=\"format-html\""), std::string::npos);
}

TEST_F(RenderingPipelineTest, MissingTemplateIdAborts) {
    tmpl_.id.clear();
    RenderingPipeline pipeline;

    try {
        pipeline.render(tmpl_, resume_);
        FAIL() << "expected the validation stage to abort";
    } catch (const errors::TemplateEngineError& e) {
        EXPECT_EQ(e.type(), errors::ErrorType::ValidationFailed);
        EXPECT_EQ(e.details().at("stage"), "validation");
    }
    EXPECT_EQ(pipeline.performance_metrics().count("dataBinding"), 0u);
}

TEST_F(RenderingPipelineTest, MissingRequiredFieldAborts) {
    resume_.personal.email.clear();
    RenderingPipeline pipeline;

    try {
        pipeline.render(tmpl_, resume_);
        FAIL() << "expected the data binding stage to abort";
    } catch (const errors::TemplateEngineError& e) {
        EXPECT_EQ(e.type(), errors::ErrorType::ValidationFailed);
        EXPECT_EQ(e.details().at("stage"), "dataBinding");
    }
}

TEST_F(RenderingPipelineTest, RecoverableBindingIssuesBecomeWarnings) {
    resume_.certifications.clear();
    RenderingPipeline pipeline;
    const RenderedTemplate out = pipeline.render(tmpl_, resume_);

    ASSERT_EQ(out.warnings.size(), 1u);
    EXPECT_EQ(out.warnings[0], "Section 'Certifications' has no data");
    EXPECT_EQ(out.rendered.html.find("data-section=\"certifications\""), std::string::npos);
}

TEST_F(RenderingPipelineTest, BinderExceptionFailsRender) {
    RenderingPipeline pipeline(std::make_unique<ThrowingBinder>());
    try {
        pipeline.render(tmpl_, resume_);
        FAIL() << "expected a rendering failure";
    } catch (const errors::TemplateEngineError& e) {
        EXPECT_EQ(e.type(), errors::ErrorType::RenderFailed);
        EXPECT_NE(std::string(e.what()).find("binder offline"), std::string::npos);
    }
}

TEST_F(RenderingPipelineTest, OptionalStageFailureIsRolledBack) {
    RenderingPipeline pipeline;
    pipeline.set_stage(StageId::Optimization, [](RenderingContext& ctx, const CancellationToken&) {
        ctx.artifacts.html = "<p>half-done</p>";
        ctx.warnings.push_back("scratch");
        throw std::runtime_error("minifier crashed");
    });

    const RenderedTemplate out = pipeline.render(tmpl_, resume_);

    ASSERT_EQ(out.warnings.size(), 1u);
    EXPECT_EQ(out.warnings[0], "Stage optimization failed but is not critical: minifier crashed");
    EXPECT_NE(out.rendered.html.find("<!doctype html>"), std::string::npos);
    EXPECT_EQ(out.rendered.html.find("<style>"), std::string::npos);
    EXPECT_FALSE(out.rendered.css.empty());
}

TEST_F(RenderingPipelineTest, RequiredStageTimeout) {
    RenderingPipeline pipeline;
    pipeline.set_stage_timeout(StageId::Styling, std::chrono::milliseconds(5));
    pipeline.set_stage(StageId::Styling, [](RenderingContext& ctx, const CancellationToken& token) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        ctx.artifacts.css = "body{}";
        token.checkpoint();
    });

    try {
        pipeline.render(tmpl_, resume_);
        FAIL() << "expected a timeout";
    } catch (const errors::TemplateEngineError& e) {
        EXPECT_EQ(e.type(), errors::ErrorType::RenderFailed);
        EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos);
    }
}

TEST_F(RenderingPipelineTest, ZeroTimeoutUsesGlobalSetting) {
    RenderingPipeline pipeline;
    pipeline.set_stage_timeout(StageId::Optimization, std::chrono::milliseconds(0));
    pipeline.set_stage(StageId::Optimization, [](RenderingContext&, const CancellationToken& token) {
        EXPECT_EQ(token.timeout(), std::chrono::milliseconds(1500));
    });

    RenderingOptions opts;
    opts.performance.timeout = std::chrono::milliseconds(1500);
    pipeline.render(tmpl_, resume_, opts);

    EXPECT_EQ(pipeline.stage_settings(StageId::Optimization).timeout.count(), 0);
    EXPECT_FALSE(pipeline.stage_settings(StageId::Optimization).required);
}

TEST_F(RenderingPipelineTest, CustomizationDrivesOrderAndVisibility) {
    customize::CustomizationEngine engine(tmpl_);
    engine.reorder_sections({"skills", "contact"});

    RenderingOptions opts;
    opts.customizations = engine.current_customization();
    opts.optimization.inline_css = false;

    RenderingPipeline pipeline;
    const RenderedTemplate out = pipeline.render(tmpl_, resume_, opts);
    const std::string& html = out.rendered.html;

    const size_t skills = html.find("data-section=\"skills\"");
    const size_t contact = html.find("data-section=\"contact\"");
    ASSERT_NE(skills, std::string::npos);
    ASSERT_NE(contact, std::string::npos);
    EXPECT_LT(skills, contact);

    // projects and certifications are hidden by the default section set
    EXPECT_EQ(html.find("data-section=\"projects\""), std::string::npos);
    EXPECT_NE(out.rendered.css.find("/* Resume Template Customization */"), std::string::npos);
    ASSERT_TRUE(out.customizations.has_value());
    EXPECT_EQ(out.to_json().at("customizations").at("templateId"), "professional-classic");
}

TEST_F(RenderingPipelineTest, MinifyShrinksOutput) {
    RenderingPipeline pipeline;
    const RenderedTemplate plain = pipeline.render(tmpl_, resume_);

    RenderingOptions opts;
    opts.optimization.minify = true;
    const RenderedTemplate small = pipeline.render(tmpl_, resume_, opts);

    EXPECT_LT(small.rendered.html.size(), plain.rendered.html.size());
    EXPECT_EQ(small.rendered.html.find("/*"), std::string::npos);
    EXPECT_EQ(pipeline.performance_metrics().at("validation").count, 2);

    pipeline.clear_performance_metrics();
    EXPECT_TRUE(pipeline.performance_metrics().empty());
}

TEST(TemplateCssTest, BaseAndResponsiveRules) {
    const model::ResumeTemplate t = ::test::make_template();

    const std::string base = template_base_css(t);
    EXPECT_NE(base.find("/* Generated CSS for tmpl-basic */"), std::string::npos);
    EXPECT_NE(base.find("padding: 0.75in 0.75in 0.75in 0.75in;"), std::string::npos);

    const std::string responsive = responsive_css(t);
    EXPECT_NE(responsive.find("@media (max-width: 768px)"), std::string::npos);
    EXPECT_NE(responsive.find("@media (max-width: 1024px)"), std::string::npos);
}

TEST(StageNameTest, Names) {
    EXPECT_STREQ(stage_name(StageId::DataBinding), "dataBinding");
    EXPECT_STREQ(stage_name(StageId::ContentProcessing), "contentProcessing");
}

} // namespace test
} // namespace render
