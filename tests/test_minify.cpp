#include <gtest/gtest.h>

#include "render/CancellationToken.hpp"
#include "render/HtmlRenderer.hpp"
#include "render/Minify.hpp"

#include <thread>

namespace render {
namespace test {

TEST(MinifyTest, HtmlDropsCommentsAndGaps) {
    const std::string html = "<div>\n  <!-- note -->\n  <p>Hello   world</p>\n</div>\n";
    EXPECT_EQ(minify_html(html), "<div><p>Hello world</p></div>");
}

TEST(MinifyTest, CssDropsCommentsAndSpacing) {
    const std::string css = "/* head */\n.a {\n  color: red;\n  margin: 0 auto;\n}\n\n.b, .c {\n  top: 0;\n}";
    EXPECT_EQ(minify_css(css), ".a{color:red;margin:0 auto}.b,.c{top:0}");
}

TEST(MinifyTest, InlineCssGoesBeforeHeadClose) {
    EXPECT_EQ(inline_css("<html><head></head><body></body></html>", "p{}"),
              "<html><head><style>\np{}\n</style>\n</head><body></body></html>");
    EXPECT_EQ(inline_css("<p>x</p>", "p{}"), "<style>\np{}\n</style>\n<p>x</p>");
}

TEST(MinifyTest, CompressDropsBlankLines) {
    EXPECT_EQ(compress_html("<a>  \n\n   \n<!-- x --><b>\n"), "<a>\n<b>\n");
}

TEST(HtmlRendererTest, Escape) {
    EXPECT_EQ(html_escape("<a href=\"x\">&'"), "&lt;a href=&quot;x&quot;&gt;&amp;'");
}

TEST(HtmlRendererTest, TemplateScriptQuotesId) {
    model::ResumeTemplate t;
    t.id = "it's</script><b>";

    const std::string js = template_script(t);
    EXPECT_NE(js.find("setAttribute('data-template', \"it's<\\/script><b>\");"), std::string::npos);
    EXPECT_EQ(js.find("</script>"), std::string::npos);
}

TEST(HtmlRendererTest, SectionMarkup) {
    ProcessedSection s;
    s.id = "work";
    s.catalog_id = "experience";
    s.name = "Work <History>";
    s.type = model::SectionType::Experience;
    model::ExperienceItem e;
    e.position = "Engineer";
    e.company = "Acme & Co";
    s.payload = std::vector<model::ExperienceItem>{e};
    s.layout.alignment = "center";

    const std::string html = render_section_html(s);
    EXPECT_NE(html.find("data-section=\"experience\""), std::string::npos);
    EXPECT_NE(html.find("data-align=\"center\""), std::string::npos);
    EXPECT_NE(html.find("Work &lt;History&gt;"), std::string::npos);
    EXPECT_NE(html.find("Acme &amp; Co"), std::string::npos);
}

TEST(HtmlRendererTest, DocumentSkipsHiddenSections) {
    model::ResumeTemplate t;
    t.id = "t";
    t.name = "Plain";

    ProcessedSection shown;
    shown.catalog_id = "summary";
    shown.type = model::SectionType::Summary;
    shown.payload = SummaryText{"Hi"};

    ProcessedSection hidden = shown;
    hidden.catalog_id = "languages";
    hidden.type = model::SectionType::Languages;
    hidden.payload = LanguageList{{"French"}};
    hidden.visible = false;

    const std::string html = render_document_html(t, {shown, hidden}, "print");
    EXPECT_NE(html.find("<title>Resume - Plain</title>"), std::string::npos);
    EXPECT_NE(html.find("class=\"format-print\""), std::string::npos);
    EXPECT_NE(html.find("data-section=\"summary\""), std::string::npos);
    EXPECT_EQ(html.find("data-section=\"languages\""), std::string::npos);
}

TEST(CancellationTokenTest, ExpiresAfterTimeout) {
    const CancellationToken token("styling", std::chrono::milliseconds(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(10));

    EXPECT_TRUE(token.expired());
    EXPECT_EQ(token.remaining().count(), 0);
    EXPECT_THROW(token.checkpoint(), StageTimeout);
}

TEST(CancellationTokenTest, FreshTokenPasses) {
    const CancellationToken token("output", std::chrono::milliseconds(60000));
    EXPECT_FALSE(token.expired());
    EXPECT_NO_THROW(token.checkpoint());
    EXPECT_EQ(token.stage(), "output");
}

} // namespace test
} // namespace render
