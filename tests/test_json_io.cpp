#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>

#include "TestFixtures.hpp"
#include "io/CustomizationJson.hpp"
#include "io/JsonIO.hpp"
#include "render/RenderedTemplate.hpp"

namespace io {
namespace test {

using nlohmann::json;
namespace fs = std::filesystem;

TEST(JsonIOTest, LoadsBundledTemplate) {
    const model::ResumeTemplate t = load_template(::test::data_path("templates/professional.json"));

    EXPECT_EQ(t.id, "professional-classic");
    EXPECT_EQ(t.version, "1.2.0");
    EXPECT_EQ(t.styling.heading_font.name, "Arial");
    EXPECT_EQ(t.styling.body_font.name, "Calibri");
    ASSERT_EQ(t.sections.size(), 7u);
    EXPECT_EQ(t.sections[0].type, model::SectionType::PersonalInfo);
    EXPECT_TRUE(t.sections[0].required);
    EXPECT_EQ(t.sections[0].fields[1].validation[0].type, "email");
    EXPECT_EQ(t.sections[4].columns, 2);
    EXPECT_DOUBLE_EQ(t.ats.min_margin, 0.5);
    EXPECT_EQ(t.layout.breakpoints.at("tablet"), 1024);
}

TEST(JsonIOTest, LoadsBundledResume) {
    const model::ResumeData r = load_resume(::test::data_path("sample_resume.json"));

    EXPECT_EQ(r.id, "resume-001");
    EXPECT_EQ(r.user_id, "user-42");
    EXPECT_EQ(r.personal.full_name, "Jordan Rivera");
    ASSERT_EQ(r.experience.size(), 2u);
    EXPECT_TRUE(r.experience[0].current);
    EXPECT_EQ(r.experience[0].achievements.size(), 2u);
    EXPECT_EQ(r.skills.all().size(), 8u);
    EXPECT_EQ(r.languages, (std::vector<std::string>{"English", "Spanish"}));
}

TEST(JsonIOTest, TemplateErrorsNameThePath) {
    try {
        parse_template({{"id", "t"}, {"name", "T"}, {"sections", json::array({{{"id", "s"}, {"order", 1}}})}});
        FAIL() << "expected a parse failure";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "template.sections[0] missing required field: type");
    }

    EXPECT_THROW(parse_template({{"id", "t"}, {"name", "T"}}), std::runtime_error);
    EXPECT_THROW(parse_template(json::array()), std::runtime_error);
}

TEST(JsonIOTest, UnknownSectionTypeIsCustom) {
    const model::ResumeTemplate t = parse_template(
        {{"id", "t"}, {"name", "T"}, {"sections", json::array({{{"id", "hobbies"}, {"type", "hobbies"}, {"order", 1}}})}});
    EXPECT_EQ(t.sections[0].type, model::SectionType::Custom);
    EXPECT_EQ(model::catalog_section_id(t.sections[0].type, t.sections[0].id), "hobbies");
}

TEST(JsonIOTest, ResumeErrorsNameThePath) {
    try {
        parse_resume({{"id", "r"}, {"experience", json::array({{{"position", "Dev"}}})}});
        FAIL() << "expected a parse failure";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "resume.experience[0] missing required field: company");
    }
}

TEST(JsonIOTest, MissingFileThrows) {
    EXPECT_THROW(read_json_file(::test::data_path("does-not-exist.json")), std::runtime_error);
}

TEST(JsonIOTest, SectionContentFromResume) {
    const json c = section_content_from_resume(::test::make_resume());

    EXPECT_EQ(c.at("contact").at("name"), "Alex Morgan");
    EXPECT_EQ(c.at("experience")[0].at("title"), "Engineer");
    EXPECT_EQ(c.at("skills"), json::array({"C++", "CMake", "Linux"}));
    EXPECT_FALSE(c.contains("projects"));
}

TEST(JsonIOTest, RenderedTemplateWritesJson) {
    render::RenderedTemplate out;
    out.id = "rendered-t-1";
    out.template_id = "t";
    out.resume_id = "r";
    out.rendered.html = "<p>x</p>";
    out.metadata.checksum = render::content_checksum(out.rendered.html);

    const fs::path path = fs::temp_directory_path() / "templater-io-test" / "rendered.json";
    out.write_to(path);

    const json j = read_json_file(path.string());
    EXPECT_EQ(j.at("templateId"), "t");
    EXPECT_TRUE(j.at("customizations").is_null());
    EXPECT_EQ(j.at("metadata").at("checksum"), out.metadata.checksum);
    fs::remove_all(path.parent_path());
}

TEST(JsonIOTest, ContentChecksum) {
    EXPECT_EQ(render::content_checksum(""), "00000000");
    EXPECT_EQ(render::content_checksum("a"), "00000061");
    EXPECT_EQ(render::content_checksum("ab"), "00000c21");
}

TEST(CustomizationJsonTest, LayoutRoundTripKeepsAdjustments) {
    model::LayoutSettings l;
    l.alignment = "center";
    model::SectionLayoutAdjustment a;
    a.columns = 2;
    a.width = "50%";
    l.custom_sections["skills"] = a;

    const model::LayoutSettings back = layout_from_json(layout_to_json(l), "layout");
    EXPECT_EQ(back.alignment, "center");
    ASSERT_EQ(back.custom_sections.count("skills"), 1u);
    EXPECT_EQ(back.custom_sections.at("skills").columns.value_or(0), 2);
    EXPECT_FALSE(back.custom_sections.at("skills").spacing.has_value());
}

TEST(CustomizationJsonTest, ColorSchemeRequiresEveryRole) {
    json j = color_scheme_to_json(model::ColorScheme{"X", "#000000", "#000000", "#000000", "#ffffff",
                                                     "#000000", "#000000", "#000000", "#000000", "#000000"});
    j.erase("link");
    EXPECT_THROW(color_scheme_from_json(j, "colorScheme"), std::runtime_error);
}

} // namespace test
} // namespace io
