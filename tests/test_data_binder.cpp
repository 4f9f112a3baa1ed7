#include <gtest/gtest.h>

#include <algorithm>

#include "TestFixtures.hpp"
#include "customize/SectionVisibility.hpp"
#include "render/DataBinder.hpp"

namespace render {
namespace test {

using nlohmann::json;

class DataBinderTest : public ::testing::Test {
protected:
    void SetUp() override {
        tmpl_ = ::test::make_template();
        resume_ = ::test::make_resume();
    }

    static bool has_code(const BindingResult& r, const std::string& code) {
        return std::any_of(r.errors.begin(), r.errors.end(),
                           [&](const BindingError& e) { return e.code == code; });
    }

    model::ResumeTemplate tmpl_;
    model::ResumeData resume_;
    ResumeDataBinder binder_;
};

TEST_F(DataBinderTest, CompleteResumeBindsCleanly) {
    const BindingResult r = binder_.bind(tmpl_, resume_, nullptr);

    EXPECT_TRUE(r.success);
    EXPECT_TRUE(r.errors.empty());
    EXPECT_TRUE(r.warnings.empty());
    EXPECT_EQ(r.metadata.total_fields, 6);
    EXPECT_EQ(r.metadata.bound_fields, 6);
    EXPECT_DOUBLE_EQ(r.metadata.data_completeness, 100.0);

    EXPECT_EQ(r.data.at("header").at("fullName"), "Alex Morgan");
    EXPECT_EQ(r.data.at("experience").size(), 1u);
    EXPECT_EQ(r.data.at("summary").at("summary"), resume_.summary);
}

TEST_F(DataBinderTest, MissingRequiredFieldIsNotRecoverable) {
    resume_.personal.full_name.clear();
    const BindingResult r = binder_.bind(tmpl_, resume_, nullptr);

    EXPECT_FALSE(r.success);
    ASSERT_TRUE(has_code(r, "REQUIRED_FIELD_MISSING"));
    const auto it = std::find_if(r.errors.begin(), r.errors.end(),
                                 [](const BindingError& e) { return e.code == "REQUIRED_FIELD_MISSING"; });
    EXPECT_EQ(it->field, "fullName");
    EXPECT_EQ(it->section, "header");
    EXPECT_FALSE(it->recoverable);
    EXPECT_DOUBLE_EQ(r.metadata.data_completeness, 83.33);
}

TEST_F(DataBinderTest, EmptyRequiredSectionIsRecoverable) {
    resume_.experience.clear();
    const BindingResult r = binder_.bind(tmpl_, resume_, nullptr);

    EXPECT_TRUE(r.success);
    EXPECT_TRUE(has_code(r, "REQUIRED_SECTION_EMPTY"));
    EXPECT_FALSE(r.data.contains("experience"));
}

TEST_F(DataBinderTest, EmptyOptionalSectionWarns) {
    resume_.skills = {};
    const BindingResult r = binder_.bind(tmpl_, resume_, nullptr);

    EXPECT_TRUE(r.success);
    ASSERT_EQ(r.warnings.size(), 1u);
    EXPECT_EQ(r.warnings[0].message, "Section 'skills' has no data");
    EXPECT_EQ(r.warnings[0].impact, "Section may appear incomplete");
}

TEST_F(DataBinderTest, RuleFailureIsRecoverable) {
    resume_.personal.email = "not-an-email";
    const BindingResult r = binder_.bind(tmpl_, resume_, nullptr);

    EXPECT_TRUE(r.success);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, "FIELD_VALIDATION_ERROR");
    EXPECT_TRUE(r.errors[0].recoverable);
}

TEST_F(DataBinderTest, MaxLengthApplies) {
    tmpl_.sections[1].fields[0].max_length = 10;
    const BindingResult r = binder_.bind(tmpl_, resume_, nullptr);
    EXPECT_TRUE(has_code(r, "FIELD_VALIDATION_ERROR"));
}

TEST_F(DataBinderTest, ArrayItemsReportTheirIndex) {
    model::ExperienceItem second;
    second.position = "Lead";
    resume_.experience.push_back(second);

    const BindingResult r = binder_.bind(tmpl_, resume_, nullptr);
    EXPECT_FALSE(r.success);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].field, "company[1]");
}

TEST_F(DataBinderTest, HiddenSectionsAreSkipped) {
    model::TemplateCustomization c;
    c.section_visibility = customize::toggle_section("skills", customize::default_sections());
    resume_.skills = {};

    const BindingResult r = binder_.bind(tmpl_, resume_, &c);
    EXPECT_TRUE(r.warnings.empty());
    EXPECT_FALSE(r.data.contains("skills"));
}

TEST(ValidationRuleTest, CheckRule) {
    model::ValidationRule email;
    email.type = "email";
    EXPECT_TRUE(check_rule(email, "Email", "a@b.co").empty());
    EXPECT_EQ(check_rule(email, "Email", "a@b"), "Email must be a valid email address");

    model::ValidationRule phone;
    phone.type = "phone";
    EXPECT_TRUE(check_rule(phone, "Phone", "+1 (555) 010-2030").empty());
    EXPECT_FALSE(check_rule(phone, "Phone", "555-12").empty());
    EXPECT_FALSE(check_rule(phone, "Phone", "call 5550102030").empty());

    model::ValidationRule url;
    url.type = "url";
    url.message = "Link must start with http";
    EXPECT_TRUE(check_rule(url, "Link", "https://example.com").empty());
    EXPECT_EQ(check_rule(url, "Link", "example.com"), "Link must start with http");

    model::ValidationRule min;
    min.type = "min-length";
    min.value = 5;
    EXPECT_EQ(check_rule(min, "Name", "abc"), "Name must be at least 5 characters");

    model::ValidationRule pattern;
    pattern.type = "pattern";
    pattern.pattern = "^[0-9]{4}$";
    EXPECT_TRUE(check_rule(pattern, "Year", "2021").empty());
    EXPECT_FALSE(check_rule(pattern, "Year", "21").empty());

    pattern.pattern = "([";
    EXPECT_NE(check_rule(pattern, "Year", "2021").find("unusable pattern"), std::string::npos);
}

TEST(SectionDataTest, CustomSectionsReadExtras) {
    model::ResumeData r = ::test::make_resume();
    r.extras["hobbies"] = json::array({"chess"});

    model::SectionDefinition hobbies;
    hobbies.id = "hobbies";
    hobbies.type = model::SectionType::Custom;
    EXPECT_EQ(section_data(hobbies, r), json::array({"chess"}));

    hobbies.id = "awards";
    EXPECT_TRUE(section_data(hobbies, r).is_null());
}

} // namespace test
} // namespace render
