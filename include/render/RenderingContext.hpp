#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "model/Customization.hpp"
#include "model/ResumeData.hpp"
#include "model/Template.hpp"
#include "nlohmann/json.hpp"
#include "render/RenderedTemplate.hpp"

namespace render {

// ---------- options ----------

struct OptimizationOptions {
    bool minify = false;
    bool inline_css = true;
    bool compress = false;
};

struct PerformanceOptions {
    // Used by any stage configured with a zero timeout.
    std::chrono::milliseconds timeout{10000};
    bool enable_profiling = true;
    bool verbose = false;
};

struct RenderingOptions {
    std::string format = "html"; // html | preview | print
    std::optional<model::TemplateCustomization> customizations;
    OptimizationOptions optimization;
    PerformanceOptions performance;
};

// ---------- data binding ----------

struct BindingError {
    std::string code;
    std::string message;
    std::string field;
    std::string section;
    bool recoverable = true;
};

struct BindingWarning {
    std::string message;
    std::string impact;
    std::string field;
    std::string section;
};

struct BindingMetadata {
    int bound_fields = 0;
    int total_fields = 0;
    double data_completeness = 0.0; // percent
};

struct BindingResult {
    bool success = true;
    nlohmann::json data = nlohmann::json::object(); // template section id -> bound payload
    std::vector<BindingError> errors;
    std::vector<BindingWarning> warnings;
    BindingMetadata metadata;
};

// ---------- processed content ----------

struct SummaryText {
    std::string text;
};

struct LanguageList {
    std::vector<std::string> items;
};

// Custom sections carry whatever JSON the resume provides.
using SectionPayload = std::variant<model::PersonalInfo,
                                    SummaryText,
                                    std::vector<model::ExperienceItem>,
                                    std::vector<model::EducationItem>,
                                    model::SkillGroups,
                                    std::vector<model::CertificationItem>,
                                    std::vector<model::ProjectItem>,
                                    LanguageList,
                                    nlohmann::json>;

struct SectionLayout {
    std::string alignment = "left";
    int columns = 1;
    std::optional<model::SectionLayoutAdjustment> adjustment;
};

struct SectionStyling {
    std::string css_class;
};

struct ProcessedSection {
    std::string id;         // template section id
    std::string catalog_id; // id used by the visibility rules and data-section selectors
    std::string name;
    model::SectionType type = model::SectionType::Custom;
    SectionPayload payload;
    SectionLayout layout;
    SectionStyling styling;
    bool visible = true;
};

// ---------- context ----------

struct RenderingError {
    std::string stage;
    std::string code;
    std::string message;
    bool recoverable = true;
    nlohmann::json details = nlohmann::json::object();
};

// Everything a stage produces. Snapshotted around the optional stage.
struct StageArtifacts {
    std::optional<BindingResult> binding;
    std::vector<ProcessedSection> sections;
    std::string html;
    std::string css;
    std::string javascript;
    std::vector<std::string> assets;

    bool minified = false;
    bool css_inlined = false;
    bool compressed = false;

    std::optional<RenderedTemplate> output;
};

struct RenderingContext {
    RenderingContext(const model::ResumeTemplate& t, const model::ResumeData& r, RenderingOptions o)
        : tmpl(t), resume(r), options(std::move(o)), start(std::chrono::steady_clock::now()) {}

    const model::ResumeTemplate& tmpl;
    const model::ResumeData& resume;
    RenderingOptions options;
    std::chrono::steady_clock::time_point start;

    std::vector<RenderingError> errors;
    std::vector<std::string> warnings;
    StageArtifacts artifacts;
};

} // namespace render
