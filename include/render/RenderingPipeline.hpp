#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "model/ResumeData.hpp"
#include "model/Template.hpp"
#include "render/CancellationToken.hpp"
#include "render/DataBinder.hpp"
#include "render/RenderedTemplate.hpp"
#include "render/RenderingContext.hpp"

namespace render {

enum class StageId { Validation, DataBinding, ContentProcessing, Styling, Optimization, Output };

// "validation", "dataBinding", "contentProcessing", "styling", "optimization", "output"
const char* stage_name(StageId id);

struct StageSettings {
    std::string name;
    std::chrono::milliseconds timeout{0}; // 0 = use PerformanceOptions::timeout
    bool required = true;
};

struct StageMetric {
    long long duration_ms = 0;
    long long timestamp = 0; // epoch ms of the latest run
    int count = 0;
};

// Template base stylesheet: typography, layout and colors from the template's styling block.
std::string template_base_css(const model::ResumeTemplate& tmpl);

// @media rules for the template's mobile and tablet breakpoints.
std::string responsive_css(const model::ResumeTemplate& tmpl);

// Runs validation -> dataBinding -> contentProcessing -> styling -> optimization -> output.
// Only optimization is optional. A failing required stage throws errors::TemplateEngineError;
// a failing optional stage is rolled back and leaves one warning.
class RenderingPipeline {
public:
    using StageFn = std::function<void(RenderingContext&, const CancellationToken&)>;

    explicit RenderingPipeline(std::unique_ptr<DataBinder> binder = nullptr);

    RenderedTemplate render(const model::ResumeTemplate& tmpl,
                            const model::ResumeData& resume,
                            RenderingOptions options = {});

    // Replaces a stage body; settings are kept.
    void set_stage(StageId id, StageFn fn);
    void set_stage_timeout(StageId id, std::chrono::milliseconds timeout);
    const StageSettings& stage_settings(StageId id) const;

    std::map<std::string, StageMetric> performance_metrics() const;
    void clear_performance_metrics();

private:
    struct Stage {
        StageSettings settings;
        StageFn fn;
    };

    void run_stage(const Stage& stage, RenderingContext& ctx);
    void record_metric(const std::string& stage, long long duration_ms);

    void validation_stage(RenderingContext& ctx, const CancellationToken& token);
    void data_binding_stage(RenderingContext& ctx, const CancellationToken& token);
    void content_processing_stage(RenderingContext& ctx, const CancellationToken& token);
    void styling_stage(RenderingContext& ctx, const CancellationToken& token);
    void optimization_stage(RenderingContext& ctx, const CancellationToken& token);
    void output_stage(RenderingContext& ctx, const CancellationToken& token);

    std::unique_ptr<DataBinder> binder_;
    std::vector<Stage> stages_;

    mutable std::mutex metrics_mu_;
    std::map<std::string, StageMetric> metrics_;
};

} // namespace render
