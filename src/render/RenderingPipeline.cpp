#include "render/RenderingPipeline.hpp"

#include "customize/CustomizationEngine.hpp"
#include "errors/TemplateError.hpp"
#include "render/HtmlRenderer.hpp"
#include "render/Minify.hpp"
#include "util/TextUtil.hpp"

#include <algorithm>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <utility>

namespace render {

using nlohmann::json;
using textutil::format_number;

namespace {

bool is_supported_format(const std::string& f) {
    return f == "html" || f == "preview" || f == "print";
}

bool font_listed(const std::vector<std::string>& list, const std::string& font) {
    const std::string want = textutil::to_lower_copy(textutil::trim_copy(font));
    return std::any_of(list.begin(), list.end(), [&](const std::string& f) {
        return textutil::to_lower_copy(textutil::trim_copy(f)) == want;
    });
}

void check_font(RenderingContext& ctx, const char* role, const model::FontSpec& font) {
    const auto& ats = ctx.tmpl.ats;
    if (font_listed(ats.prohibited_fonts, font.name)) {
        ctx.warnings.push_back(std::string("Template ") + role + " font '" + font.name +
                               "' is prohibited by the ATS profile");
    } else if (!ats.approved_fonts.empty() && !font_listed(ats.approved_fonts, font.name)) {
        ctx.warnings.push_back(std::string("Template ") + role + " font '" + font.name +
                               "' is not on the ATS-approved list");
    }
}

std::string combine_css(const std::vector<std::string>& parts) {
    std::vector<std::string> kept;
    for (const auto& p : parts) {
        if (!textutil::trim_copy(p).empty()) kept.push_back(p);
    }
    return textutil::join(kept, "\n\n");
}

SectionPayload payload_for(const model::SectionDefinition& section,
                           const model::ResumeData& resume,
                           const json& bound) {
    switch (section.type) {
        case model::SectionType::PersonalInfo: return resume.personal;
        case model::SectionType::Summary: return SummaryText{resume.summary};
        case model::SectionType::Experience: return resume.experience;
        case model::SectionType::Education: return resume.education;
        case model::SectionType::Skills: return resume.skills;
        case model::SectionType::Certifications: return resume.certifications;
        case model::SectionType::Projects: return resume.projects;
        case model::SectionType::Languages: return LanguageList{resume.languages};
        case model::SectionType::Custom: break;
    }
    return SectionPayload(std::in_place_type<json>, bound);
}

json errors_json(const RenderingContext& ctx, size_t from) {
    json arr = json::array();
    for (size_t i = from; i < ctx.errors.size(); ++i) {
        const auto& e = ctx.errors[i];
        arr.push_back({{"stage", e.stage}, {"code", e.code}, {"message", e.message},
                       {"recoverable", e.recoverable}, {"details", e.details}});
    }
    return arr;
}

} // namespace

const char* stage_name(StageId id) {
    switch (id) {
        case StageId::Validation: return "validation";
        case StageId::DataBinding: return "dataBinding";
        case StageId::ContentProcessing: return "contentProcessing";
        case StageId::Styling: return "styling";
        case StageId::Optimization: return "optimization";
        case StageId::Output: return "output";
    }
    return "validation";
}

std::string template_base_css(const model::ResumeTemplate& tmpl) {
    const auto& s = tmpl.styling;
    const auto& l = tmpl.layout;

    auto size_of = [&](const char* key, double def) {
        auto it = s.heading_sizes.find(key);
        return it != s.heading_sizes.end() ? it->second : def;
    };

    std::ostringstream css;
    css << "/* Generated CSS for " << tmpl.id << " */\n"
        << ".resume-template {\n"
        << "  font-family: " << s.body_font.stack << ";\n"
        << "  font-size: " << format_number(s.body_size) << "pt;\n"
        << "  line-height: " << format_number(l.line_spacing) << ";\n"
        << "  color: " << s.text_color << ";\n"
        << "  background: " << s.background_color << ";\n"
        << "  max-width: 8.5in;\n"
        << "  margin: 0 auto;\n"
        << "  padding: " << format_number(l.margins.top) << "in " << format_number(l.margins.right) << "in "
        << format_number(l.margins.bottom) << "in " << format_number(l.margins.left) << "in;\n"
        << "}\n\n"
        << ".resume-template * {\n"
        << "  box-sizing: border-box;\n"
        << "}\n\n"
        << ".resume-section {\n"
        << "  margin-bottom: " << format_number(l.section_spacing) << "pt;\n"
        << "}\n\n"
        << ".name {\n"
        << "  font-family: " << s.heading_font.stack << ";\n"
        << "  font-size: " << format_number(size_of("h1", 24)) << "pt;\n"
        << "  font-weight: 700;\n"
        << "  margin-bottom: 8px;\n"
        << "}\n\n"
        << ".section-title {\n"
        << "  font-family: " << s.heading_font.stack << ";\n"
        << "  font-size: " << format_number(size_of("h2", 18)) << "pt;\n"
        << "  font-weight: " << s.heading_font.weight << ";\n"
        << "  color: " << s.text_color << ";\n"
        << "  border-bottom: 1px solid " << s.border_color << ";\n"
        << "  padding-bottom: " << format_number(l.item_spacing) << "pt;\n"
        << "  margin-bottom: " << format_number(l.item_spacing) << "pt;\n"
        << "}\n\n"
        << ".position,\n.degree {\n"
        << "  font-size: " << format_number(size_of("h3", 14)) << "pt;\n"
        << "  font-weight: 600;\n"
        << "  margin-bottom: 4px;\n"
        << "}\n\n"
        << ".company,\n.institution {\n"
        << "  font-style: italic;\n"
        << "  color: " << s.secondary_color << ";\n"
        << "}\n\n"
        << ".experience-item,\n.education-item {\n"
        << "  margin-bottom: " << format_number(l.item_spacing) << "pt;\n"
        << "}\n\n"
        << ".contact-info {\n"
        << "  display: flex;\n"
        << "  flex-wrap: wrap;\n"
        << "  gap: " << format_number(l.item_spacing) << "pt;\n"
        << "}\n\n"
        << ".contact-label {\n"
        << "  color: " << s.secondary_color << ";\n"
        << "}\n\n"
        << "a {\n"
        << "  color: " << s.accent_color << ";\n"
        << "  text-decoration: none;\n"
        << "}";
    return css.str();
}

std::string responsive_css(const model::ResumeTemplate& tmpl) {
    std::ostringstream css;
    css << "/* Responsive styles */";

    auto mobile = tmpl.layout.breakpoints.find("mobile");
    if (mobile != tmpl.layout.breakpoints.end()) {
        css << "\n@media (max-width: " << mobile->second << "px) {\n"
            << "  .resume-template {\n"
            << "    padding: 1cm;\n"
            << "    font-size: 14px;\n"
            << "  }\n\n"
            << "  .contact-info {\n"
            << "    flex-direction: column;\n"
            << "    gap: 8px;\n"
            << "  }\n"
            << "}";
    }

    auto tablet = tmpl.layout.breakpoints.find("tablet");
    if (tablet != tmpl.layout.breakpoints.end()) {
        css << "\n\n@media (max-width: " << tablet->second << "px) {\n"
            << "  .resume-template {\n"
            << "    padding: 1.5cm;\n"
            << "  }\n"
            << "}";
    }
    return css.str();
}

RenderingPipeline::RenderingPipeline(std::unique_ptr<DataBinder> binder)
    : binder_(binder ? std::move(binder) : std::make_unique<ResumeDataBinder>()) {
    using std::chrono::milliseconds;

    stages_ = {
        {{"validation", milliseconds(2000), true},
         [this](RenderingContext& c, const CancellationToken& t) { validation_stage(c, t); }},
        {{"dataBinding", milliseconds(5000), true},
         [this](RenderingContext& c, const CancellationToken& t) { data_binding_stage(c, t); }},
        {{"contentProcessing", milliseconds(3000), true},
         [this](RenderingContext& c, const CancellationToken& t) { content_processing_stage(c, t); }},
        {{"styling", milliseconds(4000), true},
         [this](RenderingContext& c, const CancellationToken& t) { styling_stage(c, t); }},
        {{"optimization", milliseconds(2000), false},
         [this](RenderingContext& c, const CancellationToken& t) { optimization_stage(c, t); }},
        {{"output", milliseconds(3000), true},
         [this](RenderingContext& c, const CancellationToken& t) { output_stage(c, t); }},
    };
}

void RenderingPipeline::set_stage(StageId id, StageFn fn) {
    stages_.at(static_cast<size_t>(id)).fn = std::move(fn);
}

void RenderingPipeline::set_stage_timeout(StageId id, std::chrono::milliseconds timeout) {
    stages_.at(static_cast<size_t>(id)).settings.timeout = timeout;
}

const StageSettings& RenderingPipeline::stage_settings(StageId id) const {
    return stages_.at(static_cast<size_t>(id)).settings;
}

RenderedTemplate RenderingPipeline::render(const model::ResumeTemplate& tmpl,
                                           const model::ResumeData& resume,
                                           RenderingOptions options) {
    RenderingContext ctx(tmpl, resume, std::move(options));

    if (ctx.options.performance.verbose) {
        std::cerr << "RenderingPipeline: rendering template " << tmpl.id << " for resume " << resume.id << "\n";
    }

    for (const auto& stage : stages_) {
        run_stage(stage, ctx);
    }

    if (!ctx.artifacts.output) {
        throw errors::rendering_failed(tmpl.id, "output stage produced no result");
    }

    RenderedTemplate out = std::move(*ctx.artifacts.output);
    out.warnings = ctx.warnings;
    out.metadata.rendering_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - ctx.start).count();

    if (ctx.options.performance.verbose) {
        std::cerr << "RenderingPipeline: rendered " << out.id << " (" << out.metadata.size.total << " bytes, "
                  << out.warnings.size() << " warnings)\n";
    }
    return out;
}

void RenderingPipeline::run_stage(const Stage& stage, RenderingContext& ctx) {
    const std::string& name = stage.settings.name;
    const auto timeout = stage.settings.timeout.count() > 0 ? stage.settings.timeout
                                                            : ctx.options.performance.timeout;
    const CancellationToken token(name, timeout);

    std::optional<StageArtifacts> saved;
    if (!stage.settings.required) saved = ctx.artifacts;
    const size_t warnings_before = ctx.warnings.size();
    const size_t errors_before = ctx.errors.size();

    std::string failure;
    std::optional<errors::ErrorType> thrown_type;

    const auto t0 = std::chrono::steady_clock::now();
    try {
        stage.fn(ctx, token);
        token.checkpoint();

        for (size_t i = errors_before; i < ctx.errors.size(); ++i) {
            if (!ctx.errors[i].recoverable) {
                failure = ctx.errors[i].message;
                break;
            }
        }
    } catch (const errors::TemplateEngineError& e) {
        failure = e.what();
        thrown_type = e.type();
    } catch (const std::exception& e) {
        failure = e.what();
    }
    const long long elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();

    if (ctx.options.performance.enable_profiling) record_metric(name, elapsed);

    if (failure.empty()) {
        if (ctx.options.performance.verbose) {
            std::cerr << "RenderingPipeline: stage " << name << " completed in " << elapsed << "ms\n";
        }
        return;
    }

    if (stage.settings.required) {
        std::cerr << "RenderingPipeline: stage " << name << " failed: " << failure << "\n";

        json details = {{"stage", name}, {"reason", failure}, {"errors", errors_json(ctx, errors_before)}};

        bool missing_required = false;
        for (size_t i = errors_before; i < ctx.errors.size(); ++i) {
            if (ctx.errors[i].code == "REQUIRED_FIELD_MISSING") missing_required = true;
        }

        const std::string message = "Unrecoverable error in stage " + name + ": " + failure;
        if (thrown_type) {
            throw errors::TemplateEngineError(*thrown_type, message, ctx.tmpl.id, std::move(details));
        }
        if (name == "validation" || missing_required) {
            throw errors::TemplateEngineError(errors::ErrorType::ValidationFailed, message, ctx.tmpl.id,
                                              std::move(details));
        }
        throw errors::rendering_failed(ctx.tmpl.id, message, std::move(details));
    }

    // Optional stage: roll back whatever it did and keep going.
    ctx.artifacts = std::move(*saved);
    ctx.warnings.resize(warnings_before);
    ctx.errors.resize(errors_before);

    const std::string warning = "Stage " + name + " failed but is not critical: " + failure;
    std::cerr << "RenderingPipeline: " << warning << "\n";
    ctx.warnings.push_back(warning);
}

void RenderingPipeline::record_metric(const std::string& stage, long long duration_ms) {
    std::lock_guard<std::mutex> lock(metrics_mu_);
    StageMetric& m = metrics_[stage];
    m.duration_ms = duration_ms;
    m.timestamp = textutil::epoch_millis();
    m.count += 1;
}

std::map<std::string, StageMetric> RenderingPipeline::performance_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mu_);
    return metrics_;
}

void RenderingPipeline::clear_performance_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mu_);
    metrics_.clear();
}

// ---------- stages ----------

void RenderingPipeline::validation_stage(RenderingContext& ctx, const CancellationToken& token) {
    if (ctx.tmpl.id.empty()) {
        ctx.errors.push_back({"validation", "INVALID_TEMPLATE", "Invalid template structure: template id is required",
                              false, json::object()});
    }
    if (ctx.resume.id.empty()) {
        ctx.errors.push_back({"validation", "INVALID_RESUME", "Invalid resume data: resume id is required",
                              false, json::object()});
    }

    if (!is_supported_format(ctx.options.format)) {
        ctx.warnings.push_back("Unsupported format: " + ctx.options.format + ", using html");
        ctx.options.format = "html";
    }

    token.checkpoint();

    // ATS profile checks only warn.
    check_font(ctx, "heading", ctx.tmpl.styling.heading_font);
    check_font(ctx, "body", ctx.tmpl.styling.body_font);

    const auto& m = ctx.tmpl.layout.margins;
    const auto& ats = ctx.tmpl.ats;
    for (double v : {m.top, m.right, m.bottom, m.left}) {
        if (v < ats.min_margin || v > ats.max_margin) {
            ctx.warnings.push_back("Template margins fall outside the ATS range " + format_number(ats.min_margin) +
                                   "-" + format_number(ats.max_margin) + " inches");
            break;
        }
    }
}

void RenderingPipeline::data_binding_stage(RenderingContext& ctx, const CancellationToken& token) {
    const model::TemplateCustomization* customization =
        ctx.options.customizations ? &*ctx.options.customizations : nullptr;

    BindingResult result;
    try {
        result = binder_->bind(ctx.tmpl, ctx.resume, customization);
    } catch (const std::exception& e) {
        ctx.errors.push_back({"dataBinding", "DATA_BINDING_ERROR", std::string("Data binding failed: ") + e.what(),
                              false, json::object()});
        return;
    }

    token.checkpoint();

    for (const auto& e : result.errors) {
        ctx.errors.push_back({"dataBinding", e.code, e.message, e.code != "REQUIRED_FIELD_MISSING",
                              {{"field", e.field}, {"section", e.section}}});
    }
    for (const auto& w : result.warnings) {
        ctx.warnings.push_back(w.message);
    }

    if (ctx.options.performance.verbose) {
        std::cerr << "RenderingPipeline: bound " << result.metadata.bound_fields << "/"
                  << result.metadata.total_fields << " fields ("
                  << format_number(result.metadata.data_completeness) << "%)\n";
    }
    ctx.artifacts.binding = std::move(result);
}

void RenderingPipeline::content_processing_stage(RenderingContext& ctx, const CancellationToken& token) {
    if (!ctx.artifacts.binding) {
        throw std::runtime_error("No bound data available for content processing");
    }
    const json& bound = ctx.artifacts.binding->data;
    const auto& customization = ctx.options.customizations;

    std::vector<ProcessedSection> sections;
    for (const auto& def : ctx.tmpl.sections) {
        token.checkpoint();
        if (!bound.contains(def.id)) continue;

        ProcessedSection s;
        s.id = def.id;
        s.catalog_id = model::catalog_section_id(def.type, def.id);
        s.name = def.name;
        s.type = def.type;
        s.payload = payload_for(def, ctx.resume, bound.at(def.id));
        s.layout.alignment = def.alignment;
        s.layout.columns = def.columns;
        if (def.columns > 1) s.styling.css_class = "columns-" + std::to_string(def.columns);
        s.visible = def.default_visible || def.required;

        if (customization) {
            auto adj = customization->layout.custom_sections.find(s.catalog_id);
            if (adj != customization->layout.custom_sections.end()) {
                s.layout.adjustment = adj->second;
                if (adj->second.alignment) s.layout.alignment = *adj->second.alignment;
            }
            if (const model::SectionConfig* cfg = customization->section_visibility.find(s.catalog_id)) {
                s.visible = cfg->visible;
            }
        }
        sections.push_back(std::move(s));
    }

    // Customization order wins; sections it does not know keep template order after it.
    std::vector<int> template_order;
    for (const auto& s : sections) {
        for (const auto& def : ctx.tmpl.sections) {
            if (def.id == s.id) template_order.push_back(def.order);
        }
    }
    std::vector<size_t> idx(sections.size());
    for (size_t i = 0; i < idx.size(); ++i) idx[i] = i;

    std::stable_sort(idx.begin(), idx.end(), [&](size_t a, size_t b) {
        if (customization) {
            const auto* ca = customization->section_visibility.find(sections[a].catalog_id);
            const auto* cb = customization->section_visibility.find(sections[b].catalog_id);
            if (ca && cb && ca->order != cb->order) return ca->order < cb->order;
            if (ca && !cb) return true;
            if (!ca && cb) return false;
        }
        return template_order[a] < template_order[b];
    });

    std::vector<ProcessedSection> ordered;
    ordered.reserve(sections.size());
    for (size_t i : idx) ordered.push_back(std::move(sections[i]));

    token.checkpoint();

    ctx.artifacts.html = render_document_html(ctx.tmpl, ordered, ctx.options.format);
    ctx.artifacts.sections = std::move(ordered);
    ctx.artifacts.assets.clear();
    if (!ctx.tmpl.preview_thumbnail.empty()) ctx.artifacts.assets.push_back(ctx.tmpl.preview_thumbnail);
}

void RenderingPipeline::styling_stage(RenderingContext& ctx, const CancellationToken& token) {
    if (ctx.artifacts.html.empty()) {
        throw std::runtime_error("No processed content available for styling");
    }

    std::vector<std::string> parts;
    parts.push_back(template_base_css(ctx.tmpl));
    if (ctx.options.customizations) {
        parts.push_back(customize::customization_css(*ctx.options.customizations));
    }
    token.checkpoint();
    parts.push_back(responsive_css(ctx.tmpl));

    ctx.artifacts.css = combine_css(parts);
}

void RenderingPipeline::optimization_stage(RenderingContext& ctx, const CancellationToken& token) {
    if (ctx.artifacts.html.empty()) {
        throw std::runtime_error("No processed content available for optimization");
    }
    const OptimizationOptions& opt = ctx.options.optimization;

    std::string html = ctx.artifacts.html;
    std::string css = ctx.artifacts.css;

    if (opt.minify) {
        html = minify_html(html);
        css = minify_css(css);
    }
    token.checkpoint();

    if (opt.inline_css) {
        html = inline_css(html, css);
        css.clear();
    }
    if (opt.compress) {
        html = compress_html(html);
    }

    ctx.artifacts.html = std::move(html);
    ctx.artifacts.css = std::move(css);
    ctx.artifacts.minified = opt.minify;
    ctx.artifacts.css_inlined = opt.inline_css;
    ctx.artifacts.compressed = opt.compress;
}

void RenderingPipeline::output_stage(RenderingContext& ctx, const CancellationToken& token) {
    if (ctx.artifacts.html.empty()) {
        throw std::runtime_error("No processed content available for output");
    }

    RenderedTemplate out;
    out.id = "rendered-" + ctx.tmpl.id + "-" + std::to_string(textutil::epoch_millis());
    out.template_id = ctx.tmpl.id;
    out.resume_id = ctx.resume.id;
    out.customizations = ctx.options.customizations;

    out.rendered.html = ctx.artifacts.html;
    out.rendered.css = ctx.artifacts.css;
    out.rendered.javascript = template_script(ctx.tmpl);
    out.rendered.assets = ctx.artifacts.assets;

    token.checkpoint();

    out.metadata.generated_at = textutil::iso8601_now();
    out.metadata.version = "1.0";
    out.metadata.size.html = out.rendered.html.size();
    out.metadata.size.css = out.rendered.css.size();
    out.metadata.size.total = out.metadata.size.html + out.metadata.size.css + out.rendered.javascript.size();
    out.metadata.checksum = content_checksum(out.rendered.to_json().dump());
    out.metadata.rendering_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - ctx.start).count();

    ctx.artifacts.output = std::move(out);
}

} // namespace render
