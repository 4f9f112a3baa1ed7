#include "commands/render.hpp"

#include "customize/CustomizationEngine.hpp"
#include "errors/RetryHandler.hpp"
#include "errors/TemplateError.hpp"
#include "io/JsonIO.hpp"
#include "render/RenderingPipeline.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try { return std::stoi(s); } catch (const std::exception&) { return def; }
}

static std::string read_text_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void write_text_file(const fs::path& path, const std::string& text) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream out(path);
    if (!out) throw std::runtime_error("Failed to open output file: " + path.string());
    out << text;
}

int cmd_render(int argc, char** argv) {
    const bool verbose = has_flag(argc, argv, "--verbose");

    try {
        const fs::path template_path = get_arg(argc, argv, "--template", "data/templates/professional.json");
        const fs::path resume_path = get_arg(argc, argv, "--resume", "data/sample_resume.json");
        const std::string customization_path = get_arg(argc, argv, "--customization", "");
        const fs::path outdir = get_arg(argc, argv, "--outdir", "out");

        render::RenderingOptions opts;
        opts.format = get_arg(argc, argv, "--format", "html");
        opts.optimization.minify = has_flag(argc, argv, "--minify");
        opts.optimization.inline_css = !has_flag(argc, argv, "--no_inline");
        opts.optimization.compress = has_flag(argc, argv, "--compress");
        opts.performance.timeout = std::chrono::milliseconds(get_arg_int(argc, argv, "--timeout", 10000));
        opts.performance.verbose = verbose;

        const model::ResumeTemplate tmpl = io::load_template(template_path.string());
        const model::ResumeData resume = io::load_resume(resume_path.string());

        if (!customization_path.empty()) {
            customize::CustomizationEngine engine(tmpl);
            engine.import_customization(read_text_file(customization_path));
            opts.customizations = engine.current_customization();
        }

        errors::RetryConfig retry_cfg;
        retry_cfg.max_retries = get_arg_int(argc, argv, "--retries", retry_cfg.max_retries);
        retry_cfg.verbose = verbose;

        errors::RetryAttemptStore attempts;
        errors::RetryHandler retry(attempts, retry_cfg);
        render::RenderingPipeline pipeline;

        const render::RenderedTemplate out = retry.run(
            [&] { return pipeline.render(tmpl, resume, opts); },
            errors::RetryContext{tmpl.id, resume.user_id});

        const fs::path rendered_path = outdir / "rendered.json";
        const fs::path html_path = outdir / "resume.html";
        out.write_to(rendered_path);
        write_text_file(html_path, out.rendered.html);

        std::cout << "TEMPLATE: " << tmpl.id << "\n";
        std::cout << "RESUME: " << resume.id << "\n";
        std::cout << "FORMAT: " << opts.format << "\n";
        std::cout << "OUT_RENDERED: " << rendered_path.string() << "\n";
        std::cout << "OUT_HTML: " << html_path.string() << "\n";

        if (!out.rendered.css.empty()) {
            const fs::path css_path = outdir / "resume.css";
            write_text_file(css_path, out.rendered.css);
            std::cout << "OUT_CSS: " << css_path.string() << "\n";
        }

        std::cout << "SIZE: " << out.metadata.size.total << "\n";
        std::cout << "CHECKSUM: " << out.metadata.checksum << "\n";
        std::cout << "WARNINGS: " << out.warnings.size() << "\n";
        for (const auto& w : out.warnings) std::cout << "- " << w << "\n";

        if (verbose) {
            for (const auto& kv : pipeline.performance_metrics()) {
                std::cout << "STAGE " << kv.first << ": " << kv.second.duration_ms << "ms\n";
            }
        }
        return 0;
    } catch (const errors::TemplateEngineError& e) {
        std::cerr << "render failed: " << e.user_message() << " (" << e.code() << ")\n";
        if (verbose) std::cerr << e.to_json().dump(2) << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "render failed: " << e.what() << "\n";
        return 1;
    }
}
