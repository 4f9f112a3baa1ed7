#include "commands/customize.hpp"

#include "customize/CustomizationEngine.hpp"
#include "errors/TemplateError.hpp"
#include "io/JsonIO.hpp"
#include "util/TextUtil.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

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
    out << text << "\n";
}

// "primary=#1a1a1a,accent=#2563eb"
static std::map<model::ColorRole, std::string> parse_color_list(const std::string& s) {
    std::map<model::ColorRole, std::string> out;
    for (const auto& part : textutil::split(s, ',')) {
        if (part.empty()) continue;
        const size_t eq = part.find('=');
        if (eq == std::string::npos) {
            throw std::runtime_error("--color expects role=#rrggbb, got: " + part);
        }
        const std::string role_s = textutil::trim_copy(part.substr(0, eq));
        auto role = model::parse_color_role(role_s);
        if (!role) throw std::runtime_error("unknown color role: " + role_s);
        out[*role] = textutil::trim_copy(part.substr(eq + 1));
    }
    return out;
}

int cmd_customize(int argc, char** argv) {
    try {
        const fs::path template_path = get_arg(argc, argv, "--template", "data/templates/professional.json");
        const std::string import_path = get_arg(argc, argv, "--import", "");
        const std::string resume_path = get_arg(argc, argv, "--resume", "");
        const fs::path out_path = get_arg(argc, argv, "--out", "out/customization.json");
        const fs::path css_path = get_arg(argc, argv, "--css", "out/customization.css");

        const std::string theme = get_arg(argc, argv, "--theme", "");
        const std::string colors = get_arg(argc, argv, "--color", "");
        const std::string fonts = get_arg(argc, argv, "--fonts", "");
        const std::string layout = get_arg(argc, argv, "--layout", "");
        const std::string role = get_arg(argc, argv, "--role", "");
        const std::string industry = get_arg(argc, argv, "--industry", "");
        const std::string level = get_arg(argc, argv, "--level", "");
        const std::string toggle = get_arg(argc, argv, "--toggle", "");
        const std::string order = get_arg(argc, argv, "--order", "");
        const bool undo = has_flag(argc, argv, "--undo");

        const model::ResumeTemplate tmpl = io::load_template(template_path.string());
        customize::CustomizationEngine engine(tmpl);

        if (!import_path.empty()) engine.import_customization(read_text_file(import_path));

        if (!role.empty()) engine.apply_role_customization(role, industry, level);
        if (!theme.empty()) engine.apply_color_theme(theme);
        for (const auto& kv : parse_color_list(colors)) engine.customize_color(kv.first, kv.second);
        if (!fonts.empty()) engine.apply_font_combination(fonts);
        if (!layout.empty()) engine.apply_layout_preset(layout);
        for (const auto& id : textutil::split(toggle, ',')) {
            if (!id.empty()) engine.toggle_section(id);
        }
        if (!order.empty()) engine.reorder_sections(textutil::split(order, ','));
        if (undo && !engine.undo_last_change()) std::cerr << "customize: nothing to undo\n";

        nlohmann::json content = nlohmann::json::object();
        if (!resume_path.empty()) content = io::section_content_from_resume(io::load_resume(resume_path));
        const customize::CustomizationAnalytics a = engine.analytics(content);

        write_text_file(out_path, engine.export_customization());
        write_text_file(css_path, engine.generate_css());

        const model::TemplateCustomization c = engine.current_customization();
        std::cout << "TEMPLATE: " << tmpl.id << "\n";
        std::cout << "THEME: " << c.color_scheme.name << "\n";
        std::cout << "FONTS: " << c.typography.heading.font_family << " / " << c.typography.body.font_family << "\n";
        std::cout << "CHANGES: " << engine.history().size() << "\n";
        std::cout << "OUT_CUSTOMIZATION: " << out_path.string() << "\n";
        std::cout << "OUT_CSS: " << css_path.string() << "\n";
        std::cout << "SCORE: " << a.overall_score << " (ats " << a.ats_score << ", readability "
                  << a.readability_score << ", design " << a.design_score << ", completeness "
                  << a.content_completeness << ")\n";
        for (const auto& s : a.strengths) std::cout << "+ " << s << "\n";
        for (const auto& w : a.warnings) std::cout << "! " << w << "\n";
        for (const auto& r : a.recommendations) std::cout << "- " << r << "\n";
        return 0;
    } catch (const errors::TemplateEngineError& e) {
        std::cerr << "customize failed: " << e.user_message() << " (" << e.code() << ")\n";
        if (has_flag(argc, argv, "--verbose")) std::cerr << e.to_json().dump(2) << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "customize failed: " << e.what() << "\n";
        return 1;
    }
}
