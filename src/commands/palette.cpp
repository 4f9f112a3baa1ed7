#include "commands/palette.hpp"

#include "customize/ColorTheme.hpp"
#include "errors/TemplateError.hpp"

#include <iostream>
#include <string>

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

static void print_themes() {
    for (const auto& id : customize::predefined_theme_ids()) {
        const auto theme = customize::predefined_theme(id);
        std::cout << id << ": " << theme->name << " (primary " << theme->primary << ", accent " << theme->accent
                  << ")\n";
    }
}

int cmd_palette(int argc, char** argv) {
    try {
        if (has_flag(argc, argv, "--themes")) {
            print_themes();
            return 0;
        }

        const std::string base = get_arg(argc, argv, "--base", "");
        const std::string relation_s = get_arg(argc, argv, "--relation", "analogous");
        if (base.empty()) {
            std::cerr << "error: missing --base\n";
            return 1;
        }

        const auto relation = customize::parse_harmony_relation(relation_s);
        if (!relation) {
            std::cerr << "error: unknown --relation: " << relation_s << "\n";
            return 1;
        }

        const auto colors = customize::generate_harmonious_colors(base, *relation);
        const customize::ColorStates states = customize::create_color_states(base);

        std::cout << "BASE: " << base << "\n";
        std::cout << "RELATION: " << relation_s << "\n";
        std::cout << "HARMONY:";
        for (const auto& c : colors) std::cout << " " << c;
        std::cout << "\n";
        std::cout << "STATES: light " << states.light << ", normal " << states.normal << ", dark " << states.dark
                  << ", border " << states.border << ", background " << states.background << "\n";
        return 0;
    } catch (const errors::TemplateEngineError& e) {
        std::cerr << "palette failed: " << e.user_message() << " (" << e.code() << ")\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "palette failed: " << e.what() << "\n";
        return 1;
    }
}
