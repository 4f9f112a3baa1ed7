#include "commands/contrast.hpp"

#include "customize/ColorTheme.hpp"
#include "errors/TemplateError.hpp"

#include <iomanip>
#include <iostream>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int cmd_contrast(int argc, char** argv) {
    const std::string fg = get_arg(argc, argv, "--fg", "");
    const std::string bg = get_arg(argc, argv, "--bg", "#ffffff");
    if (fg.empty()) {
        std::cerr << "error: missing --fg\n";
        return 1;
    }

    try {
        const customize::AccessibilityInfo info = customize::color_accessibility_info(fg, bg);

        std::cout << "FOREGROUND: " << fg << "\n";
        std::cout << "BACKGROUND: " << bg << "\n";
        std::cout << "RATIO: " << std::fixed << std::setprecision(2) << info.contrast_ratio << "\n";
        std::cout << "WCAG_AA: " << (info.wcag_aa ? "pass" : "fail") << "\n";
        std::cout << "WCAG_AAA: " << (info.wcag_aaa ? "pass" : "fail") << "\n";
        std::cout << "ATS_SAFE: " << (customize::is_ats_safe(fg) ? "yes" : "no") << "\n";
        if (!info.recommendation.empty()) std::cout << "NOTE: " << info.recommendation << "\n";
        return 0;
    } catch (const errors::TemplateEngineError& e) {
        std::cerr << "contrast failed: " << e.user_message() << " (" << e.code() << ")\n";
        return 1;
    }
}
