#include "commands/contrast.hpp"
#include "commands/customize.hpp"
#include "commands/palette.hpp"
#include "commands/render.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  resume-templater render [args]\n"
        << "  resume-templater customize [args]\n"
        << "  resume-templater palette [args]\n"
        << "  resume-templater contrast [args]\n"
        << "  resume-templater help\n";
    return 1;
}

static int print_render_help() {
    std::cerr
        << "usage:\n"
        << "  resume-templater render [options]\n"
        << "\n"
        << "inputs/outputs:\n"
        << "  --template <path>            default: data/templates/professional.json\n"
        << "  --resume <path>              default: data/sample_resume.json\n"
        << "  --customization <path>       optional: exported customization JSON\n"
        << "  --outdir <dir>               default: out\n"
        << "\n"
        << "rendering:\n"
        << "  --format <html|preview|print> default: html\n"
        << "  --minify                     minify markup and stylesheet\n"
        << "  --no_inline                  keep the stylesheet separate (out/resume.css)\n"
        << "  --compress                   strip comments and blank lines\n"
        << "  --timeout <ms>               default: 10000 (stages without their own timeout)\n"
        << "  --retries <n>                default: 3\n"
        << "  --verbose                    stage timings and error details\n";
    return 0;
}

static int print_customize_help() {
    std::cerr
        << "usage:\n"
        << "  resume-templater customize [options]\n"
        << "\n"
        << "inputs/outputs:\n"
        << "  --template <path>            default: data/templates/professional.json\n"
        << "  --import <path>              start from an exported customization\n"
        << "  --resume <path>              optional: score content completeness against this resume\n"
        << "  --out <path>                 default: out/customization.json\n"
        << "  --css <path>                 default: out/customization.css\n"
        << "\n"
        << "changes (applied in this order):\n"
        << "  --role <str> [--industry <str>] [--level <entry|mid|senior|executive>]\n"
        << "  --theme <id>                 e.g. executive, corporate, minimal, modern_blue\n"
        << "  --color <role=#hex,...>      e.g. primary=#1e3a8a,accent=#2563eb\n"
        << "  --fonts <combination>        e.g. \"Corporate Classic\"\n"
        << "  --layout <preset>            traditional | modern | compact | spacious\n"
        << "  --toggle <id,...>            flip section visibility\n"
        << "  --order <id,...>             visible section order\n"
        << "  --undo                       undo the last change\n";
    return 0;
}

static int print_palette_help() {
    std::cerr
        << "usage:\n"
        << "  resume-templater palette --themes\n"
        << "  resume-templater palette --base <#hex> [--relation <analogous|complementary|triadic|\n"
        << "                           split-complementary|tetradic>]\n";
    return 0;
}

static int print_contrast_help() {
    std::cerr
        << "usage:\n"
        << "  resume-templater contrast --fg <#hex> [--bg <#hex>]   default bg: #ffffff\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    // subcommand help
    const bool help = argc >= 3 && std::string(argv[2]) == "--help";
    if (cmd == "render"    && help) return print_render_help();
    if (cmd == "customize" && help) return print_customize_help();
    if (cmd == "palette"   && help) return print_palette_help();
    if (cmd == "contrast"  && help) return print_contrast_help();

    if (cmd == "render")    return cmd_render(argc - 1, argv + 1);
    if (cmd == "customize") return cmd_customize(argc - 1, argv + 1);
    if (cmd == "palette")   return cmd_palette(argc - 1, argv + 1);
    if (cmd == "contrast")  return cmd_contrast(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
