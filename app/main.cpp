#include "commands/convert.hpp"
#include "commands/menu.hpp"
#include "commands/salaries.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  staff-pay menu [args]\n"
        << "  staff-pay salaries [args]\n"
        << "  staff-pay convert [args]\n"
        << "  staff-pay help\n";
    return 1;
}

static int print_menu_help() {
    std::cerr
        << "usage:\n"
        << "  staff-pay menu [options]\n"
        << "\n"
        << "options:\n"
        << "  --load <path>                preload employees from .json or .csv\n"
        << "  --quiet                      do not print menu and prompts\n";
    return 0;
}

static int print_salaries_help() {
    std::cerr
        << "usage:\n"
        << "  staff-pay salaries --data <path> --month <YYYY-MM> [options]\n"
        << "\n"
        << "options:\n"
        << "  --data <path>                (required) .json or .csv employee records\n"
        << "  --month <YYYY-MM>            (required)\n"
        << "  --plan <dept>=<value>        department plan for the month, repeatable\n"
        << "  --distribute                 split each given plan evenly across the department\n"
        << "  --precision <n>              default: 2\n";
    return 0;
}

static int print_convert_help() {
    std::cerr
        << "usage:\n"
        << "  staff-pay convert --in <path> --out <path>\n"
        << "\n"
        << "formats are chosen by extension (.json, .csv)\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    // subcommand help
    if (cmd == "menu"     && (argc >= 3 && std::string(argv[2]) == "--help")) return print_menu_help();
    if (cmd == "salaries" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_salaries_help();
    if (cmd == "convert"  && (argc >= 3 && std::string(argv[2]) == "--help")) return print_convert_help();

    if (cmd == "menu")     return cmd_menu(argc - 1, argv + 1);
    if (cmd == "salaries") return cmd_salaries(argc - 1, argv + 1);
    if (cmd == "convert")  return cmd_convert(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
