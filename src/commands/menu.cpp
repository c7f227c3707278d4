#include "commands/menu.hpp"

#include "cli/MenuSession.hpp"
#include "io/RecordIO.hpp"
#include "org/Registry.hpp"

#include <iostream>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

int cmd_menu(int argc, char** argv) {
    const std::string load_path = get_arg(argc, argv, "--load", "");

    cli::MenuConfig cfg;
    cfg.show_prompts = !has_flag(argc, argv, "--quiet");

    org::Registry registry;

    if (!load_path.empty()) {
        try {
            const size_t n = registry.import_records(io::load_records(load_path));
            std::cout << "LOADED: " << n << " employees from " << load_path << "\n";
        } catch (const std::exception& e) {
            std::cerr << "error: failed to load " << load_path << ": " << e.what() << "\n";
            return 1;
        }
    }

    return cli::run_menu(registry, std::cin, std::cout, cfg);
}
