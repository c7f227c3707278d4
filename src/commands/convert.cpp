#include "commands/convert.hpp"

#include "io/RecordIO.hpp"

#include <iostream>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (argv[i] == key) return argv[i + 1];
    }
    return def;
}

int cmd_convert(int argc, char** argv) {
    const std::string in_path  = get_arg(argc, argv, "--in", "");
    const std::string out_path = get_arg(argc, argv, "--out", "");

    if (in_path.empty() || out_path.empty()) {
        std::cerr << "error: missing --in and/or --out\n";
        std::cerr << "usage:\n  staff-pay convert --in <path> --out <path>\n";
        return 1;
    }

    try {
        const auto records = io::load_records(in_path);
        if (io::format_for_path(in_path) == io::RecordFormat::Json &&
            io::format_for_path(out_path) == io::RecordFormat::Csv) {
            std::cerr << "warning: production figures are not carried by CSV\n";
        }
        io::save_records(out_path, records);

        std::cout << "IN: " << in_path << "\n";
        std::cout << "OUT: " << out_path << "\n";
        std::cout << "RECORDS: " << records.size() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "convert failed: " << e.what() << "\n";
        return 1;
    }
}
