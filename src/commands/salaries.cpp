#include "commands/salaries.hpp"

#include "cli/SalaryReport.hpp"
#include "io/RecordIO.hpp"
#include "org/Registry.hpp"
#include "util/TextUtil.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

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

// every value of a repeatable option
static std::vector<std::string> get_all_args(int argc, char** argv, const std::string& key) {
    std::vector<std::string> out;
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) out.push_back(argv[i + 1]);
    }
    return out;
}

static int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    double v = 0.0;
    if (!textutil::try_parse_double(s, v) || v < 0.0 || v > 15.0 || v != std::floor(v)) {
        std::cerr << "warning: ignoring " << key << " '" << s << "', using " << def << "\n";
        return def;
    }
    return static_cast<int>(v);
}

static int salaries_usage() {
    std::cerr
        << "usage:\n"
        << "  staff-pay salaries --data <path> --month <YYYY-MM> [--plan <dept>=<value>]... [--distribute]\n";
    return 1;
}

int cmd_salaries(int argc, char** argv) {
    const std::string data_path = get_arg(argc, argv, "--data", "");
    const std::string month     = get_arg(argc, argv, "--month", "");
    const bool distribute       = has_flag(argc, argv, "--distribute");
    const int precision         = get_arg_int(argc, argv, "--precision", 2);

    if (data_path.empty() || month.empty()) {
        std::cerr << "error: missing --data and/or --month\n";
        return salaries_usage();
    }

    try {
        std::vector<cli::PlanSpec> plans;
        for (const auto& spec : get_all_args(argc, argv, "--plan")) {
            plans.push_back(cli::parse_plan_spec(spec));
        }

        org::Registry registry;
        registry.import_records(io::load_records(data_path));
        cli::apply_plans(registry, plans, month, distribute);

        cli::SalaryReport report;
        report.data_path = data_path;
        report.month = month;
        report.precision = precision;
        report.lines = registry.calculate_salaries(month);
        cli::write_salary_report(std::cout, report);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "salaries failed: " << e.what() << "\n";
        return 1;
    }
}
