#include "cli/SalaryReport.hpp"

#include "payroll/Errors.hpp"
#include "util/TextUtil.hpp"

#include <iomanip>

namespace cli {

PlanSpec parse_plan_spec(const std::string& spec) {
    const auto eq = spec.rfind('=');
    if (eq == std::string::npos) {
        throw payroll::InputError("plan expects <dept>=<value>, got '" + spec + "'");
    }

    PlanSpec p;
    p.department = textutil::trim(spec.substr(0, eq));
    if (p.department.empty()) {
        throw payroll::InputError("plan expects <dept>=<value>, got '" + spec + "'");
    }
    p.value = textutil::parse_double(spec.substr(eq + 1), "plan for " + p.department);
    return p;
}

void apply_plans(org::Registry& registry, const std::vector<PlanSpec>& plans,
                 const std::string& month, bool distribute) {
    for (const auto& p : plans) {
        registry.set_plan(p.department, month, p.value);
        if (distribute) registry.distribute_plan(p.department, month);
    }
}

double write_salary_report(std::ostream& out, const SalaryReport& report) {
    out << "DATA: " << report.data_path << "\n";
    out << "MONTH: " << report.month << "\n";
    out << "EMPLOYEES: " << report.lines.size() << "\n";

    const auto flags = out.flags();
    const auto prec = out.precision();

    double total = 0.0;
    out << std::fixed << std::setprecision(report.precision);
    for (const auto& l : report.lines) {
        out << l.employee->name() << " (" << l.employee->position() << ", "
            << l.employee->department().name() << "): " << l.salary << "\n";
        total += l.salary;
    }
    out << "TOTAL: " << total << "\n";

    out.flags(flags);
    out.precision(prec);
    return total;
}

}  // namespace cli
