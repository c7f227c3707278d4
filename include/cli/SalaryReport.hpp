#pragma once
#include <ostream>
#include <string>
#include <vector>

#include "org/Registry.hpp"

namespace cli {

// "<department>=<value>"; the last '=' splits, so department names may contain '='
struct PlanSpec {
    std::string department;
    double value = 0.0;
};

// Throws payroll::InputError when '=' is missing, the department is empty or
// the value is not a number.
PlanSpec parse_plan_spec(const std::string& spec);

// Sets each plan for `month`; with `distribute`, splits each one right after
// it is set. Registry errors propagate unchanged.
void apply_plans(org::Registry& registry, const std::vector<PlanSpec>& plans,
                 const std::string& month, bool distribute);

struct SalaryReport {
    std::string data_path;
    std::string month;
    int precision = 2;
    std::vector<org::SalaryLine> lines;
};

// DATA / MONTH / EMPLOYEES header, one line per employee, TOTAL. Returns the total.
double write_salary_report(std::ostream& out, const SalaryReport& report);

}  // namespace cli
