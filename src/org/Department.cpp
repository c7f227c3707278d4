#include "org/Department.hpp"

#include "org/Employee.hpp"
#include "payroll/Errors.hpp"

#include <utility>

namespace org {

Department::Department(std::string name) : m_name(std::move(name)) {}

void Department::add_employee(Employee& employee) {
    m_employees.push_back(&employee);
}

double Department::plan_for(const std::string& month) const {
    auto it = m_plan.find(month);
    return (it == m_plan.end()) ? 0.0 : it->second;
}

void Department::set_plan(const std::string& month, double value) {
    if (value < 0.0) {
        throw payroll::InputError("plan of " + m_name + " for " + month + " must not be negative");
    }
    m_plan[month] = value;
}

void Department::distribute_plan(const std::string& month) {
    if (m_employees.empty()) return;

    const double per_employee = plan_for(month) / static_cast<double>(m_employees.size());
    for (Employee* e : m_employees) {
        e->set_production(month, per_employee);
    }
}

}  // namespace org
