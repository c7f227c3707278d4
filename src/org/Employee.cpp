#include "org/Employee.hpp"

#include "org/Department.hpp"
#include "payroll/Errors.hpp"
#include "util/TextUtil.hpp"

#include <utility>

namespace org {

static void require_non_negative(double v, const std::string& what) {
    if (v < 0.0) {
        throw payroll::InputError(what + " must not be negative");
    }
}

Employee::Employee(EmployeeDraft draft, const Department& department)
    : m_name(std::move(draft.name)),
      m_position(std::move(draft.position)),
      m_department(&department),
      m_base_salary(draft.base_salary),
      m_payment(std::move(draft.payment_scheme)),
      m_bonus(std::move(draft.bonus_scheme)),
      m_role(draft.role),
      m_production(std::move(draft.production)) {
    if (textutil::trim(m_name).empty()) {
        throw payroll::InputError("employee name must not be empty");
    }
    require_non_negative(m_base_salary, "base salary of " + m_name);
    for (const auto& kv : m_production) {
        require_non_negative(kv.second, "production of " + m_name + " for " + kv.first);
    }
}

double Employee::production_for(const std::string& month) const {
    auto it = m_production.find(month);
    return (it == m_production.end()) ? 0.0 : it->second;
}

void Employee::set_production(const std::string& month, double value) {
    require_non_negative(value, "production of " + m_name + " for " + month);
    m_production[month] = value;
}

double Employee::resolve_bonus(const std::string& month) const {
    return payroll::calculate_bonus(m_bonus, m_base_salary, m_department->plan_for(month), production_for(month));
}

double Employee::calculate_salary(const std::string& month) const {
    const double actual = production_for(month);
    const double plan = m_department->plan_for(month);
    const double bonus = payroll::calculate_bonus(m_bonus, m_base_salary, plan, actual);
    return payroll::calculate_pay(m_payment, m_base_salary, bonus, plan, actual);
}

const char* role_name(Role role) {
    switch (role) {
        case Role::Staff: return "staff";
        case Role::Manager: return "manager";
    }
    return "staff";
}

Role role_from_name(const std::string& name) {
    const std::string n = textutil::to_lower(textutil::trim(name));
    if (n.empty() || n == "staff") return Role::Staff;
    if (n == "manager") return Role::Manager;
    throw payroll::InputError("unknown role: " + name);
}

}  // namespace org
