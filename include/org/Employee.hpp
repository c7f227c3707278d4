#pragma once
#include <map>
#include <string>

#include "payroll/BonusScheme.hpp"
#include "payroll/PaymentScheme.hpp"

namespace org {

class Department;

enum class Role {
    Staff,
    Manager  // role tag only, no extra state or behavior
};

// Everything needed to create an Employee except the department link.
struct EmployeeDraft {
    std::string name;
    std::string position;
    double base_salary = 0.0;
    payroll::PaymentScheme payment_scheme = payroll::FixedSalaryWithBonus{};
    payroll::BonusScheme bonus_scheme = payroll::FixedBonus{};
    Role role = Role::Staff;
    std::map<std::string, double> production;
};

class Employee {
public:
    // Throws payroll::InputError on empty name, negative base salary or
    // negative production figures. `department` must outlive the employee.
    Employee(EmployeeDraft draft, const Department& department);

    const std::string& name() const { return m_name; }
    const std::string& position() const { return m_position; }
    const Department& department() const { return *m_department; }
    double base_salary() const { return m_base_salary; }
    const payroll::PaymentScheme& payment_scheme() const { return m_payment; }
    const payroll::BonusScheme& bonus_scheme() const { return m_bonus; }
    Role role() const { return m_role; }
    bool is_manager() const { return m_role == Role::Manager; }

    // month -> recorded production
    const std::map<std::string, double>& production() const { return m_production; }

    // 0 when nothing was recorded for `month`
    double production_for(const std::string& month) const;

    void set_production(const std::string& month, double value);

    double resolve_bonus(const std::string& month) const;
    double calculate_salary(const std::string& month) const;

private:
    std::string m_name;
    std::string m_position;
    const Department* m_department;  // non-owning
    double m_base_salary;
    payroll::PaymentScheme m_payment;
    payroll::BonusScheme m_bonus;
    Role m_role;
    std::map<std::string, double> m_production;
};

const char* role_name(Role role);

// "manager" -> Manager, "staff" or empty -> Staff, anything else throws payroll::InputError
Role role_from_name(const std::string& name);

}  // namespace org
