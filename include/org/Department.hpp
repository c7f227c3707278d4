#pragma once
#include <map>
#include <string>
#include <vector>

namespace org {

class Employee;

class Department {
public:
    explicit Department(std::string name);

    const std::string& name() const { return m_name; }

    // nullptr when no manager was assigned
    const Employee* manager() const { return m_manager; }
    void set_manager(const Employee* manager) { m_manager = manager; }

    // insertion order; duplicates are not rejected
    const std::vector<Employee*>& employees() const { return m_employees; }
    void add_employee(Employee& employee);

    // month -> target
    const std::map<std::string, double>& plan() const { return m_plan; }

    // 0 when no plan was set for `month`
    double plan_for(const std::string& month) const;

    // Throws payroll::InputError for negative values.
    void set_plan(const std::string& month, double value);

    // Writes plan_for(month) / employee count into every member's production
    // for `month`, overwriting what was there. No-op without employees.
    void distribute_plan(const std::string& month);

private:
    std::string m_name;
    const Employee* m_manager = nullptr;
    std::vector<Employee*> m_employees;
    std::map<std::string, double> m_plan;
};

}  // namespace org
