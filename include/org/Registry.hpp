#pragma once
#include <memory>
#include <string>
#include <vector>

#include "io/EmployeeRecord.hpp"
#include "org/Department.hpp"
#include "org/Employee.hpp"

namespace org {

struct SalaryLine {
    const Employee* employee = nullptr;
    double salary = 0.0;
};

// Owns every Department and Employee of a session. Departments and
// employees keep stable addresses for the registry's lifetime.
class Registry {
public:
    Registry() = default;
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&) = default;
    Registry& operator=(Registry&&) = default;

    // Returns the existing department when `name` is already taken.
    Department& create_department(const std::string& name);

    Department* find_department(const std::string& name);
    const Department* find_department(const std::string& name) const;

    // first employee with that name, nullptr on miss
    Employee* find_employee(const std::string& name);
    const Employee* find_employee(const std::string& name) const;

    // Throws payroll::LookupError for an unknown department; nothing is
    // created in that case. A Manager added to a department without one
    // becomes its manager.
    Employee& add_employee(const std::string& department_name, EmployeeDraft draft);

    void set_plan(const std::string& department_name, const std::string& month, double value);
    void distribute_plan(const std::string& department_name, const std::string& month);
    void assign_manager(const std::string& department_name, const std::string& employee_name);

    // one line per employee, in insertion order
    std::vector<SalaryLine> calculate_salaries(const std::string& month) const;

    // All records are converted before anything is committed. Returns the
    // number of employees added.
    size_t import_records(const std::vector<io::EmployeeRecord>& records);
    std::vector<io::EmployeeRecord> export_records() const;

    const std::vector<std::unique_ptr<Department>>& departments() const { return m_departments; }
    const std::vector<std::unique_ptr<Employee>>& employees() const { return m_employees; }

private:
    Department& require_department(const std::string& name);

    std::vector<std::unique_ptr<Department>> m_departments;  // creation order
    std::vector<std::unique_ptr<Employee>> m_employees;      // insertion order
};

EmployeeDraft draft_from_record(const io::EmployeeRecord& record);
io::EmployeeRecord record_from_employee(const Employee& employee);

}  // namespace org
