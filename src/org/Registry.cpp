#include "org/Registry.hpp"

#include "payroll/Errors.hpp"
#include "util/TextUtil.hpp"

#include <utility>

namespace org {

static void require_month_key(const std::string& month) {
    if (!textutil::is_month_key(month)) {
        throw payroll::InputError("month must have the form YYYY-MM, got '" + month + "'");
    }
}

static void require_department_name(const std::string& name) {
    if (textutil::trim(name).empty()) {
        throw payroll::InputError("department name must not be empty");
    }
}

Department& Registry::create_department(const std::string& name) {
    require_department_name(name);
    if (Department* existing = find_department(name)) return *existing;

    m_departments.push_back(std::make_unique<Department>(name));
    return *m_departments.back();
}

Department* Registry::find_department(const std::string& name) {
    for (auto& d : m_departments) {
        if (d->name() == name) return d.get();
    }
    return nullptr;
}

const Department* Registry::find_department(const std::string& name) const {
    for (const auto& d : m_departments) {
        if (d->name() == name) return d.get();
    }
    return nullptr;
}

Employee* Registry::find_employee(const std::string& name) {
    for (auto& e : m_employees) {
        if (e->name() == name) return e.get();
    }
    return nullptr;
}

const Employee* Registry::find_employee(const std::string& name) const {
    for (const auto& e : m_employees) {
        if (e->name() == name) return e.get();
    }
    return nullptr;
}

Department& Registry::require_department(const std::string& name) {
    Department* d = find_department(name);
    if (!d) throw payroll::LookupError("department not found: " + name);
    return *d;
}

Employee& Registry::add_employee(const std::string& department_name, EmployeeDraft draft) {
    Department& dept = require_department(department_name);

    auto emp = std::make_unique<Employee>(std::move(draft), dept);
    Employee& ref = *emp;
    m_employees.push_back(std::move(emp));

    dept.add_employee(ref);
    if (ref.is_manager() && dept.manager() == nullptr) dept.set_manager(&ref);
    return ref;
}

void Registry::set_plan(const std::string& department_name, const std::string& month, double value) {
    Department& dept = require_department(department_name);
    require_month_key(month);
    dept.set_plan(month, value);
}

void Registry::distribute_plan(const std::string& department_name, const std::string& month) {
    Department& dept = require_department(department_name);
    require_month_key(month);
    dept.distribute_plan(month);
}

void Registry::assign_manager(const std::string& department_name, const std::string& employee_name) {
    Department& dept = require_department(department_name);
    for (Employee* e : dept.employees()) {
        if (e->name() == employee_name) {
            dept.set_manager(e);
            return;
        }
    }
    throw payroll::LookupError("employee " + employee_name + " is not a member of " + department_name);
}

std::vector<SalaryLine> Registry::calculate_salaries(const std::string& month) const {
    require_month_key(month);

    std::vector<SalaryLine> out;
    out.reserve(m_employees.size());
    for (const auto& e : m_employees) {
        out.push_back(SalaryLine{e.get(), e->calculate_salary(month)});
    }
    return out;
}

EmployeeDraft draft_from_record(const io::EmployeeRecord& record) {
    EmployeeDraft d;
    d.name = record.name;
    d.position = record.position;
    d.base_salary = record.base_salary;
    d.payment_scheme = record.payment_scheme.empty()
        ? payroll::PaymentScheme{payroll::FixedSalaryWithBonus{}}
        : payroll::payment_scheme_from_tag(record.payment_scheme);
    d.bonus_scheme = record.bonus_scheme.empty()
        ? payroll::BonusScheme{payroll::FixedBonus{record.bonus}}
        : payroll::bonus_scheme_from_tag(record.bonus_scheme, record.bonus);
    d.role = role_from_name(record.role);
    d.production = record.production;
    return d;
}

io::EmployeeRecord record_from_employee(const Employee& employee) {
    io::EmployeeRecord r;
    r.name = employee.name();
    r.position = employee.position();
    r.department = employee.department().name();
    r.base_salary = employee.base_salary();
    r.bonus = payroll::fixed_bonus_amount(employee.bonus_scheme());
    r.payment_scheme = payroll::payment_scheme_tag(employee.payment_scheme());
    r.bonus_scheme = payroll::bonus_scheme_tag(employee.bonus_scheme());
    r.role = role_name(employee.role());
    r.production = employee.production();
    return r;
}

size_t Registry::import_records(const std::vector<io::EmployeeRecord>& records) {
    // Stage: departments that do not exist yet and fully constructed employees.
    std::vector<std::unique_ptr<Department>> new_departments;
    std::vector<std::pair<Department*, std::unique_ptr<Employee>>> staged;
    staged.reserve(records.size());

    for (size_t i = 0; i < records.size(); ++i) {
        const io::EmployeeRecord& r = records[i];
        try {
            require_department_name(r.department);

            Department* dept = find_department(r.department);
            if (!dept) {
                for (auto& nd : new_departments) {
                    if (nd->name() == r.department) {
                        dept = nd.get();
                        break;
                    }
                }
            }
            if (!dept) {
                new_departments.push_back(std::make_unique<Department>(r.department));
                dept = new_departments.back().get();
            }

            staged.emplace_back(dept, std::make_unique<Employee>(draft_from_record(r), *dept));
        } catch (const payroll::SelectionError& e) {
            throw payroll::SelectionError("record " + std::to_string(i) + ": " + e.what());
        } catch (const payroll::InputError& e) {
            throw payroll::InputError("record " + std::to_string(i) + ": " + e.what());
        }
    }

    // Commit.
    for (auto& nd : new_departments) m_departments.push_back(std::move(nd));
    for (auto& s : staged) {
        Department* dept = s.first;
        Employee& ref = *s.second;
        m_employees.push_back(std::move(s.second));
        dept->add_employee(ref);
        if (ref.is_manager() && dept->manager() == nullptr) dept->set_manager(&ref);
    }

    return staged.size();
}

std::vector<io::EmployeeRecord> Registry::export_records() const {
    std::vector<io::EmployeeRecord> out;
    out.reserve(m_employees.size());
    for (const auto& e : m_employees) out.push_back(record_from_employee(*e));
    return out;
}

}  // namespace org
