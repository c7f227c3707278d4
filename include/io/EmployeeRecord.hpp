#pragma once
#include <map>
#include <string>

namespace io {

// Flat, persisted form of an employee.
struct EmployeeRecord {
    std::string name;
    std::string position;
    std::string department;
    double base_salary = 0.0;

    double bonus = 0.0;               // FixedBonus amount
    std::string payment_scheme;       // tag, empty = fixed_salary
    std::string bonus_scheme;         // tag, empty = fixed
    std::string role;                 // "manager" | "staff", empty = staff

    std::map<std::string, double> production;  // JSON only
};

}  // namespace io
