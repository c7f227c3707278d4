#pragma once
#include <istream>
#include <string>
#include <vector>

#include "io/EmployeeRecord.hpp"
#include "nlohmann/json.hpp"

namespace io {

// Top-level array of employee objects. Throws payroll::InputError naming the
// offending record and field; std::runtime_error when the file cannot be read.
std::vector<EmployeeRecord> load_json_records(const std::string& path);
std::vector<EmployeeRecord> load_json_records(std::istream& in);

nlohmann::json records_to_json(const std::vector<EmployeeRecord>& records);

// Pretty-printed, 4-space indent.
void save_json_records(const std::string& path, const std::vector<EmployeeRecord>& records);

}  // namespace io
