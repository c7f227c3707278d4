#pragma once
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "io/EmployeeRecord.hpp"

namespace io {

// Header row + data rows, RFC 4180 quoting. Required columns: name, position,
// department, base_salary. Production is not carried. Throws
// payroll::InputError naming the line on malformed input.
std::vector<EmployeeRecord> load_csv_records(const std::string& path);
std::vector<EmployeeRecord> load_csv_records(std::istream& in);

// Throws payroll::InputError when `records` is empty.
void save_csv_records(const std::string& path, const std::vector<EmployeeRecord>& records);
void write_csv_records(std::ostream& out, const std::vector<EmployeeRecord>& records);

// one logical CSV row (may span physical lines inside quotes); false at EOF
bool read_csv_row(std::istream& in, std::vector<std::string>& fields, size_t& line_no);

std::string csv_escape(const std::string& field);

}  // namespace io
