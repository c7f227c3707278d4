#pragma once
#include <string>
#include <vector>

#include "io/EmployeeRecord.hpp"

namespace io {

enum class RecordFormat {
    Json,
    Csv
};

// by extension (.json / .csv, case-insensitive); throws payroll::InputError otherwise
RecordFormat format_for_path(const std::string& path);

std::vector<EmployeeRecord> load_records(const std::string& path);
void save_records(const std::string& path, const std::vector<EmployeeRecord>& records);

}  // namespace io
