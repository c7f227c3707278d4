#include "io/RecordIO.hpp"

#include "io/CsvIO.hpp"
#include "io/JsonIO.hpp"
#include "payroll/Errors.hpp"
#include "util/TextUtil.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace io {

RecordFormat format_for_path(const std::string& path) {
    const std::string ext = textutil::to_lower(fs::path(path).extension().string());
    if (ext == ".json") return RecordFormat::Json;
    if (ext == ".csv") return RecordFormat::Csv;
    throw payroll::InputError("unsupported file type (expected .json or .csv): " + path);
}

std::vector<EmployeeRecord> load_records(const std::string& path) {
    switch (format_for_path(path)) {
        case RecordFormat::Json: return load_json_records(path);
        case RecordFormat::Csv: return load_csv_records(path);
    }
    return {};
}

void save_records(const std::string& path, const std::vector<EmployeeRecord>& records) {
    switch (format_for_path(path)) {
        case RecordFormat::Json: save_json_records(path, records); return;
        case RecordFormat::Csv: save_csv_records(path, records); return;
    }
}

}  // namespace io
