#include "io/CsvIO.hpp"

#include "payroll/Errors.hpp"
#include "util/TextUtil.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace io {

static const char* const kColumns[] = {
    "name", "position", "department", "base_salary",
    "bonus", "payment_scheme", "bonus_scheme", "role",
};

static const char* const kRequired[] = {"name", "position", "department", "base_salary"};

bool read_csv_row(std::istream& in, std::vector<std::string>& fields, size_t& line_no) {
    fields.clear();

    std::string line;
    if (!std::getline(in, line)) return false;
    ++line_no;

    std::string cur;
    bool in_quotes = false;
    size_t i = 0;

    while (true) {
        if (i >= line.size()) {
            if (in_quotes) {
                // quoted field continues on the next physical line
                std::string next;
                if (!std::getline(in, next)) {
                    throw payroll::InputError("line " + std::to_string(line_no) + ": unterminated quoted field");
                }
                ++line_no;
                cur.push_back('\n');
                line = std::move(next);
                i = 0;
                continue;
            }
            break;
        }

        const char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cur.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                cur.push_back(c);
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(std::move(cur));
            cur.clear();
        } else if (c == '\r' && i + 1 == line.size()) {
            // CRLF line ending
        } else {
            cur.push_back(c);
        }
        ++i;
    }

    fields.push_back(std::move(cur));
    return true;
}

static bool is_blank_row(const std::vector<std::string>& fields) {
    for (const auto& f : fields) {
        if (!textutil::trim(f).empty()) return false;
    }
    return true;
}

std::vector<EmployeeRecord> load_csv_records(std::istream& in) {
    std::vector<std::string> header;
    size_t line_no = 0;

    do {
        if (!read_csv_row(in, header, line_no)) {
            throw payroll::InputError("CSV input has no header row");
        }
    } while (is_blank_row(header));

    std::unordered_map<std::string, size_t> col;
    for (size_t i = 0; i < header.size(); ++i) {
        col[textutil::to_lower(textutil::trim(header[i]))] = i;
    }
    for (const char* req : kRequired) {
        if (col.find(req) == col.end()) {
            throw payroll::InputError("CSV header missing required column: " + std::string(req));
        }
    }

    std::vector<EmployeeRecord> out;
    std::vector<std::string> row;

    while (read_csv_row(in, row, line_no)) {
        if (is_blank_row(row)) continue;

        const std::string where = "line " + std::to_string(line_no);

        auto cell = [&](const char* key) -> std::string {
            auto it = col.find(key);
            if (it == col.end() || it->second >= row.size()) return "";
            return textutil::trim(row[it->second]);
        };
        auto required_cell = [&](const char* key) -> std::string {
            auto it = col.find(key);
            if (it->second >= row.size()) {
                throw payroll::InputError(where + ": missing required field: " + std::string(key));
            }
            return textutil::trim(row[it->second]);
        };

        EmployeeRecord r;
        r.name        = required_cell("name");
        r.position    = required_cell("position");
        r.department  = required_cell("department");
        r.base_salary = textutil::parse_double(required_cell("base_salary"), where + ": base_salary");

        const std::string bonus = cell("bonus");
        if (!bonus.empty()) r.bonus = textutil::parse_double(bonus, where + ": bonus");
        r.payment_scheme = cell("payment_scheme");
        r.bonus_scheme   = cell("bonus_scheme");
        r.role           = cell("role");

        out.push_back(std::move(r));
    }

    return out;
}

std::vector<EmployeeRecord> load_csv_records(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open CSV file: " + path);
    }
    return load_csv_records(in);
}

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;

    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (char c : field) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

static std::string format_number(double v) {
    std::ostringstream oss;
    oss.precision(std::numeric_limits<double>::max_digits10);
    oss << v;
    return oss.str();
}

void write_csv_records(std::ostream& out, const std::vector<EmployeeRecord>& records) {
    if (records.empty()) {
        throw payroll::InputError("no records to save");
    }

    bool first = true;
    for (const char* c : kColumns) {
        if (!first) out << ',';
        out << c;
        first = false;
    }
    out << "\n";

    for (const auto& r : records) {
        out << csv_escape(r.name) << ','
            << csv_escape(r.position) << ','
            << csv_escape(r.department) << ','
            << format_number(r.base_salary) << ','
            << format_number(r.bonus) << ','
            << csv_escape(r.payment_scheme) << ','
            << csv_escape(r.bonus_scheme) << ','
            << csv_escape(r.role) << "\n";
    }
}

void save_csv_records(const std::string& path, const std::vector<EmployeeRecord>& records) {
    if (records.empty()) {
        throw payroll::InputError("no records to save");
    }

    std::ofstream out(path);
    if (!out) throw std::runtime_error("failed to open output file: " + path);

    write_csv_records(out, records);
    if (!out) throw std::runtime_error("failed to write output file: " + path);
}

}  // namespace io
