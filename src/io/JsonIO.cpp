#include "io/JsonIO.hpp"

#include "payroll/Errors.hpp"
#include "util/TextUtil.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace io {

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw payroll::InputError(where + " must be an object");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw payroll::InputError(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw payroll::InputError(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::string optional_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return "";
    return require_string(j, key, where);
}

// numbers may also arrive as numeric strings
static double number_value(const json& v, const std::string& where) {
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) return textutil::parse_double(v.get<std::string>(), where);
    throw payroll::InputError(where + " must be a number");
}

static double require_number(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw payroll::InputError(where + " missing required field: " + std::string(key));
    }
    return number_value(j.at(key), where + "." + key);
}

static EmployeeRecord parse_record(const json& j, const std::string& where) {
    require_object(j, where);

    EmployeeRecord r;
    r.name        = require_string(j, "name", where);
    r.position    = require_string(j, "position", where);
    r.department  = require_string(j, "department", where);
    r.base_salary = require_number(j, "base_salary", where);

    if (j.contains("bonus") && !j.at("bonus").is_null()) {
        r.bonus = number_value(j.at("bonus"), where + ".bonus");
    }
    r.payment_scheme = optional_string(j, "payment_scheme", where);
    r.bonus_scheme   = optional_string(j, "bonus_scheme", where);
    r.role           = optional_string(j, "role", where);

    if (j.contains("production") && !j.at("production").is_null()) {
        const json& prod = j.at("production");
        require_object(prod, where + ".production");
        for (auto it = prod.begin(); it != prod.end(); ++it) {
            r.production[it.key()] = number_value(it.value(), where + ".production." + it.key());
        }
    }

    return r;
}

std::vector<EmployeeRecord> load_json_records(std::istream& in) {
    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        // parse_error and out_of_range (number overflow) alike
        throw payroll::InputError(std::string("failed to parse JSON: ") + e.what());
    }

    if (!j.is_array()) {
        throw payroll::InputError("root must be an array of employee records");
    }

    std::vector<EmployeeRecord> out;
    out.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        std::ostringstream oss;
        oss << "root[" << i << "]";
        out.push_back(parse_record(j.at(i), oss.str()));
    }
    return out;
}

std::vector<EmployeeRecord> load_json_records(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open JSON file: " + path);
    }
    return load_json_records(in);
}

nlohmann::json records_to_json(const std::vector<EmployeeRecord>& records) {
    json arr = json::array();
    for (const auto& r : records) {
        json j;
        j["name"] = r.name;
        j["position"] = r.position;
        j["department"] = r.department;
        j["base_salary"] = r.base_salary;
        j["bonus"] = r.bonus;
        j["payment_scheme"] = r.payment_scheme;
        j["bonus_scheme"] = r.bonus_scheme;
        j["role"] = r.role;

        json prod = json::object();
        for (const auto& kv : r.production) prod[kv.first] = kv.second;
        j["production"] = prod;

        arr.push_back(std::move(j));
    }
    return arr;
}

void save_json_records(const std::string& path, const std::vector<EmployeeRecord>& records) {
    // serialize before the target is truncated; invalid UTF-8 becomes U+FFFD
    const std::string text = records_to_json(records).dump(4, ' ', false, json::error_handler_t::replace);

    std::ofstream out(path);
    if (!out) throw std::runtime_error("failed to open output file: " + path);

    out << text << "\n";
    if (!out) throw std::runtime_error("failed to write output file: " + path);
}

}  // namespace io
