#pragma once
#include <stdexcept>
#include <string>

namespace payroll {

// department / employee name not found
class LookupError : public std::runtime_error {
public:
    explicit LookupError(const std::string& what) : std::runtime_error(what) {}
};

// unknown scheme code or tag
class SelectionError : public std::runtime_error {
public:
    explicit SelectionError(const std::string& what) : std::runtime_error(what) {}
};

// malformed or out-of-range input (numbers, month keys, records)
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace payroll
