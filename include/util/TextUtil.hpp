#pragma once
#include <string>

namespace textutil {

// strip leading/trailing ASCII whitespace
std::string trim(const std::string& s);

std::string to_lower(std::string s);

// whole string must be a finite decimal number (surrounding spaces allowed)
bool try_parse_double(const std::string& s, double& out);

// like try_parse_double, throws payroll::InputError naming `what` on failure
double parse_double(const std::string& s, const std::string& what);

// "YYYY-MM" with month 01..12
bool is_month_key(const std::string& s);

}
