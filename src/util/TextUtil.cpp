#include "util/TextUtil.hpp"

#include "payroll/Errors.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace textutil {

std::string trim(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;

    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;

    return s.substr(a, b - a);
}

std::string to_lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool try_parse_double(const std::string& s, double& out) {
    const std::string t = trim(s);
    if (t.empty()) return false;

    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size()) return false;
    if (errno == ERANGE || !std::isfinite(v)) return false;

    out = v;
    return true;
}

double parse_double(const std::string& s, const std::string& what) {
    double v = 0.0;
    if (!try_parse_double(s, v)) {
        throw payroll::InputError(what + " must be a number, got '" + s + "'");
    }
    return v;
}

bool is_month_key(const std::string& s) {
    if (s.size() != 7 || s[4] != '-') return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 4) continue;
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    const int month = (s[5] - '0') * 10 + (s[6] - '0');
    return month >= 1 && month <= 12;
}

}
