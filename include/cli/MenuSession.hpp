#pragma once
#include <istream>
#include <ostream>

#include "org/Registry.hpp"

namespace cli {

struct MenuConfig {
    int salary_precision = 2;   // digits after the decimal point
    bool show_prompts = true;   // print the menu and field prompts
};

// Runs the 12-action menu until "12" or end of input. Errors are reported on
// `out` and the loop continues. Returns 0.
int run_menu(org::Registry& registry, std::istream& in, std::ostream& out, const MenuConfig& cfg = {});

}  // namespace cli
