#pragma once
#include <string>
#include <variant>

namespace payroll {

// Caller-supplied amount, independent of plan/actual.
struct FixedBonus {
    double amount = 0.0;
};

// 10% of the base rate.
struct PercentOfBaseBonus {};

// 20% of the base rate, scaled by plan fulfilment (actual / plan).
struct PlanPerformanceBonus {};

using BonusScheme = std::variant<FixedBonus, PercentOfBaseBonus, PlanPerformanceBonus>;

// Total for every variant: plan == 0 yields 0 for PlanPerformanceBonus.
double calculate_bonus(const BonusScheme& scheme, double base, double plan, double actual);

// "fixed" | "percent_of_base" | "plan_performance"
std::string bonus_scheme_tag(const BonusScheme& scheme);

// `amount` is only used for "fixed". Throws SelectionError on unknown tag.
BonusScheme bonus_scheme_from_tag(const std::string& tag, double amount = 0.0);

// menu codes "1".."3" in the order of the variant list
BonusScheme bonus_scheme_from_code(const std::string& code, double amount = 0.0);

// FixedBonus amount, 0 for the computed variants
double fixed_bonus_amount(const BonusScheme& scheme);

}  // namespace payroll
