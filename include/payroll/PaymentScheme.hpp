#pragma once
#include <string>
#include <variant>

#include "payroll/BonusScheme.hpp"

namespace payroll {

// base + bonus
struct FixedSalaryWithBonus {};

// actual * base + bonus (base is the rate per produced unit)
struct PercentProductionWithBonus {};

// (actual / plan) * base + bonus, bonus alone when plan == 0
struct PercentPlanWithBonus {};

using PaymentScheme = std::variant<FixedSalaryWithBonus, PercentProductionWithBonus, PercentPlanWithBonus>;

// `bonus` is an already resolved figure. Never throws, also for plan == 0.
double calculate_pay(const PaymentScheme& scheme, double base, double bonus, double plan, double actual);

// Resolves the bonus through `bonus_scheme` first.
double calculate_pay(const PaymentScheme& scheme, double base, const BonusScheme& bonus_scheme,
                     double plan, double actual);

// "fixed_salary" | "percent_production" | "percent_plan"
std::string payment_scheme_tag(const PaymentScheme& scheme);

// Both throw SelectionError on unknown input.
PaymentScheme payment_scheme_from_tag(const std::string& tag);
PaymentScheme payment_scheme_from_code(const std::string& code);

}  // namespace payroll
