#include "payroll/PaymentScheme.hpp"

#include "payroll/Errors.hpp"
#include "util/TextUtil.hpp"

namespace payroll {

namespace {

struct PayCalculator {
    double base;
    double bonus;
    double plan;
    double actual;

    double operator()(const FixedSalaryWithBonus&) const { return base + bonus; }
    double operator()(const PercentProductionWithBonus&) const { return actual * base + bonus; }
    double operator()(const PercentPlanWithBonus&) const {
        if (plan == 0.0) return bonus;
        return (actual / plan) * base + bonus;
    }
};

struct PaymentTagger {
    const char* operator()(const FixedSalaryWithBonus&) const { return "fixed_salary"; }
    const char* operator()(const PercentProductionWithBonus&) const { return "percent_production"; }
    const char* operator()(const PercentPlanWithBonus&) const { return "percent_plan"; }
};

}  // namespace

double calculate_pay(const PaymentScheme& scheme, double base, double bonus, double plan, double actual) {
    return std::visit(PayCalculator{base, bonus, plan, actual}, scheme);
}

double calculate_pay(const PaymentScheme& scheme, double base, const BonusScheme& bonus_scheme,
                     double plan, double actual) {
    const double bonus = calculate_bonus(bonus_scheme, base, plan, actual);
    return calculate_pay(scheme, base, bonus, plan, actual);
}

std::string payment_scheme_tag(const PaymentScheme& scheme) {
    return std::visit(PaymentTagger{}, scheme);
}

PaymentScheme payment_scheme_from_tag(const std::string& tag) {
    const std::string t = textutil::to_lower(textutil::trim(tag));
    if (t == "fixed_salary") return FixedSalaryWithBonus{};
    if (t == "percent_production") return PercentProductionWithBonus{};
    if (t == "percent_plan") return PercentPlanWithBonus{};
    throw SelectionError("unknown payment scheme: " + tag);
}

PaymentScheme payment_scheme_from_code(const std::string& code) {
    const std::string c = textutil::trim(code);
    if (c == "1") return FixedSalaryWithBonus{};
    if (c == "2") return PercentProductionWithBonus{};
    if (c == "3") return PercentPlanWithBonus{};
    throw SelectionError("invalid payment scheme choice: " + code);
}

}  // namespace payroll
