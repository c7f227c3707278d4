#include "payroll/BonusScheme.hpp"

#include "payroll/Errors.hpp"
#include "util/TextUtil.hpp"

namespace payroll {

namespace {

struct BonusCalculator {
    double base;
    double plan;
    double actual;

    double operator()(const FixedBonus& b) const { return b.amount; }
    double operator()(const PercentOfBaseBonus&) const { return 0.10 * base; }
    double operator()(const PlanPerformanceBonus&) const {
        if (plan == 0.0) return 0.0;
        return 0.20 * base * (actual / plan);
    }
};

struct BonusTagger {
    const char* operator()(const FixedBonus&) const { return "fixed"; }
    const char* operator()(const PercentOfBaseBonus&) const { return "percent_of_base"; }
    const char* operator()(const PlanPerformanceBonus&) const { return "plan_performance"; }
};

}  // namespace

double calculate_bonus(const BonusScheme& scheme, double base, double plan, double actual) {
    return std::visit(BonusCalculator{base, plan, actual}, scheme);
}

std::string bonus_scheme_tag(const BonusScheme& scheme) {
    return std::visit(BonusTagger{}, scheme);
}

BonusScheme bonus_scheme_from_tag(const std::string& tag, double amount) {
    const std::string t = textutil::to_lower(textutil::trim(tag));
    if (t == "fixed") return FixedBonus{amount};
    if (t == "percent_of_base") return PercentOfBaseBonus{};
    if (t == "plan_performance") return PlanPerformanceBonus{};
    throw SelectionError("unknown bonus scheme: " + tag);
}

BonusScheme bonus_scheme_from_code(const std::string& code, double amount) {
    const std::string c = textutil::trim(code);
    if (c == "1") return FixedBonus{amount};
    if (c == "2") return PercentOfBaseBonus{};
    if (c == "3") return PlanPerformanceBonus{};
    throw SelectionError("invalid bonus scheme choice: " + code);
}

double fixed_bonus_amount(const BonusScheme& scheme) {
    if (const auto* fixed = std::get_if<FixedBonus>(&scheme)) return fixed->amount;
    return 0.0;
}

}  // namespace payroll
