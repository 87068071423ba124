#pragma once
#include <cmath>
#include <vector>
#include "../Scenario.hpp"
#include "../kernel/SocialSecurity.hpp"

namespace Glidepath {

struct YearCashFlows {
    double social_security = 0.0;
    double other_income = 0.0;
    double taxable_other_income = 0.0;
    double spending = 0.0;

    double fixed_income() const { return social_security + other_income; }
};

// Deterministic per-year cash flows of a scenario: benefits, fixed income,
// spending and contributions. Nothing here depends on sampled returns.
class IncomeBlock {
    const ScenarioInput& scenario;
    HouseholdBenefits benefits;

public:
    explicit IncomeBlock(const ScenarioInput& s)
        : scenario(s), benefits(s.people, s.start_year, s.assumptions.cola) {}

    YearCashFlows flows_in(int year) const {
        YearCashFlows f;
        f.social_security = benefits.benefit_in(year);
        for (const auto& stream : scenario.income) {
            if (!stream.active_in(year)) continue;
            double amount = stream.amount * std::pow(1.0 + stream.growth, year - stream.start_year);
            f.other_income += amount;
            if (stream.taxable) f.taxable_other_income += amount;
        }
        f.spending = scenario.spending.amount_in(year, scenario.start_year);
        return f;
    }

    double contribution_to(int account, int year) const {
        double total = 0.0;
        for (const auto& c : scenario.contributions) {
            if (c.account == account && c.active_in(year)) total += c.amount;
        }
        return total;
    }
};

} // namespace Glidepath
