#pragma once
#include <vector>
#include "../Scenario.hpp"
#include "../blocks/ConversionPolicy.hpp"
#include "../blocks/IncomeBlock.hpp"
#include "../engine/types.h"
#include "../kernel/ReturnSampler.hpp"
#include "../kernel/RmdTable.hpp"
#include "../kernel/TaxSystem.hpp"

namespace Glidepath {

// Deterministic projection of one path. Holds references only; the scenario,
// tables and policy must outlive the simulator. simulate() is const and safe
// to call from several threads with distinct samplers.
class LedgerSimulator {
public:
    static constexpr double kShortfallTolerance = 1e-6;
    static constexpr double kTaxTolerance = 0.005;
    static constexpr int kMaxTaxIterations = 100;

    LedgerSimulator(const ScenarioInput& scenario, const TaxTable& tax_table,
                    const RmdTable& rmd_table, const ConversionPolicy& conversion);

    PathOutcome simulate(ReturnSampler& sampler, int path_index) const;

private:
    const ScenarioInput& scenario;
    const RmdTable& rmd;
    const ConversionPolicy& conversion;
    TaxEngine tax;
    IncomeBlock income;
    std::vector<ReturnClass> classes;
    int roth_account = -1;
    int taxable_account = -1;

    struct YearState;

    void apply_growth(YearState& st, const std::vector<double>& returns) const;
    void take_rmds(YearState& st) const;
    void convert(YearState& st, double ordinary_base, double need) const;
    double balance_of(const YearState& st, AccountType type) const;
    double withdraw(YearState& st, double amount, AccountType only, bool for_tax) const;
    double withdraw_in_order(YearState& st, double amount, bool for_tax) const;
    double cover_need(YearState& st, double need) const;
    double projected_deferred_draw(const YearState& st, double need) const;
    void settle_tax(YearState& st, double ordinary_base) const;
};

} // namespace Glidepath
