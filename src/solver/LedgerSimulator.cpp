#include "LedgerSimulator.hpp"
#include <algorithm>
#include <cmath>

namespace Glidepath {

// Mutable balances of one path plus the scratch totals of the year being built
struct LedgerSimulator::YearState {
    std::vector<double> balance;
    std::vector<double> basis;
    double cash = 0.0;             // Surplus held when there is no taxable account
    LedgerYear* year = nullptr;

    double ordinary_draws = 0.0;   // Tax-deferred withdrawals
    double realized_gain = 0.0;
    double surplus = 0.0;
    double tax_settled = 0.0;      // Withheld + paid
    double tax_unpaid = 0.0;
};

LedgerSimulator::LedgerSimulator(const ScenarioInput& s, const TaxTable& tax_table,
                                 const RmdTable& rmd_table, const ConversionPolicy& policy)
    : scenario(s), rmd(rmd_table), conversion(policy),
      tax(tax_table, s.state, s.assumptions.bracket_indexation),
      income(s), classes(ReturnSampler::classes_for(s.accounts)) {
    for (int i = 0; i < static_cast<int>(s.accounts.size()); ++i) {
        if (roth_account < 0 && s.accounts[i].type == AccountType::Roth) roth_account = i;
        if (taxable_account < 0 && s.accounts[i].type == AccountType::Taxable) taxable_account = i;
    }
}

PathOutcome LedgerSimulator::simulate(ReturnSampler& sampler, int path_index) const {
    PathOutcome out;
    out.path_index = path_index;
    out.ledger.reserve(scenario.num_years());

    YearState st;
    for (const auto& a : scenario.accounts) {
        st.balance.push_back(a.balance);
        st.basis.push_back(a.type == AccountType::Taxable ? a.cost_basis : 0.0);
    }

    const double ss_fraction = scenario.assumptions.ss_taxable_fraction;

    for (int y = scenario.start_year; y <= scenario.end_year; ++y) {
        LedgerYear ly;
        ly.year = y;
        ly.age = scenario.people.empty() ? 0 : scenario.people[0].age_in(y);
        ly.accounts.resize(scenario.accounts.size());

        st.year = &ly;
        st.ordinary_draws = 0.0;
        st.realized_gain = 0.0;
        st.surplus = 0.0;
        st.tax_settled = 0.0;
        st.tax_unpaid = 0.0;

        // 1. Income
        YearCashFlows flows = income.flows_in(y);
        ly.social_security = flows.social_security;
        ly.other_income = flows.other_income;
        ly.spending = flows.spending;

        // 2. Growth on the opening balance
        apply_growth(st, sampler.sample_year(classes, scenario.assumptions.correlation));

        // 3. RMDs
        take_rmds(st);

        // 4. Conversion
        double ordinary_base = ly.rmd_taken + flows.taxable_other_income + ss_fraction * flows.social_security;
        double need = flows.spending - (flows.fixed_income() + ly.rmd_taken);
        convert(st, ordinary_base, need);

        // 5. Spending need
        double spending_unmet = 0.0;
        if (need < 0.0) {
            st.surplus = -need;
        } else if (need > 0.0) {
            spending_unmet = need - cover_need(st, need);
        }

        // 6. Tax
        settle_tax(st, ordinary_base);

        // 7. Surplus, contributions, close the year
        ly.surplus = st.surplus;
        if (st.surplus > 0.0) {
            if (taxable_account >= 0) {
                st.balance[taxable_account] += st.surplus;
                st.basis[taxable_account] += st.surplus;
            } else {
                st.cash += st.surplus;
            }
        }
        ly.cash = st.cash;
        ly.net_worth = st.cash;
        for (int i = 0; i < static_cast<int>(scenario.accounts.size()); ++i) {
            double c = income.contribution_to(i, y);
            if (c > 0.0) {
                st.balance[i] += c;
                if (scenario.accounts[i].type == AccountType::Taxable) st.basis[i] += c;
                ly.accounts[i].contribution = c;
            }
            ly.accounts[i].end_balance = st.balance[i];
            ly.net_worth += st.balance[i];
        }

        ly.shortfall = std::max(0.0, spending_unmet) + st.tax_unpaid;
        out.lifetime_tax += ly.total_tax;
        bool failed = ly.shortfall > kShortfallTolerance;
        out.ledger.push_back(std::move(ly));

        if (failed) {
            out.success = false;
            out.failure_year = y;
            break;
        }
    }

    out.terminal_net_worth = out.success && !out.ledger.empty() ? out.ledger.back().net_worth : 0.0;
    return out;
}

void LedgerSimulator::apply_growth(YearState& st, const std::vector<double>& returns) const {
    for (std::size_t i = 0; i < st.balance.size(); ++i) {
        AccountYear& a = st.year->accounts[i];
        a.start_balance = st.balance[i];
        a.sampled_return = returns[i];
        a.growth = st.balance[i] * returns[i];
        st.balance[i] = std::max(0.0, st.balance[i] + a.growth);
    }
}

void LedgerSimulator::take_rmds(YearState& st) const {
    LedgerYear& ly = *st.year;
    for (std::size_t i = 0; i < st.balance.size(); ++i) {
        const Account& acc = scenario.accounts[i];
        if (acc.type != AccountType::TaxDeferred) continue;
        const Person& owner = scenario.people[acc.owner];
        AccountYear& a = ly.accounts[i];
        a.rmd_required = rmd.required_minimum(owner.age_in(ly.year), a.start_balance, owner.birth_year);
        a.rmd_taken = std::min(a.rmd_required, st.balance[i]);
        st.balance[i] -= a.rmd_taken;
        ly.rmd_required += a.rmd_required;
        ly.rmd_taken += a.rmd_taken;
    }
}

void LedgerSimulator::convert(YearState& st, double ordinary_base, double need) const {
    const RothPolicy& settings = conversion.settings();
    LedgerYear& ly = *st.year;
    if (roth_account < 0 || !settings.active_in(ly.year)) return;

    double available = balance_of(st, AccountType::TaxDeferred);
    if (available <= 0.0) return;

    // Tax-deferred draws for this year's spending are ordinary income too
    double base = ordinary_base + projected_deferred_draw(st, need);

    ConversionContext ctx{ly.year, ly.age, available, base, scenario.filing_status, tax};
    double amount = std::clamp(conversion.propose(ctx), 0.0, std::min(settings.annual_cap, available));
    if (amount <= 0.0) return;

    double remaining = amount;
    for (std::size_t i = 0; i < st.balance.size() && remaining > 0.0; ++i) {
        if (scenario.accounts[i].type != AccountType::TaxDeferred) continue;
        double take = std::min(remaining, st.balance[i]);
        st.balance[i] -= take;
        ly.accounts[i].conversion_out += take;
        remaining -= take;
    }

    double withheld = 0.0;
    if (settings.funding == ConversionFunding::ConvertedAmount) {
        double before = tax.tax(base, 0.0, scenario.filing_status, ly.year).total();
        double after = tax.tax(base + amount, 0.0, scenario.filing_status, ly.year).total();
        withheld = std::clamp(after - before, 0.0, amount);
    }

    AccountYear& roth = ly.accounts[roth_account];
    roth.conversion_in = amount - withheld;
    roth.tax_paid += withheld;
    st.balance[roth_account] += amount - withheld;

    ly.conversion = amount;
    ly.conversion_tax = withheld;
    st.tax_settled += withheld;
}

double LedgerSimulator::withdraw(YearState& st, double amount, AccountType only, bool for_tax) const {
    double drawn = 0.0;
    for (std::size_t i = 0; i < st.balance.size() && amount - drawn > 0.0; ++i) {
        if (scenario.accounts[i].type != only || st.balance[i] <= 0.0) continue;

        double take = std::min(amount - drawn, st.balance[i]);
        AccountYear& a = st.year->accounts[i];

        if (only == AccountType::Taxable) {
            double basis_used = take * std::min(1.0, st.basis[i] / st.balance[i]);
            double gain = take - basis_used;
            st.basis[i] = std::max(0.0, st.basis[i] - basis_used);
            a.realized_gain += gain;
            st.realized_gain += gain;
        } else if (only == AccountType::TaxDeferred) {
            st.ordinary_draws += take;
        }

        st.balance[i] -= take;
        a.withdrawal += take;
        if (for_tax) a.tax_paid += take;
        drawn += take;
    }
    return drawn;
}

double LedgerSimulator::withdraw_in_order(YearState& st, double amount, bool for_tax) const {
    double drawn = 0.0;
    for (AccountType type : scenario.withdrawal_order) {
        if (amount - drawn <= 0.0) break;
        drawn += withdraw(st, amount - drawn, type, for_tax);
    }
    return drawn;
}

double LedgerSimulator::balance_of(const YearState& st, AccountType type) const {
    double total = 0.0;
    for (std::size_t i = 0; i < st.balance.size(); ++i) {
        if (scenario.accounts[i].type == type) total += st.balance[i];
    }
    return total;
}

// Cash on hand goes first, then the configured strategy. Anything the
// strategy leaves uncovered falls back to the priority order.
double LedgerSimulator::cover_need(YearState& st, double need) const {
    double drawn = std::min(st.cash, need);
    st.cash -= drawn;

    const WithdrawalPolicy& policy = scenario.withdrawal;
    switch (policy.strategy) {
        case WithdrawalStrategy::Ordered:
            break;

        case WithdrawalStrategy::Proportional: {
            double taxable = balance_of(st, AccountType::Taxable);
            double deferred = balance_of(st, AccountType::TaxDeferred);
            if (taxable + deferred > 0.0 && need - drawn > 0.0) {
                double share = (need - drawn) * taxable / (taxable + deferred);
                drawn += withdraw(st, share, AccountType::Taxable, false);
                drawn += withdraw(st, need - drawn, AccountType::TaxDeferred, false);
            }
            break;
        }

        case WithdrawalStrategy::BracketLimited: {
            // RMDs already count against the limit. Tax-deferred money above
            // it is only touched once every other account is empty.
            double limit = std::max(0.0, policy.pre_tax_limit - st.year->rmd_taken);
            drawn += withdraw(st, std::min(limit, need - drawn), AccountType::TaxDeferred, false);
            for (AccountType type : scenario.withdrawal_order) {
                if (type != AccountType::TaxDeferred) drawn += withdraw(st, need - drawn, type, false);
            }
            return drawn + withdraw(st, need - drawn, AccountType::TaxDeferred, false);
        }
    }
    return drawn + withdraw_in_order(st, need - drawn, false);
}

// Dry run of cover_need on a scratch copy of the year
double LedgerSimulator::projected_deferred_draw(const YearState& st, double need) const {
    if (need <= 0.0) return 0.0;
    YearState trial = st;
    LedgerYear scratch = *st.year;
    trial.year = &scratch;
    trial.ordinary_draws = 0.0;
    cover_need(trial, need);
    return trial.ordinary_draws;
}

// Tax-deferred and taxable draws made to pay the tax raise the tax itself, so
// settle by iterating until the amount still owed is within tolerance. This
// year's surplus pays first, then cash on hand, then taxable accounts, then
// the remaining priority order.
void LedgerSimulator::settle_tax(YearState& st, double ordinary_base) const {
    LedgerYear& ly = *st.year;
    TaxResult result;

    for (int iter = 0; iter < kMaxTaxIterations; ++iter) {
        double ordinary = ordinary_base + ly.conversion + st.ordinary_draws;
        result = tax.tax(ordinary, st.realized_gain, scenario.filing_status, ly.year);

        double due = result.total() - st.tax_settled;
        if (due <= kTaxTolerance) break;

        double from_cash = std::min(st.surplus, due);
        st.surplus -= from_cash;
        double held = std::min(st.cash, due - from_cash);
        st.cash -= held;
        from_cash += held;
        st.tax_settled += from_cash;
        due -= from_cash;
        if (due <= 0.0) continue;

        double paid = withdraw(st, due, AccountType::Taxable, true);
        paid += withdraw_in_order(st, due - paid, true);
        st.tax_settled += paid;

        if (paid <= 0.0 && from_cash <= 0.0) break;  // Every account exhausted
    }

    ly.ordinary_income = ordinary_base + ly.conversion + st.ordinary_draws;
    ly.capital_gains = st.realized_gain;
    result = tax.tax(ly.ordinary_income, ly.capital_gains, scenario.filing_status, ly.year);
    ly.federal_tax = result.federal;
    ly.state_tax = result.state;
    ly.total_tax = result.total();
    st.tax_unpaid = std::max(0.0, result.total() - st.tax_settled);
    if (st.tax_unpaid <= kTaxTolerance) st.tax_unpaid = 0.0;
}

} // namespace Glidepath
