#undef NDEBUG
#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include "Scenario.hpp"
#include "blocks/ConversionPolicy.hpp"
#include "io/json_loader.hpp"
#include "kernel/ReturnSampler.hpp"
#include "kernel/RmdTable.hpp"
#include "kernel/TaxSystem.hpp"
#include "solver/LedgerSimulator.hpp"

using namespace Glidepath;

static bool close(double a, double b, double tol = 1e-6) { return std::abs(a - b) <= tol; }

static Account account(const std::string& name, AccountType type, double balance, double basis = 0.0) {
    Account a;
    a.name = name;
    a.type = type;
    a.balance = balance;
    a.cost_basis = basis;
    return a;
}

// One person born 1980 with no benefit, zero returns, no accounts yet
static ScenarioInput base(int start_year, int end_year) {
    ScenarioInput s;
    s.id = "ledger-test";
    s.start_year = start_year;
    s.end_year = end_year;
    Person p;
    p.name = "Pat";
    p.birth_year = 1980;
    p.pia = 0.0;
    p.claiming_age = 67;
    s.people.push_back(p);
    return s;
}

static PathOutcome simulate(const ScenarioInput& s, const TaxTable& taxes) {
    s.validate_or_throw();
    RmdTable rmd;
    auto policy = make_conversion_policy(s.roth);
    LedgerSimulator sim(s, taxes, rmd, *policy);
    ReturnSampler sampler(1, 0);
    return sim.simulate(sampler, 0);
}

static void test_depletion(const TaxTable& zero, const TaxTable& real) {
    std::cout << "Testing depletion timing..." << std::endl;
    ScenarioInput s = base(2026, 2050);
    s.accounts.push_back(account("401k", AccountType::TaxDeferred, 1000000.0));
    s.spending.annual = 40000.0;

    // 25 years of $40k from $1M: the last dollar goes in year 25
    PathOutcome ok = simulate(s, zero);
    assert(ok.success);
    assert(ok.failure_year == 0);
    assert(ok.ledger.size() == 25);
    assert(close(ok.ledger.back().net_worth, 0.0));
    assert(close(ok.ledger.back().shortfall, 0.0));

    s.end_year = 2051;
    PathOutcome fail = simulate(s, zero);
    assert(!fail.success);
    assert(fail.failure_year == 2051);
    assert(fail.ledger.size() == 26);
    assert(close(fail.ledger.back().shortfall, 40000.0));
    assert(close(fail.terminal_net_worth, 0.0));

    // Tax on the withdrawals shortens the horizon
    s.end_year = 2050;
    PathOutcome taxed = simulate(s, real);
    assert(!taxed.success);
    assert(taxed.failure_year < 2050);
    assert(taxed.lifetime_tax > 0.0);
    std::cout << "With 2024 single tables the plan fails in " << taxed.failure_year << std::endl;
}

static void test_hand_computed_taxable(const TaxTable& flat10) {
    std::cout << "Testing taxable gains and tax fixed point..." << std::endl;
    ScenarioInput s = base(2026, 2026);
    s.accounts.push_back(account("Brokerage", AccountType::Taxable, 100000.0, 60000.0));
    s.spending.annual = 10000.0;

    PathOutcome out = simulate(s, flat10);
    assert(out.success);
    const LedgerYear& ly = out.ledger.at(0);
    // Gains are 40% of every dollar drawn, taxed at 10%: T = 0.1 * 0.4 * (10000 + T)
    double tax = 400.0 / 0.96;
    assert(close(ly.total_tax, tax, 0.01));
    assert(close(ly.capital_gains, 0.4 * (10000.0 + tax), 0.05));
    assert(close(ly.accounts[0].end_balance, 100000.0 - 10000.0 - tax, 0.01));
    assert(close(ly.accounts[0].tax_paid, tax, 0.01));
    assert(close(ly.accounts[0].withdrawal, 10000.0 + tax, 0.01));
    assert(close(ly.shortfall, 0.0));
}

static void test_rmds(const TaxTable& zero) {
    std::cout << "Testing required minimum distributions..." << std::endl;
    ScenarioInput s = base(2025, 2034);
    s.people[0].birth_year = 1950;
    s.accounts.push_back(account("IRA", AccountType::TaxDeferred, 500000.0));
    s.accounts.push_back(account("Cash", AccountType::Taxable, 0.0));

    RmdTable rmd;
    PathOutcome out = simulate(s, zero);
    assert(out.success);
    double deposited = 0.0;
    for (const auto& ly : out.ledger) {
        const AccountYear& ira = ly.accounts[0];
        double expected = ira.start_balance / rmd.divisor(ly.age);
        assert(close(ira.rmd_required, expected));
        assert(close(ira.rmd_taken, expected));
        deposited += expected;
        assert(close(ly.surplus, expected));
        assert(close(ly.accounts[1].end_balance, deposited, 1e-4));
    }
    assert(close(out.ledger[0].rmd_taken, 500000.0 / 24.6));
}

struct GreedyConversion : public ConversionPolicy {
    explicit GreedyConversion(const RothPolicy& p) : ConversionPolicy(p) {}
    double propose(const ConversionContext&) const override { return 1e12; }
};

static void test_conversion_caps(const TaxTable& zero) {
    std::cout << "Testing conversion clamps..." << std::endl;
    ScenarioInput s = base(2026, 2030);
    s.accounts.push_back(account("IRA", AccountType::TaxDeferred, 30000.0));
    s.accounts.push_back(account("Roth", AccountType::Roth, 0.0));
    s.roth.kind = ConversionKind::FixedCap;
    s.roth.annual_cap = 20000.0;
    s.roth.start_year = 2026;
    s.roth.end_year = 2030;

    PathOutcome out = simulate(s, zero);
    const double expected[] = {20000.0, 10000.0, 0.0, 0.0, 0.0};
    for (std::size_t i = 0; i < out.ledger.size(); ++i) {
        const LedgerYear& ly = out.ledger[i];
        assert(ly.conversion <= std::min(s.roth.annual_cap, ly.accounts[0].start_balance) + 1e-9);
        assert(close(ly.conversion, expected[i]));
    }
    assert(close(out.ledger.back().accounts[1].end_balance, 30000.0));

    // A policy asking for more than the cap is clamped
    RmdTable rmd;
    GreedyConversion greedy(s.roth);
    LedgerSimulator sim(s, zero, rmd, greedy);
    ReturnSampler sampler(1, 0);
    PathOutcome g = sim.simulate(sampler, 0);
    assert(close(g.ledger[0].conversion, 20000.0));

    // Outside the window nothing moves
    s.roth.start_year = 2028;
    PathOutcome late = simulate(s, zero);
    assert(close(late.ledger[0].conversion, 0.0));
    assert(close(late.ledger[2].conversion, 20000.0));

    // No Roth account, no conversion
    ScenarioInput no_roth = s;
    no_roth.accounts.pop_back();
    no_roth.roth.start_year = 2026;
    PathOutcome none = simulate(no_roth, zero);
    for (const auto& ly : none.ledger) assert(close(ly.conversion, 0.0));
    assert(close(none.ledger.back().net_worth, 30000.0));
}

static void test_conversion_funding(const TaxTable& flat10) {
    std::cout << "Testing conversion funding..." << std::endl;
    ScenarioInput s = base(2026, 2026);
    s.accounts.push_back(account("Brokerage", AccountType::Taxable, 5000.0, 5000.0));
    s.accounts.push_back(account("IRA", AccountType::TaxDeferred, 100000.0));
    s.accounts.push_back(account("Roth", AccountType::Roth, 0.0));
    s.roth.kind = ConversionKind::FixedCap;
    s.roth.annual_cap = 10000.0;
    s.roth.start_year = 2026;
    s.roth.end_year = 2026;

    s.roth.funding = ConversionFunding::Taxable;
    const LedgerYear paid = simulate(s, flat10).ledger.at(0);
    assert(close(paid.conversion, 10000.0));
    assert(close(paid.total_tax, 1000.0));
    assert(close(paid.conversion_tax, 0.0));
    assert(close(paid.accounts[0].end_balance, 4000.0));
    assert(close(paid.accounts[1].end_balance, 90000.0));
    assert(close(paid.accounts[2].end_balance, 10000.0));

    s.roth.funding = ConversionFunding::ConvertedAmount;
    const LedgerYear withheld = simulate(s, flat10).ledger.at(0);
    assert(close(withheld.conversion_tax, 1000.0));
    assert(close(withheld.accounts[0].end_balance, 5000.0));
    assert(close(withheld.accounts[2].conversion_in, 9000.0));
    assert(close(withheld.accounts[2].end_balance, 9000.0));
}

static void test_bracket_fill(const TaxTable& real) {
    std::cout << "Testing bracket-filling conversions..." << std::endl;
    ScenarioInput s = base(2024, 2024);
    s.people[0].birth_year = 1960;
    s.accounts.push_back(account("Brokerage", AccountType::Taxable, 100000.0, 100000.0));
    s.accounts.push_back(account("IRA", AccountType::TaxDeferred, 500000.0));
    s.accounts.push_back(account("Roth", AccountType::Roth, 0.0));
    s.roth.kind = ConversionKind::BracketFill;
    s.roth.annual_cap = 100000.0;
    s.roth.target_rate = 0.12;
    s.roth.start_year = 2024;
    s.roth.end_year = 2024;

    const LedgerYear ly = simulate(s, real).ledger.at(0);
    // Top of the 12% bracket plus the standard deduction
    assert(close(ly.conversion, 47150.0 + 14600.0));
    assert(close(ly.total_tax, 1160.0 + 35550.0 * 0.12));
    assert(close(ly.accounts[0].end_balance, 100000.0 - ly.total_tax, 0.01));

    s.roth.annual_cap = 25000.0;
    assert(close(simulate(s, real).ledger.at(0).conversion, 25000.0));
}

static void test_cash_flows(const TaxTable& zero) {
    std::cout << "Testing income, surplus and contributions..." << std::endl;
    ScenarioInput s = base(2026, 2027);
    s.accounts.push_back(account("Brokerage", AccountType::Taxable, 0.0));
    s.accounts.push_back(account("Roth", AccountType::Roth, 0.0));
    s.spending.annual = 30000.0;
    s.spending.inflation = 0.10;
    s.spending.items.push_back({2027, 5000.0});
    IncomeStream pension;
    pension.name = "Pension";
    pension.start_year = 2026;
    pension.end_year = 2027;
    pension.amount = 50000.0;
    s.income.push_back(pension);
    Contribution c;
    c.account = 1;
    c.start_year = 2026;
    c.end_year = 2026;
    c.amount = 5000.0;
    s.contributions.push_back(c);

    PathOutcome out = simulate(s, zero);
    assert(out.success);
    assert(close(out.ledger[0].spending, 30000.0));
    assert(close(out.ledger[0].surplus, 20000.0));
    assert(close(out.ledger[0].accounts[0].end_balance, 20000.0));
    assert(close(out.ledger[0].accounts[1].contribution, 5000.0));
    assert(close(out.ledger[1].spending, 33000.0 + 5000.0));
    assert(close(out.ledger[1].accounts[0].end_balance, 20000.0 + 12000.0));
    assert(close(out.ledger[1].accounts[1].end_balance, 5000.0));
    assert(close(out.terminal_net_worth, 37000.0));

    std::cout << "Testing withdrawal order..." << std::endl;
    ScenarioInput o = base(2026, 2026);
    o.accounts.push_back(account("Brokerage", AccountType::Taxable, 50000.0, 50000.0));
    o.accounts.push_back(account("Roth", AccountType::Roth, 50000.0));
    o.spending.annual = 10000.0;
    o.withdrawal_order = {AccountType::Roth, AccountType::Taxable, AccountType::TaxDeferred};
    const LedgerYear ly = simulate(o, zero).ledger.at(0);
    assert(close(ly.accounts[0].end_balance, 50000.0));
    assert(close(ly.accounts[1].end_balance, 40000.0));

    std::cout << "Testing empty households..." << std::endl;
    ScenarioInput empty = base(2026, 2030);
    PathOutcome nothing = simulate(empty, zero);
    assert(nothing.success);
    assert(nothing.ledger.size() == 5);
    assert(close(nothing.terminal_net_worth, 0.0));

    empty.spending.annual = 1.0;
    PathOutcome broke = simulate(empty, zero);
    assert(!broke.success);
    assert(broke.failure_year == 2026);
}

static void test_cash_holding(const TaxTable& zero) {
    std::cout << "Testing surplus held as cash without a taxable account..." << std::endl;
    ScenarioInput s = base(2026, 2060);
    s.people[0].birth_year = 1946;
    s.accounts.push_back(account("IRA", AccountType::TaxDeferred, 1000000.0));
    s.spending.annual = 20000.0;

    RmdTable rmd;
    PathOutcome out = simulate(s, zero);
    assert(out.success);
    assert(out.ledger.size() == 35);

    const LedgerYear& first = out.ledger[0];
    double rmd_first = 1000000.0 / rmd.divisor(80);
    assert(close(first.rmd_taken, rmd_first));
    assert(close(first.surplus, rmd_first - 20000.0));
    assert(close(first.cash, rmd_first - 20000.0));
    assert(close(first.net_worth, 980000.0, 1e-4));

    // Only spending leaves the household; RMD cash beyond it is kept
    for (std::size_t i = 0; i < out.ledger.size(); ++i) {
        assert(close(out.ledger[i].net_worth, 1000000.0 - 20000.0 * (i + 1), 1e-4));
    }
    assert(close(out.terminal_net_worth, 300000.0, 1e-4));

    ScenarioInput with_taxable = s;
    with_taxable.accounts.push_back(account("Brokerage", AccountType::Taxable, 0.0));
    PathOutcome same = simulate(with_taxable, zero);
    assert(same.success);
    assert(close(same.terminal_net_worth, out.terminal_net_worth, 1e-4));
    for (const auto& ly : same.ledger) assert(close(ly.cash, 0.0));

    // Cash on hand pays tax before any account is touched
    TaxTable flat10 = TaxTable::flat(2020, 0.10);
    ScenarioInput taxed = base(2026, 2027);
    taxed.people[0].birth_year = 1946;
    taxed.accounts.push_back(account("IRA", AccountType::TaxDeferred, 1000000.0));
    PathOutcome t = simulate(taxed, flat10);
    assert(t.success);
    const LedgerYear& y1 = t.ledger[0];
    assert(close(y1.total_tax, 0.1 * y1.rmd_taken));
    assert(close(y1.cash, 0.9 * y1.rmd_taken));
    assert(close(y1.accounts[0].withdrawal, 0.0));
}

static ScenarioInput strategy_scenario(double spending) {
    ScenarioInput s = base(2025, 2025);
    s.people[0].birth_year = 1960;
    s.accounts.push_back(account("Brokerage", AccountType::Taxable, 50000.0, 50000.0));
    s.accounts.push_back(account("IRA", AccountType::TaxDeferred, 50000.0));
    s.accounts.push_back(account("Roth", AccountType::Roth, 0.0));
    s.spending.annual = spending;
    return s;
}

static void test_withdrawal_strategies(const TaxTable& zero) {
    std::cout << "Testing withdrawal strategies..." << std::endl;

    ScenarioInput ordered = strategy_scenario(10000.0);
    LedgerYear ly = simulate(ordered, zero).ledger.at(0);
    assert(close(ly.accounts[0].end_balance, 40000.0));
    assert(close(ly.accounts[1].end_balance, 50000.0));

    // Split by balance: equal balances share the need equally
    ScenarioInput prop = strategy_scenario(10000.0);
    prop.withdrawal.strategy = WithdrawalStrategy::Proportional;
    ly = simulate(prop, zero).ledger.at(0);
    assert(close(ly.accounts[0].end_balance, 45000.0));
    assert(close(ly.accounts[1].end_balance, 45000.0));
    assert(close(ly.ordinary_income, 5000.0));

    prop.accounts[0].balance = prop.accounts[0].cost_basis = 30000.0;
    ly = simulate(prop, zero).ledger.at(0);
    assert(close(ly.accounts[0].end_balance, 30000.0 - 3750.0));
    assert(close(ly.accounts[1].end_balance, 50000.0 - 6250.0));

    // Tax-deferred first up to the limit, then the priority order
    ScenarioInput bracket = strategy_scenario(20000.0);
    bracket.withdrawal.strategy = WithdrawalStrategy::BracketLimited;
    bracket.withdrawal.pre_tax_limit = 10000.0;
    ly = simulate(bracket, zero).ledger.at(0);
    assert(close(ly.accounts[0].end_balance, 40000.0));
    assert(close(ly.accounts[1].end_balance, 40000.0));

    // The RMD uses part of the limit
    bracket.people[0].birth_year = 1950;
    ly = simulate(bracket, zero).ledger.at(0);
    assert(close(ly.rmd_taken, 50000.0 / 24.6));
    assert(close(ly.accounts[1].end_balance, 40000.0));
    assert(close(ly.accounts[0].end_balance, 40000.0));

    // Above the limit tax-deferred money is still used before the plan fails
    ScenarioInput last = strategy_scenario(20000.0);
    last.accounts[0].balance = last.accounts[0].cost_basis = 5000.0;
    last.withdrawal.strategy = WithdrawalStrategy::BracketLimited;
    PathOutcome out = simulate(last, zero);
    assert(out.success);
    assert(close(out.ledger[0].accounts[0].end_balance, 0.0));
    assert(close(out.ledger[0].accounts[1].end_balance, 35000.0));
}

static void test_bracket_fill_with_spending_draws(const TaxTable& real) {
    std::cout << "Testing bracket fill alongside tax-deferred spending..." << std::endl;
    ScenarioInput s = base(2024, 2024);
    s.people[0].birth_year = 1960;
    s.accounts.push_back(account("IRA", AccountType::TaxDeferred, 500000.0));
    s.accounts.push_back(account("Roth", AccountType::Roth, 0.0));
    s.spending.annual = 20000.0;
    s.roth.kind = ConversionKind::BracketFill;
    s.roth.annual_cap = 100000.0;
    s.roth.target_rate = 0.12;
    s.roth.start_year = 2024;
    s.roth.end_year = 2024;

    // The $20k spending draw already sits in the bracket
    const LedgerYear ly = simulate(s, real).ledger.at(0);
    assert(close(ly.conversion, 47150.0 + 14600.0 - 20000.0));
    assert(ly.accounts[0].withdrawal >= 20000.0);
}

int main() {
    std::cout << "Testing LedgerSimulator..." << std::endl;
    TaxTable zero = TaxTable::flat(2020, 0.0);
    TaxTable flat10 = TaxTable::flat(2020, 0.10);
    TaxTable real = JsonLoader::load_tax_table(std::string(GLIDEPATH_DATA_DIR) + "/tax_tables.json");

    test_depletion(zero, real);
    test_hand_computed_taxable(flat10);
    test_rmds(zero);
    test_conversion_caps(zero);
    test_conversion_funding(flat10);
    test_bracket_fill(real);
    test_cash_flows(zero);
    test_cash_holding(zero);
    test_withdrawal_strategies(zero);
    test_bracket_fill_with_spending_draws(real);

    std::cout << "SUCCESS: LedgerSimulator verified." << std::endl;
    return 0;
}
