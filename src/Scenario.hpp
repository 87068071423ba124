#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace Glidepath {

enum class AccountType { Taxable, TaxDeferred, Roth };
enum class CorrelationMode { Full, Independent };
enum class ConversionKind { None, FixedCap, BracketFill };
enum class ConversionFunding { Taxable, ConvertedAmount };
enum class WithdrawalStrategy { Ordered, Proportional, BracketLimited };

const char* to_string(AccountType t);
const char* to_string(CorrelationMode m);
const char* to_string(ConversionKind k);
const char* to_string(ConversionFunding f);
const char* to_string(WithdrawalStrategy w);

struct Person {
    std::string name;
    int birth_year = 1960;
    double pia = 0.0;        // Monthly PIA in start-year dollars
    int claiming_age = 67;   // Whole years, [62, 70]
    int death_age = 0;       // 0 = survives the horizon

    int age_in(int year) const { return year - birth_year; }

    // Not alive in the calendar year the death age is attained
    bool alive_in(int year) const {
        return death_age <= 0 || age_in(year) < death_age;
    }
};

struct Account {
    std::string name;
    AccountType type = AccountType::Taxable;
    double balance = 0.0;
    double cost_basis = 0.0;   // Taxable only
    double mean_return = 0.0;
    double volatility = 0.0;
    int owner = 0;             // Index into ScenarioInput::people
};

struct SpendingItem {
    int year = 0;
    double amount = 0.0;
};

struct SpendingSchedule {
    double annual = 0.0;       // Start-year dollars
    double inflation = 0.0;
    std::vector<SpendingItem> items;  // One-off, not inflated

    double amount_in(int year, int start_year) const;
};

struct Contribution {
    int account = 0;
    int start_year = 0;
    int end_year = 0;
    double amount = 0.0;

    bool active_in(int year) const { return year >= start_year && year <= end_year; }
};

// Pension, part-time wages, rental, annuity...
struct IncomeStream {
    std::string name;
    int start_year = 0;
    int end_year = 0;
    double amount = 0.0;
    double growth = 0.0;
    bool taxable = true;

    bool active_in(int year) const { return year >= start_year && year <= end_year; }
};

struct RothPolicy {
    ConversionKind kind = ConversionKind::None;
    double annual_cap = 0.0;
    int start_year = 0;
    int end_year = 0;
    double target_rate = 0.12;  // BracketFill: fill ordinary income up to this bracket
    ConversionFunding funding = ConversionFunding::Taxable;

    bool active_in(int year) const {
        return kind != ConversionKind::None && year >= start_year && year <= end_year;
    }
};

// How the spending need is split across accounts. Ordered walks
// withdrawal_order; Proportional splits between taxable and tax-deferred by
// balance; BracketLimited draws tax-deferred first, up to pre_tax_limit less
// the year's RMD. Whatever remains falls back to withdrawal_order.
struct WithdrawalPolicy {
    WithdrawalStrategy strategy = WithdrawalStrategy::Ordered;
    double pre_tax_limit = 0.0;   // BracketLimited only
};

struct Assumptions {
    double cola = 0.0;
    double ss_taxable_fraction = 0.85;
    double bracket_indexation = 0.0;
    CorrelationMode correlation = CorrelationMode::Full;
};

// Immutable for the duration of a run. Sweeps work on copies.
struct ScenarioInput {
    std::string id = "scenario";
    int start_year = 2025;
    int end_year = 2055;

    std::vector<Person> people;
    std::vector<Account> accounts;
    SpendingSchedule spending;
    std::vector<Contribution> contributions;
    std::vector<IncomeStream> income;

    std::string filing_status = "single";
    std::string state;   // Empty = no state tax

    std::vector<AccountType> withdrawal_order = {
        AccountType::Taxable, AccountType::TaxDeferred, AccountType::Roth};
    WithdrawalPolicy withdrawal;

    RothPolicy roth;
    Assumptions assumptions;

    int num_years() const { return end_year - start_year + 1; }

    // Throws ValidationError naming the offending field
    void validate_or_throw() const;
};

bool operator==(const Person& a, const Person& b);
bool operator==(const Account& a, const Account& b);
bool operator==(const SpendingItem& a, const SpendingItem& b);
bool operator==(const SpendingSchedule& a, const SpendingSchedule& b);
bool operator==(const Contribution& a, const Contribution& b);
bool operator==(const IncomeStream& a, const IncomeStream& b);
bool operator==(const RothPolicy& a, const RothPolicy& b);
bool operator==(const WithdrawalPolicy& a, const WithdrawalPolicy& b);
bool operator==(const Assumptions& a, const Assumptions& b);
bool operator==(const ScenarioInput& a, const ScenarioInput& b);

inline bool operator!=(const ScenarioInput& a, const ScenarioInput& b) { return !(a == b); }

} // namespace Glidepath
