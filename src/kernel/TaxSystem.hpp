#pragma once
#include <limits>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace Glidepath {

struct Bracket {
    double lower = 0.0;  // Lower bound of the income slice
    double rate = 0.0;   // Marginal rate applied inside the slice
};

// Ordered (lower bound, rate) pairs starting at 0 with strictly increasing bounds.
struct BracketSchedule {
    std::vector<Bracket> brackets;

    // Tax on the income slice [from, to), thresholds scaled by `scale`.
    // Each bracket's rate applies only to its overlap with the slice.
    double tax_on_slice(double from, double to, double scale = 1.0) const;

    double tax_on(double income, double scale = 1.0) const {
        return tax_on_slice(0.0, income, scale);
    }

    double marginal_rate(double income, double scale = 1.0) const;

    // Upper bound of the highest bracket taxed at <= rate (+inf if it is the top bracket)
    double ceiling_for_rate(double rate, double scale = 1.0) const;

    void validate_or_throw(const std::string& where) const;
};

struct FederalSchedule {
    double standard_deduction = 0.0;
    BracketSchedule ordinary;
    BracketSchedule capital_gains;   // 0/15/20, stacked on ordinary income
};

struct StateSchedule {
    double standard_deduction = 0.0;
    BracketSchedule brackets;        // Flat = one bracket at 0
    bool includes_capital_gains = false;
};

// Tax year -> filing status -> schedule. Read-only once built; shared by
// reference across every path of a run.
class TaxTable {
public:
    static constexpr const char* kAllStatuses = "*";

    using FederalMap = std::map<int, std::map<std::string, FederalSchedule>>;
    using StateMap = std::map<int, std::map<std::string, std::map<std::string, StateSchedule>>>;

    // Both adders validate the schedule and throw DataError when malformed
    void add_federal(int year, const std::string& filing_status, const FederalSchedule& schedule);
    void add_state(int year, const std::string& state, const std::string& filing_status, const StateSchedule& schedule);

    // Latest table year <= year carrying the filing status. DataError if none.
    int federal_year(int year, const std::string& filing_status) const;
    int state_year(int year, const std::string& state) const;

    const FederalSchedule& federal(int year, const std::string& filing_status) const;
    const StateSchedule& state(int year, const std::string& state, const std::string& filing_status) const;

    bool empty() const { return federal_.empty(); }
    const FederalMap& federal_tables() const { return federal_; }
    const StateMap& state_tables() const { return state_; }

    // Single-status table with one flat rate on ordinary income and gains.
    static TaxTable flat(int year, double rate, const std::string& filing_status = "single");

private:
    FederalMap federal_;
    StateMap state_;
};

struct TaxResult {
    double federal_ordinary = 0.0;
    double federal_capital_gains = 0.0;
    double federal = 0.0;
    double state = 0.0;

    double total() const { return federal + state; }
};

// Table-driven progressive tax. Thresholds and deductions are indexed from the
// table year to the tax year at `indexation` per year.
class TaxEngine {
    const TaxTable& table;
    std::string state;
    double indexation;

public:
    TaxEngine(const TaxTable& t, std::string state_code = "", double indexation_rate = 0.0)
        : table(t), state(std::move(state_code)), indexation(indexation_rate) {}

    TaxResult tax(double ordinary_income, double capital_gains,
                  const std::string& filing_status, int tax_year) const;

    double marginal_ordinary_rate(double ordinary_income, const std::string& filing_status, int tax_year) const;

    // Gross ordinary income (deduction included) at which the highest bracket
    // taxed at <= rate ends
    double bracket_ceiling(double rate, const std::string& filing_status, int tax_year) const;

    // Throws DataError when the table cannot serve this status / state from `year` on
    void check_available(const std::string& filing_status, int year) const;

private:
    double scale_for(int table_year, int tax_year) const;
};

} // namespace Glidepath
