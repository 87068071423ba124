#include "TaxSystem.hpp"
#include "../Errors.hpp"
#include <algorithm>
#include <cmath>

namespace Glidepath {

// ---------------------------------------------------------------------------
// BracketSchedule
// ---------------------------------------------------------------------------

double BracketSchedule::tax_on_slice(double from, double to, double scale) const {
    if (to <= from) return 0.0;
    const double inf = std::numeric_limits<double>::infinity();
    double tax = 0.0;
    const std::size_t n = brackets.size();
    for (std::size_t i = 0; i < n; ++i) {
        double lo = brackets[i].lower * scale;
        double hi = (i + 1 < n) ? brackets[i + 1].lower * scale : inf;
        if (hi <= from) continue;
        if (lo >= to) break;
        double overlap = std::min(to, hi) - std::max(from, lo);
        if (overlap > 0.0) tax += overlap * brackets[i].rate;
    }
    return tax;
}

double BracketSchedule::marginal_rate(double income, double scale) const {
    double rate = 0.0;
    for (const auto& b : brackets) {
        if (income >= b.lower * scale) rate = b.rate;
        else break;
    }
    return rate;
}

double BracketSchedule::ceiling_for_rate(double rate, double scale) const {
    double ceiling = 0.0;
    const std::size_t n = brackets.size();
    for (std::size_t i = 0; i < n; ++i) {
        if (brackets[i].rate > rate) break;
        if (i + 1 == n) return std::numeric_limits<double>::infinity();
        ceiling = brackets[i + 1].lower * scale;
    }
    return ceiling;
}

void BracketSchedule::validate_or_throw(const std::string& where) const {
    if (brackets.empty()) throw DataError(where + ": bracket list is empty");
    if (brackets.front().lower != 0.0) throw DataError(where + ": first lower bound must be 0");
    for (std::size_t i = 0; i < brackets.size(); ++i) {
        const Bracket& b = brackets[i];
        if (!std::isfinite(b.lower)) throw DataError(where + ": non-finite lower bound");
        if (!(b.rate >= 0.0 && b.rate <= 1.0)) {
            throw DataError(where + ": rate " + std::to_string(b.rate) + " outside [0, 1]");
        }
        if (i > 0 && !(b.lower > brackets[i - 1].lower)) {
            throw DataError(where + ": lower bounds must strictly increase (bracket " + std::to_string(i) + ")");
        }
    }
}

// ---------------------------------------------------------------------------
// TaxTable
// ---------------------------------------------------------------------------

namespace {

std::string key(int year, const std::string& a, const std::string& b = "") {
    std::string k = std::to_string(year) + "/" + a;
    if (!b.empty()) k += "/" + b;
    return k;
}

void check_deduction(double d, const std::string& where) {
    if (!std::isfinite(d) || d < 0.0) throw DataError(where + ": standard_deduction must be a finite amount >= 0");
}

} // namespace

void TaxTable::add_federal(int year, const std::string& filing_status, const FederalSchedule& schedule) {
    const std::string where = "federal " + key(year, filing_status);
    check_deduction(schedule.standard_deduction, where);
    schedule.ordinary.validate_or_throw(where + " ordinary");
    schedule.capital_gains.validate_or_throw(where + " capital_gains");
    federal_[year][filing_status] = schedule;
}

void TaxTable::add_state(int year, const std::string& state, const std::string& filing_status,
                         const StateSchedule& schedule) {
    const std::string status = filing_status.empty() ? std::string(kAllStatuses) : filing_status;
    const std::string where = "state " + key(year, state, status);
    check_deduction(schedule.standard_deduction, where);
    schedule.brackets.validate_or_throw(where);
    state_[year][state][status] = schedule;
}

int TaxTable::federal_year(int year, const std::string& filing_status) const {
    for (auto it = federal_.upper_bound(year); it != federal_.begin();) {
        --it;
        if (it->second.count(filing_status)) return it->first;
    }
    throw DataError("no federal table for filing status '" + filing_status +
                    "' in or before tax year " + std::to_string(year));
}

int TaxTable::state_year(int year, const std::string& state) const {
    for (auto it = state_.upper_bound(year); it != state_.begin();) {
        --it;
        if (it->second.count(state)) return it->first;
    }
    throw DataError("no state table for '" + state + "' in or before tax year " + std::to_string(year));
}

const FederalSchedule& TaxTable::federal(int year, const std::string& filing_status) const {
    auto y = federal_.find(year);
    if (y != federal_.end()) {
        auto s = y->second.find(filing_status);
        if (s != y->second.end()) return s->second;
    }
    throw DataError("missing federal table " + key(year, filing_status));
}

const StateSchedule& TaxTable::state(int year, const std::string& state,
                                     const std::string& filing_status) const {
    auto y = state_.find(year);
    if (y != state_.end()) {
        auto st = y->second.find(state);
        if (st != y->second.end()) {
            auto s = st->second.find(filing_status);
            if (s != st->second.end()) return s->second;
            s = st->second.find(kAllStatuses);
            if (s != st->second.end()) return s->second;
        }
    }
    throw DataError("missing state table " + key(year, state, filing_status));
}

TaxTable TaxTable::flat(int year, double rate, const std::string& filing_status) {
    FederalSchedule s;
    s.ordinary.brackets = {{0.0, rate}};
    s.capital_gains.brackets = {{0.0, rate}};
    TaxTable t;
    t.add_federal(year, filing_status, s);
    return t;
}

// ---------------------------------------------------------------------------
// TaxEngine
// ---------------------------------------------------------------------------

double TaxEngine::scale_for(int table_year, int tax_year) const {
    if (indexation == 0.0 || tax_year <= table_year) return 1.0;
    return std::pow(1.0 + indexation, tax_year - table_year);
}

TaxResult TaxEngine::tax(double ordinary_income, double capital_gains,
                         const std::string& filing_status, int tax_year) const {
    if (!(ordinary_income >= 0.0)) throw DataError("ordinary income must be >= 0, got " + std::to_string(ordinary_income));
    if (!(capital_gains >= 0.0)) throw DataError("capital gains must be >= 0, got " + std::to_string(capital_gains));

    TaxResult r;

    // 1. Federal: deduction first hits ordinary income, the rest shelters gains
    int fy = table.federal_year(tax_year, filing_status);
    const FederalSchedule& fed = table.federal(fy, filing_status);
    double scale = scale_for(fy, tax_year);
    double deduction = fed.standard_deduction * scale;

    double taxable_ordinary = std::max(0.0, ordinary_income - deduction);
    double unused_deduction = std::max(0.0, deduction - ordinary_income);
    double taxable_gains = std::max(0.0, capital_gains - unused_deduction);

    r.federal_ordinary = fed.ordinary.tax_on(taxable_ordinary, scale);
    // Gains stack on top of ordinary income
    r.federal_capital_gains = fed.capital_gains.tax_on_slice(
        taxable_ordinary, taxable_ordinary + taxable_gains, scale);
    r.federal = r.federal_ordinary + r.federal_capital_gains;

    // 2. State
    if (!state.empty()) {
        int sy = table.state_year(tax_year, state);
        const StateSchedule& st = table.state(sy, state, filing_status);
        double s_scale = scale_for(sy, tax_year);
        double base = ordinary_income + (st.includes_capital_gains ? capital_gains : 0.0);
        double taxable = std::max(0.0, base - st.standard_deduction * s_scale);
        r.state = st.brackets.tax_on(taxable, s_scale);
    }
    return r;
}

double TaxEngine::marginal_ordinary_rate(double ordinary_income, const std::string& filing_status,
                                         int tax_year) const {
    int fy = table.federal_year(tax_year, filing_status);
    const FederalSchedule& fed = table.federal(fy, filing_status);
    double scale = scale_for(fy, tax_year);
    double taxable = ordinary_income - fed.standard_deduction * scale;
    if (taxable < 0.0) return 0.0;
    return fed.ordinary.marginal_rate(taxable, scale);
}

double TaxEngine::bracket_ceiling(double rate, const std::string& filing_status, int tax_year) const {
    int fy = table.federal_year(tax_year, filing_status);
    const FederalSchedule& fed = table.federal(fy, filing_status);
    double scale = scale_for(fy, tax_year);
    return fed.ordinary.ceiling_for_rate(rate, scale) + fed.standard_deduction * scale;
}

void TaxEngine::check_available(const std::string& filing_status, int year) const {
    int fy = table.federal_year(year, filing_status);
    table.federal(fy, filing_status);
    if (!state.empty()) {
        int sy = table.state_year(year, state);
        table.state(sy, state, filing_status);
    }
}

} // namespace Glidepath
