#include "Scenario.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>

namespace Glidepath {

const char* to_string(AccountType t) {
    switch (t) {
        case AccountType::Taxable:     return "taxable";
        case AccountType::TaxDeferred: return "tax_deferred";
        case AccountType::Roth:        return "roth";
    }
    return "taxable";
}

const char* to_string(CorrelationMode m) {
    return m == CorrelationMode::Full ? "full" : "independent";
}

const char* to_string(ConversionKind k) {
    switch (k) {
        case ConversionKind::None:        return "none";
        case ConversionKind::FixedCap:    return "fixed_cap";
        case ConversionKind::BracketFill: return "bracket_fill";
    }
    return "none";
}

const char* to_string(ConversionFunding f) {
    return f == ConversionFunding::Taxable ? "taxable" : "converted_amount";
}

const char* to_string(WithdrawalStrategy w) {
    switch (w) {
        case WithdrawalStrategy::Ordered:        return "ordered";
        case WithdrawalStrategy::Proportional:   return "proportional";
        case WithdrawalStrategy::BracketLimited: return "bracket_limited";
    }
    return "ordered";
}

double SpendingSchedule::amount_in(int year, int start_year) const {
    double total = annual * std::pow(1.0 + inflation, year - start_year);
    for (const auto& item : items) {
        if (item.year == year) total += item.amount;
    }
    return total;
}

namespace {

bool finite_nonneg(double x) { return std::isfinite(x) && x >= 0.0; }
bool finite_rate(double x) { return std::isfinite(x) && x > -1.0; }

std::string at(const char* list, std::size_t i, const char* field) {
    return std::string(list) + "[" + std::to_string(i) + "]." + field;
}

} // namespace

void ScenarioInput::validate_or_throw() const {
    auto fail = [this](const std::string& field, const std::string& reason) {
        throw ValidationError(id, field, reason);
    };

    if (id.empty()) throw ValidationError("scenario id must not be empty");
    if (start_year < 1900 || start_year > 2200) fail("start_year", "outside [1900, 2200]");
    if (end_year < start_year) fail("end_year", "must not precede start_year");
    if (end_year > 2200) fail("end_year", "outside [1900, 2200]");

    // 1. People
    if (people.empty() || people.size() > 2) fail("people", "expected one or two people");
    for (std::size_t i = 0; i < people.size(); ++i) {
        const Person& p = people[i];
        if (p.birth_year < 1900 || p.birth_year > 2100) fail(at("people", i, "birth_year"), "outside [1900, 2100]");
        if (!finite_nonneg(p.pia)) fail(at("people", i, "pia"), "must be a finite amount >= 0");
        if (p.claiming_age < 62 || p.claiming_age > 70) fail(at("people", i, "claiming_age"), "must lie in [62, 70]");
        if (p.death_age < 0) fail(at("people", i, "death_age"), "must be >= 0");
    }

    // 2. Accounts
    for (std::size_t i = 0; i < accounts.size(); ++i) {
        const Account& a = accounts[i];
        if (!finite_nonneg(a.balance)) fail(at("accounts", i, "balance"), "must be a finite amount >= 0");
        if (!finite_nonneg(a.cost_basis)) fail(at("accounts", i, "cost_basis"), "must be a finite amount >= 0");
        if (!finite_rate(a.mean_return)) fail(at("accounts", i, "mean_return"), "must be finite and > -1");
        if (!finite_nonneg(a.volatility)) fail(at("accounts", i, "volatility"), "must be finite and >= 0");
        if (a.owner < 0 || a.owner >= static_cast<int>(people.size())) fail(at("accounts", i, "owner"), "not a valid person index");
    }

    // 3. Cash flows
    if (!finite_nonneg(spending.annual)) fail("spending.annual", "must be a finite amount >= 0");
    if (!finite_rate(spending.inflation)) fail("spending.inflation", "must be finite and > -1");
    for (std::size_t i = 0; i < spending.items.size(); ++i) {
        if (!finite_nonneg(spending.items[i].amount)) fail(at("spending.items", i, "amount"), "must be a finite amount >= 0");
    }
    for (std::size_t i = 0; i < contributions.size(); ++i) {
        const Contribution& c = contributions[i];
        if (c.account < 0 || c.account >= static_cast<int>(accounts.size())) fail(at("contributions", i, "account"), "not a valid account index");
        if (!finite_nonneg(c.amount)) fail(at("contributions", i, "amount"), "must be a finite amount >= 0");
        if (c.end_year < c.start_year) fail(at("contributions", i, "end_year"), "must not precede start_year");
    }
    for (std::size_t i = 0; i < income.size(); ++i) {
        const IncomeStream& s = income[i];
        if (!finite_nonneg(s.amount)) fail(at("income", i, "amount"), "must be a finite amount >= 0");
        if (!finite_rate(s.growth)) fail(at("income", i, "growth"), "must be finite and > -1");
        if (s.end_year < s.start_year) fail(at("income", i, "end_year"), "must not precede start_year");
    }

    // 4. Tax and withdrawal policy
    if (filing_status.empty()) fail("filing_status", "must not be empty");
    if (withdrawal_order.size() != 3) fail("withdrawal_order", "must list each account type exactly once");
    for (AccountType t : {AccountType::Taxable, AccountType::TaxDeferred, AccountType::Roth}) {
        if (std::count(withdrawal_order.begin(), withdrawal_order.end(), t) != 1) {
            fail("withdrawal_order", std::string("account type '") + to_string(t) + "' must appear exactly once");
        }
    }

    if (!finite_nonneg(withdrawal.pre_tax_limit)) fail("withdrawal.pre_tax_limit", "must be a finite amount >= 0");

    if (!finite_nonneg(roth.annual_cap)) fail("roth.annual_cap", "must be a finite amount >= 0");
    if (roth.kind != ConversionKind::None && roth.end_year < roth.start_year) fail("roth.end_year", "must not precede start_year");
    if (!(roth.target_rate >= 0.0 && roth.target_rate <= 1.0)) fail("roth.target_rate", "must lie in [0, 1]");

    if (!finite_rate(assumptions.cola)) fail("assumptions.cola", "must be finite and > -1");
    if (!(assumptions.ss_taxable_fraction >= 0.0 && assumptions.ss_taxable_fraction <= 1.0)) {
        fail("assumptions.ss_taxable_fraction", "must lie in [0, 1]");
    }
    if (!finite_rate(assumptions.bracket_indexation)) fail("assumptions.bracket_indexation", "must be finite and > -1");
}

// --- Field-for-field equality (used by the persistence round trip) ---

bool operator==(const Person& a, const Person& b) {
    return a.name == b.name && a.birth_year == b.birth_year && a.pia == b.pia &&
           a.claiming_age == b.claiming_age && a.death_age == b.death_age;
}

bool operator==(const Account& a, const Account& b) {
    return a.name == b.name && a.type == b.type && a.balance == b.balance &&
           a.cost_basis == b.cost_basis && a.mean_return == b.mean_return &&
           a.volatility == b.volatility && a.owner == b.owner;
}

bool operator==(const SpendingItem& a, const SpendingItem& b) {
    return a.year == b.year && a.amount == b.amount;
}

bool operator==(const SpendingSchedule& a, const SpendingSchedule& b) {
    return a.annual == b.annual && a.inflation == b.inflation && a.items == b.items;
}

bool operator==(const Contribution& a, const Contribution& b) {
    return a.account == b.account && a.start_year == b.start_year &&
           a.end_year == b.end_year && a.amount == b.amount;
}

bool operator==(const IncomeStream& a, const IncomeStream& b) {
    return a.name == b.name && a.start_year == b.start_year && a.end_year == b.end_year &&
           a.amount == b.amount && a.growth == b.growth && a.taxable == b.taxable;
}

bool operator==(const RothPolicy& a, const RothPolicy& b) {
    return a.kind == b.kind && a.annual_cap == b.annual_cap && a.start_year == b.start_year &&
           a.end_year == b.end_year && a.target_rate == b.target_rate && a.funding == b.funding;
}

bool operator==(const WithdrawalPolicy& a, const WithdrawalPolicy& b) {
    return a.strategy == b.strategy && a.pre_tax_limit == b.pre_tax_limit;
}

bool operator==(const Assumptions& a, const Assumptions& b) {
    return a.cola == b.cola && a.ss_taxable_fraction == b.ss_taxable_fraction &&
           a.bracket_indexation == b.bracket_indexation && a.correlation == b.correlation;
}

bool operator==(const ScenarioInput& a, const ScenarioInput& b) {
    return a.id == b.id && a.start_year == b.start_year && a.end_year == b.end_year &&
           a.people == b.people && a.accounts == b.accounts && a.spending == b.spending &&
           a.contributions == b.contributions && a.income == b.income &&
           a.filing_status == b.filing_status && a.state == b.state &&
           a.withdrawal_order == b.withdrawal_order && a.withdrawal == b.withdrawal && a.roth == b.roth &&
           a.assumptions == b.assumptions;
}

} // namespace Glidepath
