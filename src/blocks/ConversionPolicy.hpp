#pragma once
#include <algorithm>
#include <memory>
#include <string>
#include "../Scenario.hpp"
#include "../kernel/TaxSystem.hpp"

namespace Glidepath {

// State visible to a conversion policy after RMDs are taken and before
// discretionary withdrawals.
struct ConversionContext {
    int year;
    int age;
    double tax_deferred_balance;
    double ordinary_income;   // RMD, taxable fixed income, taxable SS and projected spending draws
    const std::string& filing_status;
    const TaxEngine& tax;
};

// Proposes a gross conversion amount for the year. The ledger clamps every
// proposal to min(annual cap, tax-deferred balance) and to the active window
// of settings().
class ConversionPolicy {
protected:
    RothPolicy policy;

public:
    explicit ConversionPolicy(const RothPolicy& p) : policy(p) {}
    virtual ~ConversionPolicy() = default;

    virtual double propose(const ConversionContext& ctx) const = 0;

    const RothPolicy& settings() const { return policy; }
};

class NoConversion : public ConversionPolicy {
public:
    NoConversion() : ConversionPolicy(RothPolicy{}) {}
    double propose(const ConversionContext&) const override { return 0.0; }
};

// Convert the cap every year inside the window
class FixedCapConversion : public ConversionPolicy {
public:
    explicit FixedCapConversion(const RothPolicy& p) : ConversionPolicy(p) {}

    double propose(const ConversionContext& ctx) const override {
        if (!policy.active_in(ctx.year)) return 0.0;
        return std::min(policy.annual_cap, ctx.tax_deferred_balance);
    }
};

// Fill ordinary income up to the top of the bracket taxed at target_rate,
// never beyond the cap
class BracketFillConversion : public ConversionPolicy {
public:
    explicit BracketFillConversion(const RothPolicy& p) : ConversionPolicy(p) {}

    double propose(const ConversionContext& ctx) const override {
        if (!policy.active_in(ctx.year)) return 0.0;
        double ceiling = ctx.tax.bracket_ceiling(policy.target_rate, ctx.filing_status, ctx.year);
        double room = std::max(0.0, ceiling - ctx.ordinary_income);
        return std::min({policy.annual_cap, room, ctx.tax_deferred_balance});
    }
};

inline std::unique_ptr<ConversionPolicy> make_conversion_policy(const RothPolicy& p) {
    switch (p.kind) {
        case ConversionKind::FixedCap:    return std::make_unique<FixedCapConversion>(p);
        case ConversionKind::BracketFill: return std::make_unique<BracketFillConversion>(p);
        case ConversionKind::None:        break;
    }
    return std::make_unique<NoConversion>();
}

} // namespace Glidepath
