#pragma once
#include <vector>

namespace Glidepath {

// One account in one simulated year. conversion_in is net of any tax
// withheld from the conversion.
struct AccountYear {
    double start_balance = 0.0;
    double sampled_return = 0.0;
    double growth = 0.0;
    double rmd_required = 0.0;
    double rmd_taken = 0.0;
    double conversion_out = 0.0;
    double conversion_in = 0.0;
    double withdrawal = 0.0;      // Spending and tax-funding draws
    double realized_gain = 0.0;
    double tax_paid = 0.0;        // Part of withdrawal used for tax, plus withholding
    double contribution = 0.0;
    double end_balance = 0.0;
};

struct LedgerYear {
    int year = 0;
    int age = 0;   // Primary person
    std::vector<AccountYear> accounts;

    double social_security = 0.0;
    double other_income = 0.0;
    double spending = 0.0;
    double rmd_required = 0.0;
    double rmd_taken = 0.0;
    double conversion = 0.0;
    double conversion_tax = 0.0;
    double ordinary_income = 0.0;
    double capital_gains = 0.0;
    double federal_tax = 0.0;
    double state_tax = 0.0;
    double total_tax = 0.0;
    double surplus = 0.0;
    double shortfall = 0.0;
    double cash = 0.0;        // Held outside the accounts when there is no taxable account
    double net_worth = 0.0;

    double income() const { return social_security + other_income; }
};

struct PathOutcome {
    int path_index = 0;
    bool success = true;
    int failure_year = 0;   // 0 when successful
    double terminal_net_worth = 0.0;
    double lifetime_tax = 0.0;
    std::vector<LedgerYear> ledger;
};

}
