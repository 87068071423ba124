#undef NDEBUG
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include "Errors.hpp"
#include "io/json_loader.hpp"
#include "kernel/TaxSystem.hpp"

using namespace Glidepath;

static bool close(double a, double b, double tol = 1e-6) { return std::abs(a - b) <= tol; }

template <typename E, typename F>
static bool throws(F fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

int main() {
    std::cout << "Testing TaxEngine..." << std::endl;
    TaxTable table = JsonLoader::load_tax_table(std::string(GLIDEPATH_DATA_DIR) + "/tax_tables.json");
    TaxEngine federal(table);

    // Published examples
    TaxResult single = federal.tax(60000.0, 0.0, "single", 2024);
    std::cout << "$60k single 2024: " << single.federal << std::endl;
    assert(close(single.federal, 5216.0));
    assert(close(single.state, 0.0));
    assert(close(federal.tax(60000.0, 0.0, "married_joint", 2024).federal, 3232.0));

    // 2023 schedule: 1100 + 4047 + 313.5
    assert(close(federal.tax(60000.0, 0.0, "single", 2023).federal, 5460.5));

    // Later years fall back to the latest table
    assert(close(federal.tax(60000.0, 0.0, "single", 2031).federal, 5216.0));
    assert(table.federal_year(2031, "single") == 2024);

    // Gains fill the 0% bracket first, then 15%
    TaxResult low = federal.tax(40000.0, 20000.0, "single", 2024);
    assert(close(low.federal_capital_gains, 0.0));
    TaxResult high = federal.tax(60000.0, 20000.0, "single", 2024);
    assert(close(high.federal_ordinary, 5216.0));
    assert(close(high.federal_capital_gains, 18375.0 * 0.15));

    // Unused deduction shelters gains
    TaxResult gains_only = federal.tax(0.0, 20000.0, "single", 2024);
    assert(close(gains_only.federal, 0.0));

    // Monotone in ordinary income and in gains
    double prev = -1.0;
    for (double income = 0.0; income <= 800000.0; income += 2500.0) {
        double t = federal.tax(income, 15000.0, "single", 2024).total();
        assert(t >= prev);
        prev = t;
    }
    prev = -1.0;
    for (double gains = 0.0; gains <= 800000.0; gains += 2500.0) {
        double t = federal.tax(50000.0, gains, "head_of_household", 2024).total();
        assert(t >= prev);
        prev = t;
    }

    // Bracket queries
    assert(close(federal.marginal_ordinary_rate(60000.0, "single", 2024), 0.12));
    assert(close(federal.marginal_ordinary_rate(10000.0, "single", 2024), 0.0));
    assert(close(federal.bracket_ceiling(0.12, "single", 2024), 47150.0 + 14600.0));
    assert(std::isinf(federal.bracket_ceiling(0.37, "single", 2024)));

    // Indexed thresholds: deduction 14892, first bracket ends at 11832
    TaxEngine indexed(table, "", 0.02);
    assert(close(indexed.tax(60000.0, 0.0, "single", 2025).federal, 1183.2 + (45108.0 - 11832.0) * 0.12));

    std::cout << "Testing state tables..." << std::endl;
    TaxEngine michigan(table, "MI");
    TaxResult mi = michigan.tax(60000.0, 10000.0, "married_joint", 2024);
    assert(close(mi.state, (70000.0 - 5600.0) * 0.0425));

    TaxEngine california(table, "CA");
    TaxResult ca = california.tax(20000.0, 0.0, "single", 2024);
    assert(close(ca.state, 10756.0 * 0.01 + (20000.0 - 5540.0 - 10756.0) * 0.02));
    assert(throws<DataError>([&] { california.tax(20000.0, 0.0, "married_joint", 2024); }));

    std::cout << "Testing lookup and validation errors..." << std::endl;
    assert(throws<DataError>([&] { federal.tax(50000.0, 0.0, "single", 2020); }));
    assert(throws<DataError>([&] { federal.tax(50000.0, 0.0, "qualifying_widow", 2024); }));
    assert(throws<DataError>([&] { federal.tax(-1.0, 0.0, "single", 2024); }));
    assert(throws<DataError>([&] { federal.tax(1.0, -5.0, "single", 2024); }));
    assert(throws<DataError>([&] { TaxEngine(table, "ZZ").check_available("single", 2024); }));

    FederalSchedule bad;
    bad.ordinary.brackets = {{0.0, 0.10}, {0.0, 0.12}};
    bad.capital_gains.brackets = {{0.0, 0.0}};
    TaxTable t;
    assert(throws<DataError>([&] { t.add_federal(2024, "single", bad); }));
    bad.ordinary.brackets = {{100.0, 0.10}};
    assert(throws<DataError>([&] { t.add_federal(2024, "single", bad); }));
    bad.ordinary.brackets = {{0.0, 1.5}};
    assert(throws<DataError>([&] { t.add_federal(2024, "single", bad); }));

    auto doc = nlohmann::json::parse(R"({"2024": {"federal": {"single": {
        "ordinary": [[0, 0.1], [20000, 0.2], [10000, 0.3]]}}}})");
    assert(throws<DataError>([&] { JsonLoader::tax_table_from_json(doc); }));

    TaxTable flat = TaxTable::flat(2020, 0.10);
    assert(close(TaxEngine(flat).tax(10000.0, 5000.0, "single", 2030).total(), 1500.0));

    std::cout << "SUCCESS: TaxEngine verified." << std::endl;
    return 0;
}
