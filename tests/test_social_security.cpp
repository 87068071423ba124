#undef NDEBUG
#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>
#include "Errors.hpp"
#include "Scenario.hpp"
#include "kernel/SocialSecurity.hpp"

using namespace Glidepath;

static bool close(double a, double b, double tol = 1e-6) { return std::abs(a - b) <= tol; }

static Person person(int birth_year, double pia, int claiming_age, int death_age = 0) {
    Person p;
    p.birth_year = birth_year;
    p.pia = pia;
    p.claiming_age = claiming_age;
    p.death_age = death_age;
    return p;
}

int main() {
    std::cout << "Testing SocialSecurityCalculator..." << std::endl;
    using SS = SocialSecurityCalculator;

    assert(SS::full_retirement_age_months(1937) == 65 * 12);
    assert(SS::full_retirement_age_months(1940) == 65 * 12 + 6);
    assert(SS::full_retirement_age_months(1943) == 66 * 12);
    assert(SS::full_retirement_age_months(1955) == 66 * 12 + 2);
    assert(SS::full_retirement_age_months(1959) == 66 * 12 + 10);
    assert(SS::full_retirement_age_months(1960) == 67 * 12);

    // PIA $2,000 at FRA 67
    double at62 = SS::annual_benefit(2000.0, 62, 67);
    double at70 = SS::annual_benefit(2000.0, 70, 67);
    std::cout << "Claim 62: " << at62 << ", claim 70: " << at70 << std::endl;
    assert(close(at62, 16800.0));
    assert(close(at70, 29760.0));
    assert(close(SS::annual_benefit(2000.0, 67, 67), 24000.0));
    assert(close(SS::adjustment_factor(-36), 0.80));

    bool threw = false;
    try {
        SS::annual_benefit(2000.0, 61, 67);
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        SS::annual_benefit(2000.0, 71, 67);
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "Testing HouseholdBenefits..." << std::endl;
    std::vector<Person> couple = {person(1960, 2000.0, 67, 80), person(1960, 1000.0, 67)};
    HouseholdBenefits hh(couple, 2025, 0.0);
    assert(close(hh.base_benefit(0), 24000.0));
    assert(close(hh.benefit_in(2026), 0.0));
    assert(close(hh.benefit_in(2027), 36000.0));
    // First person is not alive in the year they turn 80
    assert(close(hh.benefit_in(2039), 36000.0));
    assert(close(hh.benefit_in(2040), 24000.0));

    HouseholdBenefits cola(couple, 2025, 0.02);
    assert(close(cola.benefit_in(2028), 36000.0 * std::pow(1.02, 3)));

    // Survivor collects only once they reach their own claiming age
    std::vector<Person> late = {person(1960, 2000.0, 67, 68), person(1960, 1000.0, 70)};
    HouseholdBenefits widowed(late, 2025, 0.0);
    assert(close(widowed.benefit_in(2027), 24000.0));
    assert(close(widowed.benefit_in(2028), 0.0));
    assert(close(widowed.benefit_in(2030), 24000.0));

    std::vector<Person> alone = {person(1958, 1500.0, 62, 75)};
    HouseholdBenefits solo(alone, 2020, 0.0);
    assert(solo.benefit_in(2020) > 0.0);
    assert(close(solo.benefit_in(2033), 0.0));

    std::cout << "SUCCESS: Social Security verified." << std::endl;
    return 0;
}
