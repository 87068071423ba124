#pragma once
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>
#include "../Errors.hpp"
#include "../Scenario.hpp"

namespace Glidepath {

// Social Security retirement benefit from PIA and claiming age.
//
// Early claiming reduces the benefit by 5/9 of 1% per month for the first 36
// months before FRA and 5/12 of 1% per month beyond that. Delayed claiming
// earns 2/3 of 1% per month after FRA, up to age 70.
struct SocialSecurityCalculator {
    static constexpr int kEarliestClaimMonths = 62 * 12;
    static constexpr int kLatestClaimMonths = 70 * 12;

    // FRA in months (SSA schedule by birth year)
    static int full_retirement_age_months(int birth_year) {
        if (birth_year <= 1937) return 65 * 12;
        if (birth_year <= 1942) return 65 * 12 + 2 * (birth_year - 1937);
        if (birth_year <= 1954) return 66 * 12;
        if (birth_year <= 1959) return 66 * 12 + 2 * (birth_year - 1954);
        return 67 * 12;
    }

    // Multiplier applied to PIA when claiming `months_from_fra` months after
    // FRA (negative = early)
    static double adjustment_factor(int months_from_fra) {
        if (months_from_fra < 0) {
            int early = -months_from_fra;
            int first = std::min(early, 36);
            int beyond = early - first;
            return 1.0 - first * (5.0 / 9.0) / 100.0 - beyond * (5.0 / 12.0) / 100.0;
        }
        return 1.0 + months_from_fra * (2.0 / 3.0) / 100.0;
    }

    // Annual benefit for a monthly PIA, ages in months
    static double annual_benefit_months(double pia, int claiming_age_months, int fra_months) {
        if (claiming_age_months < kEarliestClaimMonths || claiming_age_months > kLatestClaimMonths) {
            throw ValidationError("claiming age " + std::to_string(claiming_age_months / 12.0) +
                                  " outside [62, 70]");
        }
        if (pia < 0.0) throw ValidationError("PIA must be >= 0");
        return 12.0 * pia * adjustment_factor(claiming_age_months - fra_months);
    }

    static double annual_benefit(double pia, int claiming_age, int full_retirement_age) {
        return annual_benefit_months(pia, claiming_age * 12, full_retirement_age * 12);
    }

    static double annual_benefit(const Person& p) {
        return annual_benefit_months(p.pia, p.claiming_age * 12, full_retirement_age_months(p.birth_year));
    }

    // Survivor receives the greater of the two individually computed benefits
    static double survivor_benefit(double own_benefit, double deceased_benefit) {
        return std::max(own_benefit, deceased_benefit);
    }
};

// Household benefit stream for the people of one scenario. Benefits are frozen
// at claiming and adjusted by COLA from the scenario start year.
class HouseholdBenefits {
    const std::vector<Person>& people;
    std::vector<double> base;
    int start_year;
    double cola;

public:
    HouseholdBenefits(const std::vector<Person>& ppl, int plan_start_year, double cola_rate)
        : people(ppl), start_year(plan_start_year), cola(cola_rate) {
        base.reserve(people.size());
        for (const auto& p : people) base.push_back(SocialSecurityCalculator::annual_benefit(p));
    }

    double base_benefit(std::size_t i) const { return base[i]; }

    double benefit_in(int year) const {
        double total = 0.0;
        std::size_t alive = 0;
        for (const auto& p : people) alive += p.alive_in(year) ? 1 : 0;

        if (alive == people.size()) {
            for (std::size_t i = 0; i < people.size(); ++i) {
                if (claimed(i, year)) total += base[i];
            }
        } else if (alive == 1 && people.size() == 2) {
            std::size_t s = people[0].alive_in(year) ? 0 : 1;
            if (claimed(s, year)) {
                total = SocialSecurityCalculator::survivor_benefit(base[s], base[1 - s]);
            }
        }
        return total * std::pow(1.0 + cola, year - start_year);
    }

private:
    bool claimed(std::size_t i, int year) const {
        return people[i].age_in(year) >= people[i].claiming_age;
    }
};

} // namespace Glidepath
