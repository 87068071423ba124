#include "RmdTable.hpp"
#include "../Errors.hpp"
#include <cmath>
#include <string>

namespace Glidepath {

RmdTable::RmdTable() : divisors_(uniform_lifetime()) {}

RmdTable::RmdTable(const std::map<int, double>& divisors) : divisors_(divisors) {
    validate_or_throw();
}

std::map<int, double> RmdTable::uniform_lifetime() {
    return {
        {72, 27.4}, {73, 26.5}, {74, 25.5}, {75, 24.6}, {76, 23.7},
        {77, 22.9}, {78, 22.0}, {79, 21.1}, {80, 20.2}, {81, 19.4},
        {82, 18.5}, {83, 17.7}, {84, 16.8}, {85, 16.0}, {86, 15.2},
        {87, 14.4}, {88, 13.7}, {89, 12.9}, {90, 12.2}, {91, 11.5},
        {92, 10.8}, {93, 10.1}, {94, 9.5},  {95, 8.9},  {96, 8.4},
        {97, 7.8},  {98, 7.3},  {99, 6.8},  {100, 6.4}, {101, 6.0},
        {102, 5.6}, {103, 5.2}, {104, 4.9}, {105, 4.6}, {106, 4.3},
        {107, 4.1}, {108, 3.9}, {109, 3.7}, {110, 3.5}, {111, 3.4},
        {112, 3.3}, {113, 3.1}, {114, 3.0}, {115, 2.9}, {116, 2.8},
        {117, 2.7}, {118, 2.5}, {119, 2.3}, {120, 2.0},
    };
}

void RmdTable::validate_or_throw() const {
    if (divisors_.empty()) throw DataError("RMD table is empty");
    int expected = divisors_.begin()->first;
    for (const auto& [age, d] : divisors_) {
        if (age != expected) throw DataError("RMD table has a gap at age " + std::to_string(expected));
        if (!std::isfinite(d) || d <= 0.0) {
            throw DataError("RMD divisor for age " + std::to_string(age) + " must be positive");
        }
        ++expected;
    }
}

int RmdTable::start_age(int birth_year) {
    if (birth_year <= 1950) return 72;
    if (birth_year <= 1959) return 73;
    return 75;
}

double RmdTable::divisor(int age) const {
    if (age > last_age()) return divisors_.rbegin()->second;
    auto it = divisors_.find(age);
    if (it == divisors_.end()) {
        throw DataError("no RMD divisor for age " + std::to_string(age));
    }
    return it->second;
}

double RmdTable::required_minimum(int age, double prior_year_end_balance, int birth_year) const {
    if (age < start_age(birth_year)) return 0.0;
    if (prior_year_end_balance <= 0.0) return 0.0;
    return prior_year_end_balance / divisor(age);
}

} // namespace Glidepath
