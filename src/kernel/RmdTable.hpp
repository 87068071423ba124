#ifndef GLIDEPATH_RMD_TABLE_H
#define GLIDEPATH_RMD_TABLE_H

#include <map>

namespace Glidepath {

// Required minimum distributions for tax-deferred accounts.
// Divisors come from the IRS Uniform Lifetime table (2022 revision) unless a
// custom table is supplied. Start age follows the SECURE 2.0 schedule.
class RmdTable {
public:
    RmdTable();

    // Ages must be contiguous and divisors positive; DataError otherwise
    explicit RmdTable(const std::map<int, double>& divisors);

    static int start_age(int birth_year);

    // Distribution period for the attained age in the distribution year.
    // Ages past the end of the table reuse the last divisor.
    double divisor(int age) const;

    // prior_year_end_balance / divisor(age), or 0 before the start age
    double required_minimum(int age, double prior_year_end_balance, int birth_year) const;

    int first_age() const { return divisors_.begin()->first; }
    int last_age() const { return divisors_.rbegin()->first; }

private:
    std::map<int, double> divisors_;

    static std::map<int, double> uniform_lifetime();
    void validate_or_throw() const;
};

} // namespace Glidepath

#endif // GLIDEPATH_RMD_TABLE_H
