#pragma once
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "../Scenario.hpp"
#include "../engine/engine.h"

namespace Glidepath {

// Flat CSV exports for the presentation layers. Column order is fixed.
class CsvWriter {
public:
    static std::string ledger_header() {
        return "label,year,account,type,starting_balance,contribution,return_applied,"
               "withdrawal,rmd,conversion,tax_paid,ending_balance";
    }

    // One row per (year, account). conversion is signed: negative out of a
    // tax-deferred account, positive (net of withholding) into Roth.
    static void write_ledger_rows(std::ostream& os, const std::string& label, const ScenarioInput& scenario,
                                  const std::vector<LedgerYear>& ledger) {
        for (const auto& ly : ledger) {
            for (std::size_t i = 0; i < ly.accounts.size(); ++i) {
                const AccountYear& a = ly.accounts[i];
                const Account& acc = scenario.accounts[i];
                os << escape(label) << ',' << ly.year << ',' << escape(acc.name) << ','
                   << to_string(acc.type) << ',' << num(a.start_balance) << ',' << num(a.contribution) << ','
                   << num(a.growth) << ',' << num(a.withdrawal) << ',' << num(a.rmd_taken) << ','
                   << num(a.conversion_in - a.conversion_out) << ',' << num(a.tax_paid) << ','
                   << num(a.end_balance) << '\n';
            }
        }
    }

    // Median path, or every retained path when the summary carries them
    static void write_ledger(const std::string& filepath, const ScenarioInput& scenario,
                             const SimulationSummary& summary) {
        std::ofstream f = open(filepath);
        f << ledger_header() << '\n';
        if (summary.paths.empty()) {
            write_ledger_rows(f, "median", scenario, summary.median_ledger());
        } else {
            for (const auto& p : summary.paths) {
                write_ledger_rows(f, "path_" + std::to_string(p.path_index), scenario, p.ledger);
            }
        }
        std::cout << "[Glidepath::IO] Wrote ledger to " << filepath << std::endl;
    }

    static void write_summary(std::ostream& os, const SimulationSummary& s) {
        struct Band { const char* name; const PercentileBands* bands; };
        const Band bands[] = {{"net_worth", &s.net_worth}, {"taxable", &s.taxable},
                              {"tax_deferred", &s.tax_deferred}, {"roth", &s.roth},
                              {"income", &s.income}, {"total_tax", &s.total_tax}};

        os << "year,survival,depletion";
        for (const auto& b : bands) {
            for (double level : b.bands->levels) os << ',' << b.name << "_p" << level_label(level);
        }
        os << '\n';

        for (std::size_t t = 0; t < s.years.size(); ++t) {
            double dep = s.depletion_by_year(static_cast<Eigen::Index>(t));
            os << s.years[t] << ',' << num(1.0 - dep, 4) << ',' << num(dep, 4);
            for (const auto& b : bands) {
                for (Eigen::Index k = 0; k < b.bands->values.rows(); ++k) {
                    os << ',' << num(b.bands->values(k, static_cast<Eigen::Index>(t)));
                }
            }
            os << '\n';
        }
    }

    static void write_summary(const std::string& filepath, const SimulationSummary& s) {
        std::ofstream f = open(filepath);
        write_summary(f, s);
        std::cout << "[Glidepath::IO] Wrote summary to " << filepath << std::endl;
    }

private:
    static std::ofstream open(const std::string& filepath) {
        std::ofstream f(filepath);
        if (!f.is_open()) throw std::runtime_error("Could not write CSV file: " + filepath);
        return f;
    }

    static std::string escape(const std::string& s) {
        if (s.find_first_of(",\"\n\r") == std::string::npos) return s;
        std::string out = "\"";
        for (char c : s) {
            if (c == '"') out += "\"\"";
            else out += c;
        }
        return out + "\"";
    }

    static std::string num(double x, int precision = 2) {
        if (!std::isfinite(x)) return "";
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision) << x;
        return oss.str();
    }

    static std::string level_label(double level) {
        std::ostringstream oss;
        oss << level;
        return oss.str();
    }
};

} // namespace Glidepath
