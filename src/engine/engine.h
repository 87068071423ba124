#ifndef GLIDEPATH_ENGINE_H
#define GLIDEPATH_ENGINE_H

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include "types.h"
#include "../Scenario.hpp"
#include "../aggregator/PercentileAggregator.hpp"
#include "../blocks/ConversionPolicy.hpp"
#include "../kernel/RmdTable.hpp"
#include "../kernel/TaxSystem.hpp"

namespace Glidepath {

struct RunOptions {
    std::vector<double> percentiles = {10.0, 50.0, 90.0};
    bool retain_paths = false;

    // Checked before each path; a set flag aborts the run with RunCancelled
    const std::atomic<bool>* cancel = nullptr;

    // Overrides the policy built from scenario.roth when set
    const ConversionPolicy* conversion = nullptr;

    bool verbose = true;
};

// Aggregated result of one Monte Carlo run
struct SimulationSummary {
    std::string scenario_id;
    int num_paths = 0;
    std::uint64_t seed = 0;
    std::vector<int> years;

    int successes = 0;
    double success_probability = 0.0;

    // Levels x years. Years after a path fails count as zero.
    PercentileBands net_worth;
    PercentileBands taxable;
    PercentileBands tax_deferred;
    PercentileBands roth;
    PercentileBands income;
    PercentileBands total_tax;

    Eigen::VectorXd depletion_by_year;   // Fraction failed on or before each year

    DistributionStats terminal_net_worth;
    DistributionStats lifetime_tax;

    // Path whose terminal net worth is closest to the median (lowest index on ties)
    int median_path_index = 0;
    PathOutcome median_path;

    const std::vector<LedgerYear>& median_ledger() const { return median_path.ledger; }

    std::vector<PathOutcome> paths;      // Only with RunOptions::retain_paths
};

class MonteCarloEngine {
public:
    explicit MonteCarloEngine(const TaxTable& tax_table, RmdTable rmd_table = RmdTable());

    // Throws ValidationError / DataError before any path runs, RunCancelled
    // when options.cancel is raised
    SimulationSummary run(const ScenarioInput& scenario, int num_paths, std::uint64_t seed,
                          const RunOptions& options = RunOptions()) const;

    // Single path with the same seeding as path `path_index` of run()
    PathOutcome run_path(const ScenarioInput& scenario, int path_index, std::uint64_t seed,
                         const ConversionPolicy* conversion = nullptr) const;

    const TaxTable& tax_table() const { return tax_; }
    const RmdTable& rmd_table() const { return rmd_; }

private:
    const TaxTable& tax_;
    RmdTable rmd_;

    void validate(const ScenarioInput& scenario) const;

    static SimulationSummary summarize(const ScenarioInput& scenario, std::vector<PathOutcome>& outcomes,
                                       std::uint64_t seed, const RunOptions& options);
};

} // namespace Glidepath

#endif // GLIDEPATH_ENGINE_H
