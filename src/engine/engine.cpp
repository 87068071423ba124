#include "engine.h"
#include <chrono>
#include <cmath>
#include <exception>
#include <iostream>
#include <memory>
#include <utility>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "../Errors.hpp"
#include "../kernel/ReturnSampler.hpp"
#include "../solver/LedgerSimulator.hpp"

namespace Glidepath {

static constexpr int kRecommendedPaths = 1000;

MonteCarloEngine::MonteCarloEngine(const TaxTable& tax_table, RmdTable rmd_table)
    : tax_(tax_table), rmd_(std::move(rmd_table)) {}

void MonteCarloEngine::validate(const ScenarioInput& scenario) const {
    scenario.validate_or_throw();
    // Every plan year, so a table missing a later state or status fails here
    // rather than inside a path
    TaxEngine engine(tax_, scenario.state, scenario.assumptions.bracket_indexation);
    for (int y = scenario.start_year; y <= scenario.end_year; ++y) {
        engine.check_available(scenario.filing_status, y);
    }
}

PathOutcome MonteCarloEngine::run_path(const ScenarioInput& scenario, int path_index, std::uint64_t seed,
                                       const ConversionPolicy* conversion) const {
    validate(scenario);
    if (path_index < 0) throw ValidationError(scenario.id, "path_index", "must be >= 0");

    std::unique_ptr<ConversionPolicy> owned;
    if (!conversion) {
        owned = make_conversion_policy(scenario.roth);
        conversion = owned.get();
    }
    LedgerSimulator sim(scenario, tax_, rmd_, *conversion);
    ReturnSampler sampler(seed, static_cast<std::uint64_t>(path_index));
    return sim.simulate(sampler, path_index);
}

SimulationSummary MonteCarloEngine::run(const ScenarioInput& scenario, int num_paths, std::uint64_t seed,
                                        const RunOptions& options) const {
    validate(scenario);
    if (num_paths < 1) throw ValidationError(scenario.id, "num_paths", "must be >= 1");
    try {
        PercentileAggregator::check_levels(options.percentiles);
    } catch (const std::invalid_argument& e) {
        throw ValidationError(scenario.id, "percentiles", e.what());
    }

    if (num_paths < kRecommendedPaths && options.verbose) {
        std::cerr << "[Glidepath::MC] Warning: " << num_paths << " paths is below the recommended "
                  << kRecommendedPaths << "; percentiles will be noisy" << std::endl;
    }

    std::unique_ptr<ConversionPolicy> owned;
    const ConversionPolicy* conversion = options.conversion;
    if (!conversion) {
        owned = make_conversion_policy(scenario.roth);
        conversion = owned.get();
    }
    const LedgerSimulator sim(scenario, tax_, rmd_, *conversion);

    int threads = 1;
#ifdef _OPENMP
    threads = omp_get_max_threads();
#endif
    if (options.verbose) {
        std::cout << "[Glidepath::MC] Scenario '" << scenario.id << "': " << num_paths << " paths x "
                  << scenario.num_years() << " years, seed " << seed << ", " << threads << " threads"
                  << std::endl;
    }
    auto t0 = std::chrono::steady_clock::now();

    std::vector<PathOutcome> outcomes(num_paths);
    std::atomic<bool> stop{false};
    std::atomic<bool> cancelled{false};
    std::exception_ptr failure;

#ifdef _OPENMP
    #pragma omp parallel for schedule(dynamic, 8)
#endif
    for (int i = 0; i < num_paths; ++i) {
        if (stop.load(std::memory_order_relaxed)) continue;
        if (options.cancel && options.cancel->load(std::memory_order_relaxed)) {
            stop = true;
            cancelled = true;
            continue;
        }
        try {
            ReturnSampler sampler(seed, static_cast<std::uint64_t>(i));
            outcomes[i] = sim.simulate(sampler, i);
        } catch (...) {
            // Rethrown on the calling thread once the loop has drained
#ifdef _OPENMP
            #pragma omp critical(glidepath_run_error)
#endif
            {
                if (!failure) failure = std::current_exception();
            }
            stop = true;
        }
    }

    if (failure) std::rethrow_exception(failure);
    if (cancelled) {
        if (options.verbose) std::cout << "[Glidepath::MC] Run cancelled" << std::endl;
        throw RunCancelled("[Glidepath] run of scenario '" + scenario.id + "' cancelled");
    }

    SimulationSummary summary = summarize(scenario, outcomes, seed, options);

    if (options.verbose) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::steady_clock::now() - t0).count();
        std::cout << "[Glidepath::MC] Success probability " << summary.success_probability
                  << " (" << summary.successes << "/" << num_paths << "), median terminal net worth "
                  << summary.terminal_net_worth.at(50.0) << " [" << ms << " ms]" << std::endl;
    }
    return summary;
}

SimulationSummary MonteCarloEngine::summarize(const ScenarioInput& scenario, std::vector<PathOutcome>& outcomes,
                                              std::uint64_t seed, const RunOptions& options) {
    const int n = static_cast<int>(outcomes.size());
    const int T = scenario.num_years();

    SimulationSummary s;
    s.scenario_id = scenario.id;
    s.num_paths = n;
    s.seed = seed;
    for (int t = 0; t < T; ++t) s.years.push_back(scenario.start_year + t);

    Eigen::MatrixXd net_worth = Eigen::MatrixXd::Zero(n, T);
    Eigen::MatrixXd taxable = Eigen::MatrixXd::Zero(n, T);
    Eigen::MatrixXd tax_deferred = Eigen::MatrixXd::Zero(n, T);
    Eigen::MatrixXd roth = Eigen::MatrixXd::Zero(n, T);
    Eigen::MatrixXd income = Eigen::MatrixXd::Zero(n, T);
    Eigen::MatrixXd total_tax = Eigen::MatrixXd::Zero(n, T);
    Eigen::VectorXd failed_in = Eigen::VectorXd::Zero(T);

    std::vector<double> terminal(n), lifetime(n);

    for (int p = 0; p < n; ++p) {
        const PathOutcome& o = outcomes[p];
        if (o.success) {
            ++s.successes;
        } else {
            failed_in(o.failure_year - scenario.start_year) += 1.0;
        }
        terminal[p] = o.terminal_net_worth;
        lifetime[p] = o.lifetime_tax;

        for (const LedgerYear& ly : o.ledger) {
            int t = ly.year - scenario.start_year;
            // The failure year itself is recorded; nothing after it
            net_worth(p, t) = ly.net_worth;
            income(p, t) = ly.income();
            total_tax(p, t) = ly.total_tax;
            taxable(p, t) = ly.cash;   // Cash on hand is a taxable holding
            for (std::size_t a = 0; a < ly.accounts.size(); ++a) {
                double bal = ly.accounts[a].end_balance;
                switch (scenario.accounts[a].type) {
                    case AccountType::Taxable:     taxable(p, t) += bal; break;
                    case AccountType::TaxDeferred: tax_deferred(p, t) += bal; break;
                    case AccountType::Roth:        roth(p, t) += bal; break;
                }
            }
        }
    }

    s.success_probability = static_cast<double>(s.successes) / n;

    s.depletion_by_year = Eigen::VectorXd::Zero(T);
    double cumulative = 0.0;
    for (int t = 0; t < T; ++t) {
        cumulative += failed_in(t);
        s.depletion_by_year(t) = cumulative / n;
    }

    const auto& levels = options.percentiles;
    s.net_worth = PercentileAggregator::bands(net_worth, levels);
    s.taxable = PercentileAggregator::bands(taxable, levels);
    s.tax_deferred = PercentileAggregator::bands(tax_deferred, levels);
    s.roth = PercentileAggregator::bands(roth, levels);
    s.income = PercentileAggregator::bands(income, levels);
    s.total_tax = PercentileAggregator::bands(total_tax, levels);

    std::vector<double> stat_levels = levels;
    bool has_median = false;
    for (double l : stat_levels) has_median = has_median || l == 50.0;
    if (!has_median) stat_levels.push_back(50.0);
    s.terminal_net_worth = PercentileAggregator::stats(terminal, stat_levels);
    s.lifetime_tax = PercentileAggregator::stats(lifetime, stat_levels);

    double median = s.terminal_net_worth.at(50.0);
    int best = 0;
    for (int p = 1; p < n; ++p) {
        if (std::abs(terminal[p] - median) < std::abs(terminal[best] - median)) best = p;
    }
    s.median_path_index = best;
    s.median_path = outcomes[best];

    if (options.retain_paths) s.paths = std::move(outcomes);
    return s;
}

} // namespace Glidepath
