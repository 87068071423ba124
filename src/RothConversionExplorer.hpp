#pragma once
#include <Eigen/Dense>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <iostream>
#include <string>
#include <vector>
#include "Errors.hpp"
#include "Scenario.hpp"
#include "engine/engine.h"

namespace Glidepath {

// Grid of Monte Carlo runs over annual conversion caps. Each cell runs a copy
// of the scenario with the same seed, so differences between cells come from
// the cap and not from sampling.
class RothConversionExplorer {
    const MonteCarloEngine& engine;

public:
    enum Metric {
        SuccessProbability = 0,
        MedianTerminalNetWorth = 1,
        MedianLifetimeTax = 2,
        P10TerminalNetWorth = 3,
        NumMetrics = 4
    };

    struct ConversionSweep {
        std::vector<double> caps;
        std::vector<SimulationSummary> summaries;
        Eigen::MatrixXd metrics;   // caps x NumMetrics

        // Lowest lifetime tax wins for MedianLifetimeTax, highest value
        // otherwise. Ties go to the earlier cap.
        double best_cap(Metric m) const {
            if (caps.empty()) throw std::invalid_argument("empty conversion sweep");
            Eigen::Index best = 0;
            for (Eigen::Index i = 1; i < metrics.rows(); ++i) {
                double v = metrics(i, m), b = metrics(best, m);
                bool better = (m == MedianLifetimeTax) ? v < b : v > b;
                if (better) best = i;
            }
            return caps[static_cast<std::size_t>(best)];
        }
    };

    explicit RothConversionExplorer(const MonteCarloEngine& e) : engine(e) {}

    static const char* metric_name(Metric m) {
        switch (m) {
            case SuccessProbability:     return "success_probability";
            case MedianTerminalNetWorth: return "median_terminal_net_worth";
            case MedianLifetimeTax:      return "median_lifetime_tax";
            case P10TerminalNetWorth:    return "p10_terminal_net_worth";
            default:                     return "unknown";
        }
    }

    // Copy of `base` converting up to `cap` per year. A scenario without a
    // conversion policy is promoted to a fixed cap over the whole horizon.
    static ScenarioInput with_cap(const ScenarioInput& base, double cap) {
        ScenarioInput s = base;
        if (s.roth.kind == ConversionKind::None) {
            s.roth.kind = ConversionKind::FixedCap;
            s.roth.start_year = s.start_year;
            s.roth.end_year = s.end_year;
        }
        s.roth.annual_cap = cap;
        return s;
    }

    ConversionSweep sweep(const ScenarioInput& base, const std::vector<double>& caps,
                          int num_paths, std::uint64_t seed, RunOptions options = RunOptions()) const {
        if (caps.empty()) throw ValidationError(base.id, "caps", "at least one cap is required");
        for (std::size_t i = 0; i < caps.size(); ++i) {
            if (!(caps[i] >= 0.0)) {
                throw ValidationError(base.id, "caps[" + std::to_string(i) + "]", "must be >= 0");
            }
        }

        // Fail fast on the base scenario before spawning cells
        with_cap(base, caps.front()).validate_or_throw();

        std::vector<double> levels = options.percentiles;
        bool has10 = false, has50 = false;
        for (double l : levels) { has10 = has10 || l == 10.0; has50 = has50 || l == 50.0; }
        if (!has10) levels.push_back(10.0);
        if (!has50) levels.push_back(50.0);
        options.percentiles = levels;
        options.verbose = false;
        options.conversion = nullptr;

        std::cout << "[Glidepath::Sweep] Scenario '" << base.id << "': " << caps.size()
                  << " caps x " << num_paths << " paths, seed " << seed << std::endl;

        const int n = static_cast<int>(caps.size());
        ConversionSweep out;
        out.caps = caps;
        out.summaries.resize(caps.size());
        std::exception_ptr failure;

#ifdef _OPENMP
        #pragma omp parallel for schedule(dynamic)
#endif
        for (int i = 0; i < n; ++i) {
            try {
                out.summaries[i] = engine.run(with_cap(base, caps[i]), num_paths, seed, options);
            } catch (...) {
#ifdef _OPENMP
                #pragma omp critical(glidepath_sweep_error)
#endif
                {
                    if (!failure) failure = std::current_exception();
                }
            }
        }
        if (failure) std::rethrow_exception(failure);

        out.metrics = Eigen::MatrixXd::Zero(n, NumMetrics);
        for (int i = 0; i < n; ++i) {
            const SimulationSummary& s = out.summaries[i];
            out.metrics(i, SuccessProbability) = s.success_probability;
            out.metrics(i, MedianTerminalNetWorth) = s.terminal_net_worth.at(50.0);
            out.metrics(i, MedianLifetimeTax) = s.lifetime_tax.at(50.0);
            out.metrics(i, P10TerminalNetWorth) = s.terminal_net_worth.at(10.0);
        }

        std::cout << "[Glidepath::Sweep] Best cap by success probability: "
                  << out.best_cap(SuccessProbability) << ", by median terminal net worth: "
                  << out.best_cap(MedianTerminalNetWorth) << std::endl;
        return out;
    }
};

} // namespace Glidepath
