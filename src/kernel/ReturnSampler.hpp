#pragma once
#include <algorithm>
#include <cstdint>
#include <random>
#include <vector>
#include "../Scenario.hpp"

namespace Glidepath {

struct ReturnClass {
    double mean = 0.0;
    double volatility = 0.0;
};

// Annual returns for one path. The generator is seeded from (run seed, path
// index) only, so a path is reproducible regardless of which worker runs it.
class ReturnSampler {
    std::mt19937_64 rng;
    std::normal_distribution<double> std_normal{0.0, 1.0};

public:
    ReturnSampler(std::uint64_t seed, std::uint64_t path_index) {
        std::seed_seq seq{
            static_cast<std::uint32_t>(seed & 0xffffffffu),
            static_cast<std::uint32_t>(seed >> 32),
            static_cast<std::uint32_t>(path_index & 0xffffffffu),
            static_cast<std::uint32_t>(path_index >> 32)};
        rng.seed(seq);
    }

    static std::vector<ReturnClass> classes_for(const std::vector<Account>& accounts) {
        std::vector<ReturnClass> out;
        out.reserve(accounts.size());
        for (const auto& a : accounts) out.push_back({a.mean_return, a.volatility});
        return out;
    }

    // One return per class. Full correlation scales a single shock per year;
    // independent mode draws one shock per class. Floored at -100%.
    std::vector<double> sample_year(const std::vector<ReturnClass>& classes, CorrelationMode mode) {
        std::vector<double> out(classes.size());
        if (mode == CorrelationMode::Full) {
            double z = std_normal(rng);
            for (std::size_t i = 0; i < classes.size(); ++i) {
                out[i] = draw(classes[i], z);
            }
        } else {
            for (std::size_t i = 0; i < classes.size(); ++i) {
                out[i] = draw(classes[i], std_normal(rng));
            }
        }
        return out;
    }

private:
    static double draw(const ReturnClass& c, double z) {
        return std::max(-1.0, c.mean + c.volatility * z);
    }
};

} // namespace Glidepath
