#pragma once

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>
#include <Eigen/Dense>

namespace Glidepath {

// Percentile levels (rows) x simulated years (cols)
struct PercentileBands {
    std::vector<double> levels;
    Eigen::MatrixXd values;

    int num_years() const { return static_cast<int>(values.cols()); }

    // Row for an exact requested level
    Eigen::VectorXd at(double level) const {
        for (std::size_t i = 0; i < levels.size(); ++i) {
            if (levels[i] == level) return values.row(static_cast<Eigen::Index>(i)).transpose();
        }
        throw std::invalid_argument("percentile level " + std::to_string(level) + " was not requested");
    }
};

struct DistributionStats {
    double mean = 0.0;
    double min = 0.0;
    double max = 0.0;
    std::vector<double> levels;
    std::vector<double> percentiles;

    double at(double level) const {
        for (std::size_t i = 0; i < levels.size(); ++i) {
            if (levels[i] == level) return percentiles[i];
        }
        throw std::invalid_argument("percentile level " + std::to_string(level) + " was not requested");
    }
};

// Order statistics over path samples. Every reduction sorts its input, so the
// result never depends on the order paths were merged in.
class PercentileAggregator {
public:
    static void check_levels(const std::vector<double>& levels) {
        if (levels.empty()) throw std::invalid_argument("at least one percentile level is required");
        for (double p : levels) {
            if (!(p >= 0.0 && p <= 100.0)) {
                throw std::invalid_argument("percentile level " + std::to_string(p) + " outside [0, 100]");
            }
        }
    }

    // Linear interpolation between closest ranks, rank = p/100 * (n - 1).
    // `sorted` must be ascending and non-empty.
    static double percentile_sorted(const double* sorted, Eigen::Index n, double p) {
        if (n == 1) return sorted[0];
        double rank = p / 100.0 * static_cast<double>(n - 1);
        Eigen::Index lo = static_cast<Eigen::Index>(std::floor(rank));
        Eigen::Index hi = std::min<Eigen::Index>(lo + 1, n - 1);
        double frac = rank - static_cast<double>(lo);
        return sorted[lo] + frac * (sorted[hi] - sorted[lo]);
    }

    static double percentile(std::vector<double> samples, double p) {
        if (samples.empty()) throw std::invalid_argument("percentile of an empty sample");
        std::sort(samples.begin(), samples.end());
        return percentile_sorted(samples.data(), static_cast<Eigen::Index>(samples.size()), p);
    }

    // samples: paths (rows) x years (cols)
    static PercentileBands bands(const Eigen::MatrixXd& samples, const std::vector<double>& levels) {
        check_levels(levels);
        PercentileBands out;
        out.levels = levels;
        out.values = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(levels.size()), samples.cols());
        if (samples.rows() == 0) return out;

        Eigen::VectorXd col(samples.rows());
        for (Eigen::Index t = 0; t < samples.cols(); ++t) {
            col = samples.col(t);
            std::sort(col.data(), col.data() + col.size());
            for (std::size_t k = 0; k < levels.size(); ++k) {
                out.values(static_cast<Eigen::Index>(k), t) = percentile_sorted(col.data(), col.size(), levels[k]);
            }
        }
        return out;
    }

    static DistributionStats stats(const std::vector<double>& samples, const std::vector<double>& levels) {
        check_levels(levels);
        DistributionStats s;
        s.levels = levels;
        if (samples.empty()) {
            s.percentiles.assign(levels.size(), 0.0);
            return s;
        }
        std::vector<double> sorted = samples;
        std::sort(sorted.begin(), sorted.end());
        Eigen::Map<const Eigen::VectorXd> v(sorted.data(), static_cast<Eigen::Index>(sorted.size()));
        s.mean = v.mean();
        s.min = sorted.front();
        s.max = sorted.back();
        for (double p : levels) {
            s.percentiles.push_back(percentile_sorted(sorted.data(), v.size(), p));
        }
        return s;
    }
};

} // namespace Glidepath
