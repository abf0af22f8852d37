// core/stats.hpp
// Summary statistics over a sample vector (min/max/mean/median/stddev/percentiles)
#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace udpperf {

struct Stats {
    uint64_t count = 0;
    double min = 0;
    double max = 0;
    double mean = 0;
    double median = 0;
    double stddev = 0;
    double p90 = 0;
    double p95 = 0;
    double p99 = 0;
};

// Nearest-rank percentile on a sorted vector, p in [0, 1]
inline double percentile_sorted(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) return 0;
    size_t idx = static_cast<size_t>(p * sorted.size());
    if (idx >= sorted.size()) idx = sorted.size() - 1;
    return sorted[idx];
}

// Calculate statistics from vector of values (population stddev)
inline Stats calculate_stats(std::vector<double> values) {
    Stats stats;
    if (values.empty()) {
        return stats;
    }

    std::sort(values.begin(), values.end());

    stats.count = values.size();
    stats.min = values.front();
    stats.max = values.back();

    double sum = 0;
    for (double v : values) {
        sum += v;
    }
    stats.mean = sum / values.size();

    double variance = 0;
    for (double v : values) {
        double diff = v - stats.mean;
        variance += diff * diff;
    }
    stats.stddev = std::sqrt(variance / values.size());

    stats.median = percentile_sorted(values, 0.50);
    stats.p90 = percentile_sorted(values, 0.90);
    stats.p95 = percentile_sorted(values, 0.95);
    stats.p99 = percentile_sorted(values, 0.99);

    return stats;
}

} // namespace udpperf
