#include "analytics/percentile.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace pglogstats::analytics {

double NearestRankPercentile(const std::vector<double>& sorted, double percentile) {
    if (sorted.empty()) {
        return 0.0;
    }

    const double n = static_cast<double>(sorted.size());
    // Divide last: p * n / 100 is exact whenever p * n is a multiple of 100
    const double rank = std::ceil(percentile * n / 100.0) - 1.0;
    const double clamped = std::clamp(rank, 0.0, n - 1.0);
    return sorted[static_cast<size_t>(clamped)];
}

double Mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

}  // namespace pglogstats::analytics
