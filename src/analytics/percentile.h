#pragma once

/// @file percentile.h
/// @brief Descriptive statistics over duration samples

#include <vector>

namespace pglogstats::analytics {

/// @brief Nearest-rank percentile of an ascending sample
///
/// Uses index = ceil(p / 100 * n) - 1, clamped to [0, n - 1].
/// @param sorted Values in ascending order
/// @param percentile Requested percentile in [0, 100]
/// @return 0 for an empty sample
double NearestRankPercentile(const std::vector<double>& sorted, double percentile);

/// @brief Arithmetic mean, 0 for an empty sample
double Mean(const std::vector<double>& values);

}  // namespace pglogstats::analytics
