#pragma once

/// @file timing_analyzer.h
/// @brief Response time distribution and time-of-day patterns

#include <chrono>
#include <utility>
#include <vector>

#include <absl/status/statusor.h>

#include "model/analysis_result.h"
#include "model/log_entry.h"

namespace pglogstats::analytics {

/// @brief Configuration for timing analysis
struct TimingAnalyzerConfig {
    /// Width of the daily_patterns buckets
    std::chrono::hours bucket_size = std::chrono::hours(24);

    /// Also sample STATEMENT entries that carry a duration
    bool include_statement_durations = false;
};

/// @brief Latency statistics over DURATION entries
///
/// Hourly patterns are keyed by UTC hour of day. Daily pattern bucket 0 is
/// the epoch-aligned bucket that holds the earliest sampled timestamp; later
/// buckets count up from there, so gaps in the log leave gaps in the keys.
class TimingAnalyzer {
public:
    explicit TimingAnalyzer(TimingAnalyzerConfig config = {});

    /// @brief Compute response time statistics and temporal patterns
    /// @return InvalidArgument if the bucket size is not positive
    absl::StatusOr<TimingAnalysis> AnalyzeTiming(const std::vector<LogEntry>& entries) const;

    /// @brief Nearest-rank percentiles of an unsorted sample
    /// @param values Sample, any order
    /// @param percentiles Requested percentiles, each in [0, 100]
    /// @return (percentile, value) pairs in request order; values are 0 for an
    ///         empty sample
    static absl::StatusOr<std::vector<std::pair<double, double>>> CalculatePercentiles(
        const std::vector<double>& values, const std::vector<double>& percentiles);

    const TimingAnalyzerConfig& GetConfig() const { return config_; }

private:
    bool IsSampled(const LogEntry& entry) const;

    TimingAnalyzerConfig config_;
};

}  // namespace pglogstats::analytics
