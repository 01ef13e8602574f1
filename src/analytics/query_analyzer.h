#pragma once

/// @file query_analyzer.h
/// @brief Query aggregation over parsed PostgreSQL log entries
///
/// Counts statements by class, groups them by normalized text, ranks the
/// slowest durations and summarizes error and connection activity.

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/status/statusor.h>

#include "model/analysis_result.h"
#include "model/log_entry.h"

namespace pglogstats::analytics {

/// @brief Configuration for query analysis
struct QueryAnalyzerConfig {
    /// Length of the most_frequent_queries list
    size_t max_frequent_queries = 20;

    /// Length of the slowest_queries list
    size_t max_slow_queries = 10;

    /// Durations at or below this value are left out of slowest_queries (0 = keep all)
    double slow_query_threshold_ms = 0.0;
};

/// @brief Aggregates statement, duration, error and connection statistics
///
/// Stateless between calls; one instance can analyze any number of entry
/// sequences, including concurrently.
///
/// Example:
/// @code
///   QueryAnalyzer analyzer;
///   auto result = analyzer.Analyze(entries);
///   if (result.ok()) {
///       std::cout << result->total_queries << " statements, p95 "
///                 << result->p95_duration << " ms\n";
///   }
/// @endcode
class QueryAnalyzer {
public:
    explicit QueryAnalyzer(QueryAnalyzerConfig config = {});

    /// @brief Compute all query aggregates in a single pass
    /// @return InvalidArgument for a negative slow query threshold; empty
    ///         input yields a zeroed result
    absl::StatusOr<AnalysisResult> Analyze(const std::vector<LogEntry>& entries) const;

    // =========================================================================
    // Individual aggregates
    // =========================================================================

    /// @brief Count, sum, mean, extremes and percentiles of a duration sample
    static QueryMetrics CalculateMetrics(const std::vector<double>& durations);

    /// @brief Duration-carrying entries above a threshold, slowest first
    ///
    /// Ties keep input order. The list is capped at max_slow_queries.
    /// @param threshold_ms Minimum duration to report (exclusive); 0 keeps all
    std::vector<std::pair<std::string, double>> FindSlowQueries(
        const std::vector<LogEntry>& entries, double threshold_ms) const;

    /// @brief Query class name -> statement count
    static std::map<std::string, uint64_t> GetQueryTypeDistribution(
        const std::vector<LogEntry>& entries);

    /// @brief Fraction of entries with ERROR, FATAL or PANIC severity
    static double CalculateErrorRate(const std::vector<LogEntry>& entries);

    /// @brief True for connection and disconnection notices
    static bool IsConnectionMessage(std::string_view message);

    const QueryAnalyzerConfig& GetConfig() const { return config_; }

private:
    static bool IsStatement(const LogEntry& entry);
    static std::string StatementText(const LogEntry& entry);
    static std::string SlowQueryLabel(const LogEntry& entry);

    QueryAnalyzerConfig config_;
};

}  // namespace pglogstats::analytics
