#pragma once

/// @file analysis_result.h
/// @brief Result types produced by the query and timing analyzers

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace pglogstats {

/// @brief Aggregated query statistics for one entry sequence
struct AnalysisResult {
    uint64_t total_queries = 0;

    /// Query class name ("SELECT", "DDL", ...) -> number of statements
    std::map<std::string, uint64_t> query_types;

    /// (label, duration ms), slowest first
    std::vector<std::pair<std::string, double>> slowest_queries;

    /// (normalized query, occurrences), most frequent first
    std::vector<std::pair<std::string, uint64_t>> most_frequent_queries;

    double total_duration = 0.0;
    double average_duration = 0.0;
    double p95_duration = 0.0;
    double p99_duration = 0.0;

    uint64_t error_count = 0;
    uint64_t connection_count = 0;
};

/// @brief Summary statistics over a plain duration sample
struct QueryMetrics {
    uint64_t total_queries = 0;
    double total_duration = 0.0;
    double average_duration = 0.0;
    double min_duration = 0.0;
    double max_duration = 0.0;
    double p95_duration = 0.0;
    double p99_duration = 0.0;
};

/// @brief Latency distribution over time
struct TimingAnalysis {
    double average_response_time = 0.0;
    double p95_response_time = 0.0;
    double p99_response_time = 0.0;

    /// Number of durations the statistics were computed from
    uint64_t sample_count = 0;

    /// Hour of day (0-23, UTC) -> mean duration in ms
    std::map<int, double> hourly_patterns;

    /// Bucket index (0 = bucket of the earliest sample) -> mean duration in ms
    std::map<int64_t, double> daily_patterns;
};

}  // namespace pglogstats
