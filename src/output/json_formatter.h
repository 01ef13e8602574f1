#pragma once

/// @file json_formatter.h
/// @brief JSON rendering of analysis results

#include <string>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "model/analysis_result.h"
#include "model/log_entry.h"
#include "output/report_metadata.h"

namespace pglogstats::output {

/// @brief JSON formatter options
struct JsonFormatterConfig {
    bool pretty = true;
    int indent = 2;
};

/// @brief Renders analysis results as JSON documents
///
/// Report layout:
/// @code
///   {
///     "metadata":          { "analysis_timestamp", "tool_version",
///                            "log_files_processed", "total_log_entries",
///                            "parse_failures" },
///     "summary":           { "total_queries", "total_duration_ms",
///                            "avg_duration_ms", "p95_duration_ms",
///                            "p99_duration_ms", "error_count",
///                            "connection_count" },
///     "query_analysis":    { "by_type", "slowest_queries", "most_frequent" },
///     "temporal_analysis": { "average_response_time_ms", ...,
///                            "hourly_stats", "daily_stats" }
///   }
/// @endcode
///
/// Quick mode drops the per-query lists and the hourly/daily breakdowns.
class JsonFormatter {
public:
    explicit JsonFormatter(JsonFormatterConfig config = {});

    /// @brief Summary, type distribution and query lists
    absl::StatusOr<std::string> FormatQueryAnalysis(const AnalysisResult& analysis) const;

    /// @brief Response time statistics and temporal patterns
    absl::StatusOr<std::string> FormatTimingAnalysis(const TimingAnalysis& timing) const;

    /// @brief Complete report with metadata
    absl::StatusOr<std::string> FormatReport(
        const AnalysisResult& analysis,
        const TimingAnalysis& timing,
        const ReportMetadata& metadata,
        bool quick = false) const;

    /// @brief The parsed entries as an array, in input order
    absl::StatusOr<std::string> FormatLogEntries(const std::vector<LogEntry>& entries) const;

    // =========================================================================
    // Document builders
    // =========================================================================

    static nlohmann::json SummaryToJson(const AnalysisResult& analysis);
    static nlohmann::json QueryAnalysisToJson(const AnalysisResult& analysis, bool quick);
    static nlohmann::json TimingAnalysisToJson(const TimingAnalysis& timing, bool quick);
    static nlohmann::json MetadataToJson(const ReportMetadata& metadata);
    static nlohmann::json LogEntryToJson(const LogEntry& entry);

private:
    absl::StatusOr<std::string> Dump(const nlohmann::json& document) const;

    JsonFormatterConfig config_;
};

}  // namespace pglogstats::output
