/// @file json_formatter.cpp
/// @brief JSON report rendering

#include "output/json_formatter.h"

#include <absl/strings/str_cat.h>
#include <absl/time/time.h>

#include "common/error.h"

namespace pglogstats::output {

using json = nlohmann::json;

JsonFormatter::JsonFormatter(JsonFormatterConfig config)
    : config_(std::move(config)) {}

absl::StatusOr<std::string> JsonFormatter::FormatQueryAnalysis(
    const AnalysisResult& analysis) const {
    json document = QueryAnalysisToJson(analysis, false);
    document["summary"] = SummaryToJson(analysis);
    return Dump(document);
}

absl::StatusOr<std::string> JsonFormatter::FormatTimingAnalysis(
    const TimingAnalysis& timing) const {
    return Dump(TimingAnalysisToJson(timing, false));
}

absl::StatusOr<std::string> JsonFormatter::FormatReport(
    const AnalysisResult& analysis,
    const TimingAnalysis& timing,
    const ReportMetadata& metadata,
    bool quick) const {
    json document;
    document["metadata"] = MetadataToJson(metadata);
    document["summary"] = SummaryToJson(analysis);
    document["query_analysis"] = QueryAnalysisToJson(analysis, quick);
    document["temporal_analysis"] = TimingAnalysisToJson(timing, quick);
    return Dump(document);
}

absl::StatusOr<std::string> JsonFormatter::FormatLogEntries(
    const std::vector<LogEntry>& entries) const {
    json document = json::array();
    for (const auto& entry : entries) {
        document.push_back(LogEntryToJson(entry));
    }
    return Dump(document);
}

json JsonFormatter::SummaryToJson(const AnalysisResult& analysis) {
    return json{
        {"total_queries", analysis.total_queries},
        {"total_duration_ms", analysis.total_duration},
        {"avg_duration_ms", analysis.average_duration},
        {"p95_duration_ms", analysis.p95_duration},
        {"p99_duration_ms", analysis.p99_duration},
        {"error_count", analysis.error_count},
        {"connection_count", analysis.connection_count}
    };
}

json JsonFormatter::QueryAnalysisToJson(const AnalysisResult& analysis, bool quick) {
    json j;
    j["by_type"] = json::object();
    for (const auto& [type, count] : analysis.query_types) {
        j["by_type"][type] = count;
    }

    if (quick) {
        return j;
    }

    j["slowest_queries"] = json::array();
    for (const auto& [query, duration] : analysis.slowest_queries) {
        j["slowest_queries"].push_back({{"query", query}, {"duration_ms", duration}});
    }

    j["most_frequent"] = json::array();
    for (const auto& [query, count] : analysis.most_frequent_queries) {
        j["most_frequent"].push_back({{"query", query}, {"count", count}});
    }

    return j;
}

json JsonFormatter::TimingAnalysisToJson(const TimingAnalysis& timing, bool quick) {
    json j = {
        {"average_response_time_ms", timing.average_response_time},
        {"p95_response_time_ms", timing.p95_response_time},
        {"p99_response_time_ms", timing.p99_response_time},
        {"sample_count", timing.sample_count}
    };

    if (quick) {
        return j;
    }

    j["hourly_stats"] = json::array();
    for (const auto& [hour, average] : timing.hourly_patterns) {
        j["hourly_stats"].push_back({{"hour", hour}, {"average_duration_ms", average}});
    }

    j["daily_stats"] = json::array();
    for (const auto& [bucket, average] : timing.daily_patterns) {
        j["daily_stats"].push_back({{"bucket", bucket}, {"average_duration_ms", average}});
    }

    return j;
}

json JsonFormatter::MetadataToJson(const ReportMetadata& metadata) {
    return json{
        {"analysis_timestamp",
         absl::FormatTime(absl::RFC3339_sec, absl::FromChrono(metadata.generated_at),
                          absl::UTCTimeZone())},
        {"tool_version", metadata.tool_version},
        {"log_files_processed", metadata.log_files},
        {"total_log_entries", metadata.total_entries},
        {"parse_failures", metadata.parse_failures}
    };
}

json JsonFormatter::LogEntryToJson(const LogEntry& entry) {
    auto optional_text = [](const std::optional<std::string>& value) -> json {
        return value ? json(*value) : json(nullptr);
    };

    json j = {
        {"timestamp",
         absl::FormatTime(absl::RFC3339_full, absl::FromChrono(entry.timestamp),
                          absl::UTCTimeZone())},
        {"process_id", entry.process_id},
        {"user", optional_text(entry.user)},
        {"database", optional_text(entry.database)},
        {"client_host", optional_text(entry.client_host)},
        {"application_name", optional_text(entry.application_name)},
        {"level", std::string(SeverityToString(entry.severity))},
        {"message", entry.message},
        {"query", optional_text(entry.query)}
    };
    j["duration_ms"] = entry.duration_ms ? json(*entry.duration_ms) : json(nullptr);
    return j;
}

absl::StatusOr<std::string> JsonFormatter::Dump(const json& document) const {
    try {
        return document.dump(config_.pretty ? config_.indent : -1, ' ', false,
                             json::error_handler_t::replace);
    } catch (const json::exception& e) {
        return MakeError(ErrorCode::kSerializationError,
                         absl::StrCat("failed to serialize report: ", e.what()));
    }
}

}  // namespace pglogstats::output
