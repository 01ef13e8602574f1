#include "analytics/query_analyzer.h"

#include <algorithm>
#include <unordered_map>

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

#include "analytics/percentile.h"
#include "analytics/sql_normalizer.h"
#include "common/error.h"
#include "common/logging.h"

namespace pglogstats::analytics {

QueryAnalyzer::QueryAnalyzer(QueryAnalyzerConfig config)
    : config_(std::move(config)) {}

absl::StatusOr<AnalysisResult> QueryAnalyzer::Analyze(
    const std::vector<LogEntry>& entries) const {
    if (config_.slow_query_threshold_ms < 0.0) {
        return InvalidArgumentError(absl::StrCat(
            "slow query threshold must not be negative, got ",
            config_.slow_query_threshold_ms));
    }

    AnalysisResult result;

    // Normalized text -> position in `frequencies`, which keeps first-seen order
    std::unordered_map<std::string, size_t> frequency_index;
    std::vector<std::pair<std::string, uint64_t>> frequencies;
    std::vector<double> durations;

    for (const auto& entry : entries) {
        if (IsErrorSeverity(entry.severity)) {
            ++result.error_count;
        }
        if (IsConnectionMessage(entry.message)) {
            ++result.connection_count;
        }
        if (entry.duration_ms) {
            durations.push_back(*entry.duration_ms);
        }
        if (!IsStatement(entry)) {
            continue;
        }

        const std::string text = StatementText(entry);
        ++result.total_queries;
        ++result.query_types[std::string(QueryTypeToString(ClassifyQuery(text)))];

        std::string key = NormalizeQuery(text);
        auto it = frequency_index.find(key);
        if (it == frequency_index.end()) {
            frequency_index.emplace(key, frequencies.size());
            frequencies.emplace_back(std::move(key), 1);
        } else {
            ++frequencies[it->second].second;
        }
    }

    std::stable_sort(frequencies.begin(), frequencies.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (frequencies.size() > config_.max_frequent_queries) {
        frequencies.resize(config_.max_frequent_queries);
    }
    result.most_frequent_queries = std::move(frequencies);

    result.slowest_queries = FindSlowQueries(entries, config_.slow_query_threshold_ms);

    const QueryMetrics metrics = CalculateMetrics(durations);
    result.total_duration = metrics.total_duration;
    result.average_duration = metrics.average_duration;
    result.p95_duration = metrics.p95_duration;
    result.p99_duration = metrics.p99_duration;

    PGLOGSTATS_LOG_DEBUG(
        "Analyzed {} entries: {} statements, {} durations, {} errors, {} connection events",
        entries.size(), result.total_queries, durations.size(),
        result.error_count, result.connection_count);

    return result;
}

QueryMetrics QueryAnalyzer::CalculateMetrics(const std::vector<double>& durations) {
    QueryMetrics metrics;
    if (durations.empty()) {
        return metrics;
    }

    std::vector<double> sorted = durations;
    std::sort(sorted.begin(), sorted.end());

    metrics.total_queries = sorted.size();
    for (double value : sorted) {
        metrics.total_duration += value;
    }
    metrics.average_duration = Mean(sorted);
    metrics.min_duration = sorted.front();
    metrics.max_duration = sorted.back();
    metrics.p95_duration = NearestRankPercentile(sorted, 95.0);
    metrics.p99_duration = NearestRankPercentile(sorted, 99.0);
    return metrics;
}

std::vector<std::pair<std::string, double>> QueryAnalyzer::FindSlowQueries(
    const std::vector<LogEntry>& entries, double threshold_ms) const {
    std::vector<const LogEntry*> candidates;
    for (const auto& entry : entries) {
        if (!entry.duration_ms) {
            continue;
        }
        if (threshold_ms > 0.0 && *entry.duration_ms <= threshold_ms) {
            continue;
        }
        candidates.push_back(&entry);
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const LogEntry* a, const LogEntry* b) {
                         return *a->duration_ms > *b->duration_ms;
                     });
    if (candidates.size() > config_.max_slow_queries) {
        candidates.resize(config_.max_slow_queries);
    }

    std::vector<std::pair<std::string, double>> slowest;
    slowest.reserve(candidates.size());
    for (const LogEntry* entry : candidates) {
        slowest.emplace_back(SlowQueryLabel(*entry), *entry->duration_ms);
    }
    return slowest;
}

std::map<std::string, uint64_t> QueryAnalyzer::GetQueryTypeDistribution(
    const std::vector<LogEntry>& entries) {
    std::map<std::string, uint64_t> distribution;
    for (const auto& entry : entries) {
        if (IsStatement(entry)) {
            ++distribution[std::string(QueryTypeToString(ClassifyQuery(StatementText(entry))))];
        }
    }
    return distribution;
}

double QueryAnalyzer::CalculateErrorRate(const std::vector<LogEntry>& entries) {
    if (entries.empty()) {
        return 0.0;
    }
    const auto errors = std::count_if(entries.begin(), entries.end(), [](const LogEntry& e) {
        return IsErrorSeverity(e.severity);
    });
    return static_cast<double>(errors) / static_cast<double>(entries.size());
}

bool QueryAnalyzer::IsConnectionMessage(std::string_view message) {
    return absl::StrContains(message, "connection received") ||
           absl::StrContains(message, "connection authorized") ||
           absl::StrContains(message, "disconnection:");
}

bool QueryAnalyzer::IsStatement(const LogEntry& entry) {
    return entry.severity == Severity::kStatement;
}

std::string QueryAnalyzer::StatementText(const LogEntry& entry) {
    return entry.query ? *entry.query : entry.message;
}

std::string QueryAnalyzer::SlowQueryLabel(const LogEntry& entry) {
    return entry.query ? NormalizeQuery(*entry.query) : entry.message;
}

}  // namespace pglogstats::analytics
