#include "analytics/timing_analyzer.h"

#include <algorithm>
#include <cstdint>
#include <map>

#include <absl/strings/str_cat.h>
#include <absl/time/civil_time.h>
#include <absl/time/time.h>

#include "analytics/percentile.h"
#include "common/error.h"
#include "common/logging.h"

namespace pglogstats::analytics {

namespace {

struct RunningMean {
    double sum = 0.0;
    uint64_t count = 0;

    void Add(double value) {
        sum += value;
        ++count;
    }
    double Value() const { return count == 0 ? 0.0 : sum / static_cast<double>(count); }
};

int64_t FloorDiv(int64_t value, int64_t divisor) {
    int64_t quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

int64_t EpochSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch()).count();
}

}  // namespace

TimingAnalyzer::TimingAnalyzer(TimingAnalyzerConfig config)
    : config_(std::move(config)) {}

absl::StatusOr<TimingAnalysis> TimingAnalyzer::AnalyzeTiming(
    const std::vector<LogEntry>& entries) const {
    if (config_.bucket_size.count() <= 0) {
        return InvalidArgumentError(absl::StrCat(
            "timing bucket size must be positive, got ", config_.bucket_size.count(), "h"));
    }

    TimingAnalysis analysis;

    std::vector<const LogEntry*> sampled;
    for (const auto& entry : entries) {
        if (IsSampled(entry)) {
            sampled.push_back(&entry);
        }
    }
    if (sampled.empty()) {
        return analysis;
    }

    const int64_t bucket_seconds =
        std::chrono::duration_cast<std::chrono::seconds>(config_.bucket_size).count();

    auto earliest = std::min_element(sampled.begin(), sampled.end(),
                                     [](const LogEntry* a, const LogEntry* b) {
                                         return a->timestamp < b->timestamp;
                                     });
    const int64_t first_bucket = FloorDiv(EpochSeconds((*earliest)->timestamp), bucket_seconds);

    std::vector<double> durations;
    durations.reserve(sampled.size());
    std::map<int, RunningMean> hourly;
    std::map<int64_t, RunningMean> buckets;

    for (const LogEntry* entry : sampled) {
        const double duration = *entry->duration_ms;
        durations.push_back(duration);

        const absl::CivilHour civil =
            absl::ToCivilHour(absl::FromChrono(entry->timestamp), absl::UTCTimeZone());
        hourly[civil.hour()].Add(duration);

        const int64_t bucket = FloorDiv(EpochSeconds(entry->timestamp), bucket_seconds);
        buckets[bucket - first_bucket].Add(duration);
    }

    std::sort(durations.begin(), durations.end());
    analysis.sample_count = durations.size();
    analysis.average_response_time = Mean(durations);
    analysis.p95_response_time = NearestRankPercentile(durations, 95.0);
    analysis.p99_response_time = NearestRankPercentile(durations, 99.0);

    for (const auto& [hour, mean] : hourly) {
        analysis.hourly_patterns[hour] = mean.Value();
    }
    for (const auto& [bucket, mean] : buckets) {
        analysis.daily_patterns[bucket] = mean.Value();
    }

    PGLOGSTATS_LOG_DEBUG("Timing sample of {} durations across {} hours and {} buckets",
                         analysis.sample_count, analysis.hourly_patterns.size(),
                         analysis.daily_patterns.size());
    return analysis;
}

absl::StatusOr<std::vector<std::pair<double, double>>> TimingAnalyzer::CalculatePercentiles(
    const std::vector<double>& values, const std::vector<double>& percentiles) {
    for (double p : percentiles) {
        if (!(p >= 0.0 && p <= 100.0)) {
            return InvalidArgumentError(
                absl::StrCat("percentile must be within [0, 100], got ", p));
        }
    }

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    std::vector<std::pair<double, double>> result;
    result.reserve(percentiles.size());
    for (double p : percentiles) {
        result.emplace_back(p, NearestRankPercentile(sorted, p));
    }
    return result;
}

bool TimingAnalyzer::IsSampled(const LogEntry& entry) const {
    if (!entry.duration_ms) {
        return false;
    }
    if (entry.severity == Severity::kDuration) {
        return true;
    }
    return config_.include_statement_durations && entry.severity == Severity::kStatement;
}

}  // namespace pglogstats::analytics
