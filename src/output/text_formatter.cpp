/// @file text_formatter.cpp
/// @brief Plain-text report rendering

#include "output/text_formatter.h"

#include <iomanip>
#include <sstream>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_replace.h>
#include <absl/time/time.h>

namespace pglogstats::output {

namespace {

void WriteTitle(std::ostringstream& out, std::string_view title) {
    out << title << "\n" << std::string(title.size(), '=') << "\n";
}

}  // namespace

TextFormatter::TextFormatter(TextFormatterConfig config)
    : config_(std::move(config)) {}

std::string TextFormatter::FormatQueryAnalysis(const AnalysisResult& analysis) const {
    std::ostringstream out;
    out << FormatSummary(analysis);

    out << std::fixed << std::setprecision(2);

    if (!analysis.query_types.empty()) {
        out << "\nQuery Types:\n";
        for (const auto& [type, count] : analysis.query_types) {
            out << "  " << type << ": " << count << "\n";
        }
    }

    if (!analysis.slowest_queries.empty()) {
        out << "\nSlowest Queries:\n";
        out << "  " << std::left << std::setw(15) << "Duration (ms)" << "Query\n";
        for (const auto& [query, duration] : analysis.slowest_queries) {
            std::ostringstream value;
            value << std::fixed << std::setprecision(2) << duration;
            out << "  " << std::left << std::setw(15) << value.str()
                << DisplayQuery(query) << "\n";
        }
    }

    if (!analysis.most_frequent_queries.empty()) {
        out << "\nMost Frequent Queries:\n";
        out << "  " << std::left << std::setw(8) << "Count" << "Query\n";
        for (const auto& [query, count] : analysis.most_frequent_queries) {
            out << "  " << std::left << std::setw(8) << count << DisplayQuery(query) << "\n";
        }
    }

    return out.str();
}

std::string TextFormatter::FormatTimingAnalysis(const TimingAnalysis& timing) const {
    std::ostringstream out;
    out << FormatTimingSummary(timing);
    out << std::fixed << std::setprecision(2);

    if (!timing.hourly_patterns.empty()) {
        out << "\nHourly Averages (UTC):\n";
        for (const auto& [hour, average] : timing.hourly_patterns) {
            out << "  " << std::setw(2) << std::setfill('0') << std::right << hour
                << ":00" << std::setfill(' ') << "  " << average << " ms\n";
        }
    }

    if (!timing.daily_patterns.empty()) {
        out << "\nDaily Buckets:\n";
        for (const auto& [bucket, average] : timing.daily_patterns) {
            out << "  #" << std::left << std::setw(6) << bucket << average << " ms\n";
        }
    }

    return out.str();
}

std::string TextFormatter::FormatReport(
    const AnalysisResult& analysis,
    const TimingAnalysis& timing,
    const ReportMetadata& metadata,
    bool quick) const {
    std::ostringstream out;

    WriteTitle(out, "PostgreSQL Log Analysis");
    out << "Generated: "
        << absl::FormatTime(absl::RFC3339_sec, absl::FromChrono(metadata.generated_at),
                            absl::UTCTimeZone())
        << "\n";
    if (!metadata.tool_version.empty()) {
        out << "Version: " << metadata.tool_version << "\n";
    }
    out << "Files Processed: " << metadata.log_files.size() << "\n";
    out << "Log Entries: " << metadata.total_entries << "\n";
    out << "Parse Failures: " << metadata.parse_failures << "\n\n";

    if (quick) {
        out << FormatSummary(analysis) << "\n" << FormatTimingSummary(timing);
    } else {
        out << FormatQueryAnalysis(analysis) << "\n" << FormatTimingAnalysis(timing);
    }

    return out.str();
}

std::string TextFormatter::FormatLogEntries(const std::vector<LogEntry>& entries) const {
    std::ostringstream out;
    WriteTitle(out, absl::StrCat("Log Entries (", entries.size(), " total)"));

    size_t index = 0;
    for (const auto& entry : entries) {
        out << "[" << ++index << "] "
            << absl::FormatTime("%Y-%m-%d %H:%M:%S", absl::FromChrono(entry.timestamp),
                                absl::UTCTimeZone())
            << " " << SeverityToString(entry.severity) << ": " << entry.message << "\n";
    }
    return out.str();
}

std::string TextFormatter::FormatSummary(const AnalysisResult& analysis) const {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);

    WriteTitle(out, "Query Analysis Report");
    out << "Total Queries: " << analysis.total_queries << "\n";
    out << "Total Duration: " << analysis.total_duration << " ms\n";
    out << "Average Duration: " << analysis.average_duration << " ms\n";
    out << "P95 Duration: " << analysis.p95_duration << " ms\n";
    out << "P99 Duration: " << analysis.p99_duration << " ms\n";
    out << "Error Count: " << analysis.error_count << "\n";
    out << "Connection Count: " << analysis.connection_count << "\n";
    return out.str();
}

std::string TextFormatter::FormatTimingSummary(const TimingAnalysis& timing) const {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);

    WriteTitle(out, "Timing Analysis Report");
    out << "Samples: " << timing.sample_count << "\n";
    out << "Average Response Time: " << timing.average_response_time << " ms\n";
    out << "95th Percentile: " << timing.p95_response_time << " ms\n";
    out << "99th Percentile: " << timing.p99_response_time << " ms\n";
    return out.str();
}

std::string TextFormatter::DisplayQuery(std::string_view query) const {
    std::string flat = absl::StrReplaceAll(query, {{"\r\n", " "}, {"\n", " "}, {"\t", " "}});
    if (config_.max_query_width > 3 && flat.size() > config_.max_query_width) {
        size_t cut = config_.max_query_width - 3;
        // Step back to a UTF-8 lead byte so no code point is split
        while (cut > 0 && (static_cast<unsigned char>(flat[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        flat.resize(cut);
        flat += "...";
    }
    return flat;
}

}  // namespace pglogstats::output
