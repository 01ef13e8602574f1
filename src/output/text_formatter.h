#pragma once

/// @file text_formatter.h
/// @brief Human-readable rendering of analysis results

#include <string>
#include <string_view>
#include <vector>

#include "model/analysis_result.h"
#include "model/log_entry.h"
#include "output/report_metadata.h"

namespace pglogstats::output {

/// @brief Text formatter options
struct TextFormatterConfig {
    /// Queries longer than this are cut and suffixed with "..." (0 = no limit)
    size_t max_query_width = 100;
};

/// @brief Renders analysis results as plain-text reports
///
/// Sections with nothing to show (no statements, no durations) are omitted.
/// Durations are printed with two decimals.
class TextFormatter {
public:
    explicit TextFormatter(TextFormatterConfig config = {});

    /// @brief Summary block followed by type distribution and query lists
    std::string FormatQueryAnalysis(const AnalysisResult& analysis) const;

    /// @brief Response time statistics with hourly and bucket breakdowns
    std::string FormatTimingAnalysis(const TimingAnalysis& timing) const;

    /// @brief Run header plus both analyses; quick mode keeps the summaries only
    std::string FormatReport(
        const AnalysisResult& analysis,
        const TimingAnalysis& timing,
        const ReportMetadata& metadata,
        bool quick = false) const;

    /// @brief Numbered listing: "[n] YYYY-MM-DD HH:MM:SS LEVEL: message" (UTC)
    std::string FormatLogEntries(const std::vector<LogEntry>& entries) const;

private:
    std::string FormatSummary(const AnalysisResult& analysis) const;
    std::string FormatTimingSummary(const TimingAnalysis& timing) const;
    std::string DisplayQuery(std::string_view query) const;

    TextFormatterConfig config_;
};

}  // namespace pglogstats::output
