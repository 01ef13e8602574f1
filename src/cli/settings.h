#pragma once

/// @file settings.h
/// @brief Validated runtime settings assembled from layered configuration

#include <optional>
#include <string_view>

#include <absl/status/statusor.h>

#include "analytics/query_analyzer.h"
#include "analytics/timing_analyzer.h"
#include "common/config.h"
#include "common/logging.h"
#include "parser/stderr_parser.h"

namespace pglogstats::cli {

/// @brief Report rendering format
enum class OutputFormat {
    kText,
    kJson
};

/// @brief Parse "text" / "json" (case-insensitive)
std::optional<OutputFormat> ParseOutputFormat(std::string_view name);

std::string_view OutputFormatToString(OutputFormat format);

/// @brief Typed view of every recognized configuration key
///
/// Defaults match an empty configuration. See FromConfig for the key names.
struct Settings {
    parser::StderrParserConfig parser;
    analytics::QueryAnalyzerConfig analysis;
    analytics::TimingAnalyzerConfig timing;

    /// Lines read from the head of each file (0 = whole file)
    size_t sample_size = 0;

    /// Parser workers (0 = hardware concurrency)
    size_t jobs = 0;

    OutputFormat output_format = OutputFormat::kText;
    LogLevel log_level = LogLevel::kWarn;

    /// @brief Read and validate settings
    ///
    /// Keys: parser.max_entry_bytes, analysis.max_frequent_queries,
    /// analysis.max_slow_queries, analysis.slow_query_threshold_ms,
    /// timing.bucket_hours, timing.include_statement_durations,
    /// input.sample_size, input.jobs, output.format, logging.level.
    /// @return InvalidArgument naming the first offending key
    static absl::StatusOr<Settings> FromConfig(const Config& config);
};

}  // namespace pglogstats::cli
