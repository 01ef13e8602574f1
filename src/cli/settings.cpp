#include "cli/settings.h"

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace pglogstats::cli {

namespace {

/// Read an integer key that must be >= minimum, or keep the current value
absl::Status ReadCount(const Config& config, std::string_view key, int64_t minimum,
                       size_t& target) {
    auto value = config.GetIntStrict(key);
    if (!value.ok()) {
        return ConfigurationError(key, value.status().message());
    }
    if (!value->has_value()) {
        return absl::OkStatus();
    }
    if (**value < minimum) {
        return ConfigurationError(key, absl::StrCat("must be at least ", minimum,
                                                    ", got ", **value));
    }
    target = static_cast<size_t>(**value);
    return absl::OkStatus();
}

}  // namespace

std::optional<OutputFormat> ParseOutputFormat(std::string_view name) {
    const std::string lower = absl::AsciiStrToLower(name);
    if (lower == "text") {
        return OutputFormat::kText;
    }
    if (lower == "json") {
        return OutputFormat::kJson;
    }
    return std::nullopt;
}

std::string_view OutputFormatToString(OutputFormat format) {
    switch (format) {
        case OutputFormat::kText: return "text";
        case OutputFormat::kJson: return "json";
    }
    return "text";
}

absl::StatusOr<Settings> Settings::FromConfig(const Config& config) {
    Settings settings;

    PGLOGSTATS_RETURN_IF_ERROR(
        ReadCount(config, "parser.max_entry_bytes", 0, settings.parser.max_entry_bytes));
    PGLOGSTATS_RETURN_IF_ERROR(ReadCount(config, "analysis.max_frequent_queries", 1,
                                         settings.analysis.max_frequent_queries));
    PGLOGSTATS_RETURN_IF_ERROR(ReadCount(config, "analysis.max_slow_queries", 1,
                                         settings.analysis.max_slow_queries));
    PGLOGSTATS_RETURN_IF_ERROR(ReadCount(config, "input.sample_size", 0, settings.sample_size));
    PGLOGSTATS_RETURN_IF_ERROR(ReadCount(config, "input.jobs", 0, settings.jobs));

    auto threshold = config.GetDoubleStrict("analysis.slow_query_threshold_ms");
    if (!threshold.ok()) {
        return ConfigurationError("analysis.slow_query_threshold_ms",
                                  threshold.status().message());
    }
    if (threshold->has_value()) {
        if (**threshold < 0.0) {
            return ConfigurationError("analysis.slow_query_threshold_ms",
                                      "must not be negative");
        }
        settings.analysis.slow_query_threshold_ms = **threshold;
    }

    size_t bucket_hours = static_cast<size_t>(settings.timing.bucket_size.count());
    PGLOGSTATS_RETURN_IF_ERROR(ReadCount(config, "timing.bucket_hours", 1, bucket_hours));
    settings.timing.bucket_size = std::chrono::hours(static_cast<int64_t>(bucket_hours));

    auto include_statements = config.GetBoolStrict("timing.include_statement_durations");
    if (!include_statements.ok()) {
        return ConfigurationError("timing.include_statement_durations",
                                  include_statements.status().message());
    }
    if (include_statements->has_value()) {
        settings.timing.include_statement_durations = **include_statements;
    }

    const std::string format = config.GetString("output.format", "text");
    auto parsed_format = ParseOutputFormat(format);
    if (!parsed_format) {
        return ConfigurationError("output.format",
                                  absl::StrCat("expected 'text' or 'json', got '", format, "'"));
    }
    settings.output_format = *parsed_format;

    const std::string level = config.GetString("logging.level", "warn");
    auto parsed_level = ParseLogLevel(level);
    if (!parsed_level) {
        return ConfigurationError("logging.level",
                                  absl::StrCat("unknown log level '", level, "'"));
    }
    settings.log_level = *parsed_level;

    return settings;
}

}  // namespace pglogstats::cli
