#pragma once

/// @file log_entry.h
/// @brief Structured PostgreSQL log records shared by the parser and analyzers

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace pglogstats {

/// @brief Severity of a log record
///
/// DEBUG..PANIC mirror PostgreSQL levels. STATEMENT and DURATION are produced
/// by the parser for `statement:` / `duration:` payloads, which PostgreSQL
/// reports under the LOG level. kUnknown covers secondary keywords such as
/// DETAIL, HINT and CONTEXT.
enum class Severity {
    kDebug,
    kLog,
    kInfo,
    kNotice,
    kWarning,
    kError,
    kFatal,
    kPanic,
    kStatement,
    kDuration,
    kUnknown
};

/// @brief Canonical upper-case name ("LOG", "STATEMENT", ...)
std::string_view SeverityToString(Severity severity);

/// @brief Map a PostgreSQL level keyword (e.g. "ERROR", "DEBUG2") to a severity
/// @return kUnknown for keywords outside the closed set
Severity SeverityFromKeyword(std::string_view keyword);

/// @brief True for ERROR, FATAL and PANIC
bool IsErrorSeverity(Severity severity);

/// @brief One logical log record, possibly assembled from several lines
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    std::string process_id;

    std::optional<std::string> user;
    std::optional<std::string> database;
    std::optional<std::string> client_host;
    std::optional<std::string> application_name;

    Severity severity = Severity::kLog;

    /// Payload after the level keyword, continuation lines included
    std::string message;

    /// SQL text for STATEMENT entries
    std::optional<std::string> query;

    /// Execution time for DURATION entries
    std::optional<double> duration_ms;

    bool IsQuery() const { return severity == Severity::kStatement && query.has_value(); }
    bool HasDuration() const { return duration_ms.has_value(); }
};

}  // namespace pglogstats
