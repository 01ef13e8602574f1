#pragma once

/// @file stderr_parser.h
/// @brief Stateful parser for PostgreSQL stderr logs
///
/// Accepts lines written with `log_line_prefix = '%m [%p] %q%u@%d %a: '`:
///
///   2024-08-14 10:30:15.123 UTC [111] app@shop psql: LOG:  statement: SELECT 1
///   2024-08-14 10:30:15.456 UTC [111] app@shop psql: LOG:  duration: 0.123 ms
///
/// A record starts at a prefixed line and extends over the following
/// unprefixed (continuation) lines, which is how PostgreSQL writes multi-line
/// SQL. Records are emitted when the next prefixed line arrives or when the
/// input ends.

#include <chrono>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "model/log_entry.h"

namespace pglogstats::parser {

/// @brief Configuration for the stderr parser
struct StderrParserConfig {
    /// Maximum size of an entry's message in bytes; continuation text past
    /// the cap is dropped (0 = unlimited)
    size_t max_entry_bytes = 0;

    /// Maximum number of per-line failures kept in Stats::failures
    size_t max_recorded_failures = 100;
};

/// @brief A prefixed line that could not be decoded
struct LineFailure {
    size_t line_number = 0;  ///< 1-based
    std::string line;
    absl::Status status;
};

/// @brief Parser for the stderr log format
///
/// Not thread-safe; use one instance per input. Instances are cheap.
///
/// Example:
/// @code
///   StderrParser parser;
///   auto entries = parser.ParseLines(lines);
///   if (!entries.ok()) {
///       PGLOGSTATS_LOG_ERROR("{}", entries.status().message());
///   }
///   for (const auto& failure : parser.GetStats().failures) {
///       PGLOGSTATS_LOG_WARN("{}", failure.status.message());
///   }
/// @endcode
class StderrParser {
public:
    explicit StderrParser(StderrParserConfig config = {});

    // =========================================================================
    // Whole-input parsing
    // =========================================================================

    /// @brief Parse a complete sequence of lines
    ///
    /// Resets the parser first. Malformed lines are dropped and recorded in
    /// GetStats(); they never fail the call.
    /// @return Entries in input order, or InvalidArgument when `lines` is empty
    absl::StatusOr<std::vector<LogEntry>> ParseLines(const std::vector<std::string>& lines);

    /// @brief Parse lines read from a stream
    /// @param input Source stream
    /// @param max_lines Stop after this many lines (0 = read everything)
    absl::StatusOr<std::vector<LogEntry>> ParseStream(std::istream& input, size_t max_lines = 0);

    // =========================================================================
    // Incremental parsing
    // =========================================================================

    /// @brief Advance the state machine by one line
    /// @return The entry finalized by this line, if any. FailedPrecondition
    ///         when called after Finish() without Reset().
    absl::StatusOr<std::optional<LogEntry>> ParseLine(std::string_view line);

    /// @brief Signal end of input and flush the open entry
    std::optional<LogEntry> Finish();

    /// @brief Discard any open entry and statistics
    void Reset();

    /// @brief Whether an entry is currently being accumulated
    bool HasOpenEntry() const;

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        size_t lines_read = 0;
        size_t lines_skipped = 0;        ///< blank or unattached lines
        size_t continuation_lines = 0;
        size_t malformed_lines = 0;
        size_t entries_emitted = 0;
        size_t entries_truncated = 0;
        std::vector<LineFailure> failures;
    };

    const Stats& GetStats() const { return stats_; }

    const StderrParserConfig& GetConfig() const { return config_; }

    // =========================================================================
    // Field helpers
    // =========================================================================

    /// @brief Parse "YYYY-MM-DD HH:MM:SS[.fraction]" in the given zone
    ///
    /// `zone` may be empty (UTC), an abbreviation PostgreSQL prints such as
    /// "UTC"/"GMT", a numeric offset ("+02", "-0530") or an IANA name.
    /// Unrecognized abbreviations are read as UTC.
    static absl::StatusOr<std::chrono::system_clock::time_point> ParseTimestamp(
        std::string_view text, std::string_view zone);

    /// @brief Extract the value of "duration: <float> ms"
    static std::optional<double> ExtractDuration(std::string_view message);

private:
    struct Idle {};

    struct Accumulating {
        LogEntry entry;
        bool truncated = false;
    };

    using State = std::variant<Idle, Accumulating>;

    /// Decode a line that matched the prefix pattern
    absl::StatusOr<LogEntry> BuildEntry(
        std::string_view timestamp,
        std::string_view zone,
        std::string_view pid,
        std::string_view rest) const;

    /// Append a continuation line to the open entry
    void AppendContinuation(Accumulating& open, std::string_view line);

    /// Move the open entry out and return to Idle
    std::optional<LogEntry> TakeOpenEntry();

    void RecordFailure(std::string_view line, absl::Status status);

    StderrParserConfig config_;
    State state_ = Idle{};
    Stats stats_;
    size_t line_number_ = 0;
    bool finished_ = false;
};

}  // namespace pglogstats::parser
