/// @file stderr_parser.cpp
/// @brief PostgreSQL stderr log parser implementation

#include "parser/stderr_parser.h"

#include <algorithm>
#include <cctype>
#include <regex>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/strip.h>
#include <absl/time/time.h>

#include "common/error.h"
#include "common/logging.h"

namespace pglogstats::parser {

namespace {

using SvMatch = std::match_results<std::string_view::const_iterator>;

/// The prefix is bounded in length, so matching runs on a short head of the
/// line and never walks the (possibly huge) SQL payload.
constexpr size_t kMaxPrefixLength = 160;

const std::regex& PrefixRegex() {
    static const std::regex regex(
        R"(^(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}(?:\.\d+)?))"
        R"((?: ([A-Za-z][A-Za-z0-9_/+\-]*|[+\-]\d{2}(?::?\d{2})?))?)"
        R"( \[(\d+)\] )",
        std::regex::ECMAScript | std::regex::optimize);
    return regex;
}

std::string_view GroupView(const SvMatch& match, size_t index) {
    if (!match[index].matched || match[index].length() == 0) {
        return {};
    }
    return std::string_view(&*match[index].first, static_cast<size_t>(match[index].length()));
}

bool IsUpper(char c) { return c >= 'A' && c <= 'Z'; }
bool IsDigit(char c) { return c >= '0' && c <= '9'; }

/// Keywords PostgreSQL attaches to the record they follow
bool IsSecondaryKeyword(std::string_view keyword) {
    return keyword == "DETAIL" || keyword == "HINT" || keyword == "CONTEXT" ||
           keyword == "LOCATION" || keyword == "QUERY";
}

struct LevelMatch {
    size_t keyword_begin = 0;
    size_t payload_begin = 0;
    std::string_view keyword;
};

/// Locate "KEYWORD:" after the session fields. A known level keyword wins;
/// otherwise the first upper-case token followed by ":  " (PostgreSQL pads
/// the level with two spaces) is taken as an unrecognized level.
std::optional<LevelMatch> FindLevelKeyword(std::string_view rest) {
    std::optional<LevelMatch> fallback;

    for (size_t i = 0; i < rest.size(); ++i) {
        if ((i > 0 && rest[i - 1] != ' ') || !IsUpper(rest[i])) {
            continue;
        }

        size_t end = i;
        while (end < rest.size() && (IsUpper(rest[end]) || IsDigit(rest[end]))) {
            ++end;
        }
        if (end >= rest.size() || rest[end] != ':') {
            i = end;
            continue;
        }

        const size_t after_colon = end + 1;
        if (after_colon < rest.size() && rest[after_colon] != ' ' && rest[after_colon] != '\t') {
            i = end;
            continue;
        }

        size_t payload = after_colon;
        while (payload < rest.size() && (rest[payload] == ' ' || rest[payload] == '\t')) {
            ++payload;
        }

        LevelMatch match{i, payload, rest.substr(i, end - i)};
        if (SeverityFromKeyword(match.keyword) != Severity::kUnknown ||
            IsSecondaryKeyword(match.keyword)) {
            return match;
        }
        if (!fallback && absl::StartsWith(rest.substr(after_colon), "  ")) {
            fallback = match;
        }
        i = end;
    }

    return fallback;
}

std::optional<std::string> SessionField(std::string_view value) {
    if (value.empty() || value == "[unknown]") {
        return std::nullopt;
    }
    return std::string(value);
}

/// Fill user/database/application from the "%u@%d %a:" part of the prefix
void ParseSession(std::string_view text, LogEntry& entry) {
    std::string_view session = absl::StripAsciiWhitespace(text);
    absl::ConsumeSuffix(&session, ":");
    session = absl::StripAsciiWhitespace(session);
    if (session.empty()) {
        return;
    }

    const size_t space = session.find(' ');
    std::string_view first = session.substr(0, space);
    std::string_view app = space == std::string_view::npos
        ? std::string_view()
        : absl::StripAsciiWhitespace(session.substr(space + 1));

    const size_t at = first.find('@');
    if (at == std::string_view::npos) {
        app = session;
    } else {
        entry.user = SessionField(first.substr(0, at));
        entry.database = SessionField(first.substr(at + 1));
    }

    entry.application_name = SessionField(app);
}

/// "+02", "-0530", "+05:30" -> offset in seconds
std::optional<int> ParseNumericOffset(std::string_view zone) {
    if (zone.size() < 3 || (zone[0] != '+' && zone[0] != '-')) {
        return std::nullopt;
    }
    const int sign = zone[0] == '-' ? -1 : 1;
    std::string digits;
    for (char c : zone.substr(1)) {
        if (IsDigit(c)) {
            digits.push_back(c);
        } else if (c != ':') {
            return std::nullopt;
        }
    }
    if (digits.size() != 2 && digits.size() != 4) {
        return std::nullopt;
    }
    const int hours = std::stoi(digits.substr(0, 2));
    const int minutes = digits.size() == 4 ? std::stoi(digits.substr(2, 2)) : 0;
    if (hours > 23 || minutes > 59) {
        return std::nullopt;
    }
    return sign * (hours * 3600 + minutes * 60);
}

absl::TimeZone ResolveZone(std::string_view zone) {
    if (zone.empty() || zone == "UTC" || zone == "GMT" || zone == "Z") {
        return absl::UTCTimeZone();
    }
    if (auto offset = ParseNumericOffset(zone)) {
        return absl::FixedTimeZone(*offset);
    }
    absl::TimeZone tz;
    if (absl::LoadTimeZone(std::string(zone), &tz)) {
        return tz;
    }
    PGLOGSTATS_LOG_TRACE("Unknown time zone '{}', reading timestamp as UTC", zone);
    return absl::UTCTimeZone();
}

}  // namespace

StderrParser::StderrParser(StderrParserConfig config)
    : config_(std::move(config)) {}

absl::StatusOr<std::vector<LogEntry>> StderrParser::ParseLines(
    const std::vector<std::string>& lines) {
    if (lines.empty()) {
        return InvalidArgumentError("no input lines to parse");
    }

    Reset();

    std::vector<LogEntry> entries;
    for (const auto& line : lines) {
        auto result = ParseLine(line);
        if (!result.ok()) {
            return result.status();
        }
        if (result->has_value()) {
            entries.push_back(std::move(**result));
        }
    }

    if (auto last = Finish()) {
        entries.push_back(std::move(*last));
    }

    PGLOGSTATS_LOG_DEBUG("Parsed {} entries from {} lines ({} malformed, {} skipped)",
                         entries.size(), stats_.lines_read,
                         stats_.malformed_lines, stats_.lines_skipped);
    return entries;
}

absl::StatusOr<std::vector<LogEntry>> StderrParser::ParseStream(
    std::istream& input, size_t max_lines) {
    Reset();

    std::vector<LogEntry> entries;
    std::string line;
    size_t count = 0;

    while ((max_lines == 0 || count < max_lines) && std::getline(input, line)) {
        ++count;
        auto result = ParseLine(line);
        if (!result.ok()) {
            return result.status();
        }
        if (result->has_value()) {
            entries.push_back(std::move(**result));
        }
    }

    if (input.bad()) {
        return MakeError(ErrorCode::kIoError,
                         absl::StrCat("read failed after ", count, " lines"));
    }
    if (count == 0) {
        return InvalidArgumentError("no input lines to parse");
    }

    if (auto last = Finish()) {
        entries.push_back(std::move(*last));
    }

    PGLOGSTATS_LOG_DEBUG("Parsed {} entries from {} streamed lines ({} malformed)",
                         entries.size(), count, stats_.malformed_lines);
    return entries;
}

absl::StatusOr<std::optional<LogEntry>> StderrParser::ParseLine(std::string_view line) {
    if (finished_) {
        return FailedPreconditionError("ParseLine called after Finish(); call Reset() first");
    }

    ++line_number_;
    ++stats_.lines_read;

    absl::ConsumeSuffix(&line, "\r");

    if (absl::StripAsciiWhitespace(line).empty()) {
        ++stats_.lines_skipped;
        return std::optional<LogEntry>();
    }

    SvMatch match;
    const std::string_view head = line.substr(0, std::min(line.size(), kMaxPrefixLength));
    if (!std::regex_search(head.begin(), head.end(), match, PrefixRegex(),
                           std::regex_constants::match_continuous)) {
        if (auto* open = std::get_if<Accumulating>(&state_)) {
            AppendContinuation(*open, line);
            ++stats_.continuation_lines;
        } else {
            ++stats_.lines_skipped;
            PGLOGSTATS_LOG_TRACE("line {}: no open entry, skipping", line_number_);
        }
        return std::optional<LogEntry>();
    }

    auto entry = BuildEntry(GroupView(match, 1), GroupView(match, 2), GroupView(match, 3),
                            line.substr(static_cast<size_t>(match.length(0))));

    // Any prefixed line closes the open record, even one we cannot decode.
    std::optional<LogEntry> finished = TakeOpenEntry();

    if (!entry.ok()) {
        RecordFailure(line, entry.status());
        return finished;
    }

    state_ = Accumulating{std::move(*entry), false};
    return finished;
}

std::optional<LogEntry> StderrParser::Finish() {
    finished_ = true;
    return TakeOpenEntry();
}

void StderrParser::Reset() {
    state_ = Idle{};
    stats_ = Stats{};
    line_number_ = 0;
    finished_ = false;
}

bool StderrParser::HasOpenEntry() const {
    return std::holds_alternative<Accumulating>(state_);
}

absl::StatusOr<LogEntry> StderrParser::BuildEntry(
    std::string_view timestamp,
    std::string_view zone,
    std::string_view pid,
    std::string_view rest) const {
    LogEntry entry;

    PGLOGSTATS_ASSIGN_OR_RETURN(entry.timestamp, ParseTimestamp(timestamp, zone));
    entry.process_id = std::string(pid);

    auto level = FindLevelKeyword(rest);
    if (!level) {
        return MakeError(ErrorCode::kParseError, "missing log level keyword after process id");
    }

    ParseSession(rest.substr(0, level->keyword_begin), entry);

    const std::string_view payload =
        absl::StripTrailingAsciiWhitespace(rest.substr(level->payload_begin));
    entry.severity = SeverityFromKeyword(level->keyword);
    entry.message = std::string(payload);

    if (level->keyword == "LOG") {
        std::string_view sql = payload;
        if (absl::StartsWith(payload, "duration:")) {
            auto duration = ExtractDuration(payload);
            if (!duration) {
                return MakeError(ErrorCode::kParseError,
                                 absl::StrCat("malformed duration in '", payload, "'"));
            }
            entry.severity = Severity::kDuration;
            entry.duration_ms = *duration;
        } else if (absl::ConsumePrefix(&sql, "statement:")) {
            entry.severity = Severity::kStatement;
            entry.query = std::string(absl::StripAsciiWhitespace(sql));
        }
    } else if (entry.severity == Severity::kStatement) {
        entry.query = std::string(payload);
    }

    return entry;
}

void StderrParser::AppendContinuation(Accumulating& open, std::string_view line) {
    LogEntry& entry = open.entry;

    if (config_.max_entry_bytes > 0 &&
        entry.message.size() + line.size() + 1 > config_.max_entry_bytes) {
        if (!open.truncated) {
            PGLOGSTATS_LOG_DEBUG("line {}: entry exceeds {} bytes, dropping continuation text",
                                 line_number_, config_.max_entry_bytes);
        }
        open.truncated = true;
        return;
    }

    entry.message.push_back('\n');
    entry.message.append(line.data(), line.size());

    if (entry.query) {
        if (entry.query->empty()) {
            entry.query->assign(line.data(), line.size());
        } else {
            entry.query->push_back('\n');
            entry.query->append(line.data(), line.size());
        }
    }
}

std::optional<LogEntry> StderrParser::TakeOpenEntry() {
    auto* open = std::get_if<Accumulating>(&state_);
    if (open == nullptr) {
        return std::nullopt;
    }

    LogEntry entry = std::move(open->entry);
    if (open->truncated) {
        ++stats_.entries_truncated;
    }
    ++stats_.entries_emitted;
    state_ = Idle{};
    return entry;
}

void StderrParser::RecordFailure(std::string_view line, absl::Status status) {
    ++stats_.malformed_lines;

    absl::Status located(status.code(), absl::StrCat("line ", line_number_, ": ", status.message()));
    PGLOGSTATS_LOG_DEBUG("Dropping malformed line: {}", located.message());

    if (stats_.failures.size() < config_.max_recorded_failures) {
        stats_.failures.push_back(LineFailure{line_number_, std::string(line), std::move(located)});
    }
}

absl::StatusOr<std::chrono::system_clock::time_point> StderrParser::ParseTimestamp(
    std::string_view text, std::string_view zone) {
    absl::Time time;
    std::string error;
    if (!absl::ParseTime("%Y-%m-%d %H:%M:%E*S", text, ResolveZone(zone), &time, &error)) {
        return MakeError(ErrorCode::kTimestampError,
                         absl::StrCat("invalid timestamp '", text, "': ", error));
    }
    return absl::ToChronoTime(time);
}

std::optional<double> StderrParser::ExtractDuration(std::string_view message) {
    static const std::regex duration_regex(R"(duration: ([0-9]+(?:\.[0-9]+)?) ms)",
                                           std::regex::ECMAScript | std::regex::optimize);

    SvMatch match;
    if (!std::regex_search(message.begin(), message.end(), match, duration_regex)) {
        return std::nullopt;
    }

    double value = 0.0;
    if (!absl::SimpleAtod(match[1].str(), &value)) {
        return std::nullopt;
    }
    return value;
}

}  // namespace pglogstats::parser
