#include "model/log_entry.h"

#include <absl/strings/match.h>

namespace pglogstats {

std::string_view SeverityToString(Severity severity) {
    switch (severity) {
        case Severity::kDebug: return "DEBUG";
        case Severity::kLog: return "LOG";
        case Severity::kInfo: return "INFO";
        case Severity::kNotice: return "NOTICE";
        case Severity::kWarning: return "WARNING";
        case Severity::kError: return "ERROR";
        case Severity::kFatal: return "FATAL";
        case Severity::kPanic: return "PANIC";
        case Severity::kStatement: return "STATEMENT";
        case Severity::kDuration: return "DURATION";
        case Severity::kUnknown:
        default:
            return "UNKNOWN";
    }
}

Severity SeverityFromKeyword(std::string_view keyword) {
    // DEBUG1..DEBUG5
    if (absl::StartsWith(keyword, "DEBUG")) {
        std::string_view rest = keyword.substr(5);
        if (rest.empty() || (rest.size() == 1 && rest[0] >= '1' && rest[0] <= '5')) {
            return Severity::kDebug;
        }
        return Severity::kUnknown;
    }
    if (keyword == "LOG") return Severity::kLog;
    if (keyword == "INFO") return Severity::kInfo;
    if (keyword == "NOTICE") return Severity::kNotice;
    if (keyword == "WARNING") return Severity::kWarning;
    if (keyword == "ERROR") return Severity::kError;
    if (keyword == "FATAL") return Severity::kFatal;
    if (keyword == "PANIC") return Severity::kPanic;
    if (keyword == "STATEMENT") return Severity::kStatement;
    return Severity::kUnknown;
}

bool IsErrorSeverity(Severity severity) {
    return severity == Severity::kError ||
           severity == Severity::kFatal ||
           severity == Severity::kPanic;
}

}  // namespace pglogstats
