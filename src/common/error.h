#pragma once

/// @file error.h
/// @brief pglogstats error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace pglogstats {

/// @brief Error codes specific to pglogstats
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kFailedPrecondition,
    kOutOfRange,
    kInternal,

    // pglogstats-specific error codes
    kParseError,          ///< A log line could not be decoded
    kTimestampError,      ///< Timestamp field present but not a valid instant
    kIoError,             ///< Reading a log file or writing a report failed
    kConfigurationError,  ///< Invalid or conflicting settings
    kSerializationError,  ///< Report rendering failed
};

/// @brief Convert pglogstats error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Human readable name of an error code, e.g. "PARSE_ERROR"
std::string_view ErrorCodeName(ErrorCode code);

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Create an invalid argument error
inline absl::Status InvalidArgumentError(std::string_view message) {
    return absl::InvalidArgumentError(message);
}

/// @brief Create a failed precondition error
inline absl::Status FailedPreconditionError(std::string_view message) {
    return absl::FailedPreconditionError(message);
}

/// @brief Create a configuration error for the given key
inline absl::Status ConfigurationError(std::string_view key, std::string_view message) {
    return MakeError(ErrorCode::kConfigurationError,
                     absl::StrCat("invalid value for '", key, "': ", message));
}

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define PGLOGSTATS_RETURN_IF_ERROR(expr)                                       \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define PGLOGSTATS_ASSIGN_OR_RETURN(lhs, rhs)                                  \
    PGLOGSTATS_ASSIGN_OR_RETURN_IMPL(                                          \
        PGLOGSTATS_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define PGLOGSTATS_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                   \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define PGLOGSTATS_CONCAT(a, b) PGLOGSTATS_CONCAT_IMPL(a, b)
#define PGLOGSTATS_CONCAT_IMPL(a, b) a##b

}  // namespace pglogstats
