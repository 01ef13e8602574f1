#include "common/error.h"

namespace pglogstats {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kParseError:
        case ErrorCode::kTimestampError:
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kFailedPrecondition:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kOutOfRange:
            return absl::StatusCode::kOutOfRange;
        case ErrorCode::kIoError:
            return absl::StatusCode::kUnavailable;
        case ErrorCode::kInternal:
        case ErrorCode::kSerializationError:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

std::string_view ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk: return "OK";
        case ErrorCode::kInvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::kNotFound: return "NOT_FOUND";
        case ErrorCode::kFailedPrecondition: return "FAILED_PRECONDITION";
        case ErrorCode::kOutOfRange: return "OUT_OF_RANGE";
        case ErrorCode::kInternal: return "INTERNAL";
        case ErrorCode::kParseError: return "PARSE_ERROR";
        case ErrorCode::kTimestampError: return "TIMESTAMP_ERROR";
        case ErrorCode::kIoError: return "IO_ERROR";
        case ErrorCode::kConfigurationError: return "CONFIGURATION_ERROR";
        case ErrorCode::kSerializationError: return "SERIALIZATION_ERROR";
        case ErrorCode::kUnknown:
        default:
            return "UNKNOWN";
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    return absl::Status(ToAbslCode(code), absl::StrCat(ErrorCodeName(code), ": ", message));
}

}  // namespace pglogstats
