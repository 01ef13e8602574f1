/// @file error_test.cpp
/// @brief Tests for status helpers and propagation macros

#include <gtest/gtest.h>

#include "common/error.h"

namespace pglogstats {
namespace {

absl::StatusOr<int> ParsePositive(int value) {
    if (value <= 0) {
        return InvalidArgumentError("value must be positive");
    }
    return value;
}

absl::StatusOr<int> Doubled(int value) {
    PGLOGSTATS_ASSIGN_OR_RETURN(int parsed, ParsePositive(value));
    return parsed * 2;
}

absl::Status CheckBoth(int a, int b) {
    PGLOGSTATS_RETURN_IF_ERROR(ParsePositive(a).status());
    PGLOGSTATS_RETURN_IF_ERROR(ParsePositive(b).status());
    return absl::OkStatus();
}

TEST(ErrorTest, DomainCodesMapToAbslCodes) {
    EXPECT_EQ(ToAbslCode(ErrorCode::kOk), absl::StatusCode::kOk);
    EXPECT_EQ(ToAbslCode(ErrorCode::kParseError), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(ToAbslCode(ErrorCode::kTimestampError), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(ToAbslCode(ErrorCode::kConfigurationError), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(ToAbslCode(ErrorCode::kIoError), absl::StatusCode::kUnavailable);
    EXPECT_EQ(ToAbslCode(ErrorCode::kSerializationError), absl::StatusCode::kInternal);
    EXPECT_EQ(ToAbslCode(ErrorCode::kFailedPrecondition),
              absl::StatusCode::kFailedPrecondition);
}

TEST(ErrorTest, MakeErrorPrefixesCodeName) {
    auto status = MakeError(ErrorCode::kTimestampError, "bad month");
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(status.message(), "TIMESTAMP_ERROR: bad month");
}

TEST(ErrorTest, ConfigurationErrorNamesKey) {
    auto status = ConfigurationError("input.jobs", "must be at least 0");
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_NE(status.message().find("'input.jobs'"), std::string::npos);
    EXPECT_NE(status.message().find("CONFIGURATION_ERROR"), std::string::npos);
}

TEST(ErrorTest, AssignOrReturn) {
    auto ok = Doubled(21);
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(*ok, 42);

    auto failed = Doubled(-1);
    EXPECT_FALSE(failed.ok());
    EXPECT_EQ(failed.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(ErrorTest, ReturnIfError) {
    EXPECT_TRUE(CheckBoth(1, 2).ok());
    EXPECT_EQ(CheckBoth(1, 0).code(), absl::StatusCode::kInvalidArgument);
}

}  // namespace
}  // namespace pglogstats
