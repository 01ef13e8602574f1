/// @file text_formatter_test.cpp
/// @brief Tests for plain-text report rendering

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "output/text_formatter.h"

namespace pglogstats {
namespace {

using output::ReportMetadata;
using output::TextFormatter;
using output::TextFormatterConfig;

AnalysisResult SampleAnalysis() {
    AnalysisResult analysis;
    analysis.total_queries = 11;
    analysis.query_types = {{"SELECT", 5}, {"INSERT", 3}, {"UPDATE", 2}, {"DELETE", 1}};
    analysis.slowest_queries = {
        {"SELECT * FROM large_table WHERE created_at > S", 2500.0},
        {"UPDATE users SET last_login = ? WHERE id = ?", 1200.0},
    };
    analysis.most_frequent_queries = {
        {"SELECT * FROM users WHERE active = N", 15},
        {"SELECT COUNT(*) FROM orders", 8},
    };
    analysis.total_duration = 5500.0;
    analysis.average_duration = 500.0;
    analysis.p95_duration = 2000.0;
    analysis.p99_duration = 2400.0;
    analysis.error_count = 2;
    analysis.connection_count = 3;
    return analysis;
}

TimingAnalysis SampleTiming() {
    TimingAnalysis timing;
    timing.average_response_time = 450.0;
    timing.p95_response_time = 1800.0;
    timing.p99_response_time = 2300.0;
    timing.sample_count = 40;
    timing.hourly_patterns = {{9, 300.0}, {14, 600.0}};
    timing.daily_patterns = {{0, 400.0}};
    return timing;
}

TEST(TextFormatterTest, SummaryBlock) {
    TextFormatter formatter;
    const std::string output = formatter.FormatQueryAnalysis(SampleAnalysis());

    EXPECT_NE(output.find("Query Analysis Report"), std::string::npos);
    EXPECT_NE(output.find("Total Queries: 11"), std::string::npos);
    EXPECT_NE(output.find("Total Duration: 5500.00 ms"), std::string::npos);
    EXPECT_NE(output.find("Average Duration: 500.00 ms"), std::string::npos);
    EXPECT_NE(output.find("P95 Duration: 2000.00 ms"), std::string::npos);
    EXPECT_NE(output.find("P99 Duration: 2400.00 ms"), std::string::npos);
    EXPECT_NE(output.find("Error Count: 2"), std::string::npos);
    EXPECT_NE(output.find("Connection Count: 3"), std::string::npos);
}

TEST(TextFormatterTest, DetailSections) {
    TextFormatter formatter;
    const std::string output = formatter.FormatQueryAnalysis(SampleAnalysis());

    EXPECT_NE(output.find("Query Types:"), std::string::npos);
    EXPECT_NE(output.find("SELECT: 5"), std::string::npos);
    EXPECT_NE(output.find("DELETE: 1"), std::string::npos);

    EXPECT_NE(output.find("Slowest Queries:"), std::string::npos);
    EXPECT_NE(output.find("Duration (ms)"), std::string::npos);
    EXPECT_NE(output.find("2500.00"), std::string::npos);
    EXPECT_NE(output.find("SELECT * FROM large_table"), std::string::npos);

    EXPECT_NE(output.find("Most Frequent Queries:"), std::string::npos);
    EXPECT_NE(output.find("15"), std::string::npos);
    EXPECT_NE(output.find("SELECT COUNT(*) FROM orders"), std::string::npos);
}

TEST(TextFormatterTest, EmptySectionsAreOmitted) {
    TextFormatter formatter;
    const std::string output = formatter.FormatQueryAnalysis(AnalysisResult{});

    EXPECT_NE(output.find("Total Queries: 0"), std::string::npos);
    EXPECT_NE(output.find("Total Duration: 0.00 ms"), std::string::npos);
    EXPECT_EQ(output.find("Query Types:"), std::string::npos);
    EXPECT_EQ(output.find("Slowest Queries:"), std::string::npos);
    EXPECT_EQ(output.find("Most Frequent Queries:"), std::string::npos);
}

TEST(TextFormatterTest, TimingReport) {
    TextFormatter formatter;
    const std::string output = formatter.FormatTimingAnalysis(SampleTiming());

    EXPECT_NE(output.find("Timing Analysis Report"), std::string::npos);
    EXPECT_NE(output.find("Average Response Time: 450.00 ms"), std::string::npos);
    EXPECT_NE(output.find("95th Percentile: 1800.00 ms"), std::string::npos);
    EXPECT_NE(output.find("99th Percentile: 2300.00 ms"), std::string::npos);
    EXPECT_NE(output.find("09:00  300.00 ms"), std::string::npos);
    EXPECT_NE(output.find("14:00  600.00 ms"), std::string::npos);
    EXPECT_NE(output.find("Daily Buckets:"), std::string::npos);
}

TEST(TextFormatterTest, QuickReportKeepsSummariesOnly) {
    ReportMetadata metadata;
    metadata.log_files = {"a.log"};
    metadata.total_entries = 50;

    TextFormatter formatter;
    const std::string output =
        formatter.FormatReport(SampleAnalysis(), SampleTiming(), metadata, true);

    EXPECT_NE(output.find("Files Processed: 1"), std::string::npos);
    EXPECT_NE(output.find("Log Entries: 50"), std::string::npos);
    EXPECT_NE(output.find("Total Queries: 11"), std::string::npos);
    EXPECT_NE(output.find("95th Percentile: 1800.00 ms"), std::string::npos);
    EXPECT_EQ(output.find("Query Types:"), std::string::npos);
    EXPECT_EQ(output.find("Slowest Queries:"), std::string::npos);
    EXPECT_EQ(output.find("Hourly Averages"), std::string::npos);
}

TEST(TextFormatterTest, FullReportIncludesDetails) {
    TextFormatter formatter;
    const std::string output =
        formatter.FormatReport(SampleAnalysis(), SampleTiming(), ReportMetadata{}, false);

    EXPECT_NE(output.find("PostgreSQL Log Analysis"), std::string::npos);
    EXPECT_NE(output.find("Most Frequent Queries:"), std::string::npos);
    EXPECT_NE(output.find("Hourly Averages (UTC):"), std::string::npos);
}

TEST(TextFormatterTest, LongQueriesAreShortened) {
    TextFormatterConfig config;
    config.max_query_width = 20;
    TextFormatter formatter(config);

    AnalysisResult analysis;
    analysis.most_frequent_queries = {{"SELECT a,\nb FROM some_really_long_table_name", 1}};

    const std::string output = formatter.FormatQueryAnalysis(analysis);
    EXPECT_NE(output.find("SELECT a, b FROM ..."), std::string::npos);
    EXPECT_EQ(output.find("some_really_long_table_name"), std::string::npos);
}

TEST(TextFormatterTest, ShorteningKeepsUtf8Intact) {
    TextFormatterConfig config;
    config.max_query_width = 12;
    TextFormatter formatter(config);

    // The 9-byte cut falls inside the two-byte "\xC3\xA9"
    AnalysisResult analysis;
    analysis.most_frequent_queries = {{"SELECT '\xC3\xA9' FROM users", 1}};

    const std::string output = formatter.FormatQueryAnalysis(analysis);
    EXPECT_NE(output.find("SELECT '...\n"), std::string::npos);
    EXPECT_EQ(output.find('\xC3'), std::string::npos);
    EXPECT_EQ(output.find('\xA9'), std::string::npos);
}

TEST(TextFormatterTest, LogEntryListing) {
    std::vector<LogEntry> entries(3);
    entries[0].timestamp = std::chrono::system_clock::from_time_t(1723717800);  // 2024-08-15 10:30:00 UTC
    entries[0].severity = Severity::kStatement;
    entries[0].message = "statement: SELECT * FROM users WHERE active = true";
    entries[1].timestamp = entries[0].timestamp + std::chrono::seconds(1);
    entries[1].severity = Severity::kError;
    entries[1].message = "relation \"missing_table\" does not exist";
    entries[2].timestamp = entries[0].timestamp + std::chrono::milliseconds(2500);
    entries[2].severity = Severity::kDuration;
    entries[2].message = "duration: 45.123 ms";

    TextFormatter formatter;
    const std::string output = formatter.FormatLogEntries(entries);

    EXPECT_NE(output.find("Log Entries (3 total)"), std::string::npos);
    EXPECT_NE(output.find("[1] 2024-08-15 10:30:00 STATEMENT: statement: SELECT * FROM users"),
              std::string::npos);
    EXPECT_NE(output.find("[2] 2024-08-15 10:30:01 ERROR: relation \"missing_table\""),
              std::string::npos);
    EXPECT_NE(output.find("[3] 2024-08-15 10:30:02 DURATION: duration: 45.123 ms"),
              std::string::npos);
}

TEST(TextFormatterTest, EmptyLogEntryListing) {
    TextFormatter formatter;
    const std::string output = formatter.FormatLogEntries({});
    EXPECT_NE(output.find("Log Entries (0 total)"), std::string::npos);
    EXPECT_EQ(output.find("[1]"), std::string::npos);
}

}  // namespace
}  // namespace pglogstats
