/// @file query_analyzer_test.cpp
/// @brief Tests for query aggregation

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "analytics/query_analyzer.h"

namespace pglogstats {
namespace {

using analytics::QueryAnalyzer;
using analytics::QueryAnalyzerConfig;
using ::testing::DoubleEq;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Pair;

LogEntry Statement(const std::string& sql) {
    LogEntry entry;
    entry.severity = Severity::kStatement;
    entry.message = "statement: " + sql;
    entry.query = sql;
    return entry;
}

LogEntry Duration(double ms, const std::string& suffix = "") {
    LogEntry entry;
    entry.severity = Severity::kDuration;
    entry.duration_ms = ms;
    entry.message = "duration: " + std::to_string(ms) + " ms" + suffix;
    return entry;
}

LogEntry Message(Severity severity, const std::string& message) {
    LogEntry entry;
    entry.severity = severity;
    entry.message = message;
    return entry;
}

class QueryAnalyzerTest : public ::testing::Test {
protected:
    AnalysisResult Analyze(const std::vector<LogEntry>& entries) {
        auto result = analyzer_.Analyze(entries);
        EXPECT_TRUE(result.ok()) << result.status().message();
        return result.ok() ? *result : AnalysisResult{};
    }

    QueryAnalyzer analyzer_;
};

TEST_F(QueryAnalyzerTest, StatementAndDurationScenario) {
    auto result = Analyze({Statement("SELECT 1"), Duration(0.123)});

    EXPECT_EQ(result.total_queries, 1u);
    ASSERT_EQ(result.query_types.size(), 1u);
    EXPECT_EQ(result.query_types.at("SELECT"), 1u);
    EXPECT_DOUBLE_EQ(result.total_duration, 0.123);
    EXPECT_DOUBLE_EQ(result.average_duration, 0.123);
    EXPECT_THAT(result.most_frequent_queries, ElementsAre(Pair("SELECT N", 1u)));
}

TEST_F(QueryAnalyzerTest, ParametersShareOneKey) {
    auto result = Analyze({
        Statement("SELECT * FROM users WHERE id = $1"),
        Statement("SELECT * FROM users WHERE id = $2"),
    });

    EXPECT_THAT(result.most_frequent_queries,
                ElementsAre(Pair("SELECT * FROM users WHERE id = ?", 2u)));
}

TEST_F(QueryAnalyzerTest, FrequentQueriesTieBreakByFirstSeen) {
    auto result = Analyze({
        Statement("SELECT a FROM t"),
        Statement("SELECT b FROM t"),
        Statement("SELECT b FROM t"),
        Statement("SELECT a FROM t"),
        Statement("SELECT c FROM t"),
        Statement("SELECT c FROM t"),
        Statement("SELECT c FROM t"),
    });

    EXPECT_THAT(result.most_frequent_queries,
                ElementsAre(Pair("SELECT c FROM t", 3u),
                            Pair("SELECT a FROM t", 2u),
                            Pair("SELECT b FROM t", 2u)));
}

TEST_F(QueryAnalyzerTest, QueryTypeCounts) {
    auto result = Analyze({
        Statement("SELECT 1"),
        Statement("select 2"),
        Statement("INSERT INTO t VALUES (1)"),
        Statement("UPDATE t SET a = 1"),
        Statement("DELETE FROM t"),
        Statement("CREATE TABLE x (id int)"),
        Statement("DROP TABLE x"),
        Statement("BEGIN"),
    });

    EXPECT_EQ(result.total_queries, 8u);
    EXPECT_EQ(result.query_types.at("SELECT"), 2u);
    EXPECT_EQ(result.query_types.at("INSERT"), 1u);
    EXPECT_EQ(result.query_types.at("UPDATE"), 1u);
    EXPECT_EQ(result.query_types.at("DELETE"), 1u);
    EXPECT_EQ(result.query_types.at("DDL"), 2u);
    EXPECT_EQ(result.query_types.at("OTHER"), 1u);
}

TEST_F(QueryAnalyzerTest, DurationAggregates) {
    auto result = Analyze({Duration(10.0), Duration(20.0), Duration(30.0)});

    EXPECT_EQ(result.total_queries, 0u);
    EXPECT_DOUBLE_EQ(result.total_duration, 60.0);
    EXPECT_DOUBLE_EQ(result.average_duration, 20.0);
    EXPECT_DOUBLE_EQ(result.p95_duration, 30.0);
    EXPECT_DOUBLE_EQ(result.p99_duration, 30.0);
}

TEST_F(QueryAnalyzerTest, PercentilesOverOneToHundred) {
    std::vector<LogEntry> entries;
    for (int i = 100; i >= 1; --i) {
        entries.push_back(Duration(i));
    }

    auto result = Analyze(entries);
    EXPECT_DOUBLE_EQ(result.p95_duration, 95.0);
    EXPECT_DOUBLE_EQ(result.p99_duration, 99.0);
    EXPECT_DOUBLE_EQ(result.average_duration, 50.5);
}

TEST_F(QueryAnalyzerTest, SlowestQueriesOrderAndLabels) {
    LogEntry timed_statement = Statement("SELECT * FROM big WHERE id = 7");
    timed_statement.duration_ms = 40.0;

    auto result = Analyze({
        Duration(5.0, " first"),
        Duration(50.0, " second"),
        timed_statement,
        Duration(50.0, " fourth"),
    });

    EXPECT_THAT(result.slowest_queries,
                ElementsAre(Pair(HasSubstr("second"), DoubleEq(50.0)),
                            Pair(HasSubstr("fourth"), DoubleEq(50.0)),
                            Pair("SELECT * FROM big WHERE id = N", DoubleEq(40.0)),
                            Pair(HasSubstr("first"), DoubleEq(5.0))));
}

TEST_F(QueryAnalyzerTest, EmptyInputYieldsZeroes) {
    auto result = Analyze({});

    EXPECT_EQ(result.total_queries, 0u);
    EXPECT_TRUE(result.query_types.empty());
    EXPECT_TRUE(result.slowest_queries.empty());
    EXPECT_TRUE(result.most_frequent_queries.empty());
    EXPECT_DOUBLE_EQ(result.total_duration, 0.0);
    EXPECT_DOUBLE_EQ(result.average_duration, 0.0);
    EXPECT_DOUBLE_EQ(result.p95_duration, 0.0);
    EXPECT_DOUBLE_EQ(result.p99_duration, 0.0);
    EXPECT_EQ(result.error_count, 0u);
    EXPECT_EQ(result.connection_count, 0u);
}

TEST_F(QueryAnalyzerTest, ErrorAndConnectionCounts) {
    auto result = Analyze({
        Message(Severity::kError, "relation \"x\" does not exist"),
        Message(Severity::kFatal, "password authentication failed for user \"bob\""),
        Message(Severity::kPanic, "could not write to file"),
        Message(Severity::kWarning, "there is no transaction in progress"),
        Message(Severity::kLog, "connection received: host=10.0.0.1 port=5000"),
        Message(Severity::kLog, "connection authorized: user=app database=shop"),
        Message(Severity::kLog, "disconnection: session time: 0:00:01.000 user=app"),
        Message(Severity::kLog, "checkpoint complete"),
    });

    EXPECT_EQ(result.error_count, 3u);
    EXPECT_EQ(result.connection_count, 3u);
}

TEST(QueryAnalyzerConfigTest, ListsAreCapped) {
    QueryAnalyzerConfig config;
    config.max_frequent_queries = 2;
    config.max_slow_queries = 1;
    QueryAnalyzer analyzer(config);

    auto result = analyzer.Analyze({
        Statement("SELECT 1 FROM a"),
        Statement("SELECT 1 FROM b"),
        Statement("SELECT 1 FROM c"),
        Duration(1.0),
        Duration(3.0),
    });
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->most_frequent_queries.size(), 2u);
    ASSERT_EQ(result->slowest_queries.size(), 1u);
    EXPECT_DOUBLE_EQ(result->slowest_queries[0].second, 3.0);
}

TEST(QueryAnalyzerConfigTest, ThresholdExcludesFastQueries) {
    QueryAnalyzerConfig config;
    config.slow_query_threshold_ms = 20.0;
    QueryAnalyzer analyzer(config);

    auto result = analyzer.Analyze({Duration(5.0), Duration(20.0), Duration(25.0)});
    ASSERT_TRUE(result.ok());
    EXPECT_THAT(result->slowest_queries, ElementsAre(Pair(HasSubstr("25"), DoubleEq(25.0))));

    // The threshold only filters the list; aggregates still cover every duration
    EXPECT_DOUBLE_EQ(result->total_duration, 50.0);
}

TEST(QueryAnalyzerConfigTest, NegativeThresholdIsRejected) {
    QueryAnalyzerConfig config;
    config.slow_query_threshold_ms = -1.0;
    QueryAnalyzer analyzer(config);

    auto result = analyzer.Analyze({});
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(QueryAnalyzerHelperTest, CalculateMetrics) {
    auto metrics = QueryAnalyzer::CalculateMetrics({30.0, 10.0, 20.0});
    EXPECT_EQ(metrics.total_queries, 3u);
    EXPECT_DOUBLE_EQ(metrics.total_duration, 60.0);
    EXPECT_DOUBLE_EQ(metrics.average_duration, 20.0);
    EXPECT_DOUBLE_EQ(metrics.min_duration, 10.0);
    EXPECT_DOUBLE_EQ(metrics.max_duration, 30.0);
    EXPECT_DOUBLE_EQ(metrics.p95_duration, 30.0);

    auto empty = QueryAnalyzer::CalculateMetrics({});
    EXPECT_EQ(empty.total_queries, 0u);
    EXPECT_DOUBLE_EQ(empty.max_duration, 0.0);
}

TEST(QueryAnalyzerHelperTest, FindSlowQueriesWithExplicitThreshold) {
    QueryAnalyzer analyzer;
    auto slow = analyzer.FindSlowQueries({Duration(100.0), Duration(900.0), Statement("SELECT 1")},
                                         500.0);
    ASSERT_EQ(slow.size(), 1u);
    EXPECT_DOUBLE_EQ(slow[0].second, 900.0);
}

TEST(QueryAnalyzerHelperTest, QueryTypeDistribution) {
    auto distribution = QueryAnalyzer::GetQueryTypeDistribution({
        Statement("SELECT 1"),
        Statement("ALTER TABLE t ADD b int"),
        Duration(1.0),
    });
    ASSERT_EQ(distribution.size(), 2u);
    EXPECT_EQ(distribution.at("SELECT"), 1u);
    EXPECT_EQ(distribution.at("DDL"), 1u);
}

TEST(QueryAnalyzerHelperTest, ErrorRate) {
    EXPECT_DOUBLE_EQ(QueryAnalyzer::CalculateErrorRate({}), 0.0);
    EXPECT_DOUBLE_EQ(QueryAnalyzer::CalculateErrorRate({
                         Message(Severity::kError, "boom"),
                         Message(Severity::kLog, "ok"),
                         Message(Severity::kLog, "ok"),
                         Message(Severity::kWarning, "hmm"),
                     }),
                     0.25);
}

TEST(QueryAnalyzerHelperTest, ConnectionMessages) {
    EXPECT_TRUE(QueryAnalyzer::IsConnectionMessage("connection received: host=[local]"));
    EXPECT_TRUE(QueryAnalyzer::IsConnectionMessage("connection authorized: user=postgres"));
    EXPECT_TRUE(QueryAnalyzer::IsConnectionMessage("disconnection: session time: 0:00:00.01"));
    EXPECT_FALSE(QueryAnalyzer::IsConnectionMessage("could not receive data from client"));
}

}  // namespace
}  // namespace pglogstats
