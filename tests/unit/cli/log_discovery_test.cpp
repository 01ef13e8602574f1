/// @file log_discovery_test.cpp
/// @brief Tests for log file discovery and reading

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "cli/log_discovery.h"

namespace pglogstats::cli {
namespace {

namespace fs = std::filesystem;

class LogDiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() /
               (std::string("pglogstats_discovery_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path Write(const std::string& name, const std::string& content) {
        const fs::path path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    fs::path dir_;
};

TEST(LogFileNameTest, RecognizesLogNames) {
    EXPECT_TRUE(IsLogFileName("postgresql-2024-08-14.log"));
    EXPECT_TRUE(IsLogFileName("server.LOG"));
    EXPECT_TRUE(IsLogFileName("dump.txt"));
    EXPECT_TRUE(IsLogFileName("postgres"));
    EXPECT_TRUE(IsLogFileName("pg_server"));

    EXPECT_FALSE(IsLogFileName("report.json"));
    EXPECT_FALSE(IsLogFileName("postgresql.conf"));
    EXPECT_FALSE(IsLogFileName("README"));
}

TEST_F(LogDiscoveryTest, ValidateLogDirectory) {
    EXPECT_TRUE(ValidateLogDirectory(dir_).ok());

    auto missing = ValidateLogDirectory(dir_ / "missing");
    EXPECT_EQ(missing.code(), absl::StatusCode::kInvalidArgument);

    const fs::path file = Write("a.log", "x\n");
    auto not_dir = ValidateLogDirectory(file);
    EXPECT_EQ(not_dir.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_NE(not_dir.message().find("not a directory"), std::string::npos);
}

TEST_F(LogDiscoveryTest, ScansDirectoryForLogFiles) {
    Write("b.log", "line\n");
    Write("a.log", "line\n");
    Write("notes.md", "line\n");
    Write("empty.log", "");
    fs::create_directories(dir_ / "nested.log");

    DiscoveryOptions options;
    options.log_dir = dir_;

    auto files = DiscoverLogFiles(options);
    ASSERT_TRUE(files.ok()) << files.status().message();
    ASSERT_EQ(files->size(), 2u);
    EXPECT_EQ((*files)[0].filename(), "a.log");
    EXPECT_EQ((*files)[1].filename(), "b.log");
}

TEST_F(LogDiscoveryTest, MissingDirectoryFails) {
    DiscoveryOptions options;
    options.log_dir = dir_ / "missing";

    auto files = DiscoverLogFiles(options);
    EXPECT_EQ(files.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(LogDiscoveryTest, MergesSourcesWithoutDuplicates) {
    const fs::path a = Write("a.log", "line\n");
    const fs::path b = Write("b.custom", "line\n");
    const fs::path list = Write("files.lst",
                                "# inputs\n\n" + a.string() + "\n  " + b.string() + "  \n");

    DiscoveryOptions options;
    options.log_dir = dir_;
    options.paths = {a.string(), (dir_ / "missing.log").string()};
    options.list_file = list;

    auto files = DiscoverLogFiles(options);
    ASSERT_TRUE(files.ok()) << files.status().message();
    ASSERT_EQ(files->size(), 2u);
    EXPECT_EQ((*files)[0].filename(), "a.log");
    EXPECT_EQ((*files)[1].filename(), "b.custom");
}

TEST_F(LogDiscoveryTest, ReadListFile) {
    const fs::path list = Write("files.lst", "# comment\n/tmp/a.log\n\n   \n/tmp/b.log\n");

    auto entries = ReadListFile(list);
    ASSERT_TRUE(entries.ok());
    ASSERT_EQ(entries->size(), 2u);
    EXPECT_EQ((*entries)[0], "/tmp/a.log");
    EXPECT_EQ((*entries)[1], "/tmp/b.log");

    EXPECT_EQ(ReadListFile(dir_ / "missing.lst").status().code(),
              absl::StatusCode::kNotFound);
}

TEST_F(LogDiscoveryTest, ReadLogFileHonorsSampleSize) {
    const fs::path path = Write("a.log", "one\ntwo\nthree\n");

    auto all = ReadLogFile(path);
    ASSERT_TRUE(all.ok());
    EXPECT_EQ(all->size(), 3u);

    auto head = ReadLogFile(path, 2);
    ASSERT_TRUE(head.ok());
    ASSERT_EQ(head->size(), 2u);
    EXPECT_EQ((*head)[1], "two");

    auto larger = ReadLogFile(path, 10);
    ASSERT_TRUE(larger.ok());
    EXPECT_EQ(larger->size(), 3u);
}

TEST_F(LogDiscoveryTest, ReadLogFileMissing) {
    auto lines = ReadLogFile(dir_ / "missing.log");
    EXPECT_EQ(lines.status().code(), absl::StatusCode::kNotFound);
}

}  // namespace
}  // namespace pglogstats::cli
