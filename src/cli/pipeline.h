#pragma once

/// @file pipeline.h
/// @brief Parse a set of log files and run both analyzers over the result

#include <filesystem>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "cli/settings.h"
#include "model/analysis_result.h"
#include "model/log_entry.h"

namespace pglogstats::cli {

/// @brief Entries gathered from all readable input files
struct ParsedLogs {
    /// Concatenated in file order; no cross-file reordering
    std::vector<LogEntry> entries;

    /// Files that were read and parsed
    std::vector<std::string> files;

    /// Files skipped because they could not be read or held no lines
    std::vector<std::string> failed_files;

    uint64_t lines_read = 0;
    uint64_t parse_failures = 0;
};

/// @brief Both analyses over one entry sequence
struct AnalysisReport {
    AnalysisResult analysis;
    TimingAnalysis timing;
};

/// @brief Parse files in parallel, one task per file
///
/// Unreadable files are logged and skipped. The worker count comes from
/// settings.jobs (0 = hardware concurrency), capped at the number of files.
ParsedLogs ParseLogFiles(const std::vector<std::filesystem::path>& files,
                         const Settings& settings);

/// @brief Run the query and timing analyzers
absl::StatusOr<AnalysisReport> AnalyzeEntries(const std::vector<LogEntry>& entries,
                                              const Settings& settings);

}  // namespace pglogstats::cli
