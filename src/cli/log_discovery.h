#pragma once

/// @file log_discovery.h
/// @brief Locating and reading PostgreSQL log files

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

namespace pglogstats::cli {

/// @brief Where to look for log files
struct DiscoveryOptions {
    /// Explicit file paths; entries that are not regular files are skipped
    std::vector<std::string> paths;

    /// Directory scanned (non-recursively) for log-like file names
    std::optional<std::filesystem::path> log_dir;

    /// File listing one log path per line; blank lines and '#' comments ignored
    std::optional<std::filesystem::path> list_file;
};

/// @brief True for *.log / *.txt, or extension-less names mentioning postgres/pg
bool IsLogFileName(const std::filesystem::path& path);

/// @brief Validate that a log directory exists and is a directory
/// @return InvalidArgument naming the directory otherwise
absl::Status ValidateLogDirectory(const std::filesystem::path& dir);

/// @brief Read a list file into its path entries
absl::StatusOr<std::vector<std::string>> ReadListFile(const std::filesystem::path& list_file);

/// @brief Collect log files from all configured sources
///
/// The result is sorted and free of duplicates. Empty files are dropped with
/// a warning.
absl::StatusOr<std::vector<std::filesystem::path>> DiscoverLogFiles(
    const DiscoveryOptions& options);

/// @brief Read the lines of a log file
/// @param sample_size Maximum number of lines to read (0 = all)
/// @return NotFound for a missing file, Unavailable if it cannot be read
absl::StatusOr<std::vector<std::string>> ReadLogFile(
    const std::filesystem::path& path, size_t sample_size = 0);

}  // namespace pglogstats::cli
