#pragma once

/// @file report_metadata.h
/// @brief Run information attached to rendered reports

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace pglogstats::output {

/// @brief Describes the run that produced a report
struct ReportMetadata {
    std::string tool_version;

    /// Log files in processing order
    std::vector<std::string> log_files;

    uint64_t total_entries = 0;
    uint64_t parse_failures = 0;

    std::chrono::system_clock::time_point generated_at = std::chrono::system_clock::now();
};

}  // namespace pglogstats::output
