/// @file log_discovery.cpp
/// @brief Log file discovery and reading

#include "cli/log_discovery.h"

#include <algorithm>
#include <fstream>
#include <system_error>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace pglogstats::cli {

namespace fs = std::filesystem;

namespace {

bool IsRegularFile(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

absl::Status ScanDirectory(const fs::path& dir, std::vector<fs::path>& files) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return MakeError(ErrorCode::kIoError,
                         absl::StrCat("cannot read log directory ", dir.string(), ": ",
                                      ec.message()));
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec) || type_ec) {
            continue;
        }
        if (IsLogFileName(entry.path())) {
            files.push_back(entry.path());
        } else {
            PGLOGSTATS_LOG_TRACE("Ignoring {}", entry.path().string());
        }
    }
    if (ec) {
        return MakeError(ErrorCode::kIoError,
                         absl::StrCat("error while scanning ", dir.string(), ": ",
                                      ec.message()));
    }
    return absl::OkStatus();
}

void AddExplicitPath(const std::string& text, std::vector<fs::path>& files) {
    const fs::path path(text);
    if (IsRegularFile(path)) {
        files.push_back(path);
    } else {
        PGLOGSTATS_LOG_WARN("Skipping {}: not a regular file", text);
    }
}

}  // namespace

bool IsLogFileName(const fs::path& path) {
    const std::string extension = absl::AsciiStrToLower(path.extension().string());
    if (!extension.empty()) {
        return extension == ".log" || extension == ".txt";
    }
    const std::string name = absl::AsciiStrToLower(path.filename().string());
    return absl::StrContains(name, "postgres") || absl::StrContains(name, "pg");
}

absl::Status ValidateLogDirectory(const fs::path& dir) {
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return InvalidArgumentError(
            absl::StrCat("log directory does not exist: ", dir.string()));
    }
    if (!fs::is_directory(dir, ec)) {
        return InvalidArgumentError(
            absl::StrCat("log directory path is not a directory: ", dir.string()));
    }
    return absl::OkStatus();
}

absl::StatusOr<std::vector<std::string>> ReadListFile(const fs::path& list_file) {
    std::ifstream input(list_file);
    if (!input) {
        return absl::NotFoundError(
            absl::StrCat("cannot open log file list ", list_file.string()));
    }

    std::vector<std::string> entries;
    std::string line;
    while (std::getline(input, line)) {
        const std::string_view trimmed = absl::StripAsciiWhitespace(line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }
        entries.emplace_back(trimmed);
    }
    return entries;
}

absl::StatusOr<std::vector<fs::path>> DiscoverLogFiles(const DiscoveryOptions& options) {
    std::vector<fs::path> files;

    if (options.log_dir) {
        PGLOGSTATS_RETURN_IF_ERROR(ValidateLogDirectory(*options.log_dir));
        PGLOGSTATS_RETURN_IF_ERROR(ScanDirectory(*options.log_dir, files));
    }

    for (const auto& path : options.paths) {
        AddExplicitPath(path, files);
    }

    if (options.list_file) {
        PGLOGSTATS_ASSIGN_OR_RETURN(auto listed, ReadListFile(*options.list_file));
        for (const auto& path : listed) {
            AddExplicitPath(path, files);
        }
    }

    for (auto& file : files) {
        file = file.lexically_normal();
    }
    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());

    files.erase(std::remove_if(files.begin(), files.end(),
                               [](const fs::path& file) {
                                   std::error_code ec;
                                   const auto size = fs::file_size(file, ec);
                                   if (ec) {
                                       PGLOGSTATS_LOG_WARN("Cannot stat {}: {}",
                                                           file.string(), ec.message());
                                       return true;
                                   }
                                   if (size == 0) {
                                       PGLOGSTATS_LOG_WARN("Skipping empty log file: {}",
                                                           file.string());
                                       return true;
                                   }
                                   return false;
                               }),
                files.end());

    PGLOGSTATS_LOG_INFO("Found {} log files to process", files.size());
    return files;
}

absl::StatusOr<std::vector<std::string>> ReadLogFile(const fs::path& path, size_t sample_size) {
    std::ifstream input(path);
    if (!input) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return absl::NotFoundError(absl::StrCat("log file not found: ", path.string()));
        }
        return MakeError(ErrorCode::kIoError, absl::StrCat("cannot open ", path.string()));
    }

    std::vector<std::string> lines;
    std::string line;
    while ((sample_size == 0 || lines.size() < sample_size) && std::getline(input, line)) {
        lines.push_back(std::move(line));
    }

    if (input.bad()) {
        return MakeError(ErrorCode::kIoError,
                         absl::StrCat("read error in ", path.string(), " after ",
                                      lines.size(), " lines"));
    }

    if (sample_size > 0 && lines.size() == sample_size) {
        PGLOGSTATS_LOG_INFO("Limiting analysis to first {} lines of {}", sample_size,
                            path.string());
    }
    return lines;
}

}  // namespace pglogstats::cli
