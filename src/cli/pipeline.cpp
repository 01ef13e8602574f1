/// @file pipeline.cpp
/// @brief File-level parsing and analysis orchestration

#include "cli/pipeline.h"

#include <algorithm>
#include <future>
#include <iterator>
#include <thread>

#include "cli/log_discovery.h"
#include "common/error.h"
#include "common/logging.h"
#include "common/thread_pool.h"
#include "parser/stderr_parser.h"

namespace pglogstats::cli {

namespace {

struct FileResult {
    absl::StatusOr<std::vector<LogEntry>> entries;
    parser::StderrParser::Stats stats;
};

FileResult ParseOneFile(const std::filesystem::path& path, const Settings& settings) {
    FileResult result{std::vector<LogEntry>{}, {}};

    auto lines = ReadLogFile(path, settings.sample_size);
    if (!lines.ok()) {
        result.entries = lines.status();
        return result;
    }

    parser::StderrParser parser(settings.parser);
    result.entries = parser.ParseLines(*lines);
    result.stats = parser.GetStats();
    return result;
}

size_t WorkerCount(size_t requested, size_t files) {
    size_t workers = requested;
    if (workers == 0) {
        workers = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    return std::max<size_t>(1, std::min(workers, files));
}

}  // namespace

ParsedLogs ParseLogFiles(const std::vector<std::filesystem::path>& files,
                         const Settings& settings) {
    ParsedLogs parsed;
    if (files.empty()) {
        return parsed;
    }

    ThreadPool pool(WorkerCount(settings.jobs, files.size()));
    PGLOGSTATS_LOG_DEBUG("Parsing {} files on {} workers", files.size(), pool.Size());

    std::vector<std::future<FileResult>> pending;
    pending.reserve(files.size());
    for (const auto& file : files) {
        pending.push_back(pool.Submit([&file, &settings]() {
            return ParseOneFile(file, settings);
        }));
    }

    for (size_t i = 0; i < files.size(); ++i) {
        FileResult result = pending[i].get();
        const std::string name = files[i].string();

        if (!result.entries.ok()) {
            PGLOGSTATS_LOG_WARN("Failed to process {}: {}", name,
                                result.entries.status().message());
            parsed.failed_files.push_back(name);
            continue;
        }

        PGLOGSTATS_LOG_INFO("Processed {} entries from {} ({} lines, {} malformed)",
                            result.entries->size(), name, result.stats.lines_read,
                            result.stats.malformed_lines);
        for (const auto& failure : result.stats.failures) {
            PGLOGSTATS_LOG_DEBUG("{}: {}", name, failure.status.message());
        }

        parsed.lines_read += result.stats.lines_read;
        parsed.parse_failures += result.stats.malformed_lines;
        parsed.files.push_back(name);
        std::move(result.entries->begin(), result.entries->end(),
                  std::back_inserter(parsed.entries));
    }

    return parsed;
}

absl::StatusOr<AnalysisReport> AnalyzeEntries(const std::vector<LogEntry>& entries,
                                              const Settings& settings) {
    AnalysisReport report;

    analytics::QueryAnalyzer query_analyzer(settings.analysis);
    PGLOGSTATS_ASSIGN_OR_RETURN(report.analysis, query_analyzer.Analyze(entries));

    analytics::TimingAnalyzer timing_analyzer(settings.timing);
    PGLOGSTATS_ASSIGN_OR_RETURN(report.timing, timing_analyzer.AnalyzeTiming(entries));

    return report;
}

}  // namespace pglogstats::cli
