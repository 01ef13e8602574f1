/// @file main.cpp
/// @brief pglogstats command line entry point

#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "cli/log_discovery.h"
#include "cli/pipeline.h"
#include "cli/settings.h"
#include "common/config.h"
#include "common/logging.h"
#include "output/json_formatter.h"
#include "output/text_formatter.h"

#ifndef PGLOGSTATS_VERSION
#define PGLOGSTATS_VERSION "0.1.0"
#endif

namespace {

constexpr int kExitOk = 0;
constexpr int kExitNoInput = 1;
constexpr int kExitInvalidConfig = 2;
constexpr int kExitOutputFailure = 3;

constexpr const char* kEnvPrefix = "PGLOGSTATS_";

struct CommandLine {
    std::vector<std::string> log_files;
    std::string log_dir;
    std::string logfile_list;
    std::string output_format;
    std::optional<size_t> sample_size;
    std::string outfile;
    std::string config_path;
    std::string log_level;
    std::optional<size_t> jobs;
    bool quick = false;
    bool list_entries = false;
    bool quiet = false;
};

/// Command line flags take precedence over file and environment values
void ApplyOverrides(const CommandLine& cmd, pglogstats::Config& config) {
    if (!cmd.output_format.empty()) {
        config.Set("output.format", cmd.output_format);
    }
    if (cmd.sample_size) {
        config.Set("input.sample_size", static_cast<int64_t>(*cmd.sample_size));
    }
    if (cmd.jobs) {
        config.Set("input.jobs", static_cast<int64_t>(*cmd.jobs));
    }
    if (!cmd.log_level.empty()) {
        config.Set("logging.level", cmd.log_level);
    }
}

bool WriteOutput(const std::string& outfile, const std::string& report) {
    if (outfile.empty() || outfile == "-") {
        std::cout << report;
        if (!report.empty() && report.back() != '\n') {
            std::cout << '\n';
        }
        std::cout.flush();
        return static_cast<bool>(std::cout);
    }

    std::ofstream out(outfile, std::ios::out | std::ios::trunc);
    if (!out) {
        PGLOGSTATS_LOG_ERROR("Cannot open {} for writing", outfile);
        return false;
    }
    out << report;
    if (!report.empty() && report.back() != '\n') {
        out << '\n';
    }
    out.close();
    if (!out) {
        PGLOGSTATS_LOG_ERROR("Failed to write report to {}", outfile);
        return false;
    }
    PGLOGSTATS_LOG_INFO("Results written to {}", outfile);
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"pglogstats - PostgreSQL log analyzer"};
    app.set_version_flag("-V,--version", PGLOGSTATS_VERSION);

    CommandLine cmd;
    app.add_option("log_files", cmd.log_files, "Log files to analyze");
    app.add_option("--log-dir", cmd.log_dir, "Directory containing PostgreSQL log files");
    app.add_option("-L,--logfile-list", cmd.logfile_list,
                   "File containing a list of log files to parse, one per line");
    app.add_option("--output-format", cmd.output_format, "Report format")
        ->check(CLI::IsMember({"text", "json"}, CLI::ignore_case));
    app.add_flag("--quick", cmd.quick, "Show only summary information");
    app.add_flag("--list-entries", cmd.list_entries,
                 "Print the parsed log entries instead of the analysis");
    app.add_option("--sample-size", cmd.sample_size,
                   "Limit analysis to the first N lines of each file");
    app.add_option("-o,--outfile", cmd.outfile, "Write the report to this file ('-' for stdout)");
    app.add_option("-c,--config", cmd.config_path, "Path to YAML configuration file");
    app.add_option("--log-level", cmd.log_level,
                   "Log level (trace, debug, info, warn, error, critical, off)");
    app.add_option("-j,--jobs", cmd.jobs, "Parser threads (0 = hardware concurrency)");
    app.add_flag("-q,--quiet", cmd.quiet, "Only report errors");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int code = app.exit(e);
        return code == 0 ? kExitOk : kExitInvalidConfig;
    }

    pglogstats::LogConfig log_config;
    log_config.level = cmd.quiet ? pglogstats::LogLevel::kError : pglogstats::LogLevel::kWarn;
    // Flushes the log sinks on every return below
    pglogstats::ScopedLogging logging(log_config);

    const auto start_time = std::chrono::steady_clock::now();

    if (cmd.sample_size && *cmd.sample_size == 0) {
        PGLOGSTATS_LOG_ERROR("--sample-size must be greater than 0");
        return kExitInvalidConfig;
    }

    // Configuration: YAML file, then PGLOGSTATS_* environment, then flags
    std::optional<std::filesystem::path> config_path;
    if (!cmd.config_path.empty()) {
        config_path = cmd.config_path;
    }
    auto config = pglogstats::LoadLayeredConfig(config_path, kEnvPrefix);
    if (!config.ok()) {
        PGLOGSTATS_LOG_ERROR("Failed to load config: {}", config.status().message());
        return kExitInvalidConfig;
    }
    ApplyOverrides(cmd, *config);

    auto settings = pglogstats::cli::Settings::FromConfig(*config);
    if (!settings.ok()) {
        PGLOGSTATS_LOG_ERROR("{}", settings.status().message());
        return kExitInvalidConfig;
    }
    pglogstats::LogLevel level = settings->log_level;
    if (cmd.quiet && level < pglogstats::LogLevel::kError) {
        level = pglogstats::LogLevel::kError;
    }
    pglogstats::SetLogLevel(level);
    PGLOGSTATS_LOG_DEBUG("Effective configuration: {}", config->ToJson().dump());

    pglogstats::cli::DiscoveryOptions discovery;
    discovery.paths = cmd.log_files;
    if (!cmd.log_dir.empty()) {
        discovery.log_dir = cmd.log_dir;
    }
    if (!cmd.logfile_list.empty()) {
        discovery.list_file = cmd.logfile_list;
    }

    if (discovery.paths.empty() && !discovery.log_dir && !discovery.list_file) {
        PGLOGSTATS_LOG_ERROR("No input given: pass log files, --log-dir or -L");
        std::cerr << app.help();
        return kExitNoInput;
    }

    auto files = pglogstats::cli::DiscoverLogFiles(discovery);
    if (!files.ok()) {
        PGLOGSTATS_LOG_ERROR("{}", files.status().message());
        return kExitInvalidConfig;
    }
    if (files->empty()) {
        PGLOGSTATS_LOG_ERROR("No log files found to process");
        return kExitNoInput;
    }

    pglogstats::cli::ParsedLogs parsed = pglogstats::cli::ParseLogFiles(*files, *settings);
    if (parsed.entries.empty()) {
        PGLOGSTATS_LOG_WARN("No log entries were successfully parsed");
        return kExitNoInput;
    }
    PGLOGSTATS_LOG_INFO("Total entries parsed: {}", parsed.entries.size());

    if (cmd.list_entries) {
        std::string listing;
        if (settings->output_format == pglogstats::cli::OutputFormat::kJson) {
            pglogstats::output::JsonFormatter formatter;
            auto json = formatter.FormatLogEntries(parsed.entries);
            if (!json.ok()) {
                PGLOGSTATS_LOG_ERROR("{}", json.status().message());
                return kExitOutputFailure;
            }
            listing = std::move(*json);
        } else {
            pglogstats::output::TextFormatter formatter;
            listing = formatter.FormatLogEntries(parsed.entries);
        }
        return WriteOutput(cmd.outfile, listing) ? kExitOk : kExitOutputFailure;
    }

    auto report = pglogstats::cli::AnalyzeEntries(parsed.entries, *settings);
    if (!report.ok()) {
        PGLOGSTATS_LOG_ERROR("Analysis failed: {}", report.status().message());
        return kExitInvalidConfig;
    }

    pglogstats::output::ReportMetadata metadata;
    metadata.tool_version = PGLOGSTATS_VERSION;
    metadata.log_files = parsed.files;
    metadata.total_entries = parsed.entries.size();
    metadata.parse_failures = parsed.parse_failures;

    std::string rendered;
    if (settings->output_format == pglogstats::cli::OutputFormat::kJson) {
        pglogstats::output::JsonFormatter formatter;
        auto json = formatter.FormatReport(report->analysis, report->timing, metadata, cmd.quick);
        if (!json.ok()) {
            PGLOGSTATS_LOG_ERROR("{}", json.status().message());
            return kExitOutputFailure;
        }
        rendered = std::move(*json);
    } else {
        pglogstats::output::TextFormatter formatter;
        rendered = formatter.FormatReport(report->analysis, report->timing, metadata, cmd.quick);
    }

    if (!WriteOutput(cmd.outfile, rendered)) {
        return kExitOutputFailure;
    }

    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time;
    if (!cmd.quiet) {
        std::cerr << "Analysis completed in " << std::fixed << std::setprecision(2)
                  << elapsed.count() << "s" << std::endl;
    }

    return kExitOk;
}
