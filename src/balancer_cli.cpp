/**
 * @file balancer_cli.cpp
 * @brief Command-line handling
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "balancer_cli.hpp"
#include "balancer_logger.hpp"

namespace poolbalancer {

args::ArgParser makeArgParser() {
    args::ArgParser parser(PROGRAM_NAME, "Balance files across the member drives of a mergerfs pool.");
    parser.setPositional("MOUNT_POINT", "mergerfs mount point (or directory inside it) to balance")
          .addOption("percentage", 'p', "Tolerance band width in percent", "2.0", "PCT")
          .addMulti("include", 'i', "Include files matching glob pattern", "PATTERN")
          .addMulti("exclude", 'e', "Exclude files matching glob pattern", "PATTERN")
          .addOption("min-size", 's', "Minimum file size (e.g. 100M, 1G)", "", "SIZE")
          .addOption("max-size", 'S', "Maximum file size (e.g. 50G)", "", "SIZE")
          .addOption("parallel", '\0', "Concurrent transfers; 0 = one per destination", "0", "N")
          .addMulti("source", '\0', "Limit source drives", "PATH")
          .addMulti("dest", '\0', "Limit destination drives", "PATH")
          .addFlag("dry-run", '\0', "Preview the plan without moving files")
          .addFlag("verbose", 'v', "Increase verbosity (-v jobs, -vv progress)")
          .addFlag("quiet", 'q', "Suppress non-error output")
          .addOption("config", '\0', "Configuration file (INI)", "", "FILE")
          .addFlag("abort-on-error", '\0', "Abort after consecutive errors instead of prompting")
          .addOption("error-threshold", '\0', "Consecutive errors before pausing or aborting", "5", "N")
          .addOption("error-log", '\0', "Append errors to this file", "", "FILE")
          .addFlag("checksum", '\0', "Verify copies with CRC32 before deleting sources")
          .addOption("rsync", '\0', "rsync executable", "rsync", "PATH")
          .addOption("max-iterations", '\0', "Stop after N iterations; 0 = unlimited", "0", "N")
          .addOption("log-dir", '\0', "Write a timestamped log file here", "", "DIR")
          .addFlag("version", '\0', "Print version and exit");
    return parser;
}

Result<CliOptions> parseCommandLine(const std::vector<std::string>& argv) {
    auto parsed = makeArgParser().parse(argv);
    if (!parsed.success()) {
        return Err<CliOptions>(ErrorCode::INVALID_ARGUMENT, parsed.error());
    }

    CliOptions options;
    options.show_help = parsed.has("help");
    options.show_version = parsed.has("version");
    if (options.show_help || options.show_version) return options;

    if (parsed.positional().size() > 1) {
        return Err<CliOptions>(ErrorCode::INVALID_ARGUMENT,
                               "Unexpected argument: " + parsed.positional()[1]);
    }

    BalanceConfig& c = options.config;
    if (!parsed.positional().empty()) c.mount_point = parsed.positional()[0];

    if (parsed.has("percentage")) {
        auto v = parsed["percentage"].asDouble();
        if (!v) return Err<CliOptions>(ErrorCode::INVALID_ARGUMENT,
                                       "Invalid percentage: " + parsed["percentage"].asString());
        c.percentage = *v;
    }

    c.include_patterns = parsed["include"].values();
    c.exclude_patterns = parsed["exclude"].values();

    for (const char* name : {"min-size", "max-size"}) {
        if (!parsed.has(name)) continue;
        auto bytes = parseSize(parsed[name].asString());
        if (!bytes) return Err<CliOptions>(ErrorCode::INVALID_ARGUMENT,
                                           std::string("Invalid size for --") + name + ": " +
                                           parsed[name].asString());
        if (std::string(name) == "min-size") c.min_size = bytes;
        else c.max_size = bytes;
    }

    struct IntOpt { const char* name; int* target; };
    for (const IntOpt& o : {IntOpt{"parallel", &c.parallel},
                            IntOpt{"error-threshold", &c.error_threshold},
                            IntOpt{"max-iterations", &c.max_iterations}}) {
        if (!parsed.has(o.name)) continue;
        auto v = parsed[o.name].asInt();
        if (!v) return Err<CliOptions>(ErrorCode::INVALID_ARGUMENT,
                                       std::string("Invalid value for --") + o.name + ": " +
                                       parsed[o.name].asString());
        *o.target = *v;
    }

    c.source_drives = parsed["source"].values();
    c.dest_drives = parsed["dest"].values();
    c.dry_run = parsed.has("dry-run");
    c.verbose = parsed["verbose"].occurrences();
    c.quiet = parsed.has("quiet");
    if (c.quiet && c.verbose > 0) {
        return Err<CliOptions>(ErrorCode::INVALID_ARGUMENT, "--quiet and --verbose are mutually exclusive");
    }
    c.config_file = parsed["config"].asString();
    c.abort_on_error = parsed.has("abort-on-error");
    c.error_log = parsed["error-log"].asString();
    c.verify_checksum = parsed.has("checksum");
    c.rsync_path = parsed["rsync"].asString("rsync");
    c.log_dir = parsed["log-dir"].asString();

    return options;
}

Result<BalanceConfig> resolveConfig(const BalanceConfig& cli) {
    std::string path = cli.config_file;
    if (path.empty()) {
        auto found = findConfigFile();
        if (found) {
            path = *found;
            PB_LOG_INFO("Config", "Using configuration file " + path);
        }
    }

    BalanceConfig merged = cli;
    if (!path.empty()) {
        auto file = loadConfigFile(path);
        if (!file) return file.error();
        merged = mergeConfigs(*file, cli);
        merged.config_file = path;
    }

    if (merged.mount_point.empty()) {
        return Err<BalanceConfig>(ErrorCode::CONFIG_MISSING,
                                  path.empty() ? "Mount point is required"
                                               : "Mount point is required (none in " + path + ")");
    }
    return merged;
}

int exitCodeFor(const RunReport& report, bool interrupted) {
    if (interrupted) return EXIT_INTERRUPTED;
    switch (report.termination) {
        case TerminationKind::CONVERGED:
        case TerminationKind::NO_CANDIDATES:
        case TerminationKind::DRY_RUN_COMPLETE:
            return report.jobs_failed == 0 ? EXIT_OK : EXIT_FAILURE_STATUS;
        case TerminationKind::ABORTED:
        case TerminationKind::DISCOVERY_FAILED:
            return EXIT_FAILURE_STATUS;
    }
    return EXIT_FAILURE_STATUS;
}

} // namespace poolbalancer
