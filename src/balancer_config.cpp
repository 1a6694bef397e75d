/**
 * @file balancer_config.cpp
 * @brief Configuration loading, merging and validation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "balancer_config.hpp"
#include "balancer_filesystem.hpp"
#include "balancer_ini.hpp"
#include <cstdlib>

namespace poolbalancer {

namespace {

std::string badValue(const std::string& origin, const std::string& key, const std::string& value) {
    return origin + ": invalid value for '" + key + "': " + value;
}

} // namespace

std::vector<std::string> BalanceConfig::validate() const {
    std::vector<std::string> errors;

    if (mount_point.empty()) {
        errors.push_back("Mount point is required");
    } else if (!fs::isDirectory(mount_point)) {
        errors.push_back("Mount point does not exist: " + mount_point);
    }

    if (percentage <= 0.0) {
        errors.push_back("Percentage must be positive: " + std::to_string(percentage));
    }

    if (parallel < 0) {
        errors.push_back("Parallel must be 0 (auto) or positive: " + std::to_string(parallel));
    }

    if (min_size && max_size && *min_size > *max_size) {
        errors.push_back("Min size (" + std::to_string(*min_size) +
                         ") cannot be greater than max size (" + std::to_string(*max_size) + ")");
    }

    if (error_threshold < 1) {
        errors.push_back("Error threshold must be at least 1: " + std::to_string(error_threshold));
    }

    if (max_iterations < 0) {
        errors.push_back("Max iterations must be 0 (unlimited) or positive: " +
                         std::to_string(max_iterations));
    }

    // Restriction entries may be glob patterns; only literal paths are checked here
    for (const auto& drive : source_drives) {
        if (drive.find_first_of("*?[") == std::string::npos && !fs::isDirectory(drive)) {
            errors.push_back("Source drive does not exist: " + drive);
        }
    }
    for (const auto& drive : dest_drives) {
        if (drive.find_first_of("*?[") == std::string::npos && !fs::isDirectory(drive)) {
            errors.push_back("Destination drive does not exist: " + drive);
        }
    }

    if (!config_file.empty() && !fs::isFile(config_file)) {
        errors.push_back("Config file does not exist: " + config_file);
    }

    return errors;
}

Result<BalanceConfig> parseConfigText(const std::string& content, const std::string& origin) {
    auto file = ini::IniFile::parse(content);

    // Keys may live at the top of the file or under [balance]; the section wins
    ini::IniValues merged = file.global();
    if (const auto* sec = file.section("balance")) merged.overlay(*sec);

    BalanceConfig config;
    config.mount_point = merged.get("mount_point").value_or("");

    if (merged.contains("percentage")) {
        auto v = merged.getDouble("percentage");
        if (!v) return Err<BalanceConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                          badValue(origin, "percentage", *merged.get("percentage")));
        config.percentage = *v;
    }

    config.include_patterns = merged.getList("include");
    config.exclude_patterns = merged.getList("exclude");

    for (const char* key : {"min_size", "max_size"}) {
        if (!merged.contains(key)) continue;
        auto raw = *merged.get(key);
        auto bytes = parseSize(raw);
        if (!bytes) return Err<BalanceConfig>(ErrorCode::CONFIG_PARSE_ERROR, badValue(origin, key, raw));
        if (std::string(key) == "min_size") config.min_size = bytes;
        else config.max_size = bytes;
    }

    struct IntKey { const char* name; int* target; };
    for (const IntKey& k : {IntKey{"parallel", &config.parallel},
                            IntKey{"verbose", &config.verbose},
                            IntKey{"error_threshold", &config.error_threshold},
                            IntKey{"max_iterations", &config.max_iterations}}) {
        if (!merged.contains(k.name)) continue;
        auto v = merged.getInt(k.name);
        if (!v) return Err<BalanceConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                          badValue(origin, k.name, *merged.get(k.name)));
        *k.target = *v;
    }

    struct BoolKey { const char* name; bool* target; };
    for (const BoolKey& k : {BoolKey{"dry_run", &config.dry_run},
                             BoolKey{"quiet", &config.quiet},
                             BoolKey{"abort_on_error", &config.abort_on_error},
                             BoolKey{"verify_checksum", &config.verify_checksum}}) {
        if (!merged.contains(k.name)) continue;
        auto v = merged.getBool(k.name);
        if (!v) return Err<BalanceConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                          badValue(origin, k.name, *merged.get(k.name)));
        *k.target = *v;
    }

    config.source_drives = merged.getList("source_drives");
    config.dest_drives = merged.getList("dest_drives");
    config.error_log = merged.get("error_log").value_or("");
    config.rsync_path = merged.get("rsync_path").value_or("rsync");
    config.log_dir = merged.get("log_dir").value_or("");

    return config;
}

Result<BalanceConfig> loadConfigFile(const std::string& path) {
    auto text = fs::readFile(path);
    if (!text) {
        return Err<BalanceConfig>(ErrorCode::CONFIG_MISSING, "Cannot read config file: " + path);
    }
    auto result = parseConfigText(*text, path);
    if (result) result->config_file = path;
    return result;
}

BalanceConfig mergeConfigs(const BalanceConfig& file, const BalanceConfig& cli) {
    BalanceConfig merged = file;
    merged.mount_point = cli.mount_point.empty() ? file.mount_point : cli.mount_point;
    merged.config_file = cli.config_file;

    if (cli.percentage != DEFAULT_PERCENTAGE) merged.percentage = cli.percentage;

    merged.include_patterns.insert(merged.include_patterns.end(),
                                   cli.include_patterns.begin(), cli.include_patterns.end());
    merged.exclude_patterns.insert(merged.exclude_patterns.end(),
                                   cli.exclude_patterns.begin(), cli.exclude_patterns.end());

    if (cli.min_size) merged.min_size = cli.min_size;
    if (cli.max_size) merged.max_size = cli.max_size;
    if (cli.parallel != 0) merged.parallel = cli.parallel;
    if (!cli.source_drives.empty()) merged.source_drives = cli.source_drives;
    if (!cli.dest_drives.empty()) merged.dest_drives = cli.dest_drives;

    if (cli.dry_run) merged.dry_run = true;
    if (cli.verbose > 0) merged.verbose = cli.verbose;
    if (cli.quiet) merged.quiet = true;
    if (cli.abort_on_error) merged.abort_on_error = true;
    if (cli.error_threshold != DEFAULT_ERROR_THRESHOLD) merged.error_threshold = cli.error_threshold;
    if (!cli.error_log.empty()) merged.error_log = cli.error_log;
    if (cli.verify_checksum) merged.verify_checksum = true;
    if (cli.rsync_path != "rsync") merged.rsync_path = cli.rsync_path;
    if (cli.max_iterations != 0) merged.max_iterations = cli.max_iterations;
    if (!cli.log_dir.empty()) merged.log_dir = cli.log_dir;

    return merged;
}

std::vector<std::string> defaultConfigPaths() {
    std::string configHome;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        configHome = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        configHome = std::string(home) + "/.config";
    }

    std::vector<std::string> paths = {"poolbalance.ini", ".poolbalance.ini"};
    if (!configHome.empty()) paths.push_back(configHome + "/poolbalance/config.ini");
    paths.push_back("/etc/poolbalance.ini");
    paths.push_back("/etc/poolbalance/config.ini");
    return paths;
}

std::optional<std::string> findConfigFile() {
    for (const auto& path : defaultConfigPaths()) {
        if (fs::isFile(path)) return path;
    }
    return std::nullopt;
}

} // namespace poolbalancer
