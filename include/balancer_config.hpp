/**
 * @file balancer_config.hpp
 * @brief Configuration for a balancing run
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Structured configuration with:
 * - Typed fields and defaults
 * - Validation returning every problem found
 * - INI file loading and CLI-over-file merging
 * - Default configuration file search path
 */
#ifndef POOLBALANCER_BALANCER_CONFIG_HPP
#define POOLBALANCER_BALANCER_CONFIG_HPP

#include "balancer_types.hpp"
#include "result.hpp"
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace poolbalancer {

constexpr double DEFAULT_PERCENTAGE = 2.0;
constexpr int DEFAULT_ERROR_THRESHOLD = 5;

/**
 * @struct BalanceConfig
 * @brief Already-parsed settings consumed by the engine
 */
struct BalanceConfig {
    std::string mount_point;

    // Tolerance band width in percentage points, centred on the target
    double percentage = DEFAULT_PERCENTAGE;

    // File filters
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;
    std::optional<uint64_t> min_size;
    std::optional<uint64_t> max_size;

    // 0 = auto: one job per underfull destination
    int parallel = 0;
    std::vector<std::string> source_drives;
    std::vector<std::string> dest_drives;

    bool dry_run = false;
    int verbose = 0;
    bool quiet = false;
    std::string config_file;

    // Consecutive error policy
    bool abort_on_error = false;
    int error_threshold = DEFAULT_ERROR_THRESHOLD;
    std::string error_log;

    bool verify_checksum = false;
    std::string rsync_path = "rsync";
    int max_iterations = 0;
    std::string log_dir;

    /**
     * @brief Validate against the filesystem and value ranges
     * @return One message per problem; empty when valid
     */
    [[nodiscard]] std::vector<std::string> validate() const;
};

/**
 * @brief Build a configuration from parsed INI text
 * @param content INI text; keys may be global or under [balance]
 * @param origin Name used in error messages
 */
[[nodiscard]] Result<BalanceConfig> parseConfigText(const std::string& content,
                                                    const std::string& origin);

/**
 * @brief Load a configuration file
 */
[[nodiscard]] Result<BalanceConfig> loadConfigFile(const std::string& path);

/**
 * @brief File values as defaults, CLI values override when set
 *
 * Include/exclude patterns from the CLI are appended to the file's lists;
 * scalar CLI values win when they differ from the built-in defaults.
 */
[[nodiscard]] BalanceConfig mergeConfigs(const BalanceConfig& file, const BalanceConfig& cli);

[[nodiscard]] std::vector<std::string> defaultConfigPaths();

[[nodiscard]] std::optional<std::string> findConfigFile();

} // namespace poolbalancer

#endif // POOLBALANCER_BALANCER_CONFIG_HPP
