/**
 * @file balancer_cli.hpp
 * @brief Command line to configuration
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef POOLBALANCER_BALANCER_CLI_HPP
#define POOLBALANCER_BALANCER_CLI_HPP

#include "balancer_args.hpp"
#include "balancer_config.hpp"
#include "result.hpp"
#include <string>
#include <vector>

namespace poolbalancer {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_STATUS = 1;
constexpr int EXIT_INTERRUPTED = 130;

struct CliOptions {
    BalanceConfig config;
    bool show_help = false;
    bool show_version = false;
};

[[nodiscard]] args::ArgParser makeArgParser();

/**
 * @brief Parse arguments (without the program name) into CLI settings
 *
 * Only what the command line says: no config file is read here.
 */
[[nodiscard]] Result<CliOptions> parseCommandLine(const std::vector<std::string>& argv);

/**
 * @brief Merge the CLI settings over a config file
 *
 * Uses --config when given, otherwise the first file on the default search
 * path; with neither, the CLI settings stand alone.
 */
[[nodiscard]] Result<BalanceConfig> resolveConfig(const BalanceConfig& cli);

/**
 * @brief Process exit status for a finished run
 *
 * 0 for Converged, NoCandidates or DryRunComplete without failed jobs,
 * 130 when interrupted, 1 otherwise.
 */
[[nodiscard]] int exitCodeFor(const RunReport& report, bool interrupted);

} // namespace poolbalancer
#endif
