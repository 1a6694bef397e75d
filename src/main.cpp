/**
 * @file main.cpp
 * @brief pool-balance entry point
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "balance_engine.hpp"
#include "balancer_cli.hpp"
#include "balancer_logger.hpp"
#include "console_reporter.hpp"
#include <csignal>
#include <signal.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace poolbalancer;

namespace {

BalancerState* g_state = nullptr;
volatile std::sig_atomic_t g_interrupted = 0;

extern "C" void handleSignal(int) {
    g_interrupted = 1;
    if (g_state) g_state->requestCancel();
}

void installSignalHandlers() {
    struct sigaction sa{};
    sa.sa_handler = handleSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto cli = parseCommandLine(args);
    if (!cli) {
        std::cerr << "Error: " << cli.error().message << "\n"
                  << "Try '" << PROGRAM_NAME << " --help' for more information.\n";
        return EXIT_FAILURE_STATUS;
    }
    if (cli->show_help) {
        std::cout << makeArgParser().help();
        return EXIT_OK;
    }
    if (cli->show_version) {
        std::cout << PROGRAM_NAME << " " << VERSION << "\n";
        return EXIT_OK;
    }

    auto resolved = resolveConfig(cli->config);
    if (!resolved) {
        std::cerr << "Error: " << resolved.error().message << "\n";
        return EXIT_FAILURE_STATUS;
    }
    const BalanceConfig& config = *resolved;

    auto problems = config.validate();
    if (!problems.empty()) {
        for (const auto& p : problems) std::cerr << "Error: " << p << "\n";
        return EXIT_FAILURE_STATUS;
    }

    auto& logger = BalancerLogger::instance();
    logger.setLevel(logLevelFromVerbosity(config.verbose, config.quiet));
    if (!config.log_dir.empty() &&
        !logger.initialize(config.log_dir, logLevelFromVerbosity(config.verbose, config.quiet))) {
        std::cerr << "Warning: cannot write log files to " << config.log_dir << "\n";
    }
    if (!config.error_log.empty() && !logger.openErrorLog(config.error_log)) {
        std::cerr << "Error: cannot open error log " << config.error_log << "\n";
        return EXIT_FAILURE_STATUS;
    }
    PB_LOG_INFO("Main", std::string(PROGRAM_NAME) + " " + VERSION + " balancing " + config.mount_point);

    BalancerState state(config.error_threshold, config.abort_on_error, config.dry_run);
    g_state = &state;
    installSignalHandlers();

    MergerfsProbe probe;
    FilesystemSource files;
    RsyncRunner runner(config.rsync_path);
    EventBus bus;
    ConsoleReporter reporter(bus, std::cout, std::cerr, config.verbose, config.quiet);
    PromptThresholdHandler prompt(std::cin, std::cerr, &reporter.outputMutex());

    if (config.dry_run && !config.quiet) {
        std::cout << "DRY RUN MODE - No files will be moved\n";
    }

    BalanceEngine engine(config, probe, files, runner, state, &bus,
                         config.abort_on_error ? nullptr : &prompt);
    RunReport report = engine.run();

    const bool interrupted = g_interrupted != 0;
    g_state = nullptr;

    reporter.printSummary(report, config.percentage, config.dry_run);
    if (interrupted) std::cerr << "Interrupted by user\n";

    PB_LOG_INFO("Main", "Finished: " + terminationToString(report.termination) + " (" + report.reason + ")");
    logger.shutdown();
    return exitCodeFor(report, interrupted);
}
