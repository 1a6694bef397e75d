/**
 * @file example_plan.cpp
 * @brief Dry-run balance plan for a set of plain directories
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Usage: example_plan DIR DIR [DIR...]
 * Each directory stands in for one pool member; usage comes from statvfs.
 */

#include "balance_engine.hpp"
#include "console_reporter.hpp"
#include <iostream>

using namespace poolbalancer;

int main(int argc, char* argv[]) {
    std::cout << "=== pool-balance Plan Example ===\n\n";

    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " DIR DIR [DIR...]\n";
        return 1;
    }

    std::vector<std::string> members(argv + 1, argv + argc);
    DirectoryListProbe probe(members);
    FilesystemSource files;
    RsyncRunner runner;

    BalanceConfig config;
    config.mount_point = members.front();
    config.percentage = 2.0;
    config.dry_run = true;
    config.verbose = 1;

    BalancerState state(config.error_threshold, config.abort_on_error, config.dry_run);
    EventBus bus;
    ConsoleReporter reporter(bus, std::cout, std::cerr, config.verbose, false);

    BalanceEngine engine(config, probe, files, runner, state, &bus);
    auto report = engine.run();
    reporter.printSummary(report, config.percentage, true);

    return report.termination == TerminationKind::DISCOVERY_FAILED ? 1 : 0;
}
