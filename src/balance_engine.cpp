/**
 * @file balance_engine.cpp
 * @brief Convergence loop implementation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "balance_engine.hpp"
#include "balancer_logger.hpp"

namespace poolbalancer {

BalanceEngine::BalanceEngine(const BalanceConfig& config, PoolProbe& probe, FileSource& files,
                             TransferRunner& runner, BalancerState& state,
                             EventBus* bus, ThresholdHandler* handler)
    : config_(config),
      state_(state),
      bus_(bus),
      inventory_(probe, bus),
      calculator_(config.percentage),
      selector_(files, FilterPipeline(config.include_patterns, config.exclude_patterns,
                                      config.min_size, config.max_size), bus),
      scheduler_(runner, state, SchedulerOptions{config.parallel, config.verify_checksum}, bus, handler) {
    inventory_.setRestrictions(config.source_drives, config.dest_drives);
}

RunReport BalanceEngine::run() {
    Classification last;
    uint32_t iteration = 0;
    bool transferred = false;

    PB_LOG_INFO("BalanceEngine", "Balancing " + config_.mount_point + " to within " +
                formatPercent(config_.percentage) + (state_.dryRun() ? " (dry run)" : ""));

    while (true) {
        if (state_.abortRequested()) {
            return finish(TerminationKind::ABORTED, state_.abortReason(), iteration, last, transferred);
        }
        if (config_.max_iterations > 0 && iteration >= static_cast<uint32_t>(config_.max_iterations)) {
            return finish(TerminationKind::NO_CANDIDATES, "iteration limit reached", iteration, last, true);
        }

        ++iteration;
        if (bus_) {
            BalanceEvent ev;
            ev.type = EventType::ITERATION_STARTED;
            ev.iteration = iteration;
            bus_->publish(ev);
        }

        // Discovering
        auto inventory = inventory_.discover(config_.mount_point, iteration);
        if (!inventory) {
            PB_LOG_ERROR("BalanceEngine", inventory.error().message);
            return finish(TerminationKind::DISCOVERY_FAILED, inventory.error().message, iteration, last, false);
        }

        // Classifying
        last = calculator_.classifyAll(inventory->drives);
        state_.setTargetPercent(last.target_percent);
        PB_LOG_DEBUG("BalanceEngine", "Iteration " + std::to_string(iteration) + ": target " +
                     formatPercent(last.target_percent) + ", range " +
                     formatPercent(TargetCalculator::usageRange(last.drives)));
        if (bus_) {
            for (const auto& d : last.drives) {
                BalanceEvent ev;
                ev.type = EventType::DRIVE_CLASSIFIED;
                ev.iteration = iteration;
                ev.drive = d;
                ev.target_percent = last.target_percent;
                bus_->publish(ev);
            }
        }
        if (last.converged()) {
            return finish(TerminationKind::CONVERGED, "all drives within range", iteration, last, false);
        }

        // Selecting
        auto plan = selector_.select(last, inventory->subpath, state_.failedPaths(), iteration);
        if (bus_) {
            BalanceEvent ev;
            ev.type = EventType::PLAN_READY;
            ev.iteration = iteration;
            ev.target_percent = plan.target_percent;
            ev.bytes = plan.totalBytes();
            ev.count = plan.candidates.size();
            bus_->publish(ev);
        }
        if (plan.empty()) {
            return finish(TerminationKind::NO_CANDIDATES, "no eligible files to move", iteration, last, false);
        }

        // Transferring
        auto batch = scheduler_.run(plan, iteration);
        if (state_.dryRun()) {
            return finish(TerminationKind::DRY_RUN_COMPLETE,
                          std::to_string(plan.candidates.size()) + " transfers planned", iteration, last, false);
        }
        transferred = transferred || batch.count(JobStatus::SUCCEEDED) > 0;
        if (state_.abortRequested()) {
            return finish(TerminationKind::ABORTED, state_.abortReason(), iteration, last, transferred);
        }
        if (batch.count(JobStatus::SUCCEEDED) == 0 && batch.count(JobStatus::FAILED) == 0) {
            return finish(TerminationKind::NO_CANDIDATES, "every planned file changed or vanished",
                          iteration, last, transferred);
        }
    }
}

RunReport BalanceEngine::finish(TerminationKind kind, const std::string& reason, uint32_t iterations,
                                const Classification& last, bool refresh) {
    RunReport report;
    report.termination = kind;
    report.reason = reason;
    report.iterations = iterations;
    report.bytes_moved = state_.bytesMoved();
    report.jobs_succeeded = state_.jobsSucceeded();
    report.jobs_failed = state_.jobsFailed();
    report.jobs_skipped = state_.jobsSkipped();
    report.target_percent = last.target_percent;
    report.final_drives = last.drives;

    // Drives changed since the last classification; take a fresh look for the summary
    if (refresh) {
        auto inventory = inventory_.discover(config_.mount_point, iterations);
        if (inventory) {
            auto fresh = calculator_.classifyAll(inventory->drives);
            report.target_percent = fresh.target_percent;
            report.final_drives = fresh.drives;
        } else {
            PB_LOG_WARNING("BalanceEngine", "Final drive refresh failed: " + inventory.error().message);
        }
    }

    std::string line = "Run finished: " + terminationToString(kind) + " (" + reason + ") after " +
                       std::to_string(iterations) + " iterations, " + formatBytes(report.bytes_moved) + " moved";
    if (kind == TerminationKind::ABORTED || kind == TerminationKind::DISCOVERY_FAILED) {
        PB_LOG_WARNING("BalanceEngine", line);
    } else {
        PB_LOG_INFO("BalanceEngine", line);
    }

    if (bus_) {
        BalanceEvent ev;
        ev.type = EventType::RUN_TERMINATED;
        ev.iteration = iterations;
        ev.termination = kind;
        ev.target_percent = report.target_percent;
        ev.bytes = report.bytes_moved;
        ev.count = report.jobs_failed;
        ev.message = reason;
        bus_->publish(ev);
    }
    return report;
}

} // namespace poolbalancer
