/**
 * @file balance_engine.hpp
 * @brief Iterate-until-converged control loop
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * BalanceEngine coordinates one balancing run:
 * - Discovering: fresh drive snapshot from the inventory
 * - Classifying: target and per-drive class
 * - Selecting: plan of candidates
 * - Transferring: the plan runs to completion on the scheduler
 *
 * The loop repeats until the pool converges, nothing eligible remains,
 * the run is aborted or discovery fails.
 */
#ifndef POOLBALANCER_BALANCE_ENGINE_HPP
#define POOLBALANCER_BALANCE_ENGINE_HPP

#include "balancer_config.hpp"
#include "balancer_events.hpp"
#include "balancer_state.hpp"
#include "drive_inventory.hpp"
#include "file_selector.hpp"
#include "target_calculator.hpp"
#include "transfer_runner.hpp"
#include "transfer_scheduler.hpp"

namespace poolbalancer {

class BalanceEngine {
public:
    BalanceEngine(const BalanceConfig& config, PoolProbe& probe, FileSource& files,
                  TransferRunner& runner, BalancerState& state,
                  EventBus* bus = nullptr, ThresholdHandler* handler = nullptr);

    BalanceEngine(const BalanceEngine&) = delete;
    BalanceEngine& operator=(const BalanceEngine&) = delete;

    /**
     * @brief Run to a terminal state
     * @return Termination, counters and the last known drive classification
     */
    [[nodiscard]] RunReport run();

private:
    RunReport finish(TerminationKind kind, const std::string& reason, uint32_t iterations,
                     const Classification& last, bool refresh);

    BalanceConfig config_;
    BalancerState& state_;
    EventBus* bus_;
    DriveInventory inventory_;
    TargetCalculator calculator_;
    FileSelector selector_;
    TransferScheduler scheduler_;
};

} // namespace poolbalancer
#endif
