/**
 * @file transfer_scheduler.hpp
 * @brief Bounded-concurrency execution of one iteration's plan
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Each job copies, verifies, deletes the source and prunes empty source
 * directories. Failures leave the source in place and feed the
 * consecutive-failure policy held in BalancerState.
 */
#ifndef POOLBALANCER_TRANSFER_SCHEDULER_HPP
#define POOLBALANCER_TRANSFER_SCHEDULER_HPP

#include "balancer_types.hpp"
#include "balancer_events.hpp"
#include "balancer_state.hpp"
#include "file_selector.hpp"
#include "transfer_runner.hpp"
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <set>
#include <vector>

namespace poolbalancer {

enum class ThresholdDecision {
    RESUME,
    ABORT
};

/**
 * @class ThresholdHandler
 * @brief Decides what happens when the failure threshold is reached
 *
 * Called on a worker thread while dispatching is paused. Only consulted
 * when abort-on-error is off.
 */
class ThresholdHandler {
public:
    virtual ~ThresholdHandler() = default;
    virtual ThresholdDecision onThresholdReached(uint32_t consecutive_failures) = 0;
};

struct SchedulerOptions {
    int parallel = 0;               ///< 0 = one job per destination in the plan
    bool verify_checksum = false;
};

/**
 * @struct BatchReport
 * @brief Terminal state of every job of one batch, in plan order
 */
struct BatchReport {
    std::vector<TransferJob> jobs;
    uint32_t concurrency = 0;
    uint32_t peak_running = 0;
    bool aborted = false;

    [[nodiscard]] size_t count(JobStatus status) const {
        size_t n = 0;
        for (const auto& j : jobs) if (j.status == status) ++n;
        return n;
    }
    [[nodiscard]] uint64_t bytesMoved() const {
        uint64_t total = 0;
        for (const auto& j : jobs) total += j.bytes_moved;
        return total;
    }
};

class TransferScheduler {
public:
    TransferScheduler(TransferRunner& runner, BalancerState& state, SchedulerOptions options,
                      EventBus* bus = nullptr, ThresholdHandler* handler = nullptr)
        : runner_(runner), state_(state), options_(options), bus_(bus), handler_(handler) {}

    TransferScheduler(const TransferScheduler&) = delete;
    TransferScheduler& operator=(const TransferScheduler&) = delete;

    /**
     * @brief Worker count for a plan: the explicit setting, else one per destination
     */
    [[nodiscard]] uint32_t concurrencyFor(const SelectionPlan& plan) const;

    /**
     * @brief Run every candidate of @p plan to a terminal status
     *
     * Blocks until all dispatched jobs finish. Jobs still queued when an
     * abort is requested are Skipped.
     */
    [[nodiscard]] BatchReport run(const SelectionPlan& plan, uint32_t iteration = 0);

private:
    struct Slot {
        TransferJob job;
        std::promise<TransferJob> result;
    };

    void workerLoop(std::vector<Slot>& slots, uint32_t iteration);
    std::optional<size_t> nextJob(std::vector<Slot>& slots);
    void finishJob(const TransferJob& job);
    void execute(TransferJob& job, uint32_t iteration);
    void handleFailure(TransferJob& job, ErrorCode code, const std::string& reason, uint32_t iteration);
    void onThreshold(uint32_t consecutive, uint32_t iteration);
    bool verifyCopy(const Candidate& c, std::string& reason) const;
    void publish(EventType type, const TransferJob& job, uint32_t iteration,
                 const std::string& message = "", uint64_t bytes = 0, uint64_t count = 0);

    TransferRunner& runner_;
    BalancerState& state_;
    SchedulerOptions options_;
    EventBus* bus_;
    ThresholdHandler* handler_;

    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<size_t> queue_;
    std::set<std::string> busy_destinations_;
    bool exclusive_destinations_ = false;
    bool paused_ = false;
    uint32_t running_ = 0;
    uint32_t peak_running_ = 0;
};

} // namespace poolbalancer
#endif
