/**
 * @file balancer_events.hpp
 * @brief Observer-pattern event bus for engine notifications
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * The engine publishes structured events; rendering and logging belong to
 * subscribers. One bus per run, owned by the caller.
 */
#ifndef POOLBALANCER_BALANCER_EVENTS_HPP
#define POOLBALANCER_BALANCER_EVENTS_HPP

#include "balancer_types.hpp"
#include "balancer_logger.hpp"
#include <algorithm>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace poolbalancer {

enum class EventType {
    ITERATION_STARTED,
    DRIVE_CLASSIFIED,
    DRIVE_UNAVAILABLE,
    SELECTION_WARNING,
    PLAN_READY,
    JOB_STARTED,
    JOB_PROGRESS,
    JOB_SUCCEEDED,
    JOB_FAILED,
    JOB_SKIPPED,
    THRESHOLD_REACHED,
    RUN_TERMINATED
};

struct BalanceEvent {
    EventType type = EventType::ITERATION_STARTED;
    uint32_t iteration = 0;
    std::optional<Drive> drive;
    std::optional<TransferJob> job;
    double target_percent = 0.0;
    uint64_t bytes = 0;             ///< Progress bytes, plan total or bytes moved
    uint64_t count = 0;             ///< Plan size or consecutive failures
    std::optional<TerminationKind> termination;
    std::string message;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

using EventCallback = std::function<void(const BalanceEvent&)>;

/**
 * @class EventBus
 * @brief Fan-out of every published event to every subscriber
 *
 * Callbacks run on the publishing thread, in subscription order, after the
 * subscriber list has been copied; a callback may unsubscribe itself.
 */
class EventBus {
public:
    using SubscriberId = uint64_t;

    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriberId subscribeAll(EventCallback cb) {
        std::lock_guard<std::mutex> lock(mtx_);
        subscribers_.emplace_back(++last_id_, std::move(cb));
        return last_id_;
    }

    void unsubscribe(SubscriberId id) {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                               [id](const auto& entry) { return entry.first == id; });
        if (it != subscribers_.end()) subscribers_.erase(it);
    }

    void publish(const BalanceEvent& event) {
        std::vector<std::pair<SubscriberId, EventCallback>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            snapshot = subscribers_;
        }
        for (const auto& [id, cb] : snapshot) {
            try {
                cb(event);
            } catch (const std::exception& e) {
                PB_LOG_WARNING("EventBus", "Subscriber " + std::to_string(id) + " threw: " + e.what());
            }
        }
    }

private:
    std::mutex mtx_;
    std::vector<std::pair<SubscriberId, EventCallback>> subscribers_;
    SubscriberId last_id_ = 0;
};

} // namespace poolbalancer
#endif // POOLBALANCER_BALANCER_EVENTS_HPP
