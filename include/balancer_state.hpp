/**
 * @file balancer_state.hpp
 * @brief Run-scoped shared state for one balancing run
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef POOLBALANCER_BALANCER_STATE_HPP
#define POOLBALANCER_BALANCER_STATE_HPP

#include <atomic>
#include <mutex>
#include <set>
#include <string>
#include <cstdint>

namespace poolbalancer {

/**
 * @class BalancerState
 * @brief Aggregate counters shared by scheduler workers and the loop
 *
 * Counters and the failure streak live behind one mutex so that the
 * increment and the threshold test happen together. The abort flag is a
 * lock-free atomic and may be set from a signal handler.
 */
class BalancerState {
public:
    BalancerState(int error_threshold, bool abort_on_error, bool dry_run)
        : error_threshold_(error_threshold < 1 ? 1 : static_cast<uint32_t>(error_threshold)),
          abort_on_error_(abort_on_error), dry_run_(dry_run) {}

    BalancerState(const BalancerState&) = delete;
    BalancerState& operator=(const BalancerState&) = delete;

    void setTargetPercent(double pct) { std::lock_guard<std::mutex> lock(mtx_); target_percent_ = pct; }
    double targetPercent() const { std::lock_guard<std::mutex> lock(mtx_); return target_percent_; }

    uint32_t errorThreshold() const { return error_threshold_; }
    bool abortOnError() const { return abort_on_error_; }
    bool dryRun() const { return dry_run_; }

    void recordSuccess(uint64_t bytes) {
        std::lock_guard<std::mutex> lock(mtx_);
        consecutive_failures_ = 0;
        bytes_moved_ += bytes;
        ++jobs_succeeded_;
    }

    /**
     * @brief Count a failed job
     * @return true exactly when this failure makes the streak reach the threshold
     */
    bool recordFailure(const std::string& source_path) {
        std::lock_guard<std::mutex> lock(mtx_);
        ++jobs_failed_;
        failed_paths_.insert(source_path);
        ++consecutive_failures_;
        return consecutive_failures_ == error_threshold_;
    }

    void recordSkipped() { std::lock_guard<std::mutex> lock(mtx_); ++jobs_skipped_; }

    void resetFailureStreak() { std::lock_guard<std::mutex> lock(mtx_); consecutive_failures_ = 0; }

    uint32_t consecutiveFailures() const { std::lock_guard<std::mutex> lock(mtx_); return consecutive_failures_; }
    uint64_t bytesMoved() const { std::lock_guard<std::mutex> lock(mtx_); return bytes_moved_; }
    uint64_t jobsSucceeded() const { std::lock_guard<std::mutex> lock(mtx_); return jobs_succeeded_; }
    uint64_t jobsFailed() const { std::lock_guard<std::mutex> lock(mtx_); return jobs_failed_; }
    uint64_t jobsSkipped() const { std::lock_guard<std::mutex> lock(mtx_); return jobs_skipped_; }

    bool hasFailed(const std::string& source_path) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return failed_paths_.count(source_path) != 0;
    }

    std::set<std::string> failedPaths() const { std::lock_guard<std::mutex> lock(mtx_); return failed_paths_; }

    // Signal-safe: only touches the atomic flag
    void requestCancel() noexcept { abort_requested_.store(true); }

    void requestAbort(const std::string& reason) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (abort_reason_.empty()) abort_reason_ = reason;
        abort_requested_.store(true);
    }

    bool abortRequested() const noexcept { return abort_requested_.load(); }

    std::string abortReason() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return abort_reason_.empty() ? std::string("cancelled") : abort_reason_;
    }

private:
    const uint32_t error_threshold_;
    const bool abort_on_error_;
    const bool dry_run_;

    mutable std::mutex mtx_;
    double target_percent_ = 0.0;
    uint32_t consecutive_failures_ = 0;
    uint64_t bytes_moved_ = 0;
    uint64_t jobs_succeeded_ = 0;
    uint64_t jobs_failed_ = 0;
    uint64_t jobs_skipped_ = 0;
    std::set<std::string> failed_paths_;
    std::string abort_reason_;
    std::atomic<bool> abort_requested_{false};
};

} // namespace poolbalancer
#endif
