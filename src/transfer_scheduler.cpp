/**
 * @file transfer_scheduler.cpp
 * @brief Worker pool for transfer jobs
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "transfer_scheduler.hpp"
#include "balancer_checksum.hpp"
#include "balancer_filesystem.hpp"
#include "balancer_logger.hpp"
#include <algorithm>
#include <thread>

namespace poolbalancer {

namespace {

// Workers re-check the abort flag at this interval; a signal handler cannot notify
constexpr auto ABORT_POLL_INTERVAL = std::chrono::milliseconds(100);

} // namespace

uint32_t TransferScheduler::concurrencyFor(const SelectionPlan& plan) const {
    if (plan.empty()) return 0;
    auto jobs = static_cast<uint32_t>(plan.candidates.size());
    if (options_.parallel > 0) return std::min(static_cast<uint32_t>(options_.parallel), jobs);
    return std::max<uint32_t>(1, static_cast<uint32_t>(plan.destinationCount()));
}

void TransferScheduler::publish(EventType type, const TransferJob& job, uint32_t iteration,
                                const std::string& message, uint64_t bytes, uint64_t count) {
    if (!bus_) return;
    BalanceEvent ev;
    ev.type = type;
    ev.iteration = iteration;
    ev.job = job;
    ev.target_percent = state_.targetPercent();
    ev.bytes = bytes;
    ev.count = count;
    ev.message = message;
    bus_->publish(ev);
}

BatchReport TransferScheduler::run(const SelectionPlan& plan, uint32_t iteration) {
    BatchReport report;
    report.concurrency = concurrencyFor(plan);
    if (plan.empty()) return report;

    std::vector<Slot> slots(plan.candidates.size());
    std::vector<std::future<TransferJob>> futures;
    futures.reserve(slots.size());
    {
        std::lock_guard<std::mutex> lock(mtx_);
        queue_.clear();
        busy_destinations_.clear();
        exclusive_destinations_ = options_.parallel <= 0;
        paused_ = false;
        running_ = 0;
        peak_running_ = 0;
        for (size_t i = 0; i < slots.size(); ++i) {
            slots[i].job.candidate = plan.candidates[i];
            queue_.push_back(i);
            futures.push_back(slots[i].result.get_future());
        }
    }

    PB_LOG_INFO("TransferScheduler", "Dispatching " + std::to_string(slots.size()) + " jobs on " +
                std::to_string(report.concurrency) + " workers" +
                (state_.dryRun() ? " (dry run)" : ""));

    std::vector<std::thread> workers;
    workers.reserve(report.concurrency);
    for (uint32_t i = 0; i < report.concurrency; ++i) {
        workers.emplace_back([this, &slots, iteration] { workerLoop(slots, iteration); });
    }
    for (auto& w : workers) w.join();

    // Anything still queued was never dispatched
    std::deque<size_t> leftover;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        leftover.swap(queue_);
        report.peak_running = peak_running_;
    }
    for (size_t idx : leftover) {
        TransferJob& job = slots[idx].job;
        job.status = JobStatus::SKIPPED;
        job.reason = "not dispatched: " + state_.abortReason();
        state_.recordSkipped();
        publish(EventType::JOB_SKIPPED, job, iteration, job.reason);
        slots[idx].result.set_value(job);
    }

    for (auto& f : futures) report.jobs.push_back(f.get());
    report.aborted = state_.abortRequested();
    return report;
}

void TransferScheduler::workerLoop(std::vector<Slot>& slots, uint32_t iteration) {
    while (auto idx = nextJob(slots)) {
        Slot& slot = slots[*idx];
        try {
            execute(slot.job, iteration);
        } catch (const std::exception& e) {
            handleFailure(slot.job, ErrorCode::INTERNAL_ERROR, e.what(), iteration);
        }
        finishJob(slot.job);
        slot.result.set_value(slot.job);
    }
}

std::optional<size_t> TransferScheduler::nextJob(std::vector<Slot>& slots) {
    std::unique_lock<std::mutex> lock(mtx_);
    while (true) {
        if (state_.abortRequested() || queue_.empty()) return std::nullopt;

        // A streak at the threshold holds dispatch until it is resolved
        bool held = paused_ || state_.consecutiveFailures() >= state_.errorThreshold();
        if (!held) {
            auto it = std::find_if(queue_.begin(), queue_.end(), [&](size_t i) {
                return !exclusive_destinations_ ||
                       busy_destinations_.count(slots[i].job.candidate.destination_drive) == 0;
            });
            if (it != queue_.end()) {
                size_t idx = *it;
                queue_.erase(it);
                busy_destinations_.insert(slots[idx].job.candidate.destination_drive);
                peak_running_ = std::max(peak_running_, ++running_);
                slots[idx].job.status = JobStatus::RUNNING;
                return idx;
            }
        }
        cv_.wait_for(lock, ABORT_POLL_INTERVAL);
    }
}

void TransferScheduler::finishJob(const TransferJob& job) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        --running_;
        busy_destinations_.erase(job.candidate.destination_drive);
    }
    cv_.notify_all();
}

void TransferScheduler::execute(TransferJob& job, uint32_t iteration) {
    const Candidate& c = job.candidate;
    const std::string dest = c.destinationPath();
    job.started = std::chrono::system_clock::now();
    publish(EventType::JOB_STARTED, job, iteration, state_.dryRun() ? "dry run" : "", c.size);

    if (state_.dryRun()) {
        job.finished = job.started;
        job.status = JobStatus::SUCCEEDED;
        job.bytes_moved = c.size;
        job.reason = "dry run";
        state_.recordSuccess(c.size);
        PB_LOG_INFO("TransferScheduler", "[DRY RUN] Would move: " + c.source_path + " -> " + dest);
        publish(EventType::JOB_SUCCEEDED, job, iteration, job.reason, c.size);
        return;
    }

    auto current = fs::fileSize(c.source_path);
    if (!current || *current != c.size) {
        job.finished = std::chrono::system_clock::now();
        job.status = JobStatus::SKIPPED;
        job.reason = !current ? "source vanished" :
                     "source changed size (" + std::to_string(c.size) + " -> " +
                     std::to_string(*current) + ")";
        state_.recordSkipped();
        PB_LOG_WARNING("TransferScheduler", "Skipped " + c.source_path + ": " + job.reason);
        publish(EventType::JOB_SKIPPED, job, iteration, job.reason);
        return;
    }

    if (fs::exists(dest)) {
        handleFailure(job, ErrorCode::TRANSFER_FAILED, "destination already exists: " + dest, iteration);
        return;
    }

    auto outcome = runner_.copy(c.source_path, dest, [&](const TransferProgress& p) {
        publish(EventType::JOB_PROGRESS, job, iteration, "", p.bytes_transferred,
                static_cast<uint64_t>(p.percent));
    });

    std::string reason;
    ErrorCode code = ErrorCode::SUCCESS;
    if (!outcome) {
        code = outcome.error().code;
        reason = outcome.error().message;
    } else if (!outcome->succeeded()) {
        code = ErrorCode::TRANSFER_FAILED;
        reason = outcome->stderr_text.empty()
                     ? "rsync exited with code " + std::to_string(outcome->exit_status)
                     : outcome->stderr_text;
    } else if (!verifyCopy(c, reason)) {
        code = ErrorCode::VERIFY_FAILED;
    } else if (auto removed = fs::remove(c.source_path); !removed) {
        code = ErrorCode::IO_ERROR;
        reason = "cannot delete source: " + removed.error;
    }

    if (code != ErrorCode::SUCCESS) {
        // Whatever reached the destination is unverified or duplicated; the source stays
        if (fs::exists(dest)) {
            if (auto cleaned = fs::remove(dest); !cleaned) {
                PB_LOG_ERROR("TransferScheduler", "Cannot remove partial copy " + dest + ": " + cleaned.error);
            }
        }
        handleFailure(job, code, reason, iteration);
        return;
    }

    int pruned = fs::pruneEmptyParents(fs::Path(c.source_path).parent_path(), c.source_drive);
    if (pruned > 0) {
        PB_LOG_DEBUG("TransferScheduler", "Removed " + std::to_string(pruned) +
                     " empty directories under " + c.source_drive);
    }

    job.finished = std::chrono::system_clock::now();
    job.status = JobStatus::SUCCEEDED;
    job.bytes_moved = c.size;
    state_.recordSuccess(c.size);
    PB_LOG_INFO("TransferScheduler", "Moved " + c.source_path + " -> " + dest + " (" +
                formatBytes(c.size) + ")");
    publish(EventType::JOB_SUCCEEDED, job, iteration, "", c.size);
}

bool TransferScheduler::verifyCopy(const Candidate& c, std::string& reason) const {
    const std::string dest = c.destinationPath();
    auto size = fs::fileSize(dest);
    if (!size) {
        reason = "destination missing after copy: " + dest;
        return false;
    }
    if (*size != c.size) {
        reason = "size mismatch: expected " + std::to_string(c.size) + ", got " + std::to_string(*size);
        return false;
    }
    if (!options_.verify_checksum) return true;

    auto src_crc = CRC32::computeFile(c.source_path);
    auto dst_crc = CRC32::computeFile(dest);
    if (!src_crc || !dst_crc) {
        reason = "cannot read file for checksum";
        return false;
    }
    if (*src_crc != *dst_crc) {
        reason = "checksum mismatch";
        return false;
    }
    return true;
}

void TransferScheduler::handleFailure(TransferJob& job, ErrorCode code, const std::string& reason,
                                      uint32_t iteration) {
    job.finished = std::chrono::system_clock::now();
    job.status = JobStatus::FAILED;
    job.reason = reason;
    job.bytes_moved = 0;

    bool reached = false;
    uint32_t streak = 0;
    {
        // Dispatch is held in the same step that trips the threshold
        std::lock_guard<std::mutex> lock(mtx_);
        reached = state_.recordFailure(job.candidate.source_path);
        streak = state_.consecutiveFailures();
        if (reached) paused_ = true;
    }
    PB_LOG_ERROR("TransferScheduler", "Failed: " + job.candidate.source_path + " - [" +
                 errorCodeToString(code) + "] " + reason);
    publish(EventType::JOB_FAILED, job, iteration, reason, 0, streak);

    if (reached) onThreshold(streak, iteration);
}

void TransferScheduler::onThreshold(uint32_t consecutive, uint32_t iteration) {
    const std::string what = std::to_string(consecutive) + " consecutive errors";
    PB_LOG_WARNING("TransferScheduler", "Error threshold reached: " + what);
    if (bus_) {
        BalanceEvent ev;
        ev.type = EventType::THRESHOLD_REACHED;
        ev.iteration = iteration;
        ev.count = consecutive;
        ev.target_percent = state_.targetPercent();
        ev.message = what;
        bus_->publish(ev);
    }

    if (state_.abortOnError()) {
        state_.requestAbort(what);
        cv_.notify_all();
        return;
    }

    ThresholdDecision decision = handler_ ? handler_->onThresholdReached(consecutive)
                                          : ThresholdDecision::ABORT;
    if (decision == ThresholdDecision::RESUME) {
        PB_LOG_INFO("TransferScheduler", "Resuming after " + what);
        state_.resetFailureStreak();
    } else {
        state_.requestAbort("aborted by operator after " + what);
    }
    { std::lock_guard<std::mutex> lock(mtx_); paused_ = false; }
    cv_.notify_all();
}

} // namespace poolbalancer
