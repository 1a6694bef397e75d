/**
 * @file console_reporter.hpp
 * @brief Terminal rendering of engine events and the run summary
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef POOLBALANCER_CONSOLE_REPORTER_HPP
#define POOLBALANCER_CONSOLE_REPORTER_HPP

#include "balancer_events.hpp"
#include "transfer_scheduler.hpp"
#include <iostream>
#include <mutex>

namespace poolbalancer {

/**
 * @class ConsoleReporter
 * @brief Subscribes to a bus and prints what the verbosity asks for
 *
 * quiet: errors only. Default: plan, dry-run moves, failures and the
 * outcome. -v adds iterations, drives and per-job lines. -vv adds
 * transfer progress.
 */
class ConsoleReporter {
public:
    ConsoleReporter(EventBus& bus, std::ostream& out, std::ostream& err, int verbose, bool quiet);
    ~ConsoleReporter();

    ConsoleReporter(const ConsoleReporter&) = delete;
    ConsoleReporter& operator=(const ConsoleReporter&) = delete;

    void onEvent(const BalanceEvent& event);

    /**
     * @brief Files moved, bytes, errors, per-drive usage and the balance verdict
     */
    void printSummary(const RunReport& report, double percentage, bool dry_run);

    /**
     * @brief Serialises output with event rendering; used by the threshold prompt
     */
    [[nodiscard]] std::mutex& outputMutex() { return mtx_; }

private:
    EventBus& bus_;
    EventBus::SubscriberId sub_;
    std::ostream& out_;
    std::ostream& err_;
    int verbose_;
    bool quiet_;
    std::mutex mtx_;
};

/**
 * @class PromptThresholdHandler
 * @brief Asks "Continue? [y/N]"; only 'y' resumes, EOF aborts
 */
class PromptThresholdHandler : public ThresholdHandler {
public:
    PromptThresholdHandler(std::istream& in, std::ostream& err, std::mutex* output_mutex = nullptr)
        : in_(in), err_(err), output_mutex_(output_mutex) {}

    ThresholdDecision onThresholdReached(uint32_t consecutive_failures) override;

private:
    void say(const std::string& text);

    std::istream& in_;
    std::ostream& err_;
    std::mutex* output_mutex_;
};

} // namespace poolbalancer
#endif
