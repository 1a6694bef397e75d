/**
 * @file console_reporter.cpp
 * @brief Terminal rendering implementation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "console_reporter.hpp"
#include "target_calculator.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>

namespace poolbalancer {

ConsoleReporter::ConsoleReporter(EventBus& bus, std::ostream& out, std::ostream& err,
                                 int verbose, bool quiet)
    : bus_(bus), out_(out), err_(err), verbose_(verbose), quiet_(quiet) {
    sub_ = bus_.subscribeAll([this](const BalanceEvent& e) { onEvent(e); });
}

ConsoleReporter::~ConsoleReporter() {
    bus_.unsubscribe(sub_);
}

void ConsoleReporter::onEvent(const BalanceEvent& e) {
    std::lock_guard<std::mutex> lock(mtx_);
    const bool normal = !quiet_;
    const bool verbose = normal && verbose_ >= 1;

    switch (e.type) {
        case EventType::ITERATION_STARTED:
            if (verbose) out_ << "Iteration " << e.iteration << "\n";
            break;
        case EventType::DRIVE_CLASSIFIED:
            if (verbose && e.drive) {
                out_ << "  " << e.drive->path << ": " << formatPercent(e.drive->usagePercent())
                     << " used, " << formatBytes(e.drive->free_bytes) << " free ("
                     << driveClassToString(e.drive->classification) << ", target "
                     << formatPercent(e.target_percent) << ")\n";
            }
            break;
        case EventType::DRIVE_UNAVAILABLE:
            if (normal && e.drive) out_ << "Warning: drive unavailable: " << e.drive->path << "\n";
            break;
        case EventType::SELECTION_WARNING:
            if (normal) out_ << "Warning: " << e.message << "\n";
            break;
        case EventType::PLAN_READY:
            if (normal && e.count > 0) {
                out_ << "Planned " << e.count << " transfer" << (e.count == 1 ? "" : "s")
                     << " (" << formatBytes(e.bytes) << ")\n";
            }
            break;
        case EventType::JOB_STARTED:
            if (verbose && e.job && e.message.empty()) {
                out_ << "Starting transfer: " << e.job->candidate.source_path << " -> "
                     << e.job->candidate.destinationPath() << "\n";
            }
            break;
        case EventType::JOB_PROGRESS:
            if (normal && verbose_ >= 2 && e.job) {
                out_ << "  " << std::setw(3) << e.count << "% " << formatBytes(e.bytes) << " "
                     << e.job->candidate.relative_path << "\n";
            }
            break;
        case EventType::JOB_SUCCEEDED:
            if (!normal || !e.job) break;
            if (e.job->reason == "dry run") {
                out_ << "[DRY RUN] Would move: " << e.job->candidate.source_path << " -> "
                     << e.job->candidate.destinationPath() << " (" << formatBytes(e.job->candidate.size)
                     << ")\n";
            } else if (verbose) {
                out_ << "Completed: " << e.job->candidate.source_path << "\n";
            }
            break;
        case EventType::JOB_FAILED:
            if (e.job) err_ << "ERROR: Failed: " << e.job->candidate.source_path << " - " << e.message << "\n";
            break;
        case EventType::JOB_SKIPPED:
            if (verbose && e.job) out_ << "Skipped: " << e.job->candidate.source_path << " - " << e.message << "\n";
            break;
        case EventType::THRESHOLD_REACHED:
            err_ << "\n" << std::string(50, '=') << "\n"
                 << "WARNING: " << e.count << " consecutive errors\n"
                 << std::string(50, '=') << "\n";
            break;
        case EventType::RUN_TERMINATED:
            if (e.termination && (*e.termination == TerminationKind::ABORTED ||
                                  *e.termination == TerminationKind::DISCOVERY_FAILED)) {
                err_ << terminationToString(*e.termination) << ": " << e.message << "\n";
            } else if (normal) {
                out_ << (e.termination ? terminationToString(*e.termination) : std::string("Finished"))
                     << ": " << e.message << "\n";
            }
            break;
    }
    out_.flush();
}

void ConsoleReporter::printSummary(const RunReport& report, double percentage, bool dry_run) {
    if (quiet_) return;
    std::lock_guard<std::mutex> lock(mtx_);

    const std::string rule(50, '=');
    out_ << "\n" << rule << "\n"
         << (dry_run ? "Balance Plan (dry run)" : "Balance Summary") << "\n"
         << rule << "\n";
    out_ << "Result:            " << terminationToString(report.termination);
    if (!report.reason.empty()) out_ << " (" << report.reason << ")";
    out_ << "\n";
    out_ << "Iterations:        " << report.iterations << "\n";
    out_ << (dry_run ? "Files to move:     " : "Files moved:       ") << report.jobs_succeeded << "\n";
    out_ << (dry_run ? "Data to transfer:  " : "Data transferred:  ") << formatBytes(report.bytes_moved) << "\n";
    out_ << "Errors:            " << report.jobs_failed << "\n";
    if (report.jobs_skipped > 0) out_ << "Skipped:           " << report.jobs_skipped << "\n";
    out_ << "\n";

    if (report.final_drives.empty()) {
        out_.flush();
        return;
    }

    auto drives = report.final_drives;
    std::sort(drives.begin(), drives.end(), [](const Drive& a, const Drive& b) { return a.path < b.path; });
    out_ << "Drive Status:\n";
    for (const auto& d : drives) {
        out_ << "  " << d.path << ": " << formatPercent(d.usagePercent()) << " used ("
             << driveClassToString(d.classification) << ")\n";
    }
    out_ << "\n";

    double range = TargetCalculator::usageRange(drives);
    if (range <= percentage) {
        out_ << "All drives are within " << formatPercent(percentage) << " of each other.\n";
    } else {
        out_ << "Drives have a usage range of " << formatPercent(range) << "\n";
    }
    out_.flush();
}

void PromptThresholdHandler::say(const std::string& text) {
    std::unique_lock<std::mutex> lock;
    if (output_mutex_) lock = std::unique_lock<std::mutex>(*output_mutex_);
    err_ << text;
    err_.flush();
}

ThresholdDecision PromptThresholdHandler::onThresholdReached(uint32_t consecutive_failures) {
    // The output lock is never held while waiting for input: running jobs keep reporting
    say(std::to_string(consecutive_failures) + " transfers failed in a row. Continue? [y/N]: ");

    std::string response;
    if (!std::getline(in_, response)) {
        say("\nNon-interactive mode, aborting.\n");
        return ThresholdDecision::ABORT;
    }
    auto start = response.find_first_not_of(" \t\r");
    auto end = response.find_last_not_of(" \t\r");
    std::string answer = start == std::string::npos ? "" : response.substr(start, end - start + 1);
    if (answer == "y" || answer == "Y") return ThresholdDecision::RESUME;

    say("Aborting by user request.\n");
    return ThresholdDecision::ABORT;
}

} // namespace poolbalancer
