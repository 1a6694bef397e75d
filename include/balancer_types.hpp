/**
 * @file balancer_types.hpp
 * @brief Core type definitions for the pool balancer
 * @version 1.0.0
 * @date 2025
 * @author Bennie Shearer
 *
 * Copyright (c) 2025 Bennie Shearer
 * MIT License - see LICENSE file for details
 *
 * Drives, candidates, transfer jobs and the enumerations shared by the
 * inventory, selector, scheduler and convergence loop.
 */

#ifndef POOLBALANCER_BALANCER_TYPES_HPP
#define POOLBALANCER_BALANCER_TYPES_HPP

#include <string>
#include <cstdint>
#include <chrono>
#include <vector>
#include <optional>
#include <sstream>
#include <iomanip>
#include <cctype>
#include <cmath>

namespace poolbalancer {

//=============================================================================
// Version Information
//=============================================================================
constexpr const char* VERSION = "1.0.0";
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char* PROGRAM_NAME = "pool-balance";

//=============================================================================
// Core Enumerations
//=============================================================================

/**
 * @enum DriveClass
 * @brief Position of a drive relative to the target usage band
 */
enum class DriveClass {
    NEUTRAL,        ///< Inside the tolerance band (or exactly on its edge)
    OVERFULL,       ///< Above the band, eligible source
    UNDERFULL,      ///< Below the band, eligible destination
    EXCLUDED        ///< Neither source nor destination by restriction
};

/**
 * @enum JobStatus
 * @brief Lifecycle of one transfer job
 */
enum class JobStatus {
    PENDING,
    RUNNING,
    SUCCEEDED,
    FAILED,
    SKIPPED
};

/**
 * @enum TerminationKind
 * @brief Terminal states of one balancing run
 */
enum class TerminationKind {
    CONVERGED,          ///< No overfull or no underfull drive remains
    NO_CANDIDATES,      ///< Still unbalanced but nothing eligible to move
    ABORTED,            ///< Error policy, operator or external cancellation
    DISCOVERY_FAILED,   ///< Drive state could not be read
    DRY_RUN_COMPLETE    ///< Plan reported without touching the filesystem
};

//=============================================================================
// Core Structures
//=============================================================================

/**
 * @struct Drive
 * @brief One pool member as observed at the start of an iteration
 */
struct Drive {
    std::string path;
    uint64_t total_bytes = 0;
    uint64_t used_bytes = 0;
    uint64_t free_bytes = 0;
    DriveClass classification = DriveClass::NEUTRAL;
    bool allowed_source = true;
    bool allowed_destination = true;

    [[nodiscard]] double usagePercent() const {
        if (total_bytes == 0) return 0.0;
        return static_cast<double>(used_bytes) * 100.0 / static_cast<double>(total_bytes);
    }
    [[nodiscard]] double freePercent() const { return 100.0 - usagePercent(); }
    [[nodiscard]] bool isExcluded() const { return !allowed_source && !allowed_destination; }
};

/**
 * @struct Candidate
 * @brief A file chosen to move in the current iteration
 */
struct Candidate {
    std::string source_path;        ///< Absolute path on the source drive
    std::string relative_path;      ///< Path below the drive root
    uint64_t size = 0;
    std::string source_drive;
    std::string destination_drive;
    uint32_t rank = 0;              ///< Position in the plan, 0 is first

    [[nodiscard]] std::string destinationPath() const {
        if (destination_drive.empty()) return relative_path;
        if (destination_drive.back() == '/') return destination_drive + relative_path;
        return destination_drive + "/" + relative_path;
    }
};

/**
 * @struct TransferJob
 * @brief A candidate together with its execution state
 */
struct TransferJob {
    Candidate candidate;
    JobStatus status = JobStatus::PENDING;
    std::string reason;
    std::chrono::system_clock::time_point started;
    std::chrono::system_clock::time_point finished;
    uint64_t bytes_moved = 0;

    [[nodiscard]] bool isTerminal() const {
        return status == JobStatus::SUCCEEDED || status == JobStatus::FAILED ||
               status == JobStatus::SKIPPED;
    }
    [[nodiscard]] double durationSeconds() const {
        return std::chrono::duration<double>(finished - started).count();
    }
};

/**
 * @struct RunReport
 * @brief What a run ended with; rendered by the caller
 */
struct RunReport {
    TerminationKind termination = TerminationKind::CONVERGED;
    std::string reason;
    uint32_t iterations = 0;
    uint64_t bytes_moved = 0;
    uint64_t jobs_succeeded = 0;
    uint64_t jobs_failed = 0;
    uint64_t jobs_skipped = 0;
    double target_percent = 0.0;
    std::vector<Drive> final_drives;
};

//=============================================================================
// Utility Functions
//=============================================================================

inline std::string driveClassToString(DriveClass c) {
    switch (c) {
        case DriveClass::NEUTRAL: return "NEUTRAL";
        case DriveClass::OVERFULL: return "OVERFULL";
        case DriveClass::UNDERFULL: return "UNDERFULL";
        case DriveClass::EXCLUDED: return "EXCLUDED";
    }
    return "UNKNOWN";
}

inline std::string jobStatusToString(JobStatus s) {
    switch (s) {
        case JobStatus::PENDING: return "PENDING";
        case JobStatus::RUNNING: return "RUNNING";
        case JobStatus::SUCCEEDED: return "SUCCEEDED";
        case JobStatus::FAILED: return "FAILED";
        case JobStatus::SKIPPED: return "SKIPPED";
    }
    return "UNKNOWN";
}

inline std::string terminationToString(TerminationKind t) {
    switch (t) {
        case TerminationKind::CONVERGED: return "Converged";
        case TerminationKind::NO_CANDIDATES: return "NoCandidates";
        case TerminationKind::ABORTED: return "Aborted";
        case TerminationKind::DISCOVERY_FAILED: return "DiscoveryFailed";
        case TerminationKind::DRY_RUN_COMPLETE: return "DryRunComplete";
    }
    return "Unknown";
}

inline std::string formatBytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    int unit = 0;
    double value = static_cast<double>(bytes);
    while (value >= 1024.0 && unit < 5) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << units[unit];
    return oss.str();
}

inline std::string formatPercent(double pct) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << pct << "%";
    return oss.str();
}

/**
 * @brief Parse a size string such as "100M", "1.5GB", "2TiB" or "1024"
 * @return Byte count, or nullopt when the string is empty, negative,
 *         malformed or carries an unknown unit. Units are 1024-based.
 */
inline std::optional<uint64_t> parseSize(const std::string& text) {
    std::string s;
    for (char c : text) s += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    auto start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return std::nullopt;
    auto end = s.find_last_not_of(" \t");
    s = s.substr(start, end - start + 1);

    size_t i = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    if (i == 0) return std::nullopt;
    if (i < s.size() && s[i] == '.') {
        size_t frac = i + 1;
        while (frac < s.size() && std::isdigit(static_cast<unsigned char>(s[frac]))) ++frac;
        if (frac == i + 1) return std::nullopt;
        i = frac;
    }
    double value = 0.0;
    try { value = std::stod(s.substr(0, i)); } catch (const std::exception&) { return std::nullopt; }

    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
    std::string unit = s.substr(i);

    static const std::pair<const char*, int> units[] = {
        {"", 0}, {"B", 0},
        {"K", 1}, {"KB", 1}, {"KIB", 1},
        {"M", 2}, {"MB", 2}, {"MIB", 2},
        {"G", 3}, {"GB", 3}, {"GIB", 3},
        {"T", 4}, {"TB", 4}, {"TIB", 4},
        {"P", 5}, {"PB", 5}, {"PIB", 5},
    };
    for (const auto& [name, power] : units) {
        if (unit == name) {
            return static_cast<uint64_t>(value * std::pow(1024.0, power));
        }
    }
    return std::nullopt;
}

} // namespace poolbalancer

#endif // POOLBALANCER_BALANCER_TYPES_HPP
