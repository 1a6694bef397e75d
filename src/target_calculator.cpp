/**
 * @file target_calculator.cpp
 * @brief Target usage and classification implementation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "target_calculator.hpp"
#include <algorithm>
#include <cmath>

namespace poolbalancer {

namespace {

// Float noise in percentage points; keeps drives on a band edge neutral
constexpr double BOUNDARY_EPSILON = 1e-9;

uint64_t bytesAtPercent(uint64_t total, double pct) {
    if (pct <= 0.0) return 0;
    double bytes = static_cast<double>(total) * pct / 100.0;
    return static_cast<uint64_t>(std::floor(bytes));
}

} // namespace

double TargetCalculator::targetPercent(const std::vector<Drive>& drives) {
    long double used = 0, total = 0;
    for (const auto& d : drives) {
        if (d.isExcluded()) continue;
        used += d.used_bytes;
        total += d.total_bytes;
    }
    if (total == 0) return 0.0;
    return static_cast<double>(used * 100.0L / total);
}

DriveClass TargetCalculator::classify(const Drive& drive, double target) const {
    if (drive.isExcluded()) return DriveClass::EXCLUDED;
    double usage = drive.usagePercent();
    double half = percentage_ / 2.0;
    if (usage > target + half + BOUNDARY_EPSILON && drive.allowed_source) return DriveClass::OVERFULL;
    if (usage < target - half - BOUNDARY_EPSILON && drive.allowed_destination) return DriveClass::UNDERFULL;
    return DriveClass::NEUTRAL;
}

Classification TargetCalculator::classifyAll(const std::vector<Drive>& drives) const {
    Classification result;
    result.target_percent = targetPercent(drives);
    result.drives = drives;
    for (auto& d : result.drives) d.classification = classify(d, result.target_percent);
    return result;
}

std::vector<Drive> Classification::overfull() const {
    std::vector<Drive> out;
    for (const auto& d : drives) if (d.classification == DriveClass::OVERFULL) out.push_back(d);
    std::stable_sort(out.begin(), out.end(), [](const Drive& a, const Drive& b) {
        if (a.usagePercent() != b.usagePercent()) return a.usagePercent() > b.usagePercent();
        return a.path < b.path;
    });
    return out;
}

std::vector<Drive> Classification::underfull() const {
    std::vector<Drive> out;
    for (const auto& d : drives) if (d.classification == DriveClass::UNDERFULL) out.push_back(d);
    return out;
}

bool Classification::converged() const {
    bool any_over = false, any_under = false;
    for (const auto& d : drives) {
        any_over = any_over || d.classification == DriveClass::OVERFULL;
        any_under = any_under || d.classification == DriveClass::UNDERFULL;
    }
    return !any_over || !any_under;
}

double TargetCalculator::usageRange(const std::vector<Drive>& drives) {
    bool first = true;
    double lo = 0.0, hi = 0.0;
    for (const auto& d : drives) {
        if (d.isExcluded()) continue;
        double u = d.usagePercent();
        if (first) { lo = hi = u; first = false; continue; }
        lo = std::min(lo, u);
        hi = std::max(hi, u);
    }
    return hi - lo;
}

uint64_t TargetCalculator::excessBytes(const Drive& drive, double target) {
    uint64_t at_target = bytesAtPercent(drive.total_bytes, target);
    return drive.used_bytes > at_target ? drive.used_bytes - at_target : 0;
}

uint64_t TargetCalculator::headroomBytes(const Drive& drive, double target) {
    uint64_t at_target = bytesAtPercent(drive.total_bytes, target);
    if (drive.used_bytes >= at_target) return 0;
    return std::min(at_target - drive.used_bytes, drive.free_bytes);
}

} // namespace poolbalancer
