/**
 * @file target_calculator.hpp
 * @brief Pool-wide target usage and drive classification
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef POOLBALANCER_TARGET_CALCULATOR_HPP
#define POOLBALANCER_TARGET_CALCULATOR_HPP

#include "balancer_types.hpp"
#include <vector>

namespace poolbalancer {

/**
 * @struct Classification
 * @brief Drives of one iteration with their class and the target they were judged against
 */
struct Classification {
    double target_percent = 0.0;
    std::vector<Drive> drives;

    [[nodiscard]] std::vector<Drive> overfull() const;    ///< Usage descending, ties by path
    [[nodiscard]] std::vector<Drive> underfull() const;   ///< Discovery order
    [[nodiscard]] bool converged() const;
};

/**
 * @class TargetCalculator
 * @brief Computes target% and classifies drives against a tolerance band
 *
 * The band is [target - percentage/2, target + percentage/2]. A drive
 * exactly on an edge is neutral.
 */
class TargetCalculator {
public:
    explicit TargetCalculator(double percentage) : percentage_(percentage) {}

    [[nodiscard]] double percentage() const { return percentage_; }

    /**
     * @brief Σused / Σtotal * 100 over drives that are not excluded
     * @return 0 when the eligible capacity is zero
     */
    [[nodiscard]] static double targetPercent(const std::vector<Drive>& drives);

    [[nodiscard]] DriveClass classify(const Drive& drive, double target) const;

    /**
     * @brief Copy the drives and set each one's classification
     */
    [[nodiscard]] Classification classifyAll(const std::vector<Drive>& drives) const;

    /// Spread between the fullest and the emptiest non-excluded drive
    [[nodiscard]] static double usageRange(const std::vector<Drive>& drives);

    /// Bytes a drive holds above the target; 0 when at or below it
    [[nodiscard]] static uint64_t excessBytes(const Drive& drive, double target);

    /// Bytes a drive may receive before reaching the target, capped by free space
    [[nodiscard]] static uint64_t headroomBytes(const Drive& drive, double target);

private:
    double percentage_;
};

} // namespace poolbalancer
#endif
