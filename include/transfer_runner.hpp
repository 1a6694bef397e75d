/**
 * @file transfer_runner.hpp
 * @brief External copy utility adapter
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef POOLBALANCER_TRANSFER_RUNNER_HPP
#define POOLBALANCER_TRANSFER_RUNNER_HPP

#include "result.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace poolbalancer {

/**
 * @struct TransferProgress
 * @brief One progress report from the copy utility
 */
struct TransferProgress {
    uint64_t bytes_transferred = 0;
    int percent = 0;
    double speed_bytes_per_sec = 0.0;
    std::optional<uint32_t> eta_seconds;
};

using ProgressCallback = std::function<void(const TransferProgress&)>;

/**
 * @struct TransferOutcome
 * @brief What the utility reported once it exited
 */
struct TransferOutcome {
    int exit_status = 0;
    uint64_t bytes_transferred = 0;
    std::string stderr_text;

    [[nodiscard]] bool succeeded() const { return exit_status == 0; }
};

/**
 * @class TransferRunner
 * @brief Copies one file, preserving attributes, and blocks until done
 *
 * Implementations must be safe to call from several threads at once.
 * An error result means the utility could not be run at all.
 */
class TransferRunner {
public:
    virtual ~TransferRunner() = default;
    virtual Result<TransferOutcome> copy(const std::string& source,
                                         const std::string& destination,
                                         const ProgressCallback& progress) = 0;
};

/**
 * @class RsyncRunner
 * @brief Runs `rsync -a --info=progress2 --no-inc-recursive SRC DEST`
 *
 * The destination's parent directory is created first. rsync runs in its
 * own process group so a terminal interrupt does not kill a copy midway.
 */
class RsyncRunner : public TransferRunner {
public:
    explicit RsyncRunner(std::string rsync_path = "rsync") : rsync_path_(std::move(rsync_path)) {}

    Result<TransferOutcome> copy(const std::string& source,
                                 const std::string& destination,
                                 const ProgressCallback& progress) override;

    [[nodiscard]] std::vector<std::string> buildCommand(const std::string& source,
                                                        const std::string& destination) const;

private:
    std::string rsync_path_;
};

/**
 * @brief Parse one rsync --info=progress2 line
 *
 * Example: "  1,234,567  50%   12.34MB/s    0:01:23"
 * @return Progress, or nullopt when the line is not a progress line
 */
[[nodiscard]] std::optional<TransferProgress> parseRsyncProgress(const std::string& line);

} // namespace poolbalancer
#endif
