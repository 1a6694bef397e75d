/**
 * @file file_selector.hpp
 * @brief Candidate selection and destination assignment
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * FileSelector turns one iteration's classification into a read-only plan:
 * - Sources are visited fullest first
 * - Within a source, largest file first, ties by path
 * - Each file goes to the underfull drive with the most remaining headroom
 * - A source stops contributing once its excess over the target is covered
 */
#ifndef POOLBALANCER_FILE_SELECTOR_HPP
#define POOLBALANCER_FILE_SELECTOR_HPP

#include "balancer_types.hpp"
#include "balancer_events.hpp"
#include "file_filter.hpp"
#include "target_calculator.hpp"
#include "result.hpp"
#include <set>
#include <string>
#include <vector>

namespace poolbalancer {

struct FileEntry {
    std::string path;   ///< Absolute path
    uint64_t size = 0;
};

/**
 * @class FileSource
 * @brief Enumerates regular files below a directory
 */
class FileSource {
public:
    virtual ~FileSource() = default;

    /**
     * @return Every visible regular file below @p root; an absent root
     *         yields an empty list
     */
    virtual Result<std::vector<FileEntry>> listFiles(const std::string& root) = 0;
};

/**
 * @class FilesystemSource
 * @brief Recursive walk that skips hidden files and hidden directories
 *
 * Symlinks are neither followed nor listed. Unreadable subdirectories are
 * skipped.
 */
class FilesystemSource : public FileSource {
public:
    Result<std::vector<FileEntry>> listFiles(const std::string& root) override;
};

/**
 * @struct SelectionPlan
 * @brief Ordered candidates for one iteration
 */
struct SelectionPlan {
    double target_percent = 0.0;
    std::vector<Candidate> candidates;
    std::vector<std::string> warnings;

    [[nodiscard]] bool empty() const { return candidates.empty(); }
    [[nodiscard]] uint64_t totalBytes() const {
        uint64_t total = 0;
        for (const auto& c : candidates) total += c.size;
        return total;
    }
    /// Distinct destination drives used by the plan
    [[nodiscard]] size_t destinationCount() const {
        std::set<std::string> dests;
        for (const auto& c : candidates) dests.insert(c.destination_drive);
        return dests.size();
    }
};

class FileSelector {
public:
    FileSelector(FileSource& source, FilterPipeline filters, EventBus* bus = nullptr)
        : source_(source), filters_(std::move(filters)), bus_(bus) {}

    /**
     * @brief Build the plan for one iteration
     * @param classification Classified drives and their target
     * @param subpath Pool-relative directory to balance ("" for the whole pool)
     * @param failed_paths Source paths already failed in this run; never reselected
     * @param iteration Iteration number carried on published events
     */
    [[nodiscard]] SelectionPlan select(const Classification& classification,
                                       const std::string& subpath,
                                       const std::set<std::string>& failed_paths = {},
                                       uint32_t iteration = 0);

private:
    void warn(SelectionPlan& plan, const Drive& drive, const std::string& message, uint32_t iteration);

    FileSource& source_;
    FilterPipeline filters_;
    EventBus* bus_;
};

} // namespace poolbalancer
#endif
