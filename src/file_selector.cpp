/**
 * @file file_selector.cpp
 * @brief Candidate selection implementation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "file_selector.hpp"
#include "balancer_filesystem.hpp"
#include "balancer_logger.hpp"
#include <algorithm>

namespace poolbalancer {

Result<std::vector<FileEntry>> FilesystemSource::listFiles(const std::string& root) {
    std::vector<FileEntry> files;
    if (!fs::isDirectory(root)) return files;

    std::error_code ec;
    fs::stdfs::recursive_directory_iterator it(
        root, fs::stdfs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Err<std::vector<FileEntry>>(ErrorCode::IO_ERROR,
                                           "Cannot walk " + root + ": " + ec.message());
    }

    for (auto end = fs::stdfs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            PB_LOG_WARNING("FileSelector", "Walk error under " + root + ": " + ec.message());
            ec.clear();
            break;
        }
        const auto& entry = *it;
        if (fs::isHidden(entry.path())) {
            if (entry.is_directory(ec)) it.disable_recursion_pending();
            continue;
        }
        if (entry.is_symlink(ec) || !entry.is_regular_file(ec)) continue;

        auto size = entry.file_size(ec);
        if (ec) { ec.clear(); continue; }
        files.push_back({entry.path().string(), static_cast<uint64_t>(size)});
    }
    return files;
}

void FileSelector::warn(SelectionPlan& plan, const Drive& drive, const std::string& message,
                        uint32_t iteration) {
    PB_LOG_WARNING("FileSelector", message);
    plan.warnings.push_back(message);
    if (!bus_) return;
    BalanceEvent ev;
    ev.type = EventType::SELECTION_WARNING;
    ev.iteration = iteration;
    ev.drive = drive;
    ev.message = message;
    bus_->publish(ev);
}

SelectionPlan FileSelector::select(const Classification& classification,
                                   const std::string& subpath,
                                   const std::set<std::string>& failed_paths,
                                   uint32_t iteration) {
    SelectionPlan plan;
    plan.target_percent = classification.target_percent;
    const double target = classification.target_percent;

    struct Destination {
        std::string path;
        uint64_t remaining;
    };
    std::vector<Destination> dests;
    for (const auto& d : classification.underfull()) {
        dests.push_back({d.path, TargetCalculator::headroomBytes(d, target)});
    }
    if (dests.empty()) return plan;

    uint32_t rank = 0;
    for (const auto& src : classification.overfull()) {
        uint64_t excess = TargetCalculator::excessBytes(src, target);
        if (excess == 0) continue;

        fs::Path drive_root(src.path);
        std::string walk_root = subpath.empty() ? src.path : (drive_root / subpath).string();

        auto listed = source_.listFiles(walk_root);
        if (!listed) {
            warn(plan, src, "Cannot enumerate " + walk_root + ": " + listed.error().message, iteration);
            continue;
        }
        if (listed->empty()) {
            PB_LOG_DEBUG("FileSelector", "No files under " + walk_root);
            continue;
        }

        std::vector<FileEntry> accepted;
        for (const auto& f : *listed) {
            std::string rel = fs::Path(f.path).lexically_relative(drive_root).generic_string();
            if (rel.empty() || rel.rfind("..", 0) == 0) continue;
            if (!filters_.accepts(rel, f.size)) continue;
            accepted.push_back(f);
        }
        if (accepted.empty()) {
            warn(plan, src, "All " + std::to_string(listed->size()) + " files on " + src.path +
                            " were rejected by filters", iteration);
            continue;
        }

        std::sort(accepted.begin(), accepted.end(), [](const FileEntry& a, const FileEntry& b) {
            if (a.size != b.size) return a.size > b.size;
            return a.path < b.path;
        });

        uint64_t planned = 0;
        for (const auto& f : accepted) {
            if (planned >= excess) break;
            if (failed_paths.count(f.path)) continue;
            // Moving this file would pull the source below the target
            if (f.size > excess - planned) continue;

            // Destinations are Underfull drives, so the source is never among them
            std::sort(dests.begin(), dests.end(), [](const Destination& a, const Destination& b) {
                if (a.remaining != b.remaining) return a.remaining > b.remaining;
                return a.path < b.path;
            });
            auto fit = std::find_if(dests.begin(), dests.end(), [&](const Destination& d) {
                return d.remaining >= f.size;
            });
            if (fit == dests.end()) {
                PB_LOG_DEBUG("FileSelector", "No destination admits " + f.path + " (" +
                             formatBytes(f.size) + ")");
                continue;
            }

            Candidate c;
            c.source_path = f.path;
            c.relative_path = fs::Path(f.path).lexically_relative(drive_root).generic_string();
            c.size = f.size;
            c.source_drive = src.path;
            c.destination_drive = fit->path;
            c.rank = rank++;
            fit->remaining -= f.size;
            planned += f.size;
            plan.candidates.push_back(std::move(c));
        }
        PB_LOG_DEBUG("FileSelector", src.path + ": planned " + formatBytes(planned) + " of " +
                     formatBytes(excess) + " excess");
    }
    return plan;
}

} // namespace poolbalancer
