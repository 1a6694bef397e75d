/**
 * @file balancer_filesystem.hpp
 * @brief Non-throwing filesystem helpers used by the balancer
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Every helper reports failure through its return value; none of them
 * throws std::filesystem::filesystem_error.
 */

#ifndef POOLBALANCER_BALANCER_FILESYSTEM_HPP
#define POOLBALANCER_BALANCER_FILESYSTEM_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <string_view>

namespace poolbalancer {
namespace fs {

namespace stdfs = std::filesystem;
using Path = stdfs::path;

[[nodiscard]] inline bool exists(const Path& p) noexcept {
    std::error_code ec;
    return stdfs::exists(p, ec);
}

[[nodiscard]] inline bool isFile(const Path& p) noexcept {
    std::error_code ec;
    return stdfs::is_regular_file(p, ec);
}

[[nodiscard]] inline bool isDirectory(const Path& p) noexcept {
    std::error_code ec;
    return stdfs::is_directory(p, ec);
}

/// nullopt when @p p cannot be stat'ed
[[nodiscard]] inline std::optional<uint64_t> fileSize(const Path& p) noexcept {
    std::error_code ec;
    const auto bytes = stdfs::file_size(p, ec);
    if (ec) return std::nullopt;
    return static_cast<uint64_t>(bytes);
}

/// Dot-prefixed names are never balanced
[[nodiscard]] inline bool isHidden(const Path& p) {
    const auto name = p.filename().native();
    return !name.empty() && name.front() == '.';
}

/**
 * @brief Outcome of a mutating filesystem call; empty error means success
 */
struct FileResult {
    std::string error;

    [[nodiscard]] explicit operator bool() const noexcept { return error.empty(); }

    static FileResult from(const std::error_code& ec) { return {ec ? ec.message() : std::string()}; }
};

[[nodiscard]] inline FileResult createDirectory(const Path& p) {
    std::error_code ec;
    stdfs::create_directories(p, ec);
    return FileResult::from(ec);
}

[[nodiscard]] inline FileResult remove(const Path& p) {
    std::error_code ec;
    stdfs::remove(p, ec);
    return FileResult::from(ec);
}

[[nodiscard]] inline FileResult writeFile(const Path& p, std::string_view content) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (out) out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) return {"cannot write " + p.string()};
    return {};
}

[[nodiscard]] inline std::optional<std::string> readFile(const Path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

/**
 * @brief Remove empty directories from @p start upward, stopping below @p root
 *
 * The root is never removed, nor anything outside it.
 * @return Number of directories removed
 */
inline int pruneEmptyParents(const Path& start, const Path& root) {
    const Path stop = root.lexically_normal();
    int removed = 0;
    for (Path dir = start.lexically_normal(); !dir.empty() && dir != stop; dir = dir.parent_path()) {
        const auto rel = dir.lexically_relative(stop);
        if (rel.empty() || *rel.begin() == "..") break;
        std::error_code ec;
        if (!stdfs::is_directory(dir, ec) || !stdfs::is_empty(dir, ec) || ec) break;
        if (!stdfs::remove(dir, ec) || ec) break;
        ++removed;
    }
    return removed;
}

/**
 * @brief Uniquely named directory under the system temp dir, removed with its contents
 */
class TempDirectory {
public:
    explicit TempDirectory(std::string_view prefix = "poolbalance") {
        static std::mt19937_64 rng{std::random_device{}()};
        std::error_code ec;
        std::ostringstream name;
        name << prefix << "_" << std::hex << rng();
        path_ = stdfs::temp_directory_path(ec) / name.str();
        stdfs::create_directories(path_, ec);
    }

    ~TempDirectory() {
        std::error_code ec;
        if (!path_.empty()) stdfs::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    [[nodiscard]] const Path& path() const noexcept { return path_; }
    [[nodiscard]] Path operator/(const Path& sub) const { return path_ / sub; }

private:
    Path path_;
};

} // namespace fs
} // namespace poolbalancer

#endif // POOLBALANCER_BALANCER_FILESYSTEM_HPP
