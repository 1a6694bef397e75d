/**
 * @file file_filter.hpp
 * @brief Glob patterns and the fixed file filter pipeline
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Filters are applied in a fixed order: exclude patterns, include
 * patterns, minimum size, maximum size.
 */
#ifndef POOLBALANCER_FILE_FILTER_HPP
#define POOLBALANCER_FILE_FILTER_HPP

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace poolbalancer {

/**
 * @class GlobPattern
 * @brief Shell-style pattern: '*', '?' and bracket classes ([abc], [a-z], [!x])
 *
 * Matching is case-sensitive and '*' also matches '/'. A pattern containing
 * '/' is matched against the pool-relative path, otherwise against the file
 * name alone. An unterminated '[' is a literal.
 */
class GlobPattern {
public:
    explicit GlobPattern(std::string pattern)
        : pattern_(std::move(pattern)), path_pattern_(pattern_.find('/') != std::string::npos) {}

    [[nodiscard]] const std::string& text() const { return pattern_; }
    [[nodiscard]] bool isPathPattern() const { return path_pattern_; }

    /**
     * @param relative_path Path below the drive root, '/'-separated
     */
    [[nodiscard]] bool matchesFile(const std::string& relative_path) const {
        if (path_pattern_) return match(relative_path, pattern_);
        auto slash = relative_path.find_last_of('/');
        return match(slash == std::string::npos ? relative_path : relative_path.substr(slash + 1), pattern_);
    }

    [[nodiscard]] static bool match(const std::string& str, const std::string& pattern) {
        size_t s = 0, p = 0;
        size_t starIdx = std::string::npos, matchIdx = 0;

        while (s < str.size()) {
            size_t next = 0;
            std::optional<bool> cls;
            if (p < pattern.size() && pattern[p] == '[') cls = matchClass(pattern, p, str[s], next);

            if (p < pattern.size() && pattern[p] == '*') {
                starIdx = p++;
                matchIdx = s;
            } else if (cls.has_value() && *cls) {
                s++;
                p = next;
            } else if (!cls.has_value() && p < pattern.size() &&
                       (pattern[p] == '?' || pattern[p] == str[s])) {
                s++;
                p++;
            } else if (starIdx != std::string::npos) {
                p = starIdx + 1;
                s = ++matchIdx;
            } else {
                return false;
            }
        }
        while (p < pattern.size() && pattern[p] == '*') p++;
        return p == pattern.size();
    }

private:
    /**
     * @brief Evaluate the bracket class starting at @p open
     * @return Whether @p c is in the class, or nullopt when the class is
     *         unterminated. @p next receives the index after ']'.
     */
    static std::optional<bool> matchClass(const std::string& pattern, size_t open, char c, size_t& next) {
        size_t i = open + 1;
        bool negate = false;
        if (i < pattern.size() && pattern[i] == '!') { negate = true; ++i; }
        size_t first = i;
        bool found = false;
        while (i < pattern.size() && (pattern[i] != ']' || i == first)) {
            if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
                if (pattern[i] <= c && c <= pattern[i + 2]) found = true;
                i += 3;
            } else {
                if (pattern[i] == c) found = true;
                ++i;
            }
        }
        if (i >= pattern.size()) return std::nullopt;
        next = i + 1;
        return found != negate;
    }

    std::string pattern_;
    bool path_pattern_;
};

/**
 * @brief Why a file was rejected by the pipeline
 */
enum class FilterVerdict {
    ACCEPTED,
    EXCLUDED,
    NOT_INCLUDED,
    TOO_SMALL,
    TOO_LARGE
};

/**
 * @class FilterPipeline
 * @brief exclude -> include -> min size -> max size
 */
class FilterPipeline {
public:
    FilterPipeline() = default;
    FilterPipeline(const std::vector<std::string>& include,
                   const std::vector<std::string>& exclude,
                   std::optional<uint64_t> min_size,
                   std::optional<uint64_t> max_size)
        : min_size_(min_size), max_size_(max_size) {
        for (const auto& p : include) include_.emplace_back(p);
        for (const auto& p : exclude) exclude_.emplace_back(p);
    }

    [[nodiscard]] FilterVerdict evaluate(const std::string& relative_path, uint64_t size) const {
        for (const auto& pattern : exclude_) {
            if (pattern.matchesFile(relative_path)) return FilterVerdict::EXCLUDED;
        }
        if (!include_.empty()) {
            bool any = false;
            for (const auto& pattern : include_) {
                if (pattern.matchesFile(relative_path)) { any = true; break; }
            }
            if (!any) return FilterVerdict::NOT_INCLUDED;
        }
        if (min_size_ && size < *min_size_) return FilterVerdict::TOO_SMALL;
        if (max_size_ && size > *max_size_) return FilterVerdict::TOO_LARGE;
        return FilterVerdict::ACCEPTED;
    }

    [[nodiscard]] bool accepts(const std::string& relative_path, uint64_t size) const {
        return evaluate(relative_path, size) == FilterVerdict::ACCEPTED;
    }

private:
    std::vector<GlobPattern> include_;
    std::vector<GlobPattern> exclude_;
    std::optional<uint64_t> min_size_;
    std::optional<uint64_t> max_size_;
};

} // namespace poolbalancer
#endif
