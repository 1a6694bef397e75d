/**
 * @file balancer_ini.hpp
 * @brief INI parsing for pool-balance configuration files
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Keys before the first [section] header are global. Lines starting with
 * '#' or ';' are comments. Values may be wrapped in single or double
 * quotes. Later keys replace earlier ones.
 */

#ifndef POOLBALANCER_BALANCER_INI_HPP
#define POOLBALANCER_BALANCER_INI_HPP

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace poolbalancer {
namespace ini {

inline std::string trim(std::string_view str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return std::string(str.substr(start, end - start + 1));
}

/**
 * @class IniValues
 * @brief Key/value set with typed lookups
 *
 * Typed getters return nullopt both when the key is absent and when the
 * text does not convert; callers test contains() to tell them apart.
 */
class IniValues {
public:
    [[nodiscard]] bool contains(const std::string& key) const { return values_.count(key) != 0; }

    [[nodiscard]] std::optional<std::string> get(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] std::optional<int> getInt(const std::string& key) const {
        auto raw = get(key);
        if (!raw) return std::nullopt;
        try {
            size_t used = 0;
            int v = std::stoi(*raw, &used);
            if (used != raw->size()) return std::nullopt;
            return v;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    [[nodiscard]] std::optional<double> getDouble(const std::string& key) const {
        auto raw = get(key);
        if (!raw) return std::nullopt;
        try {
            size_t used = 0;
            double v = std::stod(*raw, &used);
            if (used != raw->size()) return std::nullopt;
            return v;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    /// true/false, yes/no, on/off, 1/0 in any case
    [[nodiscard]] std::optional<bool> getBool(const std::string& key) const {
        auto raw = get(key);
        if (!raw) return std::nullopt;
        std::string v = *raw;
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
        if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
        if (v == "false" || v == "no" || v == "off" || v == "0") return false;
        return std::nullopt;
    }

    /// Comma-separated entries, trimmed, blanks dropped
    [[nodiscard]] std::vector<std::string> getList(const std::string& key) const {
        std::vector<std::string> out;
        auto raw = get(key);
        if (!raw) return out;
        std::istringstream iss(*raw);
        std::string item;
        while (std::getline(iss, item, ',')) {
            auto t = trim(item);
            if (!t.empty()) out.push_back(std::move(t));
        }
        return out;
    }

    void set(const std::string& key, const std::string& value) { values_[key] = value; }

    /// Copy every key of @p other over this set
    void overlay(const IniValues& other) {
        for (const auto& [k, v] : other.values_) values_[k] = v;
    }

private:
    std::map<std::string, std::string> values_;
};

/**
 * @class IniFile
 * @brief Parsed document: global keys plus named sections
 */
class IniFile {
public:
    [[nodiscard]] static IniFile parse(std::string_view content) {
        IniFile doc;
        IniValues* current = &doc.global_;
        std::istringstream iss{std::string(content)};
        std::string raw;

        while (std::getline(iss, raw)) {
            std::string line = trim(raw);
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            if (line.size() >= 2 && line.front() == '[' && line.back() == ']') {
                std::string name = trim(std::string_view(line).substr(1, line.size() - 2));
                if (!name.empty()) current = &doc.sections_[name];
                continue;
            }

            auto eq = line.find('=');
            if (eq == std::string::npos) continue;
            std::string key = trim(std::string_view(line).substr(0, eq));
            std::string value = trim(std::string_view(line).substr(eq + 1));
            if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
                value.back() == value.front()) {
                value = value.substr(1, value.size() - 2);
            }
            if (!key.empty()) current->set(key, value);
        }
        return doc;
    }

    [[nodiscard]] const IniValues& global() const noexcept { return global_; }

    [[nodiscard]] const IniValues* section(const std::string& name) const {
        auto it = sections_.find(name);
        return it != sections_.end() ? &it->second : nullptr;
    }

private:
    IniValues global_;
    std::map<std::string, IniValues> sections_;
};

} // namespace ini
} // namespace poolbalancer

#endif // POOLBALANCER_BALANCER_INI_HPP
