/**
 * @file balancer_args.hpp
 * @brief Command-line option parsing
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Supports:
 * - Long options with a separate or inline value (--opt VALUE, --opt=VALUE)
 * - Short options, bundled flags (-vq) and attached values (-p5)
 * - Counted flags (-vv) and repeatable options
 * - "--" ends option processing
 */

#ifndef POOLBALANCER_BALANCER_ARGS_HPP
#define POOLBALANCER_BALANCER_ARGS_HPP

#include <algorithm>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace poolbalancer {
namespace args {

enum class ArgType {
    Flag,       // No value; every occurrence counted
    Value,      // Last occurrence wins
    MultiValue  // Every occurrence kept
};

/**
 * @brief What one option received on the command line
 */
class ArgValue {
public:
    [[nodiscard]] int occurrences() const noexcept { return count_; }
    [[nodiscard]] bool isSet() const noexcept { return count_ > 0; }
    [[nodiscard]] const std::vector<std::string>& values() const noexcept { return values_; }

    [[nodiscard]] std::string asString(const std::string& fallback = "") const {
        return values_.empty() ? fallback : values_.back();
    }

    /// Whole-string conversion; "12abc" is rejected
    [[nodiscard]] std::optional<int> asInt() const { return convert<int>(); }
    [[nodiscard]] std::optional<double> asDouble() const { return convert<double>(); }

    void record() { ++count_; }
    void record(std::string value) {
        ++count_;
        values_.push_back(std::move(value));
    }

private:
    template<typename T>
    std::optional<T> convert() const {
        if (values_.empty()) return std::nullopt;
        std::istringstream iss(values_.back());
        T v{};
        if (!(iss >> v)) return std::nullopt;
        char extra;
        if (iss >> extra) return std::nullopt;
        return v;
    }

    int count_ = 0;
    std::vector<std::string> values_;
};

struct ArgDef {
    std::string name;
    char shortName = '\0';
    std::string description;
    ArgType type = ArgType::Value;
    std::string defaultValue;   ///< Help text only
    std::string metavar;
};

class ParseResult {
public:
    [[nodiscard]] bool success() const noexcept { return error_.empty(); }
    [[nodiscard]] const std::string& error() const noexcept { return error_; }
    [[nodiscard]] const std::vector<std::string>& positional() const noexcept { return positional_; }

    [[nodiscard]] bool has(const std::string& name) const {
        auto it = values_.find(name);
        return it != values_.end() && it->second.isSet();
    }

    [[nodiscard]] const ArgValue& operator[](const std::string& name) const {
        static const ArgValue none;
        auto it = values_.find(name);
        return it != values_.end() ? it->second : none;
    }

private:
    friend class ArgParser;
    std::string error_;
    std::map<std::string, ArgValue> values_;
    std::vector<std::string> positional_;
};

class ArgParser {
public:
    ArgParser(std::string program, std::string description)
        : program_(std::move(program)), description_(std::move(description)) {}

    ArgParser& addFlag(const std::string& name, char shortName, const std::string& description) {
        defs_.push_back({name, shortName, description, ArgType::Flag, "", ""});
        return *this;
    }

    ArgParser& addOption(const std::string& name, char shortName, const std::string& description,
                         const std::string& defaultValue, const std::string& metavar) {
        defs_.push_back({name, shortName, description, ArgType::Value, defaultValue, metavar});
        return *this;
    }

    ArgParser& addMulti(const std::string& name, char shortName, const std::string& description,
                        const std::string& metavar) {
        defs_.push_back({name, shortName, description, ArgType::MultiValue, "", metavar});
        return *this;
    }

    ArgParser& setPositional(const std::string& name, const std::string& description) {
        positional_ = name;
        positionalDesc_ = description;
        return *this;
    }

    /**
     * @brief Parse arguments (program name excluded)
     *
     * Stops at the first error; the result then carries only the message.
     */
    [[nodiscard]] ParseResult parse(const std::vector<std::string>& args) const {
        ParseResult r;
        auto fail = [&r](std::string msg) {
            r.error_ = std::move(msg);
            return r;
        };

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            if (arg == "-h" || arg == "--help") {
                r.values_["help"].record();
            } else if (arg == "--") {
                r.positional_.insert(r.positional_.end(), args.begin() + static_cast<long>(i) + 1, args.end());
                break;
            } else if (arg.rfind("--", 0) == 0) {
                std::string name = arg.substr(2);
                std::optional<std::string> inlineValue;
                if (auto eq = name.find('='); eq != std::string::npos) {
                    inlineValue = name.substr(eq + 1);
                    name.resize(eq);
                }
                const ArgDef* def = find([&](const ArgDef& d) { return d.name == name; });
                if (!def) return fail("Unknown option: --" + name);

                if (def->type == ArgType::Flag) {
                    if (inlineValue) return fail("Option --" + name + " does not take a value");
                    r.values_[def->name].record();
                } else if (inlineValue) {
                    r.values_[def->name].record(*inlineValue);
                } else if (i + 1 < args.size()) {
                    r.values_[def->name].record(args[++i]);
                } else {
                    return fail("Option --" + name + " requires a value");
                }
            } else if (arg.size() > 1 && arg[0] == '-') {
                for (size_t j = 1; j < arg.size(); ++j) {
                    char c = arg[j];
                    const ArgDef* def = find([c](const ArgDef& d) { return d.shortName == c; });
                    if (!def) return fail(std::string("Unknown option: -") + c);
                    if (def->type == ArgType::Flag) {
                        r.values_[def->name].record();
                        continue;
                    }
                    // Rest of the token, else the next argument, is the value
                    if (j + 1 < arg.size()) {
                        r.values_[def->name].record(arg.substr(j + 1));
                    } else if (i + 1 < args.size()) {
                        r.values_[def->name].record(args[++i]);
                    } else {
                        return fail(std::string("Option -") + c + " requires a value");
                    }
                    break;
                }
            } else {
                r.positional_.push_back(arg);
            }
        }
        return r;
    }

    [[nodiscard]] std::string help() const {
        std::ostringstream oss;
        oss << "Usage: " << program_;
        if (!positional_.empty()) oss << " " << positional_;
        oss << " [OPTIONS]\n\n" << description_ << "\n\n";
        if (!positional_.empty()) {
            oss << "Arguments:\n  " << positional_ << "  " << positionalDesc_ << "\n\n";
        }

        auto label = [](const ArgDef& d) {
            std::string s = d.shortName ? std::string("-") + d.shortName + ", " : std::string("    ");
            s += "--" + d.name;
            if (d.type != ArgType::Flag) s += " " + d.metavar;
            return s;
        };
        size_t width = 20;
        for (const auto& d : defs_) width = std::max(width, label(d).size());

        oss << "Options:\n";
        oss << "  " << "-h, --help" << std::string(width - 10 + 2, ' ') << "Show this help message\n";
        for (const auto& d : defs_) {
            std::string l = label(d);
            oss << "  " << l << std::string(width - l.size() + 2, ' ') << d.description;
            if (!d.defaultValue.empty()) oss << " [default: " << d.defaultValue << "]";
            if (d.type == ArgType::MultiValue) oss << " (repeatable)";
            oss << "\n";
        }
        return oss.str();
    }

private:
    template<typename Pred>
    const ArgDef* find(Pred pred) const {
        auto it = std::find_if(defs_.begin(), defs_.end(), pred);
        return it != defs_.end() ? &*it : nullptr;
    }

    std::string program_;
    std::string description_;
    std::string positional_;
    std::string positionalDesc_;
    std::vector<ArgDef> defs_;
};

} // namespace args
} // namespace poolbalancer

#endif // POOLBALANCER_BALANCER_ARGS_HPP
