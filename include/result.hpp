/**
 * @file result.hpp
 * @brief Value-or-error return type used across the balancer
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef POOLBALANCER_RESULT_HPP
#define POOLBALANCER_RESULT_HPP

#include <string>
#include <utility>
#include <variant>

namespace poolbalancer {

/**
 * @brief Error codes, grouped by the stage that raises them
 *
 * 2xx discovery, 3xx transfer, 4xx configuration, 5xx system.
 */
enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 3,
    CANCELLED = 6,
    DISCOVERY_FAILED = 200,
    DRIVE_UNAVAILABLE = 201,
    IO_ERROR = 204,
    SELECTION_WARNING = 250,
    TRANSFER_FAILED = 300,
    VERIFY_FAILED = 301,
    SOURCE_CHANGED = 302,
    THRESHOLD_EXCEEDED = 303,
    CONFIG_INVALID = 400,
    CONFIG_MISSING = 401,
    CONFIG_PARSE_ERROR = 402,
    SYSTEM_ERROR = 500,
    INTERNAL_ERROR = 503
};

inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::CANCELLED: return "CANCELLED";
        case ErrorCode::DISCOVERY_FAILED: return "DISCOVERY_FAILED";
        case ErrorCode::DRIVE_UNAVAILABLE: return "DRIVE_UNAVAILABLE";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::SELECTION_WARNING: return "SELECTION_WARNING";
        case ErrorCode::TRANSFER_FAILED: return "TRANSFER_FAILED";
        case ErrorCode::VERIFY_FAILED: return "VERIFY_FAILED";
        case ErrorCode::SOURCE_CHANGED: return "SOURCE_CHANGED";
        case ErrorCode::THRESHOLD_EXCEEDED: return "THRESHOLD_EXCEEDED";
        case ErrorCode::CONFIG_INVALID: return "CONFIG_INVALID";
        case ErrorCode::CONFIG_MISSING: return "CONFIG_MISSING";
        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        case ErrorCode::SYSTEM_ERROR: return "SYSTEM_ERROR";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
    }
    return "UNKNOWN(" + std::to_string(static_cast<int>(code)) + ")";
}

struct Error {
    ErrorCode code = ErrorCode::INTERNAL_ERROR;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg = "") : code(c), message(std::move(msg)) {}

    /// "[CODE] message", or just "[CODE]"
    [[nodiscard]] std::string toString() const {
        return "[" + errorCodeToString(code) + "]" + (message.empty() ? "" : " " + message);
    }
};

/**
 * @class Result
 * @brief Holds either a T or an Error
 *
 * Converts implicitly from both so functions can `return value;` or
 * `return Err<T>(code, msg);`. Accessing the wrong side throws
 * std::bad_variant_access.
 */
template<typename T>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(Error err) : data_(std::in_place_index<1>, std::move(err)) {}
    Result(ErrorCode code, std::string msg = "") : Result(Error{code, std::move(msg)}) {}

    [[nodiscard]] bool has_value() const noexcept { return data_.index() == 0; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] const Error& error() const { return std::get<1>(data_); }

    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }
    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }

private:
    std::variant<T, Error> data_;
};

template<typename T>
Result<T> Err(ErrorCode code, std::string msg = "") {
    return Result<T>(Error{code, std::move(msg)});
}

} // namespace poolbalancer

#endif // POOLBALANCER_RESULT_HPP
