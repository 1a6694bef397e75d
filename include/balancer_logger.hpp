/**
 * @file balancer_logger.hpp
 * @brief Logging for balancing runs
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * One log file per run under the configured directory, plus an optional
 * append-only error log that receives every ERROR line regardless of the
 * verbosity level. Nothing is written until a sink is opened.
 */
#ifndef POOLBALANCER_BALANCER_LOGGER_HPP
#define POOLBALANCER_BALANCER_LOGGER_HPP

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <system_error>

namespace poolbalancer {

enum class LogLevel { LOG_DEBUG, LOG_INFO, LOG_WARNING, LOG_ERROR };

/// -v gives INFO, -vv DEBUG, -q only errors
inline LogLevel logLevelFromVerbosity(int verbose, bool quiet) {
    if (quiet) return LogLevel::LOG_ERROR;
    if (verbose >= 2) return LogLevel::LOG_DEBUG;
    return verbose == 1 ? LogLevel::LOG_INFO : LogLevel::LOG_WARNING;
}

class BalancerLogger {
public:
    static BalancerLogger& instance() {
        static BalancerLogger logger;
        return logger;
    }

    /// Open poolbalance_YYYYmmdd_HHMMSS.log under @p dir, creating it if needed
    bool initialize(const std::filesystem::path& dir, LogLevel level) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) return false;
        std::lock_guard<std::mutex> lock(mtx_);
        level_ = level;
        run_log_.open(dir / ("poolbalance_" + stamp("%Y%m%d_%H%M%S") + ".log"), std::ios::app);
        return run_log_.is_open();
    }

    bool openErrorLog(const std::filesystem::path& path) {
        std::lock_guard<std::mutex> lock(mtx_);
        error_log_.open(path, std::ios::app);
        return error_log_.is_open();
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx_);
        level_ = level;
    }

    void write(LogLevel level, const std::string& component, const std::string& message) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (level == LogLevel::LOG_ERROR && error_log_.is_open()) {
            error_log_ << "[" << stamp("%Y-%m-%dT%H:%M:%S") << "] ERROR: [" << component << "] "
                       << message << std::endl;
        }
        if (level >= level_ && run_log_.is_open()) {
            run_log_ << stamp("%Y-%m-%d %H:%M:%S") << " " << tag(level) << " [" << component << "] "
                     << message << std::endl;
        }
    }

    void shutdown() {
        std::lock_guard<std::mutex> lock(mtx_);
        run_log_.close();
        error_log_.close();
    }

    BalancerLogger(const BalancerLogger&) = delete;
    BalancerLogger& operator=(const BalancerLogger&) = delete;

private:
    BalancerLogger() = default;

    static const char* tag(LogLevel level) {
        switch (level) {
            case LogLevel::LOG_DEBUG: return "DEBUG";
            case LogLevel::LOG_INFO: return "INFO ";
            case LogLevel::LOG_WARNING: return "WARN ";
            case LogLevel::LOG_ERROR: return "ERROR";
        }
        return "?????";
    }

    static std::string stamp(const char* format) {
        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);
        std::ostringstream out;
        out << std::put_time(&local, format);
        return out.str();
    }

    std::mutex mtx_;
    std::ofstream run_log_;
    std::ofstream error_log_;
    LogLevel level_ = LogLevel::LOG_WARNING;
};

#define PB_LOG_DEBUG(comp, msg) poolbalancer::BalancerLogger::instance().write(poolbalancer::LogLevel::LOG_DEBUG, comp, msg)
#define PB_LOG_INFO(comp, msg) poolbalancer::BalancerLogger::instance().write(poolbalancer::LogLevel::LOG_INFO, comp, msg)
#define PB_LOG_WARNING(comp, msg) poolbalancer::BalancerLogger::instance().write(poolbalancer::LogLevel::LOG_WARNING, comp, msg)
#define PB_LOG_ERROR(comp, msg) poolbalancer::BalancerLogger::instance().write(poolbalancer::LogLevel::LOG_ERROR, comp, msg)

} // namespace poolbalancer
#endif // POOLBALANCER_BALANCER_LOGGER_HPP
