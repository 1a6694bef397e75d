/**
 * @file transfer_runner.cpp
 * @brief rsync subprocess adapter
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "transfer_runner.hpp"
#include "balancer_filesystem.hpp"
#include "balancer_logger.hpp"
#include <cerrno>
#include <cstring>
#include <regex>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace poolbalancer {

namespace {

constexpr int EXEC_FAILED_STATUS = 127;

struct Pipe {
    int fds[2] = {-1, -1};
    ~Pipe() { closeRead(); closeWrite(); }
    // Close-on-exec so rsync children forked by sibling workers never hold our write end
    bool open() { return ::pipe2(fds, O_CLOEXEC) == 0; }
    void closeRead() { if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; } }
    void closeWrite() { if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; } }
};

std::string trimLine(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

std::optional<TransferProgress> parseRsyncProgress(const std::string& line) {
    static const std::regex pattern(
        R"(^\s*([\d,]+)\s+(\d+)%\s+([\d.]+)([kKMGT]?B)/s\s+(\d+:\d+:\d+|\d+:\d+)?)");
    std::smatch m;
    if (!std::regex_search(line, m, pattern)) return std::nullopt;

    TransferProgress p;
    std::string digits;
    for (char c : m[1].str()) if (c != ',') digits += c;
    try {
        p.bytes_transferred = std::stoull(digits);
        p.percent = std::stoi(m[2].str());
        double speed = std::stod(m[3].str());
        std::string unit = m[4].str();
        if (unit == "kB" || unit == "KB") speed *= 1024.0;
        else if (unit == "MB") speed *= 1024.0 * 1024.0;
        else if (unit == "GB") speed *= 1024.0 * 1024.0 * 1024.0;
        else if (unit == "TB") speed *= 1024.0 * 1024.0 * 1024.0 * 1024.0;
        p.speed_bytes_per_sec = speed;

        if (m[5].matched) {
            uint32_t total = 0;
            std::string part;
            for (char c : m[5].str() + ":") {
                if (c == ':') { total = total * 60 + static_cast<uint32_t>(std::stoul(part)); part.clear(); }
                else part += c;
            }
            p.eta_seconds = total;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return p;
}

std::vector<std::string> RsyncRunner::buildCommand(const std::string& source,
                                                   const std::string& destination) const {
    return {rsync_path_, "-a", "--info=progress2", "--no-inc-recursive", source, destination};
}

Result<TransferOutcome> RsyncRunner::copy(const std::string& source,
                                          const std::string& destination,
                                          const ProgressCallback& progress) {
    auto parent = fs::Path(destination).parent_path();
    if (!parent.empty()) {
        if (auto made = fs::createDirectory(parent); !made) {
            return Err<TransferOutcome>(ErrorCode::IO_ERROR,
                                        "Cannot create " + parent.string() + ": " + made.error);
        }
    }

    Pipe out, err;
    if (!out.open() || !err.open()) {
        return Err<TransferOutcome>(ErrorCode::SYSTEM_ERROR, std::string("pipe: ") + std::strerror(errno));
    }

    auto args = buildCommand(source, destination);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return Err<TransferOutcome>(ErrorCode::SYSTEM_ERROR, std::string("fork: ") + std::strerror(errno));
    }
    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(out.fds[1], STDOUT_FILENO);
        ::dup2(err.fds[1], STDERR_FILENO);
        ::close(out.fds[0]); ::close(out.fds[1]);
        ::close(err.fds[0]); ::close(err.fds[1]);
        ::execvp(argv[0], argv.data());
        const char* msg = std::strerror(errno);
        ssize_t ignored = ::write(STDERR_FILENO, "exec failed: ", 13);
        ignored = ::write(STDERR_FILENO, msg, std::strlen(msg));
        (void)ignored;
        ::_exit(EXEC_FAILED_STATUS);
    }
    out.closeWrite();
    err.closeWrite();

    TransferOutcome outcome;
    std::string pending;
    pollfd fds[2] = {{out.fds[0], POLLIN, 0}, {err.fds[0], POLLIN, 0}};
    int open_fds = 2;
    char buf[4096];

    while (open_fds > 0) {
        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            PB_LOG_ERROR("RsyncRunner", std::string("poll: ") + std::strerror(errno));
            break;
        }
        for (auto& p : fds) {
            if (p.fd < 0 || !(p.revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = ::read(p.fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) { p.fd = -1; --open_fds; continue; }

            if (p.fd == out.fds[0]) {
                pending.append(buf, static_cast<size_t>(n));
                size_t pos;
                // progress2 redraws with '\r'; treat it as a line break
                while ((pos = pending.find_first_of("\r\n")) != std::string::npos) {
                    std::string line = pending.substr(0, pos);
                    pending.erase(0, pos + 1);
                    if (auto pr = parseRsyncProgress(line)) {
                        outcome.bytes_transferred = pr->bytes_transferred;
                        if (progress) progress(*pr);
                    }
                }
            } else {
                outcome.stderr_text.append(buf, static_cast<size_t>(n));
            }
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Err<TransferOutcome>(ErrorCode::SYSTEM_ERROR,
                                        std::string("waitpid: ") + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        outcome.exit_status = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.exit_status = 128 + WTERMSIG(status);
    }
    outcome.stderr_text = trimLine(outcome.stderr_text);

    if (outcome.exit_status == EXEC_FAILED_STATUS &&
        outcome.stderr_text.rfind("exec failed", 0) == 0) {
        return Err<TransferOutcome>(ErrorCode::TRANSFER_FAILED,
                                    rsync_path_ + " not found. Please install rsync. (" +
                                    outcome.stderr_text + ")");
    }
    return outcome;
}

} // namespace poolbalancer
