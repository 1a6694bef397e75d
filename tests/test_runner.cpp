/**
 * @file test_runner.cpp
 * @brief rsync adapter: command line, progress parsing and process handling
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "test_framework.hpp"
#include "test_support.hpp"
#include "transfer_runner.hpp"

#include <thread>

using namespace poolbalancer;
using namespace poolbalancer::testing;

namespace {

/// Write an executable shell script standing in for rsync
std::string writeScript(const fs::TempDirectory& dir, const std::string& name, const std::string& body) {
    auto path = (dir / name).string();
    (void)fs::writeFile(path, "#!/bin/sh\n" + body);
    std::error_code ec;
    fs::stdfs::permissions(path, fs::stdfs::perms::owner_all, fs::stdfs::perm_options::replace, ec);
    return path;
}

} // namespace

TEST_CASE(Progress_ParsesFullLine) {
    auto p = parseRsyncProgress("  1,234,567  50%   12.34MB/s    0:01:23");
    REQUIRE(p.has_value());
    REQUIRE_EQ(p->bytes_transferred, 1234567ULL);
    REQUIRE_EQ(p->percent, 50);
    REQUIRE_NEAR(p->speed_bytes_per_sec, 12.34 * 1024 * 1024, 1.0);
    REQUIRE(p->eta_seconds.has_value());
    REQUIRE_EQ(*p->eta_seconds, 83u);
}

TEST_CASE(Progress_FinalLineWithTransferCounter) {
    auto p = parseRsyncProgress("      4,096 100%  500.00kB/s    0:00:00 (xfr#1, to-chk=0/1)");
    REQUIRE(p.has_value());
    REQUIRE_EQ(p->bytes_transferred, 4096ULL);
    REQUIRE_EQ(p->percent, 100);
    REQUIRE_NEAR(p->speed_bytes_per_sec, 500.0 * 1024, 0.01);
    REQUIRE_EQ(p->eta_seconds.value_or(99), 0u);
}

TEST_CASE(Progress_IgnoresOtherOutput) {
    REQUIRE_FALSE(parseRsyncProgress("sending incremental file list").has_value());
    REQUIRE_FALSE(parseRsyncProgress("").has_value());
    REQUIRE_FALSE(parseRsyncProgress("movie.mkv").has_value());
}

TEST_CASE(Rsync_CommandLine) {
    RsyncRunner runner("/opt/bin/rsync");
    auto cmd = runner.buildCommand("/mnt/d1/a b.mkv", "/mnt/d2/a b.mkv");
    REQUIRE_SIZE(cmd, 6u);
    REQUIRE_EQ(cmd[0], "/opt/bin/rsync");
    REQUIRE_EQ(cmd[1], "-a");
    REQUIRE_EQ(cmd[2], "--info=progress2");
    REQUIRE_EQ(cmd[3], "--no-inc-recursive");
    // Paths are passed as single arguments, never through a shell
    REQUIRE_EQ(cmd[4], "/mnt/d1/a b.mkv");
    REQUIRE_EQ(cmd[5], "/mnt/d2/a b.mkv");
}

TEST_CASE(Rsync_MissingBinaryIsError) {
    fs::TempDirectory dir("pbrsync");
    RsyncRunner runner((dir / "no-such-rsync").string());
    auto result = runner.copy((dir / "src").string(), (dir / "out/dst").string(), nullptr);
    REQUIRE_ERROR(result, ErrorCode::TRANSFER_FAILED);
    REQUIRE_CONTAINS(result.error().message, "Please install rsync");
}

TEST_CASE(Rsync_ExitStatusReported) {
    fs::TempDirectory dir("pbrsync");
    auto ok = RsyncRunner("true").copy((dir / "a").string(), (dir / "sub/b").string(), nullptr);
    REQUIRE_OK(ok);
    REQUIRE(ok->succeeded());
    // Parent of the destination is created before the copy starts
    REQUIRE(fs::isDirectory(dir / "sub"));

    auto bad = RsyncRunner("false").copy((dir / "a").string(), (dir / "b").string(), nullptr);
    REQUIRE_OK(bad);
    REQUIRE_FALSE(bad->succeeded());
    REQUIRE_EQ(bad->exit_status, 1);
}

TEST_CASE(Rsync_ProgressAndStderrCaptured) {
    fs::TempDirectory dir("pbrsync");
    auto script = writeScript(dir, "fake-rsync",
        "printf '      1,000  50%%    1.00MB/s    0:00:01\\r      2,000 100%%    2.00MB/s    0:00:00\\n'\n"
        "cp \"$4\" \"$5\"\n"
        "echo 'some warning' >&2\n");
    auto src = (dir / "src.bin").string();
    writeSizedFile(src, 2000);
    auto dst = (dir / "target/dst.bin").string();

    std::vector<TransferProgress> seen;
    auto result = RsyncRunner(script).copy(src, dst, [&](const TransferProgress& p) { seen.push_back(p); });

    REQUIRE_OK(result);
    REQUIRE(result->succeeded());
    REQUIRE_SIZE(seen, 2u);
    REQUIRE_EQ(seen[0].percent, 50);
    REQUIRE_EQ(seen[1].bytes_transferred, 2000ULL);
    REQUIRE_EQ(result->bytes_transferred, 2000ULL);
    REQUIRE_EQ(result->stderr_text, "some warning");
    REQUIRE_EQ(fs::fileSize(dst).value_or(0), 2000ULL);
}

TEST_CASE(Rsync_FailureKeepsStderr) {
    fs::TempDirectory dir("pbrsync");
    auto script = writeScript(dir, "fake-rsync", "echo 'rsync: write failed: No space left on device (28)' >&2\nexit 11\n");
    auto result = RsyncRunner(script).copy((dir / "a").string(), (dir / "b").string(), nullptr);
    REQUIRE_OK(result);
    REQUIRE_EQ(result->exit_status, 11);
    REQUIRE_CONTAINS(result->stderr_text, "No space left");
}

TEST_CASE(Rsync_ChildDoesNotInheritSiblingPipes) {
    fs::TempDirectory dir("pbrsync");
    // Reports how many pipes beyond stdout/stderr the copy process holds
    auto counter = writeScript(dir, "count-rsync",
        "n=0\n"
        "for fd in /proc/$$/fd/*; do\n"
        "  case \"${fd##*/}\" in 0|1|2) continue ;; esac\n"
        "  case \"$(readlink \"$fd\" 2>/dev/null)\" in pipe:*) n=$((n+1)) ;; esac\n"
        "done\n"
        "echo \"extra pipes: $n\" >&2\n");
    auto slow = writeScript(dir, "slow-rsync", "touch \"$5.started\"\nsleep 1\ncp \"$4\" \"$5\"\n");
    auto src = (dir / "src.bin").string();
    writeSizedFile(src, 100);

    auto alone = RsyncRunner(counter).copy(src, (dir / "a/x").string(), nullptr);
    REQUIRE_OK(alone);
    REQUIRE_CONTAINS(alone->stderr_text, "extra pipes: ");

    // A sibling copy keeps its pipes open in this process while its child sleeps
    auto sibling_dst = (dir / "b/slow.bin").string();
    Result<TransferOutcome> sibling = Err<TransferOutcome>(ErrorCode::INTERNAL_ERROR, "not run");
    std::thread worker([&] { sibling = RsyncRunner(slow).copy(src, sibling_dst, nullptr); });
    auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!fs::exists(sibling_dst + ".started") && std::chrono::steady_clock::now() < give_up) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    auto beside = RsyncRunner(counter).copy(src, (dir / "c/x").string(), nullptr);
    worker.join();

    REQUIRE(fs::exists(sibling_dst + ".started"));
    REQUIRE_OK(sibling);
    REQUIRE(sibling->succeeded());
    REQUIRE_OK(beside);
    REQUIRE_EQ(beside->stderr_text, alone->stderr_text);
}

int main(int argc, char* argv[]) {
    std::string filter;
    if (argc > 1) filter = argv[1];
    return TestRunner::instance().run(filter);
}
