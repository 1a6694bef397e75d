/**
 * @file test_inventory.cpp
 * @brief Drive discovery, target computation and classification
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "test_framework.hpp"
#include "test_support.hpp"
#include "drive_inventory.hpp"
#include "target_calculator.hpp"

#include <algorithm>

using namespace poolbalancer;
using namespace poolbalancer::testing;

//=============================================================================
// DriveInventory
//=============================================================================

TEST_CASE(Inventory_DiscoversMembersInOrder) {
    FakeProbe probe;
    probe.addDrive("/mnt/disk1", 100 * GB, 80 * GB);
    probe.addDrive("/mnt/disk2/", 100 * GB, 20 * GB);
    DriveInventory inventory(probe);

    auto inv = inventory.discover("/mnt/pool");
    REQUIRE_OK(inv);
    REQUIRE_SIZE(inv->drives, 2u);
    REQUIRE_EQ(inv->drives[0].path, "/mnt/disk1");
    REQUIRE_EQ(inv->drives[0].used_bytes, 80 * GB);
    REQUIRE(inv->drives[0].allowed_source);
    REQUIRE(inv->drives[0].allowed_destination);
}

TEST_CASE(Inventory_DuplicateMembersCollapse) {
    FakeProbe probe;
    probe.addDrive("/mnt/disk1", 100 * GB, 10 * GB);
    probe.addDrive("/mnt/disk1", 100 * GB, 10 * GB);
    DriveInventory inventory(probe);
    auto inv = inventory.discover("/mnt/pool");
    REQUIRE_OK(inv);
    REQUIRE_SIZE(inv->drives, 1u);
}

TEST_CASE(Inventory_RestrictionsSetRoles) {
    FakeProbe probe;
    probe.addDrive("/mnt/disk1", 100 * GB, 80 * GB);
    probe.addDrive("/mnt/disk2", 100 * GB, 20 * GB);
    probe.addDrive("/mnt/disk3", 100 * GB, 50 * GB);
    DriveInventory inventory(probe);
    inventory.setRestrictions({"/mnt/disk1"}, {"/mnt/disk2"});

    auto inv = inventory.discover("/mnt/pool");
    REQUIRE_OK(inv);
    REQUIRE(inv->drives[0].allowed_source);
    REQUIRE_FALSE(inv->drives[0].allowed_destination);
    REQUIRE_FALSE(inv->drives[1].allowed_source);
    REQUIRE(inv->drives[1].allowed_destination);
    REQUIRE(inv->drives[2].isExcluded());
}

TEST_CASE(Inventory_UnavailableDriveIsDroppedWithWarning) {
    FakeProbe probe;
    probe.addDrive("/mnt/disk1", 100 * GB, 80 * GB);
    probe.addDrive("/mnt/disk2", 100 * GB, 20 * GB);
    probe.markUnavailable("/mnt/disk2");
    EventBus bus;
    EventRecorder events(bus);
    DriveInventory inventory(probe, &bus);

    auto inv = inventory.discover("/mnt/pool", 4);
    REQUIRE_OK(inv);
    REQUIRE_SIZE(inv->drives, 1u);
    auto warnings = events.of(EventType::DRIVE_UNAVAILABLE);
    REQUIRE_SIZE(warnings, 1u);
    REQUIRE_EQ(warnings[0].drive->path, "/mnt/disk2");
    REQUIRE_EQ(warnings[0].iteration, 4u);
}

TEST_CASE(Inventory_DiscoveryFailures) {
    FakeProbe none;
    DriveInventory empty(none);
    REQUIRE_ERROR(empty.discover("/mnt/pool"), ErrorCode::DISCOVERY_FAILED);

    FakeProbe broken;
    broken.addDrive("/mnt/disk1", 100 * GB, 10 * GB);
    broken.failMembership("no srcmounts attribute");
    DriveInventory unreadable(broken);
    auto r = unreadable.discover("/mnt/pool");
    REQUIRE_ERROR(r, ErrorCode::DISCOVERY_FAILED);
    REQUIRE_CONTAINS(r.error().message, "srcmounts");

    FakeProbe gone;
    gone.addDrive("/mnt/disk1", 100 * GB, 10 * GB);
    gone.markUnavailable("/mnt/disk1");
    DriveInventory allGone(gone);
    REQUIRE_ERROR(allGone.discover("/mnt/pool"), ErrorCode::DISCOVERY_FAILED);
}

TEST_CASE(Inventory_WalkPathJoinsSubpath) {
    Inventory inv;
    Drive d = makeDrive("/mnt/disk1", 1, 0);
    REQUIRE_EQ(inv.walkPath(d), "/mnt/disk1");
    inv.subpath = "media/tv";
    REQUIRE_EQ(inv.walkPath(d), "/mnt/disk1/media/tv");
}

TEST_CASE(DirectoryListProbe_StatsRealDirectories) {
    fs::TempDirectory a("pbdisk"), b("pbdisk");
    DirectoryListProbe probe({a.path().string(), b.path().string(), "/no/such/drive"});
    DriveInventory inventory(probe);

    auto inv = inventory.discover("ignored");
    REQUIRE_OK(inv);
    REQUIRE_SIZE(inv->drives, 2u);
    REQUIRE_GT(inv->drives[0].total_bytes, 0ULL);
    REQUIRE_LE(inv->drives[0].used_bytes, inv->drives[0].total_bytes);
}

TEST_CASE(ExpandGlobPaths_MatchesDirectoriesSorted) {
    fs::TempDirectory root("pbglob");
    REQUIRE(fs::createDirectory(root / "disk2"));
    REQUIRE(fs::createDirectory(root / "disk1"));
    REQUIRE(fs::writeFile(root / "disk3", "not a directory"));

    auto out = expandGlobPaths({(root / "disk*").string(), "/literal/path/"});
    REQUIRE_SIZE(out, 3u);
    REQUIRE_EQ(out[0], (root / "disk1").string());
    REQUIRE_EQ(out[1], (root / "disk2").string());
    REQUIRE_EQ(out[2], "/literal/path");
}

TEST_CASE(NormalizeDrivePath_KeepsRoot) {
    REQUIRE_EQ(normalizeDrivePath("/mnt/disk1//"), "/mnt/disk1");
    REQUIRE_EQ(normalizeDrivePath("/"), "/");
}

TEST_CASE(ReadXattr_AbsentAttribute) {
    fs::TempDirectory dir("pbxattr");
    auto r = readXattr(dir.path().string(), "user.poolbalance.absent");
    // Filesystems without user xattrs report an error instead of ENODATA
    if (r) REQUIRE_FALSE(r.value().has_value());
}

//=============================================================================
// TargetCalculator
//=============================================================================

TEST_CASE(Target_ThreeDriveScenario) {
    std::vector<Drive> drives = {makeDrive("/d1", 100 * GB, 80 * GB),
                                 makeDrive("/d2", 100 * GB, 20 * GB),
                                 makeDrive("/d3", 200 * GB, 100 * GB)};
    TargetCalculator calc(10.0);
    auto c = calc.classifyAll(drives);

    REQUIRE_NEAR(c.target_percent, 50.0, 1e-9);
    REQUIRE(c.drives[0].classification == DriveClass::OVERFULL);
    REQUIRE(c.drives[1].classification == DriveClass::UNDERFULL);
    REQUIRE(c.drives[2].classification == DriveClass::NEUTRAL);
    REQUIRE_FALSE(c.converged());
    REQUIRE_SIZE(c.overfull(), 1u);
    REQUIRE_SIZE(c.underfull(), 1u);
}

TEST_CASE(Target_IndependentOfOrder) {
    std::vector<Drive> drives = {makeDrive("/a", 3 * GB, 1 * GB),
                                 makeDrive("/b", 7 * GB, 6 * GB),
                                 makeDrive("/c", 11 * GB, 2 * GB),
                                 makeDrive("/d", 13 * GB, 12 * GB)};
    double expected = TargetCalculator::targetPercent(drives);
    REQUIRE_NEAR(expected, 21.0 * 100.0 / 34.0, 1e-9);

    std::sort(drives.begin(), drives.end(), [](const Drive& x, const Drive& y) { return x.path < y.path; });
    do {
        REQUIRE_NEAR(TargetCalculator::targetPercent(drives), expected, 1e-9);
    } while (std::next_permutation(drives.begin(), drives.end(),
                                   [](const Drive& x, const Drive& y) { return x.path < y.path; }));
}

TEST_CASE(Target_BoundaryIsNeutral) {
    // target 50%, band 40..60
    std::vector<Drive> drives = {makeDrive("/hi", 100, 60),
                                 makeDrive("/lo", 100, 40)};
    TargetCalculator calc(20.0);
    auto c = calc.classifyAll(drives);
    REQUIRE_NEAR(c.target_percent, 50.0, 1e-9);
    REQUIRE(c.drives[0].classification == DriveClass::NEUTRAL);
    REQUIRE(c.drives[1].classification == DriveClass::NEUTRAL);
    REQUIRE(c.converged());

    // Non-terminating fractions on the edge stay neutral too
    std::vector<Drive> thirds = {makeDrive("/x", 300, 200), makeDrive("/y", 300, 100)};
    TargetCalculator third(100.0 / 3.0);
    auto t = third.classifyAll(thirds);
    REQUIRE(t.drives[0].classification == DriveClass::NEUTRAL);
    REQUIRE(t.drives[1].classification == DriveClass::NEUTRAL);
}

TEST_CASE(Target_ExcludedDrivesIgnored) {
    std::vector<Drive> drives = {makeDrive("/d1", 100, 90),
                                 makeDrive("/d2", 100, 10),
                                 makeDrive("/d3", 100, 100)};
    drives[2].allowed_source = false;
    drives[2].allowed_destination = false;
    TargetCalculator calc(2.0);
    auto c = calc.classifyAll(drives);
    REQUIRE_NEAR(c.target_percent, 50.0, 1e-9);
    REQUIRE(c.drives[2].classification == DriveClass::EXCLUDED);
    REQUIRE_NEAR(TargetCalculator::usageRange(c.drives), 80.0, 1e-9);
}

TEST_CASE(Target_RoleRestrictionsGateClasses) {
    std::vector<Drive> drives = {makeDrive("/full", 100, 90), makeDrive("/empty", 100, 10)};
    drives[0].allowed_source = false;      // may only receive
    drives[1].allowed_destination = false; // may only give
    TargetCalculator calc(2.0);
    auto c = calc.classifyAll(drives);
    REQUIRE(c.drives[0].classification == DriveClass::NEUTRAL);
    REQUIRE(c.drives[1].classification == DriveClass::NEUTRAL);
    REQUIRE(c.converged());
}

TEST_CASE(Target_ZeroCapacity) {
    std::vector<Drive> drives = {makeDrive("/a", 0, 0)};
    REQUIRE_NEAR(TargetCalculator::targetPercent(drives), 0.0, 1e-12);
    REQUIRE_NEAR(TargetCalculator::targetPercent({}), 0.0, 1e-12);
}

TEST_CASE(Target_OverfullOrderAndBytes) {
    std::vector<Drive> drives = {makeDrive("/b", 100, 90),
                                 makeDrive("/a", 100, 90),
                                 makeDrive("/c", 100, 95),
                                 makeDrive("/z", 1000, 0)};
    TargetCalculator calc(2.0);
    auto c = calc.classifyAll(drives);
    auto over = c.overfull();
    REQUIRE_SIZE(over, 3u);
    REQUIRE_EQ(over[0].path, "/c");
    REQUIRE_EQ(over[1].path, "/a");
    REQUIRE_EQ(over[2].path, "/b");

    Drive d = makeDrive("/d", 1000, 800);
    REQUIRE_EQ(TargetCalculator::excessBytes(d, 50.0), 300ULL);
    REQUIRE_EQ(TargetCalculator::excessBytes(d, 90.0), 0ULL);
    Drive e = makeDrive("/e", 1000, 200);
    REQUIRE_EQ(TargetCalculator::headroomBytes(e, 50.0), 300ULL);
    e.free_bytes = 100;
    REQUIRE_EQ(TargetCalculator::headroomBytes(e, 50.0), 100ULL);
    REQUIRE_EQ(TargetCalculator::headroomBytes(d, 50.0), 0ULL);
}

int main(int argc, char* argv[]) {
    std::string filter;
    if (argc > 1) filter = argv[1];
    return TestRunner::instance().run(filter);
}
