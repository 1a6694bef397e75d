/**
 * @file test_selector.cpp
 * @brief Glob filters and candidate selection
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "test_framework.hpp"
#include "test_support.hpp"
#include "file_filter.hpp"
#include "file_selector.hpp"
#include "target_calculator.hpp"

#include <algorithm>
#include <map>

using namespace poolbalancer;
using namespace poolbalancer::testing;

namespace {

Classification classified(const std::vector<Drive>& drives, double percentage = 2.0) {
    return TargetCalculator(percentage).classifyAll(drives);
}

bool planHas(const SelectionPlan& plan, const std::string& path) {
    return std::any_of(plan.candidates.begin(), plan.candidates.end(),
                       [&](const Candidate& c) { return c.source_path == path; });
}

} // namespace

//=============================================================================
// GlobPattern / FilterPipeline
//=============================================================================

TEST_CASE(Glob_BasicWildcards) {
    REQUIRE(GlobPattern::match("movie.mkv", "*.mkv"));
    REQUIRE(GlobPattern::match("a.txt", "?.txt"));
    REQUIRE_FALSE(GlobPattern::match("ab.txt", "?.txt"));
    REQUIRE(GlobPattern::match("file1", "file[0-9]"));
    REQUIRE_FALSE(GlobPattern::match("fileX", "file[0-9]"));
    REQUIRE(GlobPattern::match("fileX", "file[!0-9]"));
    REQUIRE(GlobPattern::match("[x", "[x"));
    REQUIRE_FALSE(GlobPattern::match("Movie.MKV", "*.mkv"));
}

TEST_CASE(Glob_NameVersusPathPatterns) {
    GlobPattern name("*.tmp");
    REQUIRE_FALSE(name.isPathPattern());
    REQUIRE(name.matchesFile("deep/dir/x.tmp"));

    GlobPattern path("media/*.mkv");
    REQUIRE(path.isPathPattern());
    REQUIRE(path.matchesFile("media/a.mkv"));
    REQUIRE(path.matchesFile("media/sub/a.mkv"));
    REQUIRE_FALSE(path.matchesFile("other/a.mkv"));
}

TEST_CASE(Filter_PipelineOrder) {
    FilterPipeline f({"*.mkv", "*.iso"}, {"*sample*"}, 100, 1000);
    REQUIRE(f.evaluate("a/sample.mkv", 500) == FilterVerdict::EXCLUDED);
    REQUIRE(f.evaluate("a/notes.txt", 500) == FilterVerdict::NOT_INCLUDED);
    REQUIRE(f.evaluate("a/film.mkv", 99) == FilterVerdict::TOO_SMALL);
    REQUIRE(f.evaluate("a/film.mkv", 1001) == FilterVerdict::TOO_LARGE);
    REQUIRE(f.evaluate("a/film.iso", 100) == FilterVerdict::ACCEPTED);
    REQUIRE(f.accepts("a/film.mkv", 1000));

    FilterPipeline open;
    REQUIRE(open.accepts("anything", 0));
}

//=============================================================================
// FileSelector
//=============================================================================

TEST_CASE(Selector_LargestFirstWithPathTieBreak) {
    FakeFileSource files;
    files.addFile("/d1", "b.bin", 5 * GB);
    files.addFile("/d1", "a.bin", 5 * GB);
    files.addFile("/d1", "big.bin", 10 * GB);
    files.addFile("/d1", "small.bin", 1 * GB);

    auto c = classified({makeDrive("/d1", 100 * GB, 80 * GB), makeDrive("/d2", 100 * GB, 20 * GB)});
    FileSelector selector(files, FilterPipeline{});
    auto plan = selector.select(c, "");

    REQUIRE_SIZE(plan.candidates, 4u);
    REQUIRE_EQ(plan.candidates[0].source_path, "/d1/big.bin");
    REQUIRE_EQ(plan.candidates[1].source_path, "/d1/a.bin");
    REQUIRE_EQ(plan.candidates[2].source_path, "/d1/b.bin");
    REQUIRE_EQ(plan.candidates[3].source_path, "/d1/small.bin");
    for (uint32_t i = 0; i < plan.candidates.size(); ++i) {
        REQUIRE_EQ(plan.candidates[i].rank, i);
        REQUIRE_EQ(plan.candidates[i].destination_drive, "/d2");
        REQUIRE_EQ(plan.candidates[i].source_drive, "/d1");
    }
    REQUIRE_EQ(plan.candidates[0].relative_path, "big.bin");
    REQUIRE_EQ(plan.candidates[0].destinationPath(), "/d2/big.bin");
    REQUIRE_EQ(plan.totalBytes(), 21 * GB);
}

TEST_CASE(Selector_FiltersNeverLeak) {
    FakeFileSource files;
    files.addFile("/d1", "keep/film.mkv", 4 * GB);
    files.addFile("/d1", "keep/film.sample.mkv", 4 * GB);
    files.addFile("/d1", "keep/notes.txt", 4 * GB);
    files.addFile("/d1", "keep/tiny.mkv", 1024);
    files.addFile("/d1", "keep/huge.mkv", 20 * GB);

    auto c = classified({makeDrive("/d1", 100 * GB, 80 * GB), makeDrive("/d2", 100 * GB, 20 * GB)});
    FileSelector selector(files, FilterPipeline({"*.mkv"}, {"*.sample.*"}, 1024 * 1024, 10 * GB));
    auto plan = selector.select(c, "");

    REQUIRE_SIZE(plan.candidates, 1u);
    REQUIRE_EQ(plan.candidates[0].source_path, "/d1/keep/film.mkv");
    REQUIRE_FALSE(planHas(plan, "/d1/keep/film.sample.mkv"));
    REQUIRE_FALSE(planHas(plan, "/d1/keep/notes.txt"));
    REQUIRE_FALSE(planHas(plan, "/d1/keep/tiny.mkv"));
    REQUIRE_FALSE(planHas(plan, "/d1/keep/huge.mkv"));
}

TEST_CASE(Selector_DropsFileNoDestinationAdmits) {
    // target 50%: d1 holds 60GB above it, d2 may take 20GB, d3 sits inside the band
    FakeFileSource files;
    files.addFile("/d1", "large.bin", 50 * GB);
    files.addFile("/d1", "fits.bin", 15 * GB);

    auto c = classified({makeDrive("/d1", 200 * GB, 160 * GB),
                         makeDrive("/d2", 100 * GB, 30 * GB),
                         makeDrive("/d3", 1000 * GB, 460 * GB)}, 10.0);
    REQUIRE_NEAR(c.target_percent, 50.0, 1e-9);
    REQUIRE_EQ(TargetCalculator::excessBytes(c.drives[0], c.target_percent), 60 * GB);
    REQUIRE(c.drives[1].classification == DriveClass::UNDERFULL);
    REQUIRE(c.drives[2].classification == DriveClass::NEUTRAL);
    REQUIRE_EQ(TargetCalculator::headroomBytes(c.drives[1], c.target_percent), 20 * GB);

    FileSelector selector(files, FilterPipeline{});
    auto plan = selector.select(c, "");
    REQUIRE_FALSE(planHas(plan, "/d1/large.bin"));
    REQUIRE(planHas(plan, "/d1/fits.bin"));
}

TEST_CASE(Selector_SpreadsAcrossDestinations) {
    FakeFileSource files;
    for (int i = 0; i < 6; ++i) files.addFile("/full", "f" + std::to_string(i), 5 * GB);

    auto c = classified({makeDrive("/full", 100 * GB, 90 * GB),
                         makeDrive("/e1", 100 * GB, 10 * GB),
                         makeDrive("/e2", 100 * GB, 10 * GB)});
    FileSelector selector(files, FilterPipeline{});
    auto plan = selector.select(c, "");

    std::map<std::string, int> per_dest;
    for (const auto& cand : plan.candidates) {
        REQUIRE_EQ(cand.source_drive, "/full");
        REQUIRE_NE(cand.destination_drive, cand.source_drive);
        ++per_dest[cand.destination_drive];
    }
    REQUIRE_EQ(plan.destinationCount(), 2u);
    REQUIRE_EQ(per_dest["/e1"], per_dest["/e2"]);
    // Equal headroom goes to the lexically first drive
    REQUIRE_EQ(plan.candidates[0].destination_drive, "/e1");
    REQUIRE_EQ(plan.candidates[1].destination_drive, "/e2");
}

TEST_CASE(Selector_StopsAtSourceExcess) {
    // target 50%, d1 holds 30GB above it
    FakeFileSource files;
    for (int i = 0; i < 10; ++i) files.addFile("/d1", "f" + std::to_string(i), 10 * GB);

    auto c = classified({makeDrive("/d1", 100 * GB, 80 * GB), makeDrive("/d2", 100 * GB, 20 * GB)});
    FileSelector selector(files, FilterPipeline{});
    auto plan = selector.select(c, "");
    REQUIRE_EQ(plan.totalBytes(), 30 * GB);
    REQUIRE_SIZE(plan.candidates, 3u);
}

TEST_CASE(Selector_NeverChoosesNeutralOrExcludedDrives) {
    FakeFileSource files;
    files.addFile("/d1", "a", 1 * GB);
    files.addFile("/d3", "b", 1 * GB);

    std::vector<Drive> drives = {makeDrive("/d1", 100 * GB, 80 * GB),
                                 makeDrive("/d2", 100 * GB, 20 * GB),
                                 makeDrive("/d3", 100 * GB, 95 * GB),
                                 makeDrive("/d4", 100 * GB, 0)};
    drives[2].allowed_source = false;
    drives[2].allowed_destination = false;
    drives[3].allowed_destination = false;
    auto c = classified(drives);
    FileSelector selector(files, FilterPipeline{});
    auto plan = selector.select(c, "");

    REQUIRE_NOT_EMPTY(plan.candidates);
    for (const auto& cand : plan.candidates) {
        REQUIRE_EQ(cand.source_drive, "/d1");
        REQUIRE_EQ(cand.destination_drive, "/d2");
    }
}

TEST_CASE(Selector_SkipsFailedPaths) {
    FakeFileSource files;
    files.addFile("/d1", "bad.bin", 5 * GB);
    files.addFile("/d1", "good.bin", 4 * GB);

    auto c = classified({makeDrive("/d1", 100 * GB, 80 * GB), makeDrive("/d2", 100 * GB, 20 * GB)});
    FileSelector selector(files, FilterPipeline{});
    auto plan = selector.select(c, "", {"/d1/bad.bin"});
    REQUIRE_SIZE(plan.candidates, 1u);
    REQUIRE_EQ(plan.candidates[0].source_path, "/d1/good.bin");
}

TEST_CASE(Selector_WarnsWhenFiltersRejectEverything) {
    FakeFileSource files;
    files.addFile("/d1", "a.txt", 5 * GB);
    files.failRoot("/d3");

    EventBus bus;
    EventRecorder events(bus);
    auto c = classified({makeDrive("/d1", 100 * GB, 80 * GB),
                         makeDrive("/d3", 100 * GB, 80 * GB),
                         makeDrive("/d2", 100 * GB, 0)});
    FileSelector selector(files, FilterPipeline({}, {"*.txt"}, std::nullopt, std::nullopt), &bus);
    auto plan = selector.select(c, "", {}, 2);

    REQUIRE(plan.empty());
    REQUIRE_SIZE(plan.warnings, 2u);
    auto warnings = events.of(EventType::SELECTION_WARNING);
    REQUIRE_SIZE(warnings, 2u);
    REQUIRE_EQ(warnings[0].iteration, 2u);
}

TEST_CASE(Selector_WalksSubpathKeepsDriveRelativePaths) {
    FakeFileSource files;
    files.addFile("/d1/media", "tv/show.mkv", 3 * GB);
    files.addFile("/d1", "other/skip.mkv", 3 * GB);

    auto c = classified({makeDrive("/d1", 100 * GB, 80 * GB), makeDrive("/d2", 100 * GB, 20 * GB)});
    FileSelector selector(files, FilterPipeline{});
    auto plan = selector.select(c, "media");
    REQUIRE_SIZE(plan.candidates, 1u);
    REQUIRE_EQ(plan.candidates[0].relative_path, "media/tv/show.mkv");
    REQUIRE_EQ(plan.candidates[0].destinationPath(), "/d2/media/tv/show.mkv");
}

TEST_CASE(Selector_ConvergedPoolHasNoPlan) {
    FakeFileSource files;
    files.addFile("/d1", "a", GB);
    auto c = classified({makeDrive("/d1", 100 * GB, 50 * GB), makeDrive("/d2", 100 * GB, 50 * GB)});
    FileSelector selector(files, FilterPipeline{});
    REQUIRE(selector.select(c, "").empty());
}

TEST_CASE(Selector_ReadOnlyOverDrives) {
    FakeFileSource files;
    files.addFile("/d1", "a", 2 * GB);
    auto c = classified({makeDrive("/d1", 100 * GB, 80 * GB), makeDrive("/d2", 100 * GB, 20 * GB)});
    auto before = c.drives;
    FileSelector selector(files, FilterPipeline{});
    auto plan = selector.select(c, "");
    REQUIRE_NOT_EMPTY(plan.candidates);
    for (size_t i = 0; i < before.size(); ++i) {
        REQUIRE_EQ(c.drives[i].used_bytes, before[i].used_bytes);
        REQUIRE_EQ(c.drives[i].free_bytes, before[i].free_bytes);
    }
}

//=============================================================================
// FilesystemSource
//=============================================================================

TEST_CASE(FilesystemSource_SkipsHiddenAndSymlinks) {
    fs::TempDirectory root("pbwalk");
    writeSizedFile(root / "visible.bin", 10);
    writeSizedFile(root / "sub" / "nested.bin", 20);
    writeSizedFile(root / ".hidden", 30);
    writeSizedFile(root / ".cache" / "inside.bin", 40);
    std::error_code ec;
    fs::stdfs::create_symlink(root / "visible.bin", root / "link.bin", ec);

    FilesystemSource source;
    auto listed = source.listFiles(root.path().string());
    REQUIRE_OK(listed);
    REQUIRE_SIZE(*listed, 2u);
    uint64_t total = 0;
    for (const auto& f : *listed) total += f.size;
    REQUIRE_EQ(total, 30ULL);
}

TEST_CASE(FilesystemSource_AbsentRootIsEmpty) {
    FilesystemSource source;
    auto listed = source.listFiles("/no/such/root/for/pool");
    REQUIRE_OK(listed);
    REQUIRE_EMPTY(*listed);
}

int main(int argc, char* argv[]) {
    std::string filter;
    if (argc > 1) filter = argv[1];
    return TestRunner::instance().run(filter);
}
