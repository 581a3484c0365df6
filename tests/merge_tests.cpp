// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <segflow/core/merge_coordinator.hpp>
#include <segflow/core/segment_scheduler.hpp>
#include "support/fakes.hpp"

using namespace segflow::core;
using namespace segflow::test;

namespace {

// Dispense every index and store its body, failing the listed ones
void fill(SegmentScheduler& scheduler, disk::ScratchStore& scratch,
          SegmentIndex count, const std::vector<SegmentIndex>& lost = {}) {
    for (SegmentIndex i = 0; i < count; ++i) {
        REQUIRE(scheduler.next_segment(0) == i);
    }
    // Record in reverse so the merge has to wait for the frontier
    for (SegmentIndex i = count; i-- > 0;) {
        if (std::find(lost.begin(), lost.end(), i) != lost.end()) {
            REQUIRE(!scheduler.record_outcome(i, SegmentOutcome::permanent_failure()));
            continue;
        }
        auto body = to_bytes(segment_body(i));
        auto key = scratch.store(i, std::span<const std::byte>(body));
        REQUIRE(key.has_value());
        REQUIRE(!scheduler.record_outcome(i, SegmentOutcome::success(*key)));
    }
}

} // namespace

TEST_CASE("MergeCoordinator appends segments in index order", "[merge]") {
    TempDir dir;
    disk::FileWriter output;
    REQUIRE(!output.open(dir.file("out.ts")));

    disk::MemoryScratchStore scratch;
    RecordingSink events;
    SegmentScheduler scheduler({5, false}, QueueMode::sequential, 1);

    SECTION("All segments present") {
        fill(scheduler, scratch, 5);
        MergeCoordinator merge(scheduler, scratch, output, events, false);
        CHECK(!merge.run());
        REQUIRE(!output.close());

        CHECK(read_file(dir.file("out.ts")) == "<seg0><seg1><seg2><seg3><seg4>");
        CHECK(merge.merged() == 5);
        CHECK(merge.lost_segments().empty());
        CHECK(scratch.size() == 0);
        CHECK(scheduler.frontier() == 5);
    }

    SECTION("Lost segments are skipped and recorded") {
        fill(scheduler, scratch, 5, {1, 4});
        MergeCoordinator merge(scheduler, scratch, output, events, false);
        CHECK(!merge.run());
        REQUIRE(!output.close());

        CHECK(read_file(dir.file("out.ts")) == "<seg0><seg2><seg3>");
        CHECK(merge.lost_segments() == std::vector<SegmentIndex>{1, 4});

        auto merged = events.merged();
        REQUIRE(merged.size() == 5);
        CHECK(merged[1] == std::make_pair(1u, true));
        CHECK(merged[2] == std::make_pair(2u, false));
    }

    SECTION("keep_scratch leaves entries in place") {
        fill(scheduler, scratch, 5);
        MergeCoordinator merge(scheduler, scratch, output, events, true);
        CHECK(!merge.run());
        CHECK(scratch.size() == 5);
    }
}

TEST_CASE("MergeCoordinator on its own thread", "[merge]") {
    TempDir dir;
    disk::FileWriter output;
    REQUIRE(!output.open(dir.file("out.ts")));

    disk::MemoryScratchStore scratch;
    NullEventSink events;
    SegmentScheduler scheduler({3, false}, QueueMode::sequential, 1);

    MergeCoordinator merge(scheduler, scratch, output, events, false);
    merge.start();
    fill(scheduler, scratch, 3);
    merge.join();

    CHECK(!merge.error());
    REQUIRE(!output.close());
    CHECK(read_file(dir.file("out.ts")) == "<seg0><seg1><seg2>");
}

TEST_CASE("MergeCoordinator I/O error aborts the run", "[merge]") {
    TempDir dir;
    disk::FileWriter output;
    REQUIRE(!output.open(dir.file("out.ts")));

    FaultyScratchStore scratch;
    RecordingSink events;
    SegmentScheduler scheduler({3, false}, QueueMode::sequential, 1);
    fill(scheduler, scratch, 3);

    std::error_code expected;
    std::string written;
    SECTION("Scratch entry cannot be read") {
        scratch.fail_read(true);
        expected = disk::DiskErrc::read_error;
    }
    SECTION("Scratch entry cannot be deleted") {
        scratch.fail_remove(true);
        expected = disk::DiskErrc::access_denied;
        written = segment_body(0);
    }
    SECTION("Output cannot be appended to") {
        REQUIRE(!output.close());
        expected = disk::DiskErrc::handle_invalid;
    }

    MergeCoordinator merge(scheduler, scratch, output, events, false);
    auto ec = merge.run();

    CHECK(ec == expected);
    CHECK(scheduler.aborted());
    CHECK(scheduler.error() == expected);
    CHECK(scheduler.frontier() == 0);
    CHECK(merge.merged() == 0);
    CHECK(scheduler.unmerged_scratch().size() == 3);
    CHECK(events.contains("Merge of segment 0 failed"));
    CHECK(events.merged().empty());

    (void)output.close();
    CHECK(read_file(dir.file("out.ts")) == written);
}

TEST_CASE("MergeCoordinator with an empty sealed stream", "[merge]") {
    TempDir dir;
    disk::FileWriter output;
    REQUIRE(!output.open(dir.file("out.ts")));

    disk::MemoryScratchStore scratch;
    NullEventSink events;
    SegmentScheduler scheduler({0, false}, QueueMode::sequential, 1);

    MergeCoordinator merge(scheduler, scratch, output, events, false);
    CHECK(!merge.run());
    CHECK(merge.merged() == 0);
    REQUIRE(!output.close());
    CHECK(read_file(dir.file("out.ts")).empty());
}
