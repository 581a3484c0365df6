// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <segflow/core/config.hpp>
#include <segflow/core/event_sink.hpp>
#include <segflow/core/retry_policy.hpp>
#include <segflow/core/segment.hpp>
#include <segflow/core/segment_scheduler.hpp>

using namespace segflow::core;

TEST_CASE("RetryPolicy defaults", "[retry]") {
    RetryPolicy policy;
    CHECK(policy.fail_threshold == 20);
    CHECK(policy.retry_delay == std::chrono::milliseconds(1000));
    CHECK(policy.delay() == std::chrono::seconds(1));
    CHECK(policy.request_retries == 3);
    CHECK(!policy.validate());
}

TEST_CASE("RetryPolicy::should_retry threshold", "[retry]") {
    RetryPolicy policy;

    SECTION("Below the threshold retries") {
        CHECK(policy.should_retry(0));
        CHECK(policy.should_retry(1));
        CHECK(policy.should_retry(FAIL_THRESHOLD - 1));
    }

    SECTION("At the threshold abandons") {
        CHECK(!policy.should_retry(FAIL_THRESHOLD));
        CHECK(!policy.should_retry(FAIL_THRESHOLD + 5));
    }

    SECTION("Same answer on repeated calls") {
        for (int i = 0; i < 3; ++i) {
            CHECK(policy.should_retry(19));
            CHECK(!policy.should_retry(20));
        }
    }

    SECTION("Threshold of one gives a single attempt") {
        RetryPolicy once{1, std::chrono::milliseconds(0), 1};
        CHECK(once.should_retry(0));
        CHECK(!once.should_retry(1));
    }

    static_assert(RetryPolicy{}.should_retry(19));
    static_assert(!RetryPolicy{}.should_retry(20));
}

TEST_CASE("RetryPolicy::validate", "[retry]") {
    SECTION("Zero threshold") {
        RetryPolicy policy;
        policy.fail_threshold = 0;
        CHECK(policy.validate() == DownloadErrc::invalid_retry_policy);
    }

    SECTION("Zero request tries") {
        RetryPolicy policy;
        policy.request_retries = 0;
        CHECK(policy.validate() == DownloadErrc::invalid_retry_policy);
    }

    SECTION("Negative delay") {
        RetryPolicy policy;
        policy.retry_delay = std::chrono::milliseconds(-1);
        CHECK(policy.validate() == DownloadErrc::invalid_retry_policy);
    }

    SECTION("Zero delay is allowed") {
        RetryPolicy policy;
        policy.retry_delay = std::chrono::milliseconds(0);
        CHECK(!policy.validate());
    }
}

TEST_CASE("SegmentState helpers", "[segment]") {
    CHECK(!is_terminal(SegmentState::pending));
    CHECK(!is_terminal(SegmentState::in_flight));
    CHECK(is_terminal(SegmentState::succeeded));
    CHECK(is_terminal(SegmentState::failed));

    CHECK(to_string(SegmentState::in_flight) == "in_flight");
    CHECK(to_string(SegmentState::failed) == "failed");
}

TEST_CASE("SegmentOutcome factories", "[segment]") {
    auto ok = SegmentOutcome::success("key-1");
    CHECK(ok.ok());
    CHECK(ok.state == SegmentState::succeeded);
    CHECK(ok.scratch == "key-1");

    auto lost = SegmentOutcome::permanent_failure();
    CHECK(!lost.ok());
    CHECK(lost.state == SegmentState::failed);
    CHECK(lost.scratch.empty());
}

TEST_CASE("QueueMode names", "[segment]") {
    SECTION("Round trip of canonical names") {
        for (auto mode : {QueueMode::automatic, QueueMode::sequential, QueueMode::out_of_order}) {
            auto parsed = parse_queue_mode(to_string(mode));
            REQUIRE(parsed.has_value());
            CHECK(*parsed == mode);
        }
    }

    SECTION("Aliases") {
        CHECK(parse_queue_mode("out-of-order") == QueueMode::out_of_order);
        CHECK(parse_queue_mode("seq") == QueueMode::sequential);
    }

    SECTION("Unknown name") {
        CHECK(!parse_queue_mode("random").has_value());
        CHECK(!parse_queue_mode("").has_value());
    }
}

TEST_CASE("resolve_queue_mode", "[segment]") {
    SECTION("Automatic picks sequential for live streams") {
        CHECK(resolve_queue_mode(QueueMode::automatic, {0, true}) == QueueMode::sequential);
    }

    SECTION("Automatic picks out-of-order for fixed streams") {
        CHECK(resolve_queue_mode(QueueMode::automatic, {10, false}) == QueueMode::out_of_order);
    }

    SECTION("Explicit modes are kept") {
        CHECK(resolve_queue_mode(QueueMode::out_of_order, {0, true}) == QueueMode::out_of_order);
        CHECK(resolve_queue_mode(QueueMode::sequential, {10, false}) == QueueMode::sequential);
    }
}

TEST_CASE("EventLevel names", "[events]") {
    CHECK(parse_level("debug") == EventLevel::debug);
    CHECK(parse_level("INFO") == EventLevel::info);
    CHECK(parse_level("warning") == EventLevel::warn);
    CHECK(parse_level("error") == EventLevel::error);
    CHECK(to_string(EventLevel::warn) == "warn");

    auto bad = parse_level("verbose");
    REQUIRE(!bad.has_value());
    CHECK(bad.error() == DownloadErrc::config_error);
}
