// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace segflow::core {

using SegmentIndex = std::uint32_t;

// Segment state machine: pending -> in_flight -> {succeeded, failed}
enum class SegmentState : std::uint8_t {
    pending,     // Known, not yet handed to a worker
    in_flight,   // Owned by a worker
    succeeded,   // Bytes persisted to scratch
    failed       // Retries exhausted, segment is lost
};

[[nodiscard]] constexpr bool is_terminal(SegmentState s) noexcept {
    return s == SegmentState::succeeded || s == SegmentState::failed;
}

// Order in which segment indices are handed to workers
enum class QueueMode : std::uint8_t {
    automatic,    // sequential for live streams, out_of_order otherwise
    sequential,   // One shared ascending cursor
    out_of_order  // Round-robin partition by worker id
};

[[nodiscard]] std::string_view to_string(QueueMode mode) noexcept;
[[nodiscard]] std::optional<QueueMode> parse_queue_mode(std::string_view name) noexcept;

[[nodiscard]] std::string_view to_string(SegmentState state) noexcept;

// Terminal result of one segment
struct SegmentOutcome {
    SegmentState state{SegmentState::failed};
    std::string scratch;   // Scratch key, only for succeeded

    [[nodiscard]] static SegmentOutcome success(std::string scratch_key) {
        return {SegmentState::succeeded, std::move(scratch_key)};
    }

    [[nodiscard]] static SegmentOutcome permanent_failure() {
        return {SegmentState::failed, {}};
    }

    [[nodiscard]] bool ok() const noexcept { return state == SegmentState::succeeded; }
};

// Input contract from stream discovery
struct StreamInfo {
    SegmentIndex segment_count{0};   // Known so far
    bool live{false};                // Count may still grow
};

} // namespace segflow::core
