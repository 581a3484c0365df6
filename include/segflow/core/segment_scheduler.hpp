// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <segflow/core/error.hpp>
#include <segflow/core/segment.hpp>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace segflow::core {

// Slot in the index-addressed segment table
struct SegmentSlot {
    SegmentState state{SegmentState::pending};
    std::string scratch;
};

// Terminal segment at the merge frontier
struct MergeItem {
    SegmentIndex index{0};
    SegmentOutcome outcome;
};

struct SchedulerProgress {
    std::uint32_t finished{0};
    std::uint32_t total{0};
};

// Shared download state: which segments exist, who holds them, what
// became of them, and how far the output has been merged.
//
// Every member function takes the single internal lock. Workers block in
// next_segment() while a live stream has nothing new; the merge thread
// blocks in next_mergeable() until the frontier segment is terminal.
class SegmentScheduler {
public:
    SegmentScheduler(StreamInfo stream, QueueMode mode, std::uint32_t workers);

    SegmentScheduler(const SegmentScheduler&) = delete;
    SegmentScheduler& operator=(const SegmentScheduler&) = delete;

    // Next index for a worker, nullopt when it should stop.
    // Blocks while a live stream is drained but not yet ended.
    [[nodiscard]] std::optional<SegmentIndex> next_segment(std::uint32_t worker_id);

    // Store the terminal outcome of an in-flight segment
    [[nodiscard]] std::error_code record_outcome(SegmentIndex index, SegmentOutcome outcome);

    // Grow the total of a live stream
    [[nodiscard]] std::error_code extend_total(SegmentIndex new_total);

    // No more segments will appear
    void end_stream();

    // Frontier segment once terminal; nullopt when everything is merged or the run aborted
    [[nodiscard]] std::optional<MergeItem> next_mergeable();

    // Move the frontier past the segment returned by next_mergeable()
    void advance_frontier();

    // Stop the run; the first error wins
    void abort(std::error_code ec);

    // Scratch keys recorded but never merged (after an abort)
    [[nodiscard]] std::vector<std::string> unmerged_scratch() const;

    [[nodiscard]] QueueMode mode() const noexcept { return mode_; }
    [[nodiscard]] std::uint32_t workers() const noexcept { return workers_; }

    [[nodiscard]] SegmentIndex total() const;
    [[nodiscard]] bool sealed() const;
    [[nodiscard]] SegmentIndex frontier() const;
    [[nodiscard]] SchedulerProgress progress() const;
    [[nodiscard]] std::error_code error() const;
    [[nodiscard]] bool aborted() const;
    [[nodiscard]] SegmentState state(SegmentIndex index) const;

private:
    // Caller holds mutex_
    [[nodiscard]] std::optional<SegmentIndex> take_locked(std::uint32_t worker_id);
    [[nodiscard]] bool merge_ready_locked() const noexcept;

    mutable std::mutex mutex_;
    std::condition_variable dispatch_cv_;
    std::condition_variable merge_cv_;

    const QueueMode mode_;
    const std::uint32_t workers_;

    SegmentIndex total_{0};
    bool sealed_{false};
    std::vector<SegmentSlot> slots_;

    SegmentIndex cursor_{0};                  // sequential
    std::vector<SegmentIndex> worker_cursors_; // out_of_order, one per worker

    SegmentIndex frontier_{0};
    std::uint32_t finished_{0};
    std::error_code error_;
};

// Queue mode actually used for a stream
[[nodiscard]] QueueMode resolve_queue_mode(QueueMode requested, const StreamInfo& stream) noexcept;

} // namespace segflow::core
