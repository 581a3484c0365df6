// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <segflow/core/event_sink.hpp>
#include <segflow/core/segment_scheduler.hpp>
#include <segflow/disk/file_writer.hpp>
#include <segflow/disk/scratch_store.hpp>
#include <system_error>
#include <thread>
#include <vector>

namespace segflow::core {

// Appends terminal segments to the output in ascending index order
class MergeCoordinator {
public:
    MergeCoordinator(SegmentScheduler& scheduler,
                     disk::ScratchStore& scratch,
                     disk::FileWriter& output,
                     EventSink& events,
                     bool keep_scratch) noexcept;
    ~MergeCoordinator();

    MergeCoordinator(const MergeCoordinator&) = delete;
    MergeCoordinator& operator=(const MergeCoordinator&) = delete;

    // Run the merge loop on its own thread
    void start();

    // Wait for the merge loop to finish
    void join() noexcept;

    // Merge loop body. Returns the fatal I/O error, if any.
    [[nodiscard]] std::error_code run() noexcept;

    // Valid after join()
    [[nodiscard]] const std::vector<SegmentIndex>& lost_segments() const noexcept { return lost_; }
    [[nodiscard]] std::error_code error() const noexcept { return error_; }
    [[nodiscard]] SegmentIndex merged() const noexcept { return merged_; }

private:
    [[nodiscard]] std::error_code merge_one(const MergeItem& item) noexcept;

    SegmentScheduler& scheduler_;
    disk::ScratchStore& scratch_;
    disk::FileWriter& output_;
    EventSink& events_;
    bool keep_scratch_;

    std::vector<SegmentIndex> lost_;
    SegmentIndex merged_{0};
    std::error_code error_;
    std::jthread thread_;
};

} // namespace segflow::core
