// Copyright (c) 2026 changcheng967. All rights reserved.

#include <segflow/core/merge_coordinator.hpp>
#include <spdlog/fmt/fmt.h>
#include <span>

namespace segflow::core {

MergeCoordinator::MergeCoordinator(SegmentScheduler& scheduler,
                                   disk::ScratchStore& scratch,
                                   disk::FileWriter& output,
                                   EventSink& events,
                                   bool keep_scratch) noexcept
    : scheduler_(scheduler)
    , scratch_(scratch)
    , output_(output)
    , events_(events)
    , keep_scratch_(keep_scratch) {}

MergeCoordinator::~MergeCoordinator() {
    join();
}

void MergeCoordinator::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::jthread([this] { error_ = run(); });
}

void MergeCoordinator::join() noexcept {
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::error_code MergeCoordinator::merge_one(const MergeItem& item) noexcept {
    if (!item.outcome.ok()) {
        lost_.push_back(item.index);
        events_.on_segment_merged(item.index, true);
        return {};
    }

    auto data = scratch_.read(item.outcome.scratch);
    if (!data) {
        return data.error();
    }

    if (auto ec = output_.append(std::span<const std::byte>(*data))) {
        return ec;
    }

    if (!keep_scratch_) {
        if (auto ec = scratch_.remove(item.outcome.scratch)) {
            return ec;
        }
    }

    events_.on_segment_merged(item.index, false);
    return {};
}

std::error_code MergeCoordinator::run() noexcept {
    while (auto item = scheduler_.next_mergeable()) {
        if (auto ec = merge_one(*item)) {
            events_.on_event(EventLevel::error,
                             fmt::format("Merge of segment {} failed: {}", item->index, ec.message()));
            scheduler_.abort(ec);
            return ec;
        }
        scheduler_.advance_frontier();
        ++merged_;
    }

    return {};
}

} // namespace segflow::core
