// Copyright (c) 2026 changcheng967. All rights reserved.

#include <segflow/core/segment_scheduler.hpp>
#include <algorithm>

namespace segflow::core {

QueueMode resolve_queue_mode(QueueMode requested, const StreamInfo& stream) noexcept {
    if (requested != QueueMode::automatic) {
        return requested;
    }
    return stream.live ? QueueMode::sequential : QueueMode::out_of_order;
}

//=============================================================================
// SegmentScheduler
//=============================================================================

SegmentScheduler::SegmentScheduler(StreamInfo stream, QueueMode mode, std::uint32_t workers)
    : mode_(resolve_queue_mode(mode, stream))
    , workers_(std::max<std::uint32_t>(workers, 1))
    , total_(stream.segment_count)
    , sealed_(!stream.live)
    , slots_(stream.segment_count) {
    if (mode_ == QueueMode::out_of_order) {
        worker_cursors_.resize(workers_);
        for (std::uint32_t w = 0; w < workers_; ++w) {
            worker_cursors_[w] = w;
        }
    }
}

std::optional<SegmentIndex> SegmentScheduler::take_locked(std::uint32_t worker_id) {
    SegmentIndex* cursor = nullptr;
    SegmentIndex step = 1;

    if (mode_ == QueueMode::out_of_order) {
        if (worker_id >= workers_) {
            return std::nullopt;
        }
        cursor = &worker_cursors_[worker_id];
        step = workers_;
    } else {
        cursor = &cursor_;
    }

    while (*cursor < total_) {
        SegmentIndex index = *cursor;
        *cursor += step;
        // A slot leaves pending exactly once
        if (slots_[index].state == SegmentState::pending) {
            slots_[index].state = SegmentState::in_flight;
            return index;
        }
    }
    return std::nullopt;
}

std::optional<SegmentIndex> SegmentScheduler::next_segment(std::uint32_t worker_id) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (mode_ == QueueMode::out_of_order && worker_id >= workers_) {
        return std::nullopt;
    }

    while (true) {
        if (error_) {
            return std::nullopt;
        }
        if (auto index = take_locked(worker_id)) {
            return index;
        }
        if (sealed_) {
            return std::nullopt;
        }
        dispatch_cv_.wait(lock);
    }
}

std::error_code SegmentScheduler::record_outcome(SegmentIndex index, SegmentOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (index >= total_ || !is_terminal(outcome.state)) {
        return make_error_code(DownloadErrc::invalid_segment);
    }

    auto& slot = slots_[index];
    if (is_terminal(slot.state)) {
        return make_error_code(DownloadErrc::duplicate_outcome);
    }
    if (slot.state != SegmentState::in_flight) {
        return make_error_code(DownloadErrc::invalid_segment);
    }

    slot.state = outcome.state;
    slot.scratch = std::move(outcome.scratch);
    ++finished_;

    if (index == frontier_) {
        merge_cv_.notify_one();
    }
    return {};
}

std::error_code SegmentScheduler::extend_total(SegmentIndex new_total) {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (sealed_) {
            return make_error_code(DownloadErrc::stream_sealed);
        }
        if (new_total < total_) {
            return make_error_code(DownloadErrc::invalid_total);
        }
        if (new_total == total_) {
            return {};
        }

        slots_.resize(new_total);
        total_ = new_total;
    }
    dispatch_cv_.notify_all();
    return {};
}

void SegmentScheduler::end_stream() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sealed_ = true;
    }
    dispatch_cv_.notify_all();
    merge_cv_.notify_all();
}

bool SegmentScheduler::merge_ready_locked() const noexcept {
    if (error_) return true;
    if (frontier_ < total_) return is_terminal(slots_[frontier_].state);
    return sealed_;
}

std::optional<MergeItem> SegmentScheduler::next_mergeable() {
    std::unique_lock<std::mutex> lock(mutex_);
    merge_cv_.wait(lock, [this] { return merge_ready_locked(); });

    if (error_ || frontier_ >= total_) {
        return std::nullopt;
    }

    const auto& slot = slots_[frontier_];
    return MergeItem{frontier_, SegmentOutcome{slot.state, slot.scratch}};
}

void SegmentScheduler::advance_frontier() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (frontier_ < total_ && is_terminal(slots_[frontier_].state)) {
        slots_[frontier_].scratch.clear();
        ++frontier_;
    }
}

void SegmentScheduler::abort(std::error_code ec) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!error_) {
            error_ = ec ? ec : make_error_code(DownloadErrc::merge_failed);
        }
    }
    dispatch_cv_.notify_all();
    merge_cv_.notify_all();
}

std::vector<std::string> SegmentScheduler::unmerged_scratch() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (SegmentIndex i = frontier_; i < total_; ++i) {
        if (slots_[i].state == SegmentState::succeeded && !slots_[i].scratch.empty()) {
            keys.push_back(slots_[i].scratch);
        }
    }
    return keys;
}

SegmentIndex SegmentScheduler::total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

bool SegmentScheduler::sealed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sealed_;
}

SegmentIndex SegmentScheduler::frontier() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frontier_;
}

SchedulerProgress SegmentScheduler::progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {finished_, total_};
}

std::error_code SegmentScheduler::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

bool SegmentScheduler::aborted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(error_);
}

SegmentState SegmentScheduler::state(SegmentIndex index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= total_) {
        return SegmentState::pending;
    }
    return slots_[index].state;
}

} // namespace segflow::core
