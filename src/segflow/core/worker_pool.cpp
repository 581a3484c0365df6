// Copyright (c) 2026 changcheng967. All rights reserved.

#include <segflow/core/worker_pool.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace segflow::core {

WorkerPool::WorkerPool(SegmentScheduler& scheduler,
                       SegmentFetcher& fetcher,
                       EventSink& events,
                       RetryPolicy policy,
                       std::uint32_t threads) noexcept
    : scheduler_(scheduler)
    , fetcher_(fetcher)
    , events_(events)
    , policy_(policy)
    , threads_(std::max<std::uint32_t>(threads, 1)) {}

WorkerPool::~WorkerPool() {
    join();
}

void WorkerPool::start() {
    if (!workers_.empty()) {
        return;
    }

    workers_.reserve(threads_);
    for (std::uint32_t i = 0; i < threads_; ++i) {
        workers_.emplace_back([this, i] { run_worker(i); });
    }
}

void WorkerPool::join() noexcept {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

SegmentOutcome WorkerPool::process(std::uint32_t worker_id, SegmentIndex index) noexcept {
    std::uint32_t attempts = 0;

    while (policy_.should_retry(attempts)) {
        events_.on_segment_started(worker_id, index, attempts);

        auto result = fetcher_.fetch(index);
        if (result) {
            return SegmentOutcome::success(std::move(*result));
        }

        ++attempts;
        events_.on_segment_retry(worker_id, index, attempts, result.error());

        // A fatal merge error ends the run; no point hammering the origin
        if (scheduler_.aborted()) {
            break;
        }
        if (policy_.should_retry(attempts) && policy_.delay().count() > 0) {
            std::this_thread::sleep_for(policy_.delay());
        }
    }

    return SegmentOutcome::permanent_failure();
}

void WorkerPool::run_worker(std::uint32_t worker_id) noexcept {
    while (auto index = scheduler_.next_segment(worker_id)) {
        SegmentOutcome outcome = process(worker_id, *index);
        const bool ok = outcome.ok();

        if (!ok && scheduler_.aborted()) {
            break;
        }

        auto ec = scheduler_.record_outcome(*index, std::move(outcome));
        if (ec) {
            events_.on_event(EventLevel::error,
                             fmt::format("[worker {}] Cannot record segment {}: {}",
                                         worker_id, *index, ec.message()));
            scheduler_.abort(ec);
            break;
        }

        if (ok) {
            events_.on_segment_finished(worker_id, *index);
        } else {
            events_.on_segment_abandoned(worker_id, *index);
        }

        auto progress = scheduler_.progress();
        events_.on_progress(progress.finished, progress.total);
    }

    events_.on_event(EventLevel::info, fmt::format("Thread {} done", worker_id));
}

} // namespace segflow::core
