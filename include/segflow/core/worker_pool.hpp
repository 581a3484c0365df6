// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <segflow/core/event_sink.hpp>
#include <segflow/core/retry_policy.hpp>
#include <segflow/core/segment_fetcher.hpp>
#include <segflow/core/segment_scheduler.hpp>
#include <cstdint>
#include <thread>
#include <vector>

namespace segflow::core {

// N symmetric fetch loops pulling indices from the scheduler
class WorkerPool {
public:
    WorkerPool(SegmentScheduler& scheduler,
               SegmentFetcher& fetcher,
               EventSink& events,
               RetryPolicy policy,
               std::uint32_t threads) noexcept;
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Spawn the worker threads
    void start();

    // Block until every worker has exited
    void join() noexcept;

    [[nodiscard]] std::uint32_t threads() const noexcept { return threads_; }

    // Body of one worker; public so a caller can drive a worker inline
    void run_worker(std::uint32_t worker_id) noexcept;

private:
    // Fetch one segment until it succeeds or the policy gives up
    [[nodiscard]] SegmentOutcome process(std::uint32_t worker_id, SegmentIndex index) noexcept;

    SegmentScheduler& scheduler_;
    SegmentFetcher& fetcher_;
    EventSink& events_;
    RetryPolicy policy_;
    std::uint32_t threads_;
    std::vector<std::jthread> workers_;
};

} // namespace segflow::core
