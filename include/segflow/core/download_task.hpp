// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <segflow/core/error.hpp>
#include <segflow/core/event_sink.hpp>
#include <segflow/core/http_session.hpp>
#include <segflow/core/merge_coordinator.hpp>
#include <segflow/core/retry_policy.hpp>
#include <segflow/core/segment.hpp>
#include <segflow/core/segment_fetcher.hpp>
#include <segflow/core/segment_scheduler.hpp>
#include <segflow/core/worker_pool.hpp>
#include <segflow/disk/file_writer.hpp>
#include <segflow/disk/scratch_store.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace segflow::core {

// Download configuration
struct DownloadConfig {
    std::string url;                       // Stream base URL
    std::string output_path;               // Merged output file
    std::string scratch_dir;               // Default: "<output_path>.parts"
    std::uint32_t threads{DEFAULT_THREADS};
    QueueMode queue_mode{QueueMode::automatic};
    RetryPolicy retry;
    bool keep_scratch{false};              // Leave scratch files after merging
    std::string user_agent{DEFAULT_USER_AGENT};

    // Configuration errors are reported before any work starts
    [[nodiscard]] std::error_code validate() const noexcept;

    [[nodiscard]] std::string effective_scratch_dir() const;
};

// Final outcome of a download, built once
struct DownloadResult {
    std::uint32_t total_segments{0};
    std::vector<SegmentIndex> lost_segments;   // Ascending
    std::error_code error;

    [[nodiscard]] bool ok() const noexcept { return !error; }
};

// Orchestrates scheduler, worker pool and merge coordinator for one stream.
//
// Collaborators not supplied are created internally: a libcurl
// HttpSession and a DirectoryScratchStore under the scratch directory.
// The event sink must outlive the task.
class DownloadTask {
public:
    DownloadTask(DownloadConfig config,
                 StreamInfo stream,
                 EventSink& events,
                 HttpTransport* transport = nullptr,
                 disk::ScratchStore* scratch = nullptr,
                 SegmentUrlFn url_fn = {});
    ~DownloadTask();

    // Non-copyable, non-movable (worker threads hold `this`)
    DownloadTask(const DownloadTask&) = delete;
    DownloadTask& operator=(const DownloadTask&) = delete;

    // Validate, open the output and spawn workers + merge. Non-blocking.
    // Calling it again is a no-op.
    [[nodiscard]] std::error_code start() noexcept;

    // Block until workers and merge have finished; same result on every call
    [[nodiscard]] DownloadResult wait() noexcept;

    // Live streams: more segments became available
    [[nodiscard]] std::error_code extend_total(SegmentIndex new_total) noexcept;

    // Live streams: no more segments will appear
    [[nodiscard]] std::error_code end_stream() noexcept;

    [[nodiscard]] bool started() const noexcept;
    [[nodiscard]] bool finished() const noexcept;
    [[nodiscard]] SchedulerProgress progress() const noexcept;
    [[nodiscard]] QueueMode queue_mode() const noexcept;

    [[nodiscard]] const DownloadConfig& config() const noexcept { return config_; }
    [[nodiscard]] const StreamInfo& stream() const noexcept { return stream_; }

    // Global initialization
    static void global_init() noexcept { HttpSession::global_init(); }
    static void global_cleanup() noexcept { HttpSession::global_cleanup(); }

private:
    [[nodiscard]] std::error_code prepare() noexcept;
    // Undo what prepare() created after a failed start
    void discard_partial_state() noexcept;
    void finish() noexcept;

    DownloadConfig config_;
    StreamInfo stream_;
    EventSink& events_;
    SegmentUrlFn url_fn_;

    std::unique_ptr<HttpSession> owned_transport_;
    std::unique_ptr<disk::DirectoryScratchStore> owned_scratch_;
    HttpTransport* transport_;
    disk::ScratchStore* scratch_;

    disk::FileWriter output_;
    std::unique_ptr<SegmentScheduler> scheduler_;
    std::unique_ptr<SegmentFetcher> fetcher_;
    std::unique_ptr<MergeCoordinator> merge_;
    std::unique_ptr<WorkerPool> pool_;

    DownloadResult result_;
    bool started_{false};
    bool finished_{false};
    mutable std::mutex mutex_;      // started_, finished_, result_
    std::mutex wait_mutex_;         // Serializes wait()
};

} // namespace segflow::core
