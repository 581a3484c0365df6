// Copyright (c) 2026 changcheng967. All rights reserved.

#include <segflow/core/download_task.hpp>
#include <segflow/core/url.hpp>
#include <spdlog/fmt/fmt.h>
#include <filesystem>

namespace segflow::core {

//=============================================================================
// DownloadConfig
//=============================================================================

std::error_code DownloadConfig::validate() const noexcept {
    if (url.empty()) {
        return make_error_code(DownloadErrc::invalid_url);
    }
    auto parsed = Url::parse(url);
    if (!parsed) {
        return parsed.error();
    }
    if (parsed->scheme() != "http" && parsed->scheme() != "https") {
        return make_error_code(DownloadErrc::invalid_url);
    }
    if (output_path.empty()) {
        return make_error_code(DownloadErrc::invalid_output);
    }
    if (threads < 1) {
        return make_error_code(DownloadErrc::invalid_thread_count);
    }
    return retry.validate();
}

std::string DownloadConfig::effective_scratch_dir() const {
    if (!scratch_dir.empty()) {
        return scratch_dir;
    }
    return output_path + ".parts";
}

//=============================================================================
// DownloadTask
//=============================================================================

DownloadTask::DownloadTask(DownloadConfig config,
                           StreamInfo stream,
                           EventSink& events,
                           HttpTransport* transport,
                           disk::ScratchStore* scratch,
                           SegmentUrlFn url_fn)
    : config_(std::move(config))
    , stream_(stream)
    , events_(events)
    , url_fn_(std::move(url_fn))
    , transport_(transport)
    , scratch_(scratch) {}

DownloadTask::~DownloadTask() {
    // A live stream nobody ended would keep workers waiting forever
    bool running = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running = started_ && !finished_;
    }
    if (running) {
        (void)end_stream();
        (void)wait();
    }
}

std::error_code DownloadTask::prepare() noexcept {
    if (auto ec = config_.validate()) {
        return ec;
    }

    // Output first: a path that cannot be opened leaves nothing behind
    if (auto ec = output_.open(config_.output_path)) {
        return ec;
    }

    try {
        if (!transport_) {
            owned_transport_ = std::make_unique<HttpSession>(config_.user_agent);
            transport_ = owned_transport_.get();
        }
        if (!scratch_) {
            owned_scratch_ = std::make_unique<disk::DirectoryScratchStore>(config_.effective_scratch_dir());
            if (auto ec = owned_scratch_->prepare()) {
                discard_partial_state();
                return ec;
            }
            scratch_ = owned_scratch_.get();
        }
    } catch (const std::exception& e) {
        events_.on_event(EventLevel::error, fmt::format("Cannot create download resources: {}", e.what()));
        discard_partial_state();
        return make_error_code(DownloadErrc::config_error);
    }
    return {};
}

void DownloadTask::discard_partial_state() noexcept {
    if (auto ec = output_.close()) {
        events_.on_event(EventLevel::warn, fmt::format("Cannot close output: {}", ec.message()));
    }
    std::error_code ec;
    std::filesystem::remove(config_.output_path, ec);
    if (ec) {
        events_.on_event(EventLevel::warn,
                         fmt::format("Cannot remove {}: {}", config_.output_path, ec.message()));
    }
    if (owned_scratch_) {
        if (auto dir_ec = owned_scratch_->discard()) {
            events_.on_event(EventLevel::warn,
                             fmt::format("Cannot remove scratch directory: {}", dir_ec.message()));
        }
    }
}

std::error_code DownloadTask::start() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) {
        return {};
    }
    started_ = true;

    if (auto ec = prepare()) {
        events_.on_event(EventLevel::error, fmt::format("Cannot start download: {}", ec.message()));
        result_.total_segments = stream_.segment_count;
        result_.error = ec;
        finished_ = true;
        return ec;
    }

    try {
        scheduler_ = std::make_unique<SegmentScheduler>(stream_, config_.queue_mode, config_.threads);
        fetcher_ = std::make_unique<SegmentFetcher>(*transport_, *scratch_, events_,
                                                    config_.url, url_fn_, config_.retry);
        merge_ = std::make_unique<MergeCoordinator>(*scheduler_, *scratch_, output_, events_,
                                                    config_.keep_scratch);
        pool_ = std::make_unique<WorkerPool>(*scheduler_, *fetcher_, events_,
                                             config_.retry, config_.threads);

        events_.on_event(EventLevel::info,
                         fmt::format("Downloading {}{} segments with {} threads ({} queue)",
                                     stream_.segment_count, stream_.live ? "+" : "",
                                     config_.threads, to_string(scheduler_->mode())));

        merge_->start();
        pool_->start();
    } catch (const std::exception& e) {
        events_.on_event(EventLevel::error, fmt::format("Cannot start download: {}", e.what()));
        if (scheduler_) {
            scheduler_->abort(make_error_code(DownloadErrc::config_error));
        }
        // Threads already spawned are collected by wait()
        if (!merge_ || !pool_) {
            discard_partial_state();
            result_.error = make_error_code(DownloadErrc::config_error);
            finished_ = true;
        }
        return make_error_code(DownloadErrc::config_error);
    }

    return {};
}

void DownloadTask::finish() noexcept {
    DownloadResult result;
    result.total_segments = scheduler_->total();
    result.lost_segments = merge_->lost_segments();
    result.error = scheduler_->error();

    if (result.error) {
        // Segments fetched after the abort were never merged
        if (!config_.keep_scratch) {
            for (const auto& key : scheduler_->unmerged_scratch()) {
                if (auto ec = scratch_->remove(key)) {
                    events_.on_event(EventLevel::warn,
                                     fmt::format("Cannot remove scratch entry {}: {}", key, ec.message()));
                }
            }
        }
    }

    if (!result.error) {
        result.error = output_.flush();
    }
    if (auto ec = output_.close(); ec && !result.error) {
        result.error = ec;
    }

    if (result.error) {
        events_.on_event(EventLevel::error, fmt::format("Download failed: {}", result.error.message()));
    } else if (!result.lost_segments.empty()) {
        events_.on_event(EventLevel::warn,
                         fmt::format("Download finished with {} lost segment(s) out of {}",
                                     result.lost_segments.size(), result.total_segments));
    } else {
        events_.on_event(EventLevel::info,
                         fmt::format("Download finished, {} segments merged", result.total_segments));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    result_ = std::move(result);
    finished_ = true;
}

DownloadResult DownloadTask::wait() noexcept {
    std::lock_guard<std::mutex> wait_lock(wait_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_) {
            DownloadResult result;
            result.total_segments = stream_.segment_count;
            result.error = make_error_code(DownloadErrc::not_started);
            return result;
        }
        if (finished_) {
            return result_;
        }
    }

    // Workers finish first: only then is every dispensed segment terminal
    pool_->join();
    merge_->join();
    finish();

    std::lock_guard<std::mutex> lock(mutex_);
    return result_;
}

std::error_code DownloadTask::extend_total(SegmentIndex new_total) noexcept {
    SegmentScheduler* scheduler = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_ || finished_ || !scheduler_) {
            return make_error_code(DownloadErrc::not_started);
        }
        scheduler = scheduler_.get();
    }

    auto ec = scheduler->extend_total(new_total);
    if (!ec) {
        events_.on_event(EventLevel::debug, fmt::format("Stream extended to {} segments", new_total));
    }
    return ec;
}

std::error_code DownloadTask::end_stream() noexcept {
    SegmentScheduler* scheduler = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_ || finished_ || !scheduler_) {
            return make_error_code(DownloadErrc::not_started);
        }
        scheduler = scheduler_.get();
    }

    scheduler->end_stream();
    return {};
}

bool DownloadTask::started() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
}

bool DownloadTask::finished() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

SchedulerProgress DownloadTask::progress() const noexcept {
    SegmentScheduler* scheduler = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        scheduler = scheduler_.get();
    }
    if (!scheduler) {
        return {0, stream_.segment_count};
    }
    return scheduler->progress();
}

QueueMode DownloadTask::queue_mode() const noexcept {
    return resolve_queue_mode(config_.queue_mode, stream_);
}

} // namespace segflow::core
