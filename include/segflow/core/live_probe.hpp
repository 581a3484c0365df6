// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <segflow/core/config.hpp>
#include <segflow/core/download_task.hpp>
#include <segflow/core/event_sink.hpp>
#include <segflow/core/http_session.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace segflow::core {

// Response header carrying the newest segment number of a live stream
constexpr std::string_view HEAD_SEQNUM_HEADER = "x-head-seqnum";

// Grows the total of a live download while the stream is on air.
//
// Polls the base URL with HEAD (the newest known segment for "{index}"
// templates). A head sequence number N extends the task to N + 1 segments.
// The stream is ended on a non-2xx status, or when the head has not moved
// or the origin has not answered for idle_polls polls in a row.
class LiveProbe {
public:
    LiveProbe(HttpTransport& transport,
              DownloadTask& task,
              EventSink& events,
              std::string url,
              std::chrono::milliseconds interval = LIVE_PROBE_INTERVAL,
              std::uint32_t idle_polls = LIVE_PROBE_IDLE_POLLS);
    ~LiveProbe();

    LiveProbe(const LiveProbe&) = delete;
    LiveProbe& operator=(const LiveProbe&) = delete;

    // Poll on a background thread until the stream ends or stop() is called
    void start();

    // Interrupt the polling thread and wait for it
    void stop() noexcept;

    // One poll. Returns false once the stream has been ended.
    [[nodiscard]] bool poll() noexcept;

    [[nodiscard]] SegmentIndex known_total() const noexcept { return known_total_; }
    [[nodiscard]] std::uint32_t idle_count() const noexcept { return idle_count_; }

private:
    [[nodiscard]] std::string probe_url() const;
    void run(std::stop_token stop) noexcept;
    void seal(std::string_view reason) noexcept;

    HttpTransport& transport_;
    DownloadTask& task_;
    EventSink& events_;
    std::string url_;
    std::chrono::milliseconds interval_;
    std::uint32_t idle_polls_;

    SegmentIndex known_total_;
    std::uint32_t idle_count_{0};

    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::jthread thread_;
};

// Parse the head sequence number header value
[[nodiscard]] std::optional<SegmentIndex> parse_head_seqnum(std::string_view value) noexcept;

} // namespace segflow::core
