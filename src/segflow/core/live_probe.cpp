// Copyright (c) 2026 changcheng967. All rights reserved.

#include <segflow/core/live_probe.hpp>
#include <segflow/core/url.hpp>
#include <spdlog/fmt/fmt.h>
#include <charconv>
#include <limits>

namespace segflow::core {

std::optional<SegmentIndex> parse_head_seqnum(std::string_view value) noexcept {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }
    if (value.empty()) {
        return std::nullopt;
    }

    SegmentIndex seqnum = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seqnum);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    // N + 1 must still fit
    if (seqnum == std::numeric_limits<SegmentIndex>::max()) {
        return std::nullopt;
    }
    return seqnum;
}

LiveProbe::LiveProbe(HttpTransport& transport,
                     DownloadTask& task,
                     EventSink& events,
                     std::string url,
                     std::chrono::milliseconds interval,
                     std::uint32_t idle_polls)
    : transport_(transport)
    , task_(task)
    , events_(events)
    , url_(std::move(url))
    , interval_(interval)
    , idle_polls_(idle_polls)
    , known_total_(task.stream().segment_count) {}

LiveProbe::~LiveProbe() {
    stop();
}

void LiveProbe::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

void LiveProbe::stop() noexcept {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
}

void LiveProbe::seal(std::string_view reason) noexcept {
    events_.on_event(EventLevel::info, fmt::format("Live stream ended ({}), {} segments",
                                                   reason, known_total_));
    if (auto ec = task_.end_stream()) {
        events_.on_event(EventLevel::debug, fmt::format("Cannot end stream: {}", ec.message()));
    }
}

std::string LiveProbe::probe_url() const {
    if (url_.find(SEGMENT_INDEX_PLACEHOLDER) == std::string::npos) {
        return url_;
    }
    // Templated streams have no base resource; ask for the newest known segment
    return segment_url(url_, known_total_ > 0 ? known_total_ - 1 : 0);
}

bool LiveProbe::poll() noexcept {
    auto response = transport_.head(probe_url());
    if (!response) {
        events_.on_event(EventLevel::warn,
                         fmt::format("Live probe failed: {}", response.error().message()));
        if (++idle_count_ >= idle_polls_) {
            seal(fmt::format("origin unreachable for {} polls", idle_count_));
            return false;
        }
        return true;
    }

    if (!response->ok()) {
        seal(fmt::format("status {}", response->status_code));
        return false;
    }

    auto seqnum = parse_head_seqnum(response->header(HEAD_SEQNUM_HEADER));
    if (seqnum && *seqnum + 1 > known_total_) {
        auto ec = task_.extend_total(*seqnum + 1);
        if (ec) {
            events_.on_event(EventLevel::debug,
                             fmt::format("Live probe stopped: {}", ec.message()));
            return false;
        }
        known_total_ = *seqnum + 1;
        idle_count_ = 0;
        return true;
    }

    if (++idle_count_ >= idle_polls_) {
        seal(fmt::format("no new segments after {} polls", idle_count_));
        return false;
    }
    return true;
}

void LiveProbe::run(std::stop_token stop) noexcept {
    while (!stop.stop_requested() && !task_.finished()) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, stop, interval_, [] { return false; });
        }
        if (stop.stop_requested()) {
            break;
        }
        if (!poll()) {
            break;
        }
    }
}

} // namespace segflow::core
