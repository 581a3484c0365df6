// Copyright (c) 2026 changcheng967. All rights reserved.

#include <segflow/core/segment_fetcher.hpp>
#include <segflow/core/url.hpp>
#include <spdlog/fmt/fmt.h>
#include <span>

namespace segflow::core {

SegmentFetcher::SegmentFetcher(HttpTransport& transport,
                               disk::ScratchStore& scratch,
                               EventSink& events,
                               std::string base_url,
                               SegmentUrlFn url_fn,
                               RetryPolicy policy) noexcept
    : transport_(transport)
    , scratch_(scratch)
    , events_(events)
    , base_url_(std::move(base_url))
    , url_fn_(url_fn ? std::move(url_fn) : SegmentUrlFn(segment_url))
    , policy_(policy) {}

std::expected<HttpResponse, std::error_code>
SegmentFetcher::request(const std::string& url) noexcept {
    std::error_code last_error = make_error_code(DownloadErrc::network_error);
    for (std::uint32_t i = 0; i < policy_.request_retries; ++i) {
        auto response = transport_.get(url);
        if (response) {
            return response;
        }
        last_error = response.error();
    }
    return std::unexpected(last_error);
}

void SegmentFetcher::probe_stream(SegmentIndex index) noexcept {
    auto probe = transport_.get(base_url_);
    if (probe) {
        events_.on_probe(index, probe->status_code, {});
    } else {
        events_.on_probe(index, 0, probe.error());
    }
}

std::expected<std::string, std::error_code> SegmentFetcher::fetch(SegmentIndex index) noexcept {
    const std::string url = url_fn_(base_url_, index);

    auto response = request(url);
    if (!response) {
        events_.on_event(EventLevel::debug,
                         fmt::format("Request for segment {} failed with {}", index,
                                     response.error().message()));
        return std::unexpected(response.error());
    }

    if (!response->ok()) {
        events_.on_event(EventLevel::debug,
                         fmt::format("Non-200 status code {} for segment {}",
                                     response->status_code, index));
        probe_stream(index);
        return std::unexpected(status_to_error(response->status_code));
    }

    // store() leaves nothing behind on failure and returns only after the
    // entry is closed, so the merge thread never sees a partial segment
    auto key = scratch_.store(index, std::span<const std::byte>(response->body));
    if (!key) {
        events_.on_event(EventLevel::error,
                         fmt::format("Unable to write segment {}: {}", index, key.error().message()));
        return std::unexpected(key.error());
    }

    return key;
}

} // namespace segflow::core
