// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <segflow/core/error.hpp>
#include <segflow/core/event_sink.hpp>
#include <segflow/core/http_session.hpp>
#include <segflow/core/retry_policy.hpp>
#include <segflow/core/segment.hpp>
#include <segflow/disk/scratch_store.hpp>
#include <expected>
#include <functional>
#include <string>
#include <string_view>

namespace segflow::core {

using SegmentUrlFn = std::function<std::string(std::string_view base_url, SegmentIndex index)>;

// One fetch attempt for one segment. Holds no shared mutable state;
// a single instance is used by all workers.
class SegmentFetcher {
public:
    SegmentFetcher(HttpTransport& transport,
                   disk::ScratchStore& scratch,
                   EventSink& events,
                   std::string base_url,
                   SegmentUrlFn url_fn,
                   RetryPolicy policy) noexcept;

    // Fetch a segment into scratch; returns the scratch key.
    // Transport errors are retried inline (policy.request_retries tries);
    // an error return is one failed attempt, never a permanent failure.
    [[nodiscard]] std::expected<std::string, std::error_code> fetch(SegmentIndex index) noexcept;

    [[nodiscard]] const std::string& base_url() const noexcept { return base_url_; }

private:
    // GET with inline transport retries
    [[nodiscard]] std::expected<HttpResponse, std::error_code> request(const std::string& url) noexcept;

    // Base-URL request issued after a non-2xx segment response
    void probe_stream(SegmentIndex index) noexcept;

    HttpTransport& transport_;
    disk::ScratchStore& scratch_;
    EventSink& events_;
    std::string base_url_;
    SegmentUrlFn url_fn_;
    RetryPolicy policy_;
};

} // namespace segflow::core
