// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <segflow/core/config.hpp>
#include <segflow/core/error.hpp>
#include <chrono>
#include <cstdint>

namespace segflow::core {

// Per-segment retry governance.
//
// Two levels: a segment gets up to fail_threshold attempts, spaced by
// retry_delay. Inside one attempt a request that fails at the transport
// level is re-sent immediately, up to request_retries tries in total;
// only when all of those fail does the attempt count as failed.
struct RetryPolicy {
    std::uint32_t fail_threshold{FAIL_THRESHOLD};
    std::chrono::milliseconds retry_delay{RETRY_DELAY};
    std::uint32_t request_retries{REQUEST_RETRY_COUNT};

    // True while a segment with `attempts` failed attempts may be tried again
    [[nodiscard]] constexpr bool should_retry(std::uint32_t attempts) const noexcept {
        return attempts < fail_threshold;
    }

    [[nodiscard]] constexpr std::chrono::milliseconds delay() const noexcept {
        return retry_delay;
    }

    [[nodiscard]] std::error_code validate() const noexcept {
        if (fail_threshold == 0 || request_retries == 0) {
            return make_error_code(DownloadErrc::invalid_retry_policy);
        }
        if (retry_delay.count() < 0) {
            return make_error_code(DownloadErrc::invalid_retry_policy);
        }
        return {};
    }
};

} // namespace segflow::core
