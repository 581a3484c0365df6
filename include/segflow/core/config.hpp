// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <string_view>

namespace segflow::core {

constexpr std::uint32_t FAIL_THRESHOLD = 20;                 // Attempts before a segment is abandoned
constexpr std::chrono::milliseconds RETRY_DELAY{1000};      // Pause between failed attempts
constexpr std::uint32_t REQUEST_RETRY_COUNT = 3;             // Inline tries on transport errors

constexpr std::uint32_t DEFAULT_THREADS = 1;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 15;

constexpr std::chrono::milliseconds LIVE_PROBE_INTERVAL{5000};
constexpr std::uint32_t LIVE_PROBE_IDLE_POLLS = 6;

constexpr std::size_t READ_BUFFER_SIZE = 256 * 1024;        // 256 KB

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

constexpr std::string_view DEFAULT_USER_AGENT =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/89.0.4389.90 Safari/537.36";

} // namespace segflow::core
