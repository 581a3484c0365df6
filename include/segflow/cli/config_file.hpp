// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <segflow/core/download_task.hpp>
#include <segflow/core/event_sink.hpp>
#include <segflow/core/segment.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace segflow::cli {

// Settings read from a JSON config file. Absent keys stay empty.
struct FileConfig {
    std::optional<std::uint32_t> threads;
    std::optional<core::QueueMode> queue_mode;
    std::optional<std::uint32_t> fail_threshold;
    std::optional<std::chrono::milliseconds> retry_delay;
    std::optional<std::uint32_t> request_retries;
    std::optional<bool> keep_scratch;
    std::optional<std::string> scratch_dir;
    std::optional<std::string> user_agent;
    std::optional<core::EventLevel> log_level;

    // Overlay the values present onto a download configuration
    void apply(core::DownloadConfig& config) const;
};

// Parse JSON text. Unknown keys are ignored; a wrong type or an unknown
// enum name yields config_error.
[[nodiscard]] std::expected<FileConfig, std::error_code> parse_config(std::string_view json) noexcept;

// Read and parse a config file
[[nodiscard]] std::expected<FileConfig, std::error_code> load_config_file(const std::string& path) noexcept;

} // namespace segflow::cli
