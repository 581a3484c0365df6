// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <segflow/cli/config_file.hpp>
#include <segflow/core/download_task.hpp>
#include <segflow/core/event_sink.hpp>
#include <segflow/core/segment.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace segflow::cli {

// CLI result: process exit code or the error that ended the run
using CliResult = std::expected<int, std::error_code>;

// Command line arguments. Options left unset fall back to the config
// file, then to the built-in defaults.
struct CliArgs {
    std::string url;
    std::string output_file;
    std::string scratch_dir;
    std::string config_path;
    std::optional<std::uint32_t> threads;
    std::optional<core::SegmentIndex> segments;
    std::optional<core::QueueMode> queue_mode;
    std::optional<core::EventLevel> log_level;
    std::optional<std::chrono::milliseconds> probe_interval;
    bool live{false};
    bool keep_scratch{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;   // First malformed argument, empty when parsing succeeded
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Merge built-in defaults, config file and flags, in that order
[[nodiscard]] core::DownloadConfig build_config(const CliArgs& args, const FileConfig& file);

// Log level in effect: flag, then file, then info (warn when quiet)
[[nodiscard]] core::EventLevel effective_level(const CliArgs& args, const FileConfig& file) noexcept;

// Download one stream
[[nodiscard]] CliResult download(const CliArgs& args) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace segflow::cli
