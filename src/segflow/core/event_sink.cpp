// Copyright (c) 2026 changcheng967. All rights reserved.

#include <segflow/core/event_sink.hpp>
#include <segflow/core/error.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <cctype>
#include <string>

namespace segflow::core {

std::string_view to_string(EventLevel level) noexcept {
    switch (level) {
        case EventLevel::debug: return "debug";
        case EventLevel::info:  return "info";
        case EventLevel::warn:  return "warn";
        case EventLevel::error: return "error";
    }
    return "unknown";
}

std::expected<EventLevel, std::error_code> parse_level(std::string_view name) noexcept {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "debug") return EventLevel::debug;
    if (lower == "info") return EventLevel::info;
    if (lower == "warn" || lower == "warning") return EventLevel::warn;
    if (lower == "error") return EventLevel::error;
    return std::unexpected(make_error_code(DownloadErrc::config_error));
}

//=============================================================================
// EventSink defaults: render typed events as text
//=============================================================================

void EventSink::on_segment_started(std::uint32_t worker, SegmentIndex index, std::uint32_t attempt) {
    on_event(EventLevel::debug, fmt::format("[worker {}] Current segment: {} (attempt {})",
                                            worker, index, attempt + 1));
}

void EventSink::on_segment_finished(std::uint32_t worker, SegmentIndex index) {
    on_event(EventLevel::debug, fmt::format("[worker {}] Downloaded segment {}", worker, index));
}

void EventSink::on_segment_retry(std::uint32_t worker, SegmentIndex index,
                                 std::uint32_t attempts, std::error_code ec) {
    on_event(EventLevel::debug, fmt::format("[worker {}] Failed segment {} [{}]: {}",
                                            worker, index, attempts, ec.message()));
}

void EventSink::on_segment_abandoned(std::uint32_t worker, SegmentIndex index) {
    on_event(EventLevel::warn, fmt::format("[worker {}] Giving up segment {}", worker, index));
}

void EventSink::on_probe(SegmentIndex index, std::int32_t status, std::error_code ec) {
    if (ec) {
        on_event(EventLevel::debug, fmt::format("Stream probe after segment {} failed: {}",
                                                index, ec.message()));
    } else {
        on_event(EventLevel::debug, fmt::format("Stream probe after segment {} returned {}",
                                                index, status));
    }
}

void EventSink::on_segment_merged(SegmentIndex index, bool lost) {
    if (lost) {
        on_event(EventLevel::warn, fmt::format("Segment {} lost, skipped in output", index));
    }
}

//=============================================================================
// LogEventSink
//=============================================================================

LogEventSink::LogEventSink(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

void LogEventSink::on_event(EventLevel level, std::string_view message) {
    if (!logger_) return;

    switch (level) {
        case EventLevel::debug: logger_->debug(message); break;
        case EventLevel::info:  logger_->info(message); break;
        case EventLevel::warn:  logger_->warn(message); break;
        case EventLevel::error: logger_->error(message); break;
    }
}

void LogEventSink::on_progress(std::uint32_t finished, std::uint32_t total) {
    if (!logger_ || total == 0) return;

    double percent = static_cast<double>(finished) * 100.0 / static_cast<double>(total);
    logger_->info("|segments| {:.2f}% ({}/{})", percent, finished, total);
}

} // namespace segflow::core
