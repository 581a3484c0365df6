// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <segflow/core/segment.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <string_view>
#include <system_error>

namespace spdlog {
class logger;
}

namespace segflow::core {

enum class EventLevel : std::uint8_t {
    debug,
    info,
    warn,
    error
};

[[nodiscard]] std::string_view to_string(EventLevel level) noexcept;
[[nodiscard]] std::expected<EventLevel, std::error_code> parse_level(std::string_view name) noexcept;

// Receiver for everything the downloader reports.
// Called concurrently from worker threads and the merge thread.
class EventSink {
public:
    virtual ~EventSink() = default;

    // Free-form, level-tagged message
    virtual void on_event(EventLevel level, std::string_view message) = 0;

    // After every recorded outcome
    virtual void on_progress(std::uint32_t finished, std::uint32_t total) = 0;

    virtual void on_segment_started(std::uint32_t worker, SegmentIndex index, std::uint32_t attempt);
    virtual void on_segment_finished(std::uint32_t worker, SegmentIndex index);
    virtual void on_segment_retry(std::uint32_t worker, SegmentIndex index,
                                  std::uint32_t attempts, std::error_code ec);
    virtual void on_segment_abandoned(std::uint32_t worker, SegmentIndex index);

    // Result of the base-URL probe issued after a non-2xx segment response.
    // status is 0 when the probe itself hit a transport error.
    virtual void on_probe(SegmentIndex index, std::int32_t status, std::error_code ec);

    virtual void on_segment_merged(SegmentIndex index, bool lost);
};

// Discards everything
class NullEventSink final : public EventSink {
public:
    void on_event(EventLevel, std::string_view) override {}
    void on_progress(std::uint32_t, std::uint32_t) override {}
};

// Forwards events to a spdlog logger
class LogEventSink : public EventSink {
public:
    explicit LogEventSink(std::shared_ptr<spdlog::logger> logger);

    void on_event(EventLevel level, std::string_view message) override;
    void on_progress(std::uint32_t finished, std::uint32_t total) override;

    [[nodiscard]] const std::shared_ptr<spdlog::logger>& logger() const noexcept { return logger_; }

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace segflow::core
