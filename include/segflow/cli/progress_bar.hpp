// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <segflow/core/event_sink.hpp>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>

namespace segflow::cli {

// Segment progress line: "|label| [====>   ]  42.00% (21/50)"
class ProgressBar {
public:
    ProgressBar(std::ostream& out, std::string_view label = "segments");

    // Redraw with the new counts. Safe to call from several threads.
    void update(std::uint32_t finished, std::uint32_t total) noexcept;

    // Draw the last state and end the line
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] const std::string& label() const noexcept { return label_; }

    // Line text without the leading carriage return
    [[nodiscard]] static std::string render(std::string_view label,
                                            std::uint32_t finished,
                                            std::uint32_t total);

private:
    std::ostream& out_;
    std::string label_;
    std::uint32_t finished_{0};
    std::uint32_t total_{0};
    bool drawn_{false};
    bool done_{false};
    std::mutex mutex_;
};

// Event sink for the CLI: messages go to the log, counts to the bar
class ProgressSink final : public core::EventSink {
public:
    ProgressSink(core::EventSink& log, ProgressBar* bar) noexcept;

    void on_event(core::EventLevel level, std::string_view message) override;
    void on_progress(std::uint32_t finished, std::uint32_t total) override;

private:
    core::EventSink& log_;
    ProgressBar* bar_;
};

} // namespace segflow::cli
