// Copyright (c) 2026 changcheng967. All rights reserved.

#include <segflow/cli/progress_bar.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <ostream>

namespace segflow::cli {

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::ostream& out, std::string_view label)
    : out_(out)
    , label_(label) {}

std::string ProgressBar::render(std::string_view label,
                                std::uint32_t finished,
                                std::uint32_t total) {
    double percent = total == 0
        ? 0.0
        : static_cast<double>(finished) * 100.0 / static_cast<double>(total);
    percent = std::clamp(percent, 0.0, 100.0);

    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < bar_width) {
        bar += '>';
        bar.append(static_cast<std::size_t>(bar_width - filled - 1), ' ');
    }
    bar += ']';

    return fmt::format("|{}| {} {:6.2f}% ({}/{})", label, bar, percent, finished, total);
}

void ProgressBar::update(std::uint32_t finished, std::uint32_t total) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_) return;

    // Outcomes are reported from several threads; never draw backwards
    if (drawn_ && total == total_ && finished <= finished_) return;

    finished_ = std::max(finished, finished_);
    total_ = total;
    drawn_ = true;

    out_ << '\r' << render(label_, finished_, total_) << std::flush;
}

void ProgressBar::finish() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_) return;
    done_ = true;

    if (drawn_) {
        out_ << '\r' << render(label_, finished_, total_) << std::endl;
    }
}

void ProgressBar::clear() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << '\r' << std::string(80, ' ') << '\r' << std::flush;
}

//=============================================================================
// ProgressSink
//=============================================================================

ProgressSink::ProgressSink(core::EventSink& log, ProgressBar* bar) noexcept
    : log_(log)
    , bar_(bar) {}

void ProgressSink::on_event(core::EventLevel level, std::string_view message) {
    log_.on_event(level, message);
}

void ProgressSink::on_progress(std::uint32_t finished, std::uint32_t total) {
    if (bar_) {
        bar_->update(finished, total);
    }
}

} // namespace segflow::cli
