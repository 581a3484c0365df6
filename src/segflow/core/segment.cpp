// Copyright (c) 2026 changcheng967. All rights reserved.

#include <segflow/core/segment.hpp>

namespace segflow::core {

std::string_view to_string(QueueMode mode) noexcept {
    switch (mode) {
        case QueueMode::automatic:    return "auto";
        case QueueMode::sequential:   return "sequential";
        case QueueMode::out_of_order: return "out_of_order";
    }
    return "unknown";
}

std::optional<QueueMode> parse_queue_mode(std::string_view name) noexcept {
    if (name == "auto" || name == "automatic") return QueueMode::automatic;
    if (name == "sequential" || name == "seq") return QueueMode::sequential;
    if (name == "out_of_order" || name == "out-of-order" || name == "ooo") return QueueMode::out_of_order;
    return std::nullopt;
}

std::string_view to_string(SegmentState state) noexcept {
    switch (state) {
        case SegmentState::pending:   return "pending";
        case SegmentState::in_flight: return "in_flight";
        case SegmentState::succeeded: return "succeeded";
        case SegmentState::failed:    return "failed";
    }
    return "unknown";
}

} // namespace segflow::core
