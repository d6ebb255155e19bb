/// @file src/core/types.cpp
/// @brief Out-of-line helpers for the shared domain types.

#include "semdiff/types.hpp"

#include <fmt/format.h>

namespace semdiff {

std::optional<double>
Session::response_value(const std::string& item_id) const noexcept {
    for (const auto& r : responses) {
        if (r.item_id == item_id) {
            return r.normalized_value;
        }
    }
    return std::nullopt;
}

std::optional<SessionStatus> parse_status(const std::string& text) noexcept {
    if (text == "created")     return SessionStatus::Created;
    if (text == "in_progress") return SessionStatus::InProgress;
    if (text == "completed")   return SessionStatus::Completed;
    return std::nullopt;
}

const char* to_string(SessionStatus status) noexcept {
    switch (status) {
        case SessionStatus::Created:    return "created";
        case SessionStatus::InProgress: return "in_progress";
        case SessionStatus::Completed:  return "completed";
    }
    return "unknown";
}

std::optional<ScaleMode> parse_mode(const std::string& text) noexcept {
    if (text == "discrete")   return ScaleMode::Discrete;
    if (text == "continuous") return ScaleMode::Continuous;
    return std::nullopt;
}

const char* to_string(ScaleMode mode) noexcept {
    switch (mode) {
        case ScaleMode::Discrete:   return "discrete";
        case ScaleMode::Continuous: return "continuous";
    }
    return "unknown";
}

std::string ItemStatistics::to_string() const {
    std::string line = fmt::format(
        "{:<12} {} <-> {}  n={}  mean={:+.1f}  sd={:.1f}  median={:+.1f}  range=[{:+.1f}, {:+.1f}]",
        item_id, low_label, high_label, count, mean, std_dev, median, min, max);
    if (distribution) {
        line += "  dist=[";
        for (std::size_t i = 0; i < distribution->size(); ++i) {
            line += fmt::format("{}{}", i == 0 ? "" : " ", (*distribution)[i]);
        }
        line += "]";
    }
    return line;
}

}  // namespace semdiff
