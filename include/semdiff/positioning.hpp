#pragma once

/// @file include/semdiff/positioning.hpp
/// @brief PositioningAnalyzer: statistics for competitive positioning maps.
///
/// # Module: Competitive Positioning Statistics
///
/// ## Responsibility
/// Participants place each competitor on a two-axis plane whose axes both
/// span [-50, 50]. This module summarises, per competitor, where the
/// participants put it: mean and population standard deviation on each
/// axis, plus the raw placements for scatter rendering.
///
/// ## Rules
/// - Only completed sessions contribute placements
/// - The first placement of a competitor in a session is the one used
/// - No rounding is applied; the plane is already in display units
/// - Group partitions count every session (session_count), completed or not,
///   while their statistics use completed sessions only

#include "semdiff/types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace semdiff::positioning {

/// One competitor placement on the plane.
struct PositionRecord {
    std::string  competitor_id;
    double       x = 0.0;  ///< [-50, 50]
    double       y = 0.0;  ///< [-50, 50]
    std::int64_t timestamp_ms = 0;
};

struct PlanePoint {
    double x = 0.0;
    double y = 0.0;
};

/// A participant's set of placements.
struct PositioningSession {
    std::string                 id;
    std::string                 group_id;
    std::string                 group_label;
    SessionStatus               status = SessionStatus::Created;
    std::vector<PositionRecord> positions;

    [[nodiscard]] std::optional<PlanePoint>
    position_of(const std::string& competitor_id) const noexcept;
};

struct CompetitorStatistics {
    std::string             competitor_id;
    double                  mean_x    = 0.0;
    double                  mean_y    = 0.0;
    double                  std_dev_x = 0.0;
    double                  std_dev_y = 0.0;
    std::size_t             count     = 0;
    std::vector<PlanePoint> positions;
};

struct PositioningGroup {
    std::string                       group_id;
    std::string                       group_label;
    std::vector<CompetitorStatistics> competitor_stats;
    std::size_t                       session_count = 0;
};

class PositioningAnalyzer {
public:
    PositioningAnalyzer() = delete;

    /// Display label for sessions without a group label.
    static constexpr const char* UNGROUPED_LABEL = "Ungrouped";

    /// One entry per competitor id, in the order supplied.
    [[nodiscard]] static std::vector<CompetitorStatistics>
    competitor_statistics(std::span<const PositioningSession> sessions,
                          std::span<const std::string>        competitor_ids);

    /// Statistics per group, groups in discovery order.
    [[nodiscard]] static std::vector<PositioningGroup>
    group_statistics(std::span<const PositioningSession> sessions,
                     std::span<const std::string>        competitor_ids);
};

}  // namespace semdiff::positioning
