#pragma once

/// @file include/semdiff/stakeholder.hpp
/// @brief RadialMap: distance scoring on the stakeholder mapping board.
///
/// # Module: Stakeholder Radial Map
///
/// ## Responsibility
/// Each respondent (itself a stakeholder) places tokens for every
/// stakeholder on a square board, once on a relationship map (how close do
/// you work with them) and once on a centrality map (how much impact do they
/// have). Distance from the board centre carries the meaning; this module
/// turns pixel positions into 0–100 scores and aggregates them.
///
/// ## Formula
/// ```
/// d     = |p - centre| / PLAYABLE_RADIUS, clamped to [0, 1]
/// score = round(d * 100)                        0 = centre, 100 = edge
/// impact = 100 - score
/// ```
///
/// ## Aggregation
/// Per target with at least one placement:
///   - mean_score = round(mean score); the centrality map reports 100 - it
///   - std_dev    = population std-dev of scores around the rounded mean,
///                  one decimal
///   - mean       = centroid direction rescaled to the mean score radius, so
///                  the marker sits on the averaged ring rather than being
///                  pulled inward by opposing placements. A centroid within
///                  MIN_PROJECTION_DISTANCE of the centre projects straight up.
///
/// ## Dissonance
/// For every unordered stakeholder pair (A, B) the mean relationship score
/// A gave B is compared with the one B gave A. Pairs where either side is
/// positive are reported, sorted by gap descending.

#include "semdiff/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace semdiff::stakeholder {

/// Board position in pixels, origin top-left.
struct BoardPoint {
    double x = 0.0;
    double y = 0.0;
};

/// A token for one stakeholder; position is empty until placed.
struct Placement {
    std::string               stakeholder_id;
    std::optional<BoardPoint> position;
};

enum class MapKind {
    Relationship,
    Centrality,
};

/// One respondent's interview.
struct InterviewSession {
    std::string            id;
    std::string            respondent_id;  ///< Stakeholder the respondent speaks for
    SessionStatus          status = SessionStatus::Created;
    std::vector<Placement> relationship_map;
    std::vector<Placement> centrality_map;

    [[nodiscard]] const std::vector<Placement>& placements(MapKind kind) const noexcept {
        return kind == MapKind::Relationship ? relationship_map : centrality_map;
    }
};

struct AggregatedPoint {
    std::string             stakeholder_id;
    BoardPoint              mean;
    std::vector<BoardPoint> points;
    int                     mean_score = 0;
    double                  std_dev    = 0.0;
    std::size_t             count      = 0;
};

struct DissonancePair {
    std::string a;
    std::string b;
    int         gap    = 0;
    int         a_to_b = 0;
    int         b_to_a = 0;
};

class RadialMap {
public:
    RadialMap() = delete;

    /// Normalised distance from the centre in [0, 100], or nullopt if unplaced.
    [[nodiscard]] static std::optional<int>
    normalize_distance(const std::optional<BoardPoint>& position) noexcept;

    /// 100 - distance, or 0 when there is no distance.
    [[nodiscard]] static int impact_score(std::optional<int> distance) noexcept;

    /// Aggregate placements of every configured stakeholder across sessions.
    /// Stakeholders without placements are omitted; order follows
    /// `stakeholder_ids`. Placements of unknown ids are ignored.
    [[nodiscard]] static std::vector<AggregatedPoint>
    aggregate(std::span<const InterviewSession> sessions,
              std::span<const std::string>      stakeholder_ids,
              MapKind                           kind);

    /// As aggregate(), restricted to the sessions of one respondent.
    [[nodiscard]] static std::vector<AggregatedPoint>
    aggregate_for_respondent(std::span<const InterviewSession> sessions,
                             std::span<const std::string>      stakeholder_ids,
                             const std::string&                respondent_id,
                             MapKind                           kind);

    /// Asymmetries between how pairs of stakeholders rate their relationship.
    [[nodiscard]] static std::vector<DissonancePair>
    relational_dissonance(std::span<const InterviewSession> sessions,
                          std::span<const std::string>      stakeholder_ids);

private:
    [[nodiscard]] static BoardPoint projected_mean(double x_sum,
                                                   double y_sum,
                                                   double score_sum,
                                                   std::size_t count) noexcept;
};

}  // namespace semdiff::stakeholder
