/// @file src/stakeholder/radial_map.cpp
/// @brief RadialMap: board distance scores, aggregation and dissonance.

#include "semdiff/stakeholder.hpp"
#include "semdiff/constants.hpp"
#include "semdiff/normalizer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <unordered_map>

namespace semdiff::stakeholder {

namespace {

/// Running sums for one target stakeholder.
struct Accumulator {
    double                  x_sum     = 0.0;
    double                  y_sum     = 0.0;
    double                  score_sum = 0.0;
    std::vector<BoardPoint> points;
    std::vector<int>        scores;
};

[[nodiscard]] bool is_configured(std::span<const std::string> ids,
                                 const std::string&           id) noexcept {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

}  // namespace

// ─── Scores ───────────────────────────────────────────────────────────────────

std::optional<int>
RadialMap::normalize_distance(const std::optional<BoardPoint>& position) noexcept {
    if (!position) {
        return std::nullopt;
    }
    const double dx   = position->x - constants::BOARD_CENTER;
    const double dy   = position->y - constants::BOARD_CENTER;
    const double dist = std::sqrt(dx * dx + dy * dy);
    const double norm = std::clamp(dist / constants::PLAYABLE_RADIUS, 0.0, 1.0);
    return static_cast<int>(std::lround(norm * 100.0));
}

int RadialMap::impact_score(std::optional<int> distance) noexcept {
    if (!distance) {
        return 0;
    }
    return 100 - *distance;
}

// ─── projected_mean ───────────────────────────────────────────────────────────

BoardPoint RadialMap::projected_mean(double      x_sum,
                                     double      y_sum,
                                     double      score_sum,
                                     std::size_t count) noexcept {
    const double n             = static_cast<double>(count);
    const double target_radius = (score_sum / n / 100.0) * constants::PLAYABLE_RADIUS;

    const double vx = x_sum / n - constants::BOARD_CENTER;
    const double vy = y_sum / n - constants::BOARD_CENTER;
    const double centroid_dist = std::sqrt(vx * vx + vy * vy);

    if (centroid_dist < constants::MIN_PROJECTION_DISTANCE) {
        // Opposing placements cancelled out; there is no direction left.
        return BoardPoint{.x = constants::BOARD_CENTER,
                          .y = constants::BOARD_CENTER - target_radius};
    }
    const double scale = target_radius / centroid_dist;
    return BoardPoint{.x = constants::BOARD_CENTER + vx * scale,
                      .y = constants::BOARD_CENTER + vy * scale};
}

// ─── aggregate ────────────────────────────────────────────────────────────────

std::vector<AggregatedPoint>
RadialMap::aggregate(std::span<const InterviewSession> sessions,
                     std::span<const std::string>      stakeholder_ids,
                     MapKind                           kind) {
    std::unordered_map<std::string, Accumulator> acc;
    for (const auto& id : stakeholder_ids) {
        acc.try_emplace(id);
    }

    for (const auto& session : sessions) {
        if (session.status != SessionStatus::Completed) continue;
        for (const auto& placement : session.placements(kind)) {
            if (!placement.position) continue;
            auto it = acc.find(placement.stakeholder_id);
            if (it == acc.end()) continue;

            const int score = normalize_distance(placement.position).value_or(0);
            auto& a = it->second;
            a.x_sum     += placement.position->x;
            a.y_sum     += placement.position->y;
            a.score_sum += score;
            a.points.push_back(*placement.position);
            a.scores.push_back(score);
        }
    }

    std::vector<AggregatedPoint> out;
    for (const auto& id : stakeholder_ids) {
        const auto& a = acc.at(id);
        const std::size_t n = a.points.size();
        if (n == 0) continue;
        // Duplicate configured ids would otherwise be emitted twice.
        if (std::any_of(out.begin(), out.end(),
                        [&id](const AggregatedPoint& p) { return p.stakeholder_id == id; })) {
            continue;
        }

        const int mean_dist = static_cast<int>(std::lround(a.score_sum / static_cast<double>(n)));

        double variance = 0.0;
        for (int s : a.scores) {
            const double d = static_cast<double>(s - mean_dist);
            variance += d * d;
        }
        variance /= static_cast<double>(n);

        out.push_back(AggregatedPoint{
            .stakeholder_id = id,
            .mean           = projected_mean(a.x_sum, a.y_sum, a.score_sum, n),
            .points         = a.points,
            .mean_score     = kind == MapKind::Centrality ? 100 - mean_dist : mean_dist,
            .std_dev        = ResponseNormalizer::round_one_decimal(std::sqrt(variance)),
            .count          = n,
        });
    }
    return out;
}

std::vector<AggregatedPoint>
RadialMap::aggregate_for_respondent(std::span<const InterviewSession> sessions,
                                    std::span<const std::string>      stakeholder_ids,
                                    const std::string&                respondent_id,
                                    MapKind                           kind) {
    std::vector<InterviewSession> own;
    for (const auto& s : sessions) {
        if (s.respondent_id == respondent_id) {
            own.push_back(s);
        }
    }
    return aggregate(own, stakeholder_ids, kind);
}

// ─── relational_dissonance ────────────────────────────────────────────────────

std::vector<DissonancePair>
RadialMap::relational_dissonance(std::span<const InterviewSession> sessions,
                                 std::span<const std::string>      stakeholder_ids) {
    struct Cell {
        double      sum   = 0.0;
        std::size_t count = 0;
    };
    // Keyed by respondent then target.
    std::unordered_map<std::string, std::unordered_map<std::string, Cell>> matrix;

    for (const auto& session : sessions) {
        if (session.status != SessionStatus::Completed) continue;
        const auto& respondent = session.respondent_id;
        if (!is_configured(stakeholder_ids, respondent)) continue;

        for (const auto& placement : session.relationship_map) {
            if (!placement.position) continue;
            if (placement.stakeholder_id == respondent) continue;
            if (!is_configured(stakeholder_ids, placement.stakeholder_id)) continue;

            auto& cell = matrix[respondent][placement.stakeholder_id];
            cell.sum += normalize_distance(placement.position).value_or(0);
            ++cell.count;
        }
    }

    const auto mean_score = [&matrix](const std::string& from, const std::string& to) {
        const auto row = matrix.find(from);
        if (row == matrix.end()) return 0;
        const auto cell = row->second.find(to);
        if (cell == row->second.end() || cell->second.count == 0) return 0;
        return static_cast<int>(
            std::lround(cell->second.sum / static_cast<double>(cell->second.count)));
    };

    std::vector<DissonancePair> pairs;
    for (std::size_t i = 0; i < stakeholder_ids.size(); ++i) {
        for (std::size_t j = i + 1; j < stakeholder_ids.size(); ++j) {
            const auto& a = stakeholder_ids[i];
            const auto& b = stakeholder_ids[j];
            const int a_to_b = mean_score(a, b);
            const int b_to_a = mean_score(b, a);
            if (a_to_b > 0 || b_to_a > 0) {
                pairs.push_back(DissonancePair{
                    .a      = a,
                    .b      = b,
                    .gap    = std::abs(a_to_b - b_to_a),
                    .a_to_b = a_to_b,
                    .b_to_a = b_to_a,
                });
            }
        }
    }

    std::stable_sort(pairs.begin(), pairs.end(),
                     [](const DissonancePair& x, const DissonancePair& y) {
                         return x.gap > y.gap;
                     });
    return pairs;
}

}  // namespace semdiff::stakeholder
