/// @file src/positioning/position_statistics.cpp
/// @brief PositioningAnalyzer: per-competitor plane statistics and groups.

#include "semdiff/positioning.hpp"
#include "semdiff/constants.hpp"

#include <cmath>
#include <unordered_map>
#include <utility>

namespace semdiff::positioning {

std::optional<PlanePoint>
PositioningSession::position_of(const std::string& competitor_id) const noexcept {
    for (const auto& p : positions) {
        if (p.competitor_id == competitor_id) {
            return PlanePoint{.x = p.x, .y = p.y};
        }
    }
    return std::nullopt;
}

// ─── competitor_statistics ────────────────────────────────────────────────────

std::vector<CompetitorStatistics>
PositioningAnalyzer::competitor_statistics(std::span<const PositioningSession> sessions,
                                           std::span<const std::string>        competitor_ids) {
    std::vector<CompetitorStatistics> out;
    out.reserve(competitor_ids.size());

    for (const auto& competitor_id : competitor_ids) {
        CompetitorStatistics stats;
        stats.competitor_id = competitor_id;

        for (const auto& session : sessions) {
            if (session.status != SessionStatus::Completed) continue;
            if (auto p = session.position_of(competitor_id)) {
                stats.positions.push_back(*p);
            }
        }

        const std::size_t n = stats.positions.size();
        if (n > 0) {
            double sum_x = 0.0;
            double sum_y = 0.0;
            for (const auto& p : stats.positions) {
                sum_x += p.x;
                sum_y += p.y;
            }
            stats.mean_x = sum_x / static_cast<double>(n);
            stats.mean_y = sum_y / static_cast<double>(n);

            double sq_x = 0.0;
            double sq_y = 0.0;
            for (const auto& p : stats.positions) {
                sq_x += (p.x - stats.mean_x) * (p.x - stats.mean_x);
                sq_y += (p.y - stats.mean_y) * (p.y - stats.mean_y);
            }
            stats.std_dev_x = std::sqrt(sq_x / static_cast<double>(n));
            stats.std_dev_y = std::sqrt(sq_y / static_cast<double>(n));
            stats.count     = n;
        }
        out.push_back(std::move(stats));
    }
    return out;
}

// ─── group_statistics ─────────────────────────────────────────────────────────

std::vector<PositioningGroup>
PositioningAnalyzer::group_statistics(std::span<const PositioningSession> sessions,
                                      std::span<const std::string>        competitor_ids) {
    std::vector<std::string>                                         order;
    std::unordered_map<std::string, std::vector<PositioningSession>> members;
    std::unordered_map<std::string, std::string>                     labels;

    for (const auto& s : sessions) {
        const std::string key = s.group_id.empty()
                                    ? std::string(constants::UNGROUPED_KEY)
                                    : s.group_id;
        auto [it, inserted] = members.try_emplace(key);
        if (inserted) {
            order.push_back(key);
            // The first session of a group names it.
            labels.emplace(key, s.group_label.empty() ? std::string(UNGROUPED_LABEL)
                                                      : s.group_label);
        }
        it->second.push_back(s);
    }

    std::vector<PositioningGroup> groups;
    groups.reserve(order.size());
    for (const auto& key : order) {
        const auto& group_sessions = members.at(key);
        groups.push_back(PositioningGroup{
            .group_id         = key,
            .group_label      = labels.at(key),
            .competitor_stats = competitor_statistics(group_sessions, competitor_ids),
            .session_count    = group_sessions.size(),
        });
    }
    return groups;
}

}  // namespace semdiff::positioning
