/// @file src/aggregation/group_aggregator.cpp
/// @brief GroupAggregator: partition completed sessions, profile each group.

#include "semdiff/aggregation.hpp"
#include "semdiff/constants.hpp"
#include "semdiff/normalizer.hpp"
#include "semdiff/statistics.hpp"

#include <unordered_map>
#include <utility>

namespace semdiff {

std::string GroupAggregator::group_key(const Session& session) {
    if (session.group_id.empty()) {
        return std::string(constants::UNGROUPED_KEY);
    }
    return session.group_id;
}

std::vector<GroupProfile>
GroupAggregator::compare_groups(std::span<const Session>   sessions,
                                std::span<const ScaleItem> items,
                                const ScaleConfig&         scale) {
    ResponseNormalizer::require_valid_points(scale.points);

    // Partition in discovery order: `order` remembers first sighting,
    // `members` holds copies so each partition is a contiguous span.
    std::vector<std::string>                             order;
    std::unordered_map<std::string, std::vector<Session>> members;
    std::unordered_map<std::string, std::string>          labels;

    for (const auto& s : sessions) {
        if (!s.is_completed()) continue;

        const std::string key = group_key(s);
        auto [it, inserted] = members.try_emplace(key);
        if (inserted) {
            order.push_back(key);
            // The first session of a group names it.
            labels.emplace(key, s.group_label.empty() ? key : s.group_label);
        }
        it->second.push_back(s);
    }

    std::vector<GroupProfile> profiles;
    profiles.reserve(order.size());

    for (const auto& key : order) {
        const auto& group_sessions = members.at(key);

        GroupProfile profile;
        profile.group_id = key;
        profile.group_label = labels.at(key);

        profile.item_stats.reserve(items.size());
        for (const auto& item : items) {
            profile.item_stats.push_back(
                StatisticsCalculator::for_item(group_sessions, item, scale));
        }
        profile.profile_vector =
            StatisticsCalculator::profile_vector(group_sessions, items, scale);

        profile.participant_count = group_sessions.size();

        profiles.push_back(std::move(profile));
    }
    return profiles;
}

}  // namespace semdiff
