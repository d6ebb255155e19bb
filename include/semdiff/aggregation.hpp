#pragma once

/// @file include/semdiff/aggregation.hpp
/// @brief GroupAggregator: per-group comparison profiles.
///
/// # Module: Group Aggregator
///
/// ## Responsibility
/// Partition completed sessions by their externally assigned group key and
/// run the StatisticsCalculator for every scale item inside each partition,
/// producing side-by-side comparable GroupProfiles.
///
/// ## Rules
/// - Incomplete sessions are ignored before partitioning
/// - An empty group id falls into the "ungrouped" bucket
/// - The label is the group_label of the first completed session in the
///   partition, else the key itself when that label is empty
/// - Groups are returned in discovery order, not sorted
/// - Sum of participant_count over all groups == number of completed sessions

#include "semdiff/types.hpp"

#include <span>
#include <string>
#include <vector>

namespace semdiff {

class GroupAggregator {
public:
    GroupAggregator() = delete;

    [[nodiscard]] static std::vector<GroupProfile>
    compare_groups(std::span<const Session>   sessions,
                   std::span<const ScaleItem> items,
                   const ScaleConfig&         scale);

    /// Partition key of a session: its group_id, or "ungrouped".
    [[nodiscard]] static std::string group_key(const Session& session);
};

}  // namespace semdiff
