/// @file src/core/engine.cpp
/// @brief AnalysisEngine: binds a project configuration to the core modules.

#include "semdiff/engine.hpp"
#include "semdiff/aggregation.hpp"
#include "semdiff/clustering.hpp"
#include "semdiff/errors.hpp"
#include "semdiff/normalizer.hpp"
#include "semdiff/randomizer.hpp"
#include "semdiff/statistics.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace semdiff::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

void EngineConfig::validate() const {
    ResponseNormalizer::require_valid_points(scale.points);

    if (cluster_count <= 0) {
        throw InvalidConfiguration(
            fmt::format("cluster_count must be positive, got {}", cluster_count));
    }
    if (max_iterations <= 0) {
        throw InvalidConfiguration(
            fmt::format("max_iterations must be positive, got {}", max_iterations));
    }

    std::unordered_set<std::string> seen;
    for (const auto& item : items) {
        if (item.id.empty()) {
            throw InvalidConfiguration("scale item with empty id");
        }
        if (!seen.insert(item.id).second) {
            throw InvalidConfiguration(fmt::format("duplicate scale item id '{}'", item.id));
        }
    }
}

std::vector<std::string> EngineConfig::item_ids() const {
    std::vector<std::string> ids;
    ids.reserve(items.size());
    for (const auto& item : items) {
        ids.push_back(item.id);
    }
    return ids;
}

// ─── AnalysisReport::to_string ───────────────────────────────────────────────

std::string AnalysisReport::to_string() const {
    std::string out = fmt::format("=== semdiff analysis: {} completed sessions ===\n",
                                  completed_sessions);

    out += "\n-- Items --\n";
    for (const auto& s : item_stats) {
        out += s.to_string();
        out += '\n';
    }

    out += "\n-- Groups --\n";
    for (const auto& g : groups) {
        out += fmt::format("{} ({}) participants={}  profile=[",
                           g.group_label.empty() ? g.group_id : g.group_label,
                           g.group_id, g.participant_count);
        for (std::size_t i = 0; i < g.profile_vector.size(); ++i) {
            out += fmt::format("{}{}", i == 0 ? "" : " ", g.profile_vector[i]);
        }
        out += "]\n";
    }

    out += "\n-- Clusters --\n";
    if (clusters.empty()) {
        out += "(not enough completed sessions)\n";
    }
    for (const auto& c : clusters) {
        out += fmt::format("cluster {}  members={}  centroid=[", c.cluster_id, c.member_count);
        for (Eigen::Index i = 0; i < c.centroid.size(); ++i) {
            out += fmt::format("{}{:+.1f}", i == 0 ? "" : " ", c.centroid[i]);
        }
        out += "]\n";
    }
    return out;
}

// ─── AnalysisEngine ───────────────────────────────────────────────────────────

AnalysisEngine::AnalysisEngine(EngineConfig config)
    : config_(std::move(config))
{
    config_.validate();
    if (config_.verbose) {
        fmt::print(stderr, "[semdiff] engine: {} items, {} mode, {} points, randomize={}\n",
                   config_.items.size(), semdiff::to_string(config_.scale.mode),
                   config_.scale.points, config_.randomize);
    }
}

std::map<std::string, bool>
AnalysisEngine::flip_pattern(const std::string& session_id) const {
    const auto ids = config_.item_ids();
    return randomizer::SessionRandomizer::flip_pattern(session_id, ids, config_.randomize);
}

ResponseRecord AnalysisEngine::record_response(const std::string& session_id,
                                               const std::string& item_id,
                                               double             raw_value,
                                               std::int64_t       timestamp_ms) const {
    const auto pattern = flip_pattern(session_id);
    const auto it      = pattern.find(item_id);
    const bool flipped = it != pattern.end() && it->second;
    return record_response(item_id, raw_value, flipped, timestamp_ms);
}

ResponseRecord AnalysisEngine::record_response(const std::string& item_id,
                                               double             raw_value,
                                               bool               was_flipped,
                                               std::int64_t       timestamp_ms) const {
    return ResponseNormalizer::make_record(item_id, raw_value, was_flipped,
                                           config_.scale, timestamp_ms);
}

std::vector<ItemStatistics>
AnalysisEngine::item_statistics(std::span<const Session> sessions) const {
    std::vector<ItemStatistics> out;
    out.reserve(config_.items.size());
    for (const auto& item : config_.items) {
        out.push_back(StatisticsCalculator::for_item(sessions, item, config_.scale));
    }
    return out;
}

std::vector<GroupProfile>
AnalysisEngine::compare_groups(std::span<const Session> sessions) const {
    return GroupAggregator::compare_groups(sessions, config_.items, config_.scale);
}

std::vector<ClusterAssignment>
AnalysisEngine::cluster(std::span<const Session> sessions) const {
    if (config_.cluster_seed) {
        ClusterRng rng(*config_.cluster_seed);
        return KMeansClusterer::cluster(sessions, config_.items, config_.cluster_count,
                                        config_.max_iterations, rng);
    }
    return KMeansClusterer::cluster(sessions, config_.items, config_.cluster_count,
                                    config_.max_iterations);
}

AnalysisReport AnalysisEngine::analyze(std::span<const Session> sessions) const {
    AnalysisReport report;
    report.completed_sessions = static_cast<std::size_t>(
        std::count_if(sessions.begin(), sessions.end(),
                      [](const Session& s) { return s.is_completed(); }));

    if (config_.verbose) {
        fmt::print(stderr, "[semdiff] analyze: {} sessions, {} completed\n",
                   sessions.size(), report.completed_sessions);
    }

    report.item_stats = item_statistics(sessions);
    report.groups     = compare_groups(sessions);
    report.clusters   = cluster(sessions);

    if (config_.verbose) {
        fmt::print(stderr, "[semdiff] analyze: {} groups, {} clusters\n",
                   report.groups.size(), report.clusters.size());
    }
    return report;
}

}  // namespace semdiff::core
