#pragma once

/// @file include/semdiff/engine.hpp
/// @brief AnalysisEngine: configured entry point to the semdiff core.
///
/// # Module: Analysis Engine
///
/// ## Responsibility
/// Bind one project's configuration (scale items, scale mode and points,
/// randomisation, clustering parameters) to the stateless modules:
///   session id → SessionRandomizer → flip pattern
///   raw answer + flip → ResponseNormalizer → ResponseRecord
///   sessions → StatisticsCalculator / GroupAggregator / KMeansClusterer
///
/// ## Usage
/// ```cpp
/// EngineConfig cfg;
/// cfg.items = load_items();
/// cfg.randomize = true;
///
/// AnalysisEngine engine(cfg);
/// auto report = engine.analyze(sessions);
/// fmt::print("{}\n", report.to_string());
/// ```
///
/// ## Guarantees
/// - The constructor validates the configuration and throws
///   InvalidConfiguration on violation; a constructed engine never throws
///   for configuration reasons afterwards
/// - All queries are const; each cluster() call builds its own generator

#include "semdiff/constants.hpp"
#include "semdiff/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace semdiff::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

struct EngineConfig {
    /// Ordered scale items. Order drives flip draws and statistics order.
    std::vector<ScaleItem> items;

    ScaleConfig scale{ScaleMode::Discrete, constants::DEFAULT_SCALE_POINTS};

    /// Swap item poles per participant to counteract primacy bias.
    bool randomize = false;

    int cluster_count  = constants::DEFAULT_CLUSTER_COUNT;
    int max_iterations = constants::DEFAULT_MAX_ITERATIONS;

    /// Fixed seed for centroid initialisation; unset means non-deterministic.
    std::optional<std::uint64_t> cluster_seed;

    /// If true, emit per-step debug output to stderr.
    bool verbose = false;

    /// Throws InvalidConfiguration on the first violated constraint.
    void validate() const;

    /// Item ids in configuration order.
    [[nodiscard]] std::vector<std::string> item_ids() const;
};

// ─── AnalysisReport ───────────────────────────────────────────────────────────

struct AnalysisReport {
    std::vector<ItemStatistics>    item_stats;
    std::vector<GroupProfile>      groups;
    std::vector<ClusterAssignment> clusters;
    std::size_t                    completed_sessions = 0;

    /// Multi-line, human-readable rendering.
    [[nodiscard]] std::string to_string() const;
};

// ─── AnalysisEngine ───────────────────────────────────────────────────────────

class AnalysisEngine {
public:
    explicit AnalysisEngine(EngineConfig config);

    /// Flip flag per configured item for this session.
    [[nodiscard]] std::map<std::string, bool>
    flip_pattern(const std::string& session_id) const;

    /// Normalise a raw answer, applying this session's flip for the item.
    /// Items not in the configuration are recorded unflipped.
    [[nodiscard]] ResponseRecord record_response(const std::string& session_id,
                                                 const std::string& item_id,
                                                 double             raw_value,
                                                 std::int64_t       timestamp_ms) const;

    /// Normalise a raw answer whose flip flag was recorded at render time.
    [[nodiscard]] ResponseRecord record_response(const std::string& item_id,
                                                 double             raw_value,
                                                 bool               was_flipped,
                                                 std::int64_t       timestamp_ms) const;

    [[nodiscard]] std::vector<ItemStatistics>
    item_statistics(std::span<const Session> sessions) const;

    [[nodiscard]] std::vector<GroupProfile>
    compare_groups(std::span<const Session> sessions) const;

    [[nodiscard]] std::vector<ClusterAssignment>
    cluster(std::span<const Session> sessions) const;

    /// Item statistics, group profiles and clusters in one pass.
    [[nodiscard]] AnalysisReport analyze(std::span<const Session> sessions) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    EngineConfig config_;
};

}  // namespace semdiff::core
