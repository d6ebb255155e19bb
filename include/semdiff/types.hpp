#pragma once

/// @file include/semdiff/types.hpp
/// @brief Shared domain types for the semdiff response-analysis core.
///
/// Every module includes this file. It defines the scale configuration, the
/// per-participant response records, the derived result types and the
/// Eigen-based aliases used by the clustering engine.

#include <Eigen/Dense>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace semdiff {

// ─── Scale Configuration ──────────────────────────────────────────────────────

/// How a scale item is presented to participants.
enum class ScaleMode {
    Discrete,    ///< Fixed set of selectable points; raw value is an index
    Continuous,  ///< Free slider; raw value is a percentage in [0, 100]
};

/// Numeric parameters shared by normalisation and statistics.
struct ScaleConfig {
    ScaleMode mode   = ScaleMode::Discrete;
    int       points = 7;  ///< Number of discrete positions (ignored when continuous)
};

/// One bipolar measurement dimension, e.g. "Traditional" vs "Innovative".
/// Owned by project configuration; immutable once referenced by responses.
struct ScaleItem {
    std::string                id;
    std::string                low_label;   ///< Pole mapped to negative values
    std::string                high_label;  ///< Pole mapped to positive values
    std::optional<std::string> category;
};

// ─── Sessions ─────────────────────────────────────────────────────────────────

/// One participant's answer to one ScaleItem.
struct ResponseRecord {
    std::string  item_id;
    double       raw_value        = 0.0;    ///< Index (discrete) or percentage (continuous)
    bool         was_flipped      = false;  ///< Poles were swapped when rendered
    double       normalized_value = 0.0;    ///< Signed value in [-50, 50], one decimal
    std::int64_t timestamp_ms     = 0;
};

/// Lifecycle of a participant session.
enum class SessionStatus {
    Created,
    InProgress,
    Completed,
};

/// A participant's full submission set.
struct Session {
    std::string                 id;           ///< Opaque; also the randomisation seed
    std::string                 group_id;     ///< Empty when no explicit group
    std::string                 group_label;
    SessionStatus               status = SessionStatus::Created;
    std::vector<ResponseRecord> responses;

    [[nodiscard]] bool is_completed() const noexcept {
        return status == SessionStatus::Completed;
    }

    /// Normalised value of the first response recorded for `item_id`.
    [[nodiscard]] std::optional<double>
    response_value(const std::string& item_id) const noexcept;
};

/// Parse "created" / "in_progress" / "completed". Returns nullopt otherwise.
[[nodiscard]] std::optional<SessionStatus>
parse_status(const std::string& text) noexcept;

/// Inverse of parse_status.
[[nodiscard]] const char* to_string(SessionStatus status) noexcept;

/// Parse "discrete" / "continuous". Returns nullopt otherwise.
[[nodiscard]] std::optional<ScaleMode>
parse_mode(const std::string& text) noexcept;

[[nodiscard]] const char* to_string(ScaleMode mode) noexcept;

// ─── Derived Results ──────────────────────────────────────────────────────────

/// Descriptive statistics for one scale item over a set of sessions.
struct ItemStatistics {
    std::string item_id;
    std::string low_label;
    std::string high_label;
    double      mean    = 0.0;  ///< One decimal
    double      std_dev = 0.0;  ///< Population std-dev, one decimal
    double      median  = 0.0;
    double      min     = 0.0;
    double      max     = 0.0;
    std::size_t count   = 0;
    std::optional<std::vector<int>> distribution;  ///< Discrete mode only

    /// One-line human-readable summary.
    [[nodiscard]] std::string to_string() const;
};

/// Per-group comparison profile.
struct GroupProfile {
    std::string                 group_id;
    std::string                 group_label;
    std::vector<ItemStatistics> item_stats;      ///< Configuration order
    std::vector<int>            profile_vector;  ///< Radar coordinates in [0, 100]
    std::size_t                 participant_count = 0;
};

/// Dense row-major view of the normalised responses: rows = sessions,
/// columns = scale items.
using ResponseMatrix = Eigen::MatrixXd;

/// A centroid in response space (length = number of scale items).
using Centroid = Eigen::VectorXd;

/// One non-empty cluster produced by a k-means run.
struct ClusterAssignment {
    int                      cluster_id = 0;
    Centroid                 centroid;
    std::vector<std::string> members;  ///< Session ids, input order
    std::size_t              member_count = 0;
};

}  // namespace semdiff
