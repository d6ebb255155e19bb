#pragma once

#include <cstdint>
#include <string_view>

/// @file include/semdiff/constants.hpp
/// @brief Numeric constants and configuration defaults for semdiff.

namespace semdiff::constants {

// ─── Normalised Scale ─────────────────────────────────────────────────────────

/// Half-width of the normalised scale. Values live in [-50, +50].
static constexpr double NORMALIZED_HALF_RANGE = 50.0;

/// Continuous-mode percentage that maps to the neutral point.
static constexpr double CONTINUOUS_MIDPOINT = 50.0;

/// Results are rounded to one decimal place (value * 10, round, / 10).
static constexpr double ROUNDING_SCALE = 10.0;

// ─── Defaults ─────────────────────────────────────────────────────────────────

static constexpr int DEFAULT_SCALE_POINTS = 7;

static constexpr int DEFAULT_CLUSTER_COUNT = 3;

static constexpr int DEFAULT_MAX_ITERATIONS = 100;

/// Group key for sessions that carry no explicit group.
static constexpr std::string_view UNGROUPED_KEY = "ungrouped";

// ─── Session Randomizer ───────────────────────────────────────────────────────

/// Polynomial hash multiplier for session-id folding.
static constexpr std::int64_t HASH_MULTIPLIER = 31;

/// Linear-congruential generator parameters (glibc-style).
static constexpr std::uint64_t LCG_MULTIPLIER = 1103515245ULL;
static constexpr std::uint64_t LCG_INCREMENT  = 12345ULL;
static constexpr std::uint64_t LCG_MODULUS    = 1ULL << 31;

/// A draw strictly above this threshold flips the item's poles.
static constexpr double FLIP_THRESHOLD = 0.5;

// ─── Stakeholder Board ────────────────────────────────────────────────────────

/// Side length of the square stakeholder board, in pixels.
static constexpr double BOARD_SIZE = 600.0;

/// Radius of a placed token. Token centres cannot get closer to the edge.
static constexpr double TOKEN_RADIUS = 24.0;

static constexpr double BOARD_CENTER = BOARD_SIZE / 2.0;

/// Largest distance from the centre a token centre can reach.
static constexpr double PLAYABLE_RADIUS = BOARD_SIZE / 2.0 - TOKEN_RADIUS;

/// Projected means closer than this to the centre have no usable direction.
static constexpr double MIN_PROJECTION_DISTANCE = 0.1;

}  // namespace semdiff::constants
