#pragma once

/// @file include/semdiff/normalizer.hpp
/// @brief ResponseNormalizer: raw answers to the signed [-50, 50] scale.
///
/// # Module: Response Normalizer
///
/// ## Formula
/// Discrete (raw = index in [0, points-1]):
///   mid        = (points - 1) / 2
///   normalized = ((raw - mid) / mid) * 50          (points == 1 → 0)
/// Continuous (raw = percentage in [0, 100]):
///   normalized = raw - 50
///
/// A flipped presentation negates the result so the low pole is always
/// negative. Results are rounded to one decimal, half away from zero.
///
/// ## Edge Cases
/// - Out-of-domain raw values are not clamped: the result leaves [-50, 50].
///   Keeping raw values in range is the caller's contract.
/// - points <= 0 throws InvalidConfiguration
///
/// ## Guarantees
/// - normalize(v, true, ...) == -normalize(v, false, ...) for every v
/// - Midpoint index of an odd discrete scale normalises to 0.0

#include "semdiff/types.hpp"

#include <cstdint>
#include <string>

namespace semdiff {

class ResponseNormalizer {
public:
    ResponseNormalizer() = delete;

    /// Map a raw answer onto the normalised scale.
    [[nodiscard]] static double normalize(double    raw_value,
                                          bool      was_flipped,
                                          ScaleMode mode,
                                          int       scale_points);

    [[nodiscard]] static double normalize(double             raw_value,
                                          bool               was_flipped,
                                          const ScaleConfig& scale) {
        return normalize(raw_value, was_flipped, scale.mode, scale.points);
    }

    /// Build a ResponseRecord with its derived value filled in.
    [[nodiscard]] static ResponseRecord make_record(std::string        item_id,
                                                    double             raw_value,
                                                    bool               was_flipped,
                                                    const ScaleConfig& scale,
                                                    std::int64_t       timestamp_ms);

    /// Recompute the derived value of an existing record in place.
    static void renormalize(ResponseRecord& record, const ScaleConfig& scale);

    /// Round to one decimal place, half away from zero.
    [[nodiscard]] static double round_one_decimal(double value) noexcept;

    /// Throws InvalidConfiguration when scale_points <= 0.
    static void require_valid_points(int scale_points);
};

}  // namespace semdiff
