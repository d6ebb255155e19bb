/// @file src/normalizer/response_normalizer.cpp
/// @brief ResponseNormalizer: discrete / continuous raw values to [-50, 50].

#include "semdiff/normalizer.hpp"
#include "semdiff/constants.hpp"
#include "semdiff/errors.hpp"

#include <cmath>
#include <fmt/format.h>
#include <utility>

namespace semdiff {

void ResponseNormalizer::require_valid_points(int scale_points) {
    if (scale_points <= 0) {
        throw InvalidConfiguration(
            fmt::format("scale points must be positive, got {}", scale_points));
    }
}

double ResponseNormalizer::round_one_decimal(double value) noexcept {
    // std::round rounds halfway cases away from zero.
    return std::round(value * constants::ROUNDING_SCALE) / constants::ROUNDING_SCALE;
}

double ResponseNormalizer::normalize(double    raw_value,
                                     bool      was_flipped,
                                     ScaleMode mode,
                                     int       scale_points) {
    require_valid_points(scale_points);

    double normalized = 0.0;
    if (mode == ScaleMode::Discrete) {
        const double midpoint = static_cast<double>(scale_points - 1) / 2.0;
        if (midpoint > 0.0) {
            normalized = ((raw_value - midpoint) / midpoint)
                         * constants::NORMALIZED_HALF_RANGE;
        }
        // Single-point scale: every answer is neutral.
    } else {
        normalized = raw_value - constants::CONTINUOUS_MIDPOINT;
    }

    // A flipped presentation put the high pole on the left; negating
    // restores canonical polarity (low pole negative).
    if (was_flipped) {
        normalized = -normalized;
    }

    const double rounded = round_one_decimal(normalized);
    // Avoid handing out -0.0 for a neutral flipped answer.
    return rounded == 0.0 ? 0.0 : rounded;
}

ResponseRecord ResponseNormalizer::make_record(std::string        item_id,
                                               double             raw_value,
                                               bool               was_flipped,
                                               const ScaleConfig& scale,
                                               std::int64_t       timestamp_ms) {
    return ResponseRecord{
        .item_id          = std::move(item_id),
        .raw_value        = raw_value,
        .was_flipped      = was_flipped,
        .normalized_value = normalize(raw_value, was_flipped, scale),
        .timestamp_ms     = timestamp_ms,
    };
}

void ResponseNormalizer::renormalize(ResponseRecord& record, const ScaleConfig& scale) {
    record.normalized_value = normalize(record.raw_value, record.was_flipped, scale);
}

}  // namespace semdiff
