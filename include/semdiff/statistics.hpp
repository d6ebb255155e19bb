#pragma once

/// @file include/semdiff/statistics.hpp
/// @brief StatisticsCalculator: descriptive statistics per scale item.
///
/// # Module: Item Statistics Calculator
///
/// ## Responsibility
/// Summarise the normalised values collected for one scale item: mean,
/// population standard deviation, median, min, max, count and, for discrete
/// scales, how many answers fell on each scale point.
///
/// ## Conventions
/// - mean and std_dev are rounded to one decimal
/// - std_dev divides by n, not n - 1
/// - median is the middle value, or the mean of the two middle values for
///   an even count, and is not rounded further
/// - min / max are exact input values
/// - distribution index = round((v / 50) * mid + mid); indices that land
///   outside [0, points - 1] are dropped without incrementing any bucket
/// - round is std::lround, so halves go away from zero: 2.5 -> 3 but
///   -0.5 -> -1. A value landing exactly half a step below the lowest
///   bucket (e.g. -75 on a 3-point scale) is therefore dropped rather than
///   counted in bucket 0
///
/// ## Edge Cases
/// - Empty input: every numeric field is 0, count is 0, and a discrete
///   distribution is an all-zero vector of length `points`
/// - points <= 0 throws InvalidConfiguration
///
/// ## Guarantees
/// - Pure: repeated calls over the same input return identical results

#include "semdiff/types.hpp"

#include <span>
#include <vector>

namespace semdiff {

class StatisticsCalculator {
public:
    StatisticsCalculator() = delete;

    /// Statistics over already-filtered normalised values.
    /// The returned item_id and labels are left empty.
    [[nodiscard]] static ItemStatistics compute(std::span<const double> values,
                                                const ScaleConfig&      scale);

    /// Statistics for `item` over the completed sessions that answered it.
    [[nodiscard]] static ItemStatistics for_item(std::span<const Session> sessions,
                                                 const ScaleItem&         item,
                                                 const ScaleConfig&       scale);

    /// Normalised values of `item_id` from completed sessions, input order.
    [[nodiscard]] static std::vector<double>
    collect_values(std::span<const Session> sessions, const std::string& item_id);

    /// Radar-chart profile: per item round(((mean + 50) / 100) * 100).
    [[nodiscard]] static std::vector<int>
    profile_vector(std::span<const Session>   sessions,
                   std::span<const ScaleItem> items,
                   const ScaleConfig&         scale);

    /// Map a normalised value back to its discrete scale index, rounding
    /// halves away from zero. The result may fall outside [0, points - 1]
    /// for out-of-range values.
    [[nodiscard]] static long bucket_index(double normalized, int scale_points) noexcept;

private:
    [[nodiscard]] static double mean(std::span<const double> v) noexcept;
    [[nodiscard]] static double population_stddev(std::span<const double> v,
                                                  double mean_val) noexcept;
    /// Precondition: non-empty.
    [[nodiscard]] static double median(std::span<const double> v);
};

}  // namespace semdiff
