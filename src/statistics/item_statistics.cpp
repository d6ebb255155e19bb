/// @file src/statistics/item_statistics.cpp
/// @brief StatisticsCalculator: mean, population std-dev, median, range and
///        discrete distribution for one scale item.

#include "semdiff/statistics.hpp"
#include "semdiff/constants.hpp"
#include "semdiff/normalizer.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace semdiff {

// ─── Private statics ──────────────────────────────────────────────────────────

double StatisticsCalculator::mean(std::span<const double> v) noexcept {
    const double sum = std::accumulate(v.begin(), v.end(), 0.0);
    return sum / static_cast<double>(v.size());
}

double StatisticsCalculator::population_stddev(std::span<const double> v,
                                               double mean_val) noexcept {
    double sq_sum = 0.0;
    for (double x : v) {
        const double d = x - mean_val;
        sq_sum += d * d;
    }
    // Population (n) denominator: the respondents are the population.
    return std::sqrt(sq_sum / static_cast<double>(v.size()));
}

double StatisticsCalculator::median(std::span<const double> v) {
    std::vector<double> sorted(v.begin(), v.end());
    std::sort(sorted.begin(), sorted.end());
    const std::size_t n = sorted.size();
    if (n % 2 == 0) {
        return (sorted[n / 2 - 1] + sorted[n / 2]) / 2.0;
    }
    return sorted[n / 2];
}

// ─── bucket_index ─────────────────────────────────────────────────────────────

long StatisticsCalculator::bucket_index(double normalized, int scale_points) noexcept {
    const double midpoint = static_cast<double>(scale_points - 1) / 2.0;
    return std::lround((normalized / constants::NORMALIZED_HALF_RANGE) * midpoint + midpoint);
}

// ─── compute ──────────────────────────────────────────────────────────────────

ItemStatistics StatisticsCalculator::compute(std::span<const double> values,
                                             const ScaleConfig&      scale) {
    ResponseNormalizer::require_valid_points(scale.points);

    ItemStatistics out;
    if (scale.mode == ScaleMode::Discrete) {
        out.distribution = std::vector<int>(static_cast<std::size_t>(scale.points), 0);
    }

    if (values.empty()) {
        return out;
    }

    const double mu = mean(values);
    const double sd = population_stddev(values, mu);

    out.mean    = ResponseNormalizer::round_one_decimal(mu);
    out.std_dev = ResponseNormalizer::round_one_decimal(sd);
    out.median  = median(values);

    const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    out.min   = *lo;
    out.max   = *hi;
    out.count = values.size();

    if (out.distribution) {
        auto& buckets = *out.distribution;
        for (double v : values) {
            const long index = bucket_index(v, scale.points);
            // Boundary rounding can land one step outside the scale.
            if (index >= 0 && index < scale.points) {
                ++buckets[static_cast<std::size_t>(index)];
            }
        }
    }
    return out;
}

// ─── collect_values / for_item ────────────────────────────────────────────────

std::vector<double>
StatisticsCalculator::collect_values(std::span<const Session> sessions,
                                     const std::string&       item_id) {
    std::vector<double> values;
    values.reserve(sessions.size());
    for (const auto& s : sessions) {
        if (!s.is_completed()) continue;
        if (auto v = s.response_value(item_id)) {
            values.push_back(*v);
        }
    }
    return values;
}

ItemStatistics StatisticsCalculator::for_item(std::span<const Session> sessions,
                                              const ScaleItem&         item,
                                              const ScaleConfig&       scale) {
    const auto values = collect_values(sessions, item.id);
    ItemStatistics stats = compute(values, scale);
    stats.item_id    = item.id;
    stats.low_label  = item.low_label;
    stats.high_label = item.high_label;
    return stats;
}

// ─── profile_vector ───────────────────────────────────────────────────────────

std::vector<int>
StatisticsCalculator::profile_vector(std::span<const Session>   sessions,
                                     std::span<const ScaleItem> items,
                                     const ScaleConfig&         scale) {
    std::vector<int> profile;
    profile.reserve(items.size());
    for (const auto& item : items) {
        const auto stats = for_item(sessions, item, scale);
        // Shift [-50, 50] onto the [0, 100] radar axis.
        const double radar = (stats.mean + constants::NORMALIZED_HALF_RANGE)
                             / (2.0 * constants::NORMALIZED_HALF_RANGE) * 100.0;
        profile.push_back(static_cast<int>(std::lround(radar)));
    }
    return profile;
}

}  // namespace semdiff
