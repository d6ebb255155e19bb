/**
 * @file  fuzz_normalizer.cpp
 * @brief libFuzzer target for ResponseNormalizer and StatisticsCalculator
 *
 * Build:
 *   cmake -DSEMDIFF_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_normalizer
 *
 * Run for 60 seconds:
 *   ./fuzz_normalizer -max_total_time=60
 *
 * Input layout:
 *   byte 0      scale points (0 is a configuration error, must throw)
 *   byte 1      bit 0 = continuous mode
 *   bytes 2..   one raw answer per byte; bit 7 marks a flipped answer
 *
 * Safety invariants verified on every input:
 *   1. points == 0 raises InvalidConfiguration, nothing else does
 *   2. In-domain answers normalise into [-50, 50]
 *   3. Statistics have count == number of answers and min <= median <= max
 *   4. Discrete distribution never counts more than `count`
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "semdiff/errors.hpp"
#include "semdiff/normalizer.hpp"
#include "semdiff/statistics.hpp"

using namespace semdiff;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 2) return 0;

    const int points = data[0] % 16;
    const ScaleConfig scale{
        (data[1] & 1) ? ScaleMode::Continuous : ScaleMode::Discrete,
        points,
    };

    if (points == 0) {
        bool threw = false;
        try {
            (void)ResponseNormalizer::normalize(0.0, false, scale);
        } catch (const InvalidConfiguration&) {
            threw = true;
        }
        assert(threw);
        return 0;
    }

    std::vector<double> values;
    for (size_t i = 2; i < size; ++i) {
        const bool flipped = (data[i] & 0x80) != 0;
        const int  byte    = data[i] & 0x7F;
        const double raw = scale.mode == ScaleMode::Continuous
                               ? static_cast<double>(byte % 101)
                               : static_cast<double>(byte % points);
        const double v = ResponseNormalizer::normalize(raw, flipped, scale);
        assert(std::isfinite(v));
        assert(v >= -50.0 && v <= 50.0);
        values.push_back(v);
    }

    const auto stats = StatisticsCalculator::compute(values, scale);
    assert(stats.count == values.size());
    if (!values.empty()) {
        assert(stats.min <= stats.median && stats.median <= stats.max);
        assert(stats.std_dev >= 0.0);
    }
    if (stats.distribution) {
        int total = 0;
        for (int c : *stats.distribution) total += c;
        assert(static_cast<std::size_t>(total) <= stats.count);
    }
    return 0;
}
