/**
 * @file  fuzz_kmeans.cpp
 * @brief libFuzzer target for KMeansClusterer
 *
 * Build:
 *   cmake -DSEMDIFF_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_kmeans
 *
 * Run for 60 seconds:
 *   ./fuzz_kmeans -max_total_time=60
 *
 * Input layout:
 *   byte 0      k (1..8)
 *   byte 1      max_iterations (1..32)
 *   byte 2      item count m (1..4)
 *   bytes 3..   rows of m bytes each, mapped onto [-50, 50]
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB for any byte sequence
 *   2. Fewer rows than k yields no clusters
 *   3. Member counts sum to the row count, every cluster is non-empty
 *   4. Every centroid coordinate is finite and within [-50, 50]
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "semdiff/clustering.hpp"

using namespace semdiff;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 3) return 0;

    const int k        = 1 + data[0] % 8;
    const int max_iter = 1 + data[1] % 32;
    const std::size_t m = 1 + data[2] % 4;

    std::vector<ScaleItem> items;
    for (std::size_t j = 0; j < m; ++j) {
        items.push_back(ScaleItem{"i" + std::to_string(j), "L", "H", std::nullopt});
    }

    std::vector<Session> sessions;
    for (std::size_t off = 3; off + m <= size; off += m) {
        Session s;
        s.id     = "s" + std::to_string(sessions.size());
        s.status = SessionStatus::Completed;
        for (std::size_t j = 0; j < m; ++j) {
            const double v = static_cast<double>(data[off + j]) / 255.0 * 100.0 - 50.0;
            s.responses.push_back(ResponseRecord{.item_id = items[j].id, .normalized_value = v});
        }
        sessions.push_back(std::move(s));
    }

    ClusterRng rng(size);
    const auto clusters = KMeansClusterer::cluster(sessions, items, k, max_iter, rng);

    if (sessions.size() < static_cast<std::size_t>(k)) {
        assert(clusters.empty());
        return 0;
    }

    std::size_t total = 0;
    for (const auto& c : clusters) {
        assert(c.member_count > 0);
        total += c.member_count;
        for (Eigen::Index j = 0; j < c.centroid.size(); ++j) {
            assert(std::isfinite(c.centroid[j]));
            assert(c.centroid[j] >= -50.0 - 1e-9 && c.centroid[j] <= 50.0 + 1e-9);
        }
    }
    assert(total == sessions.size());
    return 0;
}
