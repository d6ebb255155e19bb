/**
 * @file  bench/bench_kmeans.cpp
 * @brief Google Benchmark suite for the semdiff analysis hot paths.
 *
 * Benchmarks
 * ----------
 *   BM_FlipPattern          - hash + LCG draws per session
 *   BM_ItemStatistics       - mean / sd / median / distribution
 *   BM_CompareGroups        - partition + per-group profiles
 *   BM_KMeans               - full clustering, varying session count
 *
 * Build (CMake):
 *   cmake -DSEMDIFF_BENCH=ON ..
 *   cmake --build build --target bench_kmeans
 *   ./build/bench_kmeans --benchmark_format=json
 *
 * Throughput units: items/second (sessions processed).
 */

#include "benchmark/benchmark.h"

#include "semdiff/aggregation.hpp"
#include "semdiff/clustering.hpp"
#include "semdiff/normalizer.hpp"
#include "semdiff/randomizer.hpp"
#include "semdiff/statistics.hpp"

#include <random>
#include <string>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

static std::vector<semdiff::ScaleItem> make_items(std::size_t m) {
    std::vector<semdiff::ScaleItem> items;
    for (std::size_t j = 0; j < m; ++j) {
        items.push_back(semdiff::ScaleItem{"item" + std::to_string(j), "Low", "High", std::nullopt});
    }
    return items;
}

/// N completed sessions answering every item on a 7-point scale.
static std::vector<semdiff::Session> make_sessions(std::size_t n,
                                                   const std::vector<semdiff::ScaleItem>& items) {
    const semdiff::ScaleConfig scale{semdiff::ScaleMode::Discrete, 7};
    std::mt19937_64 gen(12345);
    std::uniform_int_distribution<int> raw(0, 6);
    std::vector<semdiff::Session> sessions;
    sessions.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        semdiff::Session s;
        s.id       = "s" + std::to_string(i);
        s.group_id = "g" + std::to_string(i % 5);
        s.status   = semdiff::SessionStatus::Completed;
        for (const auto& item : items) {
            s.responses.push_back(
                semdiff::ResponseNormalizer::make_record(item.id, raw(gen), false, scale, 0));
        }
        sessions.push_back(std::move(s));
    }
    return sessions;
}

// ── Benchmarks ────────────────────────────────────────────────────────────────

static void BM_FlipPattern(benchmark::State& state) {
    std::vector<std::string> ids;
    for (const auto& item : make_items(static_cast<std::size_t>(state.range(0)))) {
        ids.push_back(item.id);
    }
    std::size_t i = 0;
    for (auto _ : state) {
        auto pattern = semdiff::randomizer::SessionRandomizer::flip_pattern(
            "participant-" + std::to_string(i++), ids, true);
        benchmark::DoNotOptimize(pattern);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_FlipPattern)->Arg(10)->Arg(50);

static void BM_ItemStatistics(benchmark::State& state) {
    const auto items    = make_items(1);
    const auto sessions = make_sessions(static_cast<std::size_t>(state.range(0)), items);
    const semdiff::ScaleConfig scale{semdiff::ScaleMode::Discrete, 7};
    for (auto _ : state) {
        auto stats = semdiff::StatisticsCalculator::for_item(sessions, items[0], scale);
        benchmark::DoNotOptimize(stats);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ItemStatistics)->Arg(100)->Arg(10000);

static void BM_CompareGroups(benchmark::State& state) {
    const auto items    = make_items(10);
    const auto sessions = make_sessions(static_cast<std::size_t>(state.range(0)), items);
    const semdiff::ScaleConfig scale{semdiff::ScaleMode::Discrete, 7};
    for (auto _ : state) {
        auto groups = semdiff::GroupAggregator::compare_groups(sessions, items, scale);
        benchmark::DoNotOptimize(groups);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_CompareGroups)->Arg(100)->Arg(2000);

static void BM_KMeans(benchmark::State& state) {
    const auto items    = make_items(10);
    const auto sessions = make_sessions(static_cast<std::size_t>(state.range(0)), items);
    for (auto _ : state) {
        semdiff::ClusterRng rng(42);
        auto clusters = semdiff::KMeansClusterer::cluster(sessions, items, 3, 100, rng);
        benchmark::DoNotOptimize(clusters);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_KMeans)->Arg(100)->Arg(1000)->Arg(5000);

BENCHMARK_MAIN();
