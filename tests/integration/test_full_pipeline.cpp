/// @file tests/integration/test_full_pipeline.cpp
/// @brief End-to-end tests for the full semdiff pipeline.
///
/// These tests exercise the complete path:
///   session id → SessionRandomizer → rendered poles → raw answer →
///   ResponseNormalizer → Session → StatisticsCalculator /
///   GroupAggregator / KMeansClusterer → AnalysisReport

#include "semdiff/data_loader.hpp"
#include "semdiff/engine.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace semdiff;
using namespace semdiff::core;

// ─── Synthetic data helpers ───────────────────────────────────────────────────

namespace {

constexpr int kPoints = 7;

EngineConfig brand_config() {
    EngineConfig cfg;
    cfg.items = {
        ScaleItem{"tradition", "Traditional", "Innovative", std::string("Values")},
        ScaleItem{"warmth", "Cold", "Warm", std::string("Tone")},
        ScaleItem{"price", "Cheap", "Premium", std::nullopt},
    };
    cfg.scale        = ScaleConfig{ScaleMode::Discrete, kPoints};
    cfg.randomize    = true;
    cfg.cluster_seed = 99;
    cfg.cluster_count = 2;
    return cfg;
}

/// Simulate a participant who always clicks the pole labelled `preferred`,
/// wherever the renderer put it.
Session simulate(const AnalysisEngine& engine,
                 const std::string&    session_id,
                 const std::string&    group_id,
                 bool                  prefers_high) {
    Session s;
    s.id          = session_id;
    s.group_id    = group_id;
    s.group_label = group_id;
    s.status      = SessionStatus::Completed;

    const auto flips = engine.flip_pattern(session_id);
    std::int64_t ts = 0;
    for (const auto& item : engine.config().items) {
        const bool flipped = flips.at(item.id);
        // Unflipped: high pole on the right (index points-1).
        const bool click_right = prefers_high != flipped;
        const double raw = click_right ? kPoints - 1 : 0;
        s.responses.push_back(engine.record_response(session_id, item.id, raw, ts++));
    }
    return s;
}

}  // anonymous namespace

// ─── Randomisation is transparent to analysis ────────────────────────────────

TEST(FullPipeline, FlipsCancelOutInNormalisedValues) {
    const AnalysisEngine engine(brand_config());
    for (int i = 0; i < 50; ++i) {
        const auto s = simulate(engine, "session_" + std::to_string(i), "", true);
        for (const auto& r : s.responses) {
            EXPECT_DOUBLE_EQ(r.normalized_value, 50.0) << s.id << " " << r.item_id;
        }
    }
}

TEST(FullPipeline, SomeSessionsAreActuallyFlipped) {
    const AnalysisEngine engine(brand_config());
    int flipped = 0;
    for (int i = 0; i < 50; ++i) {
        for (const auto& [id, f] : engine.flip_pattern("session_" + std::to_string(i))) {
            if (f) ++flipped;
        }
    }
    EXPECT_GT(flipped, 0);
    EXPECT_LT(flipped, 150);
}

TEST(FullPipeline, PolarisedGroupsAreSeparated) {
    const AnalysisEngine engine(brand_config());
    std::vector<Session> sessions;
    for (int i = 0; i < 10; ++i) {
        sessions.push_back(simulate(engine, "fan_" + std::to_string(i), "fans", true));
        sessions.push_back(simulate(engine, "critic_" + std::to_string(i), "critics", false));
    }

    const auto report = engine.analyze(sessions);
    EXPECT_EQ(report.completed_sessions, 20u);

    ASSERT_EQ(report.item_stats.size(), 3u);
    for (const auto& s : report.item_stats) {
        EXPECT_DOUBLE_EQ(s.mean, 0.0);
        EXPECT_DOUBLE_EQ(s.std_dev, 50.0);
        ASSERT_TRUE(s.distribution.has_value());
        EXPECT_EQ((*s.distribution)[0], 10);
        EXPECT_EQ((*s.distribution)[kPoints - 1], 10);
    }

    ASSERT_EQ(report.groups.size(), 2u);
    EXPECT_EQ(report.groups[0].group_id, "fans");
    EXPECT_EQ(report.groups[0].profile_vector, (std::vector<int>{100, 100, 100}));
    EXPECT_EQ(report.groups[1].profile_vector, (std::vector<int>{0, 0, 0}));

    ASSERT_EQ(report.clusters.size(), 2u);
    for (const auto& c : report.clusters) {
        ASSERT_EQ(c.member_count, 10u);
        const char prefix = c.members.front()[0];
        for (const auto& m : c.members) {
            EXPECT_EQ(m[0], prefix);
        }
    }
}

// ─── CSV round through the loader ─────────────────────────────────────────────

TEST(FullPipeline, CsvInputProducesReport) {
    const auto items = DataLoader::parse_items_string(
        "id,low_label,high_label\n"
        "p1,Cold,Warm\n"
        "p2,Slow,Fast\n");
    ASSERT_EQ(items.size(), 2u);

    EngineConfig cfg;
    cfg.items         = items;
    cfg.scale         = ScaleConfig{ScaleMode::Continuous, 7};
    cfg.cluster_count = 1;
    const AnalysisEngine engine(cfg);

    const auto sessions = DataLoader::parse_sessions_string(
        "session_id,group_id,group_label,status,item_id,raw_value,was_flipped,timestamp\n"
        "s1,g,Group,completed,p1,80,0,1\n"
        "s1,g,Group,completed,p2,20,1,2\n"
        "s2,g,Group,completed,p1,60,0,3\n"
        "s2,g,Group,completed,p2,40,1,4\n"
        "s3,,,created,p1,0,0,5\n",
        engine.config().scale);
    ASSERT_EQ(sessions.size(), 3u);

    const auto report = engine.analyze(sessions);
    EXPECT_EQ(report.completed_sessions, 2u);
    EXPECT_DOUBLE_EQ(report.item_stats[0].mean, 20.0);
    EXPECT_DOUBLE_EQ(report.item_stats[1].mean, 20.0);
    EXPECT_FALSE(report.item_stats[0].distribution.has_value());

    ASSERT_EQ(report.groups.size(), 1u);
    EXPECT_EQ(report.groups[0].group_label, "Group");
    EXPECT_EQ(report.groups[0].profile_vector, (std::vector<int>{70, 70}));

    ASSERT_EQ(report.clusters.size(), 1u);
    EXPECT_EQ(report.clusters[0].member_count, 2u);
    EXPECT_NEAR(report.clusters[0].centroid[0], 20.0, 1e-9);
}
