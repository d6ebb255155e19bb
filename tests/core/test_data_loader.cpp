/// @file tests/core/test_data_loader.cpp
/// @brief Unit tests for the CSV DataLoader.

#include <gtest/gtest.h>
#include "semdiff/data_loader.hpp"

#include <cstdio>
#include <fstream>
#include <string>

using namespace semdiff;
using namespace semdiff::core;

namespace {

const ScaleConfig kSeven{ScaleMode::Discrete, 7};

const char* kResponses =
    "session_id,group_id,group_label,status,item_id,raw_value,was_flipped,timestamp\n"
    "s1,mkt,Marketing,completed,p1,6,0,1704067200000\n"
    "s2,,,in_progress,p1,0,1,1704067201000\n"
    "s1,mkt,Marketing,completed,p2,0,1,1704067202000\n";

}  // namespace

// ─── split_csv ───────────────────────────────────────────────────────────────

TEST(DataLoaderSplit, TrimsFields) {
    const auto f = DataLoader::split_csv(" a , b,c ");
    ASSERT_EQ(f.size(), 3u);
    EXPECT_EQ(f[0], "a");
    EXPECT_EQ(f[1], "b");
    EXPECT_EQ(f[2], "c");
}

TEST(DataLoaderSplit, KeepsEmptyFields) {
    const auto f = DataLoader::split_csv("s1,,,completed");
    ASSERT_EQ(f.size(), 4u);
    EXPECT_TRUE(f[1].empty());
    EXPECT_TRUE(f[2].empty());
}

TEST(DataLoaderSplit, QuotedFieldMayContainComma) {
    const auto f = DataLoader::split_csv("p1,\"Cold, distant\",\"Say \"\"hi\"\"\"");
    ASSERT_EQ(f.size(), 3u);
    EXPECT_EQ(f[1], "Cold, distant");
    EXPECT_EQ(f[2], "Say \"hi\"");
}

// ─── Items ───────────────────────────────────────────────────────────────────

TEST(DataLoaderItems, ParsesWithAndWithoutCategory) {
    const auto items = DataLoader::parse_items_string(
        "id,low_label,high_label,category\n"
        "p1,Traditional,Innovative,Values\n"
        "p2,Slow,Fast\n");
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].id, "p1");
    EXPECT_EQ(items[0].low_label, "Traditional");
    EXPECT_EQ(items[0].high_label, "Innovative");
    ASSERT_TRUE(items[0].category.has_value());
    EXPECT_EQ(*items[0].category, "Values");
    EXPECT_FALSE(items[1].category.has_value());
}

TEST(DataLoaderItems, SkipsMalformedRowsAndComments) {
    const auto items = DataLoader::parse_items_string(
        "# scale definition\n"
        "id,low_label,high_label\n"
        "p1,only-two\n"
        ",Low,High\n"
        "\n"
        "p3,Low,High\r\n");
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].id, "p3");
    EXPECT_EQ(items[0].high_label, "High");
}

TEST(DataLoaderItems, EmptyAndHeaderOnly) {
    EXPECT_TRUE(DataLoader::parse_items_string("").empty());
    EXPECT_TRUE(DataLoader::parse_items_string("id,low_label,high_label\n").empty());
}

// ─── Sessions ────────────────────────────────────────────────────────────────

TEST(DataLoaderSessions, GroupsRowsBySessionInFirstSeenOrder) {
    const auto sessions = DataLoader::parse_sessions_string(kResponses, kSeven);
    ASSERT_EQ(sessions.size(), 2u);

    EXPECT_EQ(sessions[0].id, "s1");
    EXPECT_EQ(sessions[0].group_id, "mkt");
    EXPECT_EQ(sessions[0].group_label, "Marketing");
    EXPECT_TRUE(sessions[0].is_completed());
    ASSERT_EQ(sessions[0].responses.size(), 2u);

    EXPECT_EQ(sessions[1].id, "s2");
    EXPECT_TRUE(sessions[1].group_id.empty());
    EXPECT_EQ(sessions[1].status, SessionStatus::InProgress);
}

TEST(DataLoaderSessions, NormalisesWithFlip) {
    const auto sessions = DataLoader::parse_sessions_string(kResponses, kSeven);
    ASSERT_EQ(sessions.size(), 2u);
    const auto& r0 = sessions[0].responses[0];
    EXPECT_EQ(r0.item_id, "p1");
    EXPECT_DOUBLE_EQ(r0.normalized_value, 50.0);
    EXPECT_FALSE(r0.was_flipped);
    EXPECT_EQ(r0.timestamp_ms, 1704067200000);

    const auto& r1 = sessions[0].responses[1];
    EXPECT_TRUE(r1.was_flipped);
    EXPECT_DOUBLE_EQ(r1.normalized_value, 50.0);  // raw 0 flipped
}

TEST(DataLoaderSessions, ContinuousScale) {
    const auto sessions = DataLoader::parse_sessions_string(
        "session_id,group_id,group_label,status,item_id,raw_value,was_flipped,timestamp\n"
        "s1,,,completed,p1,72.5,false,0\n",
        ScaleConfig{ScaleMode::Continuous, 7});
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_DOUBLE_EQ(sessions[0].responses[0].normalized_value, 22.5);
}

TEST(DataLoaderSessions, SkipsMalformedRows) {
    const auto sessions = DataLoader::parse_sessions_string(
        "session_id,group_id,group_label,status,item_id,raw_value,was_flipped,timestamp\n"
        "s1,,,finished,p1,3,0,0\n"       // unknown status
        "s1,,,completed,p1,abc,0,0\n"    // raw not numeric
        "s1,,,completed,p1,3,maybe,0\n"  // flag not boolean
        "s1,,,completed,p1,3,0,12x\n"    // timestamp trailing garbage
        "s1,,,completed,,3,0,0\n"        // missing item
        "s1,,,completed,p1,3,0\n"        // too few fields
        "s2,,,completed,p1,3,0,0\n",
        kSeven);
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].id, "s2");
    EXPECT_DOUBLE_EQ(sessions[0].responses[0].normalized_value, 0.0);
}

TEST(DataLoaderSessions, InvalidScaleYieldsNothing) {
    EXPECT_TRUE(DataLoader::parse_sessions_string(kResponses,
                                                  ScaleConfig{ScaleMode::Discrete, 0}).empty());
}

// ─── Files ───────────────────────────────────────────────────────────────────

TEST(DataLoaderFiles, MissingFileIsNullopt) {
    EXPECT_FALSE(DataLoader::load_items("/nonexistent/semdiff/items.csv").has_value());
    EXPECT_FALSE(DataLoader::load_sessions("/nonexistent/semdiff/r.csv", kSeven).has_value());
}

TEST(DataLoaderFiles, LoadsFromDisk) {
    const std::string path = ::testing::TempDir() + "semdiff_responses.csv";
    {
        std::ofstream out(path);
        out << kResponses;
    }
    const auto sessions = DataLoader::load_sessions(path, kSeven);
    std::remove(path.c_str());
    ASSERT_TRUE(sessions.has_value());
    EXPECT_EQ(sessions->size(), 2u);
}
