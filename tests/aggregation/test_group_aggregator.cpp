/// @file tests/aggregation/test_group_aggregator.cpp
/// @brief Unit tests for GroupAggregator::compare_groups.
///
/// Test categories:
///   - Partitioning by group id in first-seen order
///   - Sessions without a group fall into "ungrouped"
///   - Labels come from the first completed session, else the key
///   - Incomplete sessions are excluded from every group
///   - Per-group item statistics and profile vectors

#include <gtest/gtest.h>
#include "semdiff/aggregation.hpp"
#include "semdiff/errors.hpp"

#include <vector>

using namespace semdiff;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static const ScaleConfig kSeven{ScaleMode::Discrete, 7};

static const std::vector<ScaleItem> kItems{
    ScaleItem{"p1", "Cold", "Warm", std::nullopt},
    ScaleItem{"p2", "Slow", "Fast", std::string("Tempo")},
};

static Session make_session(const std::string& id,
                            const std::string& group_id,
                            const std::string& group_label,
                            double p1, double p2,
                            SessionStatus status = SessionStatus::Completed) {
    Session s;
    s.id          = id;
    s.group_id    = group_id;
    s.group_label = group_label;
    s.status      = status;
    s.responses.push_back(ResponseRecord{.item_id = "p1", .normalized_value = p1});
    s.responses.push_back(ResponseRecord{.item_id = "p2", .normalized_value = p2});
    return s;
}

// ─── Test 1: partitioning ────────────────────────────────────────────────────

TEST(GroupAggregator, GroupsAppearInFirstSeenOrder) {
    const std::vector<Session> sessions{
        make_session("s1", "sales", "Sales", 10, 10),
        make_session("s2", "eng", "Engineering", 20, 20),
        make_session("s3", "sales", "Sales", 30, 30),
    };
    const auto groups = GroupAggregator::compare_groups(sessions, kItems, kSeven);
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].group_id, "sales");
    EXPECT_EQ(groups[1].group_id, "eng");
    EXPECT_EQ(groups[0].participant_count, 2u);
    EXPECT_EQ(groups[1].participant_count, 1u);
}

TEST(GroupAggregator, MissingGroupIdFallsIntoUngrouped) {
    const std::vector<Session> sessions{
        make_session("s1", "", "", 0, 0),
        make_session("s2", "", "", 0, 0),
    };
    const auto groups = GroupAggregator::compare_groups(sessions, kItems, kSeven);
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].group_id, "ungrouped");
    EXPECT_EQ(groups[0].group_label, "ungrouped");
    EXPECT_EQ(groups[0].participant_count, 2u);
}

TEST(GroupAggregator, LabelComesFromFirstSession) {
    const std::vector<Session> sessions{
        make_session("s1", "ops", "Operations", 0, 0),
        make_session("s2", "ops", "Ops Team", 0, 0),
    };
    const auto groups = GroupAggregator::compare_groups(sessions, kItems, kSeven);
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].group_label, "Operations");
}

TEST(GroupAggregator, EmptyFirstLabelFallsBackToKey) {
    const std::vector<Session> sessions{
        make_session("s1", "ops", "", 0, 0),
        make_session("s2", "ops", "Operations", 0, 0),
    };
    const auto groups = GroupAggregator::compare_groups(sessions, kItems, kSeven);
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].group_label, "ops");
}

TEST(GroupAggregator, IncompleteSessionDoesNotNameGroup) {
    const std::vector<Session> sessions{
        make_session("s1", "ops", "Draft", 0, 0, SessionStatus::InProgress),
        make_session("s2", "ops", "Operations", 0, 0),
    };
    const auto groups = GroupAggregator::compare_groups(sessions, kItems, kSeven);
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].group_label, "Operations");
}

TEST(GroupAggregator, GroupKeyHelper) {
    Session s;
    EXPECT_EQ(GroupAggregator::group_key(s), "ungrouped");
    s.group_id = "g1";
    EXPECT_EQ(GroupAggregator::group_key(s), "g1");
}

// ─── Test 2: status filtering ────────────────────────────────────────────────

TEST(GroupAggregator, IncompleteSessionsAreExcluded) {
    const std::vector<Session> sessions{
        make_session("s1", "a", "A", -50, -50),
        make_session("s2", "a", "A", 50, 50, SessionStatus::InProgress),
        make_session("s3", "b", "B", 50, 50, SessionStatus::Created),
    };
    const auto groups = GroupAggregator::compare_groups(sessions, kItems, kSeven);
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].group_id, "a");
    EXPECT_EQ(groups[0].participant_count, 1u);
    EXPECT_DOUBLE_EQ(groups[0].item_stats[0].mean, -50.0);
}

TEST(GroupAggregator, ParticipantCountsSumToCompletedSessions) {
    const std::vector<Session> sessions{
        make_session("s1", "a", "A", 0, 0),
        make_session("s2", "b", "B", 0, 0),
        make_session("s3", "", "", 0, 0),
        make_session("s4", "a", "A", 0, 0, SessionStatus::InProgress),
        make_session("s5", "b", "B", 0, 0),
    };
    const auto groups = GroupAggregator::compare_groups(sessions, kItems, kSeven);
    std::size_t total = 0;
    for (const auto& g : groups) total += g.participant_count;
    EXPECT_EQ(total, 4u);
}

TEST(GroupAggregator, NoCompletedSessionsGivesNoGroups) {
    const std::vector<Session> sessions{
        make_session("s1", "a", "A", 0, 0, SessionStatus::InProgress),
    };
    EXPECT_TRUE(GroupAggregator::compare_groups(sessions, kItems, kSeven).empty());
}

// ─── Test 3: per-group profiles ──────────────────────────────────────────────

TEST(GroupAggregator, ItemStatsFollowConfigurationOrder) {
    const std::vector<Session> sessions{
        make_session("s1", "a", "A", -50, 50),
        make_session("s2", "a", "A", 0, 50),
    };
    const auto groups = GroupAggregator::compare_groups(sessions, kItems, kSeven);
    ASSERT_EQ(groups.size(), 1u);
    const auto& stats = groups[0].item_stats;
    ASSERT_EQ(stats.size(), 2u);
    EXPECT_EQ(stats[0].item_id, "p1");
    EXPECT_EQ(stats[1].item_id, "p2");
    EXPECT_DOUBLE_EQ(stats[0].mean, -25.0);
    EXPECT_DOUBLE_EQ(stats[1].mean, 50.0);
    EXPECT_EQ(groups[0].profile_vector, (std::vector<int>{25, 100}));
}

TEST(GroupAggregator, GroupsAreProfiledIndependently) {
    const std::vector<Session> sessions{
        make_session("s1", "a", "A", -50, -50),
        make_session("s2", "b", "B", 50, 50),
    };
    const auto groups = GroupAggregator::compare_groups(sessions, kItems, kSeven);
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].profile_vector, (std::vector<int>{0, 0}));
    EXPECT_EQ(groups[1].profile_vector, (std::vector<int>{100, 100}));
}

TEST(GroupAggregator, InvalidPointsThrow) {
    const std::vector<Session> sessions;
    EXPECT_THROW((void)GroupAggregator::compare_groups(sessions, kItems,
                                                       ScaleConfig{ScaleMode::Discrete, -1}),
                 InvalidConfiguration);
}
