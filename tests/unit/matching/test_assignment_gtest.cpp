#include <gtest/gtest.h>

#include "src/core/matching/Assignment.hpp"
#include "src/core/matching/StabilityAnalysis.hpp"

using mentor_match::matching::Assignment;
using mentor_match::matching::BlockingPair;
using mentor_match::matching::StabilityAnalysis;
using mentor_match::scoring::ScoreMatrix;

TEST(AssignmentTest, StartsEmpty) {
    Assignment a({2, 1}, 3);
    EXPECT_EQ(a.mentorCount(), 2);
    EXPECT_EQ(a.menteeCount(), 3);
    EXPECT_EQ(a.assignedCount(), 0);
    EXPECT_EQ(a.unassignedMentees(), (std::vector<int>{0, 1, 2}));
}

TEST(AssignmentTest, AssignRespectsCapacity) {
    Assignment a({1, 1}, 3);
    EXPECT_TRUE(a.assign(0, 0));
    EXPECT_FALSE(a.assign(1, 0));
    EXPECT_FALSE(a.isAssigned(1));
    EXPECT_TRUE(a.assign(1, 1));
    EXPECT_EQ(a.load(0), 1);
    EXPECT_FALSE(a.hasCapacity(0));
    EXPECT_NO_THROW(a.validate());
}

TEST(AssignmentTest, AssigningTwiceThrows) {
    Assignment a({2, 2}, 1);
    ASSERT_TRUE(a.assign(0, 0));
    EXPECT_THROW(a.assign(0, 1), std::logic_error);
}

TEST(AssignmentTest, UnassignFreesTheSlot) {
    Assignment a({1}, 2);
    ASSERT_TRUE(a.assign(0, 0));
    a.unassign(0);
    a.unassign(0);
    EXPECT_FALSE(a.isAssigned(0));
    EXPECT_TRUE(a.assign(1, 0));
    EXPECT_EQ(a.mentorOf(1), 0);
    EXPECT_EQ(a.mentorOf(0), Assignment::kUnassigned);
}

TEST(AssignmentTest, NegativeCapacityThrows) {
    EXPECT_THROW(Assignment({1, -1}, 2), std::invalid_argument);
}

TEST(AssignmentTest, ZeroCapacityMentorNeverTakesMentees) {
    Assignment a({0}, 1);
    EXPECT_FALSE(a.assign(0, 0));
}

TEST(AssignmentTest, TotalScoreAndRosterOrder) {
    auto scores = ScoreMatrix::fromRows({{4.0, 9.0, 4.0}});
    Assignment a({3}, 3);
    a.assign(2, 0);
    a.assign(0, 0);
    a.assign(1, 0);

    EXPECT_DOUBLE_EQ(a.totalScore(scores), 17.0);
    EXPECT_EQ(a.rosterOf(0, scores), (std::vector<int>{1, 0, 2}));
}

TEST(AssignmentTest, EqualityComparesMappingAndBuckets) {
    Assignment a({1, 1}, 2);
    Assignment b({1, 1}, 2);
    a.assign(0, 1);
    EXPECT_NE(a, b);
    b.assign(0, 1);
    EXPECT_EQ(a, b);
}

class StabilityAnalysisTest : public ::testing::Test {
protected:
    const double X = ScoreMatrix::kIneligible;
};

TEST_F(StabilityAnalysisTest, UnassignedMenteeBlocksWithFreeMentor) {
    auto scores = ScoreMatrix::fromRows({{1.0}});
    Assignment a({1}, 1);
    const auto pairs = StabilityAnalysis::findBlockingPairs(a, scores);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0], (BlockingPair{0, 0}));
}

TEST_F(StabilityAnalysisTest, IneligiblePairsNeverBlock) {
    auto scores = ScoreMatrix::fromRows({{X}});
    Assignment a({1}, 1);
    EXPECT_TRUE(StabilityAnalysis::isStable(a, scores));
}

TEST_F(StabilityAnalysisTest, FullMentorBlocksOnlyForStrictlyBetterMentee) {
    // Mentor 0 holds mentee 1; mentee 0 scores higher with mentor 0 than with mentor 1
    auto scores = ScoreMatrix::fromRows({{10.0, 9.0}, {8.0, 1.0}});
    Assignment a({1, 1}, 2);
    a.assign(1, 0);
    a.assign(0, 1);
    const auto pairs = StabilityAnalysis::findBlockingPairs(a, scores);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0], (BlockingPair{0, 0}));

    Assignment b({1, 1}, 2);
    b.assign(0, 0);
    b.assign(1, 1);
    EXPECT_EQ(StabilityAnalysis::countBlockingPairs(b, scores), 0);
}

TEST_F(StabilityAnalysisTest, TiesDoNotBlock) {
    auto scores = ScoreMatrix::fromRows({{5.0, 5.0}});
    Assignment a({1}, 2);
    a.assign(1, 0);
    EXPECT_TRUE(StabilityAnalysis::isStable(a, scores));
}

TEST_F(StabilityAnalysisTest, ZeroCapacityMentorNeverBlocks) {
    auto scores = ScoreMatrix::fromRows({{7.0}});
    Assignment a({0}, 1);
    EXPECT_TRUE(StabilityAnalysis::isStable(a, scores));
}

TEST_F(StabilityAnalysisTest, WorstHeldMenteePrefersHigherIndexOnTies) {
    auto scores = ScoreMatrix::fromRows({{3.0, 2.0, 2.0}});
    Assignment a({3}, 3);
    a.assign(2, 0);
    a.assign(0, 0);
    a.assign(1, 0);
    EXPECT_EQ(StabilityAnalysis::worstHeldMentee(a, scores, 0), 2);

    Assignment empty({1}, 3);
    EXPECT_EQ(StabilityAnalysis::worstHeldMentee(empty, scores, 0), -1);
}
