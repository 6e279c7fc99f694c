#include <gtest/gtest.h>

#include "mentor_match/errors.hpp"
#include "mentor_match/types.hpp"
#include "src/core/matching/HybridPriorityStableMatching.hpp"
#include "src/core/matching/ILPOptimalMatching.hpp"
#include "src/core/matching/MatchingFactory.hpp"
#include "src/core/matching/MatchingStrategy.hpp"

using mentor_match::matching::MatchingFactory;

class MatchingFactoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Small dense matrix for a smoke test
        scores = mentor_match::scoring::ScoreMatrix::fromRows({
            {3.0, 1.0, 2.0},
            {1.0, 4.0, 2.0}
        });
    }

    mentor_match::scoring::ScoreMatrix scores;
};

TEST_F(MatchingFactoryTest, CreateGreedyStrategy) {
    auto strategy = MatchingFactory::createStrategy(mentor_match::MatchingAlgorithm::GREEDY);
    ASSERT_NE(strategy, nullptr);
    EXPECT_EQ(strategy->getName(), "Greedy");
    EXPECT_EQ(strategy->getType(), mentor_match::MatchingAlgorithm::GREEDY);

    const mentor_match::matching::MatchingProblem problem(scores, {1, 2});
    auto result = strategy->match(problem);
    EXPECT_EQ(result.assignment.assignedCount(), 3);
}

TEST_F(MatchingFactoryTest, CreateWeightedOptimalStrategy) {
    auto strategy = MatchingFactory::createStrategy(mentor_match::MatchingAlgorithm::WEIGHTED_OPTIMAL);
    ASSERT_NE(strategy, nullptr);
    EXPECT_EQ(strategy->getName(), "WeightedOptimal");
    EXPECT_TRUE(strategy->guaranteesOptimality());

    const mentor_match::matching::MatchingProblem problem(scores, {1, 2});
    EXPECT_DOUBLE_EQ(strategy->match(problem).total_score, 9.0);
}

TEST_F(MatchingFactoryTest, CreateStableStrategy) {
    auto strategy = MatchingFactory::createStrategy(mentor_match::MatchingAlgorithm::STABLE);
    ASSERT_NE(strategy, nullptr);
    EXPECT_EQ(strategy->getName(), "Stable");
    EXPECT_TRUE(strategy->guaranteesStability());
}

TEST_F(MatchingFactoryTest, HybridReceivesItsParameters) {
    mentor_match::HybridParams hybrid;
    hybrid.score_tolerance = 0.25;
    hybrid.priority_tags = {"returning"};
    auto strategy = MatchingFactory::createStrategy(mentor_match::MatchingAlgorithm::HYBRID_PRIORITY_STABLE,
                                                    hybrid, mentor_match::SolverParams{});
    ASSERT_NE(strategy, nullptr);
    EXPECT_EQ(strategy->getName(), "HybridPriorityStable");

    auto* typed = dynamic_cast<mentor_match::matching::HybridPriorityStableMatching*>(strategy.get());
    ASSERT_NE(typed, nullptr);
    EXPECT_DOUBLE_EQ(typed->getParams().score_tolerance, 0.25);
}

TEST_F(MatchingFactoryTest, IlpReceivesSolverParameters) {
    mentor_match::SolverParams solver;
    solver.backend = "CBC";
    solver.time_limit_seconds = 5.0;
    auto strategy = MatchingFactory::createStrategy(mentor_match::MatchingAlgorithm::ILP_OPTIMAL,
                                                    mentor_match::HybridParams{}, solver);
    auto* typed = dynamic_cast<mentor_match::matching::ILPOptimalMatching*>(strategy.get());
    ASSERT_NE(typed, nullptr);
    EXPECT_EQ(typed->getParams().backend, "CBC");
    EXPECT_EQ(strategy->getName(), "ILPOptimal");
}

TEST_F(MatchingFactoryTest, InvalidHybridParametersThrow) {
    mentor_match::HybridParams hybrid;
    hybrid.score_tolerance = 2.0;
    EXPECT_THROW(MatchingFactory::createStrategy(mentor_match::MatchingAlgorithm::HYBRID_PRIORITY_STABLE,
                                                 hybrid, mentor_match::SolverParams{}),
                 mentor_match::InvalidConfigurationError);
}

TEST_F(MatchingFactoryTest, CreateStrategyUnsupportedThrows) {
    EXPECT_NO_THROW(MatchingFactory::createStrategy(mentor_match::MatchingAlgorithm::STABLE));
    auto unsupported = static_cast<mentor_match::MatchingAlgorithm>(99);
    EXPECT_THROW(MatchingFactory::createStrategy(unsupported), std::runtime_error);
}

TEST_F(MatchingFactoryTest, GetAvailableStrategiesFollowsEnumOrder) {
    auto list = MatchingFactory::getAvailableStrategies();
    const auto algorithms = mentor_match::allMatchingAlgorithms();
    ASSERT_EQ(list.size(), algorithms.size());
    for (size_t i = 0; i < algorithms.size(); ++i) {
        EXPECT_EQ(MatchingFactory::createStrategy(algorithms[i])->getName(), list[i]);
    }
}

TEST_F(MatchingFactoryTest, AlgorithmFromNameAcceptsAliases) {
    using mentor_match::MatchingAlgorithm;
    EXPECT_EQ(MatchingFactory::algorithmFromName("Greedy"), MatchingAlgorithm::GREEDY);
    EXPECT_EQ(MatchingFactory::algorithmFromName("weighted"), MatchingAlgorithm::WEIGHTED_OPTIMAL);
    EXPECT_EQ(MatchingFactory::algorithmFromName("hungarian"), MatchingAlgorithm::WEIGHTED_OPTIMAL);
    EXPECT_EQ(MatchingFactory::algorithmFromName("gale-shapley"), MatchingAlgorithm::STABLE);
    EXPECT_EQ(MatchingFactory::algorithmFromName("gata-mixed"), MatchingAlgorithm::HYBRID_PRIORITY_STABLE);
    EXPECT_EQ(MatchingFactory::algorithmFromName("ortools"), MatchingAlgorithm::ILP_OPTIMAL);
    EXPECT_THROW(MatchingFactory::algorithmFromName("random"), mentor_match::InvalidConfigurationError);
}

TEST_F(MatchingFactoryTest, ToStringRoundTripsThroughAlgorithmFromName) {
    for (auto algorithm : mentor_match::allMatchingAlgorithms()) {
        EXPECT_EQ(MatchingFactory::algorithmFromName(mentor_match::toString(algorithm)), algorithm);
    }
}
