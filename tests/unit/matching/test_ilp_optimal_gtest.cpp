#include <gtest/gtest.h>

#include "mentor_match/errors.hpp"
#include "src/core/matching/ILPOptimalMatching.hpp"
#include "src/core/matching/WeightedOptimalMatching.hpp"
#include "tests/unit/support/StubLinearSolver.hpp"

using namespace mentor_match;
using namespace mentor_match::matching;
using mentor_match::scoring::ScoreMatrix;
using mentor_match::solver::SolveStatus;
using mentor_match::test_support::SolveTrace;
using mentor_match::test_support::StubLinearSolver;

namespace {

ILPOptimalMatching::SolverFactory stubFactory(SolveStatus status = SolveStatus::OPTIMAL,
                                              int timeouts = 0,
                                              SolveTrace* trace = nullptr) {
    return [status, timeouts, trace](const SolverParams&) -> std::unique_ptr<ILinearSolver> {
        return std::make_unique<StubLinearSolver>(status, timeouts, trace);
    };
}

SolverErrorKind expectSolverError(const ILPOptimalMatching& strategy, const MatchingProblem& problem) {
    try {
        strategy.match(problem);
    } catch (const SolverError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "Expected SolverError";
    return SolverErrorKind::UNAVAILABLE;
}

} // namespace

class ILPOptimalMatchingTest : public ::testing::Test {
protected:
    void SetUp() override {
        scores = ScoreMatrix::fromRows({
            {10.0, 9.0, 3.0, 2.0},
            {8.0, 1.0, 7.0, 4.0},
            {5.0, 6.0, 11.0, 12.0}
        });
    }

    ScoreMatrix scores;
};

TEST_F(ILPOptimalMatchingTest, MatchesWeightedOptimalTotal) {
    SolveTrace trace;
    const ILPOptimalMatching strategy(SolverParams{}, stubFactory(SolveStatus::OPTIMAL, 0, &trace));
    const MatchingProblem problem(scores, {1, 1, 2});

    const auto result = strategy.match(problem);
    EXPECT_EQ(result.name, "ILPOptimal");
    EXPECT_DOUBLE_EQ(result.total_score, WeightedOptimalMatching().match(problem).total_score);
    EXPECT_NO_THROW(result.assignment.validate());

    EXPECT_EQ(trace.calls, 1);
    EXPECT_EQ(trace.last_variable_count, 12);
    EXPECT_EQ(trace.last_constraint_count, 4 + 3);
}

TEST_F(ILPOptimalMatchingTest, IneligiblePairsGetNoVariable) {
    const double X = ScoreMatrix::kIneligible;
    auto sparse = ScoreMatrix::fromRows({{4.0, X}, {X, X}});
    SolveTrace trace;
    const ILPOptimalMatching strategy(SolverParams{}, stubFactory(SolveStatus::OPTIMAL, 0, &trace));
    const MatchingProblem problem(sparse, {1, 1});

    const auto result = strategy.match(problem);
    EXPECT_EQ(trace.last_variable_count, 1);
    EXPECT_EQ(trace.last_constraint_count, 2);
    EXPECT_EQ(result.assignment.mentorOf(0), 0);
    EXPECT_FALSE(result.assignment.isAssigned(1));
    EXPECT_EQ(result.no_eligible_mentees, (std::vector<int>{1}));
}

TEST_F(ILPOptimalMatchingTest, ZeroTotalCapacityIsInfeasible) {
    const ILPOptimalMatching strategy(SolverParams{}, stubFactory());
    const MatchingProblem problem(scores, {0, 0, 0});
    EXPECT_EQ(expectSolverError(strategy, problem), SolverErrorKind::INFEASIBLE);
}

TEST_F(ILPOptimalMatchingTest, CapacitiesNearIntMaxAreNotMistakenForZero) {
    const ILPOptimalMatching strategy(SolverParams{}, stubFactory());
    const MatchingProblem problem(scores, {999999999, 999999999, 999999999});
    const auto result = strategy.match(problem);
    EXPECT_TRUE(result.success);
    EXPECT_DOUBLE_EQ(result.total_score, 10.0 + 9.0 + 11.0 + 12.0);
}

TEST_F(ILPOptimalMatchingTest, MissingBackendIsUnavailable) {
    const ILPOptimalMatching strategy(
        SolverParams{}, [](const SolverParams&) { return std::unique_ptr<ILinearSolver>(); });
    const MatchingProblem problem(scores, {1, 1, 2});
    EXPECT_EQ(expectSolverError(strategy, problem), SolverErrorKind::UNAVAILABLE);
}

TEST_F(ILPOptimalMatchingTest, BackendStatusesMapToSolverErrors) {
    const MatchingProblem problem(scores, {1, 1, 2});
    EXPECT_EQ(expectSolverError(ILPOptimalMatching(SolverParams{}, stubFactory(SolveStatus::INFEASIBLE)), problem),
              SolverErrorKind::INFEASIBLE);
    EXPECT_EQ(expectSolverError(ILPOptimalMatching(SolverParams{}, stubFactory(SolveStatus::TIMED_OUT)), problem),
              SolverErrorKind::TIMEOUT);
    EXPECT_EQ(expectSolverError(ILPOptimalMatching(SolverParams{}, stubFactory(SolveStatus::ERROR)), problem),
              SolverErrorKind::UNAVAILABLE);
}

TEST_F(ILPOptimalMatchingTest, FeasibleWithoutProofIsATimeout) {
    SolveTrace trace;
    const ILPOptimalMatching strategy(SolverParams{}, stubFactory(SolveStatus::FEASIBLE, 0, &trace));
    const MatchingProblem problem(scores, {1, 1, 2});
    EXPECT_EQ(expectSolverError(strategy, problem), SolverErrorKind::TIMEOUT);
    EXPECT_EQ(trace.calls, 1);
}

TEST_F(ILPOptimalMatchingTest, FeasibleWithoutProofIsRetriedBeforeFailing) {
    SolverParams params;
    params.time_limit_seconds = 1.0;
    params.timeout_retries = 2;

    SolveTrace trace;
    const ILPOptimalMatching strategy(params, stubFactory(SolveStatus::FEASIBLE, 0, &trace));
    const MatchingProblem problem(scores, {1, 1, 2});
    EXPECT_EQ(expectSolverError(strategy, problem), SolverErrorKind::TIMEOUT);
    EXPECT_EQ(trace.calls, 3);
    EXPECT_DOUBLE_EQ(trace.last_time_limit, 4.0);
}

TEST_F(ILPOptimalMatchingTest, TimeoutRetryDoublesTheLimit) {
    SolverParams params;
    params.time_limit_seconds = 2.0;
    params.timeout_retries = 1;

    SolveTrace trace;
    const ILPOptimalMatching strategy(params, stubFactory(SolveStatus::OPTIMAL, 1, &trace));
    const MatchingProblem problem(scores, {1, 1, 2});

    const auto result = strategy.match(problem);
    EXPECT_DOUBLE_EQ(result.total_score, 40.0);
    EXPECT_EQ(trace.calls, 2);
    EXPECT_DOUBLE_EQ(trace.last_time_limit, 4.0);
}

TEST_F(ILPOptimalMatchingTest, TimeoutWithoutRetriesFails) {
    SolveTrace trace;
    const ILPOptimalMatching strategy(SolverParams{}, stubFactory(SolveStatus::OPTIMAL, 1, &trace));
    const MatchingProblem problem(scores, {1, 1, 2});
    EXPECT_EQ(expectSolverError(strategy, problem), SolverErrorKind::TIMEOUT);
    EXPECT_EQ(trace.calls, 1);
}

TEST_F(ILPOptimalMatchingTest, RejectsInvalidSolverParameters) {
    SolverParams params;
    params.time_limit_seconds = 0.0;
    EXPECT_THROW(ILPOptimalMatching{params}, InvalidConfigurationError);

    params = SolverParams{};
    params.timeout_retries = -1;
    EXPECT_THROW(ILPOptimalMatching{params}, InvalidConfigurationError);
}
