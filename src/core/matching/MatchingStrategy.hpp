#pragma once

#include "Assignment.hpp"
#include "mentor_match/types.hpp"
#include "src/core/scoring/ScoreMatrix.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mentor_match::matching {

/**
 * @brief Everything a strategy needs to produce an assignment
 *
 * The score matrix is borrowed and must outlive the problem. Capacities are
 * indexed like score matrix rows; priorities like its columns.
 */
struct MatchingProblem {
    const scoring::ScoreMatrix& scores;
    std::vector<int> capacities;
    std::vector<double> mentee_priorities; ///< empty = every mentee priority 0

    MatchingProblem(const scoring::ScoreMatrix& scoreMatrix, std::vector<int> mentorCapacities,
                    std::vector<double> priorities = {})
        : scores(scoreMatrix),
          capacities(std::move(mentorCapacities)),
          mentee_priorities(std::move(priorities)) {}

    int mentorCount() const { return scores.mentorCount(); }
    int menteeCount() const { return scores.menteeCount(); }

    double priorityOf(int mentee) const {
        return mentee < static_cast<int>(mentee_priorities.size()) ? mentee_priorities[mentee] : 0.0;
    }

    long long totalCapacity() const;

    Assignment emptyAssignment() const { return Assignment(capacities, menteeCount()); }

    /**
     * @brief Check that capacities and priorities fit the matrix
     * @throws std::invalid_argument On any size or sign mismatch
     */
    void validate() const;
};

/**
 * @brief One strategy's output
 */
struct AlgorithmResult {
    MatchingAlgorithm algorithm = MatchingAlgorithm::GREEDY;
    std::string name;
    Assignment assignment;
    double total_score = 0.0;

    bool success = true;
    StrategyFailure failure = StrategyFailure::NONE;
    std::string error_message;

    std::vector<int> no_eligible_mentees;  ///< mentees with zero eligible mentors
    int remaining_blocking_pairs = -1;     ///< -1 when the strategy does not report it
    double runtime_ms = 0.0;
};

/**
 * @brief Abstract base for all mentor/mentee matching strategies
 *
 * Strategies are pure over the problem: no shared mutable state, so separate
 * instances may run concurrently on the same ScoreMatrix.
 */
class MatchingStrategy {
public:
    virtual ~MatchingStrategy() = default;

    /**
     * @brief Compute an assignment
     * @throws SolverError Only from strategies backed by an external solver
     */
    virtual AlgorithmResult match(const MatchingProblem& problem) const = 0;

    virtual std::string getName() const = 0;

    virtual MatchingAlgorithm getType() const = 0;

    /// True when every produced assignment has zero blocking pairs
    virtual bool guaranteesStability() const { return false; }

    /// True when every produced assignment has the maximum total score
    virtual bool guaranteesOptimality() const { return false; }

protected:
    /**
     * @brief Wrap an assignment into a result tagged with this strategy
     *
     * Fills the total score and the list of mentees that had no eligible mentor.
     */
    AlgorithmResult makeResult(const MatchingProblem& problem, Assignment assignment) const;
};

using MatchingStrategyPtr = std::unique_ptr<MatchingStrategy>;

/// Mentees that no mentor may take, in ascending index order
std::vector<int> menteesWithoutEligibleMentor(const scoring::ScoreMatrix& scores);

} // namespace mentor_match::matching
