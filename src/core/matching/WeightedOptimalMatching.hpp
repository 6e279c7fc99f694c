#pragma once

#include "MatchingStrategy.hpp"

namespace mentor_match::matching {

/**
 * @brief Maximum-total-score assignment via the Hungarian algorithm
 *
 * Each mentor is expanded into one column per capacity slot, and every mentee
 * also gets a private "unassigned" column of cost 0, so leaving a mentee out is
 * always an option. Ineligible cells carry a finite cost large enough that no
 * optimal solution uses them.
 */
class WeightedOptimalMatching : public MatchingStrategy {
public:
    AlgorithmResult match(const MatchingProblem& problem) const override;

    std::string getName() const override { return "WeightedOptimal"; }

    MatchingAlgorithm getType() const override { return MatchingAlgorithm::WEIGHTED_OPTIMAL; }

    bool guaranteesOptimality() const override { return true; }

    /// The assignment alone, reused as the hybrid strategy's target
    static Assignment solve(const MatchingProblem& problem);
};

} // namespace mentor_match::matching
