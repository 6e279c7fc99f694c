#pragma once

#include "MatchingStrategy.hpp"

namespace mentor_match::matching {

/**
 * @brief Highest-score-first baseline
 *
 * Sorts every eligible pair by descending score (ties: mentee index, then
 * mentor index) and walks the list once, keeping a pair when the mentee is
 * still free and the mentor still has a slot. No optimality guarantee.
 */
class GreedyMatching : public MatchingStrategy {
public:
    AlgorithmResult match(const MatchingProblem& problem) const override;

    std::string getName() const override { return "Greedy"; }

    MatchingAlgorithm getType() const override { return MatchingAlgorithm::GREEDY; }
};

} // namespace mentor_match::matching
