#pragma once

#include "MatchingStrategy.hpp"

namespace mentor_match::matching {

/**
 * @brief Mentee-proposing deferred acceptance with mentor capacities
 *
 * Algorithm:
 * 1. Every free mentee proposes to its best mentor not yet tried
 * 2. A mentor keeps its `capacity` best proposals so far (score, then lower
 *    mentee index) and rejects the rest
 * 3. Rejected mentees continue down their list until accepted or exhausted
 *
 * Both sides rank by the same compatibility score. The result has no
 * blocking pair and is reached after at most mentees x mentors proposals.
 */
class StableMatching : public MatchingStrategy {
public:
    AlgorithmResult match(const MatchingProblem& problem) const override;

    std::string getName() const override { return "Stable"; }

    MatchingAlgorithm getType() const override { return MatchingAlgorithm::STABLE; }

    bool guaranteesStability() const override { return true; }
};

} // namespace mentor_match::matching
