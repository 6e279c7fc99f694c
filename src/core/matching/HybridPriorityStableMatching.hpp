#pragma once

#include "MatchingStrategy.hpp"

namespace mentor_match::matching {

/**
 * @brief Weighted optimum followed by a bounded stability repair pass
 *
 * Starts from the WeightedOptimal assignment (the target) and repeatedly
 * resolves one blocking pair (m, e):
 * - m has a free slot: e moves to m, only if e was unassigned
 * - m is full: e takes the slot of m's worst mentee w, and w takes e's old
 *   mentor (must be eligible) or becomes unassigned when e had none
 *
 * A repair is applicable only when it keeps the total at or above
 * target x (1 - score_tolerance) and strictly lowers the blocking-pair count,
 * so the pass never ends with more blocking pairs than the target had.
 * Each round applies the applicable repair with the largest score change;
 * score-neutral candidates are ordered by mentee priority.
 *
 * Heuristic: the result is neither guaranteed optimal nor stable.
 */
class HybridPriorityStableMatching : public MatchingStrategy {
public:
    /**
     * @throws InvalidConfigurationError If the tolerance is outside [0, 1] or rounds < 0
     */
    explicit HybridPriorityStableMatching(HybridParams params = {});

    AlgorithmResult match(const MatchingProblem& problem) const override;

    std::string getName() const override { return "HybridPriorityStable"; }

    MatchingAlgorithm getType() const override { return MatchingAlgorithm::HYBRID_PRIORITY_STABLE; }

    const HybridParams& getParams() const { return params_; }

private:
    HybridParams params_;
};

} // namespace mentor_match::matching
