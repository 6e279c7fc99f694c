#pragma once

#include "Assignment.hpp"
#include "src/core/scoring/ScoreMatrix.hpp"
#include <vector>

namespace mentor_match::matching {

struct BlockingPair {
    int mentor;
    int mentee;

    bool operator==(const BlockingPair& other) const {
        return mentor == other.mentor && mentee == other.mentee;
    }
};

/**
 * @brief Blocking-pair detection for capacitated assignments
 *
 * An eligible pair (m, e) not matched together blocks the assignment when
 * - e is unassigned, or scores m strictly above its current mentor, and
 * - m has a free slot, or scores e strictly above the lowest-scoring mentee it holds.
 *
 * Preferences on both sides come from the same raw score, so ties never block.
 */
class StabilityAnalysis {
public:
    /// All blocking pairs, mentee-major then mentor index order
    static std::vector<BlockingPair> findBlockingPairs(const Assignment& assignment,
                                                       const scoring::ScoreMatrix& scores);

    static int countBlockingPairs(const Assignment& assignment, const scoring::ScoreMatrix& scores);

    static bool isStable(const Assignment& assignment, const scoring::ScoreMatrix& scores) {
        return countBlockingPairs(assignment, scores) == 0;
    }

    /**
     * @brief Held mentee with the lowest score for a mentor
     * @return Mentee index (highest index among equal scores), or -1 for an empty bucket
     */
    static int worstHeldMentee(const Assignment& assignment, const scoring::ScoreMatrix& scores, int mentor);

private:
    StabilityAnalysis() = default;
};

} // namespace mentor_match::matching
