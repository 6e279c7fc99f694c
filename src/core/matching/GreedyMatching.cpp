#include "GreedyMatching.hpp"
#include <algorithm>

namespace mentor_match::matching {

namespace {

struct ScoredPair {
    double score;
    int mentee;
    int mentor;
};

} // namespace

AlgorithmResult GreedyMatching::match(const MatchingProblem& problem) const {
    problem.validate();
    const auto& scores = problem.scores;
    Assignment assignment = problem.emptyAssignment();

    std::vector<ScoredPair> pairs;
    pairs.reserve(static_cast<size_t>(scores.mentorCount()) * static_cast<size_t>(scores.menteeCount()));
    for (int m = 0; m < scores.mentorCount(); ++m) {
        if (problem.capacities[m] == 0) {
            continue;
        }
        for (int e = 0; e < scores.menteeCount(); ++e) {
            if (scores.isEligible(m, e)) {
                pairs.push_back({scores.score(m, e), e, m});
            }
        }
    }

    std::sort(pairs.begin(), pairs.end(), [](const ScoredPair& a, const ScoredPair& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.mentee != b.mentee) return a.mentee < b.mentee;
        return a.mentor < b.mentor;
    });

    int remaining = scores.menteeCount();
    for (const auto& pair : pairs) {
        if (remaining == 0) {
            break;
        }
        if (assignment.isAssigned(pair.mentee)) {
            continue;
        }
        if (assignment.assign(pair.mentee, pair.mentor)) {
            --remaining;
        }
    }

    return makeResult(problem, std::move(assignment));
}

} // namespace mentor_match::matching
