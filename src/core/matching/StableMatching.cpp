#include "StableMatching.hpp"
#include "StabilityAnalysis.hpp"
#include "mentor_match/logging.hpp"
#include <deque>
#include <stdexcept>

namespace mentor_match::matching {

AlgorithmResult StableMatching::match(const MatchingProblem& problem) const {
    problem.validate();
    const auto& scores = problem.scores;
    const int mentees = scores.menteeCount();
    Assignment assignment = problem.emptyAssignment();

    std::vector<std::vector<int>> preferences(static_cast<size_t>(mentees));
    std::vector<size_t> nextChoice(static_cast<size_t>(mentees), 0);
    std::deque<int> free;
    for (int e = 0; e < mentees; ++e) {
        preferences[e] = scores.rankedMentorsFor(e);
        free.push_back(e);
    }

    // A mentor prefers a higher score, then the lower mentee index
    auto mentorPrefers = [&scores](int mentor, int a, int b) {
        const double sa = scores.score(mentor, a);
        const double sb = scores.score(mentor, b);
        return sa > sb || (sa == sb && a < b);
    };

    long long proposals = 0;
    while (!free.empty()) {
        const int e = free.front();
        free.pop_front();
        if (nextChoice[e] >= preferences[e].size()) {
            continue; // list exhausted, stays unassigned
        }

        const int m = preferences[e][nextChoice[e]++];
        ++proposals;

        if (assignment.assign(e, m)) {
            continue;
        }

        const int worst = StabilityAnalysis::worstHeldMentee(assignment, scores, m);
        if (worst >= 0 && mentorPrefers(m, e, worst)) {
            assignment.unassign(worst);
            if (!assignment.assign(e, m)) {
                throw std::logic_error("Mentor slot vanished after releasing a mentee");
            }
            free.push_back(worst);
        } else {
            free.push_back(e);
        }
    }

    LOG_DEBUG("Stable matching settled after " + std::to_string(proposals) + " proposals");

    AlgorithmResult result = makeResult(problem, std::move(assignment));
    result.remaining_blocking_pairs = StabilityAnalysis::countBlockingPairs(result.assignment, scores);
    return result;
}

} // namespace mentor_match::matching
