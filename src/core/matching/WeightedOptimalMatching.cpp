#include "WeightedOptimalMatching.hpp"
#include "HungarianSolver.hpp"
#include <algorithm>
#include <stdexcept>

namespace mentor_match::matching {

Assignment WeightedOptimalMatching::solve(const MatchingProblem& problem) {
    problem.validate();
    const auto& scores = problem.scores;
    const int mentees = scores.menteeCount();
    Assignment assignment = problem.emptyAssignment();
    if (mentees == 0 || scores.mentorCount() == 0) {
        return assignment;
    }

    // Slot columns; a mentor never needs more slots than there are mentees
    std::vector<int> slotMentor;
    for (int m = 0; m < scores.mentorCount(); ++m) {
        const int slots = std::min(problem.capacities[m], mentees);
        slotMentor.insert(slotMentor.end(), static_cast<size_t>(slots), m);
    }
    const int slotCount = static_cast<int>(slotMentor.size());

    // Any solution touching a forbidden cell costs more than leaving everyone out
    const double forbidden = (scores.maxScore() + 1.0) * (mentees + 1);

    cv::Mat1d cost(mentees, slotCount + mentees, forbidden);
    for (int e = 0; e < mentees; ++e) {
        for (int s = 0; s < slotCount; ++s) {
            const int m = slotMentor[s];
            if (scores.isEligible(m, e)) {
                cost(e, s) = -scores.score(m, e);
            }
        }
        cost(e, slotCount + e) = 0.0;
    }

    const auto rowToCol = solveMinCostAssignment(cost);
    for (int e = 0; e < mentees; ++e) {
        const int col = rowToCol[e];
        if (col < 0 || col >= slotCount) {
            continue;
        }
        const int m = slotMentor[col];
        if (scores.isEligible(m, e) && !assignment.assign(e, m)) {
            throw std::logic_error("Slot expansion assigned more mentees than mentor capacity");
        }
    }
    return assignment;
}

AlgorithmResult WeightedOptimalMatching::match(const MatchingProblem& problem) const {
    return makeResult(problem, solve(problem));
}

} // namespace mentor_match::matching
