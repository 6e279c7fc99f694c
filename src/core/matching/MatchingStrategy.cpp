#include "MatchingStrategy.hpp"
#include <numeric>
#include <stdexcept>

namespace mentor_match::matching {

long long MatchingProblem::totalCapacity() const {
    return std::accumulate(capacities.begin(), capacities.end(), 0LL);
}

void MatchingProblem::validate() const {
    if (static_cast<int>(capacities.size()) != scores.mentorCount()) {
        throw std::invalid_argument("Capacity count (" + std::to_string(capacities.size()) +
                                    ") does not match mentor count (" +
                                    std::to_string(scores.mentorCount()) + ")");
    }
    for (size_t m = 0; m < capacities.size(); ++m) {
        if (capacities[m] < 0) {
            throw std::invalid_argument("Negative capacity for mentor " + std::to_string(m));
        }
    }
    if (!mentee_priorities.empty() && static_cast<int>(mentee_priorities.size()) != scores.menteeCount()) {
        throw std::invalid_argument("Priority count does not match mentee count");
    }
}

AlgorithmResult MatchingStrategy::makeResult(const MatchingProblem& problem, Assignment assignment) const {
    AlgorithmResult result;
    result.algorithm = getType();
    result.name = getName();
    result.total_score = assignment.totalScore(problem.scores);
    result.assignment = std::move(assignment);
    result.no_eligible_mentees = menteesWithoutEligibleMentor(problem.scores);
    return result;
}

std::vector<int> menteesWithoutEligibleMentor(const scoring::ScoreMatrix& scores) {
    std::vector<int> mentees;
    for (int e = 0; e < scores.menteeCount(); ++e) {
        if (scores.eligibleMentorCount(e) == 0) {
            mentees.push_back(e);
        }
    }
    return mentees;
}

} // namespace mentor_match::matching
