#include "StabilityAnalysis.hpp"
#include <limits>

namespace mentor_match::matching {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

// Score a mentor must beat to take one more mentee: -inf with a free slot,
// the worst held score when full, +inf for a zero-capacity mentor.
std::vector<double> mentorThresholds(const Assignment& assignment, const scoring::ScoreMatrix& scores) {
    std::vector<double> thresholds(static_cast<size_t>(assignment.mentorCount()), kInf);
    for (int m = 0; m < assignment.mentorCount(); ++m) {
        if (assignment.hasCapacity(m)) {
            thresholds[m] = -kInf;
        } else if (const int worst = StabilityAnalysis::worstHeldMentee(assignment, scores, m); worst >= 0) {
            thresholds[m] = scores.score(m, worst);
        }
    }
    return thresholds;
}

template <typename Visitor>
void forEachBlockingPair(const Assignment& assignment, const scoring::ScoreMatrix& scores, Visitor&& visit) {
    const auto thresholds = mentorThresholds(assignment, scores);
    for (int e = 0; e < assignment.menteeCount(); ++e) {
        const int current = assignment.mentorOf(e);
        const double currentScore = current == Assignment::kUnassigned ? -kInf : scores.score(current, e);
        for (int m = 0; m < assignment.mentorCount(); ++m) {
            if (m == current || !scores.isEligible(m, e)) {
                continue;
            }
            const double s = scores.score(m, e);
            if (s > currentScore && s > thresholds[m]) {
                visit(m, e);
            }
        }
    }
}

} // namespace

int StabilityAnalysis::worstHeldMentee(const Assignment& assignment, const scoring::ScoreMatrix& scores,
                                       int mentor) {
    int worst = -1;
    for (int e : assignment.menteesOf(mentor)) {
        if (worst < 0) {
            worst = e;
            continue;
        }
        const double s = scores.score(mentor, e);
        const double w = scores.score(mentor, worst);
        if (s < w || (s == w && e > worst)) {
            worst = e;
        }
    }
    return worst;
}

std::vector<BlockingPair> StabilityAnalysis::findBlockingPairs(const Assignment& assignment,
                                                               const scoring::ScoreMatrix& scores) {
    std::vector<BlockingPair> pairs;
    forEachBlockingPair(assignment, scores, [&pairs](int m, int e) { pairs.push_back({m, e}); });
    return pairs;
}

int StabilityAnalysis::countBlockingPairs(const Assignment& assignment, const scoring::ScoreMatrix& scores) {
    int count = 0;
    forEachBlockingPair(assignment, scores, [&count](int, int) { ++count; });
    return count;
}

} // namespace mentor_match::matching
