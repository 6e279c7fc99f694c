#include "HybridPriorityStableMatching.hpp"
#include "StabilityAnalysis.hpp"
#include "WeightedOptimalMatching.hpp"
#include "mentor_match/errors.hpp"
#include "mentor_match/logging.hpp"
#include <cmath>
#include <optional>
#include <sstream>

namespace mentor_match::matching {

namespace {

constexpr double kScoreEpsilon = 1e-9;

struct Repair {
    int mentor;        // m, preferred by the moving mentee
    int mentee;        // e, moves into m
    int displaced;     // w, leaves m; -1 when m had a free slot
    double delta;
    int blocking;      // blocking pairs after the move
    Assignment after;
};

std::optional<Repair> buildRepair(const Assignment& current, const scoring::ScoreMatrix& scores,
                                  const BlockingPair& pair) {
    const int m = pair.mentor;
    const int e = pair.mentee;
    const int o = current.mentorOf(e);

    Repair repair{m, e, -1, 0.0, 0, current};
    Assignment& next = repair.after;

    if (current.hasCapacity(m)) {
        // Moving e away from o would cost o load
        if (o != Assignment::kUnassigned) {
            return std::nullopt;
        }
        repair.delta = scores.score(m, e);
        if (!next.assign(e, m)) {
            return std::nullopt;
        }
        return repair;
    }

    const int w = StabilityAnalysis::worstHeldMentee(current, scores, m);
    if (w < 0) {
        return std::nullopt;
    }
    repair.displaced = w;

    if (o == Assignment::kUnassigned) {
        repair.delta = scores.score(m, e) - scores.score(m, w);
        next.unassign(w);
        if (!next.assign(e, m)) {
            return std::nullopt;
        }
        return repair;
    }

    if (!scores.isEligible(o, w)) {
        return std::nullopt;
    }
    repair.delta = scores.score(m, e) - scores.score(o, e) + scores.score(o, w) - scores.score(m, w);
    next.unassign(e);
    next.unassign(w);
    if (!next.assign(e, m) || !next.assign(w, o)) {
        return std::nullopt;
    }
    return repair;
}

// True when `a` should be applied before `b`
bool preferRepair(const Repair& a, const Repair& b, const MatchingProblem& problem) {
    if (std::abs(a.delta - b.delta) > kScoreEpsilon) {
        return a.delta > b.delta;
    }
    const double movedA = problem.priorityOf(a.mentee);
    const double movedB = problem.priorityOf(b.mentee);
    if (movedA != movedB) {
        return movedA > movedB;
    }
    const double displacedA = a.displaced < 0 ? -1.0 : problem.priorityOf(a.displaced);
    const double displacedB = b.displaced < 0 ? -1.0 : problem.priorityOf(b.displaced);
    if (displacedA != displacedB) {
        return displacedA < displacedB;
    }
    if (a.mentee != b.mentee) {
        return a.mentee < b.mentee;
    }
    return a.mentor < b.mentor;
}

} // namespace

HybridPriorityStableMatching::HybridPriorityStableMatching(HybridParams params)
    : params_(std::move(params)) {
    if (!std::isfinite(params_.score_tolerance) || params_.score_tolerance < 0.0 ||
        params_.score_tolerance > 1.0) {
        throw InvalidConfigurationError("hybrid.score_tolerance must be within [0, 1]");
    }
    if (params_.max_repair_rounds < 0) {
        throw InvalidConfigurationError("hybrid.max_repair_rounds must be >= 0");
    }
}

AlgorithmResult HybridPriorityStableMatching::match(const MatchingProblem& problem) const {
    const auto& scores = problem.scores;
    Assignment assignment = WeightedOptimalMatching::solve(problem);

    const double target = assignment.totalScore(scores);
    const double minimumTotal = target - params_.score_tolerance * target;
    const int maxRounds = params_.max_repair_rounds > 0
        ? params_.max_repair_rounds
        : scores.menteeCount() * scores.mentorCount();

    double total = target;
    int blocking = StabilityAnalysis::countBlockingPairs(assignment, scores);
    const int initialBlocking = blocking;

    int rounds = 0;
    while (blocking > 0 && rounds < maxRounds) {
        std::optional<Repair> best;
        for (const auto& pair : StabilityAnalysis::findBlockingPairs(assignment, scores)) {
            auto repair = buildRepair(assignment, scores, pair);
            if (!repair || total + repair->delta < minimumTotal - kScoreEpsilon) {
                continue;
            }
            repair->blocking = StabilityAnalysis::countBlockingPairs(repair->after, scores);
            if (repair->blocking >= blocking) {
                continue;
            }
            if (!best || preferRepair(*repair, *best, problem)) {
                best = std::move(repair);
            }
        }
        if (!best) {
            break;
        }

        LOG_DEBUG("Hybrid repair: mentee " + std::to_string(best->mentee) + " -> mentor " +
                  std::to_string(best->mentor) + " (delta " + std::to_string(best->delta) + ")");
        assignment = std::move(best->after);
        total = assignment.totalScore(scores);
        blocking = best->blocking;
        ++rounds;
    }

    std::ostringstream summary;
    summary << "Hybrid repair: " << rounds << " round(s), blocking pairs " << initialBlocking
            << " -> " << blocking << ", total " << target << " -> " << total;
    LOG_DEBUG(summary.str());

    AlgorithmResult result = makeResult(problem, std::move(assignment));
    result.remaining_blocking_pairs = blocking;
    return result;
}

} // namespace mentor_match::matching
