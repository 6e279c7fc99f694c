#include "Evaluator.hpp"
#include "src/core/matching/StabilityAnalysis.hpp"
#include <opencv2/core.hpp>
#include <algorithm>
#include <numeric>

namespace mentor_match::metrics {

AssignmentMetrics Evaluator::computeMetrics(const matching::AlgorithmResult& result,
                                            const scoring::ScoreMatrix& scores) {
    AssignmentMetrics metrics;
    metrics.strategy = result.name;
    metrics.algorithm = result.algorithm;
    metrics.success = result.success;
    metrics.failure = result.failure;
    metrics.error_message = result.error_message;
    metrics.runtime_ms = result.runtime_ms;
    metrics.no_eligible = static_cast<int>(result.no_eligible_mentees.size());

    if (!result.success) {
        metrics.unmatched = scores.menteeCount();
        return metrics;
    }

    const auto& assignment = result.assignment;
    metrics.total_score = assignment.totalScore(scores);
    metrics.matched = assignment.assignedCount();
    metrics.unmatched = assignment.unassignedCount();
    metrics.blocking_pairs = matching::StabilityAnalysis::countBlockingPairs(assignment, scores);

    // Pair scores
    std::vector<double> pairScores;
    pairScores.reserve(static_cast<size_t>(metrics.matched));
    for (int e = 0; e < assignment.menteeCount(); ++e) {
        if (assignment.isAssigned(e)) {
            pairScores.push_back(scores.score(assignment.mentorOf(e), e));
        }
    }
    if (!pairScores.empty()) {
        const auto [minIt, maxIt] = std::minmax_element(pairScores.begin(), pairScores.end());
        metrics.min_pair_score = *minIt;
        metrics.max_pair_score = *maxIt;
        metrics.average_pair_score =
            std::accumulate(pairScores.begin(), pairScores.end(), 0.0) / static_cast<double>(pairScores.size());
    }

    // Mentor loads
    const int mentors = assignment.mentorCount();
    if (mentors > 0) {
        cv::Mat1d loads(1, mentors);
        for (int m = 0; m < mentors; ++m) {
            loads(0, m) = assignment.load(m);
        }
        double minLoad = 0.0;
        double maxLoad = 0.0;
        cv::minMaxLoc(loads, &minLoad, &maxLoad);
        cv::Scalar mean, stddev;
        cv::meanStdDev(loads, mean, stddev);

        metrics.min_load = static_cast<int>(minLoad);
        metrics.max_load = static_cast<int>(maxLoad);
        metrics.mean_load = mean[0];
        metrics.load_stddev = stddev[0];
    }

    const auto& capacities = assignment.capacities();
    const long long totalCapacity = std::accumulate(capacities.begin(), capacities.end(), 0LL);
    if (totalCapacity > 0) {
        metrics.utilization = static_cast<double>(metrics.matched) / static_cast<double>(totalCapacity);
    }

    return metrics;
}

EvaluationReport Evaluator::evaluate(const std::vector<matching::AlgorithmResult>& results,
                                     const scoring::ScoreMatrix& scores) {
    EvaluationReport report;
    report.results = results;
    report.metrics.reserve(results.size());
    for (const auto& result : results) {
        report.metrics.push_back(computeMetrics(result, scores));
    }

    report.ranking.resize(results.size());
    std::iota(report.ranking.begin(), report.ranking.end(), 0);
    std::stable_sort(report.ranking.begin(), report.ranking.end(), [&report](size_t a, size_t b) {
        const auto& ma = report.metrics[a];
        const auto& mb = report.metrics[b];
        if (ma.success != mb.success) return ma.success;
        if (!ma.success) return false;
        if (ma.total_score != mb.total_score) return ma.total_score > mb.total_score;
        if (ma.blocking_pairs != mb.blocking_pairs) return ma.blocking_pairs < mb.blocking_pairs;
        return ma.unmatched < mb.unmatched;
    });

    for (size_t position = 0; position < report.ranking.size(); ++position) {
        report.metrics[report.ranking[position]].rank = static_cast<int>(position) + 1;
    }
    return report;
}

} // namespace mentor_match::metrics
