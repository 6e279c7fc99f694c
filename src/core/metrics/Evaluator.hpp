#ifndef CORE_METRICS_EVALUATOR_HPP
#define CORE_METRICS_EVALUATOR_HPP

#include "src/core/matching/MatchingStrategy.hpp"
#include "src/core/scoring/ScoreMatrix.hpp"
#include <string>
#include <vector>

namespace mentor_match::metrics {

/**
 * @brief Comparison metrics for one strategy's assignment
 */
struct AssignmentMetrics {
    std::string strategy;
    MatchingAlgorithm algorithm = MatchingAlgorithm::GREEDY;
    bool success = false;
    StrategyFailure failure = StrategyFailure::NONE;
    std::string error_message;

    double total_score = 0.0;
    int matched = 0;
    int unmatched = 0;
    int blocking_pairs = -1;           // recomputed from the assignment, -1 for failed results
    int no_eligible = 0;               // mentees without any eligible mentor

    // Match quality over assigned pairs (0 when nothing is assigned)
    double average_pair_score = 0.0;
    double min_pair_score = 0.0;
    double max_pair_score = 0.0;

    // Mentor load distribution
    int min_load = 0;
    int max_load = 0;
    double mean_load = 0.0;
    double load_stddev = 0.0;
    double utilization = 0.0;          // assigned / total capacity

    double runtime_ms = 0.0;
    int rank = 0;                      // 1 = best
};

/**
 * @brief Results in input order, their metrics, and the ranking
 */
struct EvaluationReport {
    std::vector<matching::AlgorithmResult> results;
    std::vector<AssignmentMetrics> metrics;   // parallel to results
    std::vector<size_t> ranking;              // indices into results, best first

    bool empty() const { return results.empty(); }

    /// Best-ranked entry; requires a non-empty report
    const AssignmentMetrics& best() const { return metrics.at(ranking.at(0)); }
};

/**
 * @brief Computes comparison metrics and ranks strategy results
 *
 * Never modifies an assignment. Ranking: higher total score, then fewer
 * blocking pairs, then fewer unmatched mentees, then input order; failed
 * results always rank after successful ones, in input order.
 */
class Evaluator {
public:
    static AssignmentMetrics computeMetrics(const matching::AlgorithmResult& result,
                                            const scoring::ScoreMatrix& scores);

    static EvaluationReport evaluate(const std::vector<matching::AlgorithmResult>& results,
                                     const scoring::ScoreMatrix& scores);

private:
    Evaluator() = default;
};

} // namespace mentor_match::metrics

#endif // CORE_METRICS_EVALUATOR_HPP
