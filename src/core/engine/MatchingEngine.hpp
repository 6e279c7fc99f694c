#pragma once

#include "MatchOutcome.hpp"
#include "src/core/config/MatchConfig.hpp"
#include "src/core/matching/ILPOptimalMatching.hpp"
#include "src/core/matching/MatchingStrategy.hpp"
#include "src/core/metrics/Evaluator.hpp"
#include "src/core/profiles/ProfileStore.hpp"
#include "src/core/scoring/ScoreMatrix.hpp"
#include <optional>
#include <vector>

namespace mentor_match::engine {

/**
 * @brief Everything one engine run produced
 */
struct EngineRun {
    scoring::ScoreMatrix scores;
    metrics::EvaluationReport report;     // one entry in single mode
    std::optional<size_t> selected;       // index into report.results of the outcome's source
    MatchOutcome outcome;                 // default-constructed unless selected is set
};

/**
 * @brief Orchestrates scoring, strategy dispatch and evaluation
 *
 * Per run: build the ScoreMatrix once, run the configured strategy (or all
 * of them), evaluate and finalize. Solver failures and unexpected exceptions
 * inside a strategy are confined to that strategy's result.
 */
class MatchingEngine {
public:
    /**
     * @throws InvalidConfigurationError If the configuration does not validate
     */
    explicit MatchingEngine(config::MatchConfig config,
                            matching::ILPOptimalMatching::SolverFactory solverFactory = {});

    /// Run according to config().run.mode
    EngineRun execute(const profiles::ProfileStore& store) const;

    scoring::ScoreMatrix buildScoreMatrix(const profiles::ProfileStore& store) const;

    /// Priority per mentee: number of its tags listed in hybrid.priority_tags
    std::vector<double> menteePriorities(const profiles::ProfileStore& store) const;

    /**
     * @brief Run one strategy, capturing failures in the result
     *
     * SolverError marks the result failed with its kind; any other exception
     * becomes INTERNAL_ERROR. Runtime is measured either way.
     */
    matching::AlgorithmResult runStrategy(MatchingAlgorithm algorithm,
                                          const matching::MatchingProblem& problem) const;

    /// Run all strategies, concurrently when OpenMP is available and enabled
    std::vector<matching::AlgorithmResult> runAll(const matching::MatchingProblem& problem) const;

    /**
     * @brief Translate an assignment into e-mails and ordered rosters
     * @throws std::invalid_argument If the result did not succeed
     */
    static MatchOutcome finalize(const matching::AlgorithmResult& result,
                                 const profiles::ProfileStore& store,
                                 const scoring::ScoreMatrix& scores);

    const config::MatchConfig& config() const { return config_; }

private:
    config::MatchConfig config_;
    matching::ILPOptimalMatching::SolverFactory solverFactory_;
};

} // namespace mentor_match::engine
