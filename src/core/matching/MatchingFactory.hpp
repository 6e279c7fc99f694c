#pragma once

#include "MatchingStrategy.hpp"
#include "ILPOptimalMatching.hpp"
#include "mentor_match/types.hpp"
#include <memory>
#include <vector>
#include <string>

namespace mentor_match::matching {

/**
 * @brief Factory for creating matching strategy instances
 *
 * The set of strategies is closed and keyed by MatchingAlgorithm:
 * - GREEDY: highest remaining score first
 * - WEIGHTED_OPTIMAL: Hungarian over capacity slots
 * - STABLE: mentee-proposing deferred acceptance
 * - HYBRID_PRIORITY_STABLE: weighted optimum plus stability repair
 * - ILP_OPTIMAL: integer program through an ILinearSolver
 */
class MatchingFactory {
public:
    /**
     * @brief Create a strategy with default parameters
     * @throws std::runtime_error If the algorithm is unknown
     */
    static MatchingStrategyPtr createStrategy(MatchingAlgorithm algorithm);

    /**
     * @brief Create a strategy with explicit hybrid and solver parameters
     *
     * @param solverFactory Backend source for ILP_OPTIMAL; empty uses the compiled-in backend
     * @throws std::runtime_error If the algorithm is unknown
     * @throws InvalidConfigurationError If the parameters are out of range
     */
    static MatchingStrategyPtr createStrategy(MatchingAlgorithm algorithm,
                                              const HybridParams& hybrid,
                                              const SolverParams& solver,
                                              ILPOptimalMatching::SolverFactory solverFactory = {});

    /**
     * @brief Get list of all available matching strategy names
     * @return Strategy names in MatchingAlgorithm order
     */
    static std::vector<std::string> getAvailableStrategies();

    /**
     * @brief Parse a selection name ("greedy", "weighted", "stable", "hybrid", "ilp")
     * @throws InvalidConfigurationError If the name is not recognised
     */
    static MatchingAlgorithm algorithmFromName(const std::string& name);

private:
    MatchingFactory() = default; // Static class, no instantiation
};

} // namespace mentor_match::matching
