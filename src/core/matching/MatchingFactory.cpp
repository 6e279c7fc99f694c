#include "MatchingFactory.hpp"
#include "GreedyMatching.hpp"
#include "HybridPriorityStableMatching.hpp"
#include "StableMatching.hpp"
#include "WeightedOptimalMatching.hpp"
#include "mentor_match/errors.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace mentor_match::matching {

MatchingStrategyPtr MatchingFactory::createStrategy(MatchingAlgorithm algorithm) {
    return createStrategy(algorithm, HybridParams{}, SolverParams{});
}

MatchingStrategyPtr MatchingFactory::createStrategy(MatchingAlgorithm algorithm,
                                                    const HybridParams& hybrid,
                                                    const SolverParams& solver,
                                                    ILPOptimalMatching::SolverFactory solverFactory) {
    switch (algorithm) {
        case MatchingAlgorithm::GREEDY:
            return std::make_unique<GreedyMatching>();

        case MatchingAlgorithm::WEIGHTED_OPTIMAL:
            return std::make_unique<WeightedOptimalMatching>();

        case MatchingAlgorithm::STABLE:
            return std::make_unique<StableMatching>();

        case MatchingAlgorithm::HYBRID_PRIORITY_STABLE:
            return std::make_unique<HybridPriorityStableMatching>(hybrid);

        case MatchingAlgorithm::ILP_OPTIMAL:
            return std::make_unique<ILPOptimalMatching>(solver, std::move(solverFactory));

        default:
            throw std::runtime_error("Unknown matching algorithm: " + std::to_string(static_cast<int>(algorithm)));
    }
}

std::vector<std::string> MatchingFactory::getAvailableStrategies() {
    return {
        "Greedy",
        "WeightedOptimal",
        "Stable",
        "HybridPriorityStable",
        "ILPOptimal"
    };
}

MatchingAlgorithm MatchingFactory::algorithmFromName(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "greedy") return MatchingAlgorithm::GREEDY;
    if (lowered == "weighted" || lowered == "weighted-optimal" || lowered == "hungarian")
        return MatchingAlgorithm::WEIGHTED_OPTIMAL;
    if (lowered == "stable" || lowered == "gale-shapley") return MatchingAlgorithm::STABLE;
    if (lowered == "hybrid" || lowered == "hybrid-priority-stable" || lowered == "gata-mixed")
        return MatchingAlgorithm::HYBRID_PRIORITY_STABLE;
    if (lowered == "ilp" || lowered == "ilp-optimal" || lowered == "ortools") return MatchingAlgorithm::ILP_OPTIMAL;

    throw InvalidConfigurationError("Unknown algorithm '" + name +
                                    "' (expected greedy, weighted, stable, hybrid or ilp)");
}

} // namespace mentor_match::matching
