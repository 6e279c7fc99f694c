#pragma once

#include <string>
#include <vector>

namespace mentor_match {

    // ================================
    // ENUMS
    // ================================

    /**
     * @brief Matching algorithms available to the engine
     */
    enum class MatchingAlgorithm {
        GREEDY,                 ///< Highest remaining score first
        WEIGHTED_OPTIMAL,       ///< Maximum-weight matching over capacity slots (Hungarian)
        STABLE,                 ///< Mentee-proposing deferred acceptance with capacities
        HYBRID_PRIORITY_STABLE, ///< Weighted optimum followed by a stability repair pass
        ILP_OPTIMAL             ///< Integer program delegated to a linear solver backend
    };

    /**
     * @brief What a run should do once profiles are scored
     */
    enum class RunMode {
        SINGLE,       ///< Run the configured algorithm only
        EVALUATE_ALL  ///< Run every algorithm and rank them
    };

    /**
     * @brief Meeting preference stated on a profile
     */
    enum class MeetingPreference {
        IN_PERSON,
        ONLINE,
        NO_PREFERENCE
    };

    /**
     * @brief How topic sets contribute to the compatibility score
     */
    enum class TopicOverlapMode {
        COUNT,   ///< weight per shared topic
        JACCARD  ///< weight scaled by |A∩B| / |A∪B|
    };

    /**
     * @brief Why a strategy did not produce an assignment
     */
    enum class StrategyFailure {
        NONE,
        SOLVER_INFEASIBLE,
        SOLVER_UNAVAILABLE,
        SOLVER_TIMEOUT,
        INTERNAL_ERROR
    };

    // ================================
    // STRING CONVERSION FUNCTIONS
    // ================================

    inline std::string toString(MatchingAlgorithm algorithm) {
        switch (algorithm) {
            case MatchingAlgorithm::GREEDY: return "greedy";
            case MatchingAlgorithm::WEIGHTED_OPTIMAL: return "weighted";
            case MatchingAlgorithm::STABLE: return "stable";
            case MatchingAlgorithm::HYBRID_PRIORITY_STABLE: return "hybrid";
            case MatchingAlgorithm::ILP_OPTIMAL: return "ilp";
            default: return "unknown";
        }
    }

    inline std::string toString(MeetingPreference preference) {
        switch (preference) {
            case MeetingPreference::IN_PERSON: return "in-person";
            case MeetingPreference::ONLINE: return "online";
            case MeetingPreference::NO_PREFERENCE: return "no preference";
            default: return "unknown";
        }
    }

    inline std::string toString(TopicOverlapMode mode) {
        switch (mode) {
            case TopicOverlapMode::COUNT: return "count";
            case TopicOverlapMode::JACCARD: return "jaccard";
            default: return "unknown";
        }
    }

    inline std::string toString(StrategyFailure failure) {
        switch (failure) {
            case StrategyFailure::NONE: return "none";
            case StrategyFailure::SOLVER_INFEASIBLE: return "solver_infeasible";
            case StrategyFailure::SOLVER_UNAVAILABLE: return "solver_unavailable";
            case StrategyFailure::SOLVER_TIMEOUT: return "solver_timeout";
            case StrategyFailure::INTERNAL_ERROR: return "internal_error";
            default: return "unknown";
        }
    }

    inline std::vector<MatchingAlgorithm> allMatchingAlgorithms() {
        return {
            MatchingAlgorithm::GREEDY,
            MatchingAlgorithm::WEIGHTED_OPTIMAL,
            MatchingAlgorithm::STABLE,
            MatchingAlgorithm::HYBRID_PRIORITY_STABLE,
            MatchingAlgorithm::ILP_OPTIMAL
        };
    }

    // ================================
    // CONFIGURATION STRUCTURES
    // ================================

    /**
     * @brief Named weights for the compatibility score
     *
     * Defaults reproduce the scoring used by the program coordinators so far.
     * Passed by value into scoring; there is no global instance.
     */
    struct ScoringWeights {
        double in_person_colocated = 10.0; // both in person, same known location
        double both_online = 8.0;
        double flexible_meeting = 5.0;     // at least one side has no preference
        double topic_match = 5.0;
        double career_topic_match = 4.0;
        double same_program = 5.0;
        double senior_term = 20.0;         // mentor further along than mentee

        TopicOverlapMode topic_overlap = TopicOverlapMode::COUNT;
        bool require_meeting_compatibility = true;
    };

    struct HybridParams {
        double score_tolerance = 0.05;          // fraction of the weighted optimum that may be given up
        int max_repair_rounds = 0;              // 0 = mentees x mentors
        std::vector<std::string> priority_tags; // e.g. "returning", "program:Computer Science"
    };

    struct SolverParams {
        std::string backend = "SCIP";   // OR-Tools MPSolver backend id
        double time_limit_seconds = 30.0;
        int timeout_retries = 0;        // each retry doubles the time limit
    };

    struct PerformanceParams {
        int num_threads = 0;             // 0 = OpenMP default
        bool parallel_strategies = true; // run strategies concurrently in evaluate-all
    };

} // namespace mentor_match
