#pragma once

#include "mentor_match/types.hpp"
#include <string>

namespace mentor_match::config {

    /**
     * @brief Complete configuration of one matching run
     *
     * Loaded from YAML by YAMLConfigLoader; CLI options are applied on top.
     */
    struct MatchConfig {
        // Run selection
        struct Run {
            std::string name = "mentor_match";
            RunMode mode = RunMode::SINGLE;
            MatchingAlgorithm algorithm = MatchingAlgorithm::WEIGHTED_OPTIMAL;
        } run;

        // Profile sources
        struct Input {
            std::string mentors_csv;
            std::string mentees_csv;
        } input;

        struct Output {
            std::string assignments_csv;  // Empty = do not write
            bool print_report = true;
        } output;

        ScoringWeights scoring;
        HybridParams hybrid;
        SolverParams solver;
        PerformanceParams performance;
    };

}
