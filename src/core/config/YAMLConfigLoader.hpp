#pragma once

#include "MatchConfig.hpp"
#include <yaml-cpp/yaml.h>
#include <string>
#include <vector>

namespace mentor_match::config {

    /**
     * @brief Loads, validates and writes MatchConfig as YAML
     *
     * Every load path ends in validate(); rejected settings raise
     * InvalidConfigurationError before any profile is scored.
     */
    class YAMLConfigLoader {
    public:
        /**
         * @brief Load configuration from a YAML file
         * @throws InvalidConfigurationError On unreadable YAML or invalid settings
         */
        static MatchConfig loadFromFile(const std::string& yaml_path);

        static MatchConfig loadFromString(const std::string& yaml_content);

        static MatchConfig loadFromYAML(const YAML::Node& root);

        static void saveToFile(const MatchConfig& config, const std::string& yaml_path);

        /**
         * @brief Check every range constraint of a configuration
         * @throws InvalidConfigurationError On the first violation
         */
        static void validate(const MatchConfig& config);

        /**
         * @brief Set one named scoring weight
         * @throws InvalidConfigurationError If the name is unknown or the value is outside [0, 1000]
         */
        static void applyWeightOverride(ScoringWeights& weights, const std::string& name, double value);

        /// Parse and apply a "name=value" override
        static void applyWeightOverride(ScoringWeights& weights, const std::string& assignment);

        static std::vector<std::string> weightNames();

        /// "greedy" ... "ilp", or "evaluate-all" which switches the run mode
        static void applyAlgorithmSelection(MatchConfig& config, const std::string& selection);

        static TopicOverlapMode stringToTopicOverlapMode(const std::string& str);

    private:
        static void parseRun(const YAML::Node& node, MatchConfig& config);
        static void parseInput(const YAML::Node& node, MatchConfig::Input& input);
        static void parseOutput(const YAML::Node& node, MatchConfig::Output& output);
        static void parseScoring(const YAML::Node& node, ScoringWeights& scoring);
        static void parseHybrid(const YAML::Node& node, HybridParams& hybrid);
        static void parseSolver(const YAML::Node& node, SolverParams& solver);
        static void parsePerformance(const YAML::Node& node, PerformanceParams& performance);
    };

} // namespace mentor_match::config
