#include "YAMLConfigLoader.hpp"
#include "mentor_match/errors.hpp"
#include "src/core/matching/MatchingFactory.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <set>
#include <utility>

namespace {

using WeightField = double mentor_match::ScoringWeights::*;

const std::vector<std::pair<std::string, WeightField>>& weightFields() {
    using mentor_match::ScoringWeights;
    static const std::vector<std::pair<std::string, WeightField>> fields = {
        {"in_person_colocated", &ScoringWeights::in_person_colocated},
        {"both_online", &ScoringWeights::both_online},
        {"flexible_meeting", &ScoringWeights::flexible_meeting},
        {"topic_match", &ScoringWeights::topic_match},
        {"career_topic_match", &ScoringWeights::career_topic_match},
        {"same_program", &ScoringWeights::same_program},
        {"senior_term", &ScoringWeights::senior_term}
    };
    return fields;
}

constexpr double kMaxWeight = 1000.0;

std::string trimCopy(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\n\r");
    return value.substr(first, last - first + 1);
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Every section is a map of known option names; a misspelled key must not
// silently fall back to the default.
void requireKnownKeys(const YAML::Node& node, const std::string& section,
                      const std::set<std::string>& known) {
    if (node.IsNull()) {
        return;
    }
    if (!node.IsMap()) {
        throw mentor_match::InvalidConfigurationError(
            (section.empty() ? std::string("top-level YAML node") : "section '" + section + "'") + " must be a map");
    }
    for (const auto& entry : node) {
        const auto key = entry.first.as<std::string>();
        if (known.count(key) == 0) {
            std::string names;
            for (const auto& name : known) {
                names += (names.empty() ? "" : ", ") + name;
            }
            throw mentor_match::InvalidConfigurationError(
                "unknown option '" + (section.empty() ? key : section + "." + key) + "' (known: " + names + ")");
        }
    }
}

}


namespace mentor_match::config {

    MatchConfig YAMLConfigLoader::loadFromFile(const std::string& yaml_path) {
        try {
            YAML::Node root = YAML::LoadFile(yaml_path);
            return loadFromYAML(root);
        } catch (const YAML::Exception& e) {
            throw InvalidConfigurationError("YAML parsing error in " + yaml_path + ": " + e.what());
        }
    }

    MatchConfig YAMLConfigLoader::loadFromString(const std::string& yaml_content) {
        try {
            YAML::Node root = YAML::Load(yaml_content);
            return loadFromYAML(root);
        } catch (const YAML::Exception& e) {
            throw InvalidConfigurationError("YAML parsing error: " + std::string(e.what()));
        }
    }

    MatchConfig YAMLConfigLoader::loadFromYAML(const YAML::Node& root) {
        MatchConfig config;

        if (!root || root.IsNull()) {
            validate(config);
            return config;
        }
        requireKnownKeys(root, "", {"run", "input", "output", "scoring", "hybrid", "solver", "performance"});

        // Parse each section
        if (root["run"]) {
            parseRun(root["run"], config);
        }

        if (root["input"]) {
            parseInput(root["input"], config.input);
        }

        if (root["output"]) {
            parseOutput(root["output"], config.output);
        }

        if (root["scoring"]) {
            parseScoring(root["scoring"], config.scoring);
        }

        if (root["hybrid"]) {
            parseHybrid(root["hybrid"], config.hybrid);
        }

        if (root["solver"]) {
            parseSolver(root["solver"], config.solver);
        }

        if (root["performance"]) {
            parsePerformance(root["performance"], config.performance);
        }

        validate(config);

        return config;
    }

    void YAMLConfigLoader::parseRun(const YAML::Node& node, MatchConfig& config) {
        requireKnownKeys(node, "run", {"name", "algorithm"});
        if (node["name"]) config.run.name = node["name"].as<std::string>();
        if (node["algorithm"]) applyAlgorithmSelection(config, node["algorithm"].as<std::string>());
    }

    void YAMLConfigLoader::parseInput(const YAML::Node& node, MatchConfig::Input& input) {
        requireKnownKeys(node, "input", {"mentors_csv", "mentees_csv"});
        if (node["mentors_csv"]) input.mentors_csv = node["mentors_csv"].as<std::string>();
        if (node["mentees_csv"]) input.mentees_csv = node["mentees_csv"].as<std::string>();
    }

    void YAMLConfigLoader::parseOutput(const YAML::Node& node, MatchConfig::Output& output) {
        requireKnownKeys(node, "output", {"assignments_csv", "print_report"});
        if (node["assignments_csv"]) output.assignments_csv = node["assignments_csv"].as<std::string>();
        if (node["print_report"]) output.print_report = node["print_report"].as<bool>();
    }

    void YAMLConfigLoader::parseScoring(const YAML::Node& node, ScoringWeights& scoring) {
        requireKnownKeys(node, "scoring", {"topic_overlap", "require_meeting_compatibility", "weights"});

        if (node["topic_overlap"]) {
            scoring.topic_overlap = stringToTopicOverlapMode(node["topic_overlap"].as<std::string>());
        }
        if (node["require_meeting_compatibility"]) {
            scoring.require_meeting_compatibility = node["require_meeting_compatibility"].as<bool>();
        }

        if (const auto& weights = node["weights"]) {
            if (!weights.IsMap()) {
                throw InvalidConfigurationError("scoring.weights must be a map of name: value");
            }
            for (const auto& entry : weights) {
                applyWeightOverride(scoring, entry.first.as<std::string>(), entry.second.as<double>());
            }
        }
    }

    void YAMLConfigLoader::parseHybrid(const YAML::Node& node, HybridParams& hybrid) {
        requireKnownKeys(node, "hybrid", {"score_tolerance", "max_repair_rounds", "priority_tags"});
        if (node["score_tolerance"]) hybrid.score_tolerance = node["score_tolerance"].as<double>();
        if (node["max_repair_rounds"]) hybrid.max_repair_rounds = node["max_repair_rounds"].as<int>();

        if (node["priority_tags"]) {
            if (!node["priority_tags"].IsSequence()) {
                throw InvalidConfigurationError("hybrid.priority_tags must be a list");
            }
            hybrid.priority_tags.clear();
            for (const auto& tag : node["priority_tags"]) {
                hybrid.priority_tags.push_back(trimCopy(tag.as<std::string>()));
            }
        }
    }

    void YAMLConfigLoader::parseSolver(const YAML::Node& node, SolverParams& solver) {
        requireKnownKeys(node, "solver", {"backend", "time_limit_seconds", "timeout_retries"});
        if (node["backend"]) solver.backend = node["backend"].as<std::string>();
        if (node["time_limit_seconds"]) solver.time_limit_seconds = node["time_limit_seconds"].as<double>();
        if (node["timeout_retries"]) solver.timeout_retries = node["timeout_retries"].as<int>();
    }

    void YAMLConfigLoader::parsePerformance(const YAML::Node& node, PerformanceParams& performance) {
        requireKnownKeys(node, "performance", {"num_threads", "parallel_strategies"});
        if (node["num_threads"]) performance.num_threads = node["num_threads"].as<int>();
        if (node["parallel_strategies"]) performance.parallel_strategies = node["parallel_strategies"].as<bool>();
    }

    void YAMLConfigLoader::validate(const MatchConfig& config) {
        for (const auto& [name, field] : weightFields()) {
            const double value = config.scoring.*field;
            if (!std::isfinite(value) || value < 0.0 || value > kMaxWeight) {
                throw InvalidConfigurationError("scoring.weights." + name + " must be within [0, 1000], got " +
                                                std::to_string(value));
            }
        }

        if (!std::isfinite(config.hybrid.score_tolerance) ||
            config.hybrid.score_tolerance < 0.0 || config.hybrid.score_tolerance > 1.0) {
            throw InvalidConfigurationError("hybrid.score_tolerance must be within [0, 1]");
        }
        if (config.hybrid.max_repair_rounds < 0) {
            throw InvalidConfigurationError("hybrid.max_repair_rounds must be >= 0");
        }
        for (const auto& tag : config.hybrid.priority_tags) {
            if (tag.empty()) {
                throw InvalidConfigurationError("hybrid.priority_tags must not contain empty tags");
            }
        }

        if (config.solver.backend.empty()) {
            throw InvalidConfigurationError("solver.backend is required");
        }
        if (!(config.solver.time_limit_seconds > 0.0) || !std::isfinite(config.solver.time_limit_seconds)) {
            throw InvalidConfigurationError("solver.time_limit_seconds must be > 0");
        }
        if (config.solver.timeout_retries < 0) {
            throw InvalidConfigurationError("solver.timeout_retries must be >= 0");
        }

        if (config.performance.num_threads < 0) {
            throw InvalidConfigurationError("performance.num_threads must be >= 0");
        }
    }

    void YAMLConfigLoader::applyWeightOverride(ScoringWeights& weights, const std::string& name, double value) {
        const auto key = toLowerCopy(trimCopy(name));
        const auto& fields = weightFields();
        const auto it = std::find_if(fields.begin(), fields.end(),
                                     [&key](const auto& field) { return field.first == key; });
        if (it == fields.end()) {
            std::string known;
            for (const auto& field : fields) {
                known += (known.empty() ? "" : ", ") + field.first;
            }
            throw InvalidConfigurationError("unknown weight '" + name + "' (known: " + known + ")");
        }
        if (!std::isfinite(value) || value < 0.0 || value > kMaxWeight) {
            throw InvalidConfigurationError("weight " + key + " must be within [0, 1000], got " + std::to_string(value));
        }
        weights.*(it->second) = value;
    }

    void YAMLConfigLoader::applyWeightOverride(ScoringWeights& weights, const std::string& assignment) {
        const auto eq = assignment.find('=');
        if (eq == std::string::npos) {
            throw InvalidConfigurationError("weight override '" + assignment + "' must look like name=value");
        }
        const auto name = trimCopy(assignment.substr(0, eq));
        const auto text = trimCopy(assignment.substr(eq + 1));

        double value = 0.0;
        size_t consumed = 0;
        try {
            value = std::stod(text, &consumed);
        } catch (const std::exception&) {
            throw InvalidConfigurationError("weight override '" + assignment + "' has a non-numeric value");
        }
        if (consumed != text.size()) {
            throw InvalidConfigurationError("weight override '" + assignment + "' has a non-numeric value");
        }
        applyWeightOverride(weights, name, value);
    }

    std::vector<std::string> YAMLConfigLoader::weightNames() {
        std::vector<std::string> names;
        for (const auto& field : weightFields()) {
            names.push_back(field.first);
        }
        return names;
    }

    void YAMLConfigLoader::applyAlgorithmSelection(MatchConfig& config, const std::string& selection) {
        const auto normalized = toLowerCopy(trimCopy(selection));
        if (normalized == "evaluate-all" || normalized == "evaluate_all" || normalized == "all") {
            config.run.mode = RunMode::EVALUATE_ALL;
            return;
        }
        config.run.algorithm = matching::MatchingFactory::algorithmFromName(normalized);
        config.run.mode = RunMode::SINGLE;
    }

    TopicOverlapMode YAMLConfigLoader::stringToTopicOverlapMode(const std::string& str) {
        const auto normalized = toLowerCopy(trimCopy(str));
        if (normalized == "count" || normalized == "intersection") return TopicOverlapMode::COUNT;
        if (normalized == "jaccard") return TopicOverlapMode::JACCARD;
        throw InvalidConfigurationError("unknown topic_overlap mode: " + str);
    }

    void YAMLConfigLoader::saveToFile(const MatchConfig& config, const std::string& yaml_path) {
        YAML::Emitter out;

        out << YAML::BeginMap;

        // Run section
        out << YAML::Key << "run";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << config.run.name;
        out << YAML::Key << "algorithm" << YAML::Value
            << (config.run.mode == RunMode::EVALUATE_ALL ? std::string("evaluate-all") : toString(config.run.algorithm));
        out << YAML::EndMap;

        // Input section
        out << YAML::Key << "input";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "mentors_csv" << YAML::Value << config.input.mentors_csv;
        out << YAML::Key << "mentees_csv" << YAML::Value << config.input.mentees_csv;
        out << YAML::EndMap;

        // Output section
        out << YAML::Key << "output";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "assignments_csv" << YAML::Value << config.output.assignments_csv;
        out << YAML::Key << "print_report" << YAML::Value << config.output.print_report;
        out << YAML::EndMap;

        // Scoring section
        out << YAML::Key << "scoring";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "topic_overlap" << YAML::Value << toString(config.scoring.topic_overlap);
        out << YAML::Key << "require_meeting_compatibility" << YAML::Value
            << config.scoring.require_meeting_compatibility;
        out << YAML::Key << "weights" << YAML::Value << YAML::BeginMap;
        for (const auto& [name, field] : weightFields()) {
            out << YAML::Key << name << YAML::Value << config.scoring.*field;
        }
        out << YAML::EndMap;
        out << YAML::EndMap;

        // Hybrid section
        out << YAML::Key << "hybrid";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "score_tolerance" << YAML::Value << config.hybrid.score_tolerance;
        out << YAML::Key << "max_repair_rounds" << YAML::Value << config.hybrid.max_repair_rounds;
        out << YAML::Key << "priority_tags" << YAML::Value << config.hybrid.priority_tags;
        out << YAML::EndMap;

        // Solver section
        out << YAML::Key << "solver";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "backend" << YAML::Value << config.solver.backend;
        out << YAML::Key << "time_limit_seconds" << YAML::Value << config.solver.time_limit_seconds;
        out << YAML::Key << "timeout_retries" << YAML::Value << config.solver.timeout_retries;
        out << YAML::EndMap;

        // Performance section
        out << YAML::Key << "performance";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "num_threads" << YAML::Value << config.performance.num_threads;
        out << YAML::Key << "parallel_strategies" << YAML::Value << config.performance.parallel_strategies;
        out << YAML::EndMap;

        out << YAML::EndMap;

        // Write to file
        std::ofstream file(yaml_path);
        if (!file) {
            throw std::runtime_error("Cannot write configuration to " + yaml_path);
        }
        file << out.c_str();
    }

} // namespace mentor_match::config
