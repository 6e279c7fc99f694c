#include <gtest/gtest.h>
#include <fstream>
#include <vector>
#include <string>
#include <filesystem>
#include <algorithm>
#include <cctype>

#include "mentor_match/errors.hpp"
#include "src/core/config/YAMLConfigLoader.hpp"

using mentor_match::config::MatchConfig;
using mentor_match::config::YAMLConfigLoader;

namespace {

std::filesystem::path repoRoot() {
    auto source_path = std::filesystem::path(__FILE__);
    return source_path.parent_path().parent_path().parent_path();
}

std::filesystem::path requiredConfigListPath() {
    return repoRoot() / "tests" / "unit" / "config" / "required_configs.txt";
}

std::string trim(const std::string& input) {
    auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char ch) { return std::isspace(ch); });
    auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char ch) { return std::isspace(ch); }).base();
    if (first >= last) {
        return {};
    }
    return std::string(first, last);
}

// Paths in the list are relative to the repository root
std::vector<std::string> loadRequiredConfigList() {
    std::vector<std::string> configs;
    std::ifstream list_file(requiredConfigListPath());
    if (!list_file.good()) {
        return configs;
    }

    std::string line;
    while (std::getline(list_file, line)) {
        auto cleaned = trim(line);
        if (cleaned.empty() || cleaned[0] == '#') {
            continue;
        }
        configs.push_back((repoRoot() / cleaned).string());
    }
    return configs;
}

const std::vector<std::string>& cachedRequiredConfigs() {
    static const std::vector<std::string> configs = loadRequiredConfigList();
    return configs;
}

std::filesystem::path exampleConfigPath() {
    return repoRoot() / "config" / "mentor_match.yaml";
}

} // namespace

class YAMLConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!std::filesystem::exists(exampleConfigPath())) {
            GTEST_SKIP() << "Example configuration not found: " << exampleConfigPath().string();
        }
        config = YAMLConfigLoader::loadFromFile(exampleConfigPath().string());
    }

    void TearDown() override {
        if (!saved_path.empty()) {
            std::error_code ec;
            std::filesystem::remove(saved_path, ec);
        }
    }

    MatchConfig config;
    std::filesystem::path saved_path;
};

TEST_F(YAMLConfigTest, ExampleConfigRunAndInputs) {
    EXPECT_EQ(config.run.name, "fall_term_matching");
    EXPECT_EQ(config.run.mode, mentor_match::RunMode::SINGLE);
    EXPECT_EQ(config.run.algorithm, mentor_match::MatchingAlgorithm::WEIGHTED_OPTIMAL);
    EXPECT_EQ(config.input.mentors_csv, "data/mentors.csv");
    EXPECT_EQ(config.input.mentees_csv, "data/mentees.csv");
    EXPECT_EQ(config.output.assignments_csv, "results/assignments.csv");
    EXPECT_TRUE(config.output.print_report);
}

TEST_F(YAMLConfigTest, ExampleConfigScoringWeights) {
    EXPECT_EQ(config.scoring.topic_overlap, mentor_match::TopicOverlapMode::COUNT);
    EXPECT_TRUE(config.scoring.require_meeting_compatibility);
    EXPECT_DOUBLE_EQ(config.scoring.in_person_colocated, 10.0);
    EXPECT_DOUBLE_EQ(config.scoring.both_online, 8.0);
    EXPECT_DOUBLE_EQ(config.scoring.flexible_meeting, 5.0);
    EXPECT_DOUBLE_EQ(config.scoring.topic_match, 5.0);
    EXPECT_DOUBLE_EQ(config.scoring.career_topic_match, 4.0);
    EXPECT_DOUBLE_EQ(config.scoring.same_program, 5.0);
    EXPECT_DOUBLE_EQ(config.scoring.senior_term, 20.0);
}

TEST_F(YAMLConfigTest, ExampleConfigHybridSolverPerformance) {
    EXPECT_DOUBLE_EQ(config.hybrid.score_tolerance, 0.05);
    EXPECT_EQ(config.hybrid.max_repair_rounds, 0);
    ASSERT_EQ(config.hybrid.priority_tags.size(), 2u);
    EXPECT_EQ(config.hybrid.priority_tags[0], "returning");
    EXPECT_EQ(config.hybrid.priority_tags[1], "program:Computer Science");

    EXPECT_EQ(config.solver.backend, "SCIP");
    EXPECT_DOUBLE_EQ(config.solver.time_limit_seconds, 30.0);
    EXPECT_EQ(config.solver.timeout_retries, 1);

    EXPECT_EQ(config.performance.num_threads, 0);
    EXPECT_TRUE(config.performance.parallel_strategies);
}

TEST_F(YAMLConfigTest, SaveAndReloadPreservesSettings) {
    config.run.mode = mentor_match::RunMode::EVALUATE_ALL;
    config.scoring.topic_overlap = mentor_match::TopicOverlapMode::JACCARD;
    config.scoring.senior_term = 12.5;
    config.hybrid.score_tolerance = 0.2;

    saved_path = std::filesystem::temp_directory_path() / "mentor_match_saved_config_test.yaml";
    YAMLConfigLoader::saveToFile(config, saved_path.string());
    const auto reloaded = YAMLConfigLoader::loadFromFile(saved_path.string());

    EXPECT_EQ(reloaded.run.name, config.run.name);
    EXPECT_EQ(reloaded.run.mode, mentor_match::RunMode::EVALUATE_ALL);
    EXPECT_EQ(reloaded.scoring.topic_overlap, mentor_match::TopicOverlapMode::JACCARD);
    EXPECT_DOUBLE_EQ(reloaded.scoring.senior_term, 12.5);
    EXPECT_DOUBLE_EQ(reloaded.hybrid.score_tolerance, 0.2);
    EXPECT_EQ(reloaded.hybrid.priority_tags, config.hybrid.priority_tags);
    EXPECT_EQ(reloaded.solver.timeout_retries, config.solver.timeout_retries);
    EXPECT_EQ(reloaded.input.mentors_csv, config.input.mentors_csv);
}

TEST(YAMLWeightOverrideTest, NamedOverridesReplaceSingleWeights) {
    mentor_match::ScoringWeights weights;
    YAMLConfigLoader::applyWeightOverride(weights, "topic_match=7.5");
    YAMLConfigLoader::applyWeightOverride(weights, " Same_Program = 0 ");
    EXPECT_DOUBLE_EQ(weights.topic_match, 7.5);
    EXPECT_DOUBLE_EQ(weights.same_program, 0.0);
    EXPECT_DOUBLE_EQ(weights.senior_term, 20.0);
}

TEST(YAMLWeightOverrideTest, RejectsMalformedOverrides) {
    mentor_match::ScoringWeights weights;
    EXPECT_THROW(YAMLConfigLoader::applyWeightOverride(weights, "topic_match"),
                 mentor_match::InvalidConfigurationError);
    EXPECT_THROW(YAMLConfigLoader::applyWeightOverride(weights, "topic_match=abc"),
                 mentor_match::InvalidConfigurationError);
    EXPECT_THROW(YAMLConfigLoader::applyWeightOverride(weights, "topic_match=5x"),
                 mentor_match::InvalidConfigurationError);
    EXPECT_THROW(YAMLConfigLoader::applyWeightOverride(weights, "height=5"),
                 mentor_match::InvalidConfigurationError);
    EXPECT_THROW(YAMLConfigLoader::applyWeightOverride(weights, "senior_term=5000"),
                 mentor_match::InvalidConfigurationError);
    EXPECT_DOUBLE_EQ(weights.topic_match, 5.0);
}

TEST(YAMLWeightOverrideTest, WeightNamesMatchTheConfigKeys) {
    const auto names = YAMLConfigLoader::weightNames();
    ASSERT_EQ(names.size(), 7u);
    EXPECT_EQ(names.front(), "in_person_colocated");
    EXPECT_EQ(names.back(), "senior_term");
}

TEST(YAMLAlgorithmSelectionTest, EvaluateAllSwitchesTheRunMode) {
    MatchConfig config;
    YAMLConfigLoader::applyAlgorithmSelection(config, "stable");
    EXPECT_EQ(config.run.algorithm, mentor_match::MatchingAlgorithm::STABLE);
    EXPECT_EQ(config.run.mode, mentor_match::RunMode::SINGLE);

    YAMLConfigLoader::applyAlgorithmSelection(config, "evaluate-all");
    EXPECT_EQ(config.run.mode, mentor_match::RunMode::EVALUATE_ALL);
    EXPECT_EQ(config.run.algorithm, mentor_match::MatchingAlgorithm::STABLE);
}

// Parameterized test for checking each config file individually
class ConfigFileTest : public ::testing::TestWithParam<std::string> {
};

TEST_P(ConfigFileTest, FileLoadsAndValidates) {
    const std::string& config_file = GetParam();
    std::ifstream test_file(config_file);
    ASSERT_TRUE(test_file.good()) << "Configuration file should exist: " << config_file;

    EXPECT_NO_THROW({
        auto loaded = YAMLConfigLoader::loadFromFile(config_file);
        (void)loaded;
    }) << config_file;
}

INSTANTIATE_TEST_SUITE_P(
    AllConfigFiles,
    ConfigFileTest,
    ::testing::ValuesIn(cachedRequiredConfigs())
);
