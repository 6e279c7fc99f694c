#include <gtest/gtest.h>
#include "mentor_match/errors.hpp"
#include "src/core/config/YAMLConfigLoader.hpp"
#include "mentor_match/types.hpp"
#include <string>
#include <vector>

using mentor_match::config::YAMLConfigLoader;
using mentor_match::InvalidConfigurationError;
using mentor_match::MatchingAlgorithm;

TEST(YAMLValidationErrors, EmptyDocumentUsesDefaults) {
    EXPECT_NO_THROW({
        auto cfg = YAMLConfigLoader::loadFromString("");
        EXPECT_EQ(cfg.run.algorithm, MatchingAlgorithm::WEIGHTED_OPTIMAL);
        EXPECT_EQ(cfg.run.mode, mentor_match::RunMode::SINGLE);
        EXPECT_DOUBLE_EQ(cfg.scoring.senior_term, 20.0);
    });
}

TEST(YAMLValidationErrors, RootMustBeAMap) {
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString("- a\n- b\n"); (void)cfg; }, InvalidConfigurationError);
}

TEST(YAMLValidationErrors, MalformedYamlIsInvalidConfiguration) {
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString("run: { name: [unclosed"); (void)cfg; },
                 InvalidConfigurationError);
}

TEST(YAMLValidationErrors, UnknownAlgorithm) {
    const char* yaml = R"YAML(
run: { algorithm: random }
)YAML";
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString(yaml); (void)cfg; }, InvalidConfigurationError);
}

TEST(YAMLValidationErrors, UnknownWeightName) {
    const char* yaml = R"YAML(
scoring:
  weights: { same_program: 3, shoe_size: 2 }
)YAML";
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString(yaml); (void)cfg; }, InvalidConfigurationError);
}

TEST(YAMLValidationErrors, WeightOutOfRange) {
    const char* yaml = R"YAML(
scoring:
  weights: { topic_match: 1001 }
)YAML";
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString(yaml); (void)cfg; }, InvalidConfigurationError);

    const char* negative = R"YAML(
scoring:
  weights: { both_online: -1 }
)YAML";
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString(negative); (void)cfg; }, InvalidConfigurationError);
}

TEST(YAMLValidationErrors, WeightsMustBeAMap) {
    const char* yaml = R"YAML(
scoring:
  weights: [1, 2, 3]
)YAML";
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString(yaml); (void)cfg; }, InvalidConfigurationError);
}

TEST(YAMLValidationErrors, UnknownTopicOverlapMode) {
    const char* yaml = R"YAML(
scoring: { topic_overlap: cosine }
)YAML";
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString(yaml); (void)cfg; }, InvalidConfigurationError);
}

TEST(YAMLValidationErrors, HybridToleranceOutOfRange) {
    const char* yaml = R"YAML(
hybrid: { score_tolerance: 1.5 }
)YAML";
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString(yaml); (void)cfg; }, InvalidConfigurationError);
}

TEST(YAMLValidationErrors, NegativeRepairRounds) {
    const char* yaml = R"YAML(
hybrid: { max_repair_rounds: -2 }
)YAML";
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString(yaml); (void)cfg; }, InvalidConfigurationError);
}

TEST(YAMLValidationErrors, PriorityTagsMustBeAList) {
    const char* yaml = R"YAML(
hybrid: { priority_tags: returning }
)YAML";
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString(yaml); (void)cfg; }, InvalidConfigurationError);
}

TEST(YAMLValidationErrors, SolverTimeLimitMustBePositive) {
    const char* yaml = R"YAML(
solver: { backend: SCIP, time_limit_seconds: 0 }
)YAML";
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString(yaml); (void)cfg; }, InvalidConfigurationError);
}

TEST(YAMLValidationErrors, SolverBackendRequired) {
    const char* yaml = R"YAML(
solver: { backend: "" }
)YAML";
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString(yaml); (void)cfg; }, InvalidConfigurationError);
}

TEST(YAMLValidationErrors, NegativeThreadCount) {
    const char* yaml = R"YAML(
performance: { num_threads: -1 }
)YAML";
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString(yaml); (void)cfg; }, InvalidConfigurationError);
}

TEST(YAMLValidationErrors, MissingFileIsInvalidConfiguration) {
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromFile("/nonexistent/mentor_match.yaml"); (void)cfg; },
                 InvalidConfigurationError);
}

TEST(YAMLValidationErrors, MisspelledSectionKeyIsRejected) {
    const char* hybrid = R"YAML(
hybrid: { score_tolerence: 0.5 }
)YAML";
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString(hybrid); (void)cfg; }, InvalidConfigurationError);

    const char* solver = R"YAML(
solver: { backend: SCIP, time_limit: 5 }
)YAML";
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString(solver); (void)cfg; }, InvalidConfigurationError);
}

TEST(YAMLValidationErrors, UnknownKeyRejectedInEverySection) {
    const std::vector<std::string> documents = {
        "unexpected: 1\n",
        "run: { algoritm: stable }\n",
        "input: { mentor_csv: m.csv }\n",
        "output: { assignment_csv: out.csv }\n",
        "scoring: { overlap: count }\n",
        "performance: { threads: 2 }\n"
    };
    for (const auto& yaml : documents) {
        EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString(yaml); (void)cfg; }, InvalidConfigurationError)
            << yaml;
    }
}

TEST(YAMLValidationErrors, SectionMustBeAMap) {
    EXPECT_THROW({ auto cfg = YAMLConfigLoader::loadFromString("solver: SCIP\n"); (void)cfg; },
                 InvalidConfigurationError);
}

TEST(YAMLValidationErrors, EmptySectionKeepsDefaults) {
    EXPECT_NO_THROW({
        auto cfg = YAMLConfigLoader::loadFromString("hybrid:\nsolver:\n");
        EXPECT_DOUBLE_EQ(cfg.hybrid.score_tolerance, 0.05);
        EXPECT_EQ(cfg.solver.backend, "SCIP");
    });
}
