#pragma once

#include "src/core/config/MatchConfig.hpp"
#include <string>
#include <vector>

namespace mentor_match::cli::mentor_match_cli {

struct CliOptions {
    std::string config_path;
    std::string mentors_csv;
    std::string mentees_csv;
    std::string algorithm;                       // empty = keep config value
    std::vector<std::string> weight_overrides;   // "name=value", applied in order
    bool evaluate_all = false;
    std::string output_csv;
    int threads = -1;                            // -1 = keep config value
    bool verbose = false;
    bool quiet = false;
};

enum class ParseStatus {
    OK,
    HELP,
    USAGE_ERROR
};

struct ParseResult {
    ParseStatus status = ParseStatus::OK;
    CliOptions options;
    std::string error;
};

void printUsage(const std::string& binaryName);

// Parse argv without printing; the caller decides what to show for HELP and USAGE_ERROR.
ParseResult parseArgs(int argc, char** argv);

// Load the YAML config (if any) and apply command-line overrides on top.
// Throws InvalidConfigurationError for bad values or selections.
config::MatchConfig buildConfig(const CliOptions& options);

} // namespace mentor_match::cli::mentor_match_cli
