#include "cli_args.hpp"
#include "src/core/config/YAMLConfigLoader.hpp"
#include <iostream>

namespace mentor_match::cli::mentor_match_cli {

namespace {

bool parseInt(const std::string& text, int& value) {
    if (text.empty() || text.size() > 6) {
        return false;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    value = std::stoi(text);
    return true;
}

} // namespace

void printUsage(const std::string& binaryName) {
    std::cout << "Usage: " << binaryName << " --mentors <mentors.csv> --mentees <mentees.csv> [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -c, --config <file>        YAML run configuration (CLI options override it)" << std::endl;
    std::cout << "  -m, --mentors <file>       Mentor profiles CSV" << std::endl;
    std::cout << "  -e, --mentees <file>       Mentee profiles CSV" << std::endl;
    std::cout << "  -a, --algorithm <name>     greedy | weighted | stable | hybrid | ilp (default: weighted)" << std::endl;
    std::cout << "      --evaluate-all         Run every algorithm and print a ranked comparison" << std::endl;
    std::cout << "  -w, --weight <name=value>  Override a scoring weight (repeatable)" << std::endl;
    std::cout << "  -o, --output <file>        Write the selected assignment as CSV" << std::endl;
    std::cout << "  -j, --threads <n>          Worker threads for --evaluate-all (0 = default)" << std::endl;
    std::cout << "  -v, --verbose              Debug logging" << std::endl;
    std::cout << "  -q, --quiet                Warnings and errors only" << std::endl;
    std::cout << "  -h, --help                 Show this help message and exit" << std::endl;
    std::cout << "Weights:";
    for (const auto& name : config::YAMLConfigLoader::weightNames()) {
        std::cout << " " << name;
    }
    std::cout << std::endl;
    std::cout << "Example:" << std::endl;
    std::cout << "  " << binaryName << " -m mentors.csv -e mentees.csv --evaluate-all -o matches.csv" << std::endl;
}

ParseResult parseArgs(int argc, char** argv) {
    ParseResult result;
    auto& options = result.options;

    const auto fail = [&result](const std::string& message) {
        result.status = ParseStatus::USAGE_ERROR;
        result.error = message;
        return result;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            result.status = ParseStatus::HELP;
            return result;
        }
        if (arg == "--evaluate-all") {
            options.evaluate_all = true;
            continue;
        }
        if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            options.quiet = true;
            continue;
        }

        const bool takesValue =
            arg == "-c" || arg == "--config" || arg == "-m" || arg == "--mentors" ||
            arg == "-e" || arg == "--mentees" || arg == "-a" || arg == "--algorithm" ||
            arg == "-w" || arg == "--weight" || arg == "-o" || arg == "--output" ||
            arg == "-j" || arg == "--threads";
        if (!takesValue) {
            return fail("Unknown argument: " + arg);
        }
        if (i + 1 >= argc) {
            return fail("Missing value for " + arg);
        }
        const std::string value = argv[++i];

        if (arg == "-c" || arg == "--config") {
            options.config_path = value;
        } else if (arg == "-m" || arg == "--mentors") {
            options.mentors_csv = value;
        } else if (arg == "-e" || arg == "--mentees") {
            options.mentees_csv = value;
        } else if (arg == "-a" || arg == "--algorithm") {
            options.algorithm = value;
        } else if (arg == "-w" || arg == "--weight") {
            if (value.find('=') == std::string::npos) {
                return fail("Weight override must be name=value: " + value);
            }
            options.weight_overrides.push_back(value);
        } else if (arg == "-o" || arg == "--output") {
            options.output_csv = value;
        } else {
            if (!parseInt(value, options.threads)) {
                return fail("Thread count must be a non-negative integer: " + value);
            }
        }
    }

    if (options.verbose && options.quiet) {
        return fail("--verbose and --quiet are mutually exclusive");
    }
    if (options.evaluate_all && !options.algorithm.empty()) {
        return fail("--evaluate-all cannot be combined with --algorithm");
    }
    return result;
}

config::MatchConfig buildConfig(const CliOptions& options) {
    config::MatchConfig config;
    if (!options.config_path.empty()) {
        config = config::YAMLConfigLoader::loadFromFile(options.config_path);
    }

    if (!options.mentors_csv.empty()) {
        config.input.mentors_csv = options.mentors_csv;
    }
    if (!options.mentees_csv.empty()) {
        config.input.mentees_csv = options.mentees_csv;
    }
    if (options.evaluate_all) {
        config.run.mode = RunMode::EVALUATE_ALL;
    } else if (!options.algorithm.empty()) {
        config::YAMLConfigLoader::applyAlgorithmSelection(config, options.algorithm);
    }
    for (const auto& assignment : options.weight_overrides) {
        config::YAMLConfigLoader::applyWeightOverride(config.scoring, assignment);
    }
    if (!options.output_csv.empty()) {
        config.output.assignments_csv = options.output_csv;
    }
    if (options.threads >= 0) {
        config.performance.num_threads = options.threads;
    }

    config::YAMLConfigLoader::validate(config);
    return config;
}

} // namespace mentor_match::cli::mentor_match_cli
