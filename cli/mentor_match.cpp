#include "cli/mentor_match/cli_args.hpp"
#include "cli/mentor_match/report.hpp"
#include "mentor_match/errors.hpp"
#include "mentor_match/logging.hpp"
#include "src/core/engine/MatchingEngine.hpp"
#include "src/core/io/AssignmentCsvWriter.hpp"
#include "src/core/io/ProfileValidator.hpp"
#include <iostream>

using namespace mentor_match;
namespace mm_cli = mentor_match::cli::mentor_match_cli;

namespace {

constexpr int kExitFatal = 1;
constexpr int kExitUsage = 2;

} // namespace

int main(int argc, char** argv) {
    const auto parsed = mm_cli::parseArgs(argc, argv);
    if (parsed.status == mm_cli::ParseStatus::HELP) {
        mm_cli::printUsage(argv[0]);
        return 0;
    }
    if (parsed.status == mm_cli::ParseStatus::USAGE_ERROR) {
        std::cerr << "Error: " << parsed.error << std::endl;
        mm_cli::printUsage(argv[0]);
        return kExitUsage;
    }

    const auto& options = parsed.options;
    if (options.verbose) {
        logging::setMinimumLevel(logging::LogLevel::DEBUG);
    } else if (options.quiet) {
        logging::setMinimumLevel(logging::LogLevel::WARNING);
    }

    try {
        const auto config = mm_cli::buildConfig(options);
        if (config.input.mentors_csv.empty() || config.input.mentees_csv.empty()) {
            std::cerr << "Error: both mentor and mentee CSV files are required" << std::endl;
            mm_cli::printUsage(argv[0]);
            return kExitUsage;
        }

        LOG_INFO("Run: " + config.run.name);
        const auto store = io::ProfileValidator::loadStore(config.input.mentors_csv, config.input.mentees_csv);

        const engine::MatchingEngine engine(config);
        const auto run = engine.execute(store);

        if (!run.selected) {
            for (const auto& result : run.report.results) {
                LOG_ERROR(result.name + ": " + toString(result.failure) + " " + result.error_message);
            }
            if (config.run.mode == RunMode::EVALUATE_ALL && config.output.print_report) {
                mm_cli::printComparison(std::cout, run.report);
            }
            LOG_ERROR("No matching strategy produced an assignment");
            return kExitFatal;
        }

        if (config.output.print_report) {
            mm_cli::printMatches(std::cout, run.outcome);
            mm_cli::printUnassigned(std::cout, run.outcome);
            mm_cli::printQualitySummary(std::cout, run.report.metrics[*run.selected]);
            if (config.run.mode == RunMode::EVALUATE_ALL) {
                mm_cli::printComparison(std::cout, run.report);
            }
        }

        if (!config.output.assignments_csv.empty()) {
            io::AssignmentCsvWriter::writeFile(run.outcome, config.output.assignments_csv);
        }

        LOG_INFO("Selected " + run.outcome.strategy + " with " +
                 std::to_string(run.outcome.mentor_of_mentee.size()) + " matches");
        return 0;

    } catch (const MalformedProfileError& e) {
        LOG_ERROR(std::string("Malformed input: ") + e.what());
        return kExitFatal;
    } catch (const InvalidConfigurationError& e) {
        LOG_ERROR(e.what());
        return kExitFatal;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Fatal error: ") + e.what());
        return kExitFatal;
    }
}
