#include "MatchingEngine.hpp"
#include "mentor_match/errors.hpp"
#include "mentor_match/logging.hpp"
#include "src/core/config/YAMLConfigLoader.hpp"
#include "src/core/matching/MatchingFactory.hpp"
#include "src/core/scoring/CompatibilityScorer.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace mentor_match::engine {

namespace {

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

const std::string kProgramTagPrefix = "program:";

} // namespace

MatchingEngine::MatchingEngine(config::MatchConfig config,
                               matching::ILPOptimalMatching::SolverFactory solverFactory)
    : config_(std::move(config)), solverFactory_(std::move(solverFactory)) {
    config::YAMLConfigLoader::validate(config_);
}

scoring::ScoreMatrix MatchingEngine::buildScoreMatrix(const profiles::ProfileStore& store) const {
    const scoring::CompatibilityScorer scorer(config_.scoring);
    return scorer.buildMatrix(store);
}

std::vector<double> MatchingEngine::menteePriorities(const profiles::ProfileStore& store) const {
    std::vector<std::string> tagRules;
    tagRules.reserve(config_.hybrid.priority_tags.size());
    for (const auto& tag : config_.hybrid.priority_tags) {
        tagRules.push_back(toLowerCopy(tag));
    }

    std::vector<double> priorities(store.menteeCount(), 0.0);
    if (tagRules.empty()) {
        return priorities;
    }

    for (size_t e = 0; e < store.menteeCount(); ++e) {
        const auto& mentee = store.mentee(e);
        const auto program = toLowerCopy(mentee.program);
        std::vector<std::string> tags;
        for (const auto& tag : mentee.tags) {
            tags.push_back(toLowerCopy(tag));
        }

        int count = 0;
        for (const auto& rule : tagRules) {
            if (rule.rfind(kProgramTagPrefix, 0) == 0) {
                if (!program.empty() && rule.substr(kProgramTagPrefix.size()) == program) {
                    ++count;
                }
            } else if (std::find(tags.begin(), tags.end(), rule) != tags.end()) {
                ++count;
            }
        }
        priorities[e] = count;
    }
    return priorities;
}

matching::AlgorithmResult MatchingEngine::runStrategy(MatchingAlgorithm algorithm,
                                                      const matching::MatchingProblem& problem) const {
    const auto start = std::chrono::steady_clock::now();
    const auto elapsedMs = [&start]() {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    };

    matching::AlgorithmResult result;
    result.algorithm = algorithm;

    try {
        auto strategy = matching::MatchingFactory::createStrategy(
            algorithm, config_.hybrid, config_.solver, solverFactory_);
        result.name = strategy->getName();
        LOG_DEBUG("Running " + result.name);

        result = strategy->match(problem);
        result.runtime_ms = elapsedMs();

        std::ostringstream oss;
        oss << result.name << ": total " << result.total_score << ", "
            << result.assignment.assignedCount() << "/" << problem.menteeCount() << " matched in "
            << result.runtime_ms << " ms";
        LOG_INFO(oss.str());
    } catch (const SolverError& e) {
        result.success = false;
        result.failure = toStrategyFailure(e.kind());
        result.error_message = e.what();
        result.assignment = problem.emptyAssignment();
        result.runtime_ms = elapsedMs();
        LOG_ERROR(result.name + " failed (" + toString(result.failure) + "): " + e.what());
    } catch (const std::exception& e) {
        result.success = false;
        result.failure = StrategyFailure::INTERNAL_ERROR;
        result.error_message = e.what();
        result.assignment = problem.emptyAssignment();
        result.runtime_ms = elapsedMs();
        LOG_ERROR((result.name.empty() ? toString(algorithm) : result.name) + " failed: " + e.what());
    }

    if (result.name.empty()) {
        result.name = toString(algorithm);
    }
    if (!result.success) {
        result.no_eligible_mentees = matching::menteesWithoutEligibleMentor(problem.scores);
    }
    return result;
}

std::vector<matching::AlgorithmResult> MatchingEngine::runAll(const matching::MatchingProblem& problem) const {
    const auto algorithms = allMatchingAlgorithms();
    std::vector<matching::AlgorithmResult> results(algorithms.size());

#ifdef _OPENMP
    const bool parallel_strategies = config_.performance.parallel_strategies && config_.performance.num_threads != 1;
    // Thread count applies to this loop only
    const int threads = config_.performance.num_threads > 0 ? config_.performance.num_threads : omp_get_max_threads();
    #pragma omp parallel for schedule(dynamic) num_threads(threads) if(parallel_strategies)
#endif
    for (size_t i = 0; i < algorithms.size(); ++i) {
        results[i] = runStrategy(algorithms[i], problem);
    }
    return results;
}

EngineRun MatchingEngine::execute(const profiles::ProfileStore& store) const {
    EngineRun run;
    run.scores = buildScoreMatrix(store);

    const auto unreachable = matching::menteesWithoutEligibleMentor(run.scores);
    for (int e : unreachable) {
        LOG_WARNING("No eligible mentor for mentee " + store.mentee(e).email + "; they will stay unassigned");
    }

    const matching::MatchingProblem problem(run.scores, store.capacities(), menteePriorities(store));

    std::vector<matching::AlgorithmResult> results;
    if (config_.run.mode == RunMode::EVALUATE_ALL) {
        LOG_INFO("Evaluating all " + std::to_string(allMatchingAlgorithms().size()) + " matching algorithms");
        results = runAll(problem);
    } else {
        results.push_back(runStrategy(config_.run.algorithm, problem));
    }

    run.report = metrics::Evaluator::evaluate(results, run.scores);

    for (size_t index : run.report.ranking) {
        if (run.report.results[index].success) {
            run.selected = index;
            break;
        }
    }
    if (run.selected) {
        run.outcome = finalize(run.report.results[*run.selected], store, run.scores);
    }
    return run;
}

MatchOutcome MatchingEngine::finalize(const matching::AlgorithmResult& result,
                                      const profiles::ProfileStore& store,
                                      const scoring::ScoreMatrix& scores) {
    if (!result.success) {
        throw std::invalid_argument("Cannot finalize failed strategy " + result.name);
    }
    const auto& assignment = result.assignment;
    if (assignment.mentorCount() != static_cast<int>(store.mentorCount()) ||
        assignment.menteeCount() != static_cast<int>(store.menteeCount())) {
        throw std::invalid_argument("Assignment does not belong to this profile store");
    }

    MatchOutcome outcome;
    outcome.strategy = result.name;
    outcome.total_score = result.total_score;

    for (size_t m = 0; m < store.mentorCount(); ++m) {
        const auto& mentor = store.mentor(m);
        MentorRoster roster;
        roster.mentor_email = mentor.email;
        roster.mentor_name = mentor.name;
        roster.capacity = mentor.capacity;
        for (int e : assignment.rosterOf(static_cast<int>(m), scores)) {
            const auto& mentee = store.mentee(e);
            roster.mentees.push_back({mentee.email, mentee.name, scores.score(static_cast<int>(m), e)});
            outcome.mentor_of_mentee[mentee.email] = mentor.email;
        }
        outcome.rosters.push_back(std::move(roster));
    }

    for (int e : assignment.unassignedMentees()) {
        outcome.unassigned_mentees.push_back(store.mentee(e).email);
    }
    return outcome;
}

} // namespace mentor_match::engine
