#include "ILPOptimalMatching.hpp"
#include "mentor_match/errors.hpp"
#include "mentor_match/logging.hpp"
#include "src/core/solver/LinearSolverFactory.hpp"
#include <stdexcept>

namespace mentor_match::matching {

namespace {

struct PairVariable {
    int mentor;
    int mentee;
};

} // namespace

ILPOptimalMatching::ILPOptimalMatching(SolverParams params, SolverFactory factory)
    : params_(std::move(params)), factory_(std::move(factory)) {
    if (!factory_) {
        factory_ = [](const SolverParams& p) { return solver::LinearSolverFactory::createSolver(p); };
    }
    if (!(params_.time_limit_seconds > 0.0)) {
        throw InvalidConfigurationError("solver.time_limit_seconds must be > 0");
    }
    if (params_.timeout_retries < 0) {
        throw InvalidConfigurationError("solver.timeout_retries must be >= 0");
    }
}

AlgorithmResult ILPOptimalMatching::match(const MatchingProblem& problem) const {
    problem.validate();
    const auto& scores = problem.scores;

    if (scores.menteeCount() > 0 && problem.totalCapacity() == 0) {
        throw SolverError(SolverErrorKind::INFEASIBLE,
                          "No mentor capacity available for " + std::to_string(scores.menteeCount()) + " mentees");
    }

    auto backend = factory_(params_);
    if (!backend) {
        throw SolverError(SolverErrorKind::UNAVAILABLE,
                          "No integer-programming backend available for '" + params_.backend + "'");
    }

    // Model
    solver::LinearProgram program;
    std::vector<PairVariable> pairs;
    std::vector<std::vector<std::pair<int, double>>> menteeTerms(static_cast<size_t>(scores.menteeCount()));
    std::vector<std::vector<std::pair<int, double>>> mentorTerms(static_cast<size_t>(scores.mentorCount()));

    for (int m = 0; m < scores.mentorCount(); ++m) {
        for (int e = 0; e < scores.menteeCount(); ++e) {
            if (!scores.isEligible(m, e)) {
                continue;
            }
            const int v = program.addBinaryVariable(
                "x[" + std::to_string(m) + "," + std::to_string(e) + "]", scores.score(m, e));
            pairs.push_back({m, e});
            menteeTerms[e].emplace_back(v, 1.0);
            mentorTerms[m].emplace_back(v, 1.0);
        }
    }
    for (int e = 0; e < scores.menteeCount(); ++e) {
        if (!menteeTerms[e].empty()) {
            program.addLessEqual(std::move(menteeTerms[e]), 1.0, "mentee_" + std::to_string(e));
        }
    }
    for (int m = 0; m < scores.mentorCount(); ++m) {
        if (!mentorTerms[m].empty()) {
            program.addLessEqual(std::move(mentorTerms[m]), problem.capacities[m], "mentor_" + std::to_string(m));
        }
    }

    // Solve. A feasible incumbent without an optimality proof means the time
    // limit stopped the search, so it is handled like a timeout.
    const auto hitTimeLimit = [](solver::SolveStatus status) {
        return status == solver::SolveStatus::TIMED_OUT || status == solver::SolveStatus::FEASIBLE;
    };
    double timeLimit = params_.time_limit_seconds;
    solver::SolveResult solution;
    for (int attempt = 0;; ++attempt) {
        solution = backend->solve(program, timeLimit);
        if (!hitTimeLimit(solution.status) || attempt >= params_.timeout_retries) {
            break;
        }
        LOG_WARNING(backend->name() + " stopped at its " + std::to_string(timeLimit) +
                    "s limit without an optimal solution, retrying with a doubled limit");
        timeLimit *= 2.0;
    }

    switch (solution.status) {
        case solver::SolveStatus::OPTIMAL:
            break;
        case solver::SolveStatus::FEASIBLE:
            throw SolverError(SolverErrorKind::TIMEOUT,
                              backend->name() + " reached its time limit before proving optimality");
        case solver::SolveStatus::INFEASIBLE:
            throw SolverError(SolverErrorKind::INFEASIBLE, solution.message.empty()
                ? backend->name() + " reported the assignment program infeasible" : solution.message);
        case solver::SolveStatus::TIMED_OUT:
            throw SolverError(SolverErrorKind::TIMEOUT, solution.message.empty()
                ? backend->name() + " exceeded its time limit" : solution.message);
        default:
            throw SolverError(SolverErrorKind::UNAVAILABLE, solution.message.empty()
                ? backend->name() + " failed: " + solver::toString(solution.status) : solution.message);
    }

    if (static_cast<int>(solution.values.size()) != program.variableCount()) {
        throw std::runtime_error(backend->name() + " returned " + std::to_string(solution.values.size()) +
                                 " values for " + std::to_string(program.variableCount()) + " variables");
    }

    // Decode
    Assignment assignment = problem.emptyAssignment();
    for (size_t v = 0; v < pairs.size(); ++v) {
        if (solution.values[v] <= 0.5) {
            continue;
        }
        const auto& pair = pairs[v];
        if (assignment.isAssigned(pair.mentee) || !assignment.assign(pair.mentee, pair.mentor)) {
            throw std::runtime_error(backend->name() + " returned a solution violating the assignment constraints");
        }
    }

    return makeResult(problem, std::move(assignment));
}

} // namespace mentor_match::matching
