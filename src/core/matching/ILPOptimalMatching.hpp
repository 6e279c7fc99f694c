#pragma once

#include "MatchingStrategy.hpp"
#include "src/interfaces/ILinearSolver.hpp"
#include <functional>
#include <memory>

namespace mentor_match::matching {

/**
 * @brief Capacitated assignment as a binary integer program
 *
 * One binary variable per eligible (mentor, mentee) pair, objective
 * max sum(score * x), each mentee's variables sum to <= 1 and each mentor's
 * to <= capacity. Solving is delegated to an ILinearSolver.
 *
 * Failures are thrown as SolverError:
 * - INFEASIBLE: the backend proves no solution, or mentees exist while total capacity is 0
 * - UNAVAILABLE: no backend compiled in, or the backend refuses to start
 * - TIMEOUT: the time limit (doubled on each configured retry) ran out
 */
class ILPOptimalMatching : public MatchingStrategy {
public:
    using SolverFactory = std::function<std::unique_ptr<ILinearSolver>(const SolverParams&)>;

    /**
     * @param params Backend name, time limit and retries
     * @param factory Solver source; empty uses solver::LinearSolverFactory
     */
    explicit ILPOptimalMatching(SolverParams params = {}, SolverFactory factory = {});

    AlgorithmResult match(const MatchingProblem& problem) const override;

    std::string getName() const override { return "ILPOptimal"; }

    MatchingAlgorithm getType() const override { return MatchingAlgorithm::ILP_OPTIMAL; }

    bool guaranteesOptimality() const override { return true; }

    const SolverParams& getParams() const { return params_; }

private:
    SolverParams params_;
    SolverFactory factory_;
};

} // namespace mentor_match::matching
