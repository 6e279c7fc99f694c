#include "OrToolsLinearSolver.hpp"
#include "ortools/linear_solver/linear_solver.h"
#include "mentor_match/logging.hpp"
#include <cstdint>
#include <memory>

namespace mentor_match::solver {

using operations_research::MPConstraint;
using operations_research::MPObjective;
using operations_research::MPSolver;
using operations_research::MPVariable;

OrToolsLinearSolver::OrToolsLinearSolver(std::string backend)
    : backend_(std::move(backend)) {}

SolveResult OrToolsLinearSolver::solve(const LinearProgram& program, double timeLimitSeconds) {
    SolveResult result;

    std::unique_ptr<MPSolver> solver(MPSolver::CreateSolver(backend_));
    if (!solver) {
        result.status = SolveStatus::UNAVAILABLE;
        result.message = backend_ + " solver unavailable";
        return result;
    }

    const auto timeLimitMs = static_cast<int64_t>(timeLimitSeconds * 1000.0);
    solver->set_time_limit(timeLimitMs);

    // Variables
    std::vector<const MPVariable*> x;
    x.reserve(program.objective.size());
    for (int v = 0; v < program.variableCount(); ++v) {
        const std::string& name = v < static_cast<int>(program.variable_names.size())
            ? program.variable_names[v]
            : std::string();
        x.push_back(solver->MakeBoolVar(name));
    }

    // Constraints
    const double infinity = solver->infinity();
    for (const auto& constraint : program.constraints) {
        MPConstraint* const row = solver->MakeRowConstraint(-infinity, constraint.upper_bound, constraint.name);
        for (const auto& [variable, coefficient] : constraint.terms) {
            row->SetCoefficient(x[variable], coefficient);
        }
    }

    // Objective
    MPObjective* const objective = solver->MutableObjective();
    for (int v = 0; v < program.variableCount(); ++v) {
        objective->SetCoefficient(x[v], program.objective[v]);
    }
    objective->SetMaximization();

    const MPSolver::ResultStatus status = solver->Solve();
    switch (status) {
        case MPSolver::OPTIMAL:
            result.status = SolveStatus::OPTIMAL;
            break;
        case MPSolver::FEASIBLE:
            result.status = SolveStatus::FEASIBLE;
            break;
        case MPSolver::INFEASIBLE:
            result.status = SolveStatus::INFEASIBLE;
            result.message = backend_ + " reported the program infeasible";
            return result;
        case MPSolver::NOT_SOLVED:
            if (solver->wall_time() >= timeLimitMs) {
                result.status = SolveStatus::TIMED_OUT;
                result.message = backend_ + " hit the " + std::to_string(timeLimitSeconds) + "s time limit";
            } else {
                result.status = SolveStatus::ERROR;
                result.message = backend_ + " stopped without a solution";
            }
            return result;
        default:
            result.status = SolveStatus::ERROR;
            result.message = backend_ + " failed with status " + std::to_string(static_cast<int>(status));
            return result;
    }

    result.values.reserve(x.size());
    for (const MPVariable* variable : x) {
        result.values.push_back(variable->solution_value());
    }
    result.objective_value = objective->Value();

    LOG_DEBUG(backend_ + " solved " + std::to_string(program.variableCount()) + " variables in " +
              std::to_string(solver->wall_time()) + " ms");
    return result;
}

} // namespace mentor_match::solver
