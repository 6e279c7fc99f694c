#pragma once

#include "src/interfaces/ILinearSolver.hpp"
#include <string>

namespace mentor_match::solver {

/**
 * @brief ILinearSolver backed by OR-Tools MPSolver
 *
 * Builds a fresh MPSolver per call, so one instance can be reused across
 * problems. The backend id is passed straight to MPSolver::CreateSolver.
 */
class OrToolsLinearSolver : public ILinearSolver {
public:
    explicit OrToolsLinearSolver(std::string backend = "SCIP");

    SolveResult solve(const LinearProgram& program, double timeLimitSeconds) override;

    std::string name() const override { return backend_; }

private:
    std::string backend_;
};

} // namespace mentor_match::solver
