#pragma once

#include "mentor_match/types.hpp"
#include "src/interfaces/ILinearSolver.hpp"
#include <memory>

namespace mentor_match::solver {

/**
 * @brief Creates the integer-programming backend compiled into this build
 *
 * OR-Tools is optional. Without it createSolver() returns nullptr and the
 * ILP strategy reports the solver as unavailable.
 */
class LinearSolverFactory {
public:
    /**
     * @brief Create a solver for params.backend
     * @return Solver instance, or nullptr when no backend is compiled in
     */
    static std::unique_ptr<ILinearSolver> createSolver(const SolverParams& params);

private:
    LinearSolverFactory() = default;
};

} // namespace mentor_match::solver
