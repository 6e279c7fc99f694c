#pragma once

#include "src/core/solver/LinearProgram.hpp"
#include <string>

namespace mentor_match {

    /**
     * @brief Interface for integer-programming backends
     *
     * Lets the ILP strategy run against OR-Tools in production and against a
     * small exhaustive solver in tests.
     */
    class ILinearSolver {
    public:
        virtual ~ILinearSolver() = default;

        /**
         * @brief Solve a binary maximization program
         * @param program Variables, objective and <= constraints
         * @param timeLimitSeconds Wall-clock bound for this call
         * @return Status plus variable values when a solution exists
         */
        virtual solver::SolveResult solve(const solver::LinearProgram& program, double timeLimitSeconds) = 0;

        /**
         * @brief Backend name (e.g., "SCIP", "CBC")
         */
        virtual std::string name() const = 0;
    };

} // namespace mentor_match
