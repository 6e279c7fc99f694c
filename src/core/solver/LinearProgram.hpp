#pragma once

#include <string>
#include <utility>
#include <vector>

namespace mentor_match::solver {

    /**
     * @brief Outcome reported by a linear solver backend
     */
    enum class SolveStatus {
        OPTIMAL,
        FEASIBLE,     ///< a solution was found but optimality is not proven
        INFEASIBLE,
        TIMED_OUT,
        UNAVAILABLE,  ///< backend missing or refused to start
        ERROR
    };

    inline std::string toString(SolveStatus status) {
        switch (status) {
            case SolveStatus::OPTIMAL: return "optimal";
            case SolveStatus::FEASIBLE: return "feasible";
            case SolveStatus::INFEASIBLE: return "infeasible";
            case SolveStatus::TIMED_OUT: return "timed_out";
            case SolveStatus::UNAVAILABLE: return "unavailable";
            case SolveStatus::ERROR: return "error";
            default: return "unknown";
        }
    }

    /// sum(coefficient * x[variable]) <= upper_bound
    struct LinearConstraint {
        std::vector<std::pair<int, double>> terms;
        double upper_bound = 0.0;
        std::string name;
    };

    /**
     * @brief Binary integer program: maximize c.x subject to A.x <= b, x in {0,1}
     */
    struct LinearProgram {
        std::vector<std::string> variable_names;
        std::vector<double> objective;
        std::vector<LinearConstraint> constraints;

        int variableCount() const { return static_cast<int>(objective.size()); }

        /// @return Index of the new variable
        int addBinaryVariable(std::string name, double objectiveCoefficient) {
            variable_names.push_back(std::move(name));
            objective.push_back(objectiveCoefficient);
            return variableCount() - 1;
        }

        void addLessEqual(std::vector<std::pair<int, double>> terms, double upperBound, std::string name) {
            constraints.push_back({std::move(terms), upperBound, std::move(name)});
        }
    };

    struct SolveResult {
        SolveStatus status = SolveStatus::ERROR;
        std::vector<double> values;    ///< one entry per variable when a solution exists
        double objective_value = 0.0;
        std::string message;
    };

} // namespace mentor_match::solver
