#pragma once

#include "mentor_match/types.hpp"
#include <stdexcept>
#include <string>

namespace mentor_match {

    /**
     * @brief A profile row is missing a required field or has an unparseable value
     *
     * Fatal to the whole run: nothing scored from a partial profile set is trustworthy.
     */
    class MalformedProfileError : public std::runtime_error {
    public:
        MalformedProfileError(const std::string& source, int row, const std::string& field,
                              const std::string& reason)
            : std::runtime_error(buildMessage(source, row, field, reason)),
              source_(source), row_(row), field_(field) {}

        const std::string& source() const { return source_; }
        int row() const { return row_; }
        const std::string& field() const { return field_; }

    private:
        static std::string buildMessage(const std::string& source, int row,
                                        const std::string& field, const std::string& reason) {
            std::string message = "Malformed profile";
            if (!source.empty()) message += " in " + source;
            if (row > 0) message += " (row " + std::to_string(row) + ")";
            if (!field.empty()) message += ", field '" + field + "'";
            return message + ": " + reason;
        }

        std::string source_;
        int row_;
        std::string field_;
    };

    /**
     * @brief Configuration rejected before any scoring happens
     */
    class InvalidConfigurationError : public std::runtime_error {
    public:
        explicit InvalidConfigurationError(const std::string& message)
            : std::runtime_error("Invalid configuration: " + message) {}
    };

    enum class SolverErrorKind {
        INFEASIBLE,
        UNAVAILABLE,
        TIMEOUT
    };

    inline StrategyFailure toStrategyFailure(SolverErrorKind kind) {
        switch (kind) {
            case SolverErrorKind::INFEASIBLE: return StrategyFailure::SOLVER_INFEASIBLE;
            case SolverErrorKind::UNAVAILABLE: return StrategyFailure::SOLVER_UNAVAILABLE;
            case SolverErrorKind::TIMEOUT: return StrategyFailure::SOLVER_TIMEOUT;
            default: return StrategyFailure::INTERNAL_ERROR;
        }
    }

    /**
     * @brief Failure of the integer-programming backend; local to the ILP strategy
     */
    class SolverError : public std::runtime_error {
    public:
        SolverError(SolverErrorKind kind, const std::string& message)
            : std::runtime_error(message), kind_(kind) {}

        SolverErrorKind kind() const { return kind_; }

    private:
        SolverErrorKind kind_;
    };

} // namespace mentor_match
