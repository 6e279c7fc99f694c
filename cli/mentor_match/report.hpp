#pragma once

#include "src/core/engine/MatchOutcome.hpp"
#include "src/core/metrics/Evaluator.hpp"
#include <ostream>

namespace mentor_match::cli::mentor_match_cli {

// Mentor by mentor, each mentee with its score.
void printMatches(std::ostream& out, const engine::MatchOutcome& outcome);

void printUnassigned(std::ostream& out, const engine::MatchOutcome& outcome);

// Average, min and max pair score plus mentor load for the selected strategy.
void printQualitySummary(std::ostream& out, const metrics::AssignmentMetrics& metrics);

// One row per strategy in rank order; failed strategies show their failure kind.
void printComparison(std::ostream& out, const metrics::EvaluationReport& report);

} // namespace mentor_match::cli::mentor_match_cli
