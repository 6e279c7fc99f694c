#include "report.hpp"
#include <iomanip>

namespace mentor_match::cli::mentor_match_cli {

void printMatches(std::ostream& out, const engine::MatchOutcome& outcome) {
    out << "=== Matches (" << outcome.strategy << ") ===" << std::endl;
    const auto precision = out.precision();
    out << std::fixed << std::setprecision(2);
    for (const auto& roster : outcome.rosters) {
        out << roster.mentor_name << " <" << roster.mentor_email << "> ["
            << roster.mentees.size() << "/" << roster.capacity << "]" << std::endl;
        if (roster.mentees.empty()) {
            out << "    (no mentees)" << std::endl;
        }
        for (const auto& mentee : roster.mentees) {
            out << "    " << mentee.name << " <" << mentee.email << ">  score "
                << mentee.score << std::endl;
        }
    }
    out << std::defaultfloat << std::setprecision(precision);
}

void printUnassigned(std::ostream& out, const engine::MatchOutcome& outcome) {
    if (outcome.unassigned_mentees.empty()) {
        out << "All mentees were matched." << std::endl;
        return;
    }
    out << "=== Unmatched mentees (" << outcome.unassigned_mentees.size() << ") ===" << std::endl;
    for (const auto& email : outcome.unassigned_mentees) {
        out << "    " << email << std::endl;
    }
}

void printQualitySummary(std::ostream& out, const metrics::AssignmentMetrics& metrics) {
    out << "=== Match quality ===" << std::endl;
    const auto precision = out.precision();
    out << std::fixed << std::setprecision(2);
    out << "  Total score:        " << metrics.total_score << std::endl;
    out << "  Matched:            " << metrics.matched << " (" << metrics.unmatched << " unmatched)" << std::endl;
    out << "  Average pair score: " << metrics.average_pair_score << std::endl;
    out << "  Min pair score:     " << metrics.min_pair_score << std::endl;
    out << "  Max pair score:     " << metrics.max_pair_score << std::endl;
    out << "  Mentor load:        " << metrics.min_load << ".." << metrics.max_load
        << " (mean " << metrics.mean_load << ", stddev " << metrics.load_stddev << ")" << std::endl;
    out << "  Utilization:        " << metrics.utilization * 100.0 << "%" << std::endl;
    out << "  Blocking pairs:     " << metrics.blocking_pairs << std::endl;
    out << std::defaultfloat << std::setprecision(precision);
}

void printComparison(std::ostream& out, const metrics::EvaluationReport& report) {
    out << "=== Algorithm comparison ===" << std::endl;
    out << std::left << std::setw(6) << "Rank" << std::setw(22) << "Strategy"
        << std::right << std::setw(12) << "Total" << std::setw(10) << "Unmatched"
        << std::setw(10) << "Blocking" << std::setw(10) << "Load"
        << std::setw(12) << "Time(ms)" << std::endl;

    const auto precision = out.precision();
    out << std::fixed;
    for (size_t index : report.ranking) {
        const auto& m = report.metrics[index];
        out << std::left << std::setw(6) << m.rank << std::setw(22) << m.strategy << std::right;
        if (!m.success) {
            out << "  FAILED: " << toString(m.failure);
            if (!m.error_message.empty()) {
                out << " (" << m.error_message << ")";
            }
            out << std::endl;
            continue;
        }
        out << std::setprecision(2) << std::setw(12) << m.total_score
            << std::setw(10) << m.unmatched
            << std::setw(10) << m.blocking_pairs
            << std::setw(10) << (std::to_string(m.min_load) + "-" + std::to_string(m.max_load))
            << std::setprecision(1) << std::setw(12) << m.runtime_ms << std::endl;
    }
    out << std::defaultfloat << std::setprecision(precision);
}

} // namespace mentor_match::cli::mentor_match_cli
