#include "AssignmentCsvWriter.hpp"
#include "mentor_match/logging.hpp"
#include <boost/filesystem.hpp>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace mentor_match::io {

std::string AssignmentCsvWriter::escapeField(const std::string& value) {
    if (value.find_first_of(",\"\n\r") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += "\"\"";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('"');
    return quoted;
}

void AssignmentCsvWriter::write(const engine::MatchOutcome& outcome, std::ostream& out) {
    out << "mentor_email,mentor_name,mentee_email,mentee_name,score\n";
    for (const auto& roster : outcome.rosters) {
        for (const auto& mentee : roster.mentees) {
            out << escapeField(roster.mentor_email) << ','
                << escapeField(roster.mentor_name) << ','
                << escapeField(mentee.email) << ','
                << escapeField(mentee.name) << ','
                << std::defaultfloat << std::setprecision(10) << mentee.score << '\n';
        }
    }
}

void AssignmentCsvWriter::writeFile(const engine::MatchOutcome& outcome, const std::string& path) {
    namespace fs = boost::filesystem;

    const fs::path target(path);
    if (target.has_parent_path() && !fs::exists(target.parent_path())) {
        fs::create_directories(target.parent_path());
    }

    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open assignment output file: " + path);
    }
    write(outcome, file);
    if (!file) {
        throw std::runtime_error("Failed while writing assignment output file: " + path);
    }
    LOG_INFO("Assignments written to " + path);
}

} // namespace mentor_match::io
