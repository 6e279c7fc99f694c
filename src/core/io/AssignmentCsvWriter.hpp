#pragma once

#include "src/core/engine/MatchOutcome.hpp"
#include <ostream>
#include <string>

namespace mentor_match::io {

    /**
     * @brief Writes a finalized outcome as mentor_email,mentor_name,mentee_email,mentee_name,score
     *
     * Mentors in input order, mentees in roster order; unassigned mentees are
     * not written. Fields containing commas, quotes or line breaks are quoted.
     */
    class AssignmentCsvWriter {
    public:
        static void write(const engine::MatchOutcome& outcome, std::ostream& out);

        /// @throws std::runtime_error If the file cannot be written
        static void writeFile(const engine::MatchOutcome& outcome, const std::string& path);

        static std::string escapeField(const std::string& value);
    };

} // namespace mentor_match::io
