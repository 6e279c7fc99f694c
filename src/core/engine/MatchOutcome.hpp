#pragma once

#include <map>
#include <string>
#include <vector>

namespace mentor_match::engine {

    struct MatchedMentee {
        std::string email;
        std::string name;
        double score = 0.0;
    };

    /**
     * @brief A mentor and its mentees, best score first (input order on ties)
     */
    struct MentorRoster {
        std::string mentor_email;
        std::string mentor_name;
        int capacity = 0;
        std::vector<MatchedMentee> mentees;
    };

    /**
     * @brief Finalized assignment handed to whoever contacts the participants
     */
    struct MatchOutcome {
        std::string strategy;
        double total_score = 0.0;
        std::map<std::string, std::string> mentor_of_mentee;   // mentee e-mail -> mentor e-mail
        std::vector<MentorRoster> rosters;                    // mentor input order
        std::vector<std::string> unassigned_mentees;          // mentee e-mails, input order
    };

} // namespace mentor_match::engine
