#pragma once

#include "mentor_match/types.hpp"
#include <set>
#include <string>
#include <vector>

namespace mentor_match::profiles {

    /**
     * @brief Attributes shared by mentors and mentees
     *
     * Topic sets are stored trimmed and lower-cased so set operations compare
     * what people meant rather than how they typed it.
     */
    struct Profile {
        std::string email;
        std::string name;
        std::string pronouns;
        std::string program;
        std::string term;
        std::string location = "Unknown";
        MeetingPreference meeting_preference = MeetingPreference::NO_PREFERENCE;
        std::set<std::string> topics;
        std::set<std::string> career_topics;
        std::vector<std::string> tags;  ///< Priority tags (e.g. "returning")

        std::string firstName() const {
            const auto end = name.find(' ');
            return end == std::string::npos ? name : name.substr(0, end);
        }
    };

    struct MentorProfile : Profile {
        int capacity = 1;  ///< Maximum number of mentees, always >= 1
    };

    struct MenteeProfile : Profile {};

} // namespace mentor_match::profiles
