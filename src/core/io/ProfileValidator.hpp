#pragma once

#include "ProfileCsvReader.hpp"
#include "src/core/profiles/Profile.hpp"
#include "src/core/profiles/ProfileStore.hpp"
#include <set>
#include <string>
#include <vector>

namespace mentor_match::io {

    /**
     * @brief Turns raw ProfileRecords into typed profiles, or rejects them
     *
     * No silent coercion: a bad required value raises MalformedProfileError
     * carrying the source file, row and field.
     */
    class ProfileValidator {
    public:
        static profiles::MentorProfile toMentor(const ProfileRecord& record);

        static profiles::MenteeProfile toMentee(const ProfileRecord& record);

        /**
         * @brief Read, validate and index both CSV files
         * @throws MalformedProfileError On the first bad row or duplicate e-mail
         */
        static profiles::ProfileStore loadStore(const std::string& mentorsCsv, const std::string& menteesCsv);

        static profiles::ProfileStore buildStore(const std::vector<ProfileRecord>& mentorRecords,
                                                 const std::vector<ProfileRecord>& menteeRecords);

        /// "online" -> ONLINE, "in person"/"in-person" -> IN_PERSON, otherwise NO_PREFERENCE
        static MeetingPreference parseMeetingPreference(const std::string& text);

        /// Trimmed, title-cased; empty or "prefer not to say" -> "Unknown"
        static std::string normalizeLocation(const std::string& text);

        /// Split on ',' or ';', trim, lower-case, drop empties
        static std::set<std::string> parseTopicSet(const std::string& text);

        /// Split on ';', trim, drop empties; order kept
        static std::vector<std::string> parseTags(const std::string& text);

        /**
         * @brief Strict positive integer
         * @throws MalformedProfileError On anything else ("two", "1.5", "0", "")
         */
        static int parseCapacity(const ProfileRecord& record);

    private:
        static void fillCommon(const ProfileRecord& record, profiles::Profile& profile);
    };

} // namespace mentor_match::io
