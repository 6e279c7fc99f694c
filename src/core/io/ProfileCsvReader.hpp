#pragma once

#include <istream>
#include <map>
#include <string>
#include <vector>

namespace mentor_match::io {

    enum class ProfileRole {
        MENTOR,
        MENTEE
    };

    inline std::string toString(ProfileRole role) {
        return role == ProfileRole::MENTOR ? "mentor" : "mentee";
    }

    /**
     * @brief Canonical field keys of a profile row
     */
    namespace fields {
        inline const std::string EMAIL = "email";
        inline const std::string NAME = "name";
        inline const std::string PRONOUNS = "pronouns";
        inline const std::string PROGRAM = "program";
        inline const std::string TERM = "term";
        inline const std::string LOCATION = "location";
        inline const std::string MEETING_PREFERENCE = "meeting_preference";
        inline const std::string TOPICS = "topics";
        inline const std::string CAREER_TOPICS = "career_topics";
        inline const std::string MAX_MENTEES = "max_mentees";
        inline const std::string TAGS = "tags";
    }

    /**
     * @brief One CSV row as raw strings keyed by canonical field name
     */
    struct ProfileRecord {
        std::string source;                        // file name, for error messages
        int row = 0;                               // 1-based line of the row in the file
        std::map<std::string, std::string> values;

        bool has(const std::string& field) const { return values.count(field) > 0; }

        /// Raw value, or an empty string when the column is absent
        const std::string& get(const std::string& field) const;
    };

    struct CsvTable {
        std::vector<std::string> header;
        std::vector<std::vector<std::string>> rows;
        std::vector<int> line_numbers;             // starting file line of each row
    };

    /**
     * @brief Reads mentor/mentee CSV exports into ProfileRecords
     *
     * Columns are located by header name, case-insensitively, so column order
     * and extra columns (timestamps, comments) do not matter. Quoted fields may
     * contain commas, doubled quotes and line breaks. Blank lines are skipped.
     */
    class ProfileCsvReader {
    public:
        /**
         * @brief Read and map a CSV file
         * @throws MalformedProfileError If the file is missing or a required column is absent
         */
        static std::vector<ProfileRecord> readFile(const std::string& path, ProfileRole role);

        static std::vector<ProfileRecord> read(std::istream& input, const std::string& source, ProfileRole role);

        /// Split a whole CSV stream into header and rows
        static CsvTable parseCsv(std::istream& input);

        /**
         * @brief Canonical field for a header cell, or empty when the column is not used
         *
         * "Max mentees", "max_mentees" and "Maximum number of mentees" all map to
         * fields::MAX_MENTEES.
         */
        static std::string canonicalField(const std::string& header);

        static std::vector<std::string> requiredFields(ProfileRole role);
    };

} // namespace mentor_match::io
