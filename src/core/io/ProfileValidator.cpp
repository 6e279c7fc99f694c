#include "ProfileValidator.hpp"
#include "mentor_match/errors.hpp"
#include "mentor_match/logging.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace mentor_match::io {

namespace {

std::string trimCopy(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\n\r");
    return value.substr(first, last - first + 1);
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string displayName(const std::string& field) {
    if (field == fields::MAX_MENTEES) return "Max mentees";
    if (field == fields::MEETING_PREFERENCE) return "Meeting Preference";
    if (field == fields::CAREER_TOPICS) return "Career topics";
    std::string name = field;
    if (!name.empty()) name.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(name.front())));
    return name;
}

std::string requireValue(const ProfileRecord& record, const std::string& field) {
    auto value = trimCopy(record.get(field));
    if (value.empty()) {
        throw MalformedProfileError(record.source, record.row, displayName(field), "value is required");
    }
    return value;
}

template <typename ProfileT>
void rejectDuplicateEmails(const std::vector<ProfileT>& pool, const std::vector<ProfileRecord>& records) {
    std::map<std::string, int> firstRow;
    for (size_t i = 0; i < pool.size(); ++i) {
        const auto key = toLowerCopy(pool[i].email);
        const auto [it, inserted] = firstRow.emplace(key, records[i].row);
        if (!inserted) {
            throw MalformedProfileError(records[i].source, records[i].row, "Email",
                                        "duplicate email '" + pool[i].email + "' (first seen on row " +
                                        std::to_string(it->second) + ")");
        }
    }
}

} // namespace

MeetingPreference ProfileValidator::parseMeetingPreference(const std::string& text) {
    const auto value = toLowerCopy(trimCopy(text));
    if (value.find("no preference") != std::string::npos) {
        return MeetingPreference::NO_PREFERENCE;
    }
    if (value.find("online") != std::string::npos) {
        return MeetingPreference::ONLINE;
    }
    if (value.find("in person") != std::string::npos || value.find("in-person") != std::string::npos) {
        return MeetingPreference::IN_PERSON;
    }
    return MeetingPreference::NO_PREFERENCE;
}

std::string ProfileValidator::normalizeLocation(const std::string& text) {
    const auto value = trimCopy(text);
    if (value.empty() || toLowerCopy(value).find("prefer not to say") != std::string::npos) {
        return "Unknown";
    }

    std::string titled;
    titled.reserve(value.size());
    bool startOfWord = true;
    for (unsigned char c : value) {
        if (std::isalpha(c)) {
            titled.push_back(static_cast<char>(startOfWord ? std::toupper(c) : std::tolower(c)));
            startOfWord = false;
        } else {
            titled.push_back(static_cast<char>(c));
            startOfWord = true;
        }
    }
    return titled;
}

std::set<std::string> ProfileValidator::parseTopicSet(const std::string& text) {
    std::set<std::string> topics;
    std::string current;
    auto flush = [&]() {
        auto topic = toLowerCopy(trimCopy(current));
        if (!topic.empty()) {
            topics.insert(std::move(topic));
        }
        current.clear();
    };
    for (char c : text) {
        if (c == ',' || c == ';') {
            flush();
        } else {
            current.push_back(c);
        }
    }
    flush();
    return topics;
}

std::vector<std::string> ProfileValidator::parseTags(const std::string& text) {
    std::vector<std::string> tags;
    size_t start = 0;
    while (start <= text.size()) {
        const auto end = text.find(';', start);
        auto tag = trimCopy(text.substr(start, end == std::string::npos ? std::string::npos : end - start));
        if (!tag.empty()) {
            tags.push_back(std::move(tag));
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return tags;
}

int ProfileValidator::parseCapacity(const ProfileRecord& record) {
    const auto text = trimCopy(record.get(fields::MAX_MENTEES));
    const auto fail = [&record, &text](const std::string& reason) {
        return MalformedProfileError(record.source, record.row, "Max mentees",
                                     reason + " (got '" + text + "')");
    };

    if (text.empty()) {
        throw fail("value is required");
    }
    if (!std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw fail("must be a positive integer");
    }
    if (text.size() > 9) {
        throw fail("is too large");
    }
    const int capacity = std::stoi(text);
    if (capacity < 1) {
        throw fail("must be at least 1");
    }
    return capacity;
}

void ProfileValidator::fillCommon(const ProfileRecord& record, profiles::Profile& profile) {
    profile.email = requireValue(record, fields::EMAIL);
    if (profile.email.find('@') == std::string::npos) {
        throw MalformedProfileError(record.source, record.row, "Email",
                                    "'" + profile.email + "' is not an e-mail address");
    }
    profile.name = requireValue(record, fields::NAME);
    profile.pronouns = trimCopy(record.get(fields::PRONOUNS));
    profile.program = trimCopy(record.get(fields::PROGRAM));
    profile.term = trimCopy(record.get(fields::TERM));
    profile.location = normalizeLocation(record.get(fields::LOCATION));
    profile.meeting_preference = parseMeetingPreference(record.get(fields::MEETING_PREFERENCE));
    profile.topics = parseTopicSet(record.get(fields::TOPICS));
    profile.career_topics = parseTopicSet(record.get(fields::CAREER_TOPICS));
    profile.tags = parseTags(record.get(fields::TAGS));
}

profiles::MentorProfile ProfileValidator::toMentor(const ProfileRecord& record) {
    profiles::MentorProfile mentor;
    fillCommon(record, mentor);
    mentor.capacity = parseCapacity(record);
    return mentor;
}

profiles::MenteeProfile ProfileValidator::toMentee(const ProfileRecord& record) {
    profiles::MenteeProfile mentee;
    fillCommon(record, mentee);
    return mentee;
}

profiles::ProfileStore ProfileValidator::buildStore(const std::vector<ProfileRecord>& mentorRecords,
                                                    const std::vector<ProfileRecord>& menteeRecords) {
    std::vector<profiles::MentorProfile> mentors;
    mentors.reserve(mentorRecords.size());
    for (const auto& record : mentorRecords) {
        mentors.push_back(toMentor(record));
    }
    rejectDuplicateEmails(mentors, mentorRecords);

    std::vector<profiles::MenteeProfile> mentees;
    mentees.reserve(menteeRecords.size());
    for (const auto& record : menteeRecords) {
        mentees.push_back(toMentee(record));
    }
    rejectDuplicateEmails(mentees, menteeRecords);

    return profiles::ProfileStore(std::move(mentors), std::move(mentees));
}

profiles::ProfileStore ProfileValidator::loadStore(const std::string& mentorsCsv, const std::string& menteesCsv) {
    LOG_INFO("Parsing mentor file: " + mentorsCsv);
    const auto mentorRecords = ProfileCsvReader::readFile(mentorsCsv, ProfileRole::MENTOR);

    LOG_INFO("Parsing mentee file: " + menteesCsv);
    const auto menteeRecords = ProfileCsvReader::readFile(menteesCsv, ProfileRole::MENTEE);

    auto store = buildStore(mentorRecords, menteeRecords);
    LOG_INFO("Loaded " + std::to_string(store.mentorCount()) + " mentors (capacity " +
             std::to_string(store.totalCapacity()) + ") and " + std::to_string(store.menteeCount()) + " mentees");
    return store;
}

} // namespace mentor_match::io
