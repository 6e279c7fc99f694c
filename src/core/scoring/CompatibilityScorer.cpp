#include "CompatibilityScorer.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace mentor_match::scoring {

namespace {

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool knownLocation(const std::string& location) {
    const auto lowered = toLowerCopy(location);
    return !lowered.empty() && lowered != "unknown";
}

bool sameLocation(const profiles::Profile& a, const profiles::Profile& b) {
    return knownLocation(a.location) && toLowerCopy(a.location) == toLowerCopy(b.location);
}

double topicTerm(const std::set<std::string>& mentorTopics,
                 const std::set<std::string>& menteeTopics,
                 double weight,
                 TopicOverlapMode mode) {
    std::vector<std::string> shared;
    std::set_intersection(mentorTopics.begin(), mentorTopics.end(),
                          menteeTopics.begin(), menteeTopics.end(),
                          std::back_inserter(shared));
    if (shared.empty()) {
        return 0.0;
    }

    if (mode == TopicOverlapMode::JACCARD) {
        const size_t unionSize = mentorTopics.size() + menteeTopics.size() - shared.size();
        return weight * static_cast<double>(shared.size()) / static_cast<double>(unionSize);
    }
    return weight * static_cast<double>(shared.size());
}

} // namespace

CompatibilityScorer::CompatibilityScorer(ScoringWeights weights)
    : weights_(std::move(weights)) {}

bool CompatibilityScorer::meetingModesCompatible(const profiles::Profile& mentor,
                                                 const profiles::Profile& mentee) {
    const auto a = mentor.meeting_preference;
    const auto b = mentee.meeting_preference;
    if (a == MeetingPreference::NO_PREFERENCE || b == MeetingPreference::NO_PREFERENCE) {
        return true;
    }
    if (a == MeetingPreference::ONLINE && b == MeetingPreference::ONLINE) {
        return true;
    }
    if (a == MeetingPreference::IN_PERSON && b == MeetingPreference::IN_PERSON) {
        return sameLocation(mentor, mentee);
    }
    return false;
}

int CompatibilityScorer::termLevel(const std::string& term) {
    if (term.empty() || !std::isdigit(static_cast<unsigned char>(term.front()))) {
        return 0;
    }
    return term.front() - '0';
}

std::optional<double> CompatibilityScorer::score(const profiles::MentorProfile& mentor,
                                                 const profiles::MenteeProfile& mentee,
                                                 const ScoringWeights& weights) {
    if (toLowerCopy(mentor.email) == toLowerCopy(mentee.email)) {
        return std::nullopt;
    }

    const bool compatible = meetingModesCompatible(mentor, mentee);
    if (!compatible && weights.require_meeting_compatibility) {
        return std::nullopt;
    }

    double total = 0.0;

    // Meeting mode
    const auto a = mentor.meeting_preference;
    const auto b = mentee.meeting_preference;
    if (a == MeetingPreference::IN_PERSON && b == MeetingPreference::IN_PERSON && sameLocation(mentor, mentee)) {
        total += weights.in_person_colocated;
    } else if (a == MeetingPreference::ONLINE && b == MeetingPreference::ONLINE) {
        total += weights.both_online;
    } else if (a == MeetingPreference::NO_PREFERENCE || b == MeetingPreference::NO_PREFERENCE) {
        total += weights.flexible_meeting;
    }

    // Topic overlap
    total += topicTerm(mentor.topics, mentee.topics, weights.topic_match, weights.topic_overlap);
    total += topicTerm(mentor.career_topics, mentee.career_topics,
                       weights.career_topic_match, weights.topic_overlap);

    // Program and term
    if (!mentor.program.empty() && toLowerCopy(mentor.program) == toLowerCopy(mentee.program)) {
        total += weights.same_program;
    }

    if (termLevel(mentor.term) > termLevel(mentee.term) ||
        toLowerCopy(mentor.term).find("graduate") != std::string::npos) {
        total += weights.senior_term;
    }

    return total;
}

ScoreMatrix CompatibilityScorer::buildMatrix(const profiles::ProfileStore& store) const {
    const int mentorCount = static_cast<int>(store.mentorCount());
    const int menteeCount = static_cast<int>(store.menteeCount());

    ScoreMatrix matrix(mentorCount, menteeCount);
    for (int m = 0; m < mentorCount; ++m) {
        for (int e = 0; e < menteeCount; ++e) {
            if (const auto s = score(store.mentor(m), store.mentee(e)); s.has_value()) {
                matrix.set(m, e, *s);
            }
        }
    }
    return matrix;
}

} // namespace mentor_match::scoring
