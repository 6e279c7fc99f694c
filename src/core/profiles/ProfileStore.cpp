#include "ProfileStore.hpp"
#include "mentor_match/errors.hpp"
#include <algorithm>
#include <cctype>
#include <numeric>

namespace mentor_match::profiles {

namespace {

std::string emailKey(const std::string& email) {
    std::string key = email;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return key;
}

template <typename ProfileT>
void indexPool(const std::vector<ProfileT>& pool, const std::string& poolName,
               std::unordered_map<std::string, size_t>& index) {
    for (size_t i = 0; i < pool.size(); ++i) {
        const auto& email = pool[i].email;
        if (email.empty()) {
            throw MalformedProfileError(poolName, static_cast<int>(i) + 1, "Email", "email is empty");
        }
        if (!index.emplace(emailKey(email), i).second) {
            throw MalformedProfileError(poolName, static_cast<int>(i) + 1, "Email",
                                        "duplicate email '" + email + "'");
        }
    }
}

} // namespace

ProfileStore::ProfileStore(std::vector<MentorProfile> mentors, std::vector<MenteeProfile> mentees)
    : mentors_(std::move(mentors)), mentees_(std::move(mentees)) {
    indexPool(mentors_, "mentors", mentorIndex_);
    indexPool(mentees_, "mentees", menteeIndex_);

    for (size_t i = 0; i < mentors_.size(); ++i) {
        if (mentors_[i].capacity < 1) {
            throw MalformedProfileError("mentors", static_cast<int>(i) + 1, "Max mentees",
                                        "capacity must be >= 1 for " + mentors_[i].email);
        }
    }
}

std::optional<size_t> ProfileStore::findMentor(const std::string& email) const {
    if (const auto it = mentorIndex_.find(emailKey(email)); it != mentorIndex_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<size_t> ProfileStore::findMentee(const std::string& email) const {
    if (const auto it = menteeIndex_.find(emailKey(email)); it != menteeIndex_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<int> ProfileStore::capacities() const {
    std::vector<int> result;
    result.reserve(mentors_.size());
    for (const auto& mentor : mentors_) {
        result.push_back(mentor.capacity);
    }
    return result;
}

long long ProfileStore::totalCapacity() const {
    return std::accumulate(mentors_.begin(), mentors_.end(), 0LL,
                           [](long long sum, const MentorProfile& m) { return sum + m.capacity; });
}

} // namespace mentor_match::profiles
