#pragma once

#include "Profile.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mentor_match::profiles {

/**
 * @brief Read-only container for the validated mentor and mentee pools
 *
 * Indices into mentors() and mentees() are the ids used by the score matrix
 * and by every Assignment. The store is built once per run and never mutated.
 */
class ProfileStore {
public:
    ProfileStore() = default;

    /**
     * @brief Build a store from already validated profiles
     * @throws MalformedProfileError on duplicate e-mails within a pool,
     *         an empty e-mail, or a mentor capacity below 1
     */
    ProfileStore(std::vector<MentorProfile> mentors, std::vector<MenteeProfile> mentees);

    const std::vector<MentorProfile>& mentors() const { return mentors_; }
    const std::vector<MenteeProfile>& mentees() const { return mentees_; }

    size_t mentorCount() const { return mentors_.size(); }
    size_t menteeCount() const { return mentees_.size(); }

    const MentorProfile& mentor(size_t index) const { return mentors_.at(index); }
    const MenteeProfile& mentee(size_t index) const { return mentees_.at(index); }

    std::optional<size_t> findMentor(const std::string& email) const;
    std::optional<size_t> findMentee(const std::string& email) const;

    /// Capacity per mentor, in mentor index order
    std::vector<int> capacities() const;

    /// Summed in 64 bits; validated capacities may each be close to INT_MAX
    long long totalCapacity() const;

private:
    std::vector<MentorProfile> mentors_;
    std::vector<MenteeProfile> mentees_;
    std::unordered_map<std::string, size_t> mentorIndex_;
    std::unordered_map<std::string, size_t> menteeIndex_;
};

} // namespace mentor_match::profiles
