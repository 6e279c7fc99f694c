#pragma once

#include "src/core/scoring/ScoreMatrix.hpp"
#include <vector>

namespace mentor_match::matching {

/**
 * @brief Mentee -> mentor mapping with per-mentor buckets
 *
 * Invariants held at all times:
 * - a mentee sits in at most one bucket
 * - no bucket grows beyond its mentor's capacity
 *
 * assign() refuses a full mentor instead of overflowing it, so strategies
 * treat a false return as "capacity exhausted".
 */
class Assignment {
public:
    static constexpr int kUnassigned = -1;

    Assignment() = default;
    Assignment(std::vector<int> capacities, int menteeCount);

    int mentorCount() const { return static_cast<int>(capacities_.size()); }
    int menteeCount() const { return static_cast<int>(mentorOf_.size()); }

    int mentorOf(int mentee) const { return mentorOf_.at(mentee); }
    bool isAssigned(int mentee) const { return mentorOf_.at(mentee) != kUnassigned; }

    const std::vector<int>& menteesOf(int mentor) const { return buckets_.at(mentor); }
    int load(int mentor) const { return static_cast<int>(buckets_.at(mentor).size()); }
    int capacity(int mentor) const { return capacities_.at(mentor); }
    bool hasCapacity(int mentor) const { return load(mentor) < capacity(mentor); }

    /**
     * @brief Place an unassigned mentee with a mentor
     * @return false when the mentor is already at capacity
     * @throws std::logic_error If the mentee is already assigned
     */
    bool assign(int mentee, int mentor);

    /// Remove a mentee from its bucket; no-op when unassigned
    void unassign(int mentee);

    int assignedCount() const;
    int unassignedCount() const { return menteeCount() - assignedCount(); }
    std::vector<int> unassignedMentees() const;

    /// Sum of scores over assigned pairs
    double totalScore(const scoring::ScoreMatrix& scores) const;

    /// Mentees of a mentor ordered by descending score, then ascending index
    std::vector<int> rosterOf(int mentor, const scoring::ScoreMatrix& scores) const;

    /**
     * @brief Re-check both invariants from scratch
     * @throws std::logic_error On the first violation found
     */
    void validate() const;

    const std::vector<int>& mentorOfAll() const { return mentorOf_; }
    const std::vector<int>& capacities() const { return capacities_; }

    bool operator==(const Assignment& other) const {
        return capacities_ == other.capacities_ && mentorOf_ == other.mentorOf_ && buckets_ == other.buckets_;
    }
    bool operator!=(const Assignment& other) const { return !(*this == other); }

private:
    std::vector<int> capacities_;
    std::vector<int> mentorOf_;
    std::vector<std::vector<int>> buckets_;
};

} // namespace mentor_match::matching
