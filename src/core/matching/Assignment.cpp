#include "Assignment.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace mentor_match::matching {

Assignment::Assignment(std::vector<int> capacities, int menteeCount)
    : capacities_(std::move(capacities)),
      mentorOf_(static_cast<size_t>(std::max(menteeCount, 0)), kUnassigned),
      buckets_(capacities_.size()) {
    for (size_t m = 0; m < capacities_.size(); ++m) {
        if (capacities_[m] < 0) {
            throw std::invalid_argument("Mentor capacity must be >= 0 (mentor " + std::to_string(m) + ")");
        }
        // A mentor can never hold more mentees than exist
        buckets_[m].reserve(static_cast<size_t>(std::min(capacities_[m], std::max(menteeCount, 0))));
    }
}

bool Assignment::assign(int mentee, int mentor) {
    if (mentorOf_.at(mentee) != kUnassigned) {
        throw std::logic_error("Mentee " + std::to_string(mentee) + " is already assigned to mentor " +
                               std::to_string(mentorOf_[mentee]));
    }
    if (!hasCapacity(mentor)) {
        return false;
    }
    buckets_[mentor].push_back(mentee);
    mentorOf_[mentee] = mentor;
    return true;
}

void Assignment::unassign(int mentee) {
    const int mentor = mentorOf_.at(mentee);
    if (mentor == kUnassigned) {
        return;
    }
    auto& bucket = buckets_[mentor];
    bucket.erase(std::remove(bucket.begin(), bucket.end(), mentee), bucket.end());
    mentorOf_[mentee] = kUnassigned;
}

int Assignment::assignedCount() const {
    return static_cast<int>(std::count_if(mentorOf_.begin(), mentorOf_.end(),
                                          [](int m) { return m != kUnassigned; }));
}

std::vector<int> Assignment::unassignedMentees() const {
    std::vector<int> result;
    for (int e = 0; e < menteeCount(); ++e) {
        if (mentorOf_[e] == kUnassigned) {
            result.push_back(e);
        }
    }
    return result;
}

double Assignment::totalScore(const scoring::ScoreMatrix& scores) const {
    double total = 0.0;
    for (int e = 0; e < menteeCount(); ++e) {
        if (const int m = mentorOf_[e]; m != kUnassigned) {
            total += scores.score(m, e);
        }
    }
    return total;
}

std::vector<int> Assignment::rosterOf(int mentor, const scoring::ScoreMatrix& scores) const {
    std::vector<int> roster = buckets_.at(mentor);
    std::sort(roster.begin(), roster.end(), [&](int a, int b) {
        const double sa = scores.score(mentor, a);
        const double sb = scores.score(mentor, b);
        if (sa != sb) return sa > sb;
        return a < b;
    });
    return roster;
}

void Assignment::validate() const {
    std::vector<int> seen(mentorOf_.size(), 0);
    for (int m = 0; m < mentorCount(); ++m) {
        if (load(m) > capacities_[m]) {
            throw std::logic_error("Mentor " + std::to_string(m) + " holds " + std::to_string(load(m)) +
                                   " mentees but has capacity " + std::to_string(capacities_[m]));
        }
        for (int e : buckets_[m]) {
            if (e < 0 || e >= menteeCount()) {
                throw std::logic_error("Mentor " + std::to_string(m) + " references unknown mentee " +
                                       std::to_string(e));
            }
            if (++seen[e] > 1) {
                throw std::logic_error("Mentee " + std::to_string(e) + " appears in more than one bucket");
            }
            if (mentorOf_[e] != m) {
                throw std::logic_error("Mentee " + std::to_string(e) + " bucket and mapping disagree");
            }
        }
    }
    for (int e = 0; e < menteeCount(); ++e) {
        if (mentorOf_[e] != kUnassigned && seen[e] == 0) {
            throw std::logic_error("Mentee " + std::to_string(e) + " mapped to a mentor but missing from its bucket");
        }
    }
}

} // namespace mentor_match::matching
