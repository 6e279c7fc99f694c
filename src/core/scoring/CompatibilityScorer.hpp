#pragma once

#include "ScoreMatrix.hpp"
#include "mentor_match/types.hpp"
#include "src/core/profiles/Profile.hpp"
#include "src/core/profiles/ProfileStore.hpp"
#include <optional>

namespace mentor_match::scoring {

/**
 * @brief Computes mentor/mentee compatibility from profile attributes
 *
 * Score components:
 * - Meeting mode: in person and co-located, both online, or one side flexible
 * - Topic overlap: mentorship topics and career topics, counted or Jaccard-scaled
 * - Program: identical program
 * - Term: mentor further along than the mentee (or a graduate student)
 *
 * A pair whose meeting modes cannot both be honoured (one in person, one
 * online, or both in person in different places) is ineligible when
 * ScoringWeights::require_meeting_compatibility is set. A person never
 * mentors themselves.
 */
class CompatibilityScorer {
public:
    explicit CompatibilityScorer(ScoringWeights weights = {});

    /**
     * @brief Score one pair with explicit weights
     * @return Score >= 0, or std::nullopt when the pair is ineligible
     */
    static std::optional<double> score(const profiles::MentorProfile& mentor,
                                       const profiles::MenteeProfile& mentee,
                                       const ScoringWeights& weights);

    std::optional<double> score(const profiles::MentorProfile& mentor,
                                const profiles::MenteeProfile& mentee) const {
        return score(mentor, mentee, weights_);
    }

    /// Score every (mentor, mentee) pair of the store
    ScoreMatrix buildMatrix(const profiles::ProfileStore& store) const;

    const ScoringWeights& weights() const { return weights_; }

    static bool meetingModesCompatible(const profiles::Profile& mentor, const profiles::Profile& mentee);

    /// Leading term digit ("3A" -> 3), 0 when the term does not start with one
    static int termLevel(const std::string& term);

private:
    ScoringWeights weights_;
};

} // namespace mentor_match::scoring
