#pragma once

#include <opencv2/core.hpp>
#include <limits>
#include <vector>

namespace mentor_match::scoring {

/**
 * @brief Dense mentor x mentee compatibility scores
 *
 * Rows are mentors, columns are mentees, both in ProfileStore index order.
 * Ineligible pairs hold -infinity; every other entry is a finite score >= 0.
 * Built once per run and shared read-only by every strategy.
 */
class ScoreMatrix {
public:
    static constexpr double kIneligible = -std::numeric_limits<double>::infinity();

    ScoreMatrix() = default;

    /// Create a matrix with every pair marked ineligible
    ScoreMatrix(int mentorCount, int menteeCount);

    /**
     * @brief Build from explicit rows (one row per mentor)
     * @throws std::invalid_argument If rows are ragged or contain negative/NaN scores
     */
    static ScoreMatrix fromRows(const std::vector<std::vector<double>>& rows, int menteeCount = -1);

    int mentorCount() const { return mentorCount_; }
    int menteeCount() const { return menteeCount_; }
    bool empty() const { return mentorCount_ == 0 || menteeCount_ == 0; }

    double score(int mentor, int mentee) const {
        return scores_(mentor, mentee);
    }

    bool isEligible(int mentor, int mentee) const {
        return scores_(mentor, mentee) != kIneligible;
    }

    /**
     * @brief Set a pair's score; kIneligible marks it infeasible
     * @throws std::invalid_argument On negative or NaN scores
     */
    void set(int mentor, int mentee, double score);

    void markIneligible(int mentor, int mentee) { scores_(mentor, mentee) = kIneligible; }

    /// Eligible mentors for a mentee, by descending score then ascending mentor index
    std::vector<int> rankedMentorsFor(int mentee) const;

    int eligibleMentorCount(int mentee) const;

    /// Largest eligible score, 0 when nothing is eligible
    double maxScore() const;

    const cv::Mat1d& data() const { return scores_; }

private:
    int mentorCount_ = 0;
    int menteeCount_ = 0;
    cv::Mat1d scores_;
};

} // namespace mentor_match::scoring
