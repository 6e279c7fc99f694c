#include "ScoreMatrix.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

namespace mentor_match::scoring {

ScoreMatrix::ScoreMatrix(int mentorCount, int menteeCount)
    : mentorCount_(mentorCount), menteeCount_(menteeCount) {
    if (mentorCount < 0 || menteeCount < 0) {
        throw std::invalid_argument("ScoreMatrix dimensions must be non-negative");
    }
    if (mentorCount > 0 && menteeCount > 0) {
        scores_ = cv::Mat1d(mentorCount, menteeCount, kIneligible);
    }
}

ScoreMatrix ScoreMatrix::fromRows(const std::vector<std::vector<double>>& rows, int menteeCount) {
    const int cols = menteeCount >= 0
        ? menteeCount
        : (rows.empty() ? 0 : static_cast<int>(rows.front().size()));

    ScoreMatrix matrix(static_cast<int>(rows.size()), cols);
    for (size_t r = 0; r < rows.size(); ++r) {
        if (static_cast<int>(rows[r].size()) != cols) {
            throw std::invalid_argument("ScoreMatrix row " + std::to_string(r) + " has " +
                                        std::to_string(rows[r].size()) + " entries, expected " +
                                        std::to_string(cols));
        }
        for (int c = 0; c < cols; ++c) {
            matrix.set(static_cast<int>(r), c, rows[r][c]);
        }
    }
    return matrix;
}

void ScoreMatrix::set(int mentor, int mentee, double score) {
    if (std::isnan(score) || (score < 0.0 && score != kIneligible)) {
        throw std::invalid_argument("Compatibility scores must be >= 0 or ineligible, got " +
                                    std::to_string(score));
    }
    scores_(mentor, mentee) = score;
}

std::vector<int> ScoreMatrix::rankedMentorsFor(int mentee) const {
    std::vector<int> ranked;
    ranked.reserve(static_cast<size_t>(mentorCount_));
    for (int m = 0; m < mentorCount_; ++m) {
        if (isEligible(m, mentee)) {
            ranked.push_back(m);
        }
    }
    std::stable_sort(ranked.begin(), ranked.end(), [&](int a, int b) {
        return scores_(a, mentee) > scores_(b, mentee);
    });
    return ranked;
}

int ScoreMatrix::eligibleMentorCount(int mentee) const {
    int count = 0;
    for (int m = 0; m < mentorCount_; ++m) {
        if (isEligible(m, mentee)) {
            ++count;
        }
    }
    return count;
}

double ScoreMatrix::maxScore() const {
    if (empty()) {
        return 0.0;
    }
    // -inf entries never win, so minMaxLoc over the raw data is enough
    double minVal = 0.0;
    double maxVal = 0.0;
    cv::minMaxLoc(scores_, &minVal, &maxVal);
    return maxVal == kIneligible ? 0.0 : maxVal;
}

} // namespace mentor_match::scoring
