#pragma once

#include <opencv2/core.hpp>
#include <vector>

namespace mentor_match::matching {

/**
 * @brief Minimum-cost rectangular assignment (Kuhn-Munkres with potentials)
 *
 * Every row is assigned to a distinct column; requires rows <= cols. Costs
 * must be finite; callers encode forbidden cells with a large finite value.
 *
 * @param cost rows x cols cost matrix
 * @return Column chosen for each row
 * @throws std::invalid_argument If rows > cols or a cost is not finite
 */
std::vector<int> solveMinCostAssignment(const cv::Mat1d& cost);

} // namespace mentor_match::matching
