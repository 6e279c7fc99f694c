#include "HungarianSolver.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace mentor_match::matching {

std::vector<int> solveMinCostAssignment(const cv::Mat1d& cost) {
    const int rows = cost.rows;
    const int cols = cost.cols;
    if (rows == 0) {
        return {};
    }
    if (rows > cols) {
        throw std::invalid_argument("Assignment needs at least as many columns as rows");
    }
    if (!cv::checkRange(cost)) {
        throw std::invalid_argument("Assignment costs must be finite");
    }

    const double INF = std::numeric_limits<double>::infinity();

    // 1-indexed: u/v are row/column potentials, p[j] is the row holding column j,
    // way[j] the previous column on the augmenting path.
    std::vector<double> u(rows + 1, 0.0), v(cols + 1, 0.0);
    std::vector<int> p(cols + 1, 0);
    std::vector<int> way(cols + 1, 0);

    for (int i = 1; i <= rows; ++i) {
        std::vector<double> minv(cols + 1, INF);
        std::vector<bool> used(cols + 1, false);
        p[0] = i;
        int j0 = 0;

        do {
            used[j0] = true;
            const int i0 = p[j0];
            double delta = INF;
            int j1 = 0;

            for (int j = 1; j <= cols; ++j) {
                if (used[j]) {
                    continue;
                }
                const double cur = cost(i0 - 1, j - 1) - u[i0] - v[j];
                if (cur < minv[j]) {
                    minv[j] = cur;
                    way[j] = j0;
                }
                if (minv[j] < delta) {
                    delta = minv[j];
                    j1 = j;
                }
            }

            for (int j = 0; j <= cols; ++j) {
                if (used[j]) {
                    u[p[j]] += delta;
                    v[j] -= delta;
                } else {
                    minv[j] -= delta;
                }
            }
            j0 = j1;
        } while (p[j0] != 0);

        do {
            const int j1 = way[j0];
            p[j0] = p[j1];
            j0 = j1;
        } while (j0 != 0);
    }

    std::vector<int> rowToCol(static_cast<size_t>(rows), -1);
    for (int j = 1; j <= cols; ++j) {
        if (p[j] != 0) {
            rowToCol[p[j] - 1] = j - 1;
        }
    }
    return rowToCol;
}

} // namespace mentor_match::matching
