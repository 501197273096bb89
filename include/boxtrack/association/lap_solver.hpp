// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 boxtrack contributors

#ifndef BOXTRACK_ASSOCIATION_LAP_SOLVER_HPP
#define BOXTRACK_ASSOCIATION_LAP_SOLVER_HPP

#include <Eigen/Dense>
#include <array>
#include <utility>
#include <vector>

namespace boxtrack {
namespace association {

// Dense Jonker-Volgenant solver for square cost matrices
namespace lapjv_internal {

typedef int index_t;

constexpr double kLarge = 1000000.0;

// Column reduction and reduction transfer. Returns the number of free rows.
inline index_t ccrrt_dense(const index_t n, const Eigen::MatrixXd& cost,
                           std::vector<index_t>& free_rows, std::vector<index_t>& x,
                           std::vector<index_t>& y, std::vector<double>& v) {
    for (index_t i = 0; i < n; ++i) {
        x[i] = -1;
        v[i] = kLarge;
        y[i] = 0;
    }
    for (index_t i = 0; i < n; ++i) {
        for (index_t j = 0; j < n; ++j) {
            const double c = cost(i, j);
            if (c < v[j]) {
                v[j] = c;
                y[j] = i;
            }
        }
    }

    std::vector<char> unique(n, 1);
    for (index_t j = n - 1; j >= 0; --j) {
        const index_t i = y[j];
        if (x[i] < 0) {
            x[i] = j;
        } else {
            unique[i] = 0;
            y[j] = -1;
        }
    }

    index_t n_free_rows = 0;
    for (index_t i = 0; i < n; ++i) {
        if (x[i] < 0) {
            free_rows[n_free_rows++] = i;
        } else if (unique[i]) {
            const index_t j = x[i];
            double min = kLarge;
            for (index_t j2 = 0; j2 < n; ++j2) {
                if (j2 == j) continue;
                const double c = cost(i, j2) - v[j2];
                if (c < min) min = c;
            }
            v[j] -= min;
        }
    }
    return n_free_rows;
}

// Augmenting row reduction. Returns the number of rows still free.
inline index_t carr_dense(const index_t n, const Eigen::MatrixXd& cost,
                          const index_t n_free_rows, std::vector<index_t>& free_rows,
                          std::vector<index_t>& x, std::vector<index_t>& y,
                          std::vector<double>& v) {
    index_t current = 0;
    index_t new_free_rows = 0;
    long rr_cnt = 0;
    while (current < n_free_rows) {
        rr_cnt++;
        const index_t free_i = free_rows[current++];
        index_t j1 = 0;
        double v1 = cost(free_i, 0) - v[0];
        index_t j2 = -1;
        double v2 = kLarge;
        for (index_t j = 1; j < n; ++j) {
            const double c = cost(free_i, j) - v[j];
            if (c < v2) {
                if (c >= v1) {
                    v2 = c;
                    j2 = j;
                } else {
                    v2 = v1;
                    v1 = c;
                    j2 = j1;
                    j1 = j;
                }
            }
        }
        index_t i0 = y[j1];
        const double v1_new = v[j1] - (v2 - v1);
        const bool v1_lowers = v1_new < v[j1];
        if (rr_cnt < static_cast<long>(current) * n) {
            if (v1_lowers) {
                v[j1] = v1_new;
            } else if (i0 >= 0 && j2 >= 0) {
                j1 = j2;
                i0 = y[j2];
            }
            if (i0 >= 0) {
                if (v1_lowers) {
                    free_rows[--current] = i0;
                } else {
                    free_rows[new_free_rows++] = i0;
                }
            }
        } else if (i0 >= 0) {
            free_rows[new_free_rows++] = i0;
        }
        x[free_i] = j1;
        y[j1] = free_i;
    }
    return new_free_rows;
}

// Collects the columns with minimal d into cols[lo, hi). Returns hi.
inline index_t find_dense(const index_t n, const index_t lo, const std::vector<double>& d,
                          std::vector<index_t>& cols) {
    index_t hi = lo + 1;
    double mind = d[cols[lo]];
    for (index_t k = hi; k < n; ++k) {
        const index_t j = cols[k];
        if (d[j] <= mind) {
            if (d[j] < mind) {
                hi = lo;
                mind = d[j];
            }
            cols[k] = cols[hi];
            cols[hi++] = j;
        }
    }
    return hi;
}

// Scans the todo columns. Returns a free column on the shortest path, or -1.
// lo and hi are only written back when no free column was reached.
inline index_t scan_dense(const index_t n, const Eigen::MatrixXd& cost,
                          index_t& plo, index_t& phi, std::vector<double>& d,
                          std::vector<index_t>& cols, std::vector<index_t>& pred,
                          const std::vector<index_t>& y, const std::vector<double>& v) {
    index_t lo = plo;
    index_t hi = phi;
    while (lo != hi) {
        index_t j = cols[lo++];
        const index_t i = y[j];
        const double mind = d[j];
        const double h = cost(i, j) - v[j] - mind;
        for (index_t k = hi; k < n; ++k) {
            j = cols[k];
            const double cred_ij = cost(i, j) - v[j] - h;
            if (cred_ij < d[j]) {
                d[j] = cred_ij;
                pred[j] = i;
                if (cred_ij == mind) {
                    if (y[j] < 0) {
                        return j;
                    }
                    cols[k] = cols[hi];
                    cols[hi++] = j;
                }
            }
        }
    }
    plo = lo;
    phi = hi;
    return -1;
}

// Dijkstra-like shortest augmenting path from start_i. Returns the free column reached.
inline index_t find_path_dense(const index_t n, const Eigen::MatrixXd& cost,
                               const index_t start_i, std::vector<index_t>& y,
                               std::vector<double>& v, std::vector<index_t>& pred) {
    index_t lo = 0;
    index_t hi = 0;
    index_t final_j = -1;
    index_t n_ready = 0;
    std::vector<index_t> cols(n);
    std::vector<double> d(n);

    for (index_t i = 0; i < n; ++i) {
        cols[i] = i;
        pred[i] = start_i;
        d[i] = cost(start_i, i) - v[i];
    }
    while (final_j == -1) {
        if (lo == hi) {
            n_ready = lo;
            hi = find_dense(n, lo, d, cols);
            for (index_t k = lo; k < hi; ++k) {
                const index_t j = cols[k];
                if (y[j] < 0) {
                    final_j = j;
                }
            }
        }
        if (final_j == -1) {
            final_j = scan_dense(n, cost, lo, hi, d, cols, pred, y, v);
        }
    }

    const double mind = d[cols[lo]];
    for (index_t k = 0; k < n_ready; ++k) {
        const index_t j = cols[k];
        v[j] += d[j] - mind;
    }
    return final_j;
}

// Augments every remaining free row along its shortest path
inline void ca_dense(const index_t n, const Eigen::MatrixXd& cost,
                     const index_t n_free_rows, const std::vector<index_t>& free_rows,
                     std::vector<index_t>& x, std::vector<index_t>& y,
                     std::vector<double>& v) {
    std::vector<index_t> pred(n);
    for (index_t f = 0; f < n_free_rows; ++f) {
        const index_t free_i = free_rows[f];
        index_t i = -1;
        index_t j = find_path_dense(n, cost, free_i, y, v, pred);
        while (i != free_i) {
            i = pred[j];
            y[j] = i;
            std::swap(j, x[i]);
        }
    }
}

/**
 * Solves the square assignment problem.
 * x[i] is the column assigned to row i, y[j] the row assigned to column j.
 */
inline void lapjv_dense(const Eigen::MatrixXd& cost, std::vector<index_t>& x,
                        std::vector<index_t>& y) {
    const index_t n = static_cast<index_t>(cost.rows());
    x.assign(n, -1);
    y.assign(n, -1);
    if (n == 0) {
        return;
    }

    std::vector<index_t> free_rows(n);
    std::vector<double> v(n);

    index_t ret = ccrrt_dense(n, cost, free_rows, x, y, v);
    int i = 0;
    while (ret > 0 && i < 2) {
        ret = carr_dense(n, cost, ret, free_rows, x, y, v);
        i++;
    }
    if (ret > 0) {
        ca_dense(n, cost, ret, free_rows, x, y, v);
    }
}

} // namespace lapjv_internal

/**
 * @brief Solves Linear Assignment Problem using Jonker-Volgenant algorithm
 *
 * Finds the minimum-cost assignment between two sets given a rectangular cost
 * matrix. The matrix is extended to a square (n + m) problem in which leaving a
 * row or a column unassigned costs costLimit / 2, so a pair is only assigned
 * when its cost does not exceed costLimit.
 */
class LAPSolver {
public:
    /**
     * @brief Solves linear assignment problem
     * @param costMatrix Cost matrix (n x m) where costMatrix(i,j) is cost of matching i to j
     * @param costLimit Maximum cost threshold for valid matches
     * @param matches Output: [i, j] pairs in ascending row order
     * @param unmatched_a Output: indices from first set that remain unmatched
     * @param unmatched_b Output: indices from second set that remain unmatched
     */
    static void linearAssignment(
        const Eigen::MatrixXd& costMatrix,
        double costLimit,
        std::vector<std::array<int, 2>>& matches,
        std::vector<int>& unmatched_a,
        std::vector<int>& unmatched_b) {

        matches.clear();
        unmatched_a.clear();
        unmatched_b.clear();

        const int n = static_cast<int>(costMatrix.rows());
        const int m = static_cast<int>(costMatrix.cols());

        if (n == 0 || m == 0) {
            for (int i = 0; i < n; ++i) unmatched_a.push_back(i);
            for (int j = 0; j < m; ++j) unmatched_b.push_back(j);
            return;
        }

        std::vector<int> x, y;
        lapjv(costMatrix, costLimit, x, y);

        for (int i = 0; i < n; ++i) {
            if (x[i] < 0) {
                unmatched_a.push_back(i);
            } else {
                matches.push_back({{i, x[i]}});
            }
        }

        for (int j = 0; j < m; ++j) {
            if (y[j] < 0) unmatched_b.push_back(j);
        }
    }

private:
    static void lapjv(const Eigen::MatrixXd& costMatrix, double costLimit,
                      std::vector<int>& x, std::vector<int>& y) {
        const int n_rows = static_cast<int>(costMatrix.rows());
        const int n_cols = static_cast<int>(costMatrix.cols());
        const int n = n_rows + n_cols;

        Eigen::MatrixXd extended = Eigen::MatrixXd::Constant(n, n, costLimit / 2.0);
        extended.topLeftCorner(n_rows, n_cols) = costMatrix;
        extended.bottomRightCorner(n_cols, n_rows).setZero();

        std::vector<lapjv_internal::index_t> x_c, y_c;
        lapjv_internal::lapjv_dense(extended, x_c, y_c);

        x.resize(n_rows);
        y.resize(n_cols);
        for (int i = 0; i < n_rows; ++i) {
            x[i] = (x_c[i] >= n_cols) ? -1 : x_c[i];
        }
        for (int j = 0; j < n_cols; ++j) {
            y[j] = (y_c[j] >= n_rows) ? -1 : y_c[j];
        }
    }
};

} // namespace association
} // namespace boxtrack

#endif // BOXTRACK_ASSOCIATION_LAP_SOLVER_HPP
