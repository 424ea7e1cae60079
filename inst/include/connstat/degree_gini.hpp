#ifndef CONNSTAT_DEGREE_GINI_HPP_
#define CONNSTAT_DEGREE_GINI_HPP_

#include "adjacency.hpp"
#include "curve.hpp"

#include <vector>

namespace connstat {

/**
 * @brief Per-node degree (sum of weights) along one axis of the matrix
 *
 * @param adj adjacency matrix
 * @param direction EFFERENT for row sums, AFFERENT for column sums
 * @return vector of length adj.n_nodes()
 *
 * @throws std::invalid_argument for any other direction
 */
std::vector<double> degree_vector(const adjacency_t& adj, direction_t direction);

/**
 * @brief Lorenz-style inequality curve of the degree distribution
 *
 * Degrees are sorted from highest to lowest. Point i (i = 1..N) sits at
 * rank i/N and holds the share of the total degree carried by the i
 * highest-degree nodes. The curve starts at (0, 0). If the total degree is
 * zero the curve is the equality diagonal.
 *
 * Example: degrees [3, 1, 1, 1] give
 * (0, 0), (0.25, 0.5), (0.5, 0.667), (0.75, 0.833), (1, 1).
 */
curve_t gini_curve(const adjacency_t& adj, direction_t direction);

/**
 * @brief Gini coefficient from the trapezoid area A under gini_curve()
 *
 * Returns 2A - 1: 0 for a regular graph, close to 1 when all connections
 * sit on a single node.
 */
double gini_coefficient(const adjacency_t& adj, direction_t direction);

/**
 * @brief Expected Gini curve under a binomial (Erdos-Renyi) degree model
 *
 * Each node has N - 1 potential partners connected with the overall edge
 * probability p = nnz / (N (N - 1)). Degree values run from N - 1 down to 0;
 * x is the cumulative probability mass and y the cumulative share of the
 * expected degree mass. Computed in closed form, no sampling.
 */
curve_t analytical_expected_gini_curve(const adjacency_t& adj, direction_t direction);

/**
 * @brief Excess inequality over the random-graph expectation
 *
 * 2 * (area under gini_curve - area under analytical_expected_gini_curve).
 * Positive values mean the degrees are more unequal than chance.
 */
double normalized_gini_coefficient(const adjacency_t& adj, direction_t direction);

} // namespace connstat

#endif // CONNSTAT_DEGREE_GINI_HPP_
