#ifndef CONNSTAT_RICH_CLUB_HPP_
#define CONNSTAT_RICH_CLUB_HPP_

#include "adjacency.hpp"
#include "curve.hpp"

#include <vector>

/**
 * @file rich_club.hpp
 * @brief Rich-club connectivity of directed graphs
 *
 * For a degree threshold k let S(k) be the nodes whose degree is at least k.
 * The rich-club value at k is the edge density of the subgraph induced by
 * S(k):
 *
 *   phi(k) = E(S(k)) / (|S(k)| (|S(k)| - 1))
 *
 * where E(S) is the summed weight of the edges with both endpoints in S.
 * phi(k) is NaN when S(k) holds fewer than two nodes.
 */

namespace connstat {

/**
 * @struct rich_club_thresholds_t
 * @brief Degree thresholds at which a rich-club curve is evaluated
 *
 * thresholds are in degree units; x is what the curve reports for each
 * threshold (the threshold itself for boolean matrices, the bin centre for
 * binned weighted degrees).
 */
struct rich_club_thresholds_t {
    std::vector<double> x;
    std::vector<double> thresholds;
};

/**
 * @brief Thresholds used by rich_club_curve() for a degree vector
 *
 * Boolean matrices use every integer degree 1..max. Weighted degrees are
 * binned into max(int(0.1 N), min(N, 30)) equal-width bins spanning
 * [min, max + 1e-6 (max - min)]; each bin's lower edge becomes a threshold.
 */
rich_club_thresholds_t rich_club_thresholds(const std::vector<double>& degrees, bool is_boolean);

/**
 * @brief Rich-club density of the induced subgraph at each threshold
 *
 * Walks the compressed columns of the members of S(k) once per threshold,
 * summing the stored values whose source is in S(k). Cost is
 * O(thresholds x nnz(S)), no induced submatrix is materialized.
 *
 * @param degrees richness of every node, length adj.n_nodes()
 * @param thresholds ascending degree thresholds
 */
std::vector<double> induced_rich_club_density(const adjacency_t& adj,
                                              const std::vector<double>& degrees,
                                              const std::vector<double>& thresholds);

/**
 * @brief Rich-club density from cumulative degree histograms, O(E + bins)
 *
 * Every edge is ranked by the smaller richness of its two endpoints. An edge
 * lies inside S(k) exactly when its rank is at least k, so cumulating the
 * edge-rank histogram and the node-richness histogram from the top gives
 * E(S(k)) and |S(k)| for all thresholds in one pass.
 *
 * @param richness per-node richness, length adj.n_nodes()
 * @param thresholds ascending thresholds; node and edge ranks below the
 *        first threshold are not counted
 * @param weighted_edges sum edge values when true, count edges when false
 */
std::vector<double> cumulative_rich_club_density(const adjacency_t& adj,
                                                 const std::vector<double>& richness,
                                                 const std::vector<double>& thresholds,
                                                 bool weighted_edges);

/**
 * @brief Naive rich-club curve
 *
 * Degrees are the weighted sums of degree_vector(). Boolean matrices are
 * evaluated at every threshold 1..max degree. Weighted matrices are binned
 * first (see rich_club_thresholds()) to bound the number of thresholds.
 * Intended for small graphs and as a reference for efficient_rich_club_curve().
 *
 * @throws std::invalid_argument if direction is not AFFERENT or EFFERENT
 */
curve_t rich_club_curve(const adjacency_t& adj, direction_t direction);

/**
 * @brief Edge-linear rich-club curve
 *
 * @param adj adjacency matrix
 * @param direction richness used for ranking nodes: structural out-degree
 *        (EFFERENT), in-degree (AFFERENT) or their sum (BOTH)
 * @param pre_calculated_richness optional per-node richness replacing the
 *        one derived from direction; must have length adj.n_nodes()
 * @param sparse_bin_set if true only the observed richness values (plus 0
 *        and max + 1) are used as bin edges, otherwise every integer
 *        0..max + 1
 *
 * @return curve with x the bin lower edges in ascending order; nodes of
 *         zero richness are always counted at threshold 0
 *
 * @throws std::invalid_argument on a richness vector of the wrong length
 */
curve_t efficient_rich_club_curve(const adjacency_t& adj,
                                  direction_t direction = direction_t::EFFERENT,
                                  const std::vector<double>* pre_calculated_richness = nullptr,
                                  bool sparse_bin_set = false);

/**
 * @brief Closed-form rich-club expectation under a degree-preserving null model
 *
 * Only defined for boolean matrices. For each threshold k in 1..max degree
 * and each node v of S(k), the number of v's out-edges landing inside S(k)
 * is modelled as hypergeometric: outdeg(v) draws from the total indegree of
 * all other nodes, of which the indegree of the other members of S(k) are
 * successes. Means are summed and divided by |S(k)| (|S(k)| - 1); the
 * variances are summed and the square root divided likewise.
 *
 * @note Summing per-node variances treats the nodes as independent. Their
 * neighbourhoods overlap, so the sd is an approximation, kept deliberately
 * to match the published reference method.
 *
 * @throws std::domain_error if the matrix is not boolean
 * @throws std::invalid_argument if direction is not AFFERENT or EFFERENT
 */
null_curve_t analytical_expected_rich_club_curve(const adjacency_t& adj, direction_t direction);

} // namespace connstat

#endif // CONNSTAT_RICH_CLUB_HPP_
