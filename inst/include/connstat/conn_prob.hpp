#ifndef CONNSTAT_CONN_PROB_HPP_
#define CONNSTAT_CONN_PROB_HPP_

#include "adjacency.hpp"

#include <Eigen/Dense>

#include <cstdint>
#include <functional>
#include <limits>
#include <vector>

/**
 * @file conn_prob.hpp
 * @brief Connection probability conditioned on binned pairwise covariates
 *
 * Every ordered pair (i, j) of nodes carries D covariate values, one per
 * covariate matrix (distance, relative depth, ...). The pairs are sorted
 * into a D-dimensional grid of bins and, per bin, the fraction of pairs that
 * are connected is reported. Bin i of a dimension holds the values with
 * edges[i] <= v < edges[i + 1]; the last bin is closed on both ends. Pairs
 * with a NaN or out-of-range covariate are not counted.
 */

namespace connstat {

/**
 * @struct conn_prob_table_t
 * @brief D-dimensional table of pair counts and connection probabilities
 *
 * The three arrays are stored flat in row-major order: the last dimension
 * varies fastest. p_conn is count_conn / count_all, with 0 for bins
 * without pairs.
 */
struct conn_prob_table_t {
    std::vector<size_t> shape;
    std::vector<std::vector<double>> bin_edges;
    std::vector<double> p_conn;
    std::vector<std::int64_t> count_conn;
    std::vector<std::int64_t> count_all;

    size_t size() const { return p_conn.size(); }

    /// Flat position of a multi-index.
    size_t flat_index(const std::vector<size_t>& index) const;
};

/**
 * @brief Covariate values for a block of source rows
 *
 * Called with [row_begin, row_end) and must return a
 * (row_end - row_begin) x N matrix whose entry (r, j) is the covariate of
 * the pair (row_begin + r, j). Calls may come from several threads at once.
 */
using covariate_block_fn = std::function<Eigen::MatrixXd(Eigen::Index row_begin, Eigen::Index row_end)>;

/**
 * @brief Binned connection probability from full covariate matrices
 *
 * @param adj adjacency matrix; a pair is connected when its entry is stored
 * @param dep_matrices D covariate matrices of size N x N
 * @param dep_bins D ascending bin edge sequences, at least two edges each
 * @param n_split number of row chunks counted in parallel; the counts do
 *        not depend on it
 * @param verbose print progress to the R console
 *
 * @throws std::invalid_argument on a count or shape mismatch, on bin edges
 *         that are not strictly increasing, or n_split < 1
 */
conn_prob_table_t extract_dependent_p_conn(const adjacency_t& adj,
                                           const std::vector<Eigen::MatrixXd>& dep_matrices,
                                           const std::vector<std::vector<double>>& dep_bins,
                                           int n_split = 1,
                                           bool verbose = false);

/**
 * @brief Binned connection probability with covariates computed per chunk
 *
 * Same counts as extract_dependent_p_conn(), but only the covariate blocks
 * of the chunks currently being counted are held in memory.
 */
conn_prob_table_t extract_dependent_p_conn_split(const adjacency_t& adj,
                                                 const std::vector<covariate_block_fn>& covariates,
                                                 const std::vector<std::vector<double>>& dep_bins,
                                                 int n_split = 1,
                                                 bool verbose = false);

/**
 * @brief Euclidean distances between two point sets
 *
 * Rows are points. Zero distances (a point with itself) are set to NaN so
 * that self pairs drop out of any binning.
 *
 * @throws std::invalid_argument if the coordinate dimensions differ
 */
Eigen::MatrixXd compute_dist_matrix(const Eigen::MatrixXd& src_pos, const Eigen::MatrixXd& tgt_pos);

/**
 * @brief sign(target depth - source depth) for every pair
 *
 * -1 when the target lies below the source, +1 above, 0 at equal depth.
 */
Eigen::MatrixXd compute_bip_matrix(const Eigen::VectorXd& src_depths, const Eigen::VectorXd& tgt_depths);

/// Distance bin edges 0, b, 2b, ..., ceil(max_range / b) b (at least one bin).
std::vector<double> distance_bins(double bin_size_um, double max_range_um);

/**
 * @brief Distance-dependent connection probability
 *
 * @param positions N x k node coordinates in um
 * @param max_range_um upper end of the distance bins; NaN uses the largest
 *        pairwise distance, which is only possible without splitting
 *
 * @throws std::invalid_argument if positions has the wrong number of rows,
 *         bin_size_um is not positive, or max_range_um is NaN with n_split > 1
 */
conn_prob_table_t extract_2nd_order(const adjacency_t& adj,
                                    const Eigen::MatrixXd& positions,
                                    double bin_size_um = 100.0,
                                    double max_range_um = std::numeric_limits<double>::quiet_NaN(),
                                    int n_split = 1,
                                    bool verbose = false);

/**
 * @brief Distance- and bipolar-dependent connection probability
 *
 * The second dimension bins compute_bip_matrix() into three bins
 * (target below, same depth, target above) with edges -1.5, -0.5, 0.5, 1.5.
 */
conn_prob_table_t extract_3rd_order(const adjacency_t& adj,
                                    const Eigen::MatrixXd& positions,
                                    const Eigen::VectorXd& depths,
                                    double bin_size_um = 100.0,
                                    double max_range_um = std::numeric_limits<double>::quiet_NaN(),
                                    int n_split = 1,
                                    bool verbose = false);

} // namespace connstat

#endif // CONNSTAT_CONN_PROB_HPP_
