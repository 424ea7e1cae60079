#ifndef CONNSTAT_ADJACENCY_HPP_
#define CONNSTAT_ADJACENCY_HPP_

#include "eigen_config.hpp"

#include <Eigen/Sparse>

#include <cstddef>
#include <string>
#include <vector>

/**
 * @file adjacency.hpp
 * @brief Sparse directed adjacency matrix with row and column access
 *
 * Rows are sources and columns are targets: entry (i, j) is the connection
 * i -> j. The efferent (out-) degree of a node is its row sum and the
 * afferent (in-) degree its column sum.
 */

namespace connstat {

/**
 * @enum direction_t
 * @brief Which side of the adjacency matrix a degree is taken from
 */
enum class direction_t {
    AFFERENT,  ///< in-degree, column sums
    EFFERENT,  ///< out-degree, row sums
    BOTH       ///< in-degree + out-degree
};

/**
 * @brief Parses "afferent", "efferent" or "both"
 * @throws std::invalid_argument for any other string
 */
direction_t direction_from_string(const std::string& name);

std::string direction_name(direction_t direction);

using csc_matrix_t = Eigen::SparseMatrix<double, Eigen::ColMajor>;
using csr_matrix_t = Eigen::SparseMatrix<double, Eigen::RowMajor>;
using triplet_t = Eigen::Triplet<double>;

/**
 * @class adjacency_t
 * @brief Immutable N x N connectivity matrix, boolean or non-negative weighted
 *
 * The matrix is held twice, compressed by column (csc) and by row (csr), so
 * that every analysis can pick the layout whose slicing it needs without
 * converting on the fly. Explicit zeros are pruned on construction. For
 * boolean matrices every stored value is 1.0.
 */
class adjacency_t {
public:
    adjacency_t() = default;

    /**
     * @throws std::invalid_argument if the matrix is not square or holds
     *         negative or non-finite values
     */
    adjacency_t(const csc_matrix_t& matrix, bool is_boolean);

    /**
     * Builds the matrix from (source, target, value) triplets. Duplicates are
     * summed for weighted matrices and collapse to a single edge for boolean
     * matrices.
     */
    adjacency_t(Eigen::Index n_nodes, const std::vector<triplet_t>& triplets, bool is_boolean);

    Eigen::Index n_nodes() const { return csc_.rows(); }
    Eigen::Index n_edges() const { return csc_.nonZeros(); }
    bool is_boolean() const { return is_boolean_; }

    /// Column-compressed storage; O(1) access to the sources of a target.
    const csc_matrix_t& csc() const { return csc_; }
    /// Row-compressed storage; O(1) access to the targets of a source.
    const csr_matrix_t& csr() const { return csr_; }

    bool has_edge(Eigen::Index source, Eigen::Index target) const;

    std::vector<double> efferent_degree() const;
    std::vector<double> afferent_degree() const;

    /// Structural nonzero counts, ignoring weights.
    std::vector<double> efferent_count() const;
    std::vector<double> afferent_count() const;

    /// Sum of all stored values.
    double total_weight() const;

private:
    void validate_and_index();

    csc_matrix_t csc_;
    csr_matrix_t csr_;
    bool is_boolean_ = true;
};

} // namespace connstat

#endif // CONNSTAT_ADJACENCY_HPP_
