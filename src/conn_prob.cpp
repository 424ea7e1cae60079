#include "conn_prob.hpp"
#include "progress_utils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include <R.h>
#include <R_ext/Print.h>

namespace connstat {

namespace {

struct bin_grid_t {
    std::vector<std::vector<double>> edges;
    std::vector<size_t> shape;
    std::vector<size_t> strides;
    size_t n_cells = 0;
};

bin_grid_t make_bin_grid(const std::vector<std::vector<double>>& dep_bins) {
    if (dep_bins.empty()) {
        throw std::invalid_argument("At least one covariate with bin edges is required");
    }

    bin_grid_t grid;
    grid.edges = dep_bins;
    grid.shape.resize(dep_bins.size());
    grid.strides.resize(dep_bins.size());

    for (size_t d = 0; d < dep_bins.size(); ++d) {
        const std::vector<double>& e = dep_bins[d];
        if (e.size() < 2) {
            throw std::invalid_argument("Bin edges of covariate " + std::to_string(d) +
                                        " must hold at least 2 values");
        }
        for (size_t k = 0; k < e.size(); ++k) {
            if (!std::isfinite(e[k])) {
                throw std::invalid_argument("Bin edges of covariate " + std::to_string(d) +
                                            " must be finite");
            }
            if (k > 0 && !(e[k] > e[k - 1])) {
                throw std::invalid_argument("Bin edges of covariate " + std::to_string(d) +
                                            " must be strictly increasing");
            }
        }
        grid.shape[d] = e.size() - 1;
    }

    size_t stride = 1;
    for (size_t d = dep_bins.size(); d-- > 0;) {
        grid.strides[d] = stride;
        stride *= grid.shape[d];
    }
    grid.n_cells = stride;
    return grid;
}

// Bin of value v, or -1 when v is NaN or outside [edges.front(), edges.back()].
inline long locate_bin(const std::vector<double>& edges, double v) {
    if (!(v >= edges.front() && v <= edges.back())) return -1;
    if (v == edges.back()) return static_cast<long>(edges.size()) - 2;
    auto it = std::upper_bound(edges.begin(), edges.end(), v);
    return static_cast<long>(it - edges.begin()) - 1;
}

/**
 * Adds the pairs of source rows [row_begin, row_end) to the counts.
 * cov[d] holds the covariate of pair (i, j) at (i - row_offset, j).
 */
void count_rows(const csr_matrix_t& A,
                const std::vector<const Eigen::MatrixXd*>& cov,
                Eigen::Index row_offset,
                Eigen::Index row_begin,
                Eigen::Index row_end,
                const bin_grid_t& grid,
                std::vector<std::int64_t>& count_conn,
                std::vector<std::int64_t>& count_all) {
    const Eigen::Index n_cols = A.cols();
    const size_t n_dims = cov.size();

    for (Eigen::Index i = row_begin; i < row_end; ++i) {
        const Eigen::Index r = i - row_offset;
        csr_matrix_t::InnerIterator it(A, i);

        for (Eigen::Index j = 0; j < n_cols; ++j) {
            while (it && it.col() < j) ++it;

            size_t cell = 0;
            bool in_range = true;
            for (size_t d = 0; d < n_dims; ++d) {
                const long b = locate_bin(grid.edges[d], (*cov[d])(r, j));
                if (b < 0) {
                    in_range = false;
                    break;
                }
                cell += static_cast<size_t>(b) * grid.strides[d];
            }
            if (!in_range) continue;

            ++count_all[cell];
            if (it && it.col() == j) ++count_conn[cell];
        }
    }
}

/**
 * Splits the rows into chunks of ceil(N / n_split), counts the chunks in
 * parallel with count_chunk(begin, end, conn, all) and sums the partial
 * counts in chunk order.
 */
template <typename ChunkCounter>
conn_prob_table_t count_in_chunks(Eigen::Index n_nodes,
                                  const bin_grid_t& grid,
                                  int n_split,
                                  bool verbose,
                                  ChunkCounter count_chunk) {
    if (n_split < 1) {
        throw std::invalid_argument("n_split must be at least 1, got " + std::to_string(n_split));
    }

    const Eigen::Index chunk_size = std::max<Eigen::Index>(1, (n_nodes + n_split - 1) / n_split);
    const int n_chunks = static_cast<int>((n_nodes + chunk_size - 1) / chunk_size);

    auto ptm = std::chrono::steady_clock::now();
    if (verbose) {
        std::string shape_str;
        for (size_t d = 0; d < grid.shape.size(); ++d) {
            if (d > 0) shape_str += "x";
            shape_str += std::to_string(grid.shape[d]);
        }
        Rprintf("Extracting %d-dimensional (%s) connection probabilities in %d split(s)...\n",
                static_cast<int>(grid.shape.size()), shape_str.c_str(), n_chunks);
        R_FlushConsole();
    }

    std::vector<std::vector<std::int64_t>> chunk_conn(static_cast<size_t>(n_chunks));
    std::vector<std::vector<std::int64_t>> chunk_all(static_cast<size_t>(n_chunks));
    std::exception_ptr chunk_error = nullptr;
    int n_done = 0;

    #ifdef _OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (int c = 0; c < n_chunks; ++c) {
        const Eigen::Index begin = static_cast<Eigen::Index>(c) * chunk_size;
        const Eigen::Index end = std::min(n_nodes, begin + chunk_size);
        try {
            std::vector<std::int64_t> conn(grid.n_cells, 0);
            std::vector<std::int64_t> all(grid.n_cells, 0);
            count_chunk(begin, end, conn, all);
            chunk_conn[static_cast<size_t>(c)].swap(conn);
            chunk_all[static_cast<size_t>(c)].swap(all);
        } catch (...) {
            #ifdef _OPENMP
            #pragma omp critical(connstat_chunk_error)
            #endif
            {
                if (!chunk_error) chunk_error = std::current_exception();
            }
        }

        if (verbose) {
            #ifdef _OPENMP
            #pragma omp critical(connstat_chunk_progress)
            #endif
            {
                ++n_done;
                Rprintf("  <SPLIT %d of %d> rows %ld-%ld done\n",
                        n_done, n_chunks, static_cast<long>(begin), static_cast<long>(end - 1));
            }
        }
    }

    if (chunk_error) {
        std::rethrow_exception(chunk_error);
    }

    conn_prob_table_t table;
    table.shape = grid.shape;
    table.bin_edges = grid.edges;
    table.count_conn.assign(grid.n_cells, 0);
    table.count_all.assign(grid.n_cells, 0);
    for (int c = 0; c < n_chunks; ++c) {
        for (size_t k = 0; k < grid.n_cells; ++k) {
            table.count_conn[k] += chunk_conn[static_cast<size_t>(c)][k];
            table.count_all[k] += chunk_all[static_cast<size_t>(c)][k];
        }
    }

    table.p_conn.resize(grid.n_cells);
    for (size_t k = 0; k < grid.n_cells; ++k) {
        table.p_conn[k] = table.count_all[k] > 0
            ? static_cast<double>(table.count_conn[k]) / static_cast<double>(table.count_all[k])
            : 0.0;
    }

    if (verbose) {
        elapsed_time(ptm, "Connection probabilities extracted", true);
    }
    return table;
}

void check_positions(const adjacency_t& adj, const Eigen::MatrixXd& positions, double bin_size_um,
                     double max_range_um, int n_split) {
    if (positions.rows() != adj.n_nodes()) {
        throw std::invalid_argument("positions has " + std::to_string(positions.rows()) +
                                    " rows but the matrix has " + std::to_string(adj.n_nodes()) +
                                    " nodes");
    }
    if (!(bin_size_um > 0.0) || !std::isfinite(bin_size_um)) {
        throw std::invalid_argument("bin_size_um must be positive and finite");
    }
    if (n_split > 1 && std::isnan(max_range_um)) {
        throw std::invalid_argument("max_range_um must be specified if n_split is larger than 1");
    }
}

double max_finite(const Eigen::MatrixXd& M) {
    double mx = 0.0;
    for (Eigen::Index j = 0; j < M.cols(); ++j) {
        for (Eigen::Index i = 0; i < M.rows(); ++i) {
            if (std::isfinite(M(i, j)) && M(i, j) > mx) mx = M(i, j);
        }
    }
    return mx;
}

} // namespace

size_t conn_prob_table_t::flat_index(const std::vector<size_t>& index) const {
    if (index.size() != shape.size()) {
        throw std::invalid_argument("Index has " + std::to_string(index.size()) +
                                    " dimensions, table has " + std::to_string(shape.size()));
    }
    size_t flat = 0;
    for (size_t d = 0; d < shape.size(); ++d) {
        if (index[d] >= shape[d]) {
            throw std::out_of_range("Index " + std::to_string(index[d]) + " out of range in dimension " +
                                    std::to_string(d));
        }
        flat = flat * shape[d] + index[d];
    }
    return flat;
}

conn_prob_table_t extract_dependent_p_conn(const adjacency_t& adj,
                                           const std::vector<Eigen::MatrixXd>& dep_matrices,
                                           const std::vector<std::vector<double>>& dep_bins,
                                           int n_split,
                                           bool verbose) {
    if (dep_matrices.size() != dep_bins.size()) {
        throw std::invalid_argument("Dependencies/bins mismatch: " + std::to_string(dep_matrices.size()) +
                                    " covariate matrices but " + std::to_string(dep_bins.size()) +
                                    " bin edge sequences");
    }
    const bin_grid_t grid = make_bin_grid(dep_bins);

    const Eigen::Index n = adj.n_nodes();
    std::vector<const Eigen::MatrixXd*> cov;
    for (size_t d = 0; d < dep_matrices.size(); ++d) {
        if (dep_matrices[d].rows() != n || dep_matrices[d].cols() != n) {
            throw std::invalid_argument("Covariate matrix " + std::to_string(d) + " is " +
                                        std::to_string(dep_matrices[d].rows()) + "x" +
                                        std::to_string(dep_matrices[d].cols()) +
                                        ", expected " + std::to_string(n) + "x" + std::to_string(n));
        }
        cov.push_back(&dep_matrices[d]);
    }

    const csr_matrix_t& A = adj.csr();
    return count_in_chunks(n, grid, n_split, verbose,
                           [&](Eigen::Index begin, Eigen::Index end,
                               std::vector<std::int64_t>& conn, std::vector<std::int64_t>& all) {
                               count_rows(A, cov, 0, begin, end, grid, conn, all);
                           });
}

conn_prob_table_t extract_dependent_p_conn_split(const adjacency_t& adj,
                                                 const std::vector<covariate_block_fn>& covariates,
                                                 const std::vector<std::vector<double>>& dep_bins,
                                                 int n_split,
                                                 bool verbose) {
    if (covariates.size() != dep_bins.size()) {
        throw std::invalid_argument("Dependencies/bins mismatch: " + std::to_string(covariates.size()) +
                                    " covariate functions but " + std::to_string(dep_bins.size()) +
                                    " bin edge sequences");
    }
    for (size_t d = 0; d < covariates.size(); ++d) {
        if (!covariates[d]) {
            throw std::invalid_argument("Covariate function " + std::to_string(d) + " is empty");
        }
    }
    const bin_grid_t grid = make_bin_grid(dep_bins);

    const Eigen::Index n = adj.n_nodes();
    const csr_matrix_t& A = adj.csr();
    return count_in_chunks(n, grid, n_split, verbose,
                           [&](Eigen::Index begin, Eigen::Index end,
                               std::vector<std::int64_t>& conn, std::vector<std::int64_t>& all) {
                               std::vector<Eigen::MatrixXd> blocks(covariates.size());
                               std::vector<const Eigen::MatrixXd*> cov(covariates.size());
                               for (size_t d = 0; d < covariates.size(); ++d) {
                                   blocks[d] = covariates[d](begin, end);
                                   if (blocks[d].rows() != end - begin || blocks[d].cols() != n) {
                                       throw std::invalid_argument(
                                           "Covariate function " + std::to_string(d) +
                                           " returned a block of the wrong shape");
                                   }
                                   cov[d] = &blocks[d];
                               }
                               count_rows(A, cov, begin, begin, end, grid, conn, all);
                           });
}

Eigen::MatrixXd compute_dist_matrix(const Eigen::MatrixXd& src_pos, const Eigen::MatrixXd& tgt_pos) {
    if (src_pos.cols() != tgt_pos.cols()) {
        throw std::invalid_argument("Source and target positions have different dimensions (" +
                                    std::to_string(src_pos.cols()) + " vs " +
                                    std::to_string(tgt_pos.cols()) + ")");
    }

    Eigen::MatrixXd dist(src_pos.rows(), tgt_pos.rows());
    for (Eigen::Index j = 0; j < tgt_pos.rows(); ++j) {
        for (Eigen::Index i = 0; i < src_pos.rows(); ++i) {
            const double d = (src_pos.row(i) - tgt_pos.row(j)).norm();
            dist(i, j) = d == 0.0 ? std::numeric_limits<double>::quiet_NaN() : d;
        }
    }
    return dist;
}

Eigen::MatrixXd compute_bip_matrix(const Eigen::VectorXd& src_depths, const Eigen::VectorXd& tgt_depths) {
    Eigen::MatrixXd bip(src_depths.size(), tgt_depths.size());
    for (Eigen::Index j = 0; j < tgt_depths.size(); ++j) {
        for (Eigen::Index i = 0; i < src_depths.size(); ++i) {
            const double dz = tgt_depths(j) - src_depths(i);
            if (std::isnan(dz)) {
                bip(i, j) = dz;
            } else {
                bip(i, j) = static_cast<double>((dz > 0.0) - (dz < 0.0));
            }
        }
    }
    return bip;
}

std::vector<double> distance_bins(double bin_size_um, double max_range_um) {
    if (!(bin_size_um > 0.0) || !std::isfinite(bin_size_um)) {
        throw std::invalid_argument("bin_size_um must be positive and finite");
    }
    if (!(max_range_um >= 0.0) || !std::isfinite(max_range_um)) {
        throw std::invalid_argument("max_range_um must be non-negative and finite");
    }
    const long n_bins = std::max(1L, static_cast<long>(std::ceil(max_range_um / bin_size_um)));
    std::vector<double> edges(static_cast<size_t>(n_bins) + 1);
    for (long k = 0; k <= n_bins; ++k) {
        edges[static_cast<size_t>(k)] = static_cast<double>(k) * bin_size_um;
    }
    return edges;
}

conn_prob_table_t extract_2nd_order(const adjacency_t& adj,
                                    const Eigen::MatrixXd& positions,
                                    double bin_size_um,
                                    double max_range_um,
                                    int n_split,
                                    bool verbose) {
    check_positions(adj, positions, bin_size_um, max_range_um, n_split);

    if (n_split == 1) {
        const Eigen::MatrixXd dist = compute_dist_matrix(positions, positions);
        if (std::isnan(max_range_um)) {
            max_range_um = max_finite(dist);
        }
        return extract_dependent_p_conn(adj, {dist}, {distance_bins(bin_size_um, max_range_um)},
                                        1, verbose);
    }

    const std::vector<covariate_block_fn> covariates = {
        [&positions](Eigen::Index begin, Eigen::Index end) {
            return compute_dist_matrix(positions.middleRows(begin, end - begin), positions);
        }
    };
    return extract_dependent_p_conn_split(adj, covariates, {distance_bins(bin_size_um, max_range_um)},
                                          n_split, verbose);
}

conn_prob_table_t extract_3rd_order(const adjacency_t& adj,
                                    const Eigen::MatrixXd& positions,
                                    const Eigen::VectorXd& depths,
                                    double bin_size_um,
                                    double max_range_um,
                                    int n_split,
                                    bool verbose) {
    check_positions(adj, positions, bin_size_um, max_range_um, n_split);
    if (depths.size() != adj.n_nodes()) {
        throw std::invalid_argument("depths has length " + std::to_string(depths.size()) +
                                    " but the matrix has " + std::to_string(adj.n_nodes()) + " nodes");
    }

    const std::vector<double> bip_bins = {-1.5, -0.5, 0.5, 1.5};

    if (n_split == 1) {
        const Eigen::MatrixXd dist = compute_dist_matrix(positions, positions);
        if (std::isnan(max_range_um)) {
            max_range_um = max_finite(dist);
        }
        const Eigen::MatrixXd bip = compute_bip_matrix(depths, depths);
        return extract_dependent_p_conn(adj, {dist, bip},
                                        {distance_bins(bin_size_um, max_range_um), bip_bins},
                                        1, verbose);
    }

    const std::vector<covariate_block_fn> covariates = {
        [&positions](Eigen::Index begin, Eigen::Index end) {
            return compute_dist_matrix(positions.middleRows(begin, end - begin), positions);
        },
        [&depths](Eigen::Index begin, Eigen::Index end) {
            return compute_bip_matrix(depths.segment(begin, end - begin), depths);
        }
    };
    return extract_dependent_p_conn_split(adj, covariates,
                                          {distance_bins(bin_size_um, max_range_um), bip_bins},
                                          n_split, verbose);
}

} // namespace connstat
