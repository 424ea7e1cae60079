#include "conn_prob.hpp"
#include "Eigen_utils.h"
#include "SEXP_cpp_conversion_utils.hpp"
#include "error_utils.h" // for REPORT_ERROR()
#include "connstat_r.h"

#include <exception>
#include <vector>

/**
 * @brief R interface to extract_dependent_p_conn()
 *
 * @param s_dep_matrices list of N x N numeric covariate matrices
 * @param s_dep_bins list of bin edge vectors, one per covariate
 * @param s_n_split number of row chunks
 * @param s_verbose print progress
 *
 * @return list(p_conn, count_conn, count_all, bin_edges); the tables are
 *         arrays of dimension lengths(bin_edges) - 1
 */
extern "C" SEXP S_extract_dependent_p_conn(
    SEXP s_A,
    SEXP s_is_boolean,
    SEXP s_dep_matrices,
    SEXP s_dep_bins,
    SEXP s_n_split,
    SEXP s_verbose
    ) {
    if (TYPEOF(s_dep_matrices) != VECSXP) {
        Rf_error("dep_matrices must be a list of numeric matrices");
    }
    const int n_split = R_int_arg(s_n_split, "n_split");
    const bool verbose = R_logical_arg(s_verbose, "verbose");
    const std::vector<std::vector<double>> dep_bins =
        R_list_of_dvectors_to_cpp_vector_of_dvectors(s_dep_bins, "dep_bins");

    std::vector<Eigen::MatrixXd> dep_matrices;
    for (int d = 0; d < LENGTH(s_dep_matrices); ++d) {
        dep_matrices.push_back(SEXP_to_EigenMatrixXd(VECTOR_ELT(s_dep_matrices, d), "dep_matrices[[i]]"));
    }

    try {
        const connstat::adjacency_t adj = SEXP_to_adjacency(s_A, s_is_boolean);
        const connstat::conn_prob_table_t table =
            connstat::extract_dependent_p_conn(adj, dep_matrices, dep_bins, n_split, verbose);
        return conn_prob_table_to_R(table);
    } catch (const std::exception& e) {
        REPORT_ERROR("Error in extract_dependent_p_conn: %s", e.what());
    }
    return R_NilValue;
}

/**
 * @brief R interface to extract_2nd_order()
 *
 * @param s_positions N x k matrix of node coordinates (um)
 * @param s_bin_size_um distance bin width
 * @param s_max_range_um upper distance; NA for the largest pairwise distance
 */
extern "C" SEXP S_extract_2nd_order(
    SEXP s_A,
    SEXP s_is_boolean,
    SEXP s_positions,
    SEXP s_bin_size_um,
    SEXP s_max_range_um,
    SEXP s_n_split,
    SEXP s_verbose
    ) {
    const Eigen::MatrixXd positions = SEXP_to_EigenMatrixXd(s_positions, "positions");
    const double bin_size_um = R_double_arg(s_bin_size_um, "bin_size_um");
    const double max_range_um = R_double_arg(s_max_range_um, "max_range_um");
    const int n_split = R_int_arg(s_n_split, "n_split");
    const bool verbose = R_logical_arg(s_verbose, "verbose");

    try {
        const connstat::adjacency_t adj = SEXP_to_adjacency(s_A, s_is_boolean);
        const connstat::conn_prob_table_t table =
            connstat::extract_2nd_order(adj, positions, bin_size_um, max_range_um, n_split, verbose);
        return conn_prob_table_to_R(table);
    } catch (const std::exception& e) {
        REPORT_ERROR("Error in extract_2nd_order: %s", e.what());
    }
    return R_NilValue;
}

extern "C" SEXP S_extract_3rd_order(
    SEXP s_A,
    SEXP s_is_boolean,
    SEXP s_positions,
    SEXP s_depths,
    SEXP s_bin_size_um,
    SEXP s_max_range_um,
    SEXP s_n_split,
    SEXP s_verbose
    ) {
    const Eigen::MatrixXd positions = SEXP_to_EigenMatrixXd(s_positions, "positions");
    const Eigen::VectorXd depths = SEXP_to_EigenVectorXd(s_depths, "depths");
    const double bin_size_um = R_double_arg(s_bin_size_um, "bin_size_um");
    const double max_range_um = R_double_arg(s_max_range_um, "max_range_um");
    const int n_split = R_int_arg(s_n_split, "n_split");
    const bool verbose = R_logical_arg(s_verbose, "verbose");

    try {
        const connstat::adjacency_t adj = SEXP_to_adjacency(s_A, s_is_boolean);
        const connstat::conn_prob_table_t table =
            connstat::extract_3rd_order(adj, positions, depths, bin_size_um, max_range_um, n_split, verbose);
        return conn_prob_table_to_R(table);
    } catch (const std::exception& e) {
        REPORT_ERROR("Error in extract_3rd_order: %s", e.what());
    }
    return R_NilValue;
}

extern "C" SEXP S_compute_dist_matrix(SEXP s_src_pos, SEXP s_tgt_pos) {
    const Eigen::MatrixXd src_pos = SEXP_to_EigenMatrixXd(s_src_pos, "src_pos");
    const Eigen::MatrixXd tgt_pos = SEXP_to_EigenMatrixXd(s_tgt_pos, "tgt_pos");

    try {
        return EigenMatrixXd_to_SEXP(connstat::compute_dist_matrix(src_pos, tgt_pos));
    } catch (const std::exception& e) {
        REPORT_ERROR("Error in compute_dist_matrix: %s", e.what());
    }
    return R_NilValue;
}

extern "C" SEXP S_compute_bip_matrix(SEXP s_src_depths, SEXP s_tgt_depths) {
    const Eigen::VectorXd src_depths = SEXP_to_EigenVectorXd(s_src_depths, "src_depths");
    const Eigen::VectorXd tgt_depths = SEXP_to_EigenVectorXd(s_tgt_depths, "tgt_depths");
    return EigenMatrixXd_to_SEXP(connstat::compute_bip_matrix(src_depths, tgt_depths));
}
