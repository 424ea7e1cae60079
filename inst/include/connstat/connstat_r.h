#ifndef CONNSTAT_R_H
#define CONNSTAT_R_H

#include <R.h>
#include <Rinternals.h>

#ifdef __cplusplus
extern "C" {
#endif

	// degree_gini_r.cpp
	SEXP S_gini_curve(SEXP s_A, SEXP s_is_boolean, SEXP s_direction);
	SEXP S_gini_coefficient(SEXP s_A, SEXP s_is_boolean, SEXP s_direction);
	SEXP S_analytical_expected_gini_curve(SEXP s_A, SEXP s_is_boolean, SEXP s_direction);
	SEXP S_normalized_gini_coefficient(SEXP s_A, SEXP s_is_boolean, SEXP s_direction);

	// rich_club_r.cpp
	SEXP S_rich_club_curve(SEXP s_A, SEXP s_is_boolean, SEXP s_direction);
	SEXP S_efficient_rich_club_curve(
		SEXP s_A,
		SEXP s_is_boolean,
		SEXP s_direction,
		SEXP s_richness,
		SEXP s_sparse_bin_set
		);
	SEXP S_analytical_expected_rich_club_curve(SEXP s_A, SEXP s_is_boolean, SEXP s_direction);
	SEXP S_normalized_rich_club_curve(
		SEXP s_A,
		SEXP s_is_boolean,
		SEXP s_direction,
		SEXP s_normalize,
		SEXP s_normalize_with,
		SEXP s_n_repeats,
		SEXP s_seed,
		SEXP s_verbose
		);
	SEXP S_rich_club_coefficient(
		SEXP s_A,
		SEXP s_is_boolean,
		SEXP s_direction,
		SEXP s_normalize_with,
		SEXP s_n_repeats,
		SEXP s_seed,
		SEXP s_verbose
		);

	// degree_control_r.cpp
	SEXP S_generate_degree_based_control(SEXP s_A, SEXP s_is_boolean, SEXP s_direction, SEXP s_seed);

	// conn_prob_r.cpp
	SEXP S_extract_dependent_p_conn(
		SEXP s_A,
		SEXP s_is_boolean,
		SEXP s_dep_matrices,
		SEXP s_dep_bins,
		SEXP s_n_split,
		SEXP s_verbose
		);
	SEXP S_extract_2nd_order(
		SEXP s_A,
		SEXP s_is_boolean,
		SEXP s_positions,
		SEXP s_bin_size_um,
		SEXP s_max_range_um,
		SEXP s_n_split,
		SEXP s_verbose
		);
	SEXP S_extract_3rd_order(
		SEXP s_A,
		SEXP s_is_boolean,
		SEXP s_positions,
		SEXP s_depths,
		SEXP s_bin_size_um,
		SEXP s_max_range_um,
		SEXP s_n_split,
		SEXP s_verbose
		);
	SEXP S_compute_dist_matrix(SEXP s_src_pos, SEXP s_tgt_pos);
	SEXP S_compute_bip_matrix(SEXP s_src_depths, SEXP s_tgt_depths);

	// conn_model_r.cpp
	SEXP S_build_2nd_order(SEXP s_p_conn, SEXP s_bin_edges, SEXP s_max_iterations, SEXP s_tolerance);
	SEXP S_build_3rd_order(SEXP s_p_conn, SEXP s_bin_edges, SEXP s_max_iterations, SEXP s_tolerance);
	SEXP S_evaluate_conn_model(SEXP s_model, SEXP s_d, SEXP s_dz);

	// openmp_diag.cpp
	SEXP S_connstat_openmp_diag(void);

#ifdef __cplusplus
}
#endif

#endif // CONNSTAT_R_H
