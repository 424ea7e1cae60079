#ifndef CONNSTAT_SEXP_CPP_CONVERSION_UTILS_HPP_
#define CONNSTAT_SEXP_CPP_CONVERSION_UTILS_HPP_

#include "curve.hpp"
#include "conn_prob.hpp"

#include <string>
#include <vector>

#include <R.h>
#include <Rinternals.h>

#undef length

// Scalar arguments; each raises an R error naming the argument when the
// SEXP has the wrong type or length.
std::string R_string_arg(SEXP s_x, const char* arg_name);
bool R_logical_arg(SEXP s_x, const char* arg_name);
int R_int_arg(SEXP s_x, const char* arg_name);
double R_double_arg(SEXP s_x, const char* arg_name);

std::vector<double> Rvect_to_CppVect_double(SEXP Ry, const char* arg_name);
std::vector<std::vector<double>> R_list_of_dvectors_to_cpp_vector_of_dvectors(SEXP Rvectvect,
                                                                               const char* arg_name);

SEXP convert_vector_double_to_R(const std::vector<double>& vec);
SEXP convert_vector_vector_double_to_R(const std::vector<std::vector<double>>& vec);

/// Named list with the given components; protects nothing on return.
SEXP make_named_list(const std::vector<SEXP>& values, const std::vector<const char*>& names);

/// list(x, y)
SEXP curve_to_R(const connstat::curve_t& curve);

/// list(x, mean, sd)
SEXP null_curve_to_R(const connstat::null_curve_t& curve);

/**
 * @brief list(p_conn, count_conn, count_all, bin_edges)
 *
 * The three tables become R arrays (vectors for one dimension) with the
 * table's shape as dim, re-ordered from row-major to R's column-major
 * layout. Counts are returned as doubles since they can exceed R's
 * integer range.
 */
SEXP conn_prob_table_to_R(const connstat::conn_prob_table_t& table);

/**
 * @brief Probability table from an R array and its list of bin edges
 *
 * Only p_conn and bin_edges are filled in; the counts stay empty.
 */
connstat::conn_prob_table_t R_to_conn_prob_table(SEXP s_p_conn, SEXP s_bin_edges);

#endif // CONNSTAT_SEXP_CPP_CONVERSION_UTILS_HPP_
