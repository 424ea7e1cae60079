#ifndef CONNSTAT_EIGEN_UTILS_H_
#define CONNSTAT_EIGEN_UTILS_H_

#include "adjacency.hpp"

#include <Eigen/Dense>
#include <Eigen/Sparse>

#include <R.h>
#include <Rinternals.h>

// Undefine conflicting macros after including R headers
#undef length

SEXP EigenMatrixXd_to_SEXP(const Eigen::MatrixXd& mat);

/// Numeric (double, integer or logical) R matrix to Eigen; raises an R error otherwise.
Eigen::MatrixXd SEXP_to_EigenMatrixXd(SEXP s_mat, const char* arg_name);

/// Numeric R vector to Eigen; raises an R error otherwise.
Eigen::VectorXd SEXP_to_EigenVectorXd(SEXP s_vec, const char* arg_name);

/**
 * @brief Adjacency matrix from a dgCMatrix, lgCMatrix, ngCMatrix or dense matrix
 *
 * s_is_boolean is TRUE, FALSE or NA. NA treats logical and pattern
 * matrices as boolean and numeric ones as weighted.
 *
 * @throws std::invalid_argument from the adjacency_t constructor
 */
connstat::adjacency_t SEXP_to_adjacency(SEXP s_A, SEXP s_is_boolean);

/// list(Dim, i, p, x) with the 0-based compressed-column slots of a dgCMatrix.
SEXP adjacency_to_SEXP(const connstat::adjacency_t& adj);

#endif // CONNSTAT_EIGEN_UTILS_H_
