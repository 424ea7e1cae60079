#include "Eigen_utils.h"

#include <cmath>
#include <vector>

namespace {

bool is_boolean_storage(SEXP s_A) {
    return Rf_inherits(s_A, "lgCMatrix") || Rf_inherits(s_A, "ngCMatrix") ||
           (Rf_isMatrix(s_A) && Rf_isLogical(s_A));
}

} // namespace

// Function to convert Eigen::MatrixXd to SEXP; both are column-major
SEXP EigenMatrixXd_to_SEXP(const Eigen::MatrixXd& mat) {
    SEXP result = PROTECT(Rf_allocMatrix(REALSXP, static_cast<int>(mat.rows()), static_cast<int>(mat.cols())));
    double* ptr = REAL(result);
    for (Eigen::Index i = 0; i < mat.size(); ++i) {
        ptr[i] = mat(i);
    }
    UNPROTECT(1);
    return result;
}

Eigen::MatrixXd SEXP_to_EigenMatrixXd(SEXP s_mat, const char* arg_name) {
    if (!Rf_isMatrix(s_mat) || !(Rf_isReal(s_mat) || Rf_isInteger(s_mat) || Rf_isLogical(s_mat))) {
        Rf_error("%s must be a numeric matrix", arg_name);
    }
    SEXP s_dim = Rf_getAttrib(s_mat, R_DimSymbol);
    const int n_rows = INTEGER(s_dim)[0];
    const int n_cols = INTEGER(s_dim)[1];

    Eigen::MatrixXd mat(n_rows, n_cols);
    const R_xlen_t n = XLENGTH(s_mat);
    if (Rf_isReal(s_mat)) {
        const double* ptr = REAL(s_mat);
        for (R_xlen_t k = 0; k < n; ++k) mat(static_cast<Eigen::Index>(k)) = ptr[k];
    } else {
        const int* ptr = Rf_isInteger(s_mat) ? INTEGER(s_mat) : LOGICAL(s_mat);
        for (R_xlen_t k = 0; k < n; ++k) {
            mat(static_cast<Eigen::Index>(k)) = ptr[k] == NA_INTEGER ? NA_REAL : static_cast<double>(ptr[k]);
        }
    }
    return mat;
}

Eigen::VectorXd SEXP_to_EigenVectorXd(SEXP s_vec, const char* arg_name) {
    if (!(Rf_isReal(s_vec) || Rf_isInteger(s_vec))) {
        Rf_error("%s must be a numeric vector", arg_name);
    }
    const R_xlen_t n = XLENGTH(s_vec);
    Eigen::VectorXd vec(n);
    if (Rf_isReal(s_vec)) {
        const double* ptr = REAL(s_vec);
        for (R_xlen_t k = 0; k < n; ++k) vec[k] = ptr[k];
    } else {
        const int* ptr = INTEGER(s_vec);
        for (R_xlen_t k = 0; k < n; ++k) vec[k] = ptr[k] == NA_INTEGER ? NA_REAL : ptr[k];
    }
    return vec;
}

connstat::adjacency_t SEXP_to_adjacency(SEXP s_A, SEXP s_is_boolean) {
    if (!Rf_isLogical(s_is_boolean) || LENGTH(s_is_boolean) != 1) {
        Rf_error("is_boolean must be TRUE, FALSE or NA");
    }
    const int flag = LOGICAL(s_is_boolean)[0];
    const bool is_boolean = flag == NA_LOGICAL ? is_boolean_storage(s_A) : flag == TRUE;

    if (Rf_inherits(s_A, "dgCMatrix") || Rf_inherits(s_A, "lgCMatrix") || Rf_inherits(s_A, "ngCMatrix")) {
        const bool has_values = !Rf_inherits(s_A, "ngCMatrix");
        SEXP s_i = PROTECT(Rf_getAttrib(s_A, Rf_install("i")));
        SEXP s_p = PROTECT(Rf_getAttrib(s_A, Rf_install("p")));
        SEXP s_x = PROTECT(has_values ? Rf_getAttrib(s_A, Rf_install("x")) : R_NilValue);
        SEXP s_dim = PROTECT(Rf_getAttrib(s_A, Rf_install("Dim")));

        if (s_i == R_NilValue || s_p == R_NilValue || s_dim == R_NilValue ||
            (has_values && s_x == R_NilValue)) {
            UNPROTECT(4);
            Rf_error("Invalid sparse matrix: missing required slots");
        }

        const int* i_data = INTEGER(s_i);
        const int* p_data = INTEGER(s_p);
        const int* dim_data = INTEGER(s_dim);
        const int n_rows = dim_data[0];
        const int n_cols = dim_data[1];
        if (n_rows != n_cols) {
            UNPROTECT(4);
            Rf_error("Adjacency matrix must be square, got %d x %d", n_rows, n_cols);
        }

        std::vector<connstat::triplet_t> triplets;
        triplets.reserve(static_cast<size_t>(Rf_length(s_i)));
        for (int j = 0; j < n_cols; ++j) {
            for (int idx = p_data[j]; idx < p_data[j + 1]; ++idx) {
                double val = 1.0;
                if (has_values) {
                    if (Rf_isReal(s_x)) {
                        val = REAL(s_x)[idx];
                    } else {
                        const int lv = LOGICAL(s_x)[idx];
                        val = lv == NA_LOGICAL ? NA_REAL : static_cast<double>(lv);
                    }
                }
                triplets.emplace_back(i_data[idx], j, val);
            }
        }
        UNPROTECT(4);
        return connstat::adjacency_t(n_rows, triplets, is_boolean);
    }

    if (Rf_isMatrix(s_A)) {
        const Eigen::MatrixXd dense = SEXP_to_EigenMatrixXd(s_A, "A");
        if (dense.rows() != dense.cols()) {
            Rf_error("Adjacency matrix must be square, got %d x %d",
                     static_cast<int>(dense.rows()), static_cast<int>(dense.cols()));
        }
        std::vector<connstat::triplet_t> triplets;
        for (Eigen::Index j = 0; j < dense.cols(); ++j) {
            for (Eigen::Index i = 0; i < dense.rows(); ++i) {
                if (dense(i, j) != 0.0) triplets.emplace_back(i, j, dense(i, j));
            }
        }
        return connstat::adjacency_t(dense.rows(), triplets, is_boolean);
    }

    Rf_error("A must be a dgCMatrix, lgCMatrix, ngCMatrix or a numeric/logical matrix");
    return connstat::adjacency_t();  // not reached
}

SEXP adjacency_to_SEXP(const connstat::adjacency_t& adj) {
    const connstat::csc_matrix_t& A = adj.csc();
    const int n = static_cast<int>(A.rows());
    const int nnz = static_cast<int>(A.nonZeros());

    SEXP s_dim = PROTECT(Rf_allocVector(INTSXP, 2));
    INTEGER(s_dim)[0] = n;
    INTEGER(s_dim)[1] = n;

    SEXP s_i = PROTECT(Rf_allocVector(INTSXP, nnz));
    SEXP s_p = PROTECT(Rf_allocVector(INTSXP, n + 1));
    SEXP s_x = PROTECT(Rf_allocVector(REALSXP, nnz));

    int k = 0;
    INTEGER(s_p)[0] = 0;
    for (int j = 0; j < n; ++j) {
        for (connstat::csc_matrix_t::InnerIterator it(A, j); it; ++it) {
            INTEGER(s_i)[k] = static_cast<int>(it.row());
            REAL(s_x)[k] = it.value();
            ++k;
        }
        INTEGER(s_p)[j + 1] = k;
    }

    SEXP result = PROTECT(Rf_allocVector(VECSXP, 4));
    SET_VECTOR_ELT(result, 0, s_dim);
    SET_VECTOR_ELT(result, 1, s_i);
    SET_VECTOR_ELT(result, 2, s_p);
    SET_VECTOR_ELT(result, 3, s_x);

    SEXP names = PROTECT(Rf_allocVector(STRSXP, 4));
    SET_STRING_ELT(names, 0, Rf_mkChar("Dim"));
    SET_STRING_ELT(names, 1, Rf_mkChar("i"));
    SET_STRING_ELT(names, 2, Rf_mkChar("p"));
    SET_STRING_ELT(names, 3, Rf_mkChar("x"));
    Rf_setAttrib(result, R_NamesSymbol, names);

    UNPROTECT(6);
    return result;
}
