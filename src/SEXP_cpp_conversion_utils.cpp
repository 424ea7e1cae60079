// The helper functions follow these patterns:

// Scalars and numeric vectors are checked and copied, raising an R error on
// a type mismatch
// Result structs are converted to named R lists
// Multi-dimensional tables become R arrays with a dim attribute

#include "SEXP_cpp_conversion_utils.hpp"

#include <cstdint>
#include <vector>

namespace {

// Position in R's column-major layout of row-major position k.
size_t col_major_index(size_t k, const std::vector<size_t>& shape) {
    size_t result = 0;
    size_t col_stride = 1;
    std::vector<size_t> idx(shape.size());
    for (size_t d = shape.size(); d-- > 0;) {
        idx[d] = k % shape[d];
        k /= shape[d];
    }
    for (size_t d = 0; d < shape.size(); ++d) {
        result += idx[d] * col_stride;
        col_stride *= shape[d];
    }
    return result;
}

SEXP table_array_to_R(const std::vector<double>& values, const std::vector<size_t>& shape) {
    SEXP s_arr = PROTECT(Rf_allocVector(REALSXP, static_cast<R_xlen_t>(values.size())));
    double* ptr = REAL(s_arr);
    for (size_t k = 0; k < values.size(); ++k) {
        ptr[col_major_index(k, shape)] = values[k];
    }
    if (shape.size() > 1) {
        SEXP s_dim = PROTECT(Rf_allocVector(INTSXP, static_cast<R_xlen_t>(shape.size())));
        for (size_t d = 0; d < shape.size(); ++d) {
            INTEGER(s_dim)[d] = static_cast<int>(shape[d]);
        }
        Rf_setAttrib(s_arr, R_DimSymbol, s_dim);
        UNPROTECT(1);
    }
    UNPROTECT(1);
    return s_arr;
}

std::vector<double> counts_to_double(const std::vector<std::int64_t>& counts) {
    return std::vector<double>(counts.begin(), counts.end());
}

} // namespace

std::string R_string_arg(SEXP s_x, const char* arg_name) {
    if (!Rf_isString(s_x) || LENGTH(s_x) != 1 || STRING_ELT(s_x, 0) == NA_STRING) {
        Rf_error("%s must be a single character string", arg_name);
    }
    return std::string(CHAR(STRING_ELT(s_x, 0)));
}

bool R_logical_arg(SEXP s_x, const char* arg_name) {
    if (!Rf_isLogical(s_x) || LENGTH(s_x) != 1 || LOGICAL(s_x)[0] == NA_LOGICAL) {
        Rf_error("%s must be TRUE or FALSE", arg_name);
    }
    return LOGICAL(s_x)[0] == TRUE;
}

int R_int_arg(SEXP s_x, const char* arg_name) {
    if (Rf_isInteger(s_x) && LENGTH(s_x) == 1 && INTEGER(s_x)[0] != NA_INTEGER) {
        return INTEGER(s_x)[0];
    }
    if (Rf_isReal(s_x) && LENGTH(s_x) == 1 && R_FINITE(REAL(s_x)[0])) {
        return static_cast<int>(REAL(s_x)[0]);
    }
    Rf_error("%s must be a single integer", arg_name);
    return 0;  // not reached
}

double R_double_arg(SEXP s_x, const char* arg_name) {
    if (Rf_isReal(s_x) && LENGTH(s_x) == 1) {
        return REAL(s_x)[0];
    }
    if (Rf_isInteger(s_x) && LENGTH(s_x) == 1) {
        return INTEGER(s_x)[0] == NA_INTEGER ? NA_REAL : INTEGER(s_x)[0];
    }
    Rf_error("%s must be a single number", arg_name);
    return 0.0;  // not reached
}

std::vector<double> Rvect_to_CppVect_double(SEXP Ry, const char* arg_name) {
    if (Rf_isReal(Ry)) {
        return std::vector<double>(REAL(Ry), REAL(Ry) + XLENGTH(Ry));
    }
    if (Rf_isInteger(Ry)) {
        std::vector<double> y(static_cast<size_t>(XLENGTH(Ry)));
        for (R_xlen_t k = 0; k < XLENGTH(Ry); ++k) {
            y[static_cast<size_t>(k)] = INTEGER(Ry)[k] == NA_INTEGER ? NA_REAL : INTEGER(Ry)[k];
        }
        return y;
    }
    Rf_error("%s must be a numeric vector", arg_name);
    return std::vector<double>();  // not reached
}

/**
 * @brief Converts an R list of numeric vectors to a C++ vector of vectors of doubles
 *
 * Used for lists of bin edges. Every element must be a numeric vector.
 */
std::vector<std::vector<double>> R_list_of_dvectors_to_cpp_vector_of_dvectors(SEXP Rvectvect,
                                                                               const char* arg_name) {
    if (TYPEOF(Rvectvect) != VECSXP) {
        Rf_error("%s must be a list of numeric vectors", arg_name);
    }
    const int n = LENGTH(Rvectvect);
    std::vector<std::vector<double>> result(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        result[static_cast<size_t>(i)] = Rvect_to_CppVect_double(VECTOR_ELT(Rvectvect, i), arg_name);
    }
    return result;
}

SEXP convert_vector_double_to_R(const std::vector<double>& vec) {
    SEXP Rvec = PROTECT(Rf_allocVector(REALSXP, static_cast<R_xlen_t>(vec.size())));
    double* ptr = REAL(Rvec);
    for (size_t j = 0; j < vec.size(); ++j) {
        ptr[j] = vec[j];
    }
    UNPROTECT(1);
    return Rvec;
}

SEXP convert_vector_vector_double_to_R(const std::vector<std::vector<double>>& vec) {
    SEXP Rlist = PROTECT(Rf_allocVector(VECSXP, static_cast<R_xlen_t>(vec.size())));
    for (size_t i = 0; i < vec.size(); ++i) {
        SET_VECTOR_ELT(Rlist, static_cast<R_xlen_t>(i), convert_vector_double_to_R(vec[i]));
    }
    UNPROTECT(1);
    return Rlist;
}

/**
 * @note values must already be protected by the caller; they are only
 * reachable from the returned list once this function returns.
 */
SEXP make_named_list(const std::vector<SEXP>& values, const std::vector<const char*>& names) {
    const R_xlen_t n = static_cast<R_xlen_t>(values.size());
    SEXP result = PROTECT(Rf_allocVector(VECSXP, n));
    SEXP s_names = PROTECT(Rf_allocVector(STRSXP, n));
    for (R_xlen_t i = 0; i < n; ++i) {
        SET_VECTOR_ELT(result, i, values[static_cast<size_t>(i)]);
        SET_STRING_ELT(s_names, i, Rf_mkChar(names[static_cast<size_t>(i)]));
    }
    Rf_setAttrib(result, R_NamesSymbol, s_names);
    UNPROTECT(2);
    return result;
}

SEXP curve_to_R(const connstat::curve_t& curve) {
    SEXP s_x = PROTECT(convert_vector_double_to_R(curve.x));
    SEXP s_y = PROTECT(convert_vector_double_to_R(curve.y));
    SEXP result = make_named_list({s_x, s_y}, {"x", "y"});
    UNPROTECT(2);
    return result;
}

SEXP null_curve_to_R(const connstat::null_curve_t& curve) {
    SEXP s_x = PROTECT(convert_vector_double_to_R(curve.x));
    SEXP s_mean = PROTECT(convert_vector_double_to_R(curve.mean));
    SEXP s_sd = PROTECT(convert_vector_double_to_R(curve.sd));
    SEXP result = make_named_list({s_x, s_mean, s_sd}, {"x", "mean", "sd"});
    UNPROTECT(3);
    return result;
}

SEXP conn_prob_table_to_R(const connstat::conn_prob_table_t& table) {
    SEXP s_p = PROTECT(table_array_to_R(table.p_conn, table.shape));
    SEXP s_conn = PROTECT(table_array_to_R(counts_to_double(table.count_conn), table.shape));
    SEXP s_all = PROTECT(table_array_to_R(counts_to_double(table.count_all), table.shape));
    SEXP s_edges = PROTECT(convert_vector_vector_double_to_R(table.bin_edges));
    SEXP result = make_named_list({s_p, s_conn, s_all, s_edges},
                                  {"p_conn", "count_conn", "count_all", "bin_edges"});
    UNPROTECT(4);
    return result;
}

connstat::conn_prob_table_t R_to_conn_prob_table(SEXP s_p_conn, SEXP s_bin_edges) {
    connstat::conn_prob_table_t table;
    table.bin_edges = R_list_of_dvectors_to_cpp_vector_of_dvectors(s_bin_edges, "bin_edges");
    const std::vector<double> values = Rvect_to_CppVect_double(s_p_conn, "p_conn");

    SEXP s_dim = Rf_getAttrib(s_p_conn, R_DimSymbol);
    if (s_dim == R_NilValue) {
        table.shape.push_back(values.size());
    } else {
        for (int d = 0; d < LENGTH(s_dim); ++d) {
            table.shape.push_back(static_cast<size_t>(INTEGER(s_dim)[d]));
        }
    }
    if (table.shape.size() != table.bin_edges.size()) {
        Rf_error("p_conn has %d dimension(s) but %d bin edge vector(s) were given",
                 static_cast<int>(table.shape.size()), static_cast<int>(table.bin_edges.size()));
    }
    for (size_t d = 0; d < table.shape.size(); ++d) {
        if (table.bin_edges[d].size() != table.shape[d] + 1) {
            Rf_error("Bin edges of dimension %d must have %d values",
                     static_cast<int>(d) + 1, static_cast<int>(table.shape[d]) + 1);
        }
    }

    table.p_conn.resize(values.size());
    for (size_t k = 0; k < values.size(); ++k) {
        table.p_conn[k] = values[col_major_index(k, table.shape)];
    }
    return table;
}
