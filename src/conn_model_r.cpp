#include "conn_model.hpp"
#include "SEXP_cpp_conversion_utils.hpp"
#include "error_utils.h" // for REPORT_ERROR()
#include "connstat_r.h"

#include <cstring>
#include <exception>
#include <string>
#include <variant>
#include <vector>

namespace {

SEXP list_elt(SEXP s_list, const char* name) {
    SEXP names = Rf_getAttrib(s_list, R_NamesSymbol);
    if (names == R_NilValue) return R_NilValue;
    for (int i = 0; i < LENGTH(s_list); ++i) {
        if (std::strcmp(CHAR(STRING_ELT(names, i)), name) == 0) {
            return VECTOR_ELT(s_list, i);
        }
    }
    return R_NilValue;
}

double model_param(SEXP s_model, const char* name) {
    SEXP s_val = list_elt(s_model, name);
    if (s_val == R_NilValue) {
        Rf_error("model is missing parameter '%s'", name);
    }
    return R_double_arg(s_val, name);
}

/// list(model, description, params...) in the layout read back by S_evaluate_conn_model()
SEXP conn_model_to_R(const connstat::conn_model_t& model) {
    std::vector<SEXP> values;
    std::vector<const char*> names;

    values.push_back(PROTECT(Rf_mkString(connstat::conn_model_name(model).c_str())));
    names.push_back("model");
    values.push_back(PROTECT(Rf_mkString(connstat::describe_conn_model(model).c_str())));
    names.push_back("description");

    if (const connstat::exp_model_t* m = std::get_if<connstat::exp_model_t>(&model)) {
        values.push_back(PROTECT(Rf_ScalarReal(m->a)));
        names.push_back("a");
        values.push_back(PROTECT(Rf_ScalarReal(m->b)));
        names.push_back("b");
    } else {
        const connstat::bipolar_exp_model_t& m = std::get<connstat::bipolar_exp_model_t>(model);
        values.push_back(PROTECT(Rf_ScalarReal(m.neg.a)));
        names.push_back("a_neg");
        values.push_back(PROTECT(Rf_ScalarReal(m.neg.b)));
        names.push_back("b_neg");
        values.push_back(PROTECT(Rf_ScalarReal(m.pos.a)));
        names.push_back("a_pos");
        values.push_back(PROTECT(Rf_ScalarReal(m.pos.b)));
        names.push_back("b_pos");
    }

    SEXP result = make_named_list(values, names);
    UNPROTECT(static_cast<int>(values.size()));
    return result;
}

} // namespace

/**
 * @brief Fits the exponential distance model to a distance table
 *
 * @param s_p_conn numeric vector of per-bin connection probabilities
 * @param s_bin_edges list holding the distance bin edges
 *
 * @return list(model = "exp", description, a, b)
 */
extern "C" SEXP S_build_2nd_order(SEXP s_p_conn, SEXP s_bin_edges, SEXP s_max_iterations, SEXP s_tolerance) {
    const int max_iterations = R_int_arg(s_max_iterations, "max_iterations");
    const double tolerance = R_double_arg(s_tolerance, "tolerance");
    const connstat::conn_prob_table_t table = R_to_conn_prob_table(s_p_conn, s_bin_edges);

    try {
        return conn_model_to_R(connstat::build_2nd_order(table, max_iterations, tolerance));
    } catch (const std::exception& e) {
        REPORT_ERROR("Error in build_2nd_order: %s", e.what());
    }
    return R_NilValue;
}

/**
 * @brief Fits the bipolar exponential model to a distance x bipolar table
 *
 * @return list(model = "bipolar_exp", description, a_neg, b_neg, a_pos, b_pos)
 */
extern "C" SEXP S_build_3rd_order(SEXP s_p_conn, SEXP s_bin_edges, SEXP s_max_iterations, SEXP s_tolerance) {
    const int max_iterations = R_int_arg(s_max_iterations, "max_iterations");
    const double tolerance = R_double_arg(s_tolerance, "tolerance");
    const connstat::conn_prob_table_t table = R_to_conn_prob_table(s_p_conn, s_bin_edges);

    try {
        return conn_model_to_R(connstat::build_3rd_order(table, max_iterations, tolerance));
    } catch (const std::exception& e) {
        REPORT_ERROR("Error in build_3rd_order: %s", e.what());
    }
    return R_NilValue;
}

/**
 * @brief Evaluates a fitted model at distances d and depth differences dz
 *
 * dz is recycled when it has length 1.
 */
extern "C" SEXP S_evaluate_conn_model(SEXP s_model, SEXP s_d, SEXP s_dz) {
    if (TYPEOF(s_model) != VECSXP) {
        Rf_error("model must be a list returned by build_2nd_order or build_3rd_order");
    }
    SEXP s_name = list_elt(s_model, "model");
    if (s_name == R_NilValue) {
        Rf_error("model has no 'model' component");
    }
    const std::string name = R_string_arg(s_name, "model$model");

    connstat::conn_model_t model;
    if (name == "exp") {
        model = connstat::exp_model_t{model_param(s_model, "a"), model_param(s_model, "b")};
    } else if (name == "bipolar_exp") {
        connstat::bipolar_exp_model_t m;
        m.neg = connstat::exp_model_t{model_param(s_model, "a_neg"), model_param(s_model, "b_neg")};
        m.pos = connstat::exp_model_t{model_param(s_model, "a_pos"), model_param(s_model, "b_pos")};
        model = m;
    } else {
        Rf_error("Unknown model '%s'. Must be 'exp' or 'bipolar_exp'", name.c_str());
    }

    const std::vector<double> d = Rvect_to_CppVect_double(s_d, "d");
    const std::vector<double> dz = Rvect_to_CppVect_double(s_dz, "dz");
    if (dz.size() != 1 && dz.size() != d.size()) {
        Rf_error("dz must have length 1 or the length of d");
    }

    std::vector<double> p(d.size());
    for (size_t k = 0; k < d.size(); ++k) {
        p[k] = connstat::evaluate_conn_model(model, d[k], dz.size() == 1 ? dz[0] : dz[k]);
    }
    return convert_vector_double_to_R(p);
}
