#include "degree_gini.hpp"
#include "Eigen_utils.h"
#include "SEXP_cpp_conversion_utils.hpp"
#include "error_utils.h" // for REPORT_ERROR()
#include "connstat_r.h"

#include <exception>
#include <string>

/**
 * @brief R interface to gini_curve()
 *
 * @param s_A adjacency matrix (dgCMatrix, lgCMatrix, ngCMatrix or dense)
 * @param s_is_boolean TRUE, FALSE or NA (infer from the storage type)
 * @param s_direction "afferent" or "efferent"
 *
 * @return list(x, y)
 */
extern "C" SEXP S_gini_curve(SEXP s_A, SEXP s_is_boolean, SEXP s_direction) {
    const std::string direction = R_string_arg(s_direction, "direction");

    try {
        const connstat::adjacency_t adj = SEXP_to_adjacency(s_A, s_is_boolean);
        const connstat::curve_t curve =
            connstat::gini_curve(adj, connstat::direction_from_string(direction));
        return curve_to_R(curve);
    } catch (const std::exception& e) {
        REPORT_ERROR("Error in gini_curve: %s", e.what());
    }
    return R_NilValue;
}

extern "C" SEXP S_gini_coefficient(SEXP s_A, SEXP s_is_boolean, SEXP s_direction) {
    const std::string direction = R_string_arg(s_direction, "direction");

    try {
        const connstat::adjacency_t adj = SEXP_to_adjacency(s_A, s_is_boolean);
        return Rf_ScalarReal(connstat::gini_coefficient(adj, connstat::direction_from_string(direction)));
    } catch (const std::exception& e) {
        REPORT_ERROR("Error in gini_coefficient: %s", e.what());
    }
    return R_NilValue;
}

extern "C" SEXP S_analytical_expected_gini_curve(SEXP s_A, SEXP s_is_boolean, SEXP s_direction) {
    const std::string direction = R_string_arg(s_direction, "direction");

    try {
        const connstat::adjacency_t adj = SEXP_to_adjacency(s_A, s_is_boolean);
        const connstat::curve_t curve =
            connstat::analytical_expected_gini_curve(adj, connstat::direction_from_string(direction));
        return curve_to_R(curve);
    } catch (const std::exception& e) {
        REPORT_ERROR("Error in analytical_expected_gini_curve: %s", e.what());
    }
    return R_NilValue;
}

extern "C" SEXP S_normalized_gini_coefficient(SEXP s_A, SEXP s_is_boolean, SEXP s_direction) {
    const std::string direction = R_string_arg(s_direction, "direction");

    try {
        const connstat::adjacency_t adj = SEXP_to_adjacency(s_A, s_is_boolean);
        return Rf_ScalarReal(
            connstat::normalized_gini_coefficient(adj, connstat::direction_from_string(direction)));
    } catch (const std::exception& e) {
        REPORT_ERROR("Error in normalized_gini_coefficient: %s", e.what());
    }
    return R_NilValue;
}
