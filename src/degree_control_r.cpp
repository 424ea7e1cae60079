#include "degree_control.hpp"
#include "Eigen_utils.h"
#include "SEXP_cpp_conversion_utils.hpp"
#include "error_utils.h" // for REPORT_ERROR()
#include "connstat_r.h"

#include <cstdint>
#include <exception>
#include <random>
#include <string>

/**
 * @brief R interface to generate_degree_based_control()
 *
 * @param s_seed integer seed; 0 seeds from std::random_device
 *
 * @return list(Dim, i, p, x) holding the 0-based dgCMatrix slots of the control
 */
extern "C" SEXP S_generate_degree_based_control(SEXP s_A, SEXP s_is_boolean, SEXP s_direction, SEXP s_seed) {
    const std::string direction = R_string_arg(s_direction, "direction");
    const int seed = R_int_arg(s_seed, "seed");
    if (seed < 0) {
        Rf_error("seed must be non-negative");
    }

    try {
        const connstat::adjacency_t adj = SEXP_to_adjacency(s_A, s_is_boolean);

        std::mt19937 rng;
        if (seed == 0) {
            std::random_device rd;
            rng.seed(rd());
        } else {
            rng.seed(static_cast<std::uint32_t>(seed));
        }

        const connstat::adjacency_t control =
            connstat::generate_degree_based_control(adj, connstat::direction_from_string(direction), rng);
        return adjacency_to_SEXP(control);
    } catch (const std::exception& e) {
        REPORT_ERROR("Error in generate_degree_based_control: %s", e.what());
    }
    return R_NilValue;
}
