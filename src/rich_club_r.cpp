#include "rich_club.hpp"
#include "rich_club_null.hpp"
#include "Eigen_utils.h"
#include "SEXP_cpp_conversion_utils.hpp"
#include "error_utils.h" // for REPORT_ERROR()
#include "connstat_r.h"

#include <cstdint>
#include <exception>
#include <string>
#include <vector>

namespace {

std::uint32_t seed_arg(SEXP s_seed) {
    const int seed = R_int_arg(s_seed, "seed");
    if (seed < 0) {
        Rf_error("seed must be non-negative");
    }
    return static_cast<std::uint32_t>(seed);
}

} // namespace

extern "C" SEXP S_rich_club_curve(SEXP s_A, SEXP s_is_boolean, SEXP s_direction) {
    const std::string direction = R_string_arg(s_direction, "direction");

    try {
        const connstat::adjacency_t adj = SEXP_to_adjacency(s_A, s_is_boolean);
        const connstat::curve_t curve =
            connstat::rich_club_curve(adj, connstat::direction_from_string(direction));
        return curve_to_R(curve);
    } catch (const std::exception& e) {
        REPORT_ERROR("Error in rich_club_curve: %s", e.what());
    }
    return R_NilValue;
}

/**
 * @brief R interface to efficient_rich_club_curve()
 *
 * @param s_direction "efferent", "afferent" or "both"
 * @param s_richness NULL or a numeric vector with one richness value per node
 * @param s_sparse_bin_set logical; bin only at observed richness values
 *
 * @return list(x, y)
 */
extern "C" SEXP S_efficient_rich_club_curve(
    SEXP s_A,
    SEXP s_is_boolean,
    SEXP s_direction,
    SEXP s_richness,
    SEXP s_sparse_bin_set
    ) {
    const std::string direction = R_string_arg(s_direction, "direction");
    const bool sparse_bin_set = R_logical_arg(s_sparse_bin_set, "sparse_bin_set");
    const bool has_richness = !Rf_isNull(s_richness);
    std::vector<double> richness;
    if (has_richness) {
        richness = Rvect_to_CppVect_double(s_richness, "richness");
    }

    try {
        const connstat::adjacency_t adj = SEXP_to_adjacency(s_A, s_is_boolean);
        const connstat::curve_t curve =
            connstat::efficient_rich_club_curve(adj,
                                                connstat::direction_from_string(direction),
                                                has_richness ? &richness : nullptr,
                                                sparse_bin_set);
        return curve_to_R(curve);
    } catch (const std::exception& e) {
        REPORT_ERROR("Error in efficient_rich_club_curve: %s", e.what());
    }
    return R_NilValue;
}

extern "C" SEXP S_analytical_expected_rich_club_curve(SEXP s_A, SEXP s_is_boolean, SEXP s_direction) {
    const std::string direction = R_string_arg(s_direction, "direction");

    try {
        const connstat::adjacency_t adj = SEXP_to_adjacency(s_A, s_is_boolean);
        const connstat::null_curve_t curve =
            connstat::analytical_expected_rich_club_curve(adj, connstat::direction_from_string(direction));
        return null_curve_to_R(curve);
    } catch (const std::exception& e) {
        REPORT_ERROR("Error in analytical_expected_rich_club_curve: %s", e.what());
    }
    return R_NilValue;
}

/**
 * @brief R interface to normalized_rich_club_curve()
 *
 * @param s_normalize "mean" or "std"
 * @param s_normalize_with "analytical" or "shuffled"
 * @param s_n_repeats number of shuffled controls
 * @param s_seed base seed of the controls; 0 for a random one
 * @param s_verbose print progress of the shuffled controls
 *
 * @return list(x, y)
 */
extern "C" SEXP S_normalized_rich_club_curve(
    SEXP s_A,
    SEXP s_is_boolean,
    SEXP s_direction,
    SEXP s_normalize,
    SEXP s_normalize_with,
    SEXP s_n_repeats,
    SEXP s_seed,
    SEXP s_verbose
    ) {
    const std::string direction = R_string_arg(s_direction, "direction");
    const std::string normalize = R_string_arg(s_normalize, "normalize");
    const std::string normalize_with = R_string_arg(s_normalize_with, "normalize_with");
    const int n_repeats = R_int_arg(s_n_repeats, "n_repeats");
    const std::uint32_t seed = seed_arg(s_seed);
    const bool verbose = R_logical_arg(s_verbose, "verbose");

    try {
        const connstat::adjacency_t adj = SEXP_to_adjacency(s_A, s_is_boolean);
        const connstat::curve_t curve =
            connstat::normalized_rich_club_curve(adj,
                                                 connstat::direction_from_string(direction),
                                                 connstat::normalize_from_string(normalize),
                                                 connstat::null_model_from_string(normalize_with),
                                                 n_repeats,
                                                 seed,
                                                 verbose);
        return curve_to_R(curve);
    } catch (const std::exception& e) {
        REPORT_ERROR("Error in normalized_rich_club_curve: %s", e.what());
    }
    return R_NilValue;
}

extern "C" SEXP S_rich_club_coefficient(
    SEXP s_A,
    SEXP s_is_boolean,
    SEXP s_direction,
    SEXP s_normalize_with,
    SEXP s_n_repeats,
    SEXP s_seed,
    SEXP s_verbose
    ) {
    const std::string direction = R_string_arg(s_direction, "direction");
    const std::string normalize_with = R_string_arg(s_normalize_with, "normalize_with");
    const int n_repeats = R_int_arg(s_n_repeats, "n_repeats");
    const std::uint32_t seed = seed_arg(s_seed);
    const bool verbose = R_logical_arg(s_verbose, "verbose");

    try {
        const connstat::adjacency_t adj = SEXP_to_adjacency(s_A, s_is_boolean);
        const double coefficient =
            connstat::rich_club_coefficient(adj,
                                            connstat::direction_from_string(direction),
                                            connstat::null_model_from_string(normalize_with),
                                            n_repeats,
                                            seed,
                                            verbose);
        return Rf_ScalarReal(coefficient);
    } catch (const std::exception& e) {
        REPORT_ERROR("Error in rich_club_coefficient: %s", e.what());
    }
    return R_NilValue;
}
