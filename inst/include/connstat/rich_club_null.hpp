#ifndef CONNSTAT_RICH_CLUB_NULL_HPP_
#define CONNSTAT_RICH_CLUB_NULL_HPP_

#include "adjacency.hpp"
#include "curve.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace connstat {

/// How an observed rich-club curve is compared with its null expectation.
enum class normalize_t {
    MEAN,  ///< observed / null mean
    STD    ///< (observed - null mean) / null sd
};

enum class null_model_t {
    ANALYTICAL,  ///< closed-form hypergeometric moments, boolean matrices only
    SHUFFLED     ///< moments over degree-preserving shuffled controls
};

/// @throws std::invalid_argument unless name is "mean" or "std"
normalize_t normalize_from_string(const std::string& name);

/// @throws std::invalid_argument unless name is "analytical" or "shuffled"
null_model_t null_model_from_string(const std::string& name);

/**
 * @brief Rich-club moments over shuffled controls
 *
 * Each of the n_repeats trials draws generate_degree_based_control(adj,
 * direction) and evaluates its rich-club density at the given degree
 * thresholds, ranking the control's nodes by their weighted degree along
 * direction. The mean and population standard deviation are taken per
 * threshold over the trial values that are not NaN.
 *
 * Trials run in parallel. Trial t uses its own generator seeded from
 * (seed, t), so the result for a given seed does not depend on the number
 * of threads. seed == 0 draws the base seed from std::random_device.
 *
 * @param thresholds ascending degree thresholds
 * @return null curve with x = thresholds
 *
 * @throws std::invalid_argument for n_repeats < 1 or a direction other
 *         than AFFERENT / EFFERENT
 * @throws std::runtime_error if no control can be drawn
 */
null_curve_t randomized_control_rich_club_curve(const adjacency_t& adj,
                                                direction_t direction,
                                                const std::vector<double>& thresholds,
                                                int n_repeats = 10,
                                                std::uint32_t seed = 0,
                                                bool verbose = false);

/**
 * @brief Rich-club curve normalized by a null model
 *
 * The observed curve is rich_club_curve(adj, direction). The null is either
 * analytical_expected_rich_club_curve() or randomized_control_rich_club_curve()
 * evaluated at the observed thresholds. Both curves are truncated to their
 * common length before normalizing, so entries with a zero null mean or sd
 * become +-inf or NaN.
 *
 * @throws std::domain_error for ANALYTICAL on a weighted matrix
 * @throws std::invalid_argument for a direction other than AFFERENT / EFFERENT
 *         or n_repeats < 1 with SHUFFLED
 */
curve_t normalized_rich_club_curve(const adjacency_t& adj,
                                   direction_t direction,
                                   normalize_t normalize = normalize_t::STD,
                                   null_model_t normalize_with = null_model_t::SHUFFLED,
                                   int n_repeats = 10,
                                   std::uint32_t seed = 0,
                                   bool verbose = false);

/**
 * @brief Single-number rich-club summary
 *
 * Mean of the STD-normalized curve ignoring NaN entries; NaN if every
 * entry is NaN. Infinite entries are kept.
 */
double rich_club_coefficient(const adjacency_t& adj,
                             direction_t direction,
                             null_model_t normalize_with = null_model_t::SHUFFLED,
                             int n_repeats = 10,
                             std::uint32_t seed = 0,
                             bool verbose = false);

} // namespace connstat

#endif // CONNSTAT_RICH_CLUB_NULL_HPP_
