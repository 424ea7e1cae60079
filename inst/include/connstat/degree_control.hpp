#ifndef CONNSTAT_DEGREE_CONTROL_HPP_
#define CONNSTAT_DEGREE_CONTROL_HPP_

#include "adjacency.hpp"

#include <random>

namespace connstat {

/**
 * @brief Random control graph preserving one degree marginal exactly
 *
 * EFFERENT: every column (target) keeps its number of stored entries, so
 * in-degree counts are unchanged. The sources of each column are resampled
 * without replacement, each source drawn with probability proportional to
 * its efferent degree in the original matrix and the column's own index
 * excluded. Out-degrees are therefore preserved in expectation only.
 * AFFERENT is the same construction applied to rows: out-degree counts are
 * exact and targets are drawn proportionally to afferent degree.
 *
 * Stored values travel with their slot, so the multiset of values of every
 * preserved column (row) is unchanged. The control has the same number of
 * edges as the input and no self-loops.
 *
 * @param adj original matrix
 * @param direction EFFERENT or AFFERENT
 * @param rng caller-owned generator; the same seed reproduces the same control
 *
 * @throws std::invalid_argument if direction is BOTH
 * @throws std::runtime_error if a column (row) has more entries than there are
 *         distinct candidates of positive weight
 */
adjacency_t generate_degree_based_control(const adjacency_t& adj,
                                          direction_t direction,
                                          std::mt19937& rng);

} // namespace connstat

#endif // CONNSTAT_DEGREE_CONTROL_HPP_
