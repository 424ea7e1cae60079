#ifndef CONNSTAT_NULL_DISTRIBUTIONS_HPP_
#define CONNSTAT_NULL_DISTRIBUTIONS_HPP_

#include <vector>

namespace connstat {

/**
 * @brief Binomial probability mass function over k = n, n-1, ..., 0
 *
 * @param n number of trials
 * @param p success probability
 * @return n + 1 probabilities, highest k first
 */
std::vector<double> binomial_pmf_descending(int n, double p);

/**
 * @struct hypergeom_moments_t
 * @brief Mean and variance of a hypergeometric distribution
 */
struct hypergeom_moments_t {
    double mean;
    double variance;
};

/**
 * @brief Moments of the number of successes in `draws` draws without
 * replacement from a population of `population` items of which
 * `successes` are successes
 *
 * mean = draws * K / M
 * var  = draws * K * (M - K) * (M - draws) / (M^2 (M - 1))
 *
 * Undefined parameter combinations (M < 1, K or draws outside [0, M])
 * yield NaN moments. M = 1 has zero variance.
 */
hypergeom_moments_t hypergeom_moments(double population, double successes, double draws);

} // namespace connstat

#endif // CONNSTAT_NULL_DISTRIBUTIONS_HPP_
