#include "null_distributions.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

#include <R.h>
#include <Rmath.h>

namespace connstat {

std::vector<double> binomial_pmf_descending(int n, double p) {
    if (n < 0) {
        throw std::invalid_argument("binomial_pmf_descending: number of trials must be non-negative");
    }
    if (!(p >= 0.0 && p <= 1.0)) {
        throw std::invalid_argument("binomial_pmf_descending: probability must lie in [0, 1]");
    }

    std::vector<double> pmf(static_cast<size_t>(n) + 1);
    for (int k = n; k >= 0; --k) {
        pmf[static_cast<size_t>(n - k)] = dbinom(static_cast<double>(k), static_cast<double>(n), p, 0);
    }
    return pmf;
}

hypergeom_moments_t hypergeom_moments(double population, double successes, double draws) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    if (population < 1.0 ||
        successes < 0.0 || successes > population ||
        draws < 0.0 || draws > population) {
        return {nan, nan};
    }

    const double M = population;
    const double K = successes;
    const double n = draws;

    hypergeom_moments_t moments;
    moments.mean = n * K / M;
    if (M == 1.0) {
        moments.variance = 0.0;
    } else {
        moments.variance = n * K * (M - K) * (M - n) / (M * M * (M - 1.0));
    }
    return moments;
}

} // namespace connstat
