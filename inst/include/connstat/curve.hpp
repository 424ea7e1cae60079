#ifndef CONNSTAT_CURVE_HPP_
#define CONNSTAT_CURVE_HPP_

#include <cstddef>
#include <vector>

namespace connstat {

/**
 * @struct curve_t
 * @brief Ordered (x, y) samples of a statistic
 *
 * x is non-decreasing. y may hold NaN at points where the statistic has no
 * valid denominator.
 */
struct curve_t {
    std::vector<double> x;
    std::vector<double> y;

    size_t size() const { return x.size(); }
};

/**
 * @struct null_curve_t
 * @brief Expected value and spread of a statistic under a null model
 */
struct null_curve_t {
    std::vector<double> x;
    std::vector<double> mean;
    std::vector<double> sd;

    size_t size() const { return x.size(); }
};

/// Trapezoid rule over the x axis of a curve.
double trapezoid_integral(const curve_t& curve);

/// Mean ignoring NaN entries (infinities are kept); NaN when every entry is NaN.
double nan_mean(const std::vector<double>& values);

/// Population standard deviation ignoring NaN entries; NaN when every entry is NaN.
double nan_std(const std::vector<double>& values);

} // namespace connstat

#endif // CONNSTAT_CURVE_HPP_
