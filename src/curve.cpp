#include "curve.hpp"

#include <cmath>
#include <limits>

namespace connstat {

double trapezoid_integral(const curve_t& curve) {
    double area = 0.0;
    for (size_t i = 1; i < curve.x.size(); ++i) {
        area += (curve.x[i] - curve.x[i - 1]) * (curve.y[i - 1] + curve.y[i]) / 2.0;
    }
    return area;
}

double nan_mean(const std::vector<double>& values) {
    double sum = 0.0;
    size_t n = 0;
    for (double v : values) {
        if (!std::isnan(v)) {
            sum += v;
            ++n;
        }
    }
    return n > 0 ? sum / static_cast<double>(n) : std::numeric_limits<double>::quiet_NaN();
}

double nan_std(const std::vector<double>& values) {
    const double mu = nan_mean(values);
    if (std::isnan(mu)) {
        return mu;
    }
    double ss = 0.0;
    size_t n = 0;
    for (double v : values) {
        if (!std::isnan(v)) {
            ss += (v - mu) * (v - mu);
            ++n;
        }
    }
    return std::sqrt(ss / static_cast<double>(n));
}

} // namespace connstat
