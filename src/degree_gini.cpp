#include "degree_gini.hpp"
#include "null_distributions.hpp"

#include <algorithm>
#include <functional>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace connstat {

namespace {

curve_t equality_diagonal(size_t n_points) {
    curve_t curve;
    curve.x.resize(n_points + 1);
    for (size_t i = 0; i <= n_points; ++i) {
        curve.x[i] = n_points > 0 ? static_cast<double>(i) / static_cast<double>(n_points) : 0.0;
    }
    curve.y = curve.x;
    return curve;
}

} // namespace

std::vector<double> degree_vector(const adjacency_t& adj, direction_t direction) {
    switch (direction) {
        case direction_t::AFFERENT:
            return adj.afferent_degree();
        case direction_t::EFFERENT:
            return adj.efferent_degree();
        default:
            throw std::invalid_argument("Unknown value for argument direction: '" +
                                        direction_name(direction) +
                                        "'. Must be 'afferent' or 'efferent'");
    }
}

curve_t gini_curve(const adjacency_t& adj, direction_t direction) {
    std::vector<double> degrees = degree_vector(adj, direction);
    const size_t n = degrees.size();

    const double total = std::accumulate(degrees.begin(), degrees.end(), 0.0);
    if (n == 0 || total <= 0.0) {
        return equality_diagonal(n);
    }

    std::sort(degrees.begin(), degrees.end(), std::greater<double>());

    curve_t curve;
    curve.x.reserve(n + 1);
    curve.y.reserve(n + 1);
    curve.x.push_back(0.0);
    curve.y.push_back(0.0);

    double cumsum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        cumsum += degrees[i];
        curve.x.push_back(static_cast<double>(i + 1) / static_cast<double>(n));
        curve.y.push_back(cumsum / total);
    }
    return curve;
}

double gini_coefficient(const adjacency_t& adj, direction_t direction) {
    return 2.0 * trapezoid_integral(gini_curve(adj, direction)) - 1.0;
}

curve_t analytical_expected_gini_curve(const adjacency_t& adj, direction_t direction) {
    // validates the direction before any work is done
    (void)degree_vector(adj, direction);

    const Eigen::Index n_nodes = adj.n_nodes();
    if (n_nodes < 2) {
        return equality_diagonal(static_cast<size_t>(n_nodes));
    }

    const int n_trials = static_cast<int>(n_nodes - 1);
    const double n_potential = static_cast<double>(n_nodes) * static_cast<double>(n_trials);
    const double p = std::min(1.0, static_cast<double>(adj.n_edges()) / n_potential);

    // Degree values n_trials, n_trials - 1, ..., 0
    const std::vector<double> pmf = binomial_pmf_descending(n_trials, p);

    double pmf_total = 0.0;
    double mass_total = 0.0;
    for (size_t i = 0; i < pmf.size(); ++i) {
        const double degree = static_cast<double>(n_trials) - static_cast<double>(i);
        pmf_total += pmf[i];
        mass_total += pmf[i] * degree;
    }
    if (pmf_total <= 0.0 || mass_total <= 0.0) {
        return equality_diagonal(pmf.size());
    }

    curve_t curve;
    curve.x.reserve(pmf.size() + 1);
    curve.y.reserve(pmf.size() + 1);
    curve.x.push_back(0.0);
    curve.y.push_back(0.0);

    double cum_p = 0.0;
    double cum_mass = 0.0;
    for (size_t i = 0; i < pmf.size(); ++i) {
        const double degree = static_cast<double>(n_trials) - static_cast<double>(i);
        cum_p += pmf[i];
        cum_mass += pmf[i] * degree;
        curve.x.push_back(cum_p / pmf_total);
        curve.y.push_back(cum_mass / mass_total);
    }
    return curve;
}

double normalized_gini_coefficient(const adjacency_t& adj, direction_t direction) {
    const double observed = trapezoid_integral(gini_curve(adj, direction));
    const double expected = trapezoid_integral(analytical_expected_gini_curve(adj, direction));
    return 2.0 * (observed - expected);
}

} // namespace connstat
