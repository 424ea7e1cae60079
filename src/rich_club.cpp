#include "rich_club.hpp"
#include "degree_gini.hpp"
#include "null_distributions.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace connstat {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

double finite_max(const std::vector<double>& values) {
    double mx = -std::numeric_limits<double>::infinity();
    for (double v : values) {
        if (std::isfinite(v) && v > mx) mx = v;
    }
    return mx;
}

double finite_min(const std::vector<double>& values) {
    double mn = std::numeric_limits<double>::infinity();
    for (double v : values) {
        if (std::isfinite(v) && v < mn) mn = v;
    }
    return mn;
}

// Index of the largest threshold <= value, or -1 if value is below all of them.
inline long threshold_bin(const std::vector<double>& thresholds, double value) {
    auto it = std::upper_bound(thresholds.begin(), thresholds.end(), value);
    return static_cast<long>(it - thresholds.begin()) - 1;
}

inline double density(double mass, double n_members) {
    const double n_pairs = n_members * (n_members - 1.0);
    return n_pairs > 0.0 ? mass / n_pairs : NaN;
}

} // namespace

rich_club_thresholds_t rich_club_thresholds(const std::vector<double>& degrees, bool is_boolean) {
    rich_club_thresholds_t result;
    if (degrees.empty()) {
        return result;
    }

    if (is_boolean) {
        const double max_degree = finite_max(degrees);
        for (double k = 1.0; k <= max_degree; k += 1.0) {
            result.thresholds.push_back(k);
        }
        result.x = result.thresholds;
        return result;
    }

    const size_t n = degrees.size();
    const size_t n_bins = std::max(static_cast<size_t>(static_cast<double>(n) * 0.1),
                                   std::min<size_t>(n, 30));
    const double mn = finite_min(degrees);
    const double mx = finite_max(degrees);
    const double upper = mx + 1e-6 * (mx - mn);

    std::vector<double> edges(n_bins + 1);
    const double step = (upper - mn) / static_cast<double>(n_bins);
    for (size_t i = 0; i <= n_bins; ++i) {
        edges[i] = mn + step * static_cast<double>(i);
    }
    edges[n_bins] = upper;

    result.thresholds.assign(edges.begin(), edges.end() - 1);
    result.x.resize(n_bins);
    for (size_t i = 0; i < n_bins; ++i) {
        result.x[i] = 0.5 * (edges[i] + edges[i + 1]);
    }
    return result;
}

std::vector<double> induced_rich_club_density(const adjacency_t& adj,
                                              const std::vector<double>& degrees,
                                              const std::vector<double>& thresholds) {
    if (degrees.size() != static_cast<size_t>(adj.n_nodes())) {
        throw std::invalid_argument("Degree vector length (" + std::to_string(degrees.size()) +
                                    ") does not match the number of nodes (" +
                                    std::to_string(adj.n_nodes()) + ")");
    }

    const csc_matrix_t& A = adj.csc();
    const size_t n_nodes = degrees.size();
    std::vector<double> result(thresholds.size(), NaN);
    std::vector<char> member(n_nodes, 0);

    for (size_t t = 0; t < thresholds.size(); ++t) {
        std::vector<Eigen::Index> club;
        for (size_t v = 0; v < n_nodes; ++v) {
            member[v] = degrees[v] >= thresholds[t] ? 1 : 0;
            if (member[v]) club.push_back(static_cast<Eigen::Index>(v));
        }

        double mass = 0.0;
        for (Eigen::Index j : club) {
            for (csc_matrix_t::InnerIterator it(A, j); it; ++it) {
                if (member[static_cast<size_t>(it.row())]) {
                    mass += it.value();
                }
            }
        }
        result[t] = density(mass, static_cast<double>(club.size()));
    }
    return result;
}

std::vector<double> cumulative_rich_club_density(const adjacency_t& adj,
                                                 const std::vector<double>& richness,
                                                 const std::vector<double>& thresholds,
                                                 bool weighted_edges) {
    if (richness.size() != static_cast<size_t>(adj.n_nodes())) {
        throw std::invalid_argument("Richness vector length (" + std::to_string(richness.size()) +
                                    ") does not match the number of nodes (" +
                                    std::to_string(adj.n_nodes()) + ")");
    }

    const size_t n_bins = thresholds.size();
    std::vector<double> node_hist(n_bins, 0.0);
    std::vector<double> edge_hist(n_bins, 0.0);

    for (double r : richness) {
        const long b = threshold_bin(thresholds, r);
        if (b >= 0) node_hist[static_cast<size_t>(b)] += 1.0;
    }

    // An edge belongs to every club whose threshold its poorer endpoint reaches.
    const csc_matrix_t& A = adj.csc();
    for (Eigen::Index j = 0; j < A.outerSize(); ++j) {
        const double r_target = richness[static_cast<size_t>(j)];
        for (csc_matrix_t::InnerIterator it(A, j); it; ++it) {
            const double rank = std::min(richness[static_cast<size_t>(it.row())], r_target);
            const long b = threshold_bin(thresholds, rank);
            if (b >= 0) edge_hist[static_cast<size_t>(b)] += weighted_edges ? it.value() : 1.0;
        }
    }

    std::vector<double> result(n_bins, NaN);
    double cum_nodes = 0.0;
    double cum_edges = 0.0;
    for (size_t b = n_bins; b-- > 0;) {
        cum_nodes += node_hist[b];
        cum_edges += edge_hist[b];
        result[b] = density(cum_edges, cum_nodes);
    }
    return result;
}

curve_t rich_club_curve(const adjacency_t& adj, direction_t direction) {
    const std::vector<double> degrees = degree_vector(adj, direction);
    const rich_club_thresholds_t grid = rich_club_thresholds(degrees, adj.is_boolean());

    curve_t curve;
    curve.x = grid.x;
    curve.y = induced_rich_club_density(adj, degrees, grid.thresholds);
    return curve;
}

curve_t efficient_rich_club_curve(const adjacency_t& adj,
                                  direction_t direction,
                                  const std::vector<double>* pre_calculated_richness,
                                  bool sparse_bin_set) {
    std::vector<double> richness;
    if (pre_calculated_richness != nullptr) {
        if (pre_calculated_richness->size() != static_cast<size_t>(adj.n_nodes())) {
            throw std::invalid_argument("Pre-calculated richness has length " +
                                        std::to_string(pre_calculated_richness->size()) +
                                        " but the matrix has " +
                                        std::to_string(adj.n_nodes()) + " nodes");
        }
        richness = *pre_calculated_richness;
    } else if (direction == direction_t::EFFERENT) {
        richness = adj.efferent_count();
    } else if (direction == direction_t::AFFERENT) {
        richness = adj.afferent_count();
    } else {
        // Nodes without any edge stay in the vector with richness 0.
        richness = adj.efferent_count();
        const std::vector<double> in_count = adj.afferent_count();
        for (size_t v = 0; v < richness.size(); ++v) {
            richness[v] += in_count[v];
        }
    }

    curve_t curve;
    if (richness.empty()) {
        return curve;
    }

    const double max_richness = std::max(0.0, finite_max(richness));
    std::vector<double> thresholds;
    if (sparse_bin_set) {
        thresholds.push_back(0.0);
        for (double r : richness) {
            if (std::isfinite(r) && r > 0.0) thresholds.push_back(r);
        }
        std::sort(thresholds.begin(), thresholds.end());
        thresholds.erase(std::unique(thresholds.begin(), thresholds.end()), thresholds.end());
    } else {
        const double top = std::ceil(max_richness);
        for (double k = 0.0; k <= top; k += 1.0) {
            thresholds.push_back(k);
        }
    }

    curve.x = thresholds;
    curve.y = cumulative_rich_club_density(adj, richness, thresholds, false);
    return curve;
}

null_curve_t analytical_expected_rich_club_curve(const adjacency_t& adj, direction_t direction) {
    if (!adj.is_boolean()) {
        throw std::domain_error("Analytical rich-club expectation is only implemented for boolean matrices");
    }
    const std::vector<double> degrees = degree_vector(adj, direction);
    const std::vector<double> in_degree = adj.afferent_degree();
    const std::vector<double> out_degree = adj.efferent_degree();
    const size_t n_nodes = degrees.size();

    double total_in = 0.0;
    for (double d : in_degree) total_in += d;

    const rich_club_thresholds_t grid = rich_club_thresholds(degrees, true);

    null_curve_t curve;
    curve.x = grid.x;
    curve.mean.assign(grid.thresholds.size(), NaN);
    curve.sd.assign(grid.thresholds.size(), NaN);

    std::vector<size_t> club;
    club.reserve(n_nodes);
    for (size_t t = 0; t < grid.thresholds.size(); ++t) {
        club.clear();
        double club_in = 0.0;
        for (size_t v = 0; v < n_nodes; ++v) {
            if (degrees[v] >= grid.thresholds[t]) {
                club.push_back(v);
                club_in += in_degree[v];
            }
        }

        double sum_mean = 0.0;
        double sum_var = 0.0;
        for (size_t v : club) {
            // v's out-edges are drawn from all stubs but its own
            const hypergeom_moments_t m = hypergeom_moments(total_in - in_degree[v],
                                                            club_in - in_degree[v],
                                                            out_degree[v]);
            sum_mean += m.mean;
            sum_var += m.variance;
        }

        const double s = static_cast<double>(club.size());
        const double n_pairs = s * (s - 1.0);
        if (n_pairs > 0.0) {
            curve.mean[t] = sum_mean / n_pairs;
            curve.sd[t] = std::sqrt(sum_var) / n_pairs;
        }
    }
    return curve;
}

} // namespace connstat
