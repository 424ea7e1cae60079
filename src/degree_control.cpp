#include "degree_control.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace connstat {

namespace {

/**
 * Draws k distinct indices != exclude, each with probability proportional to
 * its weight among the indices not yet drawn.
 *
 * Successive draws from the full distribution with repeats rejected; once
 * the rejections exceed a budget (k close to the number of candidates)
 * the remaining slots are filled by Efraimidis-Spirakis keys log(u) / w.
 */
void sample_without_replacement(std::discrete_distribution<size_t>& dist,
                                const std::vector<double>& weights,
                                size_t exclude,
                                size_t k,
                                std::mt19937& rng,
                                std::vector<char>& taken,
                                std::vector<size_t>& out) {
    out.clear();
    const size_t max_attempts = 16 * k + 64;
    size_t attempts = 0;
    while (out.size() < k && attempts < max_attempts) {
        ++attempts;
        const size_t i = dist(rng);
        if (i == exclude || taken[i]) continue;
        taken[i] = 1;
        out.push_back(i);
    }

    if (out.size() < k) {
        // keyed selection among the candidates still available
        std::uniform_real_distribution<double> unif(0.0, 1.0);
        std::vector<std::pair<double, size_t>> keys;
        for (size_t i = 0; i < weights.size(); ++i) {
            if (i == exclude || taken[i] || !(weights[i] > 0.0)) continue;
            double u = unif(rng);
            while (u <= 0.0) u = unif(rng);
            keys.emplace_back(std::log(u) / weights[i], i);
        }
        const size_t missing = k - out.size();
        std::nth_element(keys.begin(), keys.begin() + static_cast<long>(missing - 1), keys.end(),
                         [](const std::pair<double, size_t>& a, const std::pair<double, size_t>& b) {
                             return a.first > b.first;
                         });
        for (size_t m = 0; m < missing; ++m) {
            taken[keys[m].second] = 1;
            out.push_back(keys[m].second);
        }
    }

    for (size_t i : out) taken[i] = 0;
}

/**
 * Resamples the inner indices of every outer vector of a compressed matrix.
 * For a column-major matrix this redraws the sources of every target.
 */
template <typename SparseMatrix>
std::vector<triplet_t> resample_inner_indices(const SparseMatrix& M,
                                              const std::vector<double>& weights,
                                              std::mt19937& rng) {
    const size_t n = weights.size();
    std::vector<triplet_t> triplets;
    triplets.reserve(static_cast<size_t>(M.nonZeros()));
    if (M.nonZeros() == 0) {
        return triplets;
    }

    size_t n_positive = 0;
    for (double w : weights) {
        if (w > 0.0) ++n_positive;
    }

    std::discrete_distribution<size_t> dist(weights.begin(), weights.end());
    std::vector<char> taken(n, 0);
    std::vector<size_t> drawn;
    std::vector<double> values;

    for (Eigen::Index outer = 0; outer < M.outerSize(); ++outer) {
        values.clear();
        for (typename SparseMatrix::InnerIterator it(M, outer); it; ++it) {
            values.push_back(it.value());
        }
        if (values.empty()) continue;

        const size_t self = static_cast<size_t>(outer);
        const size_t n_candidates = n_positive - (weights[self] > 0.0 ? 1 : 0);
        if (values.size() > n_candidates) {
            throw std::runtime_error("Cannot place " + std::to_string(values.size()) +
                                     " connections of node " + std::to_string(outer) +
                                     ": only " + std::to_string(n_candidates) +
                                     " candidate partners have nonzero degree");
        }

        sample_without_replacement(dist, weights, self, values.size(), rng, taken, drawn);
        std::sort(drawn.begin(), drawn.end());

        for (size_t m = 0; m < drawn.size(); ++m) {
            const Eigen::Index inner = static_cast<Eigen::Index>(drawn[m]);
            if (SparseMatrix::IsRowMajor) {
                triplets.emplace_back(outer, inner, values[m]);
            } else {
                triplets.emplace_back(inner, outer, values[m]);
            }
        }
    }
    return triplets;
}

} // namespace

adjacency_t generate_degree_based_control(const adjacency_t& adj,
                                          direction_t direction,
                                          std::mt19937& rng) {
    std::vector<triplet_t> triplets;
    switch (direction) {
        case direction_t::EFFERENT:
            triplets = resample_inner_indices(adj.csc(), adj.efferent_degree(), rng);
            break;
        case direction_t::AFFERENT:
            triplets = resample_inner_indices(adj.csr(), adj.afferent_degree(), rng);
            break;
        default:
            throw std::invalid_argument("Unknown value for argument direction: '" +
                                        direction_name(direction) +
                                        "'. Must be 'afferent' or 'efferent'");
    }
    return adjacency_t(adj.n_nodes(), triplets, adj.is_boolean());
}

} // namespace connstat
