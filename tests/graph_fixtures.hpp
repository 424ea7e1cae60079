#pragma once

// Small graphs shared by the tests.

#include "adjacency.hpp"

#include <random>
#include <utility>
#include <vector>

namespace connstat_test {

inline connstat::adjacency_t boolean_graph(Eigen::Index n, const std::vector<std::pair<int, int>>& edges) {
    std::vector<connstat::triplet_t> triplets;
    for (const auto& e : edges) {
        triplets.emplace_back(e.first, e.second, 1.0);
    }
    return connstat::adjacency_t(n, triplets, true);
}

/// Erdos-Renyi directed graph without self-loops; weights uniform in [0.5, 2) when weighted.
inline connstat::adjacency_t random_graph(Eigen::Index n, double p, unsigned int seed, bool weighted = false) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> unif(0.0, 1.0);
    std::vector<connstat::triplet_t> triplets;
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < n; ++j) {
            if (i == j) continue;
            if (unif(rng) < p) {
                const double w = weighted ? 0.5 + 1.5 * unif(rng) : 1.0;
                triplets.emplace_back(i, j, w);
            }
        }
    }
    return connstat::adjacency_t(n, triplets, !weighted);
}

/// The 4-node example 0->1, 0->2, 1->2, 2->3 (efferent degrees 2, 1, 1, 0).
inline connstat::adjacency_t four_node_example() {
    return boolean_graph(4, {{0, 1}, {0, 2}, {1, 2}, {2, 3}});
}

} // namespace connstat_test
