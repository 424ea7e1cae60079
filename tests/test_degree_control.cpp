#include "degree_control.hpp"

#include "graph_fixtures.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>
#include <vector>

using namespace connstat;
using connstat_test::boolean_graph;
using connstat_test::near;
using connstat_test::throws;

namespace {

bool same_entries(const adjacency_t& a, const adjacency_t& b) {
    if (a.n_edges() != b.n_edges()) return false;
    for (Eigen::Index j = 0; j < a.n_nodes(); ++j) {
        csc_matrix_t::InnerIterator ia(a.csc(), j);
        csc_matrix_t::InnerIterator ib(b.csc(), j);
        for (; ia && ib; ++ia, ++ib) {
            if (ia.row() != ib.row() || ia.value() != ib.value()) return false;
        }
        if (ia || ib) return false;
    }
    return true;
}

bool has_self_loop(const adjacency_t& adj) {
    for (Eigen::Index i = 0; i < adj.n_nodes(); ++i) {
        if (adj.has_edge(i, i)) return true;
    }
    return false;
}

std::vector<double> sorted_column_values(const adjacency_t& adj, Eigen::Index j) {
    std::vector<double> v;
    for (csc_matrix_t::InnerIterator it(adj.csc(), j); it; ++it) v.push_back(it.value());
    std::sort(v.begin(), v.end());
    return v;
}

std::vector<double> sorted_row_values(const adjacency_t& adj, Eigen::Index i) {
    std::vector<double> v;
    for (csr_matrix_t::InnerIterator it(adj.csr(), i); it; ++it) v.push_back(it.value());
    std::sort(v.begin(), v.end());
    return v;
}

} // namespace

int main() {
    const adjacency_t adj = connstat_test::random_graph(50, 0.1, 11);

    // EFFERENT keeps every in-degree exactly.
    {
        std::mt19937 rng(42);
        adjacency_t control = generate_degree_based_control(adj, direction_t::EFFERENT, rng);
        assert(control.n_nodes() == adj.n_nodes());
        assert(control.n_edges() == adj.n_edges());
        assert(control.is_boolean());
        assert(near(control.afferent_count(), adj.afferent_count()));
        assert(!has_self_loop(control));
        assert(!same_entries(control, adj));
    }

    // AFFERENT keeps every out-degree exactly.
    {
        std::mt19937 rng(42);
        adjacency_t control = generate_degree_based_control(adj, direction_t::AFFERENT, rng);
        assert(control.n_edges() == adj.n_edges());
        assert(near(control.efferent_count(), adj.efferent_count()));
        assert(!has_self_loop(control));
    }

    // Same seed, same control; different seed, different control.
    {
        std::mt19937 rng_a(7);
        std::mt19937 rng_b(7);
        std::mt19937 rng_c(8);
        adjacency_t a = generate_degree_based_control(adj, direction_t::EFFERENT, rng_a);
        adjacency_t b = generate_degree_based_control(adj, direction_t::EFFERENT, rng_b);
        adjacency_t c = generate_degree_based_control(adj, direction_t::EFFERENT, rng_c);
        assert(same_entries(a, b));
        assert(!same_entries(a, c));
    }

    // Weighted values move with their slot.
    {
        const adjacency_t weighted = connstat_test::random_graph(30, 0.15, 5, true);
        std::mt19937 rng(3);
        adjacency_t by_col = generate_degree_based_control(weighted, direction_t::EFFERENT, rng);
        assert(!by_col.is_boolean());
        for (Eigen::Index j = 0; j < weighted.n_nodes(); ++j) {
            assert(sorted_column_values(by_col, j) == sorted_column_values(weighted, j));
        }
        adjacency_t by_row = generate_degree_based_control(weighted, direction_t::AFFERENT, rng);
        for (Eigen::Index i = 0; i < weighted.n_nodes(); ++i) {
            assert(sorted_row_values(by_row, i) == sorted_row_values(weighted, i));
        }
        assert(near(by_row.total_weight(), weighted.total_weight(), 1e-9));
    }

    // Columns that need every candidate reproduce the complete graph.
    {
        std::vector<std::pair<int, int>> edges;
        for (int i = 0; i < 6; ++i)
            for (int j = 0; j < 6; ++j)
                if (i != j) edges.emplace_back(i, j);
        const adjacency_t complete = boolean_graph(6, edges);
        std::mt19937 rng(1);
        adjacency_t control = generate_degree_based_control(complete, direction_t::EFFERENT, rng);
        assert(same_entries(control, complete));
    }

    // High-degree sources are drawn more often.
    {
        // node 0 sends to everyone, nodes 1..9 send one edge each to node 0
        std::vector<std::pair<int, int>> edges;
        for (int j = 1; j < 10; ++j) edges.emplace_back(0, j);
        for (int i = 1; i < 10; ++i) edges.emplace_back(i, 0);
        const adjacency_t hub = boolean_graph(10, edges);

        std::mt19937 rng(99);
        double hub_out = 0.0;
        const int n_trials = 200;
        for (int t = 0; t < n_trials; ++t) {
            adjacency_t control = generate_degree_based_control(hub, direction_t::EFFERENT, rng);
            hub_out += control.efferent_count()[0];
        }
        // column j != 0 draws node 0 with probability 9 / 17
        assert(hub_out / n_trials > 3.0);
    }

    // AFFERENT mirror: high in-degree targets are drawn more often.
    {
        // node 0 receives from everyone and sends one edge to each of 1..9
        std::vector<std::pair<int, int>> edges;
        for (int i = 1; i < 10; ++i) edges.emplace_back(i, 0);
        for (int j = 1; j < 10; ++j) edges.emplace_back(0, j);
        const adjacency_t hub = boolean_graph(10, edges);

        std::mt19937 rng(99);
        double hub_in = 0.0;
        const int n_trials = 200;
        for (int t = 0; t < n_trials; ++t) {
            adjacency_t control = generate_degree_based_control(hub, direction_t::AFFERENT, rng);
            assert(near(control.efferent_count(), hub.efferent_count()));
            // row 0 needs every other node
            for (int j = 1; j < 10; ++j) assert(control.has_edge(0, j));
            hub_in += control.afferent_count()[0];
        }
        // row i != 0 draws node 0 with probability 9 / 17
        assert(hub_in / n_trials > 3.0);
        assert(hub_in / n_trials < 9.0);
    }

    // In-degree is kept in expectation by AFFERENT controls.
    {
        const adjacency_t adj = connstat_test::random_graph(40, 0.15, 23);
        const std::vector<double> in_count = adj.afferent_count();
        std::vector<double> mean_in(in_count.size(), 0.0);
        std::mt19937 rng(5);
        const int n_trials = 300;
        for (int t = 0; t < n_trials; ++t) {
            adjacency_t control = generate_degree_based_control(adj, direction_t::AFFERENT, rng);
            const std::vector<double> c = control.afferent_count();
            for (size_t j = 0; j < c.size(); ++j) mean_in[j] += c[j] / n_trials;
        }
        double total_observed = 0.0;
        double total_mean = 0.0;
        double cov = 0.0;
        double var_obs = 0.0;
        double var_mean = 0.0;
        for (size_t j = 0; j < in_count.size(); ++j) {
            total_observed += in_count[j];
            total_mean += mean_in[j];
        }
        assert(near(total_mean, total_observed, 1e-6));
        const double mu = total_observed / static_cast<double>(in_count.size());
        for (size_t j = 0; j < in_count.size(); ++j) {
            cov += (in_count[j] - mu) * (mean_in[j] - mu);
            var_obs += (in_count[j] - mu) * (in_count[j] - mu);
            var_mean += (mean_in[j] - mu) * (mean_in[j] - mu);
        }
        // targets keep their ranking on average
        assert(cov / std::sqrt(var_obs * var_mean) > 0.8);
    }

    // Errors.
    {
        std::mt19937 rng(1);
        const bool both = throws<std::invalid_argument>([&adj, &rng] {
            generate_degree_based_control(adj, direction_t::BOTH, rng);
        });
        assert(both);

        // column 0 has two sources but only node 1 is a candidate once node 0 is excluded
        const adjacency_t self_loop = boolean_graph(3, {{0, 0}, {1, 0}});
        const bool impossible = throws<std::runtime_error>([&self_loop, &rng] {
            generate_degree_based_control(self_loop, direction_t::EFFERENT, rng);
        });
        assert(impossible);
    }

    // An empty graph stays empty.
    {
        std::mt19937 rng(1);
        adjacency_t control = generate_degree_based_control(boolean_graph(4, {}), direction_t::AFFERENT, rng);
        assert(control.n_edges() == 0);
    }

    return 0;
}
