#include "conn_prob.hpp"

#include "graph_fixtures.hpp"
#include "test_support.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <cstdint>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>

using namespace connstat;
using connstat_test::boolean_graph;
using connstat_test::near;
using connstat_test::throws;

namespace {

const double NaN = std::numeric_limits<double>::quiet_NaN();

// Nodes on a line at x = 0, 1, 2, 3 with edges 0->1, 1->2, 0->2, 0->3.
adjacency_t line_graph() {
    return boolean_graph(4, {{0, 1}, {1, 2}, {0, 2}, {0, 3}});
}

Eigen::MatrixXd line_positions() {
    Eigen::MatrixXd pos(4, 1);
    pos << 0.0, 1.0, 2.0, 3.0;
    return pos;
}

std::vector<double> as_double(const std::vector<std::int64_t>& counts) {
    return std::vector<double>(counts.begin(), counts.end());
}

Eigen::MatrixXd random_positions(Eigen::Index n, unsigned int seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> unif(0.0, 500.0);
    Eigen::MatrixXd pos(n, 3);
    for (Eigen::Index i = 0; i < n; ++i)
        for (Eigen::Index k = 0; k < 3; ++k) pos(i, k) = unif(rng);
    return pos;
}

} // namespace

int main() {
    // Distances and relative depths.
    {
        Eigen::MatrixXd src(2, 2);
        src << 0.0, 0.0,
               3.0, 4.0;
        Eigen::MatrixXd tgt(3, 2);
        tgt << 0.0, 0.0,
               3.0, 0.0,
               3.0, 4.0;
        Eigen::MatrixXd dist = compute_dist_matrix(src, tgt);
        assert(dist.rows() == 2 && dist.cols() == 3);
        assert(std::isnan(dist(0, 0)));
        assert(near(dist(0, 1), 3.0));
        assert(near(dist(0, 2), 5.0));
        assert(near(dist(1, 0), 5.0));
        assert(near(dist(1, 1), 4.0));
        assert(std::isnan(dist(1, 2)));

        Eigen::VectorXd depths(3);
        depths << 100.0, 200.0, NaN;
        Eigen::MatrixXd bip = compute_bip_matrix(depths, depths);
        assert(near(bip(0, 0), 0.0));
        assert(near(bip(0, 1), 1.0));
        assert(near(bip(1, 0), -1.0));
        assert(std::isnan(bip(0, 2)));
        assert(std::isnan(bip(2, 1)));

        const bool mismatch = throws<std::invalid_argument>([&src] {
            compute_dist_matrix(src, Eigen::MatrixXd::Zero(2, 3));
        });
        assert(mismatch);
    }

    // Distance bin edges.
    {
        assert(near(distance_bins(100.0, 250.0), {0.0, 100.0, 200.0, 300.0}));
        assert(near(distance_bins(100.0, 200.0), {0.0, 100.0, 200.0}));
        assert(near(distance_bins(100.0, 0.0), {0.0, 100.0}));
        const bool zero_bin = throws<std::invalid_argument>([] { distance_bins(0.0, 10.0); });
        assert(zero_bin);
    }

    // Hand-counted 1-D table.
    {
        const adjacency_t adj = line_graph();
        const Eigen::MatrixXd dist = compute_dist_matrix(line_positions(), line_positions());

        conn_prob_table_t table = extract_dependent_p_conn(adj, {dist}, {{0.0, 1.5, 3.0}});
        assert(table.shape == std::vector<size_t>{2});
        assert(near(as_double(table.count_all), {6.0, 6.0}));
        assert(near(as_double(table.count_conn), {2.0, 2.0}));
        assert(near(table.p_conn, {1.0 / 3.0, 1.0 / 3.0}));

        // an empty bin reports probability 0
        conn_prob_table_t sparse = extract_dependent_p_conn(adj, {dist}, {{0.0, 0.5, 1.5, 3.0}});
        assert(near(as_double(sparse.count_all), {0.0, 6.0, 6.0}));
        assert(near(sparse.p_conn, {0.0, 1.0 / 3.0, 1.0 / 3.0}));

        // distances beyond the last edge are dropped
        conn_prob_table_t short_range = extract_dependent_p_conn(adj, {dist}, {{0.0, 1.5, 2.5}});
        assert(near(as_double(short_range.count_all), {6.0, 4.0}));
        assert(near(as_double(short_range.count_conn), {2.0, 1.0}));
    }

    // Row-major layout of a 2-D table.
    {
        const adjacency_t adj = line_graph();
        const Eigen::MatrixXd dist = compute_dist_matrix(line_positions(), line_positions());
        Eigen::VectorXd depths(4);
        depths << 0.0, 0.0, 1.0, 1.0;
        const Eigen::MatrixXd bip = compute_bip_matrix(depths, depths);

        conn_prob_table_t table = extract_dependent_p_conn(
            adj, {dist, bip}, {{0.0, 1.5, 3.0}, {-1.5, -0.5, 0.5, 1.5}});
        assert(table.shape == (std::vector<size_t>{2, 3}));
        assert(table.size() == 6);
        assert(table.flat_index({1, 2}) == 5);

        // distance 1: pairs (0,1) (1,0) (2,3) (3,2) same depth, (1,2) up, (2,1) down
        assert(table.count_all[table.flat_index({0, 1})] == 4);
        assert(table.count_all[table.flat_index({0, 2})] == 1);
        assert(table.count_all[table.flat_index({0, 0})] == 1);
        assert(table.count_conn[table.flat_index({0, 1})] == 1);
        assert(table.count_conn[table.flat_index({0, 2})] == 1);
        // distances 2 and 3: all four pairs cross depths, 0->2 and 0->3 go up
        assert(table.count_all[table.flat_index({1, 2})] == 3);
        assert(table.count_all[table.flat_index({1, 0})] == 3);
        assert(table.count_conn[table.flat_index({1, 2})] == 2);
        assert(near(table.p_conn[table.flat_index({1, 0})], 0.0));

        const bool out_of_range = throws<std::out_of_range>([&table] { table.flat_index({2, 0}); });
        assert(out_of_range);
    }

    // Splitting into chunks does not change the counts.
    {
        const adjacency_t adj = connstat_test::random_graph(57, 0.1, 17);
        const Eigen::MatrixXd pos = random_positions(57, 4);
        const Eigen::MatrixXd dist = compute_dist_matrix(pos, pos);
        const std::vector<std::vector<double>> bins = {distance_bins(50.0, 900.0)};

        conn_prob_table_t whole = extract_dependent_p_conn(adj, {dist}, bins, 1);
        for (int n_split : {2, 5, 57, 100}) {
            conn_prob_table_t split = extract_dependent_p_conn(adj, {dist}, bins, n_split);
            assert(split.count_all == whole.count_all);
            assert(split.count_conn == whole.count_conn);
        }

        std::int64_t total = 0;
        for (std::int64_t c : whole.count_all) total += c;
        assert(total == 57 * 56);
        std::int64_t connected = 0;
        for (std::int64_t c : whole.count_conn) connected += c;
        assert(connected == adj.n_edges());

        // covariates computed per block
        const std::vector<covariate_block_fn> covariates = {
            [&pos](Eigen::Index begin, Eigen::Index end) {
                return compute_dist_matrix(pos.middleRows(begin, end - begin), pos);
            }
        };
        conn_prob_table_t blocked = extract_dependent_p_conn_split(adj, covariates, bins, 4);
        assert(blocked.count_all == whole.count_all);
        assert(blocked.count_conn == whole.count_conn);
        assert(near(blocked.p_conn, whole.p_conn, 0.0));
    }

    // Distance-dependent tables.
    {
        const adjacency_t adj = line_graph();
        Eigen::MatrixXd pos = line_positions();

        // range taken from the largest distance, 3
        conn_prob_table_t table = extract_2nd_order(adj, pos, 1.0);
        assert(near(table.bin_edges[0], {0.0, 1.0, 2.0, 3.0}));
        assert(near(as_double(table.count_all), {0.0, 6.0, 6.0}));
        assert(near(as_double(table.count_conn), {0.0, 2.0, 2.0}));
        assert(near(table.p_conn[0], 0.0));

        conn_prob_table_t split = extract_2nd_order(adj, pos, 1.0, 3.0, 3);
        assert(split.count_all == table.count_all);
        assert(split.count_conn == table.count_conn);

        const adjacency_t random_adj = connstat_test::random_graph(40, 0.2, 6);
        const Eigen::MatrixXd random_pos = random_positions(40, 9);
        Eigen::VectorXd depths = random_pos.col(2);

        conn_prob_table_t third = extract_3rd_order(random_adj, random_pos, depths, 100.0, 800.0);
        assert(third.shape == (std::vector<size_t>{8, 3}));
        assert(near(third.bin_edges[1], {-1.5, -0.5, 0.5, 1.5}));
        conn_prob_table_t third_split = extract_3rd_order(random_adj, random_pos, depths, 100.0, 800.0, 6);
        assert(third_split.count_all == third.count_all);
        assert(third_split.count_conn == third.count_conn);
    }

    // Argument checks.
    {
        const adjacency_t adj = line_graph();
        const Eigen::MatrixXd pos = line_positions();
        const Eigen::MatrixXd dist = compute_dist_matrix(pos, pos);

        const bool mismatch = throws<std::invalid_argument>([&adj, &dist] {
            extract_dependent_p_conn(adj, {dist, dist}, {{0.0, 1.0}});
        });
        assert(mismatch);

        const bool not_increasing = throws<std::invalid_argument>([&adj, &dist] {
            extract_dependent_p_conn(adj, {dist}, {{0.0, 2.0, 2.0}});
        });
        assert(not_increasing);

        const bool one_edge = throws<std::invalid_argument>([&adj, &dist] {
            extract_dependent_p_conn(adj, {dist}, {{0.0}});
        });
        assert(one_edge);

        const bool wrong_shape = throws<std::invalid_argument>([&adj] {
            extract_dependent_p_conn(adj, {Eigen::MatrixXd::Zero(3, 4)}, {{0.0, 1.0}});
        });
        assert(wrong_shape);

        const bool zero_split = throws<std::invalid_argument>([&adj, &dist] {
            extract_dependent_p_conn(adj, {dist}, {{0.0, 1.0}}, 0);
        });
        assert(zero_split);

        const bool bad_block = throws<std::invalid_argument>([&adj] {
            const std::vector<covariate_block_fn> covariates = {
                [](Eigen::Index, Eigen::Index) { return Eigen::MatrixXd::Zero(1, 1).eval(); }
            };
            extract_dependent_p_conn_split(adj, covariates, {{0.0, 1.0}}, 2);
        });
        assert(bad_block);

        const bool wrong_rows = throws<std::invalid_argument>([&adj] {
            extract_2nd_order(adj, Eigen::MatrixXd::Zero(3, 2));
        });
        assert(wrong_rows);

        const bool no_range = throws<std::invalid_argument>([&adj, &pos] {
            extract_2nd_order(adj, pos, 1.0, NaN, 2);
        });
        assert(no_range);

        const bool bad_depths = throws<std::invalid_argument>([&adj, &pos] {
            extract_3rd_order(adj, pos, Eigen::VectorXd::Zero(2), 1.0, 3.0);
        });
        assert(bad_depths);
    }

    return 0;
}
