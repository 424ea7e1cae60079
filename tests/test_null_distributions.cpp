#include "null_distributions.hpp"
#include "rich_club.hpp"

#include "graph_fixtures.hpp"
#include "test_support.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace connstat;
using connstat_test::near;
using connstat_test::throws;

int main() {
    // Binomial PMF, highest count first.
    {
        assert(near(binomial_pmf_descending(2, 0.5), {0.25, 0.5, 0.25}));
        assert(near(binomial_pmf_descending(3, 1.0), {1.0, 0.0, 0.0, 0.0}));
        assert(near(binomial_pmf_descending(0, 0.3), {1.0}));

        const bool bad_p = throws<std::invalid_argument>([] { binomial_pmf_descending(3, 1.5); });
        assert(bad_p);
        const bool bad_n = throws<std::invalid_argument>([] { binomial_pmf_descending(-1, 0.5); });
        assert(bad_n);
    }

    // Hypergeometric moments.
    {
        hypergeom_moments_t m = hypergeom_moments(10, 4, 3);
        assert(near(m.mean, 1.2));
        assert(near(m.variance, 504.0 / 900.0));

        hypergeom_moments_t single = hypergeom_moments(1, 1, 1);
        assert(near(single.mean, 1.0));
        assert(near(single.variance, 0.0));

        // drawing everything leaves no spread
        hypergeom_moments_t all = hypergeom_moments(5, 2, 5);
        assert(near(all.mean, 2.0));
        assert(near(all.variance, 0.0));

        assert(std::isnan(hypergeom_moments(4, 5, 1).mean));
        assert(std::isnan(hypergeom_moments(4, 2, 6).variance));
        assert(std::isnan(hypergeom_moments(0, 0, 0).mean));
    }

    // Analytical rich club on the 4-node example.
    // indeg [0, 1, 2, 1], outdeg [2, 1, 1, 0], total indegree 4.
    // k = 1, S = {0, 1, 2}: per-node (M, K, n) = (4, 3, 2), (3, 2, 1), (2, 1, 1).
    {
        adjacency_t adj = connstat_test::four_node_example();
        null_curve_t c = analytical_expected_rich_club_curve(adj, direction_t::EFFERENT);
        assert(near(c.x, {1.0, 2.0}));

        const double sum_mean = 1.5 + 2.0 / 3.0 + 0.5;
        const double sum_var = 0.25 + 2.0 / 9.0 + 0.25;
        assert(near(c.mean[0], sum_mean / 6.0));
        assert(near(c.sd[0], std::sqrt(sum_var) / 6.0));
        assert(std::isnan(c.mean[1]));
        assert(std::isnan(c.sd[1]));
    }

    // Only boolean matrices.
    {
        adjacency_t weighted(3, {{0, 1, 2.0}, {1, 2, 1.0}}, false);
        const bool threw = throws<std::domain_error>([&weighted] {
            analytical_expected_rich_club_curve(weighted, direction_t::EFFERENT);
        });
        assert(threw);
    }

    // The expectation tracks the observed curve of random graphs.
    {
        adjacency_t adj = connstat_test::random_graph(60, 0.1, 3);
        const std::vector<double> in_degree = adj.afferent_degree();
        null_curve_t c = analytical_expected_rich_club_curve(adj, direction_t::AFFERENT);
        assert(c.size() > 0);
        assert(c.mean[0] > 0.05 && c.mean[0] < 0.15);

        // a club smaller than the graph leaves stubs outside it, so the draws vary
        bool checked_strict_club = false;
        for (size_t t = 0; t < c.size(); ++t) {
            size_t club = 0;
            for (double d : in_degree) {
                if (d >= c.x[t]) ++club;
            }
            if (club >= 2 && club < in_degree.size()) {
                assert(c.sd[t] > 0.0);
                checked_strict_club = true;
                break;
            }
        }
        assert(checked_strict_club);
    }

    // A club holding every stub draws all successes: zero variance.
    {
        // directed 4-cycle plus chords, every in-degree >= 1
        adjacency_t adj = connstat_test::boolean_graph(4, {{0, 1}, {1, 2}, {2, 3}, {3, 0}, {0, 2}});
        null_curve_t c = analytical_expected_rich_club_curve(adj, direction_t::AFFERENT);
        assert(near(c.x[0], 1.0));
        // out-degree 2 + 1 + 1 + 1 stubs among 4 * 3 pairs
        assert(near(c.mean[0], 5.0 / 12.0));
        assert(c.sd[0] == 0.0);
    }

    return 0;
}
