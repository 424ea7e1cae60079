#include "degree_gini.hpp"

#include "graph_fixtures.hpp"
#include "test_support.hpp"

#include <stdexcept>
#include <vector>

using namespace connstat;
using connstat_test::boolean_graph;
using connstat_test::near;
using connstat_test::throws;

int main() {
    // Degrees [3, 1, 1, 1]: the curve is anchored at the origin, one point per node.
    {
        adjacency_t adj = boolean_graph(4, {{0, 1}, {0, 2}, {0, 3}, {1, 0}, {2, 0}, {3, 0}});
        curve_t c = gini_curve(adj, direction_t::EFFERENT);
        assert(c.size() == 5);
        assert(near(c.x, {0.0, 0.25, 0.5, 0.75, 1.0}));
        assert(near(c.y, {0.0, 0.5, 4.0 / 6.0, 5.0 / 6.0, 1.0}));

        // area 0.625
        assert(near(gini_coefficient(adj, direction_t::EFFERENT), 0.25));
    }

    // A regular ring has no inequality.
    {
        adjacency_t ring = boolean_graph(5, {{0, 1}, {1, 2}, {2, 3}, {3, 4}, {4, 0}});
        assert(near(gini_coefficient(ring, direction_t::EFFERENT), 0.0));
        assert(near(gini_coefficient(ring, direction_t::AFFERENT), 0.0));
    }

    // Out-star: all edges on one node gives 1 - 1/N.
    {
        adjacency_t star = boolean_graph(5, {{0, 1}, {0, 2}, {0, 3}, {0, 4}});
        assert(near(gini_coefficient(star, direction_t::EFFERENT), 0.8));
        // in-degrees [0, 1, 1, 1, 1]
        assert(near(gini_coefficient(star, direction_t::AFFERENT), 0.2));
    }

    // Weighted degrees are value sums.
    {
        adjacency_t adj(2, {{0, 1, 3.0}, {1, 0, 1.0}}, false);
        curve_t c = gini_curve(adj, direction_t::EFFERENT);
        assert(near(c.y, {0.0, 0.75, 1.0}));
    }

    // Zero total degree gives the equality diagonal.
    {
        adjacency_t empty = boolean_graph(4, {});
        curve_t c = gini_curve(empty, direction_t::EFFERENT);
        assert(near(c.x, c.y));
        assert(near(gini_coefficient(empty, direction_t::EFFERENT), 0.0));
    }

    // BOTH is not a degree axis.
    {
        adjacency_t adj = connstat_test::four_node_example();
        const bool threw = throws<std::invalid_argument>([&adj] { gini_curve(adj, direction_t::BOTH); });
        assert(threw);
        const bool threw_null = throws<std::invalid_argument>([&adj] {
            analytical_expected_gini_curve(adj, direction_t::BOTH);
        });
        assert(threw_null);
    }

    // Binomial null: 3 nodes, 3 edges -> p = 0.5 over 2 trials, pmf [0.25, 0.5, 0.25]
    // for degrees [2, 1, 0].
    {
        adjacency_t adj = boolean_graph(3, {{0, 1}, {1, 2}, {2, 0}});
        curve_t c = analytical_expected_gini_curve(adj, direction_t::EFFERENT);
        assert(near(c.x, {0.0, 0.25, 0.75, 1.0}));
        assert(near(c.y, {0.0, 0.5, 1.0, 1.0}));
    }

    // Complete graph: the null puts all mass on degree N - 1.
    {
        std::vector<std::pair<int, int>> edges;
        for (int i = 0; i < 4; ++i)
            for (int j = 0; j < 4; ++j)
                if (i != j) edges.emplace_back(i, j);
        adjacency_t complete = boolean_graph(4, edges);
        curve_t c = analytical_expected_gini_curve(complete, direction_t::EFFERENT);
        assert(near(trapezoid_integral(c), 0.5));
        assert(near(normalized_gini_coefficient(complete, direction_t::EFFERENT), 0.0));
    }

    // Empty graph: zero density gives the diagonal.
    {
        adjacency_t empty = boolean_graph(4, {});
        curve_t c = analytical_expected_gini_curve(empty, direction_t::AFFERENT);
        assert(near(c.x, c.y));
        assert(near(c.x.front(), 0.0));
        assert(near(c.x.back(), 1.0));
    }

    // A star is far more unequal than a random graph of the same density.
    {
        adjacency_t star = boolean_graph(6, {{0, 1}, {0, 2}, {0, 3}, {0, 4}, {0, 5}});
        assert(normalized_gini_coefficient(star, direction_t::EFFERENT) > 0.2);
    }

    return 0;
}
