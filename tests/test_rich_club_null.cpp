#include "rich_club_null.hpp"
#include "rich_club.hpp"
#include "omp_compat.h"

#include "graph_fixtures.hpp"
#include "test_support.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace connstat;
using connstat_test::near;
using connstat_test::throws;

int main() {
    // Moments drop NaN only; an infinite normalized entry stays visible.
    {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        const double inf = std::numeric_limits<double>::infinity();
        assert(near(nan_mean({1.0, nan, 3.0}), 2.0));
        assert(near(nan_std({1.0, nan, 3.0}), 1.0));
        assert(std::isnan(nan_mean({nan, nan})));
        assert(std::isnan(nan_std({})));
        assert(nan_mean({1.0, inf, nan}) == inf);
        assert(nan_mean({-inf, 2.0}) == -inf);
        assert(std::isnan(nan_std({1.0, inf})));
    }

    // Parsers.
    {
        assert(normalize_from_string("mean") == normalize_t::MEAN);
        assert(normalize_from_string("std") == normalize_t::STD);
        assert(null_model_from_string("analytical") == null_model_t::ANALYTICAL);
        assert(null_model_from_string("shuffled") == null_model_t::SHUFFLED);

        const bool bad_normalize = throws<std::invalid_argument>([] { normalize_from_string("median"); });
        assert(bad_normalize);
        const bool bad_model = throws<std::invalid_argument>([] { null_model_from_string("Shuffled"); });
        assert(bad_model);
    }

    // Analytical normalization of the 4-node example: observed [0.5, NaN].
    {
        const adjacency_t adj = connstat_test::four_node_example();
        const double mean = (1.5 + 2.0 / 3.0 + 0.5) / 6.0;
        const double sd = std::sqrt(0.25 + 2.0 / 9.0 + 0.25) / 6.0;

        curve_t by_mean = normalized_rich_club_curve(adj, direction_t::EFFERENT, normalize_t::MEAN,
                                                     null_model_t::ANALYTICAL);
        assert(near(by_mean.x, {1.0, 2.0}));
        assert(near(by_mean.y[0], 0.5 / mean));
        assert(near(by_mean.y[0], 1.125));
        assert(std::isnan(by_mean.y[1]));

        curve_t by_std = normalized_rich_club_curve(adj, direction_t::EFFERENT, normalize_t::STD,
                                                    null_model_t::ANALYTICAL);
        assert(near(by_std.y[0], (0.5 - mean) / sd));
        assert(std::isnan(by_std.y[1]));

        const double coefficient = rich_club_coefficient(adj, direction_t::EFFERENT, null_model_t::ANALYTICAL);
        assert(near(coefficient, (0.5 - mean) / sd));
    }

    // Shuffled moments at the observed thresholds.
    {
        const adjacency_t adj = connstat_test::random_graph(40, 0.15, 21);
        const std::vector<double> degrees = adj.efferent_degree();
        const rich_club_thresholds_t grid = rich_club_thresholds(degrees, true);

        null_curve_t null_curve =
            randomized_control_rich_club_curve(adj, direction_t::EFFERENT, grid.thresholds, 20, 1234);
        assert(null_curve.size() == grid.thresholds.size());
        assert(near(null_curve.x, grid.thresholds));
        assert(null_curve.mean[0] > 0.0 && null_curve.mean[0] < 1.0);
        assert(null_curve.sd[0] >= 0.0);
        for (size_t k = 0; k < null_curve.size(); ++k) {
            if (std::isfinite(null_curve.mean[k])) {
                assert(null_curve.mean[k] >= 0.0 && null_curve.mean[k] <= 1.0);
            }
        }

        // same seed, same moments
        null_curve_t again =
            randomized_control_rich_club_curve(adj, direction_t::EFFERENT, grid.thresholds, 20, 1234);
        assert(near(again.mean, null_curve.mean, 0.0));
        assert(near(again.sd, null_curve.sd, 0.0));
    }

    // Trials are seeded per trial, so the thread count does not matter.
    {
        const adjacency_t adj = connstat_test::random_graph(30, 0.2, 8, true);
#ifdef _OPENMP
        assert(built_with_openmp());
#endif
        const int saved = connstat_get_max_threads();

        connstat_set_num_threads(1);
        curve_t serial = normalized_rich_club_curve(adj, direction_t::AFFERENT, normalize_t::STD,
                                                    null_model_t::SHUFFLED, 12, 77);
        connstat_set_num_threads(4);
        curve_t parallel = normalized_rich_club_curve(adj, direction_t::AFFERENT, normalize_t::STD,
                                                      null_model_t::SHUFFLED, 12, 77);
        connstat_set_num_threads(saved);

        assert(near(serial.x, parallel.x, 0.0));
        assert(near(serial.y, parallel.y, 1e-12));
        assert(!serial.y.empty());
    }

    // Weighted graphs: binned thresholds, value-weighted controls.
    {
        const adjacency_t adj = connstat_test::random_graph(40, 0.2, 13, true);
        const std::vector<double> degrees = adj.efferent_degree();
        const rich_club_thresholds_t grid = rich_club_thresholds(degrees, false);
        const curve_t observed = rich_club_curve(adj, direction_t::EFFERENT);
        assert(near(observed.x, grid.x));

        null_curve_t null_curve =
            randomized_control_rich_club_curve(adj, direction_t::EFFERENT, grid.thresholds, 10, 31);
        assert(null_curve.size() == grid.thresholds.size());
        assert(std::isfinite(null_curve.mean[0]) && null_curve.mean[0] > 0.0);
        // mass per pair, weights below 2
        for (size_t k = 0; k < null_curve.size(); ++k) {
            if (!std::isnan(null_curve.mean[k])) {
                assert(null_curve.mean[k] >= 0.0 && null_curve.mean[k] < 2.0);
            }
        }

        // same seed, same controls; a zero null mean or sd gives +-inf
        auto same = [](double a, double b) { return std::isinf(b) ? a == b : near(a, b, 1e-12); };

        curve_t by_mean = normalized_rich_club_curve(adj, direction_t::EFFERENT, normalize_t::MEAN,
                                                     null_model_t::SHUFFLED, 10, 31);
        assert(near(by_mean.x, observed.x));
        assert(by_mean.size() == observed.size());
        for (size_t k = 0; k < by_mean.size(); ++k) {
            assert(same(by_mean.y[k], observed.y[k] / null_curve.mean[k]));
        }

        curve_t by_std = normalized_rich_club_curve(adj, direction_t::EFFERENT, normalize_t::STD,
                                                    null_model_t::SHUFFLED, 10, 31);
        assert(by_std.size() == observed.size());
        for (size_t k = 0; k < by_std.size(); ++k) {
            assert(same(by_std.y[k], (observed.y[k] - null_curve.mean[k]) / null_curve.sd[k]));
        }
    }

    // The shuffled coefficient is the mean of the STD entries that are not NaN.
    {
        const adjacency_t adj = connstat_test::random_graph(30, 0.2, 3);
        curve_t curve = normalized_rich_club_curve(adj, direction_t::EFFERENT, normalize_t::STD,
                                                   null_model_t::SHUFFLED, 8, 5);
        const double coefficient = rich_club_coefficient(adj, direction_t::EFFERENT,
                                                         null_model_t::SHUFFLED, 8, 5);
        double sum = 0.0;
        int n = 0;
        for (double v : curve.y) {
            if (!std::isnan(v)) {
                sum += v;
                ++n;
            }
        }
        if (n > 0) {
            assert(near(coefficient, sum / n, 1e-12));
        } else {
            assert(std::isnan(coefficient));
        }
    }

    // Errors.
    {
        const adjacency_t adj = connstat_test::four_node_example();
        const adjacency_t weighted = connstat_test::random_graph(10, 0.3, 4, true);
        const std::vector<double> thresholds = {1.0, 2.0};

        const bool zero_repeats = throws<std::invalid_argument>([&adj, &thresholds] {
            randomized_control_rich_club_curve(adj, direction_t::EFFERENT, thresholds, 0, 1);
        });
        assert(zero_repeats);

        const bool normalized_zero_repeats = throws<std::invalid_argument>([&adj] {
            normalized_rich_club_curve(adj, direction_t::EFFERENT, normalize_t::STD,
                                       null_model_t::SHUFFLED, 0, 1);
        });
        assert(normalized_zero_repeats);

        const bool analytical_weighted = throws<std::domain_error>([&weighted] {
            normalized_rich_club_curve(weighted, direction_t::EFFERENT, normalize_t::MEAN,
                                       null_model_t::ANALYTICAL);
        });
        assert(analytical_weighted);

        const bool both = throws<std::invalid_argument>([&adj] {
            normalized_rich_club_curve(adj, direction_t::BOTH, normalize_t::STD,
                                       null_model_t::ANALYTICAL);
        });
        assert(both);

        const bool both_shuffled = throws<std::invalid_argument>([&adj, &thresholds] {
            randomized_control_rich_club_curve(adj, direction_t::BOTH, thresholds, 2, 1);
        });
        assert(both_shuffled);
    }

    return 0;
}
