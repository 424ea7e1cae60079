#include "rich_club_null.hpp"
#include "degree_control.hpp"
#include "degree_gini.hpp"
#include "rich_club.hpp"
#include "omp_compat.h"
#include "progress_utils.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include <R.h>
#include <R_ext/Print.h>

namespace connstat {

normalize_t normalize_from_string(const std::string& name) {
    if (name == "mean") return normalize_t::MEAN;
    if (name == "std") return normalize_t::STD;
    throw std::invalid_argument("Unknown value for argument normalize: '" + name +
                                "'. Must be 'mean' or 'std'");
}

null_model_t null_model_from_string(const std::string& name) {
    if (name == "analytical") return null_model_t::ANALYTICAL;
    if (name == "shuffled") return null_model_t::SHUFFLED;
    throw std::invalid_argument("Unknown value for argument normalize_with: '" + name +
                                "'. Must be 'analytical' or 'shuffled'");
}

null_curve_t randomized_control_rich_club_curve(const adjacency_t& adj,
                                                direction_t direction,
                                                const std::vector<double>& thresholds,
                                                int n_repeats,
                                                std::uint32_t seed,
                                                bool verbose) {
    if (n_repeats < 1) {
        throw std::invalid_argument("n_repeats must be at least 1, got " + std::to_string(n_repeats));
    }
    (void)degree_vector(adj, direction);

    if (seed == 0) {
        std::random_device rd;
        seed = rd();
    }

    const size_t n_thresholds = thresholds.size();
    std::vector<std::vector<double>> trials(static_cast<size_t>(n_repeats));

    auto ptm = std::chrono::steady_clock::now();
    if (verbose) {
        Rprintf("Generating %d shuffled controls (%s) on %d thread(s)\n",
                n_repeats, direction_name(direction).c_str(), connstat_get_max_threads());
    }
    progress_tracker_t progress(static_cast<size_t>(n_repeats), "Shuffled controls",
                                static_cast<size_t>(std::max(1, n_repeats / 10)));

    std::exception_ptr trial_error = nullptr;

    #ifdef _OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (int t = 0; t < n_repeats; ++t) {
        try {
            std::seed_seq seq{seed, static_cast<std::uint32_t>(t)};
            std::mt19937 rng(seq);

            const adjacency_t control = generate_degree_based_control(adj, direction, rng);
            const std::vector<double> degrees = degree_vector(control, direction);
            trials[static_cast<size_t>(t)] =
                cumulative_rich_club_density(control, degrees, thresholds, true);
        } catch (...) {
            #ifdef _OPENMP
            #pragma omp critical(connstat_trial_error)
            #endif
            {
                if (!trial_error) trial_error = std::current_exception();
            }
        }

        if (verbose) {
            #ifdef _OPENMP
            #pragma omp critical(connstat_progress)
            #endif
            progress.step_done();
        }
    }

    if (trial_error) {
        std::rethrow_exception(trial_error);
    }
    if (verbose) {
        progress.finish();
    }

    null_curve_t result;
    result.x = thresholds;
    result.mean.resize(n_thresholds);
    result.sd.resize(n_thresholds);

    std::vector<double> column(static_cast<size_t>(n_repeats));
    for (size_t k = 0; k < n_thresholds; ++k) {
        for (size_t t = 0; t < trials.size(); ++t) {
            column[t] = trials[t][k];
        }
        result.mean[k] = nan_mean(column);
        result.sd[k] = nan_std(column);
    }

    if (verbose) {
        elapsed_time(ptm, "Null rich-club moments", true);
    }
    return result;
}

curve_t normalized_rich_club_curve(const adjacency_t& adj,
                                   direction_t direction,
                                   normalize_t normalize,
                                   null_model_t normalize_with,
                                   int n_repeats,
                                   std::uint32_t seed,
                                   bool verbose) {
    const std::vector<double> degrees = degree_vector(adj, direction);
    if (normalize_with == null_model_t::ANALYTICAL && !adj.is_boolean()) {
        throw std::domain_error("Analytical normalization is only implemented for boolean matrices; "
                                "use the shuffled null model for weighted matrices");
    }
    if (normalize_with == null_model_t::SHUFFLED && n_repeats < 1) {
        throw std::invalid_argument("n_repeats must be at least 1, got " + std::to_string(n_repeats));
    }

    const rich_club_thresholds_t grid = rich_club_thresholds(degrees, adj.is_boolean());
    curve_t observed;
    observed.x = grid.x;
    observed.y = induced_rich_club_density(adj, degrees, grid.thresholds);

    null_curve_t null_curve;
    if (normalize_with == null_model_t::ANALYTICAL) {
        null_curve = analytical_expected_rich_club_curve(adj, direction);
    } else {
        null_curve = randomized_control_rich_club_curve(adj, direction, grid.thresholds,
                                                        n_repeats, seed, verbose);
    }

    const size_t n = std::min(observed.size(), null_curve.size());
    curve_t result;
    result.x.assign(observed.x.begin(), observed.x.begin() + static_cast<long>(n));
    result.y.resize(n);
    for (size_t k = 0; k < n; ++k) {
        if (normalize == normalize_t::MEAN) {
            result.y[k] = observed.y[k] / null_curve.mean[k];
        } else {
            result.y[k] = (observed.y[k] - null_curve.mean[k]) / null_curve.sd[k];
        }
    }
    return result;
}

double rich_club_coefficient(const adjacency_t& adj,
                             direction_t direction,
                             null_model_t normalize_with,
                             int n_repeats,
                             std::uint32_t seed,
                             bool verbose) {
    const curve_t curve = normalized_rich_club_curve(adj, direction, normalize_t::STD,
                                                     normalize_with, n_repeats, seed, verbose);
    return nan_mean(curve.y);
}

} // namespace connstat
