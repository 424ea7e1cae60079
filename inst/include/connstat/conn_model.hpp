#ifndef CONNSTAT_CONN_MODEL_HPP_
#define CONNSTAT_CONN_MODEL_HPP_

#include "conn_prob.hpp"

#include <string>
#include <variant>
#include <vector>

namespace connstat {

/// p(d) = a * exp(-b * d)
struct exp_model_t {
    double a = 0.0;
    double b = 0.0;
};

/**
 * @struct bipolar_exp_model_t
 * @brief Exponential distance decay with separate parameters by relative depth
 *
 * neg applies when the target lies below the source (dz < 0), pos when it
 * lies above (dz > 0), and the average of the two at dz == 0.
 */
struct bipolar_exp_model_t {
    exp_model_t neg;
    exp_model_t pos;
};

using conn_model_t = std::variant<exp_model_t, bipolar_exp_model_t>;

/// Connection probability predicted by a model at distance d and depth difference dz.
double evaluate_conn_model(const conn_model_t& model, double d, double dz = 0.0);

/// "exp" or "bipolar_exp"
std::string conn_model_name(const conn_model_t& model);

/// Human-readable formula with the fitted parameters filled in.
std::string describe_conn_model(const conn_model_t& model);

struct exp_fit_result_t {
    exp_model_t model;
    double sse = 0.0;      ///< residual sum of squares at the solution
    int iterations = 0;
    bool converged = false;
};

/**
 * @brief Least-squares fit of a * exp(-b * x) to (x, y)
 *
 * Levenberg-Marquardt on the two parameters. Samples where x or y is not
 * finite are skipped.
 *
 * @param p0 starting point
 * @param max_iterations upper bound on accepted plus rejected steps
 * @param tolerance stop once the step or the relative change in the
 *        residual sum of squares falls below it
 *
 * @throws std::invalid_argument if x and y differ in length or fewer than two
 *         finite samples remain
 */
exp_fit_result_t fit_exp_model(const std::vector<double>& x,
                               const std::vector<double>& y,
                               const exp_model_t& p0 = exp_model_t(),
                               int max_iterations = 200,
                               double tolerance = 1e-10);

/**
 * @brief Exponential distance model fitted to a 1-D distance table
 *
 * Probabilities are fitted at the bin centres.
 *
 * @throws std::invalid_argument unless the table is one-dimensional
 */
conn_model_t build_2nd_order(const conn_prob_table_t& table,
                             int max_iterations = 200,
                             double tolerance = 1e-10);

/**
 * @brief Bipolar exponential model fitted to a distance x bipolar table
 *
 * The first bipolar bin (target below) gives neg and the last (target
 * above) gives pos.
 *
 * @throws std::invalid_argument unless the table is two-dimensional with at
 *         least two bipolar bins
 */
conn_model_t build_3rd_order(const conn_prob_table_t& table,
                             int max_iterations = 200,
                             double tolerance = 1e-10);

} // namespace connstat

#endif // CONNSTAT_CONN_MODEL_HPP_
