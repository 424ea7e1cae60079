#include "conn_model.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace connstat {

namespace {

inline double exp_decay(const exp_model_t& m, double d) {
    return m.a * std::exp(-m.b * d);
}

std::string format_exp(const exp_model_t& m, const char* var) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "%.6g * exp(-%.6g * %s)", m.a, m.b, var);
    return buf;
}

std::vector<double> bin_centres(const std::vector<double>& edges) {
    std::vector<double> centres(edges.size() > 0 ? edges.size() - 1 : 0);
    for (size_t k = 0; k < centres.size(); ++k) {
        centres[k] = 0.5 * (edges[k] + edges[k + 1]);
    }
    return centres;
}

} // namespace

double evaluate_conn_model(const conn_model_t& model, double d, double dz) {
    return std::visit([d, dz](const auto& m) -> double {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, exp_model_t>) {
            return exp_decay(m, d);
        } else {
            if (dz < 0.0) return exp_decay(m.neg, d);
            if (dz > 0.0) return exp_decay(m.pos, d);
            return 0.5 * (exp_decay(m.neg, d) + exp_decay(m.pos, d));
        }
    }, model);
}

std::string conn_model_name(const conn_model_t& model) {
    return std::holds_alternative<exp_model_t>(model) ? "exp" : "bipolar_exp";
}

std::string describe_conn_model(const conn_model_t& model) {
    if (const exp_model_t* m = std::get_if<exp_model_t>(&model)) {
        return "f(d) = " + format_exp(*m, "d");
    }
    const bipolar_exp_model_t& m = std::get<bipolar_exp_model_t>(model);
    return "f(d, dz) = " + format_exp(m.neg, "d") + " if dz < 0\n"
           "           " + format_exp(m.pos, "d") + " if dz > 0\n"
           "           average of both if dz == 0";
}

exp_fit_result_t fit_exp_model(const std::vector<double>& x,
                               const std::vector<double>& y,
                               const exp_model_t& p0,
                               int max_iterations,
                               double tolerance) {
    if (x.size() != y.size()) {
        throw std::invalid_argument("x and y must have the same length (" + std::to_string(x.size()) +
                                    " vs " + std::to_string(y.size()) + ")");
    }
    std::vector<double> xs, ys;
    for (size_t i = 0; i < x.size(); ++i) {
        if (std::isfinite(x[i]) && std::isfinite(y[i])) {
            xs.push_back(x[i]);
            ys.push_back(y[i]);
        }
    }
    if (xs.size() < 2) {
        throw std::invalid_argument("At least 2 finite samples are required to fit an exponential model");
    }

    auto sse_at = [&xs, &ys](const Eigen::Vector2d& theta) {
        double sse = 0.0;
        for (size_t i = 0; i < xs.size(); ++i) {
            const double r = ys[i] - theta(0) * std::exp(-theta(1) * xs[i]);
            sse += r * r;
        }
        return sse;
    };

    Eigen::Vector2d theta(p0.a, p0.b);
    double sse = sse_at(theta);
    if (!std::isfinite(sse)) {
        throw std::invalid_argument("Residuals are not finite at the starting point");
    }

    exp_fit_result_t result;
    double lambda = 1e-3;

    for (int iter = 0; iter < max_iterations; ++iter) {
        result.iterations = iter + 1;
        if (sse == 0.0) {
            result.converged = true;
            break;
        }

        Eigen::Matrix2d JtJ = Eigen::Matrix2d::Zero();
        Eigen::Vector2d Jtr = Eigen::Vector2d::Zero();
        for (size_t i = 0; i < xs.size(); ++i) {
            const double e = std::exp(-theta(1) * xs[i]);
            const double r = ys[i] - theta(0) * e;
            Eigen::Vector2d J(e, -theta(0) * xs[i] * e);
            JtJ.noalias() += J * J.transpose();
            Jtr.noalias() += J * r;
        }

        // Marquardt scaling; the floor keeps the system solvable while a == 0
        Eigen::Matrix2d A = JtJ;
        for (int k = 0; k < 2; ++k) {
            A(k, k) += lambda * std::max(JtJ(k, k), 1e-12);
        }

        Eigen::LDLT<Eigen::Matrix2d> ldlt(A);
        if (ldlt.info() != Eigen::Success) {
            lambda *= 10.0;
            continue;
        }
        const Eigen::Vector2d delta = ldlt.solve(Jtr);
        const Eigen::Vector2d candidate = theta + delta;
        const double candidate_sse = sse_at(candidate);

        if (std::isfinite(candidate_sse) && candidate_sse < sse) {
            const double rel_change = (sse - candidate_sse) / sse;
            theta = candidate;
            sse = candidate_sse;
            lambda = std::max(lambda / 10.0, 1e-12);
            if (delta.norm() < tolerance * (theta.norm() + tolerance) || rel_change < tolerance) {
                result.converged = true;
                break;
            }
        } else {
            lambda *= 10.0;
            if (lambda > 1e16) {
                // no descent direction left at working precision
                result.converged = true;
                break;
            }
        }
    }

    result.model.a = theta(0);
    result.model.b = theta(1);
    result.sse = sse;
    return result;
}

conn_model_t build_2nd_order(const conn_prob_table_t& table, int max_iterations, double tolerance) {
    if (table.shape.size() != 1 || table.bin_edges.size() != 1) {
        throw std::invalid_argument("2nd order model requires a 1-dimensional distance table");
    }
    const std::vector<double> x = bin_centres(table.bin_edges[0]);
    return fit_exp_model(x, table.p_conn, exp_model_t(), max_iterations, tolerance).model;
}

conn_model_t build_3rd_order(const conn_prob_table_t& table, int max_iterations, double tolerance) {
    if (table.shape.size() != 2 || table.bin_edges.size() != 2 || table.shape[1] < 2) {
        throw std::invalid_argument("3rd order model requires a distance x bipolar table "
                                    "with at least 2 bipolar bins");
    }
    const std::vector<double> x = bin_centres(table.bin_edges[0]);
    const size_t n_bip = table.shape[1];

    std::vector<double> y_neg(x.size());
    std::vector<double> y_pos(x.size());
    for (size_t k = 0; k < x.size(); ++k) {
        y_neg[k] = table.p_conn[k * n_bip];
        y_pos[k] = table.p_conn[k * n_bip + n_bip - 1];
    }

    bipolar_exp_model_t model;
    model.neg = fit_exp_model(x, y_neg, exp_model_t(), max_iterations, tolerance).model;
    model.pos = fit_exp_model(x, y_pos, exp_model_t(), max_iterations, tolerance).model;
    return model;
}

} // namespace connstat
