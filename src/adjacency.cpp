#include "adjacency.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace connstat {

direction_t direction_from_string(const std::string& name) {
    if (name == "afferent") {
        return direction_t::AFFERENT;
    } else if (name == "efferent") {
        return direction_t::EFFERENT;
    } else if (name == "both") {
        return direction_t::BOTH;
    }
    throw std::invalid_argument("Unknown value for argument direction: '" + name +
                                "'. Must be 'afferent', 'efferent' or 'both'");
}

std::string direction_name(direction_t direction) {
    switch (direction) {
        case direction_t::AFFERENT: return "afferent";
        case direction_t::EFFERENT: return "efferent";
        default: return "both";
    }
}

adjacency_t::adjacency_t(const csc_matrix_t& matrix, bool is_boolean)
    : csc_(matrix), is_boolean_(is_boolean) {
    validate_and_index();
}

adjacency_t::adjacency_t(Eigen::Index n_nodes,
                         const std::vector<triplet_t>& triplets,
                         bool is_boolean)
    : csc_(n_nodes, n_nodes), is_boolean_(is_boolean) {
    for (const auto& t : triplets) {
        if (t.row() < 0 || t.row() >= n_nodes || t.col() < 0 || t.col() >= n_nodes) {
            throw std::invalid_argument("Edge (" + std::to_string(t.row()) + ", " +
                                        std::to_string(t.col()) +
                                        ") lies outside a matrix of " +
                                        std::to_string(n_nodes) + " nodes");
        }
    }
    if (is_boolean_) {
        csc_.setFromTriplets(triplets.begin(), triplets.end(),
                             [](const double a, const double b) { return (a != 0.0 || b != 0.0) ? 1.0 : 0.0; });
    } else {
        csc_.setFromTriplets(triplets.begin(), triplets.end());
    }
    validate_and_index();
}

void adjacency_t::validate_and_index() {
    if (csc_.rows() != csc_.cols()) {
        throw std::invalid_argument("Adjacency matrix must be square, got " +
                                    std::to_string(csc_.rows()) + " x " +
                                    std::to_string(csc_.cols()));
    }

    csc_.prune(0.0);
    csc_.makeCompressed();

    double* values = csc_.valuePtr();
    for (Eigen::Index k = 0; k < csc_.nonZeros(); ++k) {
        if (!std::isfinite(values[k]) || values[k] < 0.0) {
            throw std::invalid_argument("Adjacency matrix values must be finite and non-negative");
        }
        if (is_boolean_) {
            values[k] = 1.0;
        }
    }

    csr_ = csc_;
    csr_.makeCompressed();
}

bool adjacency_t::has_edge(Eigen::Index source, Eigen::Index target) const {
    if (source < 0 || source >= n_nodes() || target < 0 || target >= n_nodes()) {
        return false;
    }
    const int* first = csr_.innerIndexPtr() + csr_.outerIndexPtr()[source];
    const int* last = csr_.innerIndexPtr() + csr_.outerIndexPtr()[source + 1];
    return std::binary_search(first, last, static_cast<int>(target));
}

std::vector<double> adjacency_t::efferent_degree() const {
    std::vector<double> degree(static_cast<size_t>(n_nodes()), 0.0);
    for (Eigen::Index i = 0; i < csr_.outerSize(); ++i) {
        for (csr_matrix_t::InnerIterator it(csr_, i); it; ++it) {
            degree[static_cast<size_t>(i)] += it.value();
        }
    }
    return degree;
}

std::vector<double> adjacency_t::afferent_degree() const {
    std::vector<double> degree(static_cast<size_t>(n_nodes()), 0.0);
    for (Eigen::Index j = 0; j < csc_.outerSize(); ++j) {
        for (csc_matrix_t::InnerIterator it(csc_, j); it; ++it) {
            degree[static_cast<size_t>(j)] += it.value();
        }
    }
    return degree;
}

std::vector<double> adjacency_t::efferent_count() const {
    std::vector<double> count(static_cast<size_t>(n_nodes()), 0.0);
    const int* outer = csr_.outerIndexPtr();
    for (Eigen::Index i = 0; i < csr_.outerSize(); ++i) {
        count[static_cast<size_t>(i)] = static_cast<double>(outer[i + 1] - outer[i]);
    }
    return count;
}

std::vector<double> adjacency_t::afferent_count() const {
    std::vector<double> count(static_cast<size_t>(n_nodes()), 0.0);
    const int* outer = csc_.outerIndexPtr();
    for (Eigen::Index j = 0; j < csc_.outerSize(); ++j) {
        count[static_cast<size_t>(j)] = static_cast<double>(outer[j + 1] - outer[j]);
    }
    return count;
}

double adjacency_t::total_weight() const {
    const double* values = csc_.valuePtr();
    double total = 0.0;
    for (Eigen::Index k = 0; k < csc_.nonZeros(); ++k) {
        total += values[k];
    }
    return total;
}

} // namespace connstat
