/// @file src/chain/transition_matrix.cpp
/// @brief TransitionMatrix construction and validation.

#include "kagg/chain.hpp"
#include "kagg/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace kagg::chain {

// ─── Construction ─────────────────────────────────────────────────────────────

TransitionMatrix::TransitionMatrix(SparseMatrix forward)
    : forward_(std::move(forward)) {}

TransitionMatrix TransitionMatrix::from_forward_operator(SparseMatrix forward) {
    if (forward.rows() == 0 || forward.rows() != forward.cols()) {
        throw DimensionError(fmt::format(
            "transition matrix must be square and non-empty, got {}x{}",
            forward.rows(), forward.cols()));
    }

    for (Index col = 0; col < forward.outerSize(); ++col) {
        for (SparseMatrix::InnerIterator it(forward, col); it; ++it) {
            if (!std::isfinite(it.value()) || it.value() < 0.0) {
                throw DegenerateInputError(fmt::format(
                    "transition probability Pr[{} -> {}] = {} is not a "
                    "finite nonnegative number",
                    it.col(), it.row(), it.value()));
            }
        }
    }

    forward.prune([](const Index&, const Index&, const double& value) {
        return value != 0.0;
    });
    forward.makeCompressed();

    return TransitionMatrix(std::move(forward));
}

TransitionMatrix TransitionMatrix::from_row_stochastic(const DenseMatrix& p) {
    return from_row_stochastic(SparseMatrix(p.sparseView()));
}

TransitionMatrix TransitionMatrix::from_row_stochastic(const SparseMatrix& p) {
    SparseMatrix forward = p.transpose();
    return from_forward_operator(std::move(forward));
}

// ─── Queries ──────────────────────────────────────────────────────────────────

double TransitionMatrix::probability(Index from, Index to) const {
    return forward_.coeff(to, from);
}

void TransitionMatrix::apply(const Eigen::Ref<const Vector>& p,
                             Eigen::Ref<Vector> out) const {
    if (p.size() != size() || out.size() != size()) {
        throw DimensionError(fmt::format(
            "cannot apply a {}-state chain to a vector of length {} "
            "into a vector of length {}", size(), p.size(), out.size()));
    }
    out.noalias() = forward_ * p;
}

double TransitionMatrix::stochastic_defect() const {
    // Column sums of F are the outgoing probability mass of each state.
    double defect = 0.0;
    for (Index col = 0; col < forward_.outerSize(); ++col) {
        double mass = 0.0;
        for (SparseMatrix::InnerIterator it(forward_, col); it; ++it) {
            mass += it.value();
        }
        defect = std::max(defect, std::abs(mass - 1.0));
    }
    return defect;
}

bool TransitionMatrix::is_stochastic(double tolerance) const {
    return stochastic_defect() <= tolerance;
}

} // namespace kagg::chain
