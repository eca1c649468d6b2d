#pragma once

/// @file include/kagg/chain.hpp
/// @brief TransitionMatrix: the immutable DTMC operator consumed by the core.
///
/// # Module: Chain
///
/// ## Responsibility
/// Own the n×n transition operator of a discrete-time Markov chain in one
/// fixed orientation so that every other module can apply it without
/// guessing conventions.
///
/// ## Convention
/// The stored matrix is the *forward operator* F with
///   F(j, i) = Pr[i → j]
/// i.e. F is column-stochastic and a distribution (column vector) evolves as
///   p_{t+1} = F · p_t.
/// A textbook row-stochastic P (P(i, j) = Pr[i → j], πP = π) enters through
/// `from_row_stochastic` and is stored as F = Pᵀ. The `.tra` loader produces
/// F directly.
///
/// ## Guarantees
/// - Square, non-empty, every stored entry finite and nonnegative
/// - Stochasticity is reported (`stochastic_defect`), not enforced
/// - Immutable after construction; const members are safe to share
///
/// ## NOT Responsible For
/// - Parsing files (see tra_loader.hpp)
/// - Krylov projection (see krylov.hpp)

#include "kagg/types.hpp"
#include "kagg/constants.hpp"

namespace kagg::chain {

class TransitionMatrix {
public:
    /// Wrap a forward operator F (F(j, i) = Pr[i → j]).
    ///
    /// # Errors
    /// - `DimensionError`        if F is empty or not square
    /// - `DegenerateInputError`  if any stored entry is negative or non-finite
    ///
    /// Explicitly stored zeros are pruned.
    [[nodiscard]] static TransitionMatrix from_forward_operator(SparseMatrix forward);

    /// Build from a dense row-stochastic matrix P (P(i, j) = Pr[i → j]).
    /// Stored as F = Pᵀ. Same errors as `from_forward_operator`.
    [[nodiscard]] static TransitionMatrix from_row_stochastic(const DenseMatrix& p);

    /// Sparse overload of `from_row_stochastic`.
    [[nodiscard]] static TransitionMatrix from_row_stochastic(const SparseMatrix& p);

    /// Number of states n.
    [[nodiscard]] Index size() const noexcept { return forward_.rows(); }

    /// Number of stored (nonzero) transitions.
    [[nodiscard]] Index transitions() const noexcept { return forward_.nonZeros(); }

    /// The forward operator F.
    [[nodiscard]] const SparseMatrix& forward() const noexcept { return forward_; }

    /// Pr[from → to] = F(to, from). Indices are not range-checked beyond
    /// Eigen's own debug assertions.
    [[nodiscard]] double probability(Index from, Index to) const;

    /// out = F · p.
    ///
    /// # Errors
    /// `DimensionError` if `p` or `out` does not have length n.
    void apply(const Eigen::Ref<const Vector>& p, Eigen::Ref<Vector> out) const;

    /// max_i |Σ_j F(j, i) − 1|: how far the chain is from being stochastic.
    [[nodiscard]] double stochastic_defect() const;

    /// True if `stochastic_defect() <= tolerance`.
    [[nodiscard]] bool is_stochastic(
        double tolerance = constants::STOCHASTIC_TOLERANCE) const;

private:
    explicit TransitionMatrix(SparseMatrix forward);

    SparseMatrix forward_;
};

} // namespace kagg::chain
