/// @file src/krylov/arnoldi_factorization.cpp
/// @brief Arnoldi process with re-orthogonalised modified Gram-Schmidt.

#include "kagg/krylov.hpp"
#include "kagg/errors.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace kagg::krylov {

std::string_view to_string(ExpandStatus status) noexcept {
    switch (status) {
        case ExpandStatus::Expanded:          return "expanded";
        case ExpandStatus::Breakdown:         return "breakdown";
        case ExpandStatus::CapacityExhausted: return "capacity-exhausted";
    }
    return "unknown";
}

// ─── Construction (initialize) ────────────────────────────────────────────────

ArnoldiFactorization::ArnoldiFactorization(const chain::TransitionMatrix& chain,
                                           const Vector& p0,
                                           Index capacity)
    : chain_(chain)
{
    const Index n = chain.size();
    if (p0.size() != n) {
        throw DimensionError(fmt::format(
            "initial distribution has length {} but the chain has {} states",
            p0.size(), n));
    }
    if (capacity < 1) {
        throw DimensionError(fmt::format(
            "basis capacity must be at least 1, got {}", capacity));
    }
    if (!p0.allFinite()) {
        throw DegenerateInputError("initial distribution has non-finite entries");
    }

    initial_norm_ = p0.norm();
    if (initial_norm_ == 0.0) {
        throw DegenerateInputError("initial distribution is the zero vector");
    }

    // A Krylov basis can never exceed the dimension of the space.
    const Index columns = std::min(capacity, n);
    basis_      = DenseMatrix::Zero(n, columns);
    hessenberg_ = DenseMatrix::Zero(columns, columns);
    residual_   = Vector::Zero(n);

    basis_.col(0) = p0 / initial_norm_;
    orthogonalize_column(0);
    size_ = 1;
}

// ─── expand ───────────────────────────────────────────────────────────────────

ExpandStatus ArnoldiFactorization::expand() {
    if (size_ == original_size()) {
        return ExpandStatus::Breakdown;
    }
    if (size_ == capacity()) {
        return ExpandStatus::CapacityExhausted;
    }
    if (residual_norm_ <= constants::BREAKDOWN_TOLERANCE * residual_scale_) {
        return ExpandStatus::Breakdown;
    }

    const Index k = size_;
    basis_.col(k) = residual_ / residual_norm_;
    hessenberg_(k, k - 1) = residual_norm_;

    orthogonalize_column(k);
    ++size_;
    return ExpandStatus::Expanded;
}

// ─── orthogonalize_column ─────────────────────────────────────────────────────

void ArnoldiFactorization::orthogonalize_column(Index j) {
    residual_.noalias() = chain_.forward() * basis_.col(j);
    residual_scale_ = residual_.norm();

    // Modified Gram-Schmidt, then a second full pass to recover the
    // orthogonality lost to cancellation. Both passes accumulate into Π.
    for (int pass = 0; pass < 2; ++pass) {
        for (Index i = 0; i <= j; ++i) {
            const double h = basis_.col(i).dot(residual_);
            hessenberg_(i, j) += h;
            residual_.noalias() -= h * basis_.col(i);
        }
    }

    residual_norm_ = residual_.norm();
}

} // namespace kagg::krylov
