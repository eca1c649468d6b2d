/// @file src/sizing/algorithms.cpp
/// @brief Fixed-size and adaptive AggregationAlgorithm factories.

#include "kagg/sizing.hpp"
#include "kagg/krylov.hpp"
#include "kagg/errors.hpp"

#include <fmt/format.h>

namespace kagg::sizing {

namespace {

void require_positive_size(Index size) {
    if (size < 1) {
        throw ScheduleError(fmt::format("aggregation size must be at least 1, got {}", size));
    }
}

/// Build a basis of `size` vectors (fewer if the subspace saturates first).
Aggregation build_fixed(const chain::TransitionMatrix& chain,
                        const Vector& p0,
                        Index size,
                        bool with_stationary) {
    krylov::ArnoldiFactorization factorization(chain, p0, size);
    while (factorization.size() < size &&
           factorization.expand() == krylov::ExpandStatus::Expanded) {
    }

    Aggregation aggregation{
        .basis       = factorization.basis(),
        .step_matrix = factorization.rayleigh_quotient(),
        .stationary  = std::nullopt,
        .initial     = aggregated_initial(factorization.initial_norm(),
                                          factorization.size()),
    };

    if (with_stationary) {
        auto estimate = krylov::StationaryEstimator::estimate(
            aggregation.step_matrix, aggregation.basis);
        if (estimate) {
            aggregation.stationary = std::move(estimate->vector);
        }
    }
    return aggregation;
}

} // anonymous namespace

Vector aggregated_initial(double norm, Index size) {
    Vector initial = Vector::Zero(size);
    if (size > 0) {
        initial(0) = norm;
    }
    return initial;
}

AggregationAlgorithm naive_arnoldi(Index size) {
    require_positive_size(size);
    return [size](const chain::TransitionMatrix& chain, const Vector& p0) {
        return build_fixed(chain, p0, size, /*with_stationary=*/false);
    };
}

AggregationAlgorithm arnoldi_with_stationary(Index size) {
    require_positive_size(size);
    return [size](const chain::TransitionMatrix& chain, const Vector& p0) {
        return build_fixed(chain, p0, size, /*with_stationary=*/true);
    };
}

AggregationAlgorithm arnoldi_adaptive(SizingConfig config) {
    AdaptiveSizeSelector selector(std::move(config));
    return [selector](const chain::TransitionMatrix& chain, const Vector& p0) {
        return selector.select(chain, p0).aggregation;
    };
}

} // namespace kagg::sizing
