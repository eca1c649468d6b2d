/// @file src/aggregation/aggregation_engine.cpp
/// @brief Double-buffered π_{t+1} = Π · π_t.

#include "kagg/aggregation.hpp"
#include "kagg/errors.hpp"

#include <fmt/format.h>

namespace kagg::aggregation {

namespace {

/// Checks that every component of the aggregation agrees on (n, k).
Aggregation validated(Aggregation aggregation) {
    const Index k = aggregation.step_matrix.rows();
    if (k == 0 || aggregation.original_size() == 0) {
        throw DimensionError("aggregation is empty");
    }
    if (aggregation.step_matrix.cols() != k || aggregation.basis.cols() != k) {
        throw DimensionError(fmt::format(
            "aggregation shapes disagree: step matrix {}x{}, basis {}x{}",
            aggregation.step_matrix.rows(), aggregation.step_matrix.cols(),
            aggregation.basis.rows(), aggregation.basis.cols()));
    }
    if (aggregation.initial.size() != k) {
        throw DimensionError(fmt::format(
            "aggregated initial state has length {}, expected {}",
            aggregation.initial.size(), k));
    }
    if (aggregation.stationary && aggregation.stationary->size() != k) {
        throw DimensionError(fmt::format(
            "aggregated stationary state has length {}, expected {}",
            aggregation.stationary->size(), k));
    }
    return aggregation;
}

} // anonymous namespace

AggregationEngine::AggregationEngine(Aggregation aggregation)
    : aggregation_(validated(std::move(aggregation)))
    , buffers_{aggregation_.initial, Vector::Zero(aggregation_.size())}
{}

AggregationEngine::AggregationEngine(const chain::TransitionMatrix& chain,
                                     const Vector& p0,
                                     const sizing::AggregationAlgorithm& algorithm)
    : AggregationEngine(algorithm(chain, p0))
{}

void AggregationEngine::step() noexcept {
    const std::size_t next = current_ ^ 1U;
    buffers_[next].noalias() = aggregation_.step_matrix * buffers_[current_];
    current_ = next;
    ++steps_;
}

void AggregationEngine::disaggregate(Eigen::Ref<Vector> out) const {
    if (out.size() != aggregation_.original_size()) {
        throw DimensionError(fmt::format(
            "disaggregation target has length {}, expected {}",
            out.size(), aggregation_.original_size()));
    }
    out.noalias() = aggregation_.basis * buffers_[current_];
}

} // namespace kagg::aggregation
