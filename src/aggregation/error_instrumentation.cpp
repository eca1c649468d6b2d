/// @file src/aggregation/error_instrumentation.cpp
/// @brief Exact-vs-aggregated co-evolution and the static / dynamic error measures.
///
/// Bound used by `step_all`:
///   e_t = A π_t − p_t  satisfies  e_{t+1} = (AΠ − FA) π_t + F e_t,  e_0 = 0.
/// F is a 1-norm contraction, so
///   ‖e_t‖₁ ≤ Σ_{s<t} ‖|AΠ − FA| · |π_s|‖₁ = Σ_{s<t} Σ_i |π_s[i]| colsum(Diff)_i.

#include "kagg/aggregation.hpp"
#include "kagg/krylov.hpp"
#include "kagg/errors.hpp"

#include <fmt/format.h>

namespace kagg::aggregation {

ErrorInstrumentation::ErrorInstrumentation(const chain::TransitionMatrix& chain,
                                           const Vector& p0,
                                           Aggregation aggregation)
    : chain_(chain)
    , engine_(std::move(aggregation))
{
    const Index n = chain_.size();
    if (p0.size() != n) {
        throw DimensionError(fmt::format(
            "initial distribution has length {}, chain has {} states", p0.size(), n));
    }
    if (engine_.aggregation().original_size() != n) {
        throw DimensionError(fmt::format(
            "aggregation basis has {} rows, chain has {} states",
            engine_.aggregation().original_size(), n));
    }

    const Aggregation& agg = engine_.aggregation();

    exact_   = {p0, Vector::Zero(n)};
    lifted_  = Vector::Zero(n);

    defect_       = krylov::commutation_defect(chain_, agg.basis, agg.step_matrix);
    defect_mass_  = defect_.colwise().sum().transpose();
    static_error_ = defect_mass_.maxCoeff();

    if (agg.stationary) {
        Vector lifted  = agg.basis * *agg.stationary;
        Vector stepped = chain_.forward() * lifted;
        stationary_error_          = (lifted - stepped).lpNorm<1>();
        stationary_weighted_error_ =
            krylov::stationary_weighted_defect(defect_, *agg.stationary);
        lifted_stationary_ = std::move(lifted);
    }
}

ErrorInstrumentation::ErrorInstrumentation(const chain::TransitionMatrix& chain,
                                           const Vector& p0,
                                           const sizing::AggregationAlgorithm& algorithm)
    : ErrorInstrumentation(chain, p0, algorithm(chain, p0))
{}

void ErrorInstrumentation::step_all() noexcept {
    dynamic_error_bound_ += engine_.state().cwiseAbs().dot(defect_mass_);
    engine_.step();

    const std::size_t next = current_ ^ 1U;
    exact_[next].noalias() = chain_.forward() * exact_[current_];
    current_ = next;
}

void ErrorInstrumentation::measure_dynamic_error() noexcept {
    lifted_.noalias() = engine_.aggregation().basis * engine_.state();
    dynamic_error_ = (lifted_ - exact_[current_]).lpNorm<1>();
    step_all();
}

ErrorMetrics ErrorInstrumentation::metrics() const noexcept {
    return ErrorMetrics{
        .static_error              = static_error_,
        .stationary_error          = stationary_error_,
        .stationary_weighted_error = stationary_weighted_error_,
        .dynamic_error             = dynamic_error_,
        .dynamic_error_bound       = dynamic_error_bound_,
        .steps                     = engine_.steps(),
    };
}

} // namespace kagg::aggregation
