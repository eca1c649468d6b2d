#pragma once

/// @file include/kagg/aggregation.hpp
/// @brief Runtime stepping of a frozen aggregation and its error instrumentation.
///
/// # Module: Aggregation
///
/// ## Responsibility
///   - `AggregationEngine`    — evolves π_{t+1} = Π · π_t with two fixed
///                              buffers and a selector flag; no allocation
///                              after construction
///   - `ErrorInstrumentation` — wraps an engine, co-evolves the exact
///                              distribution p_{t+1} = F · p_t and accumulates
///                              the approximation error metrics
///
/// ## Usage
/// ```cpp
/// auto algo = sizing::arnoldi_adaptive(cfg);
/// AggregationEngine engine(chain, p0, algo);
/// for (int t = 0; t < 100000; ++t) engine.step();
///
/// ErrorInstrumentation probe(chain, p0, algo);
/// for (int t = 0; t < 1000; ++t) probe.measure_dynamic_error();
/// fmt::print("{} <= {}\n", probe.dynamic_error(), probe.dynamic_error_bound());
/// ```
///
/// ## Guarantees
/// - `step`, `step_all`, `measure_dynamic_error` never allocate
/// - Instances are for exclusive use by one caller; no internal locking

#include "kagg/types.hpp"
#include "kagg/chain.hpp"
#include "kagg/sizing.hpp"

#include <array>
#include <cstdint>
#include <optional>

namespace kagg::aggregation {

// ─── AggregationEngine ────────────────────────────────────────────────────────

/// Holds a frozen aggregation and the current aggregated distribution π_t.
class AggregationEngine {
public:
    /// Take ownership of a frozen aggregation; π_0 is `aggregation.initial`.
    ///
    /// # Errors
    /// `DimensionError` if the aggregation is empty or Π, A, π₀, π_st
    /// disagree on the size k.
    explicit AggregationEngine(Aggregation aggregation);

    /// Run `algorithm` on (chain, p₀) and hold the result.
    AggregationEngine(const chain::TransitionMatrix& chain,
                      const Vector& p0,
                      const sizing::AggregationAlgorithm& algorithm);

    /// π_{t+1} = Π · π_t into the spare buffer, then swap buffer roles.
    void step() noexcept;

    /// Current aggregated distribution π_t.
    [[nodiscard]] const Vector& state() const noexcept { return buffers_[current_]; }

    /// out = A · π_t (disaggregation into the original state space).
    ///
    /// # Errors
    /// `DimensionError` if `out` does not have length n.
    void disaggregate(Eigen::Ref<Vector> out) const;

    [[nodiscard]] const Aggregation& aggregation() const noexcept { return aggregation_; }

    /// Aggregation size k.
    [[nodiscard]] Index size() const noexcept { return aggregation_.size(); }

    /// Steps taken since construction.
    [[nodiscard]] std::uint64_t steps() const noexcept { return steps_; }

private:
    Aggregation           aggregation_;
    std::array<Vector, 2> buffers_;
    std::size_t           current_ = 0;
    std::uint64_t         steps_   = 0;
};

// ─── ErrorMetrics ─────────────────────────────────────────────────────────────

/// Snapshot of the error measures of an instrumented aggregation.
struct ErrorMetrics {
    double                static_error;               ///< err = ‖|AΠ − FA|‖₁
    std::optional<double> stationary_error;           ///< err_st = ‖p̃_st − F p̃_st‖₁
    std::optional<double> stationary_weighted_error;  ///< err_π_st
    double                dynamic_error;              ///< err_k = ‖A π_k − p_k‖₁
    double                dynamic_error_bound;        ///< err_k_bnd
    std::uint64_t         steps;
};

// ─── ErrorInstrumentation ─────────────────────────────────────────────────────

/// Runs an aggregation and the exact chain in lock-step.
///
/// Derived once at construction from Diff = |AΠ − FA|:
///   - err      = max column sum of Diff
///   - err_st   = ‖p̃_st − F·p̃_st‖₁ with p̃_st = A·π_st
///   - err_π_st = Σ_i |π_st[i]| · colsum(Diff)_i
/// The last two are absent when the aggregation carries no π_st.
///
/// Preconditions on the dynamic measures:
///   - err_k_bnd telescopes from t = 0 and is only a bound for steps taken
///     in order from the initial state
///   - for a per-step err_k trace, call `measure_dynamic_error()` exclusively;
///     `step_all()` advances without measuring
///
/// Holds the chain by const-reference: the chain must outlive this object.
class ErrorInstrumentation {
public:
    /// # Errors
    /// `DimensionError` if p₀ or the aggregation does not match the chain.
    ErrorInstrumentation(const chain::TransitionMatrix& chain,
                         const Vector& p0,
                         Aggregation aggregation);

    /// Run `algorithm` on (chain, p₀) and instrument the result.
    ErrorInstrumentation(const chain::TransitionMatrix& chain,
                         const Vector& p0,
                         const sizing::AggregationAlgorithm& algorithm);

    /// Advance aggregated and exact distributions by one step and add
    /// Σ_i |π_t[i]| · colsum(Diff)_i (π_t = state stepped from) to err_k_bnd.
    void step_all() noexcept;

    /// err_k = ‖A·π_t − p_t‖₁ for the current (pre-step) state, then
    /// `step_all()`.
    void measure_dynamic_error() noexcept;

    [[nodiscard]] const AggregationEngine& engine() const noexcept { return engine_; }

    /// Exact transient distribution p_t.
    [[nodiscard]] const Vector& exact_state() const noexcept { return exact_[current_]; }

    /// Last lift A·π_t computed by `measure_dynamic_error()`.
    [[nodiscard]] const Vector& lifted_state() const noexcept { return lifted_; }

    /// p̃_st = A·π_st, if π_st is available.
    [[nodiscard]] const std::optional<Vector>& lifted_stationary() const noexcept {
        return lifted_stationary_;
    }

    /// Diff = |AΠ − FA|, n×k.
    [[nodiscard]] const DenseMatrix& defect() const noexcept { return defect_; }

    [[nodiscard]] double static_error() const noexcept { return static_error_; }
    [[nodiscard]] std::optional<double> stationary_error() const noexcept {
        return stationary_error_;
    }
    [[nodiscard]] std::optional<double> stationary_weighted_error() const noexcept {
        return stationary_weighted_error_;
    }
    [[nodiscard]] double dynamic_error() const noexcept { return dynamic_error_; }
    [[nodiscard]] double dynamic_error_bound() const noexcept { return dynamic_error_bound_; }

    [[nodiscard]] ErrorMetrics metrics() const noexcept;

private:
    const chain::TransitionMatrix& chain_;
    AggregationEngine              engine_;

    std::array<Vector, 2> exact_;
    std::size_t           current_ = 0;
    Vector                lifted_;

    DenseMatrix           defect_;
    Vector                defect_mass_;  ///< colsum(Diff), length k
    std::optional<Vector> lifted_stationary_;

    double                static_error_ = 0.0;
    std::optional<double> stationary_error_;
    std::optional<double> stationary_weighted_error_;
    double                dynamic_error_       = 0.0;
    double                dynamic_error_bound_ = 0.0;
};

} // namespace kagg::aggregation
