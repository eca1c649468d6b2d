#pragma once

/// @file include/kagg/sizing.hpp
/// @brief Aggregation size selection and the aggregation algorithms.
///
/// # Module: Sizing
///
/// ## Responsibility
/// Turn a chain and an initial distribution into a frozen `Aggregation`:
///   - `AdaptiveSizeSelector` — grows one Arnoldi factorization across an
///     ascending checkpoint schedule and stops at the first checkpoint where
///     the stationary-weighted residual
///       criterion(k) = Σ_i |π_st[i]| · Σ_j |(A_kΠ_k − FA_k)[j, i]|
///     is at most ε and π_st is real
///   - `naive_arnoldi`, `arnoldi_with_stationary`, `arnoldi_adaptive` —
///     the interchangeable `AggregationAlgorithm`s
///
/// ## Outcomes
/// Only configuration and input-contract violations throw. A schedule that
/// runs out before meeting ε is not an error: the aggregation at the largest
/// size reached comes back with `SizingOutcome::ScheduleExhausted` (usable but
/// uncertified). Krylov breakdown ends the search at the saturated size.
///
/// ## NOT Responsible For
/// - Refining the size between the last two checkpoints (not implemented)
/// - Stepping the aggregation (see aggregation.hpp)

#include "kagg/types.hpp"
#include "kagg/constants.hpp"
#include "kagg/chain.hpp"

#include <complex>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace kagg::sizing {

// ─── SizingConfig ─────────────────────────────────────────────────────────────

/// Configuration of the adaptive size search.
struct SizingConfig {
    /// Tolerance ε on the stationary-weighted residual. Must be > 0;
    /// +infinity accepts the first checkpoint with a real π_st.
    double tolerance = constants::DEFAULT_TOLERANCE;

    /// Strictly ascending aggregation sizes at which the criterion is measured.
    std::vector<Index> checkpoints = linear_schedule(
        constants::DEFAULT_SCHEDULE_FIRST,
        constants::DEFAULT_SCHEDULE_STRIDE,
        constants::DEFAULT_SCHEDULE_COUNT);

    /// Preallocation bound on the basis size. Must exceed the largest checkpoint.
    Index size_cap = constants::DEFAULT_SIZE_CAP;

    /// `count` sizes first, first + stride, first + 2·stride, …
    [[nodiscard]] static std::vector<Index>
    linear_schedule(Index first, Index stride, Index count);

    /// Throw `ScheduleError` unless the configuration is usable.
    void validate() const;
};

// ─── Results ──────────────────────────────────────────────────────────────────

/// What happened at one evaluated checkpoint.
enum class CheckpointStatus {
    Accepted,        ///< criterion ≤ ε with a real π_st
    AboveTolerance,  ///< real π_st but criterion > ε
    NotConverged,    ///< dominant eigenpair of Π complex; criterion not measured
};

/// How the search ended.
enum class SizingOutcome {
    Converged,          ///< a checkpoint was accepted
    ScheduleExhausted,  ///< every checkpoint evaluated, none accepted
    SubspaceSaturated,  ///< Krylov breakdown before acceptance
};

[[nodiscard]] std::string_view to_string(CheckpointStatus status) noexcept;
[[nodiscard]] std::string_view to_string(SizingOutcome outcome) noexcept;

/// One evaluated checkpoint.
struct CheckpointRecord {
    Index                               size;
    CheckpointStatus                    status;
    std::optional<double>               criterion;   ///< absent if NotConverged
    std::optional<std::complex<double>> eigenvalue;  ///< dominant eigenvalue used
};

/// Result of `AdaptiveSizeSelector::select`.
struct SizingResult {
    Aggregation                   aggregation;
    SizingOutcome                 outcome;
    std::optional<double>         criterion;  ///< at the returned size, if measured
    std::vector<CheckpointRecord> trace;

    /// True iff the returned aggregation met the tolerance.
    [[nodiscard]] bool certified() const noexcept {
        return outcome == SizingOutcome::Converged;
    }
};

// ─── AdaptiveSizeSelector ─────────────────────────────────────────────────────

/// Finds the smallest checkpoint size whose aggregation meets the tolerance,
/// without rebuilding the basis per candidate.
///
/// # Example
/// ```cpp
/// SizingConfig cfg;
/// cfg.tolerance   = 1e-10;
/// cfg.checkpoints = SizingConfig::linear_schedule(1, 5, 40);
/// cfg.size_cap    = 500;
/// auto result = AdaptiveSizeSelector(cfg).select(chain, p0);
/// if (!result.certified()) { /* usable, but ε was not reached */ }
/// ```
class AdaptiveSizeSelector {
public:
    /// # Errors
    /// `ScheduleError` if `config` fails `SizingConfig::validate()`.
    explicit AdaptiveSizeSelector(SizingConfig config = SizingConfig{});

    /// Run the search.
    ///
    /// # Errors
    /// `DimensionError` / `DegenerateInputError` for an unusable p₀.
    [[nodiscard]] SizingResult select(const chain::TransitionMatrix& chain,
                                      const Vector& p0) const;

    [[nodiscard]] const SizingConfig& config() const noexcept { return config_; }

private:
    SizingConfig config_;
};

// ─── Aggregation algorithms ───────────────────────────────────────────────────

/// Maps (chain, p₀) to a frozen aggregation.
using AggregationAlgorithm =
    std::function<Aggregation(const chain::TransitionMatrix&, const Vector&)>;

/// Fixed-size aggregation without a stationary estimate.
/// Stops early at the saturated size on Krylov breakdown.
/// `ScheduleError` if size < 1.
[[nodiscard]] AggregationAlgorithm naive_arnoldi(Index size);

/// Fixed-size aggregation with π_st when the dominant eigenpair is real.
/// `ScheduleError` if size < 1.
[[nodiscard]] AggregationAlgorithm arnoldi_with_stationary(Index size);

/// Adaptive aggregation; the configuration is validated immediately.
[[nodiscard]] AggregationAlgorithm arnoldi_adaptive(SizingConfig config);

/// π₀ = [norm, 0, …, 0] of length `size`.
[[nodiscard]] Vector aggregated_initial(double norm, Index size);

} // namespace kagg::sizing
