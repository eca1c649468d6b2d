/// @file src/sizing/adaptive_size_selector.cpp
/// @brief Checkpointed growth of one Arnoldi factorization until the
///        stationary-weighted residual drops below ε.

#include "kagg/sizing.hpp"
#include "kagg/krylov.hpp"
#include "kagg/errors.hpp"

#include <fmt/format.h>

namespace kagg::sizing {

// ─── Names ────────────────────────────────────────────────────────────────────

std::string_view to_string(CheckpointStatus status) noexcept {
    switch (status) {
        case CheckpointStatus::Accepted:       return "accepted";
        case CheckpointStatus::AboveTolerance: return "above-tolerance";
        case CheckpointStatus::NotConverged:   return "not-converged";
    }
    return "unknown";
}

std::string_view to_string(SizingOutcome outcome) noexcept {
    switch (outcome) {
        case SizingOutcome::Converged:         return "converged";
        case SizingOutcome::ScheduleExhausted: return "schedule-exhausted";
        case SizingOutcome::SubspaceSaturated: return "subspace-saturated";
    }
    return "unknown";
}

// ─── SizingConfig ─────────────────────────────────────────────────────────────

std::vector<Index> SizingConfig::linear_schedule(Index first, Index stride, Index count) {
    if (first < 1 || stride < 1 || count < 1) {
        throw ScheduleError(fmt::format(
            "linear schedule needs first >= 1, stride >= 1, count >= 1 "
            "(got {}, {}, {})", first, stride, count));
    }

    std::vector<Index> sizes;
    sizes.reserve(static_cast<std::size_t>(count));
    for (Index i = 0; i < count; ++i) {
        sizes.push_back(first + i * stride);
    }
    return sizes;
}

void SizingConfig::validate() const {
    if (!(tolerance > 0.0)) {
        throw ScheduleError(fmt::format("tolerance must be positive, got {}", tolerance));
    }
    if (checkpoints.empty()) {
        throw ScheduleError("checkpoint schedule is empty");
    }
    if (checkpoints.front() < 1) {
        throw ScheduleError(fmt::format(
            "checkpoints must be at least 1, got {}", checkpoints.front()));
    }
    for (std::size_t i = 1; i < checkpoints.size(); ++i) {
        if (checkpoints[i] <= checkpoints[i - 1]) {
            throw ScheduleError(fmt::format(
                "checkpoints must be strictly ascending: {} follows {}",
                checkpoints[i], checkpoints[i - 1]));
        }
    }
    if (size_cap <= checkpoints.back()) {
        throw ScheduleError(fmt::format(
            "size cap {} must exceed the largest checkpoint {}",
            size_cap, checkpoints.back()));
    }
}

// ─── AdaptiveSizeSelector ─────────────────────────────────────────────────────

AdaptiveSizeSelector::AdaptiveSizeSelector(SizingConfig config)
    : config_(std::move(config))
{
    config_.validate();
}

SizingResult AdaptiveSizeSelector::select(const chain::TransitionMatrix& chain,
                                          const Vector& p0) const {
    // One factorization for the whole search; its buffers are sized to the cap
    // once and every checkpoint works on a prefix of them.
    krylov::ArnoldiFactorization factorization(chain, p0, config_.size_cap);

    std::vector<CheckpointRecord>             trace;
    std::optional<krylov::StationaryEstimate> estimate;
    std::optional<double>                     criterion;
    SizingOutcome outcome   = SizingOutcome::ScheduleExhausted;
    bool          saturated = false;
    Index         evaluated = 0;

    for (const Index target : config_.checkpoints) {
        // ── Grow to the checkpoint ───────────────────────────────────────────
        while (factorization.size() < target) {
            if (factorization.expand() != krylov::ExpandStatus::Expanded) {
                saturated = true;
                break;
            }
        }
        if (factorization.size() == evaluated) {
            break;  // saturated below this checkpoint; size already measured
        }
        evaluated = factorization.size();

        // ── Measure ──────────────────────────────────────────────────────────
        const auto basis       = factorization.basis();
        const auto step_matrix = factorization.rayleigh_quotient();

        CheckpointRecord record{evaluated, CheckpointStatus::NotConverged,
                                std::nullopt, std::nullopt};
        criterion.reset();

        estimate = krylov::StationaryEstimator::estimate(step_matrix, basis);
        if (estimate) {
            criterion = krylov::stationary_weighted_defect(
                krylov::commutation_defect(chain, basis, step_matrix),
                estimate->vector);
            record.eigenvalue = estimate->eigenvalue;
            record.criterion  = criterion;
            record.status     = (*criterion <= config_.tolerance)
                                    ? CheckpointStatus::Accepted
                                    : CheckpointStatus::AboveTolerance;
        }
        trace.push_back(record);

        if (record.status == CheckpointStatus::Accepted) {
            outcome = SizingOutcome::Converged;
            break;
        }
        if (saturated) {
            break;
        }
    }

    if (saturated && outcome != SizingOutcome::Converged) {
        outcome = SizingOutcome::SubspaceSaturated;
    }

    // ── Freeze ───────────────────────────────────────────────────────────────
    const Index size = factorization.size();
    Aggregation aggregation{
        .basis       = factorization.basis(),
        .step_matrix = factorization.rayleigh_quotient(),
        .stationary  = estimate ? std::optional<Vector>(std::move(estimate->vector))
                                : std::nullopt,
        .initial     = aggregated_initial(factorization.initial_norm(), size),
    };

    return SizingResult{
        .aggregation = std::move(aggregation),
        .outcome     = outcome,
        .criterion   = criterion,
        .trace       = std::move(trace),
    };
}

} // namespace kagg::sizing
