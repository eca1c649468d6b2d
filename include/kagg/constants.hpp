#pragma once

#include <Eigen/Core>

/// @file include/kagg/constants.hpp
/// @brief Numerical tolerances and sizing defaults for kagg.

namespace kagg::constants {

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Relative residual below which the Krylov subspace counts as saturated:
/// ‖r_k‖₂ ≤ BREAKDOWN_TOLERANCE · ‖F·v_k‖₂.
static constexpr double BREAKDOWN_TOLERANCE = 1e-12;

/// Two eigenvalue distances to the unit circle closer than this are a tie.
static constexpr double EIGENVALUE_TIE_TOLERANCE = 1e-12;

/// Maximum column-sum deviation still reported as stochastic.
static constexpr double STOCHASTIC_TOLERANCE = 1e-9;

// ─── Sizing Defaults ──────────────────────────────────────────────────────────

/// Default convergence tolerance ε for the stationary-weighted residual.
static constexpr double DEFAULT_TOLERANCE = 1e-12;

/// Largest aggregation the selector will build. Buffers are preallocated to
/// this many basis vectors; raise it for chains that need larger aggregations.
static constexpr Eigen::Index DEFAULT_SIZE_CAP = 2000;

/// Default checkpoint schedule: 1, 11, 21, …, 1001.
static constexpr Eigen::Index DEFAULT_SCHEDULE_FIRST  = 1;
static constexpr Eigen::Index DEFAULT_SCHEDULE_STRIDE = 10;
static constexpr Eigen::Index DEFAULT_SCHEDULE_COUNT  = 101;

// ─── Experiment Defaults ──────────────────────────────────────────────────────

/// Transient steps taken by the CLI driver.
static constexpr long DEFAULT_STEPS = 100000;

/// Seed for the CLI's random initial distribution.
static constexpr unsigned long DEFAULT_SEED = 42;

} // namespace kagg::constants
