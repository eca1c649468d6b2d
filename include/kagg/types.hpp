#pragma once

/// @file include/kagg/types.hpp
/// @brief Shared value types for the Krylov aggregation (kagg) library.
///
/// Every module includes this file. It defines the Eigen-based linear-algebra
/// aliases and the frozen `Aggregation` bundle that flows from the sizing
/// stage into the runtime engine.

#include <Eigen/Dense>
#include <Eigen/Sparse>

#include <optional>

namespace kagg {

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Index type for every dimension in the library (states, basis size).
using Index = Eigen::Index;

/// Dense column vector: distributions in either the full or aggregated space.
using Vector = Eigen::VectorXd;

/// Dense matrix: the Krylov basis A (n×k) and the aggregated operator Π (k×k).
using DenseMatrix = Eigen::MatrixXd;

/// Sparse storage for the n×n transition operator.
using SparseMatrix = Eigen::SparseMatrix<double>;

// ─── Aggregation ──────────────────────────────────────────────────────────────

/// A frozen aggregation of size k for a chain with n states.
///
/// Produced once by an aggregation algorithm and immutable afterwards.
///   - `basis`       — A, n×k, orthonormal columns (disaggregation matrix)
///   - `step_matrix` — Π = AᵀFA, k×k
///   - `stationary`  — π_st with ‖A·π_st‖₁ = 1; absent if not estimated or
///                     the dominant eigenpair was complex
///   - `initial`     — π₀ = [‖p₀‖₂, 0, …, 0]
struct Aggregation {
    DenseMatrix           basis;
    DenseMatrix           step_matrix;
    std::optional<Vector> stationary;
    Vector                initial;

    /// Aggregation size k.
    [[nodiscard]] Index size() const noexcept { return step_matrix.rows(); }

    /// Number of states n of the original chain.
    [[nodiscard]] Index original_size() const noexcept { return basis.rows(); }
};

} // namespace kagg
