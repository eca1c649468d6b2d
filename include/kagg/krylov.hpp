#pragma once

/// @file include/kagg/krylov.hpp
/// @brief Krylov basis construction and stationary estimation.
///
/// # Module: Krylov
///
/// ## Responsibility
/// Provides:
///   - `ArnoldiFactorization` — grows an orthonormal basis A of
///     span{p₀, Fp₀, F²p₀, …} one vector at a time, maintaining Π = AᵀFA
///   - `StationaryEstimator`  — extracts the aggregated stationary
///     distribution π_st from Π via its dominant eigenpair
///   - `commutation_defect` / `stationary_weighted_defect` — the residual
///     |AΠ − FA| and its π_st-weighted L1 mass, the sizing criterion
///
/// ## Arnoldi relation
/// A factorization of size k satisfies
///   F · A_k = A_k · Π_k + r_k · e_kᵀ
/// with A_kᵀ A_k = I_k and A_kᵀ r_k = 0. Π_k is upper Hessenberg and complete
/// (its last column is known); r_k is the pending, unnormalised next vector.
///
/// ## Storage
/// A and Π live in buffers allocated once at construction to `capacity`
/// columns. `basis()` and `rayleigh_quotient()` are prefix views into them;
/// growing the basis never reallocates.
///
/// ## NOT Responsible For
/// - Deciding how large the basis should be (see sizing.hpp)
/// - Stepping distributions (see aggregation.hpp)

#include "kagg/types.hpp"
#include "kagg/constants.hpp"
#include "kagg/chain.hpp"

#include <complex>
#include <optional>
#include <string_view>

namespace kagg::krylov {

// ─── ArnoldiFactorization ─────────────────────────────────────────────────────

/// Outcome of a single `ArnoldiFactorization::expand()` call.
enum class ExpandStatus {
    Expanded,           ///< one basis vector appended
    Breakdown,          ///< residual vanished: the subspace is invariant under F
    CapacityExhausted,  ///< preallocated buffers are full
};

[[nodiscard]] std::string_view to_string(ExpandStatus status) noexcept;

/// Incrementally built Arnoldi factorization of (F, p₀).
///
/// Orthogonalisation is modified Gram-Schmidt followed by one complete
/// re-orthogonalisation pass.
///
/// Holds the chain by const-reference: the chain must outlive the
/// factorization. Not thread-safe.
///
/// # Example
/// ```cpp
/// auto chain = TransitionMatrix::from_row_stochastic(p);
/// ArnoldiFactorization fact(chain, p0, 50);
/// while (fact.size() < 10 && fact.expand() == ExpandStatus::Expanded) {}
/// auto pi = fact.rayleigh_quotient();   // k×k
/// ```
class ArnoldiFactorization {
public:
    /// Seed the factorization with v₁ = p₀ / ‖p₀‖₂ and compute its column of Π.
    ///
    /// # Arguments
    /// * `chain`    — Transition operator (held by const-reference)
    /// * `p0`       — Initial distribution, length n
    /// * `capacity` — Maximum basis size; buffers hold min(capacity, n) columns
    ///
    /// # Errors
    /// - `DimensionError`       if p0.size() != n or capacity < 1
    /// - `DegenerateInputError` if ‖p₀‖₂ = 0 or p₀ has non-finite entries
    ArnoldiFactorization(const chain::TransitionMatrix& chain,
                         const Vector& p0,
                         Index capacity = constants::DEFAULT_SIZE_CAP);

    /// Append one basis vector and the matching column of Π.
    ///
    /// # Returns
    /// - `Expanded`          on success (size() grows by one)
    /// - `Breakdown`         if ‖r_k‖ is numerically zero or k = n; nothing
    ///                       is modified and the current size is final
    /// - `CapacityExhausted` if size() == capacity(); nothing is modified
    [[nodiscard]] ExpandStatus expand();

    /// Current basis size k.
    [[nodiscard]] Index size() const noexcept { return size_; }

    /// Maximum basis size this factorization can reach.
    [[nodiscard]] Index capacity() const noexcept { return basis_.cols(); }

    /// Number of states n.
    [[nodiscard]] Index original_size() const noexcept { return basis_.rows(); }

    /// A_k: n×k view of the orthonormal basis.
    [[nodiscard]] auto basis() const { return basis_.leftCols(size_); }

    /// Π_k = A_kᵀ F A_k: k×k view of the projected operator.
    [[nodiscard]] auto rayleigh_quotient() const {
        return hessenberg_.topLeftCorner(size_, size_);
    }

    /// r_k, the component of F·v_k orthogonal to A_k.
    [[nodiscard]] const Vector& residual() const noexcept { return residual_; }

    /// ‖r_k‖₂.
    [[nodiscard]] double residual_norm() const noexcept { return residual_norm_; }

    /// ‖p₀‖₂, the first entry of π₀.
    [[nodiscard]] double initial_norm() const noexcept { return initial_norm_; }

private:
    /// Compute F·v_j, orthogonalise it against v_0..v_j (two MGS passes) and
    /// store the coefficients in column j of Π and the remainder in r.
    void orthogonalize_column(Index j);

    const chain::TransitionMatrix& chain_;
    DenseMatrix basis_;        ///< n × capacity
    DenseMatrix hessenberg_;   ///< capacity × capacity
    Vector      residual_;
    double      residual_norm_  = 0.0;
    double      residual_scale_ = 0.0;  ///< ‖F·v_k‖₂ before orthogonalisation
    double      initial_norm_   = 0.0;
    Index       size_           = 0;
};

// ─── StationaryEstimator ──────────────────────────────────────────────────────

/// Aggregated stationary distribution and the eigenvalue it belongs to.
struct StationaryEstimate {
    std::complex<double> eigenvalue;  ///< dominant eigenvalue of Π (real here)
    Vector               vector;      ///< π_st, ‖A·π_st‖₁ = 1, Σ(A·π_st) ≥ 0
};

/// Extracts π_st from a projected operator. Stateless.
class StationaryEstimator {
public:
    StationaryEstimator() = delete;

    /// Estimate the aggregated stationary distribution.
    ///
    /// 1. Eigen-decompose Π and select the eigenpair whose eigenvalue
    ///    magnitude is nearest 1 (ties go to the larger real part).
    /// 2. A complex eigenvalue or eigenvector means the pair has not
    ///    converged at this size: return `nullopt`.
    /// 3. Otherwise scale so that ‖A·π_st‖₁ = 1 and Σ(A·π_st) ≥ 0.
    ///
    /// # Arguments
    /// * `step_matrix` — Π, k×k
    /// * `basis`       — A, n×k
    ///
    /// # Returns
    /// - `Some(estimate)` with a real π_st
    /// - `None` if the dominant pair is complex, the solver failed, or the
    ///   lift vanished
    [[nodiscard]] static std::optional<StationaryEstimate>
    estimate(const Eigen::Ref<const DenseMatrix>& step_matrix,
             const Eigen::Ref<const DenseMatrix>& basis);

    /// Index of the eigenvalue whose magnitude is nearest 1; ties (within
    /// EIGENVALUE_TIE_TOLERANCE) are broken by the larger real part.
    /// Returns -1 for an empty input.
    [[nodiscard]] static Index
    dominant_index(const Eigen::Ref<const Eigen::VectorXcd>& eigenvalues) noexcept;
};

// ─── Residual measures ────────────────────────────────────────────────────────

/// Elementwise |AΠ − FA| (n×k): how far Π fails to commute with F through A.
///
/// # Errors
/// `DimensionError` if A is not n×k or Π is not k×k.
[[nodiscard]] DenseMatrix
commutation_defect(const chain::TransitionMatrix& chain,
                   const Eigen::Ref<const DenseMatrix>& basis,
                   const Eigen::Ref<const DenseMatrix>& step_matrix);

/// Σ_i |π[i]| · Σ_j defect(j, i): the stationary-weighted L1 residual.
[[nodiscard]] double
stationary_weighted_defect(const Eigen::Ref<const DenseMatrix>& defect,
                           const Eigen::Ref<const Vector>& pi);

} // namespace kagg::krylov
