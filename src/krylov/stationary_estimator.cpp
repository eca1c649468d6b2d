/// @file src/krylov/stationary_estimator.cpp
/// @brief Dominant-eigenpair extraction of the aggregated stationary vector.

#include "kagg/krylov.hpp"
#include "kagg/errors.hpp"

#include <Eigen/Eigenvalues>
#include <fmt/format.h>

#include <cmath>

namespace kagg::krylov {

// ─── dominant_index ───────────────────────────────────────────────────────────

Index StationaryEstimator::dominant_index(
    const Eigen::Ref<const Eigen::VectorXcd>& eigenvalues) noexcept
{
    Index  best          = -1;
    double best_distance = 0.0;

    for (Index i = 0; i < eigenvalues.size(); ++i) {
        const double distance = std::abs(std::abs(eigenvalues(i)) - 1.0);
        if (best < 0 ||
            distance < best_distance - constants::EIGENVALUE_TIE_TOLERANCE) {
            best          = i;
            best_distance = distance;
        } else if (std::abs(distance - best_distance) <= constants::EIGENVALUE_TIE_TOLERANCE &&
                   eigenvalues(i).real() > eigenvalues(best).real()) {
            best          = i;
            best_distance = std::min(distance, best_distance);
        }
    }
    return best;
}

// ─── estimate ─────────────────────────────────────────────────────────────────

std::optional<StationaryEstimate>
StationaryEstimator::estimate(const Eigen::Ref<const DenseMatrix>& step_matrix,
                              const Eigen::Ref<const DenseMatrix>& basis)
{
    if (step_matrix.rows() == 0 ||
        step_matrix.rows() != step_matrix.cols() ||
        basis.cols() != step_matrix.rows()) {
        return std::nullopt;
    }

    Eigen::EigenSolver<DenseMatrix> solver(step_matrix, /*computeEigenvectors=*/true);
    if (solver.info() != Eigen::Success) {
        return std::nullopt;
    }

    const Index dominant = dominant_index(solver.eigenvalues());
    const std::complex<double> lambda = solver.eigenvalues()(dominant);
    const Eigen::VectorXcd eigenvector = solver.eigenvectors().col(dominant);

    // A complex pair has not converged to the (real) stationary direction.
    if (lambda.imag() != 0.0 || !eigenvector.imag().isZero(0.0)) {
        return std::nullopt;
    }

    Vector pi = eigenvector.real();
    const Vector lifted = basis * pi;
    const double mass   = lifted.lpNorm<1>();
    if (!std::isfinite(mass) || mass == 0.0) {
        return std::nullopt;
    }

    // Eigenvectors carry an arbitrary sign; orient the lift as a distribution.
    const double sign = lifted.sum() < 0.0 ? -1.0 : 1.0;
    pi *= sign / mass;

    return StationaryEstimate{lambda, std::move(pi)};
}

// ─── Residual measures ────────────────────────────────────────────────────────

DenseMatrix commutation_defect(const chain::TransitionMatrix& chain,
                               const Eigen::Ref<const DenseMatrix>& basis,
                               const Eigen::Ref<const DenseMatrix>& step_matrix)
{
    if (basis.rows() != chain.size() ||
        basis.cols() != step_matrix.rows() ||
        step_matrix.rows() != step_matrix.cols()) {
        throw DimensionError(fmt::format(
            "basis {}x{} and step matrix {}x{} do not fit a {}-state chain",
            basis.rows(), basis.cols(), step_matrix.rows(), step_matrix.cols(),
            chain.size()));
    }

    DenseMatrix defect = basis * step_matrix;
    defect.noalias() -= chain.forward() * basis;
    return defect.cwiseAbs();
}

double stationary_weighted_defect(const Eigen::Ref<const DenseMatrix>& defect,
                                  const Eigen::Ref<const Vector>& pi)
{
    return pi.cwiseAbs().dot(defect.colwise().sum().transpose());
}

} // namespace kagg::krylov
