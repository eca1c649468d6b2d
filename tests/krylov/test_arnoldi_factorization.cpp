/// @file tests/krylov/test_arnoldi_factorization.cpp
/// @brief Tests for ArnoldiFactorization: basis growth, the Arnoldi relation,
///        breakdown and capacity handling.

#include "kagg/krylov.hpp"
#include "kagg/errors.hpp"
#include "support/test_chains.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace kagg;
using namespace kagg::krylov;

namespace {

/// Grow `fact` to `k` vectors; returns the status that stopped growth.
ExpandStatus grow_to(ArnoldiFactorization& fact, Index k) {
    ExpandStatus status = ExpandStatus::Expanded;
    while (fact.size() < k && (status = fact.expand()) == ExpandStatus::Expanded) {
    }
    return status;
}

} // anonymous namespace

// ─── Seed ─────────────────────────────────────────────────────────────────────

TEST(ArnoldiSeed, FirstVectorIsNormalisedInitialDistribution) {
    const auto chain = fixtures::birth_death_chain(12);
    const Vector p0  = fixtures::random_distribution(12, 5);
    ArnoldiFactorization fact(chain, p0, 8);

    EXPECT_EQ(fact.size(), 1);
    EXPECT_NEAR(fact.initial_norm(), p0.norm(), 1e-15);
    EXPECT_TRUE(fact.basis().col(0).isApprox(p0 / p0.norm()));
}

TEST(ArnoldiSeed, TwoStateScenarioFirstStepMatrix) {
    const auto chain = fixtures::two_state_chain();
    ArnoldiFactorization fact(chain, fixtures::point_mass(2, 0));

    ASSERT_EQ(fact.rayleigh_quotient().rows(), 1);
    EXPECT_NEAR(fact.rayleigh_quotient()(0, 0), 0.9, 1e-15);
    EXPECT_NEAR(fact.residual_norm(), 0.1, 1e-15);
    EXPECT_DOUBLE_EQ(fact.initial_norm(), 1.0);
}

TEST(ArnoldiSeed, TwoStateScenarioFullBasisIsIdentity) {
    const auto chain = fixtures::two_state_chain();
    ArnoldiFactorization fact(chain, fixtures::point_mass(2, 0));
    ASSERT_EQ(fact.expand(), ExpandStatus::Expanded);

    EXPECT_TRUE(DenseMatrix(fact.basis()).isApprox(DenseMatrix::Identity(2, 2)));
    EXPECT_TRUE(DenseMatrix(fact.rayleigh_quotient()).isApprox(DenseMatrix(chain.forward())));
}

// ─── Structure ────────────────────────────────────────────────────────────────

TEST(ArnoldiStructure, BasisIsOrthonormal) {
    const auto chain = fixtures::birth_death_chain(40);
    ArnoldiFactorization fact(chain, fixtures::random_distribution(40, 7), 20);
    ASSERT_EQ(grow_to(fact, 15), ExpandStatus::Expanded);
    ASSERT_EQ(fact.size(), 15);

    const DenseMatrix gram = fact.basis().transpose() * fact.basis();
    EXPECT_LT((gram - DenseMatrix::Identity(15, 15)).cwiseAbs().maxCoeff(), 1e-12);
}

TEST(ArnoldiStructure, StepMatrixIsProjectedOperator) {
    const auto chain = fixtures::random_chain(25, 2);
    ArnoldiFactorization fact(chain, fixtures::random_distribution(25, 3), 10);
    ASSERT_EQ(grow_to(fact, 6), ExpandStatus::Expanded);

    const DenseMatrix a = fact.basis();
    const DenseMatrix projected = a.transpose() * (chain.forward() * a);
    EXPECT_LT((projected - DenseMatrix(fact.rayleigh_quotient())).cwiseAbs().maxCoeff(), 1e-12);
}

TEST(ArnoldiStructure, ArnoldiRelationHolds) {
    const auto chain = fixtures::birth_death_chain(30);
    ArnoldiFactorization fact(chain, fixtures::random_distribution(30, 9), 12);
    ASSERT_EQ(grow_to(fact, 8), ExpandStatus::Expanded);

    const Index k = fact.size();
    const DenseMatrix a = fact.basis();
    DenseMatrix lhs = chain.forward() * a;
    DenseMatrix rhs = a * fact.rayleigh_quotient();
    rhs.col(k - 1) += fact.residual();

    EXPECT_LT((lhs - rhs).cwiseAbs().maxCoeff(), 1e-12);
    EXPECT_LT((a.transpose() * fact.residual()).cwiseAbs().maxCoeff(), 1e-12);
}

TEST(ArnoldiStructure, StepMatrixIsUpperHessenberg) {
    const auto chain = fixtures::random_chain(20, 4);
    ArnoldiFactorization fact(chain, fixtures::random_distribution(20, 1), 8);
    ASSERT_EQ(grow_to(fact, 6), ExpandStatus::Expanded);

    const DenseMatrix pi = fact.rayleigh_quotient();
    for (Index j = 0; j < pi.cols(); ++j) {
        for (Index i = j + 2; i < pi.rows(); ++i) {
            EXPECT_EQ(pi(i, j), 0.0) << "entry (" << i << ", " << j << ")";
        }
    }
}

TEST(ArnoldiStructure, InitialDistributionProjectsOntoFirstAxis) {
    const auto chain = fixtures::random_chain(15, 8);
    const Vector p0  = fixtures::random_distribution(15, 6);
    ArnoldiFactorization fact(chain, p0, 6);
    ASSERT_EQ(grow_to(fact, 5), ExpandStatus::Expanded);

    const Vector projected = fact.basis().transpose() * p0;
    EXPECT_NEAR(projected(0), p0.norm(), 1e-12);
    EXPECT_LT(projected.tail(4).cwiseAbs().maxCoeff(), 1e-12);
}

// ─── Termination ──────────────────────────────────────────────────────────────

TEST(ArnoldiTermination, AbsorbingInitialStateBreaksDownImmediately) {
    const auto chain = fixtures::absorbing_chain(6);
    ArnoldiFactorization fact(chain, fixtures::point_mass(6, 0));

    EXPECT_EQ(fact.expand(), ExpandStatus::Breakdown);
    EXPECT_EQ(fact.size(), 1);
    EXPECT_NEAR(fact.rayleigh_quotient()(0, 0), 1.0, 1e-15);
}

TEST(ArnoldiTermination, BreaksDownAtFullDimension) {
    const auto chain = fixtures::two_state_chain();
    ArnoldiFactorization fact(chain, fixtures::point_mass(2, 0));
    ASSERT_EQ(fact.expand(), ExpandStatus::Expanded);

    EXPECT_EQ(fact.expand(), ExpandStatus::Breakdown);
    EXPECT_EQ(fact.size(), 2);
}

TEST(ArnoldiTermination, CapacityExhaustedLeavesStateUnchanged) {
    const auto chain = fixtures::birth_death_chain(20);
    ArnoldiFactorization fact(chain, fixtures::random_distribution(20, 2), 3);
    ASSERT_EQ(grow_to(fact, 3), ExpandStatus::Expanded);

    const DenseMatrix before = fact.rayleigh_quotient();
    EXPECT_EQ(fact.expand(), ExpandStatus::CapacityExhausted);
    EXPECT_EQ(fact.size(), 3);
    EXPECT_TRUE(DenseMatrix(fact.rayleigh_quotient()).isApprox(before));
}

TEST(ArnoldiTermination, CapacityIsClampedToStateCount) {
    const auto chain = fixtures::birth_death_chain(5);
    ArnoldiFactorization fact(chain, fixtures::random_distribution(5, 1), 100);
    EXPECT_EQ(fact.capacity(), 5);
    EXPECT_EQ(fact.original_size(), 5);
}

TEST(ArnoldiTermination, StatusNames) {
    EXPECT_EQ(to_string(ExpandStatus::Expanded), "expanded");
    EXPECT_EQ(to_string(ExpandStatus::Breakdown), "breakdown");
    EXPECT_EQ(to_string(ExpandStatus::CapacityExhausted), "capacity-exhausted");
}

// ─── Input validation ─────────────────────────────────────────────────────────

TEST(ArnoldiValidation, RejectsLengthMismatch) {
    const auto chain = fixtures::two_state_chain();
    EXPECT_THROW((void)ArnoldiFactorization(chain, Vector::Ones(3)), DimensionError);
}

TEST(ArnoldiValidation, RejectsZeroCapacity) {
    const auto chain = fixtures::two_state_chain();
    EXPECT_THROW((void)ArnoldiFactorization(chain, Vector::Ones(2), 0), DimensionError);
}

TEST(ArnoldiValidation, RejectsZeroInitialDistribution) {
    const auto chain = fixtures::two_state_chain();
    EXPECT_THROW((void)ArnoldiFactorization(chain, Vector::Zero(2)), DegenerateInputError);
}

TEST(ArnoldiValidation, RejectsNonFiniteInitialDistribution) {
    const auto chain = fixtures::two_state_chain();
    Vector p0(2);
    p0 << std::numeric_limits<double>::infinity(), 0.0;
    EXPECT_THROW((void)ArnoldiFactorization(chain, p0), DegenerateInputError);
}
