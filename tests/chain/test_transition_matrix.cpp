/// @file tests/chain/test_transition_matrix.cpp
/// @brief Tests for TransitionMatrix construction, orientation and queries.

#include "kagg/chain.hpp"
#include "kagg/errors.hpp"
#include "support/test_chains.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <vector>

using namespace kagg;
using namespace kagg::chain;

// ─── Orientation ──────────────────────────────────────────────────────────────

TEST(TransitionMatrixConvention, RowStochasticIsStoredTransposed) {
    DenseMatrix p(2, 2);
    p << 0.9, 0.1,
         0.5, 0.5;
    const auto chain = TransitionMatrix::from_row_stochastic(p);

    EXPECT_TRUE(DenseMatrix(chain.forward()).isApprox(p.transpose()));
    EXPECT_DOUBLE_EQ(chain.probability(0, 1), 0.1);
    EXPECT_DOUBLE_EQ(chain.probability(1, 0), 0.5);
}

TEST(TransitionMatrixConvention, ApplyEvolvesDistributionForward) {
    const auto chain = fixtures::two_state_chain();
    const Vector p0  = fixtures::point_mass(2, 0);
    Vector p1(2);
    chain.apply(p0, p1);

    EXPECT_NEAR(p1(0), 0.9, 1e-15);
    EXPECT_NEAR(p1(1), 0.1, 1e-15);
}

TEST(TransitionMatrixConvention, ApplyPreservesProbabilityMass) {
    const auto chain = fixtures::random_chain(20, 3);
    const Vector p0  = fixtures::random_distribution(20, 4);
    Vector p1(20);
    chain.apply(p0, p1);

    EXPECT_NEAR(p1.sum(), 1.0, 1e-12);
    EXPECT_GE(p1.minCoeff(), 0.0);
}

TEST(TransitionMatrixConvention, SparseAndDenseFactoriesAgree) {
    const DenseMatrix p = fixtures::random_row_stochastic(6, 11);
    const auto dense  = TransitionMatrix::from_row_stochastic(p);
    const auto sparse = TransitionMatrix::from_row_stochastic(SparseMatrix(p.sparseView()));

    EXPECT_TRUE(DenseMatrix(dense.forward()).isApprox(DenseMatrix(sparse.forward())));
}

// ─── Validation ───────────────────────────────────────────────────────────────

TEST(TransitionMatrixValidation, RejectsNonSquare) {
    EXPECT_THROW((void)TransitionMatrix::from_forward_operator(SparseMatrix(2, 3)), DimensionError);
}

TEST(TransitionMatrixValidation, RejectsEmpty) {
    EXPECT_THROW((void)TransitionMatrix::from_forward_operator(SparseMatrix(0, 0)), DimensionError);
}

TEST(TransitionMatrixValidation, RejectsNegativeProbability) {
    DenseMatrix p(2, 2);
    p << 1.2, -0.2,
         0.5,  0.5;
    EXPECT_THROW((void)TransitionMatrix::from_row_stochastic(p), DegenerateInputError);
}

TEST(TransitionMatrixValidation, RejectsNonFiniteProbability) {
    DenseMatrix p(2, 2);
    p << std::numeric_limits<double>::quiet_NaN(), 0.5,
         0.5, 0.5;
    EXPECT_THROW((void)TransitionMatrix::from_row_stochastic(p), DegenerateInputError);
}

TEST(TransitionMatrixValidation, ErrorsShareCommonBase) {
    EXPECT_THROW((void)TransitionMatrix::from_forward_operator(SparseMatrix(2, 3)), AggregationError);
}

TEST(TransitionMatrixValidation, ExplicitZerosArePruned) {
    std::vector<Eigen::Triplet<double>> triplets{{0, 0, 1.0}, {1, 0, 0.0}, {1, 1, 1.0}};
    SparseMatrix f(2, 2);
    f.setFromTriplets(triplets.begin(), triplets.end());

    const auto chain = TransitionMatrix::from_forward_operator(f);
    EXPECT_EQ(chain.transitions(), 2);
}

TEST(TransitionMatrixApply, RejectsLengthMismatch) {
    const auto chain = fixtures::two_state_chain();
    Vector p(3);
    Vector out(2);
    EXPECT_THROW(chain.apply(p, out), DimensionError);

    Vector p2(2);
    Vector out3(3);
    EXPECT_THROW(chain.apply(p2, out3), DimensionError);
}

// ─── Stochasticity ────────────────────────────────────────────────────────────

TEST(TransitionMatrixStochastic, ScenarioChainsAreStochastic) {
    EXPECT_NEAR(fixtures::two_state_chain().stochastic_defect(), 0.0, 1e-15);
    EXPECT_NEAR(fixtures::absorbing_chain(5).stochastic_defect(), 0.0, 1e-15);
    EXPECT_NEAR(fixtures::birth_death_chain(10).stochastic_defect(), 0.0, 1e-15);
    EXPECT_TRUE(fixtures::random_chain(15, 1).is_stochastic());
}

TEST(TransitionMatrixStochastic, ReportsMissingMass) {
    DenseMatrix p(2, 2);
    p << 0.5, 0.2,
         0.5, 0.5;
    const auto chain = TransitionMatrix::from_row_stochastic(p);
    EXPECT_NEAR(chain.stochastic_defect(), 0.3, 1e-15);
    EXPECT_FALSE(chain.is_stochastic());
    EXPECT_TRUE(chain.is_stochastic(0.5));
}

TEST(TransitionMatrixQueries, SizeAndTransitions) {
    const auto chain = fixtures::birth_death_chain(4);
    EXPECT_EQ(chain.size(), 4);
    // 4 self-loops + 3 up + 3 down
    EXPECT_EQ(chain.transitions(), 10);
}
