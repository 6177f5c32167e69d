#include <gtest/gtest.h>

#include "integrator/butcher_tableau.hpp"
#include "common/errors.hpp"

#include <Eigen/Dense>

#include <limits>
#include <vector>

using namespace integrator;
using common::ConfigurationError;

using Rows = std::vector<std::vector<double>>;
using Weights = std::vector<double>;

// Test fixture
class ButcherTableauTest : public ::testing::Test {
protected:
    // Two-stage method a = [[0, 0], [2/3, 0]], b = [1/4, 3/4]
    Rows ralston_a_ = {{0.0, 0.0}, {2.0 / 3.0, 0.0}};
    Weights ralston_b_ = {0.25, 0.75};
};

TEST_F(ButcherTableauTest, StoresCoefficients) {
    ButcherTableau tableau(2, ralston_a_, ralston_b_);

    EXPECT_EQ(tableau.stages(), 2);
    EXPECT_DOUBLE_EQ(tableau.a()(1, 0), 2.0 / 3.0);
    EXPECT_DOUBLE_EQ(tableau.a()(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(tableau.b()(0), 0.25);
    EXPECT_DOUBLE_EQ(tableau.b()(1), 0.75);
}

TEST_F(ButcherTableauTest, AbscissasAreRowSums) {
    Rows a = {
        {0.0, 0.0, 0.0},
        {0.5, 0.0, 0.0},
        {-1.0, 2.0, 0.0}
    };
    Weights b = {1.0 / 6.0, 2.0 / 3.0, 1.0 / 6.0};
    ButcherTableau tableau(3, a, b);

    ASSERT_EQ(tableau.c().size(), 3);
    EXPECT_DOUBLE_EQ(tableau.c()(0), 0.0);
    EXPECT_DOUBLE_EQ(tableau.c()(1), 0.5);
    EXPECT_DOUBLE_EQ(tableau.c()(2), 1.0);
}

TEST_F(ButcherTableauTest, EigenConstructorMatchesNestedRows) {
    Eigen::MatrixXd a(2, 2);
    a << 0.0, 0.0,
         2.0 / 3.0, 0.0;
    Eigen::VectorXd b(2);
    b << 0.25, 0.75;

    ButcherTableau from_eigen(2, a, b);
    ButcherTableau from_rows(2, ralston_a_, ralston_b_);

    EXPECT_TRUE(from_eigen.a().isApprox(from_rows.a()));
    EXPECT_TRUE(from_eigen.b().isApprox(from_rows.b()));
    EXPECT_TRUE(from_eigen.c().isApprox(from_rows.c()));
}

TEST_F(ButcherTableauTest, RejectsNonPositiveStageCount) {
    Rows a;
    Weights b;
    EXPECT_THROW(ButcherTableau(0, a, b), ConfigurationError);
}

TEST_F(ButcherTableauTest, RejectsWeightCountMismatch) {
    Weights b = {1.0};
    EXPECT_THROW(ButcherTableau(2, ralston_a_, b), ConfigurationError);
}

TEST_F(ButcherTableauTest, RejectsRowCountMismatch) {
    Rows a = {{0.0, 0.0}};
    EXPECT_THROW(ButcherTableau(2, a, ralston_b_), ConfigurationError);
}

TEST_F(ButcherTableauTest, RejectsShortRow) {
    Rows a = {{0.0, 0.0}, {2.0 / 3.0}};
    EXPECT_THROW(ButcherTableau(2, a, ralston_b_), ConfigurationError);
}

TEST_F(ButcherTableauTest, RejectsNonSquareEigenMatrix) {
    Eigen::MatrixXd a = Eigen::MatrixXd::Zero(2, 3);
    Eigen::VectorXd b = Eigen::VectorXd::Constant(2, 0.5);
    EXPECT_THROW(ButcherTableau(2, a, b), ConfigurationError);
}

// Explicit methods need a strictly lower-triangular coupling matrix
TEST_F(ButcherTableauTest, RejectsNonzeroDiagonal) {
    Rows a = {{0.5, 0.0}, {2.0 / 3.0, 0.0}};
    EXPECT_THROW(ButcherTableau(2, a, ralston_b_), ConfigurationError);
}

TEST_F(ButcherTableauTest, RejectsNonzeroUpperEntry) {
    Rows a = {{0.0, 0.1}, {2.0 / 3.0, 0.0}};
    EXPECT_THROW(ButcherTableau(2, a, ralston_b_), ConfigurationError);
}

TEST_F(ButcherTableauTest, RejectsImplicitEigenMatrix) {
    Eigen::MatrixXd a(2, 2);
    a << 0.25, 0.0,
         0.5, 0.25;
    Eigen::VectorXd b = Eigen::VectorXd::Constant(2, 0.5);
    EXPECT_THROW(ButcherTableau(2, a, b), ConfigurationError);
}

TEST_F(ButcherTableauTest, RejectsNonFiniteCoefficients) {
    Rows a = {{0.0, 0.0}, {std::numeric_limits<double>::quiet_NaN(), 0.0}};
    EXPECT_THROW(ButcherTableau(2, a, ralston_b_), ConfigurationError);
}

TEST_F(ButcherTableauTest, WeightConsistency) {
    ButcherTableau consistent(2, ralston_a_, ralston_b_);
    EXPECT_TRUE(consistent.weights_consistent());

    // Not enforced, only reported
    Weights b = {0.5, 0.75};
    ButcherTableau inconsistent(2, ralston_a_, b);
    EXPECT_FALSE(inconsistent.weights_consistent());
}
