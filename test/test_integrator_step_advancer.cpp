#include <gtest/gtest.h>

#include "integrator/step_advancer.hpp"
#include "integrator/factory.hpp"

#include <Eigen/Dense>

#include <cmath>

using namespace integrator;
using common::EquationVector;

namespace {
// dx/dt = x, solution is x(t) = x0 * e^t
auto exponential_growth(int n) -> EquationVector {
    EquationVector f;
    for (int i = 0; i < n; ++i) {
        f.emplace_back([i](double, const Eigen::VectorXd& y) { return y(i); });
    }
    return f;
}

// Simple harmonic oscillator, state [position, velocity]
// dx/dt = v, dv/dt = -omega^2 * x
auto harmonic_oscillator(double omega) -> EquationVector {
    return {
        [](double, const Eigen::VectorXd& y) { return y(1); },
        [omega](double, const Eigen::VectorXd& y) { return -omega * omega * y(0); }
    };
}
} // namespace

// Test fixture
class StepAdvancerTest : public ::testing::Test {
protected:
    StepAdvancer rk4_ = StepAdvancer(TableauFactory::create(Method::RK4), 0.1);
    StepAdvancer ralston_ = StepAdvancer(TableauFactory::create(Method::RALSTON), 0.1);
};

TEST_F(StepAdvancerTest, AdvancesInstantByStepSize) {
    Eigen::VectorXd y(1);
    y << 1.0;

    auto next = ralston_.advance(exponential_growth(1), 2.5, y);

    EXPECT_DOUBLE_EQ(next.first, 2.6);
}

// For dy/dt = y the two-stage method multiplies y by 1 + h + h^2/2
TEST_F(StepAdvancerTest, RalstonSingleStepGrowthFactor) {
    Eigen::VectorXd y(1);
    y << 1.0;

    auto next = ralston_.advance(exponential_growth(1), 0.0, y);

    EXPECT_NEAR(next.second(0), 1.105, 1e-14);
}

TEST_F(StepAdvancerTest, RK4ExponentialGrowth) {
    Eigen::VectorXd y(1);
    y << 1.0;

    auto next = rk4_.advance(exponential_growth(1), 0.0, y);

    // Analytical solution: x(0.1) = 1.0 * e^0.1 ≈ 1.10517
    EXPECT_NEAR(next.second(0), std::exp(0.1), 1e-6);
}

TEST_F(StepAdvancerTest, RK4ExponentialDecay) {
    EquationVector decay = {
        [](double, const Eigen::VectorXd& y) { return -y(0); }
    };
    Eigen::VectorXd y(1);
    y << 1.0;

    auto next = rk4_.advance(decay, 0.0, y);

    // Analytical solution: x(0.1) = 1.0 * e^(-0.1) ≈ 0.904837
    EXPECT_NEAR(next.second(0), std::exp(-0.1), 1e-6);
}

TEST_F(StepAdvancerTest, ConstantVelocityIsExact) {
    EquationVector constant = {
        [](double, const Eigen::VectorXd&) { return 1.0; }
    };
    Eigen::VectorXd y(1);
    y << 5.0;

    StepAdvancer advancer(TableauFactory::create(Method::RALSTON), 0.5);
    auto next = advancer.advance(constant, 0.0, y);

    // Analytical solution: x(0.5) = 5.0 + 0.5 = 5.5
    EXPECT_NEAR(next.second(0), 5.5, 1e-12);
}

TEST_F(StepAdvancerTest, RK4SimpleHarmonicOscillator) {
    Eigen::VectorXd y(2);
    y << 1.0, 0.0; // Initial position = 1, velocity = 0

    auto next = rk4_.advance(harmonic_oscillator(1.0), 0.0, y);

    // Analytical solution: x(t) = cos(t), v(t) = -sin(t)
    EXPECT_NEAR(next.second(0), std::cos(0.1), 1e-6);
    EXPECT_NEAR(next.second(1), -std::sin(0.1), 1e-6);
}

TEST_F(StepAdvancerTest, MultiDimensionalState) {
    Eigen::VectorXd y(3);
    y << 1.0, 2.0, 3.0;

    auto next = rk4_.advance(exponential_growth(3), 0.0, y);

    double factor = std::exp(0.1);
    ASSERT_EQ(next.second.size(), y.size());
    EXPECT_NEAR(next.second(0), 1.0 * factor, 1e-6);
    EXPECT_NEAR(next.second(1), 2.0 * factor, 1e-6);
    EXPECT_NEAR(next.second(2), 3.0 * factor, 1e-6);
}

TEST_F(StepAdvancerTest, InputsAreNotModified) {
    Eigen::VectorXd y(2);
    y << 1.0, 0.0;
    Eigen::VectorXd copy = y;

    auto next = ralston_.advance(harmonic_oscillator(2.0), 0.0, y);

    EXPECT_EQ(y, copy);
    EXPECT_NE(next.second, y);
}

TEST_F(StepAdvancerTest, WorkspaceReuseGivesIdenticalSteps) {
    Eigen::VectorXd y(2);
    y << 1.0, 0.5;
    auto f = harmonic_oscillator(3.0);

    StageWorkspace workspace;
    auto first = rk4_.advance(f, 0.0, y, workspace);
    auto second = rk4_.advance(f, 0.0, y, workspace);
    auto fresh = rk4_.advance(f, 0.0, y);

    EXPECT_EQ(first.second, second.second);
    EXPECT_EQ(first.second, fresh.second);
}
