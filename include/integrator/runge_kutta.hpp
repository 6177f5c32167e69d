#pragma once

#include "integrator/butcher_tableau.hpp"
#include "integrator/step_advancer.hpp"
#include "common/types.hpp"

#include <Eigen/Dense>

#include <vector>

namespace integrator {

/// @brief Fixed-step explicit Runge-Kutta integrator
///
/// @details Owns an equation system, its initial condition (t0, y0), the step
///          size and the method, and produces the trajectory from t0 to a
///          requested final instant.
///
///          The run stops at the first instant that, rounded to
///          kRoundingDigits decimal places, reaches the final instant. The
///          last record may therefore overshoot tf by at most one step; it
///          never stops before tf. Choose h so that (tf - t0) / h is an
///          integer when an exact endpoint is needed.
///
///          At most ceil((tf - t0) / h) + 1 steps are taken, which assumes
///          t + h advances by about h at every instant of the run.
///
///          No error control is performed. Divergent solutions are returned
///          as computed; validate results with conserved quantities.
class RungeKuttaIntegrator {
public:
    /// @brief Decimal places used when comparing the current instant with tf
    static constexpr int kRoundingDigits = 10;

    /// @brief Constructor
    /// @param f Equation vector (n functions)
    /// @param t0 Initial instant
    /// @param y0 Initial state (n components)
    /// @param h Step size, must be positive
    /// @param stages Number of stages R
    /// @param a R×R coupling coefficients (strictly lower triangular)
    /// @param b R weights
    /// @throws common::ConfigurationError on any invalid argument
    RungeKuttaIntegrator(
        common::EquationVector f,
        double t0,
        Eigen::VectorXd y0,
        double h,
        int stages,
        const std::vector<std::vector<double>>& a,
        const std::vector<double>& b
    );

    /// @brief Constructor
    /// @param f Equation vector (n functions)
    /// @param t0 Initial instant
    /// @param y0 Initial state (n components)
    /// @param h Step size, must be positive
    /// @param tableau Method coefficients
    /// @throws common::ConfigurationError on any invalid argument
    RungeKuttaIntegrator(
        common::EquationVector f,
        double t0,
        Eigen::VectorXd y0,
        double h,
        ButcherTableau tableau
    );

    /// @brief Integrate from t0 to tf
    /// @param tf Final instant, must be greater than t0
    /// @return Trajectory starting with (t0, y0), spaced by h, ending at or just past tf
    /// @throws common::ConfigurationError if tf is not after t0, or if the instant
    ///         stops advancing because h is below the resolution of t
    /// @throws common::EvaluationError if a derivative cannot be evaluated
    auto integrate(double tf) const -> common::Trajectory;

    auto t0() const -> double { return t0_; }
    auto initial_state() const -> const Eigen::VectorXd& { return y0_; }
    auto step_size() const -> double { return advancer_.stage_evaluator().step_size(); }
    auto tableau() const -> const ButcherTableau& { return advancer_.stage_evaluator().tableau(); }
    auto dimension() const -> Eigen::Index { return y0_.size(); }

private:
    /// @brief Round an instant to kRoundingDigits decimal places
    static auto round_instant(double t) -> double;

    common::EquationVector equations_; ///< dy_i/dt = f_i(t, y)
    double t0_;                        ///< Initial instant
    Eigen::VectorXd y0_;               ///< Initial state
    StepAdvancer advancer_;            ///< Single-step update
};

} // namespace integrator
