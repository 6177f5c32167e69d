#pragma once

#include "integrator/stage_evaluator.hpp"
#include "common/types.hpp"

#include <Eigen/Dense>

namespace integrator {

/// @brief Advances a system by one explicit Runge-Kutta step
///
/// @details y_{k+1} = y_k + h Σ_r b_r k_r,  t_{k+1} = t_k + h
///
///          The update reads only the (t_k, y_k) snapshot; the inputs are never
///          modified.
class StepAdvancer {
public:
    /// @brief Constructor
    /// @param tableau Method coefficients
    /// @param h Step size, must be positive
    StepAdvancer(ButcherTableau tableau, double h);

    /// @brief Computes the next instant and state
    /// @param f Equation vector (n functions)
    /// @param t Current instant
    /// @param y Current state (n components)
    /// @return (t + h, next state)
    auto advance(const common::EquationVector& f, double t, const Eigen::VectorXd& y) const -> common::TrajectoryPoint;

    /// @brief Computes the next instant and state, reusing caller-owned stage buffers
    auto advance(const common::EquationVector& f, double t, const Eigen::VectorXd& y, StageWorkspace& workspace) const -> common::TrajectoryPoint;

    auto stage_evaluator() const -> const StageEvaluator& { return evaluator_; }

private:
    StageEvaluator evaluator_; ///< Stage computation for this method and step size
};

} // namespace integrator
