#pragma once

#include "integrator/butcher_tableau.hpp"
#include "common/types.hpp"

#include <Eigen/Dense>

#include <cstddef>

namespace integrator {

/// @brief Reusable per-step stage buffers
///
/// Sized once per run and overwritten every step.
struct StageWorkspace {
    Eigen::MatrixXd k;       ///< Stage derivatives, n×R; column r holds k_r for every equation
    Eigen::VectorXd shifted; ///< Shifted state for the stage being evaluated

    /// @brief Size the buffers for a system
    /// @param dimension Number of equations n
    /// @param stages Number of stages R
    void resize(Eigen::Index dimension, int stages);
};

/// @brief Computes the intermediate stage derivatives of one explicit Runge-Kutta step
///
/// @details For stage r of a step from (t, y):
///
///          k_r[i] = f_i(t + h c_r, y + h Σ_{s<r} a_rs k_s)
///
///          All equations share the instant and the shifted state, so the
///          stages are computed for the whole system at once: k_r is complete
///          for every equation before k_{r+1} is started. Stage 0 is f(t, y).
///
///          Exceptions thrown by a derivative function propagate unchanged.
class StageEvaluator {
public:
    /// @brief Constructor
    /// @param tableau Method coefficients
    /// @param h Step size, must be positive
    /// @throws common::ConfigurationError if h is not a positive finite number
    StageEvaluator(ButcherTableau tableau, double h);

    /// @brief Compute every stage of a step
    /// @param f Equation vector (n functions)
    /// @param t Current instant
    /// @param y Current state (n components)
    /// @param workspace Output buffers; workspace.k receives the stages
    void evaluate(const common::EquationVector& f, double t, const Eigen::VectorXd& y, StageWorkspace& workspace) const;

    /// @brief Value of a single stage for a single equation
    /// @param f Equation vector (n functions)
    /// @param i Equation index
    /// @param t Current instant
    /// @param y Current state (n components)
    /// @param r Stage index in [0, R)
    /// @return k_r[i]
    auto stage(const common::EquationVector& f, std::size_t i, double t, const Eigen::VectorXd& y, int r) const -> double;

    auto tableau() const -> const ButcherTableau& { return tableau_; }
    auto step_size() const -> double { return h_; }

private:
    /// @brief Compute stages 0..last_stage into the workspace
    void evaluate_through(const common::EquationVector& f, double t, const Eigen::VectorXd& y,
                          int last_stage, StageWorkspace& workspace) const;

    ButcherTableau tableau_; ///< Method coefficients
    double h_;               ///< Step size
};

} // namespace integrator
