#pragma once

#include <Eigen/Dense>

#include <vector>

namespace integrator {

/// @brief Coefficients (a, b, c) of an explicit Runge-Kutta method
///
/// @details For an R-stage method:
///          - a ∈ ℝᴿˣᴿ couples stage r to earlier stages s < r
///          - b ∈ ℝᴿ weights the stages in the final update
///          - c ∈ ℝᴿ are the stage abscissas, c_r = Σ_s a_rs
///
///          Only explicit methods are supported: a must be strictly lower
///          triangular so that every stage depends on earlier stages only.
///          The tableau is validated once at construction and is immutable.
class ButcherTableau {
public:
    /// @brief Construct from nested rows
    /// @param stages Number of stages R
    /// @param a R rows of R coupling coefficients each
    /// @param b R weights
    /// @throws common::ConfigurationError on dimension mismatch or a nonzero a_rs with s >= r
    ButcherTableau(int stages, const std::vector<std::vector<double>>& a, const std::vector<double>& b);

    /// @brief Construct from Eigen containers
    /// @param stages Number of stages R
    /// @param a R×R coupling matrix
    /// @param b R weights
    /// @throws common::ConfigurationError on dimension mismatch or a nonzero a_rs with s >= r
    ButcherTableau(int stages, const Eigen::MatrixXd& a, const Eigen::VectorXd& b);

    /// @brief Number of stages R
    auto stages() const -> int { return stages_; }

    /// @brief Coupling coefficients a (R×R, strictly lower triangular)
    auto a() const -> const Eigen::MatrixXd& { return a_; }

    /// @brief Stage weights b
    auto b() const -> const Eigen::VectorXd& { return b_; }

    /// @brief Stage abscissas c (row sums of a)
    auto c() const -> const Eigen::VectorXd& { return c_; }

    /// @brief Check first-order consistency, Σ b_r = 1
    /// @param tolerance Absolute tolerance on the weight sum
    /// @return true if the weights sum to one within tolerance
    auto weights_consistent(double tolerance = 1e-12) const -> bool;

private:
    /// @brief Validate dimensions and the explicit (lower-triangular) structure
    void validate() const;

    int stages_;        ///< Number of stages R
    Eigen::MatrixXd a_; ///< Coupling coefficients
    Eigen::VectorXd b_; ///< Weights
    Eigen::VectorXd c_; ///< Abscissas
};

} // namespace integrator
