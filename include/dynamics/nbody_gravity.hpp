#pragma once

#include "dynamics/state_layout.hpp"
#include "common/types.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <memory>
#include <vector>

namespace dynamics {

/// @brief Planar Newtonian N-body gravity model
///
/// @details For every body a with mass m_a, position r_a and momentum p_a:
///
///          dr_a/dt = p_a / m_a
///          dp_a/dt = m_a Σ_{b≠a} G m_b (r_b - r_a) / |r_b - r_a|³
///
///          The model is immutable after construction; derivative functions
///          built from it only read it.
class NBodyGravity {
public:
    /// @brief Constructor
    /// @param masses Body masses, all positive
    /// @param G Gravitational constant (default is unit-normalized)
    /// @throws common::ConfigurationError for an empty mass list or a non-positive mass
    explicit NBodyGravity(std::vector<double> masses, double G = 1.0);

    /// @brief Rate of change of one state component
    /// @param body Body index
    /// @param component Component of that body
    /// @param state Flat state vector
    /// @return d(component)/dt
    /// @throws common::EvaluationError if two bodies coincide
    auto derivative(std::size_t body, Component component, const Eigen::VectorXd& state) const -> double;

    /// @brief Rates of change of the whole state
    ///
    /// Each pair of bodies is visited once; the result is ordered like the state.
    ///
    /// @param state Flat state vector
    /// @return dy/dt for every component
    /// @throws common::EvaluationError if two bodies coincide
    auto derivatives(const Eigen::VectorXd& state) const -> Eigen::VectorXd;

    /// @brief Velocity of a body, p / m
    auto velocity(std::size_t body, const Eigen::VectorXd& state) const -> Eigen::Vector2d;

    /// @brief Net gravitational force on a body, dp/dt
    /// @throws common::EvaluationError if two bodies coincide
    auto force(std::size_t body, const Eigen::VectorXd& state) const -> Eigen::Vector2d;

    /// @brief Sum of all body momenta
    auto total_momentum(const Eigen::VectorXd& state) const -> Eigen::Vector2d;

    /// @brief Kinetic plus gravitational potential energy
    /// @throws common::EvaluationError if two bodies coincide
    auto total_energy(const Eigen::VectorXd& state) const -> double;

    /// @brief Mass-weighted mean position
    auto center_of_mass(const Eigen::VectorXd& state) const -> Eigen::Vector2d;

    auto masses() const -> const std::vector<double>& { return masses_; }
    auto gravitational_constant() const -> double { return G_; }
    auto layout() const -> const StateLayout& { return layout_; }
    auto body_count() const -> std::size_t { return masses_.size(); }

private:
    std::vector<double> masses_; ///< Body masses
    double G_;                   ///< Gravitational constant
    StateLayout layout_;         ///< Body/component to flat offset mapping
};

/// @brief Build the ordered derivative functions of an N-body model
///
/// Function i computes the derivative of flat state entry i, following the
/// model's StateLayout. Each function shares ownership of the model.
///
/// The functions share a cache of the last state they were called with, so
/// the model is evaluated once per distinct state rather than once per
/// component. They must not be called concurrently.
///
/// @param model Gravity model
/// @return Equation vector of 4 * body_count functions
/// @throws common::ConfigurationError if model is null
auto make_equation_vector(std::shared_ptr<const NBodyGravity> model) -> common::EquationVector;

} // namespace dynamics
