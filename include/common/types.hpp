#pragma once

#include <Eigen/Dense>

#include <functional>
#include <utility>
#include <vector>

namespace common {

// ============================================
// EQUATION TYPES
// ============================================

/// @brief Scalar derivative function dy_i/dt = f_i(t, y)
///
/// @details Receives the current instant and the full state vector and
///          returns the rate of change of a single state component.
using DerivativeFunction = std::function<double(double t, const Eigen::VectorXd& y)>;

/// @brief Ordered system of derivative functions
///
/// Index i of the equation vector corresponds to index i of the state vector.
using EquationVector = std::vector<DerivativeFunction>;

// ============================================
// STATE TYPES (Data Containers)
// ============================================

/// @brief Single time-stamped state (instant, state vector)
using TrajectoryPoint = std::pair<double, Eigen::VectorXd>;

/// @brief Trajectory (sequence of states)
using Trajectory = std::vector<TrajectoryPoint>;

} // namespace common
