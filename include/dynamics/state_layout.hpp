#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <utility>
#include <vector>

namespace dynamics {

/// @brief Planar state of a single body
struct BodyState {
    Eigen::Vector2d position; ///< Position (x, y)
    Eigen::Vector2d momentum; ///< Momentum (px, py)
};

/// @brief Per-body state component
enum class Component { X, PX, Y, PY };

/// @brief Mapping between per-body records and the flat state vector
///
/// @details Each body occupies four consecutive entries of the flat state,
///          ordered [x, px, y, py]:
///
///          [x_0, px_0, y_0, py_0, x_1, px_1, y_1, py_1, ...]
class StateLayout {
public:
    /// @brief Number of flat entries per body
    static constexpr std::size_t kComponentsPerBody = 4;

    /// @brief Constructor
    /// @param body_count Number of bodies, must be positive
    /// @throws common::ConfigurationError if body_count is zero
    explicit StateLayout(std::size_t body_count);

    /// @brief Flat offset of a body component
    /// @throws std::out_of_range if body is not in the layout
    auto offset(std::size_t body, Component component) const -> Eigen::Index;

    /// @brief Body and component stored at a flat offset
    /// @throws std::out_of_range if index is outside the state
    auto locate(Eigen::Index index) const -> std::pair<std::size_t, Component>;

    /// @brief Number of bodies
    auto body_count() const -> std::size_t { return body_count_; }

    /// @brief Length of the flat state vector
    auto dimension() const -> Eigen::Index { return static_cast<Eigen::Index>(body_count_ * kComponentsPerBody); }

    /// @brief Flatten body records into a state vector
    /// @throws common::ConfigurationError if the number of records does not match
    auto pack(const std::vector<BodyState>& bodies) const -> Eigen::VectorXd;

    /// @brief Split a state vector into body records
    /// @throws common::ConfigurationError if the state length does not match
    auto unpack(const Eigen::VectorXd& state) const -> std::vector<BodyState>;

    /// @brief Position of one body in a flat state
    /// @throws common::ConfigurationError if the state length does not match
    auto position(const Eigen::VectorXd& state, std::size_t body) const -> Eigen::Vector2d;

    /// @brief Momentum of one body in a flat state
    auto momentum(const Eigen::VectorXd& state, std::size_t body) const -> Eigen::Vector2d;

private:
    /// @brief Reject states whose length does not match the layout
    void check_dimension(const Eigen::VectorXd& state) const;

    std::size_t body_count_; ///< Number of bodies
};

} // namespace dynamics
