#include "dynamics/state_layout.hpp"
#include "common/errors.hpp"

#include <stdexcept>
#include <string>

namespace dynamics {

StateLayout::StateLayout(std::size_t body_count)
    : body_count_(body_count)
{
    if (body_count_ == 0) {
        throw common::ConfigurationError("State layout requires at least one body");
    }
}

auto StateLayout::offset(std::size_t body, Component component) const -> Eigen::Index
{
    if (body >= body_count_) {
        throw std::out_of_range("Body " + std::to_string(body) + " outside layout of " + std::to_string(body_count_));
    }
    return static_cast<Eigen::Index>(body * kComponentsPerBody + static_cast<std::size_t>(component));
}

auto StateLayout::locate(Eigen::Index index) const -> std::pair<std::size_t, Component>
{
    if (index < 0 || index >= dimension()) {
        throw std::out_of_range("State index " + std::to_string(index) + " outside layout");
    }
    const auto flat = static_cast<std::size_t>(index);
    return {flat / kComponentsPerBody, static_cast<Component>(flat % kComponentsPerBody)};
}

auto StateLayout::pack(const std::vector<BodyState>& bodies) const -> Eigen::VectorXd
{
    if (bodies.size() != body_count_) {
        throw common::ConfigurationError(
            "Expected " + std::to_string(body_count_) + " bodies, got " + std::to_string(bodies.size())
        );
    }

    Eigen::VectorXd state(dimension());
    for (std::size_t body = 0; body < body_count_; ++body) {
        state(offset(body, Component::X)) = bodies[body].position.x();
        state(offset(body, Component::PX)) = bodies[body].momentum.x();
        state(offset(body, Component::Y)) = bodies[body].position.y();
        state(offset(body, Component::PY)) = bodies[body].momentum.y();
    }
    return state;
}

auto StateLayout::unpack(const Eigen::VectorXd& state) const -> std::vector<BodyState>
{
    check_dimension(state);

    std::vector<BodyState> bodies(body_count_);
    for (std::size_t body = 0; body < body_count_; ++body) {
        bodies[body].position = position(state, body);
        bodies[body].momentum = momentum(state, body);
    }
    return bodies;
}

auto StateLayout::position(const Eigen::VectorXd& state, std::size_t body) const -> Eigen::Vector2d
{
    check_dimension(state);
    return Eigen::Vector2d(state(offset(body, Component::X)), state(offset(body, Component::Y)));
}

auto StateLayout::momentum(const Eigen::VectorXd& state, std::size_t body) const -> Eigen::Vector2d
{
    check_dimension(state);
    return Eigen::Vector2d(state(offset(body, Component::PX)), state(offset(body, Component::PY)));
}

void StateLayout::check_dimension(const Eigen::VectorXd& state) const
{
    if (state.size() != dimension()) {
        throw common::ConfigurationError(
            "State has " + std::to_string(state.size()) + " components, layout expects " + std::to_string(dimension())
        );
    }
}

} // namespace dynamics
