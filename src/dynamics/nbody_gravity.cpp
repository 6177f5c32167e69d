#include "dynamics/nbody_gravity.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dynamics {

namespace {
auto validated_masses(std::vector<double> masses) -> std::vector<double>
{
    if (masses.empty()) {
        throw common::ConfigurationError("N-body model requires at least one body");
    }
    for (std::size_t a = 0; a < masses.size(); ++a) {
        if (!std::isfinite(masses[a]) || masses[a] <= 0.0) {
            throw common::ConfigurationError("Mass of body " + std::to_string(a) + " must be positive");
        }
    }
    return masses;
}
/// @brief Last state seen by an equation vector and its derivatives
struct DerivativeCache {
    Eigen::VectorXd state;
    Eigen::VectorXd rates;
    bool valid = false;
};
} // namespace

NBodyGravity::NBodyGravity(std::vector<double> masses, double G)
    : masses_(validated_masses(std::move(masses))), G_(G), layout_(masses_.size())
{
    if (!std::isfinite(G_)) {
        throw common::ConfigurationError("Gravitational constant must be finite");
    }
}

auto NBodyGravity::derivative(std::size_t body, Component component, const Eigen::VectorXd& state) const -> double
{
    switch (component) {
        case Component::X: return velocity(body, state).x();
        case Component::Y: return velocity(body, state).y();
        case Component::PX: return force(body, state).x();
        case Component::PY: return force(body, state).y();
    }
    return 0.0;
}

auto NBodyGravity::derivatives(const Eigen::VectorXd& state) const -> Eigen::VectorXd
{
    const std::size_t count = masses_.size();
    std::vector<Eigen::Vector2d> positions(count);
    Eigen::VectorXd rates(layout_.dimension());
    for (std::size_t body = 0; body < count; ++body) {
        positions[body] = layout_.position(state, body);
        const Eigen::Vector2d v = layout_.momentum(state, body) / masses_[body];
        rates(layout_.offset(body, Component::X)) = v.x();
        rates(layout_.offset(body, Component::Y)) = v.y();
    }

    std::vector<Eigen::Vector2d> forces(count, Eigen::Vector2d::Zero());
    for (std::size_t a = 0; a < count; ++a) {
        for (std::size_t b = a + 1; b < count; ++b) {
            const Eigen::Vector2d dr = positions[b] - positions[a];
            const double r = dr.norm();
            if (r == 0.0) {
                throw common::EvaluationError(
                    "Bodies " + std::to_string(a) + " and " + std::to_string(b) + " coincide"
                );
            }
            // Force on a from b; b receives the opposite
            const Eigen::Vector2d f = G_ * masses_[a] * masses_[b] / (r * r * r) * dr;
            forces[a] += f;
            forces[b] -= f;
        }
    }
    for (std::size_t body = 0; body < count; ++body) {
        rates(layout_.offset(body, Component::PX)) = forces[body].x();
        rates(layout_.offset(body, Component::PY)) = forces[body].y();
    }
    return rates;
}

auto NBodyGravity::velocity(std::size_t body, const Eigen::VectorXd& state) const -> Eigen::Vector2d
{
    return layout_.momentum(state, body) / masses_.at(body);
}

auto NBodyGravity::force(std::size_t body, const Eigen::VectorXd& state) const -> Eigen::Vector2d
{
    const Eigen::Vector2d r_a = layout_.position(state, body);

    Eigen::Vector2d sum = Eigen::Vector2d::Zero();
    for (std::size_t other = 0; other < masses_.size(); ++other) {
        if (other == body) {
            continue;
        }
        const Eigen::Vector2d dr = layout_.position(state, other) - r_a;
        const double r = dr.norm();
        if (r == 0.0) {
            throw common::EvaluationError(
                "Bodies " + std::to_string(body) + " and " + std::to_string(other) + " coincide"
            );
        }
        sum += G_ * masses_[other] / (r * r * r) * dr;
    }

    return masses_.at(body) * sum;
}

auto NBodyGravity::total_momentum(const Eigen::VectorXd& state) const -> Eigen::Vector2d
{
    Eigen::Vector2d p = Eigen::Vector2d::Zero();
    for (std::size_t body = 0; body < masses_.size(); ++body) {
        p += layout_.momentum(state, body);
    }
    return p;
}

auto NBodyGravity::total_energy(const Eigen::VectorXd& state) const -> double
{
    double kinetic = 0.0;
    double potential = 0.0;
    for (std::size_t a = 0; a < masses_.size(); ++a) {
        kinetic += layout_.momentum(state, a).squaredNorm() / (2.0 * masses_[a]);
        for (std::size_t b = a + 1; b < masses_.size(); ++b) {
            const double r = (layout_.position(state, b) - layout_.position(state, a)).norm();
            if (r == 0.0) {
                throw common::EvaluationError(
                    "Bodies " + std::to_string(a) + " and " + std::to_string(b) + " coincide"
                );
            }
            potential -= G_ * masses_[a] * masses_[b] / r;
        }
    }
    return kinetic + potential;
}

auto NBodyGravity::center_of_mass(const Eigen::VectorXd& state) const -> Eigen::Vector2d
{
    Eigen::Vector2d weighted = Eigen::Vector2d::Zero();
    double total_mass = 0.0;
    for (std::size_t body = 0; body < masses_.size(); ++body) {
        weighted += masses_[body] * layout_.position(state, body);
        total_mass += masses_[body];
    }
    return weighted / total_mass;
}

auto make_equation_vector(std::shared_ptr<const NBodyGravity> model) -> common::EquationVector
{
    if (!model) {
        throw common::ConfigurationError("Gravity model cannot be null");
    }

    const Eigen::Index dimension = model->layout().dimension();
    auto cache = std::make_shared<DerivativeCache>();
    common::EquationVector equations;
    equations.reserve(static_cast<std::size_t>(dimension));

    for (Eigen::Index i = 0; i < dimension; ++i) {
        equations.emplace_back([model, cache, i](double /*t*/, const Eigen::VectorXd& state) {
            if (!cache->valid || cache->state.size() != state.size() || cache->state != state) {
                cache->valid = false;
                cache->rates = model->derivatives(state);
                cache->state = state;
                cache->valid = true;
            }
            return cache->rates(i);
        });
    }

    return equations;
}

} // namespace dynamics
