#include "integrator/runge_kutta.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>

namespace integrator {

namespace {
constexpr std::size_t kMaxReservedRecords = std::size_t{1} << 20;
} // namespace

RungeKuttaIntegrator::RungeKuttaIntegrator(
    common::EquationVector f,
    double t0,
    Eigen::VectorXd y0,
    double h,
    int stages,
    const std::vector<std::vector<double>>& a,
    const std::vector<double>& b
) : RungeKuttaIntegrator(std::move(f), t0, std::move(y0), h, ButcherTableau(stages, a, b))
{}

RungeKuttaIntegrator::RungeKuttaIntegrator(
    common::EquationVector f,
    double t0,
    Eigen::VectorXd y0,
    double h,
    ButcherTableau tableau
) : equations_(std::move(f)), t0_(t0), y0_(std::move(y0)), advancer_(std::move(tableau), h)
{
    if (equations_.empty()) {
        throw common::ConfigurationError("Equation vector cannot be empty");
    }
    if (static_cast<Eigen::Index>(equations_.size()) != y0_.size()) {
        throw common::ConfigurationError(
            "Equation vector has " + std::to_string(equations_.size()) + " functions but initial state has "
            + std::to_string(y0_.size()) + " components"
        );
    }
    for (std::size_t i = 0; i < equations_.size(); ++i) {
        if (!equations_[i]) {
            throw common::ConfigurationError("Equation " + std::to_string(i) + " is empty");
        }
    }
    if (!std::isfinite(t0_)) {
        throw common::ConfigurationError("Initial instant must be finite");
    }
    if (!y0_.allFinite()) {
        throw common::ConfigurationError("Initial state must be finite");
    }
}

auto RungeKuttaIntegrator::integrate(double tf) const -> common::Trajectory
{
    if (!std::isfinite(tf) || tf <= t0_) {
        throw common::ConfigurationError(
            "Final instant " + std::to_string(tf) + " must be after initial instant " + std::to_string(t0_)
        );
    }

    const double h = step_size();
    const double span = std::ceil((tf - t0_) / h);
    if (span >= static_cast<double>(std::numeric_limits<std::size_t>::max() - 1)) {
        throw common::ConfigurationError("Final instant is unreachable with step size " + std::to_string(h));
    }
    // Never more than one step past tf
    const auto max_steps = static_cast<std::size_t>(span) + 1;

    common::Trajectory trajectory;
    trajectory.reserve(std::min(max_steps + 1, kMaxReservedRecords));

    double t = t0_;
    Eigen::VectorXd state = y0_;
    trajectory.emplace_back(t, state);

    StageWorkspace workspace;
    workspace.resize(y0_.size(), tableau().stages());

    for (std::size_t step = 0; step < max_steps; ++step) {
        auto next = advancer_.advance(equations_, t, state, workspace);
        t = next.first;
        state = std::move(next.second);
        trajectory.emplace_back(t, state);

        if (round_instant(t) >= tf) {
            return trajectory;
        }
    }

    // h is too small for t + h to advance at this magnitude
    throw common::ConfigurationError(
        "Final instant " + std::to_string(tf) + " not reached after " + std::to_string(max_steps)
        + " steps; step size " + std::to_string(h) + " is lost in rounding of the instant"
    );
}

auto RungeKuttaIntegrator::round_instant(double t) -> double
{
    static const double scale = std::pow(10.0, kRoundingDigits);
    return std::round(t * scale) / scale;
}

} // namespace integrator
