#include "integrator/step_advancer.hpp"

#include <utility>

namespace integrator {

StepAdvancer::StepAdvancer(ButcherTableau tableau, double h)
    : evaluator_(std::move(tableau), h)
{}

auto StepAdvancer::advance(const common::EquationVector& f, double t, const Eigen::VectorXd& y) const -> common::TrajectoryPoint
{
    StageWorkspace workspace;
    return advance(f, t, y, workspace);
}

auto StepAdvancer::advance(const common::EquationVector& f, double t, const Eigen::VectorXd& y, StageWorkspace& workspace) const -> common::TrajectoryPoint
{
    evaluator_.evaluate(f, t, y, workspace);

    const double h = evaluator_.step_size();
    // phi_i = Σ_r b_r k_r[i]
    Eigen::VectorXd y_next = y + h * (workspace.k * evaluator_.tableau().b());

    return {t + h, std::move(y_next)};
}

} // namespace integrator
