#include "integrator/stage_evaluator.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace integrator {

void StageWorkspace::resize(Eigen::Index dimension, int stages)
{
    k = Eigen::MatrixXd::Zero(dimension, stages);
    shifted = Eigen::VectorXd::Zero(dimension);
}

StageEvaluator::StageEvaluator(ButcherTableau tableau, double h)
    : tableau_(std::move(tableau)), h_(h)
{
    if (!std::isfinite(h_) || h_ <= 0.0) {
        throw common::ConfigurationError("Step size must be positive");
    }
}

void StageEvaluator::evaluate(const common::EquationVector& f, double t, const Eigen::VectorXd& y, StageWorkspace& workspace) const
{
    evaluate_through(f, t, y, tableau_.stages() - 1, workspace);
}

auto StageEvaluator::stage(const common::EquationVector& f, std::size_t i, double t, const Eigen::VectorXd& y, int r) const -> double
{
    if (r < 0 || r >= tableau_.stages()) {
        throw std::out_of_range("Stage index " + std::to_string(r) + " outside [0, " + std::to_string(tableau_.stages()) + ")");
    }
    if (i >= f.size()) {
        throw std::out_of_range("Equation index " + std::to_string(i) + " outside system of " + std::to_string(f.size()));
    }

    StageWorkspace workspace;
    workspace.resize(y.size(), tableau_.stages());
    evaluate_through(f, t, y, r, workspace);
    return workspace.k(static_cast<Eigen::Index>(i), r);
}

void StageEvaluator::evaluate_through(const common::EquationVector& f, double t, const Eigen::VectorXd& y,
                                      int last_stage, StageWorkspace& workspace) const
{
    const auto n = y.size();
    if (static_cast<Eigen::Index>(f.size()) != n) {
        throw common::ConfigurationError(
            "Equation vector has " + std::to_string(f.size()) + " functions but state has " + std::to_string(n) + " components"
        );
    }
    if (workspace.k.rows() != n || workspace.k.cols() != tableau_.stages()) {
        workspace.resize(n, tableau_.stages());
    }

    const Eigen::MatrixXd& a = tableau_.a();
    const Eigen::VectorXd& c = tableau_.c();

    for (int r = 0; r <= last_stage; ++r) {
        // y + h Σ_{s<r} a_rs k_s
        workspace.shifted = y;
        for (int s = 0; s < r; ++s) {
            if (a(r, s) != 0.0) {
                workspace.shifted.noalias() += (h_ * a(r, s)) * workspace.k.col(s);
            }
        }

        const double t_r = t + h_ * c(r);
        // Non-finite values are stored as computed; divergence is the caller's to detect
        for (Eigen::Index i = 0; i < n; ++i) {
            workspace.k(i, r) = f[static_cast<std::size_t>(i)](t_r, workspace.shifted);
        }
    }
}

} // namespace integrator
