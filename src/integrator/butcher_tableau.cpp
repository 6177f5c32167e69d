#include "integrator/butcher_tableau.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <string>

namespace integrator {

ButcherTableau::ButcherTableau(int stages, const std::vector<std::vector<double>>& a, const std::vector<double>& b)
    : stages_(stages)
{
    if (stages_ <= 0) {
        throw common::ConfigurationError("Number of stages must be positive");
    }
    if (static_cast<int>(b.size()) != stages_) {
        throw common::ConfigurationError(
            "Weight vector b has " + std::to_string(b.size()) + " entries, expected " + std::to_string(stages_)
        );
    }
    if (static_cast<int>(a.size()) != stages_) {
        throw common::ConfigurationError(
            "Coupling matrix a has " + std::to_string(a.size()) + " rows, expected " + std::to_string(stages_)
        );
    }

    a_ = Eigen::MatrixXd::Zero(stages_, stages_);
    for (int r = 0; r < stages_; ++r) {
        if (static_cast<int>(a[r].size()) != stages_) {
            throw common::ConfigurationError(
                "Row " + std::to_string(r) + " of coupling matrix a has " + std::to_string(a[r].size())
                + " columns, expected " + std::to_string(stages_)
            );
        }
        for (int s = 0; s < stages_; ++s) {
            a_(r, s) = a[r][s];
        }
    }
    b_ = Eigen::Map<const Eigen::VectorXd>(b.data(), stages_);

    validate();
    c_ = a_.rowwise().sum();
}

ButcherTableau::ButcherTableau(int stages, const Eigen::MatrixXd& a, const Eigen::VectorXd& b)
    : stages_(stages), a_(a), b_(b)
{
    if (stages_ <= 0) {
        throw common::ConfigurationError("Number of stages must be positive");
    }
    if (b_.size() != stages_) {
        throw common::ConfigurationError(
            "Weight vector b has " + std::to_string(b_.size()) + " entries, expected " + std::to_string(stages_)
        );
    }
    if (a_.rows() != stages_ || a_.cols() != stages_) {
        throw common::ConfigurationError(
            "Coupling matrix a is " + std::to_string(a_.rows()) + "x" + std::to_string(a_.cols())
            + ", expected " + std::to_string(stages_) + "x" + std::to_string(stages_)
        );
    }

    validate();
    c_ = a_.rowwise().sum();
}

void ButcherTableau::validate() const
{
    if (!a_.allFinite() || !b_.allFinite()) {
        throw common::ConfigurationError("Tableau coefficients must be finite");
    }

    // Explicit methods only: stage r may depend on stages s < r
    for (int r = 0; r < stages_; ++r) {
        for (int s = r; s < stages_; ++s) {
            if (a_(r, s) != 0.0) {
                throw common::ConfigurationError(
                    "Coupling coefficient a[" + std::to_string(r) + "][" + std::to_string(s)
                    + "] must be zero for an explicit method"
                );
            }
        }
    }
}

auto ButcherTableau::weights_consistent(double tolerance) const -> bool
{
    return std::abs(b_.sum() - 1.0) <= tolerance;
}

} // namespace integrator
