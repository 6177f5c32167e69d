#pragma once

#include "integrator/butcher_tableau.hpp"

#include <iostream>
#include <string>

namespace integrator {
/// @brief Explicit Runge-Kutta methods available by name
enum class Method { EULER, MIDPOINT, HEUN, RALSTON, KUTTA3, RK4, RK38 };

std::istream& operator>>(std::istream& is, Method& method);
std::ostream& operator<<(std::ostream& os, const Method& method);

/// @brief Parse a method name (case-insensitive)
/// @throws common::ConfigurationError for an unknown name
auto parse_method(const std::string& name) -> Method;

/// @brief Factory for the Butcher tableaus of the named methods
class TableauFactory {
public:
    /// @brief Create the tableau of a named method
    /// @param method Method to create
    /// @return Validated tableau
    static auto create(Method method) -> ButcherTableau;
};
} // namespace integrator
