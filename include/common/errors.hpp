#pragma once

#include <stdexcept>
#include <string>

namespace common {

/// @brief Raised for malformed configuration, always before any step is taken
///
/// Covers malformed tableaus, mismatched equation/state sizes, non-positive
/// step sizes, unreachable final instants and invalid scenario files.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

/// @brief Raised when a derivative function cannot be evaluated
///
/// Aborts the run; the partial trajectory is discarded.
class EvaluationError : public std::runtime_error {
public:
    explicit EvaluationError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace common
