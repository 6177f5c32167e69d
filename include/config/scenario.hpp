#pragma once

#include "integrator/butcher_tableau.hpp"
#include "dynamics/state_layout.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace config {

/// @brief Complete description of an N-body integration run
struct Scenario {
    double gravitational_constant;          ///< G
    double t0;                              ///< Initial instant
    double tf;                              ///< Final instant
    double timestep;                        ///< Step size h
    std::size_t output_stride;              ///< Keep every k-th record on output
    std::vector<double> masses;             ///< Body masses
    std::vector<dynamics::BodyState> bodies; ///< Initial body states
    std::string method;                     ///< Method label ("CUSTOM" for an explicit tableau)
    integrator::ButcherTableau tableau;     ///< Method coefficients
};

/// @brief Build a scenario from a JSON document
///
/// @details Expected layout:
///          {
///              "gravitational_constant": 1.0,          (optional, default 1)
///              "t0": 0.0,                              (optional, default 0)
///              "tf": 500.0,
///              "timestep": 0.025,
///              "method": "RALSTON",                    (optional)
///              "tableau": {"stages": 2, "a": [[0, 0], [0.667, 0]], "b": [0.25, 0.75]},  (optional)
///              "output_stride": 10,                    (optional, default 1)
///              "bodies": [{"mass": 5, "position": [20, 20], "momentum": [-2, 2]}, ...]
///          }
///
///          "method" and "tableau" are mutually exclusive; without either the
///          RALSTON method is used.
///
/// @param doc Parsed JSON document
/// @return Validated scenario
/// @throws common::ConfigurationError for missing, mistyped or invalid fields
auto parse_scenario(const nlohmann::json& doc) -> Scenario;

/// @brief Check the run parameters of a scenario
///
/// parse_scenario() applies this to every scenario it returns; call it again
/// after changing fields by hand.
///
/// @param scenario Scenario to check
/// @throws common::ConfigurationError for a non-positive timestep or stride,
///         tf not after t0, or a body/mass count mismatch
void validate_scenario(const Scenario& scenario);

/// @brief Read and parse a scenario file
/// @param path Path to a JSON scenario file
/// @return Validated scenario
/// @throws common::ConfigurationError if the file cannot be read or is invalid
auto load_scenario(const std::string& path) -> Scenario;

} // namespace config
