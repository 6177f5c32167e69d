#include "config/scenario.hpp"
#include "integrator/factory.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

namespace config {

namespace {

auto require(const nlohmann::json& node, const std::string& key) -> const nlohmann::json&
{
    if (!node.contains(key)) {
        throw common::ConfigurationError("Scenario is missing required field '" + key + "'");
    }
    return node.at(key);
}

auto read_number(const nlohmann::json& node, const std::string& key) -> double
{
    const auto& value = require(node, key);
    if (!value.is_number()) {
        throw common::ConfigurationError("Scenario field '" + key + "' must be a number");
    }
    double number = value.get<double>();
    if (!std::isfinite(number)) {
        throw common::ConfigurationError("Scenario field '" + key + "' must be finite");
    }
    return number;
}

auto read_number(const nlohmann::json& node, const std::string& key, double fallback) -> double
{
    return node.contains(key) ? read_number(node, key) : fallback;
}

auto read_pair(const nlohmann::json& node, const std::string& key) -> Eigen::Vector2d
{
    const auto& value = require(node, key);
    if (!value.is_array() || value.size() != 2 || !value[0].is_number() || !value[1].is_number()) {
        throw common::ConfigurationError("Scenario field '" + key + "' must be an array of 2 numbers");
    }
    return Eigen::Vector2d(value[0].get<double>(), value[1].get<double>());
}

auto read_tableau(const nlohmann::json& node) -> integrator::ButcherTableau
{
    const auto& stages = require(node, "stages");
    if (!stages.is_number_integer()) {
        throw common::ConfigurationError("Tableau field 'stages' must be an integer");
    }
    const auto& a = require(node, "a");
    const auto& b = require(node, "b");
    if (!a.is_array() || !b.is_array()) {
        throw common::ConfigurationError("Tableau fields 'a' and 'b' must be arrays");
    }
    return integrator::ButcherTableau(
        stages.get<int>(),
        a.get<std::vector<std::vector<double>>>(),
        b.get<std::vector<double>>()
    );
}

} // namespace

auto parse_scenario(const nlohmann::json& doc) -> Scenario
{
    if (!doc.is_object()) {
        throw common::ConfigurationError("Scenario must be a JSON object");
    }

    try {
        const double G = read_number(doc, "gravitational_constant", 1.0);
        const double t0 = read_number(doc, "t0", 0.0);
        const double tf = read_number(doc, "tf");
        const double timestep = read_number(doc, "timestep");

        std::size_t stride = 1;
        if (doc.contains("output_stride")) {
            const auto& value = doc.at("output_stride");
            if (!value.is_number_integer() || value.get<long long>() < 1) {
                throw common::ConfigurationError("Scenario output_stride must be a positive integer");
            }
            stride = value.get<std::size_t>();
        }

        const auto& bodies_node = require(doc, "bodies");
        if (!bodies_node.is_array() || bodies_node.empty()) {
            throw common::ConfigurationError("Scenario bodies must be a non-empty array");
        }
        std::vector<double> masses;
        std::vector<dynamics::BodyState> bodies;
        for (const auto& body : bodies_node) {
            if (!body.is_object()) {
                throw common::ConfigurationError("Each scenario body must be an object");
            }
            const double mass = read_number(body, "mass");
            if (mass <= 0.0) {
                throw common::ConfigurationError("Scenario body " + std::to_string(masses.size()) + " must have positive mass");
            }
            masses.push_back(mass);
            bodies.push_back({read_pair(body, "position"), read_pair(body, "momentum")});
        }

        if (doc.contains("method") && doc.contains("tableau")) {
            throw common::ConfigurationError("Scenario cannot specify both 'method' and 'tableau'");
        }
        if (doc.contains("tableau")) {
            Scenario scenario{G, t0, tf, timestep, stride, std::move(masses), std::move(bodies), "CUSTOM",
                              read_tableau(doc.at("tableau"))};
            validate_scenario(scenario);
            return scenario;
        }
        std::string method = "RALSTON";
        if (doc.contains("method")) {
            if (!doc.at("method").is_string()) {
                throw common::ConfigurationError("Scenario method must be a string");
            }
            method = doc.at("method").get<std::string>();
        }
        const auto kind = integrator::parse_method(method);
        std::ostringstream label;
        label << kind;
        Scenario scenario{G, t0, tf, timestep, stride, std::move(masses), std::move(bodies), label.str(),
                          integrator::TableauFactory::create(kind)};
        validate_scenario(scenario);
        return scenario;
    } catch (const nlohmann::json::exception& e) {
        throw common::ConfigurationError(std::string("Malformed scenario: ") + e.what());
    }
}

void validate_scenario(const Scenario& scenario)
{
    if (!std::isfinite(scenario.timestep) || scenario.timestep <= 0.0) {
        throw common::ConfigurationError("Scenario timestep must be positive");
    }
    if (!std::isfinite(scenario.t0) || !std::isfinite(scenario.tf) || scenario.tf <= scenario.t0) {
        throw common::ConfigurationError("Scenario tf must be after t0");
    }
    if (scenario.output_stride == 0) {
        throw common::ConfigurationError("Scenario output_stride must be a positive integer");
    }
    if (scenario.bodies.empty() || scenario.bodies.size() != scenario.masses.size()) {
        throw common::ConfigurationError(
            "Scenario has " + std::to_string(scenario.bodies.size()) + " bodies and "
            + std::to_string(scenario.masses.size()) + " masses"
        );
    }
}

auto load_scenario(const std::string& path) -> Scenario
{
    std::ifstream inFile(path);
    if (!inFile.is_open()) {
        throw common::ConfigurationError("Could not open scenario file " + path);
    }

    nlohmann::json doc;
    try {
        inFile >> doc;
    } catch (const nlohmann::json::exception& e) {
        throw common::ConfigurationError("Failed to parse scenario file " + path + ": " + e.what());
    }

    return parse_scenario(doc);
}

} // namespace config
