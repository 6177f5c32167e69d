#include <config/scenario.hpp>
#include <dynamics/nbody_gravity.hpp>
#include <integrator/factory.hpp>
#include <integrator/runge_kutta.hpp>
#include <common/trajectory.hpp>
#include <common/errors.hpp>

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <boost/program_options.hpp>

#include <chrono>
#include <cmath>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

namespace po = boost::program_options;

int main(int argc, char* argv[]) {
    // Command-line options
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "Produce help message")
        ("scenario,s", po::value<std::string>()->required(), "Input JSON file describing masses, initial states and run parameters")
        ("output,o", po::value<std::string>()->default_value("nbody_trajectory.json"), "Output JSON file with the sampled trajectory")
        ("method,m", po::value<integrator::Method>(), "Runge-Kutta method (EULER, MIDPOINT, HEUN, RALSTON, KUTTA3, RK4, RK38); overrides the scenario")
        ("timestep,t", po::value<double>(), "Step size (overrides the scenario)")
        ("final-time,f", po::value<double>(), "Final instant (overrides the scenario)")
        ("stride,k", po::value<std::size_t>(), "Write every k-th record (overrides the scenario)");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }
        po::notify(vm);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl << desc << std::endl;
        return 1;
    }

    // Load scenario and apply overrides
    auto scenario_file = vm["scenario"].as<std::string>();
    std::unique_ptr<config::Scenario> scenario;
    try {
        scenario = std::make_unique<config::Scenario>(config::load_scenario(scenario_file));
    } catch (const common::ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::string method_label = scenario->method;
    integrator::ButcherTableau tableau = scenario->tableau;
    if (vm.count("method")) {
        auto method = vm["method"].as<integrator::Method>();
        tableau = integrator::TableauFactory::create(method);
        std::ostringstream label;
        label << method;
        method_label = label.str();
    }
    if (vm.count("timestep")) {
        scenario->timestep = vm["timestep"].as<double>();
    }
    if (vm.count("final-time")) {
        scenario->tf = vm["final-time"].as<double>();
    }
    if (vm.count("stride")) {
        scenario->output_stride = vm["stride"].as<std::size_t>();
    }
    try {
        config::validate_scenario(*scenario);
    } catch (const common::ConfigurationError& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }
    const double h = scenario->timestep;
    const double tf = scenario->tf;
    const std::size_t stride = scenario->output_stride;

    if (!tableau.weights_consistent()) {
        std::cout << "Warning: tableau weights do not sum to 1, the method is not consistent" << std::endl;
    }

    common::Trajectory sampled;
    std::size_t steps = 0;
    Eigen::VectorXd initial_state;
    Eigen::VectorXd final_state;
    std::shared_ptr<const dynamics::NBodyGravity> model;
    try {
        model = std::make_shared<const dynamics::NBodyGravity>(scenario->masses, scenario->gravitational_constant);
        initial_state = model->layout().pack(scenario->bodies);
        integrator::RungeKuttaIntegrator rk(
            dynamics::make_equation_vector(model),
            scenario->t0,
            initial_state,
            h,
            tableau
        );

        std::cout << "Steps to apply: " << std::ceil((tf - scenario->t0) / h) << std::endl;

        auto start = std::chrono::steady_clock::now();
        auto trajectory = rk.integrate(tf);
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
        std::cout << "Elapsed time: " << elapsed.count() << " s" << std::endl;

        steps = trajectory.size() - 1;
        final_state = trajectory.back().second;
        sampled = common::subsample(trajectory, stride);
        std::cout << "Records written: " << sampled.size() << std::endl;
    } catch (const common::ConfigurationError& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    } catch (const common::EvaluationError& e) {
        std::cerr << "Integration failed: " << e.what() << std::endl;
        return 1;
    }

    // JSON array to store trajectory data
    nlohmann::json traj_json = nlohmann::json::array();
    const auto& layout = model->layout();
    for (const auto& entry : sampled) {
        nlohmann::json point;
        point["time"] = entry.first;
        point["bodies"] = nlohmann::json::array();
        for (const auto& body : layout.unpack(entry.second)) {
            point["bodies"].push_back({
                {"position", {body.position.x(), body.position.y()}},
                {"momentum", {body.momentum.x(), body.momentum.y()}}
            });
        }
        traj_json.push_back(point);
    }

    Eigen::Vector2d p_initial = model->total_momentum(initial_state);
    Eigen::Vector2d p_final = model->total_momentum(final_state);

    nlohmann::json data_json = {};
    data_json["points"] = traj_json;
    data_json["summary"]["method"] = method_label;
    data_json["summary"]["stages"] = tableau.stages();
    data_json["summary"]["timestep"] = h;
    data_json["summary"]["t0"] = scenario->t0;
    data_json["summary"]["tf"] = tf;
    data_json["summary"]["steps"] = steps;
    data_json["summary"]["output_stride"] = stride;
    data_json["summary"]["masses"] = scenario->masses;
    data_json["summary"]["initial_momentum"] = {p_initial.x(), p_initial.y()};
    data_json["summary"]["final_momentum"] = {p_final.x(), p_final.y()};
    try {
        data_json["summary"]["initial_energy"] = model->total_energy(initial_state);
        data_json["summary"]["final_energy"] = model->total_energy(final_state);
    } catch (const common::EvaluationError& e) {
        std::cerr << "Warning: energy undefined: " << e.what() << std::endl;
    }

    // Write JSON to file
    auto output_file = vm["output"].as<std::string>();
    std::ofstream outFile(output_file);
    if (!outFile.is_open()) {
        std::cerr << "Error opening output file!" << std::endl;
        return 1;
    }
    outFile << data_json.dump(4); // Pretty-print with 4-space indentation
    outFile.close();
    std::cout << "N-body trajectory data written to " << output_file << std::endl;

    return 0;
}
