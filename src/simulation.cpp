#include "simulation.h"

#include "enum_utils.h"
#include "metrics/trajectory_metrics.h"
#include "trajectory_writer.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <json.hpp>
#include <sstream>

using Clock = std::chrono::high_resolution_clock;
using Duration = std::chrono::duration<double>;
using json = nlohmann::json;

Simulation::Simulation(Config const& config)
    : config_(config)
    , params_(config.parameters())
    , initial_(config.initialState())
    , grid_(config.timeGrid())
    , options_(config.integratorOptions()) {
    config_.validate();
}

void Simulation::deriveResults(SimulationResults& results) const {
    auto const start = Clock::now();

    results.frames = deriveFrames(params_, results.trajectory, config_.simulation.thread_count);
    if (!results.frames.empty()) {
        results.final_trail = bobTrail(results.frames, results.frames.size() - 1,
                                       static_cast<size_t>(config_.output.trail_length));
        results.initial_energy = results.frames.front().energy;
    }
    results.energy_drift = metrics::maxRelativeEnergyDrift(params_, results.trajectory);

    results.timing.derive_seconds = Duration(Clock::now() - start).count();
}

SimulationResults Simulation::compute() {
    SimulationResults results;
    auto const start = Clock::now();

    Integrator integrator(options_);
    results.trajectory = integrator.integrate(params_, initial_, grid_, config_.deadline());
    results.solver = integrator.lastStats();
    results.timing.physics_seconds = Duration(Clock::now() - start).count();

    deriveResults(results);

    results.timing.total_seconds = Duration(Clock::now() - start).count();
    return results;
}

SimulationResults Simulation::run(std::string const& config_path) {
    auto const start = Clock::now();
    SimulationResults results;

    try {
        results = compute();
    } catch (DomainError const& err) {
        results.trajectory = err.partial();
        results.failure = RunFailure{err.reason(), err.what(), err.lastTime()};
        results.timing.physics_seconds = Duration(Clock::now() - start).count();
        deriveResults(results);

        std::cerr << "Integration failed (" << enum_utils::toString(err.reason()) << "): "
                  << err.what() << "\n";
        std::cerr << "Saving partial trajectory (" << results.trajectory.size() << " samples)\n";

        saveArtifacts(results, config_path);
        results.timing.total_seconds = Duration(Clock::now() - start).count();
        printSummary(results);
        throw;
    }

    saveArtifacts(results, config_path);
    results.timing.total_seconds = Duration(Clock::now() - start).count();
    printSummary(results);
    return results;
}

void Simulation::saveArtifacts(SimulationResults& results, std::string const& config_path) {
    auto const start = Clock::now();

    run_directory_ = createRunDirectory();
    results.output_directory = run_directory_;

    if (!config_path.empty()) {
        saveConfigCopy(config_path);
    }
    config_.save(run_directory_ + "/resolved_config.toml");

    if (config_.output.save_trajectory &&
        !trajectory_writer::saveTrajectoryCSV(run_directory_ + "/trajectory.csv", results.trajectory)) {
        std::cerr << "Warning: trajectory.csv is incomplete\n";
    }
    if (config_.output.save_frames &&
        !trajectory_writer::saveFramesCSV(run_directory_ + "/frames.csv", results.frames)) {
        std::cerr << "Warning: frames.csv is incomplete\n";
    }

    results.timing.io_seconds = Duration(Clock::now() - start).count();
    saveMetadata(results);
}

std::string Simulation::createRunDirectory() {
    std::string path;

    if (config_.output.mode == OutputMode::Direct) {
        path = config_.output.directory;
    } else {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm tm = *std::localtime(&time);

        std::ostringstream dir_name;
        dir_name << config_.output.directory << "/run_" << std::put_time(&tm, "%Y%m%d_%H%M%S");
        path = dir_name.str();
    }

    std::filesystem::create_directories(path);
    return path;
}

void Simulation::saveConfigCopy(std::string const& original_path) {
    if (std::filesystem::exists(original_path)) {
        std::filesystem::copy_file(original_path, run_directory_ + "/config.toml",
                                   std::filesystem::copy_options::overwrite_existing);
    }
}

void Simulation::saveMetadata(SimulationResults const& results) {
    std::ofstream out(run_directory_ + "/metadata.json");
    if (!out) {
        std::cerr << "Error: Could not write metadata.json in " << run_directory_ << "\n";
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time);
    std::ostringstream time_str;
    time_str << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");

    json j;
    j["version"] = "1.0";
    j["created_at"] = time_str.str();

    j["parameters"] = {
        {"length1", params_.L1()}, {"length2", params_.L2()}, {"mass1", params_.m1()},
        {"mass2", params_.m2()},   {"gravity", params_.g()},
    };
    j["initial_state"] = {
        {"theta1", initial_.theta1}, {"omega1", initial_.omega1},
        {"theta2", initial_.theta2}, {"omega2", initial_.omega2},
    };
    j["grid"] = {
        {"duration_seconds", grid_.span()},
        {"dt", grid_.dt()},
        {"samples", grid_.sampleCount()},
    };
    j["solver"] = {
        {"method", enum_utils::toString(options_.method)},
        {"rtol", options_.rtol},
        {"atol", options_.atol},
        {"max_dt", options_.max_dt},
        {"accepted_steps", results.solver.accepted_steps},
        {"rejected_steps", results.solver.rejected_steps},
        {"derivative_evaluations", results.solver.derivative_evaluations},
    };

    json trail = json::array();
    for (auto const& p : results.final_trail) {
        trail.push_back({p.x, p.y});
    }

    j["results"] = {
        {"completed", results.completed()},
        {"samples_completed", results.trajectory.size()},
        {"initial_energy", results.initial_energy},
        {"energy_drift", results.energy_drift},
        {"final_trail", trail},
    };
    if (results.failure) {
        j["results"]["failure"] = {
            {"reason", enum_utils::toString(results.failure->reason)},
            {"message", results.failure->message},
            {"last_time", results.failure->last_time},
        };
    } else {
        j["results"]["failure"] = nullptr;
    }

    j["timing"] = {
        {"total_seconds", results.timing.total_seconds},
        {"physics_seconds", results.timing.physics_seconds},
        {"derive_seconds", results.timing.derive_seconds},
        {"io_seconds", results.timing.io_seconds},
    };

    out << j.dump(2) << "\n";
}

void Simulation::printSummary(SimulationResults const& results) const {
    std::cout << "\n";
    if (results.completed()) {
        std::cout << "=== Simulation Complete ===\n";
    } else {
        std::cout << "=== Simulation Stopped (" << enum_utils::toString(results.failure->reason)
                  << " at t=" << results.failure->last_time << "s) ===\n";
    }

    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Samples:      " << results.trajectory.size() << "/" << grid_.sampleCount() << "\n";
    std::cout << "Solver:       " << enum_utils::toString(options_.method) << ", "
              << results.solver.accepted_steps << " accepted / " << results.solver.rejected_steps
              << " rejected steps\n";
    std::cout << "Energy:       E0=" << results.initial_energy << " J, max drift "
              << std::setprecision(6) << (results.energy_drift * 100.0) << "%\n";
    std::cout << std::setprecision(3);
    std::cout << "Total time:   " << results.timing.total_seconds << "s\n";
    std::cout << "  Physics:    " << results.timing.physics_seconds << "s\n";
    std::cout << "  Derive:     " << results.timing.derive_seconds << "s\n";
    std::cout << "  I/O:        " << results.timing.io_seconds << "s\n";
    if (!results.output_directory.empty()) {
        std::cout << "Output:       " << results.output_directory << "/\n";
    }
    std::cout << std::defaultfloat;
}
