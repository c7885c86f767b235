#pragma once

#include "config.h"
#include "derived.h"
#include "integrator.h"
#include "pendulum.h"
#include "trajectory.h"

#include <optional>
#include <string>
#include <vector>

// Timing results for profiling
struct TimingStats {
    double total_seconds = 0.0;
    double physics_seconds = 0.0;
    double derive_seconds = 0.0;
    double io_seconds = 0.0;
};

// Failure details recorded alongside a partial run
struct RunFailure {
    DomainErrorReason reason = DomainErrorReason::DeadlineExceeded;
    std::string message;
    double last_time = 0.0;
};

struct SimulationResults {
    Trajectory trajectory;
    std::vector<DerivedFrame> frames;
    std::vector<Point> final_trail; // Bob trail ending at the last frame
    double initial_energy = 0.0;
    double energy_drift = 0.0;      // max relative deviation from initial_energy
    IntegrationStats solver;
    TimingStats timing;
    std::optional<RunFailure> failure;
    std::string output_directory;   // Where artifacts were saved (empty for compute())

    bool completed() const { return !failure.has_value(); }
};

// Runs one configuration end to end: integrate, derive, export.
// The constructor validates the whole config and throws ConfigurationError
// before any integration work.
class Simulation {
public:
    explicit Simulation(Config const& config);

    // Headless: integrate and derive only, no I/O. DomainError propagates.
    SimulationResults compute();

    // compute() plus artifacts in the output directory. On DomainError the
    // partial trajectory is still exported, then the error is rethrown.
    // If config_path is given, that file is copied next to the artifacts.
    SimulationResults run(std::string const& config_path = "");

    PendulumParameters const& parameters() const { return params_; }
    TimeGrid const& grid() const { return grid_; }

private:
    Config config_;
    PendulumParameters params_;
    State initial_;
    TimeGrid grid_;
    IntegratorOptions options_;
    std::string run_directory_;

    void deriveResults(SimulationResults& results) const;

    // Output directory management
    std::string createRunDirectory();
    void saveConfigCopy(std::string const& config_path);
    void saveMetadata(SimulationResults const& results);
    void saveArtifacts(SimulationResults& results, std::string const& config_path);
    void printSummary(SimulationResults const& results) const;
};
