#pragma once

#include "integrator.h"
#include "pendulum.h"
#include "state.h"

#include <chrono>
#include <cmath>
#include <string>

struct PhysicsParams {
    double gravity = 9.81;
    double length1 = 1.0;
    double length2 = 1.0;
    double mass1 = 1.0;
    double mass2 = 1.0;
    double initial_angle1 = M_PI / 2;       // radians
    double initial_angle2 = M_PI / 2 + 0.1; // radians
    double initial_velocity1 = 0.0;         // rad/s
    double initial_velocity2 = 0.0;         // rad/s
};

// Fixed-step quality presets for the RK4 method.
// Each maps to the largest substep the integrator may take.
enum class PhysicsQuality {
    Low,    // max_dt = 0.020
    Medium, // max_dt = 0.012
    High,   // max_dt = 0.007
    Ultra,  // max_dt = 0.003
    Custom  // Use explicit max_dt value
};

inline double qualityToMaxDt(PhysicsQuality quality) {
    switch (quality) {
    case PhysicsQuality::Low:
        return 0.020;
    case PhysicsQuality::Medium:
        return 0.012;
    case PhysicsQuality::High:
        return 0.007;
    case PhysicsQuality::Ultra:
        return 0.003;
    case PhysicsQuality::Custom:
        return 0.007;
    }
    return 0.007;
}

struct SimulationParams {
    double duration_seconds = 20.0; // t_span
    double dt = 0.02;               // output sample spacing

    IntegrationMethod method = IntegrationMethod::DormandPrince;
    double rtol = 1e-9;
    double atol = 1e-9;

    PhysicsQuality physics_quality = PhysicsQuality::High;
    double max_dt = 0.007;

    // Run budget, 0 = unlimited
    long max_steps = 0;
    double max_wall_seconds = 0.0;

    int thread_count = 0; // 0 = auto, used for the derived-frame map

    size_t sampleCount() const {
        return dt > 0 ? static_cast<size_t>(std::llround(duration_seconds / dt)) : 0;
    }
};

// Output directory mode: a fresh run_YYYYMMDD_HHMMSS per run, or write in place
enum class OutputMode { Timestamped, Direct };

struct OutputParams {
    std::string directory = "output";
    OutputMode mode = OutputMode::Timestamped;
    int trail_length = 200;
    bool save_trajectory = true;
    bool save_frames = true;
};

struct Config {
    PhysicsParams physics;
    SimulationParams simulation;
    OutputParams output;

    // Load from TOML file; a missing file falls back to defaults, a parse
    // error throws ConfigurationError naming the file
    static Config load(std::string const& path);

    static Config defaults();

    // Save resolved values as TOML (angles in degrees, like the input)
    void save(std::string const& path) const;

    // Apply a parameter override from CLI (e.g., "physics.length1", "1.5").
    // Returns true if the key was recognized and the value parsed.
    bool applyOverride(std::string const& key, std::string const& value);

    // Throw ConfigurationError naming the first invalid key
    void validate() const;

    // Validated views for the core. Each throws ConfigurationError.
    PendulumParameters parameters() const;
    State initialState() const;
    TimeGrid timeGrid() const;
    IntegratorOptions integratorOptions() const;
    Deadline deadline() const;
};
