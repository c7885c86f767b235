#pragma once

#include "errors.h"
#include "pendulum.h"
#include "trajectory.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

// Uniform output grid over [0, t_span): round(t_span / dt) samples at i*dt
class TimeGrid {
public:
    // Largest grid accepted; 100M samples is about 4 GB of trajectory
    static constexpr size_t kMaxSamples = 100'000'000;

    TimeGrid(double t_span, double dt);

    double span() const { return t_span_; }
    double dt() const { return dt_; }
    size_t sampleCount() const { return count_; }

    // Computed from the index rather than accumulated, so runs are reproducible
    double timeAt(size_t i) const { return static_cast<double>(i) * dt_; }

private:
    double t_span_;
    double dt_;
    size_t count_;
};

enum class IntegrationMethod {
    DormandPrince, // Adaptive embedded RK 5(4), the default
    Rk4            // Classic fixed-step RK4 with substeps bounded by max_dt
};

struct IntegratorOptions {
    IntegrationMethod method = IntegrationMethod::DormandPrince;

    // Adaptive stepping
    double rtol = 1e-9;
    double atol = 1e-9;
    double initial_step = 1e-3;
    double min_step = 1e-12;
    double max_step = 0.0; // 0 = bounded only by the output spacing

    // Fixed stepping
    double max_dt = 0.007;

    // Throws ConfigurationError for non-positive tolerances or step bounds
    void validate() const;
};

// Caller-supplied budget for one run. Checked before every step attempt.
struct Deadline {
    std::optional<std::chrono::steady_clock::time_point> wall_clock;
    std::optional<size_t> max_steps;

    static Deadline none() { return {}; }
    static Deadline after(std::chrono::steady_clock::duration budget) {
        return {std::chrono::steady_clock::now() + budget, std::nullopt};
    }
    static Deadline steps(size_t count) { return {std::nullopt, count}; }
};

// Per-run solver counters, useful for profiling tolerance choices
struct IntegrationStats {
    size_t accepted_steps = 0;
    size_t rejected_steps = 0;
    size_t derivative_evaluations = 0;
};

class Integrator {
public:
    explicit Integrator(IntegratorOptions options = {});

    // Solve the initial value problem on the grid. The first sample is the
    // initial state at t = 0. Throws ConfigurationError for a non-finite
    // initial state and DomainError when the solver cannot continue.
    Trajectory integrate(PendulumParameters const& params, State const& initial,
                         TimeGrid const& grid, Deadline const& deadline = Deadline::none());

    IntegratorOptions const& options() const { return options_; }
    IntegrationStats const& lastStats() const { return stats_; }

private:
    IntegratorOptions options_;
    IntegrationStats stats_;

    void integrateAdaptive(DoublePendulum const& model, TimeGrid const& grid,
                           Deadline const& deadline, std::vector<Sample>& samples);
    void integrateFixed(DoublePendulum const& model, TimeGrid const& grid,
                        Deadline const& deadline, std::vector<Sample>& samples);

    void checkDeadline(Deadline const& deadline, double t, std::vector<Sample> const& samples) const;
};

// Convenience wrapper with default options
Trajectory integrate(PendulumParameters const& params, State const& initial, double t_span,
                     double dt);
