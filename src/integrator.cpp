#include "integrator.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <string>

namespace {

// Dormand-Prince 5(4) tableau
constexpr double c2 = 1.0 / 5, c3 = 3.0 / 10, c4 = 4.0 / 5, c5 = 8.0 / 9;
constexpr double a21 = 1.0 / 5;
constexpr double a31 = 3.0 / 40, a32 = 9.0 / 40;
constexpr double a41 = 44.0 / 45, a42 = -56.0 / 15, a43 = 32.0 / 9;
constexpr double a51 = 19372.0 / 6561, a52 = -25360.0 / 2187, a53 = 64448.0 / 6561,
                 a54 = -212.0 / 729;
constexpr double a61 = 9017.0 / 3168, a62 = -355.0 / 33, a63 = 46732.0 / 5247, a64 = 49.0 / 176,
                 a65 = -5103.0 / 18656;

// 5th-order weights (also row 7 of the tableau, which gives FSAL)
constexpr double b1 = 35.0 / 384, b3 = 500.0 / 1113, b4 = 125.0 / 192, b5 = -2187.0 / 6784,
                 b6 = 11.0 / 84;

// Difference between the 5th- and embedded 4th-order weights
constexpr double e1 = 71.0 / 57600, e3 = -71.0 / 16695, e4 = 71.0 / 1920, e5 = -17253.0 / 339200,
                 e6 = 22.0 / 525, e7 = -1.0 / 40;

constexpr double SAFETY = 0.9;
constexpr double MIN_FACTOR = 0.2;
constexpr double MAX_FACTOR = 5.0;

// Hairer-style RMS norm of the local error, scaled per component
double errorNorm(State const& err, State const& y0, State const& y1, double atol, double rtol) {
    auto term = [&](double e, double a, double b) {
        double const sc = atol + rtol * std::max(std::abs(a), std::abs(b));
        double const r = e / sc;
        return r * r;
    };
    double const sum = term(err.theta1, y0.theta1, y1.theta1) +
                       term(err.omega1, y0.omega1, y1.omega1) +
                       term(err.theta2, y0.theta2, y1.theta2) +
                       term(err.omega2, y0.omega2, y1.omega2);
    return std::sqrt(sum / 4.0);
}

State rk4Step(DoublePendulum const& f, State const& y, double h) {
    State const k1 = f(y);
    State const k2 = f(y + (h / 2) * k1);
    State const k3 = f(y + (h / 2) * k2);
    State const k4 = f(y + h * k3);
    return y + (h / 6.0) * (k1 + 2.0 * k2 + 2.0 * k3 + k4);
}

std::string describeTime(double t) {
    std::ostringstream ss;
    ss << "t=" << t << "s";
    return ss.str();
}

} // namespace

TimeGrid::TimeGrid(double t_span, double dt) : t_span_(t_span), dt_(dt), count_(0) {
    if (!std::isfinite(t_span) || t_span <= 0.0) {
        throw ConfigurationError("simulation.duration_seconds",
                                 "must be a positive number of seconds, got " + std::to_string(t_span));
    }
    if (!std::isfinite(dt) || dt <= 0.0) {
        throw ConfigurationError("simulation.dt", "must be positive, got " + std::to_string(dt));
    }
    if (dt > t_span) {
        throw ConfigurationError("simulation.dt", "must not exceed duration_seconds (" +
                                                      std::to_string(dt) + " > " +
                                                      std::to_string(t_span) + ")");
    }
    double const ratio = t_span / dt;
    if (!(ratio < static_cast<double>(kMaxSamples))) {
        throw ConfigurationError("simulation.dt", "grid of " + std::to_string(ratio) +
                                                      " samples exceeds the limit of " +
                                                      std::to_string(kMaxSamples));
    }
    count_ = static_cast<size_t>(std::llround(ratio));
}

void IntegratorOptions::validate() const {
    if (!(rtol > 0.0) || !std::isfinite(rtol)) {
        throw ConfigurationError("simulation.rtol", "must be positive");
    }
    if (!(atol > 0.0) || !std::isfinite(atol)) {
        throw ConfigurationError("simulation.atol", "must be positive");
    }
    if (!(initial_step > 0.0)) {
        throw ConfigurationError("simulation.initial_step", "must be positive");
    }
    if (!(min_step > 0.0)) {
        throw ConfigurationError("simulation.min_step", "must be positive");
    }
    if (max_step < 0.0) {
        throw ConfigurationError("simulation.max_step", "must be zero (unbounded) or positive");
    }
    if (!(max_dt > 0.0)) {
        throw ConfigurationError("simulation.max_dt", "must be positive");
    }
}

Integrator::Integrator(IntegratorOptions options) : options_(options) {
    options_.validate();
}

Trajectory Integrator::integrate(PendulumParameters const& params, State const& initial,
                                 TimeGrid const& grid, Deadline const& deadline) {
    if (!initial.isFinite()) {
        throw ConfigurationError("physics.initial_state", "angles and velocities must be finite");
    }

    stats_ = IntegrationStats{};

    std::vector<Sample> samples;
    samples.reserve(grid.sampleCount());
    samples.push_back({0.0, initial});

    DoublePendulum const model(params);

    switch (options_.method) {
    case IntegrationMethod::DormandPrince:
        integrateAdaptive(model, grid, deadline, samples);
        break;
    case IntegrationMethod::Rk4:
        integrateFixed(model, grid, deadline, samples);
        break;
    }

    return Trajectory(std::move(samples));
}

void Integrator::checkDeadline(Deadline const& deadline, double t,
                               std::vector<Sample> const& samples) const {
    size_t const attempts = stats_.accepted_steps + stats_.rejected_steps;
    if (deadline.max_steps && attempts >= *deadline.max_steps) {
        throw DomainError(DomainErrorReason::DeadlineExceeded,
                          "step budget of " + std::to_string(*deadline.max_steps) +
                              " exhausted at " + describeTime(t),
                          t, Trajectory(samples));
    }
    if (deadline.wall_clock && std::chrono::steady_clock::now() > *deadline.wall_clock) {
        throw DomainError(DomainErrorReason::DeadlineExceeded,
                          "wall-clock deadline exceeded at " + describeTime(t), t,
                          Trajectory(samples));
    }
}

void Integrator::integrateAdaptive(DoublePendulum const& f, TimeGrid const& grid,
                                   Deadline const& deadline, std::vector<Sample>& samples) {
    double t = 0.0;
    State y = samples.front().state;

    State k1 = f(y);
    stats_.derivative_evaluations++;
    if (!k1.isFinite()) {
        throw DomainError(DomainErrorReason::NonFiniteState,
                          "derivative is not finite at the initial state", t, Trajectory(samples));
    }

    double h = std::min(options_.initial_step, grid.dt());
    if (options_.max_step > 0.0) {
        h = std::min(h, options_.max_step);
    }

    for (size_t i = 1; i < grid.sampleCount(); ++i) {
        double const target = grid.timeAt(i);

        while (t < target) {
            checkDeadline(deadline, t, samples);

            double const min_h =
                std::max(options_.min_step, 16.0 * std::numeric_limits<double>::epsilon() * std::abs(t));
            if (h < min_h) {
                throw DomainError(DomainErrorReason::StepSizeUnderflow,
                                  "step size " + std::to_string(h) + " fell below minimum at " +
                                      describeTime(t),
                                  t, Trajectory(samples));
            }

            // Land exactly on the output time; a step that would leave a
            // sliver behind is stretched to cover it
            double const remaining = target - t;
            bool const lands = h >= 0.99 * remaining;
            double const step = lands ? remaining : h;

            State const k2 = f(y + step * (a21 * k1));
            State const k3 = f(y + step * (a31 * k1 + a32 * k2));
            State const k4 = f(y + step * (a41 * k1 + a42 * k2 + a43 * k3));
            State const k5 = f(y + step * (a51 * k1 + a52 * k2 + a53 * k3 + a54 * k4));
            State const k6 = f(y + step * (a61 * k1 + a62 * k2 + a63 * k3 + a64 * k4 + a65 * k5));
            State const y_new = y + step * (b1 * k1 + b3 * k3 + b4 * k4 + b5 * k5 + b6 * k6);
            State const k7 = f(y_new);
            stats_.derivative_evaluations += 6;

            State const local_error =
                step * (e1 * k1 + e3 * k3 + e4 * k4 + e5 * k5 + e6 * k6 + e7 * k7);
            double const err = errorNorm(local_error, y, y_new, options_.atol, options_.rtol);

            bool const finite = y_new.isFinite() && k7.isFinite() && std::isfinite(err);
            if (finite && err <= 1.0) {
                stats_.accepted_steps++;
                t = lands ? target : t + step;
                y = y_new;
                k1 = k7;

                double const factor =
                    err == 0.0 ? MAX_FACTOR
                               : std::clamp(SAFETY * std::pow(err, -0.2), MIN_FACTOR, MAX_FACTOR);
                // A step shortened to hit the grid says nothing about the
                // controller's preferred size, so never shrink h because of it
                h = lands ? std::max(h, step * factor) : step * factor;
            } else {
                stats_.rejected_steps++;
                double const factor =
                    finite ? std::max(MIN_FACTOR, SAFETY * std::pow(err, -0.2)) : MIN_FACTOR;
                h = step * std::min(1.0, factor);
            }

            if (options_.max_step > 0.0) {
                h = std::min(h, options_.max_step);
            }
        }

        samples.push_back({target, y});
    }
}

void Integrator::integrateFixed(DoublePendulum const& f, TimeGrid const& grid,
                                Deadline const& deadline, std::vector<Sample>& samples) {
    int const substeps = std::max(1, static_cast<int>(std::ceil(grid.dt() / options_.max_dt)));
    double const h = grid.dt() / substeps;

    State y = samples.front().state;

    for (size_t i = 1; i < grid.sampleCount(); ++i) {
        double const start = grid.timeAt(i - 1);
        for (int s = 0; s < substeps; ++s) {
            double const t = start + s * h;
            checkDeadline(deadline, t, samples);

            y = rk4Step(f, y, h);
            stats_.accepted_steps++;
            stats_.derivative_evaluations += 4;

            if (!y.isFinite()) {
                throw DomainError(DomainErrorReason::NonFiniteState,
                                  "state diverged to a non-finite value at " + describeTime(t + h),
                                  t, Trajectory(samples));
            }
        }
        samples.push_back({grid.timeAt(i), y});
    }
}

Trajectory integrate(PendulumParameters const& params, State const& initial, double t_span,
                     double dt) {
    Integrator integrator;
    return integrator.integrate(params, initial, TimeGrid(t_span, dt));
}
