#pragma once

#include "errors.h"
#include "state.h"

#include <cmath>
#include <string>

// Physical constants of one double pendulum. Immutable after construction;
// every field is validated to be finite and strictly positive.
class PendulumParameters {
public:
    PendulumParameters() : PendulumParameters(1.0, 1.0, 1.0, 1.0) {}

    PendulumParameters(double L1, double L2, double m1, double m2, double g = 9.81)
        : L1_(require("physics.length1", L1))
        , L2_(require("physics.length2", L2))
        , m1_(require("physics.mass1", m1))
        , m2_(require("physics.mass2", m2))
        , g_(require("physics.gravity", g)) {}

    double L1() const { return L1_; }
    double L2() const { return L2_; }
    double m1() const { return m1_; }
    double m2() const { return m2_; }
    double g() const { return g_; }

    bool operator==(PendulumParameters const& other) const = default;

private:
    double L1_, L2_, m1_, m2_, g_;

    static double require(char const* field, double value) {
        if (!std::isfinite(value)) {
            throw ConfigurationError(field, "must be finite");
        }
        if (value <= 0.0) {
            throw ConfigurationError(field, "must be positive, got " + std::to_string(value));
        }
        return value;
    }
};

// Shared denominator of both angular accelerations:
//   D = 2*m1 + m2 - m2*cos(2*(theta1 - theta2))
// Since cos <= 1, D >= 2*m1 for every state, and m1 > 0 is enforced by
// PendulumParameters, so the equations of motion are never singular.
inline double accelerationDenominator(PendulumParameters const& p, double theta1, double theta2) {
    return 2.0 * p.m1() + p.m2() - p.m2() * std::cos(2.0 * (theta1 - theta2));
}

inline double denominatorLowerBound(PendulumParameters const& p) {
    return 2.0 * p.m1();
}

// Equations of motion from the two-link pendulum Lagrangian.
// Returns (omega1, alpha1, omega2, alpha2) for the given state.
inline StateDerivative derivatives(PendulumParameters const& p, State const& s) {
    double const G = p.g();
    double const L1 = p.L1();
    double const L2 = p.L2();
    double const M1 = p.m1();
    double const M2 = p.m2();

    double const delta = s.theta1 - s.theta2;
    double const sin_delta = std::sin(delta);
    double const cos_delta = std::cos(delta);
    double const denom_factor = accelerationDenominator(p, s.theta1, s.theta2);

    double const num1 = -G * (2.0 * M1 + M2) * std::sin(s.theta1);
    double const num2 = -M2 * G * std::sin(s.theta1 - 2.0 * s.theta2);
    double const num3 = -2.0 * sin_delta * M2;
    double const num4 = s.omega2 * s.omega2 * L2 + s.omega1 * s.omega1 * L1 * cos_delta;
    double const a1 = (num1 + num2 + num3 * num4) / (L1 * denom_factor);

    double const n1 = 2.0 * sin_delta;
    double const n2 = s.omega1 * s.omega1 * L1 * (M1 + M2);
    double const n3 = G * (M1 + M2) * std::cos(s.theta1);
    double const n4 = s.omega2 * s.omega2 * L2 * M2 * cos_delta;
    double const a2 = (n1 * (n2 + n3 + n4)) / (L2 * denom_factor);

    return {s.omega1, a1, s.omega2, a2};
}

// Binds parameters to the derivative function for the integrator
class DoublePendulum {
public:
    explicit DoublePendulum(PendulumParameters params) : params_(params) {}

    PendulumParameters const& parameters() const { return params_; }

    StateDerivative operator()(State const& s) const { return derivatives(params_, s); }

private:
    PendulumParameters params_;
};
