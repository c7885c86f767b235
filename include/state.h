#pragma once

#include <cmath>

// Instantaneous configuration of the double pendulum.
// Angles are measured from the downward vertical and are never wrapped:
// a full revolution shows up as theta growing past 2*pi.
struct State {
    double theta1 = 0.0; // rad
    double omega1 = 0.0; // rad/s
    double theta2 = 0.0; // rad
    double omega2 = 0.0; // rad/s

    bool isFinite() const {
        return std::isfinite(theta1) && std::isfinite(omega1) && std::isfinite(theta2) &&
               std::isfinite(omega2);
    }

    bool operator==(State const& other) const = default;
};

// Time derivative of a State, same ordering: (omega1, alpha1, omega2, alpha2)
using StateDerivative = State;

// Vector arithmetic used by the Runge-Kutta stages
inline State operator+(State const& a, State const& b) {
    return {a.theta1 + b.theta1, a.omega1 + b.omega1, a.theta2 + b.theta2, a.omega2 + b.omega2};
}

inline State operator-(State const& a, State const& b) {
    return {a.theta1 - b.theta1, a.omega1 - b.omega1, a.theta2 - b.theta2, a.omega2 - b.omega2};
}

inline State operator*(double s, State const& a) {
    return {s * a.theta1, s * a.omega1, s * a.theta2, s * a.omega2};
}

// Display-time transform into [-pi, pi). Never applied to trajectory data.
inline double wrapAngle(double theta) {
    double wrapped = std::fmod(theta + M_PI, 2.0 * M_PI);
    if (wrapped < 0.0) {
        wrapped += 2.0 * M_PI;
    }
    return wrapped - M_PI;
}

inline double deg2rad(double degrees) {
    return degrees * M_PI / 180.0;
}
inline double rad2deg(double radians) {
    return radians * 180.0 / M_PI;
}
