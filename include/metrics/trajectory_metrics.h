#pragma once

#include "derived.h"
#include "metrics/metric_series.h"
#include "pendulum.h"
#include "trajectory.h"

#include <array>
#include <optional>
#include <vector>

// Diagnostics computed from finished trajectories. Nothing here integrates;
// every function is a read-only pass over its inputs.

namespace metrics {

enum class StateComponent { Theta1, Omega1, Theta2, Omega2 };

double componentOf(State const& s, StateComponent c);

// One state component over time (raw radians / rad/s)
MetricSeries<double> componentSeries(Trajectory const& trajectory, StateComponent c);

// Arm angle in degrees, arm is 1 or 2
MetricSeries<double> angleSeriesDegrees(Trajectory const& trajectory, int arm);

struct PhasePoint {
    double theta = 0.0;
    double omega = 0.0;
};

// (theta, omega) pairs for one arm, in trajectory order
std::vector<PhasePoint> phaseSpace(Trajectory const& trajectory, int arm);

MetricSeries<double> energySeries(PendulumParameters const& p, Trajectory const& trajectory);

// max |E(t) - E(0)| / |E(0)|; falls back to the absolute drift when E(0) is 0
double maxRelativeEnergyDrift(PendulumParameters const& p, Trajectory const& trajectory);

// Euclidean distance between the two bobs sample by sample.
// Series are compared up to the shorter of the two.
MetricSeries<double> bobDivergence(std::vector<DerivedFrame> const& a,
                                   std::vector<DerivedFrame> const& b);

struct NormalMode {
    double angular_frequency = 0.0; // rad/s
    double amplitude_ratio = 0.0;   // theta2 / theta1 in this mode
};

// Small-angle normal modes of the linearized system, slow mode first.
// Solves det(K - w^2 M) = 0 with
//   M = [[(m1+m2) L1^2, m2 L1 L2], [m2 L1 L2, m2 L2^2]]
//   K = diag((m1+m2) g L1, m2 g L2)
std::array<NormalMode, 2> normalModes(PendulumParameters const& p);

// Angular frequency from the mean spacing of upward zero crossings.
// Needs at least two crossings.
std::optional<double> estimateAngularFrequency(Trajectory const& trajectory, StateComponent c);

} // namespace metrics
