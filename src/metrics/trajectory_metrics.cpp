#include "metrics/trajectory_metrics.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace metrics {

namespace {

StateComponent angleComponent(int arm) {
    if (arm == 1)
        return StateComponent::Theta1;
    if (arm == 2)
        return StateComponent::Theta2;
    throw std::invalid_argument("arm must be 1 or 2, got " + std::to_string(arm));
}

} // namespace

double componentOf(State const& s, StateComponent c) {
    switch (c) {
    case StateComponent::Theta1:
        return s.theta1;
    case StateComponent::Omega1:
        return s.omega1;
    case StateComponent::Theta2:
        return s.theta2;
    case StateComponent::Omega2:
        return s.omega2;
    }
    return 0.0;
}

MetricSeries<double> componentSeries(Trajectory const& trajectory, StateComponent c) {
    MetricSeries<double> series;
    series.reserve(trajectory.size());
    for (auto const& sample : trajectory) {
        series.push(sample.time, componentOf(sample.state, c));
    }
    return series;
}

MetricSeries<double> angleSeriesDegrees(Trajectory const& trajectory, int arm) {
    StateComponent const c = angleComponent(arm);
    MetricSeries<double> series;
    series.reserve(trajectory.size());
    for (auto const& sample : trajectory) {
        series.push(sample.time, rad2deg(componentOf(sample.state, c)));
    }
    return series;
}

std::vector<PhasePoint> phaseSpace(Trajectory const& trajectory, int arm) {
    angleComponent(arm); // validates arm

    std::vector<PhasePoint> points;
    points.reserve(trajectory.size());
    for (auto const& sample : trajectory) {
        State const& s = sample.state;
        points.push_back(arm == 1 ? PhasePoint{s.theta1, s.omega1} : PhasePoint{s.theta2, s.omega2});
    }
    return points;
}

MetricSeries<double> energySeries(PendulumParameters const& p, Trajectory const& trajectory) {
    EnergySeries lazy(p, trajectory);
    MetricSeries<double> series;
    series.reserve(lazy.size());
    size_t i = 0;
    for (double energy : lazy) {
        series.push(trajectory[i++].time, energy);
    }
    return series;
}

double maxRelativeEnergyDrift(PendulumParameters const& p, Trajectory const& trajectory) {
    if (trajectory.empty())
        return 0.0;

    auto const series = energySeries(p, trajectory);
    double const initial = series[0];
    double const drift = series.maxDeviationFrom(initial);
    return initial != 0.0 ? drift / std::abs(initial) : drift;
}

MetricSeries<double> bobDivergence(std::vector<DerivedFrame> const& a,
                                   std::vector<DerivedFrame> const& b) {
    size_t const n = std::min(a.size(), b.size());
    MetricSeries<double> series;
    series.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        double const dx = a[i].bob.x - b[i].bob.x;
        double const dy = a[i].bob.y - b[i].bob.y;
        series.push(a[i].time, std::hypot(dx, dy));
    }
    return series;
}

std::array<NormalMode, 2> normalModes(PendulumParameters const& p) {
    double const M1 = p.m1();
    double const M2 = p.m2();
    double const L1 = p.L1();
    double const L2 = p.L2();
    double const G = p.g();

    // Mass and stiffness matrix entries
    double const a = (M1 + M2) * L1 * L1;
    double const b = M2 * L1 * L2;
    double const c = M2 * L2 * L2;
    double const k1 = (M1 + M2) * G * L1;
    double const k2 = M2 * G * L2;

    // (ac - b^2) w^4 - (a k2 + c k1) w^2 + k1 k2 = 0, with ac - b^2 = m1 m2 L1^2 L2^2 > 0
    double const qa = a * c - b * b;
    double const qb = a * k2 + c * k1;
    double const qc = k1 * k2;
    double const disc = std::sqrt(qb * qb - 4.0 * qa * qc);

    std::array<double, 2> const lambdas = {(qb - disc) / (2.0 * qa), (qb + disc) / (2.0 * qa)};

    std::array<NormalMode, 2> modes;
    for (size_t i = 0; i < 2; ++i) {
        double const lambda = lambdas[i];
        modes[i].angular_frequency = std::sqrt(lambda);
        modes[i].amplitude_ratio = (k1 - lambda * a) / (lambda * b);
    }
    return modes;
}

std::optional<double> estimateAngularFrequency(Trajectory const& trajectory, StateComponent c) {
    auto const crossings = componentSeries(trajectory, c).upwardZeroCrossings();
    if (crossings.size() < 2)
        return std::nullopt;

    double const span = crossings.back() - crossings.front();
    if (span <= 0.0)
        return std::nullopt;

    double const periods = static_cast<double>(crossings.size() - 1);
    return 2.0 * M_PI * periods / span;
}

} // namespace metrics
