#include "derived.h"

#include <algorithm>
#include <cmath>
#include <thread>

Point jointPosition(PendulumParameters const& p, State const& s) {
    return {p.L1() * std::sin(s.theta1), -p.L1() * std::cos(s.theta1)};
}

Point bobPosition(PendulumParameters const& p, State const& s) {
    Point const joint = jointPosition(p, s);
    return {joint.x + p.L2() * std::sin(s.theta2), joint.y - p.L2() * std::cos(s.theta2)};
}

double kineticEnergy(PendulumParameters const& p, State const& s) {
    double const L1 = p.L1();
    double const L2 = p.L2();
    double const w1 = s.omega1;
    double const w2 = s.omega2;

    return 0.5 * (p.m1() + p.m2()) * L1 * L1 * w1 * w1 + 0.5 * p.m2() * L2 * L2 * w2 * w2 +
           p.m2() * L1 * L2 * w1 * w2 * std::cos(s.theta1 - s.theta2);
}

double potentialEnergy(PendulumParameters const& p, State const& s) {
    return -(p.m1() + p.m2()) * p.g() * p.L1() * std::cos(s.theta1) -
           p.m2() * p.g() * p.L2() * std::cos(s.theta2);
}

double totalEnergy(PendulumParameters const& p, State const& s) {
    return kineticEnergy(p, s) + potentialEnergy(p, s);
}

DerivedFrame deriveFrame(PendulumParameters const& p, Sample const& sample) {
    DerivedFrame frame;
    frame.time = sample.time;
    frame.joint = jointPosition(p, sample.state);
    frame.bob = bobPosition(p, sample.state);
    frame.energy = totalEnergy(p, sample.state);
    return frame;
}

std::vector<DerivedFrame> deriveFrames(PendulumParameters const& p, Trajectory const& trajectory,
                                       int thread_count) {
    size_t const n = trajectory.size();
    std::vector<DerivedFrame> frames(n);
    if (n == 0) {
        return frames;
    }

    size_t workers = thread_count > 0 ? static_cast<size_t>(thread_count)
                                      : std::max(1u, std::thread::hardware_concurrency());
    workers = std::min(workers, n);
    size_t const chunk_size = n / workers;

    std::vector<std::thread> threads;
    threads.reserve(workers);

    // Each thread writes a disjoint slice of `frames`
    for (size_t t = 0; t < workers; ++t) {
        size_t start = t * chunk_size;
        size_t end = (t == workers - 1) ? n : start + chunk_size;

        threads.emplace_back([&, start, end]() {
            for (size_t i = start; i < end; ++i) {
                frames[i] = deriveFrame(p, trajectory[i]);
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    return frames;
}

std::vector<Point> bobTrail(std::vector<DerivedFrame> const& frames, size_t index,
                            size_t max_length) {
    if (frames.empty() || max_length == 0) {
        return {};
    }
    index = std::min(index, frames.size() - 1);
    size_t const count = std::min(max_length, index + 1);

    std::vector<Point> trail;
    trail.reserve(count);
    for (size_t i = index + 1 - count; i <= index; ++i) {
        trail.push_back(frames[i].bob);
    }
    return trail;
}
