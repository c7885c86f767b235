#include "derived.h"
#include "integrator.h"

#include <gtest/gtest.h>

#include <cmath>
#include <numeric>
#include <vector>

namespace {

Trajectory makeTrajectory(std::vector<State> const& states, double dt = 0.1) {
    std::vector<Sample> samples;
    for (size_t i = 0; i < states.size(); ++i) {
        samples.push_back({static_cast<double>(i) * dt, states[i]});
    }
    return Trajectory(std::move(samples));
}

} // namespace

TEST(DerivedTest, PositionsAtRestHangBelowPivot) {
    PendulumParameters const p(1.5, 0.5, 1.0, 1.0);
    Point const joint = jointPosition(p, State{});
    Point const bob = bobPosition(p, State{});
    EXPECT_DOUBLE_EQ(joint.x, 0.0);
    EXPECT_DOUBLE_EQ(joint.y, -1.5);
    EXPECT_DOUBLE_EQ(bob.x, 0.0);
    EXPECT_DOUBLE_EQ(bob.y, -2.0);
}

TEST(DerivedTest, HorizontalArmsPointAlongX) {
    PendulumParameters const p(1.0, 2.0, 1.0, 1.0);
    State const s{M_PI / 2, 0.0, -M_PI / 2, 0.0};
    Point const joint = jointPosition(p, s);
    Point const bob = bobPosition(p, s);
    EXPECT_NEAR(joint.x, 1.0, 1e-12);
    EXPECT_NEAR(joint.y, 0.0, 1e-12);
    EXPECT_NEAR(bob.x, -1.0, 1e-12);
    EXPECT_NEAR(bob.y, 0.0, 1e-12);
}

TEST(DerivedTest, ArmLengthsArePreserved) {
    PendulumParameters const p(1.3, 0.9, 1.0, 1.0);
    State const s{2.1, 0.0, -0.4, 0.0};
    Point const joint = jointPosition(p, s);
    Point const bob = bobPosition(p, s);
    EXPECT_NEAR(std::hypot(joint.x, joint.y), 1.3, 1e-12);
    EXPECT_NEAR(std::hypot(bob.x - joint.x, bob.y - joint.y), 0.9, 1e-12);
}

TEST(DerivedTest, EnergyAtRestIsPotentialOnly) {
    PendulumParameters const p;
    EXPECT_DOUBLE_EQ(kineticEnergy(p, State{}), 0.0);
    // -(m1 + m2) g L1 - m2 g L2 = -3 g
    EXPECT_DOUBLE_EQ(potentialEnergy(p, State{}), -3.0 * 9.81);
    EXPECT_DOUBLE_EQ(totalEnergy(p, State{}), -3.0 * 9.81);
}

TEST(DerivedTest, KineticEnergyIncludesCouplingTerm) {
    PendulumParameters const p(1.0, 1.0, 2.0, 3.0);
    State const aligned{0.0, 1.0, 0.0, 1.0};
    State const opposed{0.0, 1.0, M_PI, 1.0};
    // 0.5*5 + 0.5*3 +/- 3
    EXPECT_NEAR(kineticEnergy(p, aligned), 7.0, 1e-12);
    EXPECT_NEAR(kineticEnergy(p, opposed), 1.0, 1e-12);
}

TEST(DerivedTest, KineticEnergyMatchesBobVelocities) {
    PendulumParameters const p(1.2, 0.7, 0.8, 1.9);
    State const s{0.6, 1.4, -1.3, -2.2};
    double const v1x = p.L1() * s.omega1 * std::cos(s.theta1);
    double const v1y = p.L1() * s.omega1 * std::sin(s.theta1);
    double const v2x = v1x + p.L2() * s.omega2 * std::cos(s.theta2);
    double const v2y = v1y + p.L2() * s.omega2 * std::sin(s.theta2);
    double const expected = 0.5 * p.m1() * (v1x * v1x + v1y * v1y) +
                            0.5 * p.m2() * (v2x * v2x + v2y * v2y);
    EXPECT_NEAR(kineticEnergy(p, s), expected, 1e-12);
}

TEST(DerivedTest, DeriveFrameCombinesAllQuantities) {
    PendulumParameters const p;
    Sample const sample{1.25, State{0.3, 0.1, 0.9, -0.4}};
    DerivedFrame const frame = deriveFrame(p, sample);
    EXPECT_EQ(frame.time, 1.25);
    EXPECT_EQ(frame.joint.x, jointPosition(p, sample.state).x);
    EXPECT_EQ(frame.bob.y, bobPosition(p, sample.state).y);
    EXPECT_EQ(frame.energy, totalEnergy(p, sample.state));
}

TEST(DerivedTest, ParallelMapMatchesSerialInOrder) {
    PendulumParameters const p;
    Trajectory const traj = integrate(p, State{M_PI / 2, 0.0, M_PI / 2 + 0.1, 0.0}, 5.0, 0.01);

    for (int threads : {1, 3, 7, 0}) {
        auto const frames = deriveFrames(p, traj, threads);
        ASSERT_EQ(frames.size(), traj.size());
        for (size_t i = 0; i < traj.size(); ++i) {
            DerivedFrame const expected = deriveFrame(p, traj[i]);
            EXPECT_EQ(frames[i].time, expected.time);
            EXPECT_EQ(frames[i].bob.x, expected.bob.x);
            EXPECT_EQ(frames[i].bob.y, expected.bob.y);
            EXPECT_EQ(frames[i].energy, expected.energy);
        }
    }
}

TEST(DerivedTest, ParallelMapHandlesTinyInputs) {
    PendulumParameters const p;
    EXPECT_TRUE(deriveFrames(p, Trajectory{}, 4).empty());

    Trajectory const two = makeTrajectory({State{}, State{0.1, 0.0, 0.1, 0.0}});
    auto const frames = deriveFrames(p, two, 16);
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_DOUBLE_EQ(frames[1].time, 0.1);

    // Negative counts fall back to hardware concurrency
    auto const automatic = deriveFrames(p, two, -3);
    ASSERT_EQ(automatic.size(), 2u);
    EXPECT_EQ(automatic[1].energy, frames[1].energy);
}

TEST(DerivedTest, BobTrailKeepsMostRecentPoints) {
    std::vector<DerivedFrame> frames(10);
    for (size_t i = 0; i < frames.size(); ++i) {
        frames[i].bob = {static_cast<double>(i), 0.0};
    }

    auto const trail = bobTrail(frames, 6, 3);
    ASSERT_EQ(trail.size(), 3u);
    EXPECT_EQ(trail.front().x, 4.0);
    EXPECT_EQ(trail.back().x, 6.0);

    EXPECT_EQ(bobTrail(frames, 1, 5).size(), 2u);
    EXPECT_EQ(bobTrail(frames, 99, 4).back().x, 9.0);
    EXPECT_TRUE(bobTrail(frames, 5, 0).empty());
    EXPECT_TRUE(bobTrail({}, 0).empty());
}

TEST(EnergySeriesTest, EvaluatesLazilyPerSample) {
    PendulumParameters const p;
    Trajectory const traj =
        makeTrajectory({State{}, State{0.5, 0.0, 0.0, 0.0}, State{0.0, 1.0, 0.0, 0.0}});
    EnergySeries const series(p, traj);

    ASSERT_EQ(series.size(), 3u);
    std::vector<double> values(series.begin(), series.end());
    ASSERT_EQ(values.size(), 3u);
    for (size_t i = 0; i < traj.size(); ++i) {
        EXPECT_EQ(values[i], totalEnergy(p, traj[i].state));
        EXPECT_EQ(series[i], values[i]);
    }
}

TEST(EnergySeriesTest, WorksWithStandardAlgorithms) {
    PendulumParameters const p;
    Trajectory const traj = makeTrajectory({State{}, State{}, State{}});
    EnergySeries const series(p, traj);
    double const sum = std::accumulate(series.begin(), series.end(), 0.0);
    EXPECT_NEAR(sum, 3.0 * -3.0 * 9.81, 1e-12);
}
