#pragma once

#include "pendulum.h"
#include "trajectory.h"

#include <cstddef>
#include <iterator>
#include <vector>

struct Point {
    double x = 0.0;
    double y = 0.0;
};

// Everything a renderer needs for one sample. y points up; the pivot is the origin.
struct DerivedFrame {
    double time = 0.0;
    Point joint; // End of arm 1
    Point bob;   // End of arm 2
    double energy = 0.0;
};

Point jointPosition(PendulumParameters const& p, State const& s);
Point bobPosition(PendulumParameters const& p, State const& s);

// Energy of both bobs, potential referenced to the pivot height.
// Kinetic energy includes the m2*L1*L2*w1*w2*cos(theta1 - theta2) coupling term.
double kineticEnergy(PendulumParameters const& p, State const& s);
double potentialEnergy(PendulumParameters const& p, State const& s);
double totalEnergy(PendulumParameters const& p, State const& s);

DerivedFrame deriveFrame(PendulumParameters const& p, Sample const& sample);

// Map every sample of a trajectory to its frame.
// thread_count <= 0 uses hardware concurrency; output order matches the trajectory.
std::vector<DerivedFrame> deriveFrames(PendulumParameters const& p, Trajectory const& trajectory,
                                       int thread_count = 0);

// Bob positions for the animation trail ending at frame `index`, oldest first.
// At most max_length points.
std::vector<Point> bobTrail(std::vector<DerivedFrame> const& frames, size_t index,
                            size_t max_length = 200);

// Lazily evaluated total energy per sample. Holds references: the trajectory
// must outlive the series.
class EnergySeries {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = double;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = double;

        iterator() = default;
        iterator(PendulumParameters const* p, Trajectory::const_iterator it) : params_(p), it_(it) {}

        double operator*() const { return totalEnergy(*params_, it_->state); }
        iterator& operator++() {
            ++it_;
            return *this;
        }
        iterator operator++(int) {
            iterator copy = *this;
            ++it_;
            return copy;
        }
        bool operator==(iterator const& other) const { return it_ == other.it_; }

    private:
        PendulumParameters const* params_ = nullptr;
        Trajectory::const_iterator it_;
    };

    EnergySeries(PendulumParameters const& p, Trajectory const& trajectory)
        : params_(p), trajectory_(trajectory) {}

    iterator begin() const { return iterator(&params_, trajectory_.begin()); }
    iterator end() const { return iterator(&params_, trajectory_.end()); }

    size_t size() const { return trajectory_.size(); }
    double operator[](size_t i) const { return totalEnergy(params_, trajectory_[i].state); }

private:
    PendulumParameters params_;
    Trajectory const& trajectory_;
};
