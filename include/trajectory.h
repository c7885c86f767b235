#pragma once

#include "state.h"

#include <cstddef>
#include <span>
#include <utility>
#include <vector>

struct Sample {
    double time = 0.0;
    State state;
};

// Ordered (time, State) series produced by one integration run.
// Read-only once built; derived data is computed from it, never written back.
class Trajectory {
public:
    using const_iterator = std::vector<Sample>::const_iterator;

    Trajectory() = default;
    explicit Trajectory(std::vector<Sample> samples) : samples_(std::move(samples)) {}

    size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }

    Sample const& operator[](size_t i) const { return samples_[i]; }
    Sample const& front() const { return samples_.front(); }
    Sample const& back() const { return samples_.back(); }

    const_iterator begin() const { return samples_.begin(); }
    const_iterator end() const { return samples_.end(); }

    std::span<Sample const> samples() const { return std::span<Sample const>(samples_); }

    // Duration covered by the samples (0 for fewer than two)
    double duration() const { return samples_.size() < 2 ? 0.0 : samples_.back().time - samples_.front().time; }

private:
    std::vector<Sample> samples_;
};
