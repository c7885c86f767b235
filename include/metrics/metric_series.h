#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace metrics {

// Result of a threshold crossing detection
struct CrossingResult {
    size_t index = 0;  // Sample where the threshold was first crossed
    double time = 0.0; // Time of that sample
    double value = 0.0;
};

// Time-stamped scalar series derived from a trajectory (energy, divergence, angles)
template <typename T = double>
class MetricSeries {
public:
    using value_type = T;

    MetricSeries() = default;
    MetricSeries(std::vector<double> times, std::vector<T> values)
        : times_(std::move(times)), values_(std::move(values)) {}

    void push(double time, T value) {
        times_.push_back(time);
        values_.push_back(value);
    }

    void reserve(size_t n) {
        times_.reserve(n);
        values_.reserve(n);
    }

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    T const& operator[](size_t i) const { return values_[i]; }
    double timeAt(size_t i) const { return times_[i]; }

    std::span<T const> history() const { return std::span<T const>(values_); }
    std::vector<T> const& values() const { return values_; }
    std::vector<double> const& times() const { return times_; }

    T min() const {
        if (values_.empty())
            return T{};
        return *std::min_element(values_.begin(), values_.end());
    }

    T max() const {
        if (values_.empty())
            return T{};
        return *std::max_element(values_.begin(), values_.end());
    }

    T mean() const {
        if (values_.empty())
            return T{};
        return std::accumulate(values_.begin(), values_.end(), T{}) /
               static_cast<T>(values_.size());
    }

    // Largest |v - reference| over the series
    T maxDeviationFrom(T reference) const {
        T worst = T{};
        for (auto const& v : values_) {
            worst = std::max(worst, static_cast<T>(std::abs(v - reference)));
        }
        return worst;
    }

    // First sample whose value exceeds threshold
    std::optional<CrossingResult> firstAbove(T threshold) const {
        for (size_t i = 0; i < values_.size(); ++i) {
            if (values_[i] > threshold) {
                return CrossingResult{i, times_[i], static_cast<double>(values_[i])};
            }
        }
        return std::nullopt;
    }

    // Times of upward zero crossings, linearly interpolated between samples
    std::vector<double> upwardZeroCrossings() const {
        std::vector<double> crossings;
        for (size_t i = 1; i < values_.size(); ++i) {
            T const a = values_[i - 1];
            T const b = values_[i];
            if (a < T{} && b >= T{}) {
                double const frac = static_cast<double>(-a) / static_cast<double>(b - a);
                crossings.push_back(times_[i - 1] + frac * (times_[i] - times_[i - 1]));
            }
        }
        return crossings;
    }

private:
    std::vector<double> times_;
    std::vector<T> values_;
};

} // namespace metrics
