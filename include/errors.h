#pragma once

#include "trajectory.h"

#include <stdexcept>
#include <string>
#include <utility>

// Invalid physical parameters, time grid or solver settings.
// Thrown before any integration work starts. field() names the config key
// (e.g. "physics.length1") so the CLI can point at the offending value.
class ConfigurationError : public std::invalid_argument {
public:
    ConfigurationError(std::string field, std::string const& message)
        : std::invalid_argument(field + ": " + message), field_(std::move(field)) {}

    std::string const& field() const { return field_; }

private:
    std::string field_;
};

enum class DomainErrorReason {
    StepSizeUnderflow, // Adaptive step collapsed below the representable minimum
    NonFiniteState,    // Solution blew up to inf/nan
    DeadlineExceeded   // Wall-clock or step budget supplied by the caller ran out
};

// Numerical integration failure. Carries everything computed up to the failure
// so callers can salvage the partial run.
class DomainError : public std::runtime_error {
public:
    DomainError(DomainErrorReason reason, std::string const& message, double last_time,
                Trajectory partial)
        : std::runtime_error(message)
        , reason_(reason)
        , last_time_(last_time)
        , partial_(std::move(partial)) {}

    DomainErrorReason reason() const { return reason_; }

    // Last time the solver reached (may lie between output samples)
    double lastTime() const { return last_time_; }

    // Output samples completed before the failure; always holds the initial sample
    Trajectory const& partial() const { return partial_; }

private:
    DomainErrorReason reason_;
    double last_time_;
    Trajectory partial_;
};
