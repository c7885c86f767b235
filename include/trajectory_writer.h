#pragma once

#include "derived.h"
#include "trajectory.h"

#include <filesystem>
#include <ostream>
#include <vector>

// Plain-text exports for external plotting / animation tools.
// Written at full double precision so re-plotting matches the run exactly.

namespace trajectory_writer {

// Header: time,theta1,omega1,theta2,omega2
void writeTrajectoryCSV(std::ostream& out, Trajectory const& trajectory);

// Header: time,x1,y1,x2,y2,energy
void writeFramesCSV(std::ostream& out, std::vector<DerivedFrame> const& frames);

// File variants return false (and log to stderr) when the file cannot be opened
bool saveTrajectoryCSV(std::filesystem::path const& path, Trajectory const& trajectory);
bool saveFramesCSV(std::filesystem::path const& path, std::vector<DerivedFrame> const& frames);

} // namespace trajectory_writer
