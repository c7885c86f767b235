#include "trajectory_writer.h"

#include <fstream>
#include <iostream>
#include <limits>

namespace trajectory_writer {

namespace {

void setFullPrecision(std::ostream& out) {
    out.precision(std::numeric_limits<double>::max_digits10);
}

} // namespace

void writeTrajectoryCSV(std::ostream& out, Trajectory const& trajectory) {
    setFullPrecision(out);
    out << "time,theta1,omega1,theta2,omega2\n";
    for (auto const& sample : trajectory) {
        State const& s = sample.state;
        out << sample.time << "," << s.theta1 << "," << s.omega1 << "," << s.theta2 << ","
            << s.omega2 << "\n";
    }
}

void writeFramesCSV(std::ostream& out, std::vector<DerivedFrame> const& frames) {
    setFullPrecision(out);
    out << "time,x1,y1,x2,y2,energy\n";
    for (auto const& f : frames) {
        out << f.time << "," << f.joint.x << "," << f.joint.y << "," << f.bob.x << "," << f.bob.y
            << "," << f.energy << "\n";
    }
}

bool saveTrajectoryCSV(std::filesystem::path const& path, Trajectory const& trajectory) {
    std::ofstream out(path);
    if (!out) {
        std::cerr << "Error: Could not open " << path << " for writing\n";
        return false;
    }
    writeTrajectoryCSV(out, trajectory);
    return static_cast<bool>(out);
}

bool saveFramesCSV(std::filesystem::path const& path, std::vector<DerivedFrame> const& frames) {
    std::ofstream out(path);
    if (!out) {
        std::cerr << "Error: Could not open " << path << " for writing\n";
        return false;
    }
    writeFramesCSV(out, frames);
    return static_cast<bool>(out);
}

} // namespace trajectory_writer
