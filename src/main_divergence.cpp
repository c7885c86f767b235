// Sensitivity-to-initial-conditions demo for the double pendulum
//
// Runs the configured pendulum twice, the second time with theta2 nudged by
// epsilon, and reports how fast the two bobs separate.
//
// Usage:
//   ./pendulum-divergence [options]
//
// Options:
//   --config <path>      Config file for simulation parameters
//   --set <key>=<value>  Override a config parameter (repeatable)
//   --epsilon <rad>      Perturbation added to theta2 (default: 1e-4)
//   --factor <x>         Report when separation exceeds factor * epsilon (default: 10)
//   --output <path>      Output CSV with per-sample separation
//   -h, --help           Show this help

#include "config.h"
#include "metrics/trajectory_metrics.h"
#include "simulation.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

void printUsage(char const* program) {
    std::cout << "Double Pendulum Divergence\n\n"
              << "Usage: " << program << " [options]\n\n"
              << "Options:\n"
              << "  --config <path>      Config file for simulation parameters\n"
              << "  --set <key>=<value>  Override a config parameter (repeatable)\n"
              << "  --epsilon <rad>      Perturbation added to theta2 (default: 1e-4)\n"
              << "  --factor <x>         Report when separation exceeds factor * epsilon (default: 10)\n"
              << "  --output <path>      Output CSV with per-sample separation\n"
              << "  -h, --help           Show this help\n";
}

void writeDivergenceCSV(std::string const& path, metrics::MetricSeries<double> const& distance) {
    std::ofstream out(path);
    if (!out) {
        std::cerr << "Error: Could not open " << path << " for writing\n";
        return;
    }
    out.precision(std::numeric_limits<double>::max_digits10);
    out << "time,distance,log10_distance\n";
    for (size_t i = 0; i < distance.size(); ++i) {
        double const d = distance[i];
        out << distance.timeAt(i) << "," << d << "," << (d > 0.0 ? std::log10(d) : -INFINITY)
            << "\n";
    }
    std::cout << "Separation written to " << path << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::string output_path;
    double epsilon = 1e-4;
    double factor = 10.0;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--set" && i + 1 < argc) {
                std::string kv = argv[++i];
                auto eq_pos = kv.find('=');
                if (eq_pos == std::string::npos) {
                    std::cerr << "Invalid --set argument (missing '='): " << kv << "\n";
                    return 1;
                }
                overrides.emplace_back(kv.substr(0, eq_pos), kv.substr(eq_pos + 1));
            } else if (arg == "--epsilon" && i + 1 < argc) {
                epsilon = std::stod(argv[++i]);
            } else if (arg == "--factor" && i + 1 < argc) {
                factor = std::stod(argv[++i]);
            } else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }
    } catch (std::exception const& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << "\n";
        return 1;
    }

    if (!(epsilon > 0.0) || !(factor > 1.0)) {
        std::cerr << "Error: --epsilon must be positive and --factor greater than 1\n";
        return 1;
    }

    try {
        Config config;
        if (!config_path.empty()) {
            std::cout << "Loading config: " << config_path << "\n";
            config = Config::load(config_path);
        } else if (fs::exists("config/default.toml")) {
            std::cout << "Loading config: config/default.toml\n";
            config = Config::load("config/default.toml");
        } else {
            std::cout << "Using default configuration\n";
        }

        for (auto const& [key, value] : overrides) {
            if (!config.applyOverride(key, value)) {
                return 1;
            }
        }

        Config perturbed = config;
        perturbed.physics.initial_angle2 += epsilon;

        std::cout << "\nDivergence Analysis Configuration:\n";
        std::cout << "  Initial angles: " << std::fixed << std::setprecision(4)
                  << rad2deg(config.physics.initial_angle1) << " deg, "
                  << rad2deg(config.physics.initial_angle2) << " deg\n";
        std::cout << std::scientific << std::setprecision(2);
        std::cout << "  Perturbation:   " << epsilon << " rad on theta2\n";
        std::cout << std::defaultfloat;
        std::cout << "  Duration:       " << config.simulation.duration_seconds << "s, dt="
                  << config.simulation.dt << "s\n\n";

        Simulation reference(config);
        Simulation nudged(perturbed);
        auto const a = reference.compute();
        auto const b = nudged.compute();

        auto const distance = metrics::bobDivergence(a.frames, b.frames);
        double const initial = distance.empty() ? 0.0 : distance[0];
        double const threshold = factor * epsilon;

        std::cout << "Time (s)   Separation (m)\n";
        std::cout << "--------   --------------\n";
        size_t const stride =
            std::max<size_t>(1, static_cast<size_t>(std::llround(1.0 / config.simulation.dt)));
        for (size_t i = 0; i < distance.size(); i += stride) {
            std::cout << std::fixed << std::setprecision(2) << std::setw(8) << distance.timeAt(i)
                      << "   " << std::scientific << std::setprecision(3) << distance[i] << "\n";
        }
        std::cout << std::defaultfloat << "\n";

        std::cout << "Initial separation:  " << initial << " m\n";
        std::cout << "Maximum separation:  " << distance.max() << " m\n";
        std::cout << "Energy drift:        " << a.energy_drift * 100.0 << "% / "
                  << b.energy_drift * 100.0 << "%\n";

        if (auto crossing = distance.firstAbove(threshold)) {
            std::cout << "Separation exceeded " << threshold << " m (" << factor
                      << "x epsilon) at t=" << crossing->time << "s\n";
            if (initial > 0.0 && crossing->time > 0.0) {
                double const rate = std::log(crossing->value / initial) / crossing->time;
                std::cout << "Mean exponential growth rate until then: " << rate << " 1/s\n";
            }
        } else {
            std::cout << "Separation stayed below " << threshold << " m: no chaos signature\n";
        }

        if (!output_path.empty()) {
            writeDivergenceCSV(output_path, distance);
        }
    } catch (ConfigurationError const& err) {
        std::cerr << "Configuration error in '" << err.field() << "': " << err.what() << "\n";
        return 1;
    } catch (DomainError const& err) {
        std::cerr << "Simulation failed at t=" << err.lastTime() << "s: " << err.what() << "\n";
        return 2;
    }

    return 0;
}
