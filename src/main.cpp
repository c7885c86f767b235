#include "config.h"
#include "enum_utils.h"
#include "simulation.h"

#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

void printUsage(char const* program) {
    std::cout << "Double Pendulum Simulation\n\n"
              << "Usage:\n"
              << "  " << program << " [config.toml] [options]  Run one simulation\n"
              << "  " << program << " -h, --help              Show this help\n\n"
              << "Options:\n"
              << "  --set <key>=<value>    Override config parameter (can be used multiple times)\n"
              << "  --output <dir>         Write artifacts directly into <dir>\n\n"
              << "Parameter keys use dot notation: section.parameter\n"
              << "  Sections: physics, simulation, output\n"
              << "  Methods:  ";
    for (auto const& name : enum_utils::names<IntegrationMethod>()) {
        std::cout << name << " ";
    }
    std::cout << "\n\n"
              << "Examples:\n"
              << "  " << program << " config/default.toml\n"
              << "  " << program << " config/default.toml --set physics.initial_angle2_deg=120\n"
              << "  " << program << " config/default.toml --set simulation.method=rk4 --set simulation.physics_quality=ultra\n";
}

// Parsed command-line options
struct CLIOptions {
    std::string config_path = "config/default.toml";
    std::vector<std::pair<std::string, std::string>> overrides;
    std::optional<std::string> output_directory;
};

// Parse --set key=value argument
std::optional<std::pair<std::string, std::string>> parseSetArg(std::string const& arg) {
    auto eq_pos = arg.find('=');
    if (eq_pos == std::string::npos) {
        std::cerr << "Invalid --set argument (missing '='): " << arg << "\n";
        return std::nullopt;
    }
    return std::make_pair(arg.substr(0, eq_pos), arg.substr(eq_pos + 1));
}

void printConfigSummary(Config const& config) {
    std::cout << "\n=== Double Pendulum Simulation ===\n\n";

    std::cout << "Physics:\n"
              << "  Gravity:        " << config.physics.gravity << " m/s^2\n"
              << "  Lengths:        L1=" << config.physics.length1 << "m, L2=" << config.physics.length2 << "m\n"
              << "  Masses:         M1=" << config.physics.mass1 << "kg, M2=" << config.physics.mass2 << "kg\n"
              << "  Initial angles: th1=" << rad2deg(config.physics.initial_angle1) << " deg, "
              << "th2=" << rad2deg(config.physics.initial_angle2) << " deg\n"
              << "  Initial rates:  w1=" << config.physics.initial_velocity1 << " rad/s, "
              << "w2=" << config.physics.initial_velocity2 << " rad/s\n\n";

    std::cout << "Simulation:\n"
              << "  Duration:       " << config.simulation.duration_seconds << "s, dt="
              << config.simulation.dt << "s (" << config.simulation.sampleCount() << " samples)\n"
              << "  Method:         " << enum_utils::toString(config.simulation.method);
    if (config.simulation.method == IntegrationMethod::Rk4) {
        std::cout << " (" << enum_utils::toString(config.simulation.physics_quality)
                  << ", max_dt=" << std::setprecision(1) << std::fixed
                  << (config.simulation.max_dt * 1000) << "ms)" << std::defaultfloat
                  << std::setprecision(6);
    } else {
        std::cout << " (rtol=" << config.simulation.rtol << ", atol=" << config.simulation.atol << ")";
    }
    std::cout << "\n\n";

    std::cout << "Output:\n"
              << "  Directory:      " << config.output.directory << "/\n\n";
}

int runSimulation(CLIOptions const& opts) {
    std::cout << "Loading config from: " << opts.config_path << "\n";

    try {
        Config config = Config::load(opts.config_path);

        for (auto const& [key, value] : opts.overrides) {
            if (!config.applyOverride(key, value)) {
                return 1;
            }
            std::cout << "Override: " << key << " = " << value << "\n";
        }
        if (opts.output_directory) {
            config.output.directory = *opts.output_directory;
            config.output.mode = OutputMode::Direct;
        }

        printConfigSummary(config);

        Simulation sim(config);
        sim.run(opts.config_path);
    } catch (ConfigurationError const& err) {
        std::cerr << "Configuration error in '" << err.field() << "': " << err.what() << "\n";
        return 1;
    } catch (DomainError const& err) {
        std::cerr << "Simulation failed at t=" << err.lastTime() << "s ("
                  << err.partial().size() << " samples kept): " << err.what() << "\n";
        return 2;
    } catch (std::exception const& err) {
        std::cerr << "Error: " << err.what() << "\n";
        return 1;
    }

    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CLIOptions opts;

    int first_option = 1;
    if (argc >= 2) {
        std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg.rfind("--", 0) != 0) {
            opts.config_path = arg;
            first_option = 2;
        }
    }

    for (int i = first_option; i < argc; ++i) {
        std::string opt = argv[i];
        if (opt == "--set" && i + 1 < argc) {
            auto parsed = parseSetArg(argv[++i]);
            if (!parsed)
                return 1;
            opts.overrides.push_back(*parsed);
        } else if (opt == "--output" && i + 1 < argc) {
            opts.output_directory = argv[++i];
        } else {
            std::cerr << "Unknown option: " << opt << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    return runSimulation(opts);
}
