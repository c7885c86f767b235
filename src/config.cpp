#include "config.h"

#include "enum_utils.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <toml.hpp>

namespace {

// Safe value extraction helpers
// Present and well-typed values only; a wrongly typed value warns
template <typename T> std::optional<T> get_opt(toml::table const& tbl, std::string_view key) {
    if (auto node = tbl.get(key)) {
        if (auto val = node->value<T>()) {
            return val;
        }
        std::cerr << "Warning: ignoring '" << key << "', wrong value type\n";
    }
    return std::nullopt;
}

template <typename T> T get_or(toml::table const& tbl, std::string_view key, T default_val) {
    return get_opt<T>(tbl, key).value_or(default_val);
}

std::string get_string_or(toml::table const& tbl, std::string_view key, std::string default_val) {
    if (auto node = tbl.get(key)) {
        if (auto val = node->value<std::string>()) {
            return *val;
        }
        std::cerr << "Warning: ignoring '" << key << "', expected a string\n";
    }
    return default_val;
}

bool parseBool(std::string const& value) {
    if (value == "true" || value == "1")
        return true;
    if (value == "false" || value == "0")
        return false;
    throw std::invalid_argument("expected true/false, got '" + value + "'");
}

std::string describeSource(toml::parse_error const& err) {
    std::ostringstream ss;
    auto const& begin = err.source().begin;
    ss << err.description() << " (line " << begin.line << ", column " << begin.column << ")";
    return ss.str();
}

// Load config values from a TOML table into an existing config (for include support)
void loadConfigFromTable(Config& config, toml::table const& tbl) {
    if (auto physics = tbl["physics"].as_table()) {
        config.physics.gravity = get_or(*physics, "gravity", config.physics.gravity);
        config.physics.length1 = get_or(*physics, "length1", config.physics.length1);
        config.physics.length2 = get_or(*physics, "length2", config.physics.length2);
        config.physics.mass1 = get_or(*physics, "mass1", config.physics.mass1);
        config.physics.mass2 = get_or(*physics, "mass2", config.physics.mass2);
        if (auto deg = get_opt<double>(*physics, "initial_angle1_deg")) {
            config.physics.initial_angle1 = deg2rad(*deg);
        }
        if (auto deg = get_opt<double>(*physics, "initial_angle2_deg")) {
            config.physics.initial_angle2 = deg2rad(*deg);
        }
        config.physics.initial_velocity1 = get_or(*physics, "initial_velocity1", config.physics.initial_velocity1);
        config.physics.initial_velocity2 = get_or(*physics, "initial_velocity2", config.physics.initial_velocity2);
    }

    if (auto sim = tbl["simulation"].as_table()) {
        config.simulation.duration_seconds = get_or(*sim, "duration_seconds", config.simulation.duration_seconds);
        config.simulation.dt = get_or(*sim, "dt", config.simulation.dt);
        auto method_str = get_string_or(*sim, "method", "");
        if (!method_str.empty()) {
            config.simulation.method =
                enum_utils::parseOr(method_str, config.simulation.method, "integration method");
        }
        config.simulation.rtol = get_or(*sim, "rtol", config.simulation.rtol);
        config.simulation.atol = get_or(*sim, "atol", config.simulation.atol);
        auto quality_str = get_string_or(*sim, "physics_quality", "");
        if (!quality_str.empty()) {
            if (auto quality = enum_utils::fromString<PhysicsQuality>(quality_str)) {
                config.simulation.physics_quality = *quality;
                config.simulation.max_dt = qualityToMaxDt(*quality);
            } else {
                std::cerr << "Unknown physics quality: " << quality_str << ", keeping "
                          << enum_utils::toString(config.simulation.physics_quality) << "\n";
            }
        }
        if (auto max_dt = get_opt<double>(*sim, "max_dt")) {
            config.simulation.max_dt = *max_dt;
            config.simulation.physics_quality = PhysicsQuality::Custom;
        }
        config.simulation.max_steps = static_cast<long>(
            get_or<int64_t>(*sim, "max_steps", config.simulation.max_steps));
        config.simulation.max_wall_seconds = get_or(*sim, "max_wall_seconds", config.simulation.max_wall_seconds);
        config.simulation.thread_count = static_cast<int>(
            get_or<int64_t>(*sim, "thread_count", config.simulation.thread_count));
    }

    if (auto output = tbl["output"].as_table()) {
        config.output.directory = get_string_or(*output, "directory", config.output.directory);
        auto mode_str = get_string_or(*output, "mode", "");
        if (!mode_str.empty()) {
            config.output.mode = enum_utils::parseOr(mode_str, config.output.mode, "output mode");
        }
        config.output.trail_length = static_cast<int>(
            get_or<int64_t>(*output, "trail_length", config.output.trail_length));
        config.output.save_trajectory = get_or(*output, "save_trajectory", config.output.save_trajectory);
        config.output.save_frames = get_or(*output, "save_frames", config.output.save_frames);
    }
}

} // namespace

Config Config::defaults() {
    return Config{};
}

Config Config::load(std::string const& path) {
    Config config;

    if (!std::filesystem::exists(path)) {
        std::cerr << "Config file not found: " << path << ", using defaults\n";
        return config;
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (toml::parse_error const& err) {
        throw ConfigurationError(path, describeSource(err));
    }

    std::string base_path = std::filesystem::path(path).parent_path().string();
    if (base_path.empty())
        base_path = ".";

    // Process includes first (they provide base values that can be overridden)
    if (auto includes = tbl["include"].as_array()) {
        for (auto const& inc : *includes) {
            if (auto inc_path = inc.value<std::string>()) {
                std::filesystem::path full_path;
                if (std::filesystem::path(*inc_path).is_absolute()) {
                    full_path = *inc_path;
                } else {
                    full_path = std::filesystem::path(base_path) / *inc_path;
                }
                if (!std::filesystem::exists(full_path)) {
                    std::cerr << "Warning: Included config not found: " << full_path << "\n";
                    continue;
                }
                try {
                    loadConfigFromTable(config, toml::parse_file(full_path.string()));
                } catch (toml::parse_error const& err) {
                    throw ConfigurationError(full_path.string(), describeSource(err));
                }
            }
        }
    }

    // Load values from this file (override includes)
    loadConfigFromTable(config, tbl);

    return config;
}

bool Config::applyOverride(std::string const& key, std::string const& value) {
    // Parse dot-notation key (e.g., "simulation.dt")
    auto dot_pos = key.find('.');
    if (dot_pos == std::string::npos) {
        std::cerr << "Invalid parameter key (missing section): " << key << "\n";
        return false;
    }

    std::string section = key.substr(0, dot_pos);
    std::string param = key.substr(dot_pos + 1);

    try {
        if (section == "physics") {
            if (param == "gravity") {
                physics.gravity = std::stod(value);
            } else if (param == "length1") {
                physics.length1 = std::stod(value);
            } else if (param == "length2") {
                physics.length2 = std::stod(value);
            } else if (param == "mass1") {
                physics.mass1 = std::stod(value);
            } else if (param == "mass2") {
                physics.mass2 = std::stod(value);
            } else if (param == "initial_angle1_deg") {
                physics.initial_angle1 = deg2rad(std::stod(value));
            } else if (param == "initial_angle2_deg") {
                physics.initial_angle2 = deg2rad(std::stod(value));
            } else if (param == "initial_velocity1") {
                physics.initial_velocity1 = std::stod(value);
            } else if (param == "initial_velocity2") {
                physics.initial_velocity2 = std::stod(value);
            } else {
                std::cerr << "Unknown physics parameter: " << param << "\n";
                return false;
            }
        } else if (section == "simulation") {
            if (param == "duration_seconds") {
                simulation.duration_seconds = std::stod(value);
            } else if (param == "dt") {
                simulation.dt = std::stod(value);
            } else if (param == "method") {
                auto method = enum_utils::fromString<IntegrationMethod>(value);
                if (!method) {
                    std::cerr << "Unknown integration method: " << value << "\n";
                    return false;
                }
                simulation.method = *method;
            } else if (param == "rtol") {
                simulation.rtol = std::stod(value);
            } else if (param == "atol") {
                simulation.atol = std::stod(value);
            } else if (param == "physics_quality") {
                auto quality = enum_utils::fromString<PhysicsQuality>(value);
                if (!quality) {
                    std::cerr << "Unknown physics quality: " << value << "\n";
                    return false;
                }
                simulation.physics_quality = *quality;
                simulation.max_dt = qualityToMaxDt(simulation.physics_quality);
            } else if (param == "max_dt") {
                simulation.max_dt = std::stod(value);
                simulation.physics_quality = PhysicsQuality::Custom;
            } else if (param == "max_steps") {
                simulation.max_steps = std::stol(value);
            } else if (param == "max_wall_seconds") {
                simulation.max_wall_seconds = std::stod(value);
            } else if (param == "thread_count") {
                simulation.thread_count = std::stoi(value);
            } else {
                std::cerr << "Unknown simulation parameter: " << param << "\n";
                return false;
            }
        } else if (section == "output") {
            if (param == "directory") {
                output.directory = value;
            } else if (param == "mode") {
                auto mode = enum_utils::fromString<OutputMode>(value);
                if (!mode) {
                    std::cerr << "Unknown output mode: " << value << "\n";
                    return false;
                }
                output.mode = *mode;
            } else if (param == "trail_length") {
                output.trail_length = std::stoi(value);
            } else if (param == "save_trajectory") {
                output.save_trajectory = parseBool(value);
            } else if (param == "save_frames") {
                output.save_frames = parseBool(value);
            } else {
                std::cerr << "Unknown output parameter: " << param << "\n";
                return false;
            }
        } else {
            std::cerr << "Unknown section: " << section << "\n";
            return false;
        }
    } catch (std::exception const& e) {
        std::cerr << "Error parsing value for " << key << ": " << e.what() << "\n";
        return false;
    }

    return true;
}

PendulumParameters Config::parameters() const {
    return PendulumParameters(physics.length1, physics.length2, physics.mass1, physics.mass2,
                              physics.gravity);
}

State Config::initialState() const {
    State s{physics.initial_angle1, physics.initial_velocity1, physics.initial_angle2,
            physics.initial_velocity2};
    if (!std::isfinite(s.theta1))
        throw ConfigurationError("physics.initial_angle1_deg", "must be finite");
    if (!std::isfinite(s.omega1))
        throw ConfigurationError("physics.initial_velocity1", "must be finite");
    if (!std::isfinite(s.theta2))
        throw ConfigurationError("physics.initial_angle2_deg", "must be finite");
    if (!std::isfinite(s.omega2))
        throw ConfigurationError("physics.initial_velocity2", "must be finite");
    return s;
}

TimeGrid Config::timeGrid() const {
    return TimeGrid(simulation.duration_seconds, simulation.dt);
}

IntegratorOptions Config::integratorOptions() const {
    IntegratorOptions options;
    options.method = simulation.method;
    options.rtol = simulation.rtol;
    options.atol = simulation.atol;
    options.max_dt = simulation.max_dt;
    options.validate();
    return options;
}

Deadline Config::deadline() const {
    Deadline deadline;
    if (simulation.max_steps > 0) {
        deadline.max_steps = static_cast<size_t>(simulation.max_steps);
    }
    if (simulation.max_wall_seconds > 0.0) {
        deadline.wall_clock =
            std::chrono::steady_clock::now() +
            std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                std::chrono::duration<double>(simulation.max_wall_seconds));
    }
    return deadline;
}

void Config::validate() const {
    parameters();
    initialState();
    timeGrid();
    integratorOptions();

    if (simulation.max_steps < 0)
        throw ConfigurationError("simulation.max_steps", "must be zero (unlimited) or positive");
    if (!(simulation.max_wall_seconds >= 0.0))
        throw ConfigurationError("simulation.max_wall_seconds", "must be zero (unlimited) or positive");
    if (simulation.thread_count < 0)
        throw ConfigurationError("simulation.thread_count", "must be zero (auto) or positive");
    if (output.trail_length < 0)
        throw ConfigurationError("output.trail_length", "cannot be negative");
    if (output.directory.empty())
        throw ConfigurationError("output.directory", "cannot be empty");
}

void Config::save(std::string const& path) const {
    std::ofstream file(path);
    if (!file) {
        std::cerr << "Error: Could not open " << path << " for writing\n";
        return;
    }

    file << std::setprecision(10);

    file << "[physics]\n";
    file << "gravity = " << physics.gravity << "\n";
    file << "length1 = " << physics.length1 << "\n";
    file << "length2 = " << physics.length2 << "\n";
    file << "mass1 = " << physics.mass1 << "\n";
    file << "mass2 = " << physics.mass2 << "\n";
    file << "initial_angle1_deg = " << rad2deg(physics.initial_angle1) << "\n";
    file << "initial_angle2_deg = " << rad2deg(physics.initial_angle2) << "\n";
    file << "initial_velocity1 = " << physics.initial_velocity1 << "\n";
    file << "initial_velocity2 = " << physics.initial_velocity2 << "\n";
    file << "\n";

    file << "[simulation]\n";
    file << "duration_seconds = " << simulation.duration_seconds << "\n";
    file << "dt = " << simulation.dt << "\n";
    file << "method = \"" << enum_utils::toString(simulation.method) << "\"\n";
    file << "rtol = " << simulation.rtol << "\n";
    file << "atol = " << simulation.atol << "\n";
    file << "physics_quality = \"" << enum_utils::toString(simulation.physics_quality) << "\"\n";
    if (simulation.physics_quality == PhysicsQuality::Custom) {
        file << "max_dt = " << simulation.max_dt << "\n";
    }
    file << "max_steps = " << simulation.max_steps << "\n";
    file << "max_wall_seconds = " << simulation.max_wall_seconds << "\n";
    file << "thread_count = " << simulation.thread_count << "\n";
    file << "\n";

    file << "[output]\n";
    // toml++ quotes and escapes the path so it always loads back
    file << "directory = " << toml::value<std::string>(output.directory) << "\n";
    file << "mode = \"" << enum_utils::toString(output.mode) << "\"\n";
    file << "trail_length = " << output.trail_length << "\n";
    file << "save_trajectory = " << (output.save_trajectory ? "true" : "false") << "\n";
    file << "save_frames = " << (output.save_frames ? "true" : "false") << "\n";
}
