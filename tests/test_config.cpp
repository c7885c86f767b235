#include "config.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("pendulum_config_" + std::string(::testing::UnitTest::GetInstance()
                                                      ->current_test_info()
                                                      ->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override { fs::remove_all(dir_); }

    std::string write(std::string const& name, std::string const& contents) {
        fs::path const path = dir_ / name;
        std::ofstream(path) << contents;
        return path.string();
    }

    fs::path dir_;
};

} // namespace

TEST_F(ConfigTest, DefaultsDescribeChaoticStart) {
    Config const config = Config::defaults();
    EXPECT_DOUBLE_EQ(config.physics.initial_angle1, M_PI / 2);
    EXPECT_DOUBLE_EQ(config.physics.initial_angle2, M_PI / 2 + 0.1);
    EXPECT_DOUBLE_EQ(config.simulation.duration_seconds, 20.0);
    EXPECT_DOUBLE_EQ(config.simulation.dt, 0.02);
    EXPECT_EQ(config.simulation.sampleCount(), 1000u);
    EXPECT_EQ(config.simulation.method, IntegrationMethod::DormandPrince);
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, LoadsAllSections) {
    auto const path = write("run.toml", R"(
[physics]
gravity = 9.5
length1 = 1.5
mass2 = 2
initial_angle1_deg = 45.0
initial_velocity2 = -0.5

[simulation]
duration_seconds = 12.5
dt = 0.05
method = "rk4"
physics_quality = "ultra"
max_steps = 5000
thread_count = 2

[output]
directory = "results"
mode = "direct"
trail_length = 50
save_frames = false
)");

    Config const config = Config::load(path);
    EXPECT_DOUBLE_EQ(config.physics.gravity, 9.5);
    EXPECT_DOUBLE_EQ(config.physics.length1, 1.5);
    EXPECT_DOUBLE_EQ(config.physics.length2, 1.0);
    EXPECT_DOUBLE_EQ(config.physics.mass2, 2.0);
    EXPECT_DOUBLE_EQ(config.physics.initial_angle1, M_PI / 4);
    EXPECT_DOUBLE_EQ(config.physics.initial_velocity2, -0.5);
    EXPECT_DOUBLE_EQ(config.simulation.duration_seconds, 12.5);
    EXPECT_DOUBLE_EQ(config.simulation.dt, 0.05);
    EXPECT_EQ(config.simulation.method, IntegrationMethod::Rk4);
    EXPECT_EQ(config.simulation.physics_quality, PhysicsQuality::Ultra);
    EXPECT_DOUBLE_EQ(config.simulation.max_dt, 0.003);
    EXPECT_EQ(config.simulation.max_steps, 5000);
    EXPECT_EQ(config.simulation.thread_count, 2);
    EXPECT_EQ(config.output.directory, "results");
    EXPECT_EQ(config.output.mode, OutputMode::Direct);
    EXPECT_EQ(config.output.trail_length, 50);
    EXPECT_FALSE(config.output.save_frames);
    EXPECT_TRUE(config.output.save_trajectory);
}

TEST_F(ConfigTest, IncludedFileIsOverriddenByIncluder) {
    write("base.toml", R"(
[physics]
length1 = 2.0
length2 = 3.0
[simulation]
dt = 0.01
)");
    auto const path = write("child.toml", R"(
include = ["base.toml"]
[physics]
length2 = 0.5
)");

    Config const config = Config::load(path);
    EXPECT_DOUBLE_EQ(config.physics.length1, 2.0);
    EXPECT_DOUBLE_EQ(config.physics.length2, 0.5);
    EXPECT_DOUBLE_EQ(config.simulation.dt, 0.01);
}

TEST_F(ConfigTest, MissingFileFallsBackToDefaults) {
    Config const config = Config::load((dir_ / "absent.toml").string());
    EXPECT_DOUBLE_EQ(config.physics.length1, 1.0);
    EXPECT_DOUBLE_EQ(config.simulation.dt, 0.02);
}

TEST_F(ConfigTest, ParseErrorNamesTheFile) {
    auto const path = write("broken.toml", "[physics\nlength1 = \n");
    try {
        Config::load(path);
        FAIL() << "expected ConfigurationError";
    } catch (ConfigurationError const& err) {
        EXPECT_EQ(err.field(), path);
        EXPECT_NE(std::string(err.what()).find("line"), std::string::npos);
    }
}

TEST_F(ConfigTest, WrongValueTypeKeepsDefault) {
    auto const path = write("typed.toml", R"(
[physics]
length1 = "long"
initial_angle1_deg = "ninety"
[simulation]
physics_quality = "ultra"
max_dt = "tiny"
)");
    Config const config = Config::load(path);
    EXPECT_DOUBLE_EQ(config.physics.length1, 1.0);
    EXPECT_DOUBLE_EQ(config.physics.initial_angle1, M_PI / 2);
    EXPECT_EQ(config.simulation.physics_quality, PhysicsQuality::Ultra);
    EXPECT_DOUBLE_EQ(config.simulation.max_dt, 0.003);
}

TEST_F(ConfigTest, WrongValueTypeKeepsIncludedValue) {
    write("base.toml", R"(
[physics]
initial_angle2_deg = 120.0
)");
    auto const path = write("child.toml", R"(
include = ["base.toml"]
[physics]
initial_angle2_deg = false
)");
    Config const config = Config::load(path);
    EXPECT_NEAR(config.physics.initial_angle2, deg2rad(120.0), 1e-12);
}

TEST_F(ConfigTest, NonStringEnumIsIgnoredWithWarning) {
    auto const path = write("enum.toml", R"(
[simulation]
method = 5
[output]
mode = true
)");
    ::testing::internal::CaptureStderr();
    Config const config = Config::load(path);
    std::string const warnings = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(config.simulation.method, IntegrationMethod::DormandPrince);
    EXPECT_EQ(config.output.mode, OutputMode::Timestamped);
    EXPECT_NE(warnings.find("'method'"), std::string::npos);
    EXPECT_NE(warnings.find("'mode'"), std::string::npos);
}

TEST_F(ConfigTest, OverridesUseDotNotation) {
    Config config;
    EXPECT_TRUE(config.applyOverride("physics.length1", "2.5"));
    EXPECT_TRUE(config.applyOverride("physics.initial_angle2_deg", "180"));
    EXPECT_TRUE(config.applyOverride("simulation.method", "rk4"));
    EXPECT_TRUE(config.applyOverride("simulation.max_dt", "0.001"));
    EXPECT_TRUE(config.applyOverride("output.save_trajectory", "false"));
    EXPECT_TRUE(config.applyOverride("output.mode", "direct"));

    EXPECT_DOUBLE_EQ(config.physics.length1, 2.5);
    EXPECT_DOUBLE_EQ(config.physics.initial_angle2, M_PI);
    EXPECT_EQ(config.simulation.method, IntegrationMethod::Rk4);
    EXPECT_EQ(config.simulation.physics_quality, PhysicsQuality::Custom);
    EXPECT_DOUBLE_EQ(config.simulation.max_dt, 0.001);
    EXPECT_FALSE(config.output.save_trajectory);
    EXPECT_EQ(config.output.mode, OutputMode::Direct);
}

TEST_F(ConfigTest, BadOverridesAreRejected) {
    Config config;
    EXPECT_FALSE(config.applyOverride("length1", "2"));
    EXPECT_FALSE(config.applyOverride("physics.wingspan", "2"));
    EXPECT_FALSE(config.applyOverride("physics.length1", "abc"));
    EXPECT_FALSE(config.applyOverride("simulation.method", "euler"));
    EXPECT_FALSE(config.applyOverride("output.save_frames", "maybe"));
    EXPECT_FALSE(config.applyOverride("render.width", "100"));
    EXPECT_DOUBLE_EQ(config.physics.length1, 1.0);
}

TEST_F(ConfigTest, ValidateNamesOffendingKey) {
    auto expectField = [](Config const& config, std::string const& field) {
        try {
            config.validate();
            FAIL() << "expected ConfigurationError for " << field;
        } catch (ConfigurationError const& err) {
            EXPECT_EQ(err.field(), field);
        }
    };

    Config config;
    config.physics.length1 = -1.0;
    expectField(config, "physics.length1");

    config = {};
    config.simulation.duration_seconds = 0.0;
    expectField(config, "simulation.duration_seconds");

    config = {};
    config.simulation.rtol = 0.0;
    expectField(config, "simulation.rtol");

    config = {};
    config.simulation.max_steps = -3;
    expectField(config, "simulation.max_steps");

    config = {};
    config.physics.initial_velocity1 = INFINITY;
    expectField(config, "physics.initial_velocity1");

    config = {};
    config.output.directory.clear();
    expectField(config, "output.directory");
}

TEST_F(ConfigTest, DeadlineReflectsBudget) {
    Config config;
    Deadline const unlimited = config.deadline();
    EXPECT_FALSE(unlimited.max_steps.has_value());
    EXPECT_FALSE(unlimited.wall_clock.has_value());

    config.simulation.max_steps = 250;
    config.simulation.max_wall_seconds = 1.5;
    Deadline const limited = config.deadline();
    ASSERT_TRUE(limited.max_steps.has_value());
    EXPECT_EQ(*limited.max_steps, 250u);
    EXPECT_TRUE(limited.wall_clock.has_value());
}

TEST_F(ConfigTest, SavedConfigLoadsBack) {
    Config original;
    original.physics.length2 = 0.75;
    original.physics.initial_angle1 = deg2rad(120.0);
    original.simulation.method = IntegrationMethod::Rk4;
    original.simulation.physics_quality = PhysicsQuality::Custom;
    original.simulation.max_dt = 0.004;
    original.output.trail_length = 30;

    auto const path = (dir_ / "resolved.toml").string();
    original.save(path);
    Config const loaded = Config::load(path);

    EXPECT_DOUBLE_EQ(loaded.physics.length2, 0.75);
    EXPECT_NEAR(loaded.physics.initial_angle1, deg2rad(120.0), 1e-9);
    EXPECT_NEAR(loaded.physics.initial_angle2, original.physics.initial_angle2, 1e-9);
    EXPECT_EQ(loaded.simulation.method, IntegrationMethod::Rk4);
    EXPECT_EQ(loaded.simulation.physics_quality, PhysicsQuality::Custom);
    EXPECT_DOUBLE_EQ(loaded.simulation.max_dt, 0.004);
    EXPECT_DOUBLE_EQ(loaded.simulation.rtol, 1e-9);
    EXPECT_EQ(loaded.output.trail_length, 30);
}

TEST_F(ConfigTest, SavedDirectoryWithQuotesLoadsBack) {
    Config original;
    original.output.directory = R"(runs\"quoted" dir)";

    auto const path = (dir_ / "escaped.toml").string();
    original.save(path);
    Config const loaded = Config::load(path);
    EXPECT_EQ(loaded.output.directory, original.output.directory);
}
