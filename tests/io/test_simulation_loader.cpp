/**
 * @file test_simulation_loader.cpp
 * @brief Unit tests for SimulationLoader YAML parsing
 */

#include <gtest/gtest.h>
#include <archimedes/io/SimulationLoader.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace archimedes::io {
namespace {

// =============================================================================
// Parse Tests (from string)
// =============================================================================

TEST(SimulationLoaderTest, EmptyDocumentGivesDefaults) {
    auto cfg = SimulationLoader::Parse("");
    EXPECT_EQ(cfg.name, "floating_sphere");
    EXPECT_EQ(cfg.source_file, "<string>");
    EXPECT_DOUBLE_EQ(cfg.dt, 0.01);
    EXPECT_DOUBLE_EQ(cfg.physics.sphere.radius, 1.0);
    EXPECT_DOUBLE_EQ(cfg.physics.sphere.density, 250.0);
    EXPECT_DOUBLE_EQ(cfg.physics.water.density, 1000.0);
    EXPECT_DOUBLE_EQ(cfg.physics.gravity, 9.81);
}

TEST(SimulationLoaderTest, ParseSimulationSection) {
    const char *yaml = R"(
simulation:
  name: "Pool Test"
  description: "Cork in a bath"
)";
    auto cfg = SimulationLoader::Parse(yaml);
    EXPECT_EQ(cfg.name, "Pool Test");
    EXPECT_EQ(cfg.description, "Cork in a bath");
}

TEST(SimulationLoaderTest, ParseTimeSection) {
    const char *yaml = R"(
time:
  start: 1.0
  end: 20.0
  dt: 0.001
)";
    auto cfg = SimulationLoader::Parse(yaml);
    EXPECT_DOUBLE_EQ(cfg.t_start, 1.0);
    EXPECT_DOUBLE_EQ(cfg.t_end, 20.0);
    EXPECT_DOUBLE_EQ(cfg.dt, 0.001);
}

TEST(SimulationLoaderTest, ParsePhysicsSections) {
    const char *yaml = R"(
sphere:
  radius: 0.5
  density: 600.0
  initial_height: 2.0
  initial_velocity: -1.5
water:
  density: 1025.0
environment:
  gravity: 1.62
)";
    auto cfg = SimulationLoader::Parse(yaml);
    EXPECT_DOUBLE_EQ(cfg.physics.sphere.radius, 0.5);
    EXPECT_DOUBLE_EQ(cfg.physics.sphere.density, 600.0);
    EXPECT_DOUBLE_EQ(cfg.physics.sphere.initial_height, 2.0);
    EXPECT_DOUBLE_EQ(cfg.physics.sphere.initial_velocity, -1.5);
    EXPECT_DOUBLE_EQ(cfg.physics.water.density, 1025.0);
    EXPECT_DOUBLE_EQ(cfg.physics.gravity, 1.62);
}

TEST(SimulationLoaderTest, PartialSectionKeepsDefaults) {
    const char *yaml = R"(
sphere:
  density: 500.0
)";
    auto cfg = SimulationLoader::Parse(yaml);
    EXPECT_DOUBLE_EQ(cfg.physics.sphere.density, 500.0);
    EXPECT_DOUBLE_EQ(cfg.physics.sphere.radius, 1.0);
    EXPECT_DOUBLE_EQ(cfg.physics.sphere.initial_height, 1.0);
}

TEST(SimulationLoaderTest, ParseLoggingSection) {
    const char *yaml = R"(
logging:
  console_level: Debug
  file_enabled: true
  file_path: run.log
  file_level: trace
)";
    auto cfg = SimulationLoader::Parse(yaml);
    EXPECT_EQ(cfg.logging.console_level, LogLevel::Debug);
    EXPECT_TRUE(cfg.logging.file_enabled);
    EXPECT_EQ(cfg.logging.file_path, "run.log");
    EXPECT_EQ(cfg.logging.file_level, LogLevel::Trace);
}

TEST(SimulationLoaderTest, QuietForcesErrorLevel) {
    const char *yaml = R"(
logging:
  console_level: Trace
  quiet: true
)";
    auto cfg = SimulationLoader::Parse(yaml);
    EXPECT_TRUE(cfg.logging.quiet_mode);
    EXPECT_EQ(cfg.logging.console_level, LogLevel::Error);
}

TEST(SimulationLoaderTest, ParseLogLevelNames) {
    EXPECT_EQ(SimulationLoader::ParseLogLevel("Event"), LogLevel::Event);
    EXPECT_EQ(SimulationLoader::ParseLogLevel("warning"), LogLevel::Warning);
    EXPECT_EQ(SimulationLoader::ParseLogLevel("Off"), LogLevel::Fatal);
    EXPECT_THROW(SimulationLoader::ParseLogLevel("Verbose"), ConfigError);
}

// =============================================================================
// Error Tests
// =============================================================================

TEST(SimulationLoaderTest, UnknownLogLevelThrows) {
    const char *yaml = R"(
logging:
  console_level: Loud
)";
    EXPECT_THROW(SimulationLoader::Parse(yaml), ConfigError);
}

TEST(SimulationLoaderTest, WrongValueTypeThrows) {
    const char *yaml = R"(
sphere:
  radius: big
)";
    EXPECT_THROW(SimulationLoader::Parse(yaml), ConfigError);
}

TEST(SimulationLoaderTest, InvalidPhysicsThrows) {
    const char *yaml = R"(
sphere:
  radius: -1.0
)";
    try {
        SimulationLoader::Parse(yaml);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_EQ(e.file(), "<string>");
        EXPECT_NE(std::string(e.what()).find("sphere.radius"), std::string::npos);
    }
}

TEST(SimulationLoaderTest, ZeroDtThrows) {
    const char *yaml = R"(
time:
  dt: 0.0
)";
    EXPECT_THROW(SimulationLoader::Parse(yaml), ConfigError);
}

TEST(SimulationLoaderTest, FileLoggingWithoutPathThrows) {
    const char *yaml = R"(
logging:
  file_enabled: true
)";
    EXPECT_THROW(SimulationLoader::Parse(yaml), ConfigError);
}

TEST(SimulationLoaderTest, MalformedYamlThrows) {
    const char *yaml = R"(
sphere:
  radius: [1.0, 2.0
)";
    EXPECT_THROW(SimulationLoader::Parse(yaml), ConfigError);
}

TEST(SimulationLoaderTest, NonMapRootThrows) {
    EXPECT_THROW(SimulationLoader::Parse("- 1\n- 2\n"), ConfigError);
}

// =============================================================================
// Load Tests (from file)
// =============================================================================

TEST(SimulationLoaderTest, LoadMissingFileThrowsIOError) {
    try {
        SimulationLoader::Load("/nonexistent/floating_sphere.yaml");
        FAIL() << "expected IOError";
    } catch (const IOError &e) {
        EXPECT_EQ(e.path(), "/nonexistent/floating_sphere.yaml");
        EXPECT_EQ(e.category(), "io");
    }
}

TEST(SimulationLoaderTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "archimedes_loader_test.yaml";
    {
        std::ofstream out(path);
        out << "simulation:\n"
            << "  name: from_file\n"
            << "time:\n"
            << "  end: 2.0\n"
            << "  dt: 0.05\n";
    }

    auto cfg = SimulationLoader::Load(path.string());
    EXPECT_EQ(cfg.name, "from_file");
    EXPECT_EQ(cfg.source_file, path.string());
    EXPECT_DOUBLE_EQ(cfg.t_end, 2.0);
    EXPECT_DOUBLE_EQ(cfg.dt, 0.05);

    std::filesystem::remove(path);
}

TEST(SimulationLoaderTest, LoadReportsLineOfSyntaxError) {
    auto path = std::filesystem::temp_directory_path() / "archimedes_loader_bad.yaml";
    {
        std::ofstream out(path);
        out << "time:\n"
            << "  end: 2.0\n"
            << "  dt: [0.05\n";
    }

    try {
        SimulationLoader::Load(path.string());
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_EQ(e.file(), path.string());
        EXPECT_GE(e.line(), 0);
    }

    std::filesystem::remove(path);
}

} // namespace
} // namespace archimedes::io
