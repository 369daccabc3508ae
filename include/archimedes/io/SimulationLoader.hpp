#pragma once

/**
 * @file SimulationLoader.hpp
 * @brief Loads simulator configuration from YAML
 *
 * YAML Format:
 * @code
 * simulation:
 *   name: floating_sphere
 *   description: "Sphere dropped into still water"
 * time:
 *   start: 0.0
 *   end: 10.0
 *   dt: 0.01
 * sphere:
 *   radius: 1.0
 *   density: 250.0
 *   initial_height: 1.0
 *   initial_velocity: 0.0
 * water:
 *   density: 1000.0
 * environment:
 *   gravity: 9.81
 * logging:
 *   console_level: Info
 *   file_enabled: false
 *   file_path: floating_sphere.log
 *   file_level: Debug
 * @endcode
 *
 * Every section and key is optional; missing values keep their defaults.
 */

#include <archimedes/core/Error.hpp>
#include <archimedes/sim/SimulatorConfig.hpp>

#include <fstream>
#include <string>

#include <yaml-cpp/yaml.h>

namespace archimedes::io {

class SimulationLoader {
  public:
    /**
     * @brief Load simulator config from file
     *
     * @param path Path to simulation YAML file
     * @return Validated SimulatorConfig
     * @throws IOError if the file cannot be opened
     * @throws ConfigError on parsing or validation errors
     */
    static SimulatorConfig Load(const std::string &path) {
        std::ifstream probe(path);
        if (!probe.is_open()) {
            throw IOError("open", path, "file not found or not readable");
        }

        YAML::Node root;
        try {
            root = YAML::LoadFile(path);
        } catch (const YAML::ParserException &e) {
            throw ConfigError(e.what(), path, e.mark.line + 1);
        } catch (const YAML::Exception &e) {
            throw ConfigError(e.what(), path);
        }
        return ParseRoot(root, path);
    }

    /**
     * @brief Parse simulator config from YAML string (for testing)
     */
    static SimulatorConfig Parse(const std::string &yaml_content) {
        YAML::Node root;
        try {
            root = YAML::Load(yaml_content);
        } catch (const YAML::Exception &e) {
            throw ConfigError(e.what(), "<string>");
        }
        return ParseRoot(root, "<string>");
    }

    /**
     * @brief Map a level name to LogLevel
     * @throws ConfigError for unknown names
     */
    static LogLevel ParseLogLevel(const std::string &level_str) {
        if (level_str == "Trace" || level_str == "trace")
            return LogLevel::Trace;
        if (level_str == "Debug" || level_str == "debug")
            return LogLevel::Debug;
        if (level_str == "Info" || level_str == "info")
            return LogLevel::Info;
        if (level_str == "Event" || level_str == "event")
            return LogLevel::Event;
        if (level_str == "Warning" || level_str == "warning")
            return LogLevel::Warning;
        if (level_str == "Error" || level_str == "error")
            return LogLevel::Error;
        if (level_str == "Off" || level_str == "off")
            return LogLevel::Fatal; // Off not in enum, use Fatal
        throw ConfigError("Unknown log level '" + level_str + "'");
    }

  private:
    // =========================================================================
    // Root Parsing
    // =========================================================================

    static SimulatorConfig ParseRoot(const YAML::Node &root, const std::string &source_path) {
        SimulatorConfig cfg;
        cfg.source_file = source_path;

        if (root.IsNull()) {
            return cfg; // Empty document: all defaults
        }
        if (!root.IsMap()) {
            throw ConfigError("Top-level YAML node must be a map", source_path);
        }

        try {
            if (root["simulation"]) {
                ParseSimulationSection(cfg, root["simulation"]);
            }
            if (root["time"]) {
                ParseTimeSection(cfg, root["time"]);
            }
            if (root["sphere"]) {
                ParseSphere(cfg.physics.sphere, root["sphere"]);
            }
            if (root["water"]) {
                ParseWater(cfg.physics.water, root["water"]);
            }
            if (root["environment"]) {
                cfg.physics.gravity =
                    Get<double>(root["environment"], "gravity", cfg.physics.gravity);
            }
            if (root["logging"]) {
                ParseLogging(cfg.logging, root["logging"]);
            }
        } catch (const YAML::Exception &e) {
            throw ConfigError(e.what(), source_path, e.mark.is_null() ? -1 : e.mark.line + 1);
        }

        auto errors = cfg.Validate();
        if (!errors.empty()) {
            throw ConfigError(JoinErrors(errors), source_path);
        }
        return cfg;
    }

    // =========================================================================
    // Section Parsers
    // =========================================================================

    static void ParseSimulationSection(SimulatorConfig &cfg, const YAML::Node &node) {
        cfg.name = Get<std::string>(node, "name", cfg.name);
        cfg.description = Get<std::string>(node, "description", cfg.description);
    }

    static void ParseTimeSection(SimulatorConfig &cfg, const YAML::Node &node) {
        cfg.t_start = Get<double>(node, "start", cfg.t_start);
        cfg.t_end = Get<double>(node, "end", cfg.t_end);
        cfg.dt = Get<double>(node, "dt", cfg.dt);
    }

    static void ParseSphere(SphereConfig &sphere, const YAML::Node &node) {
        sphere.radius = Get<double>(node, "radius", sphere.radius);
        sphere.density = Get<double>(node, "density", sphere.density);
        sphere.initial_height = Get<double>(node, "initial_height", sphere.initial_height);
        sphere.initial_velocity = Get<double>(node, "initial_velocity", sphere.initial_velocity);
    }

    static void ParseWater(WaterConfig &water, const YAML::Node &node) {
        water.density = Get<double>(node, "density", water.density);
    }

    static void ParseLogging(LogConfig &logging, const YAML::Node &node) {
        if (node["console_level"]) {
            logging.console_level = ParseLogLevel(node["console_level"].as<std::string>());
        }

        logging.file_enabled = Get<bool>(node, "file_enabled", logging.file_enabled);
        logging.file_path = Get<std::string>(node, "file_path", logging.file_path);
        if (node["file_level"]) {
            logging.file_level = ParseLogLevel(node["file_level"].as<std::string>());
        }

        logging.quiet_mode = Get<bool>(node, "quiet", logging.quiet_mode);
        if (logging.quiet_mode) {
            logging.console_level = LogLevel::Error;
        }
    }

    /// Read an optional key, keeping the fallback when absent
    template <typename T>
    static T Get(const YAML::Node &node, const std::string &key, const T &fallback) {
        const YAML::Node value = node[key];
        if (!value) {
            return fallback;
        }
        return value.as<T>();
    }
};

} // namespace archimedes::io
