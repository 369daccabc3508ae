#pragma once

/**
 * @file SimulatorConfig.hpp
 * @brief Simulator configuration struct
 *
 * NOT templated - the Simulator always runs in double precision.
 * Populated programmatically or by io::SimulationLoader from YAML.
 */

#include <archimedes/core/PhysicsConfig.hpp>
#include <archimedes/io/LogService.hpp>

#include <cmath>
#include <string>
#include <vector>

namespace archimedes {

/**
 * @brief Complete simulator configuration
 */
struct SimulatorConfig {
    // Identity
    std::string name = "floating_sphere";
    std::string description;
    std::string source_file; ///< Set by SimulationLoader (empty when built in code)

    // Time
    double t_start = 0.0; ///< [s]
    double t_end = 10.0;  ///< [s]
    double dt = 0.01;     ///< Nominal tick length [s]

    PhysicsConfig physics;
    LogConfig logging;

    /// Create default config
    [[nodiscard]] static SimulatorConfig Default() { return SimulatorConfig{}; }

    /// Validate configuration
    [[nodiscard]] std::vector<std::string> Validate() const {
        std::vector<std::string> errors = physics.Validate();
        if (!std::isfinite(dt) || dt <= 0.0) {
            errors.push_back("time.dt must be positive and finite");
        }
        if (!std::isfinite(t_start) || !std::isfinite(t_end)) {
            errors.push_back("time.start and time.end must be finite");
        } else if (t_end < t_start) {
            errors.push_back("time.end must not be before time.start");
        }
        if (logging.file_enabled && logging.file_path.empty()) {
            errors.push_back("logging.file_enabled requires logging.file_path");
        }
        return errors;
    }
};

} // namespace archimedes
