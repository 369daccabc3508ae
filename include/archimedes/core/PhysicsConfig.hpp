#pragma once

/**
 * @file PhysicsConfig.hpp
 * @brief Named physical constants for the floating sphere scenario
 *
 * These structs are NOT templated - they use double for numeric values.
 * Defaults reproduce the reference scenario: a 1 m sphere of density 250 kg/m^3
 * released 1 m above fresh water under standard gravity.
 */

#include <cmath>
#include <string>
#include <vector>

namespace archimedes {

// =============================================================================
// SphereConfig
// =============================================================================

/**
 * @brief Sphere construction constants
 */
struct SphereConfig {
    double radius = 1.0;           ///< [m]
    double density = 250.0;        ///< [kg/m^3], mass = density * volume
    double initial_height = 1.0;   ///< Centre height above the water surface [m]
    double initial_velocity = 0.0; ///< Vertical velocity, positive up [m/s]

    /// Validate configuration
    [[nodiscard]] std::vector<std::string> Validate() const {
        std::vector<std::string> errors;
        if (!std::isfinite(radius) || radius <= 0.0) {
            errors.push_back("sphere.radius must be positive and finite");
        }
        if (!std::isfinite(density) || density <= 0.0) {
            errors.push_back("sphere.density must be positive and finite");
        }
        if (!std::isfinite(initial_height)) {
            errors.push_back("sphere.initial_height must be finite");
        }
        if (!std::isfinite(initial_velocity)) {
            errors.push_back("sphere.initial_velocity must be finite");
        }
        return errors;
    }
};

// =============================================================================
// WaterConfig
// =============================================================================

struct WaterConfig {
    double density = 1000.0; ///< [kg/m^3]

    [[nodiscard]] std::vector<std::string> Validate() const {
        std::vector<std::string> errors;
        if (!std::isfinite(density) || density <= 0.0) {
            errors.push_back("water.density must be positive and finite");
        }
        return errors;
    }
};

// =============================================================================
// PhysicsConfig
// =============================================================================

/**
 * @brief Everything needed to build a SimulationState
 */
struct PhysicsConfig {
    SphereConfig sphere;
    WaterConfig water;
    double gravity = 9.81; ///< Magnitude of gravitational acceleration [m/s^2]

    /// Validate all sub-configs
    [[nodiscard]] std::vector<std::string> Validate() const {
        std::vector<std::string> errors = sphere.Validate();
        auto water_errors = water.Validate();
        errors.insert(errors.end(), water_errors.begin(), water_errors.end());
        if (!std::isfinite(gravity)) {
            errors.push_back("gravity must be finite");
        }
        return errors;
    }
};

/// Join validation messages into a single line for error reporting
inline std::string JoinErrors(const std::vector<std::string> &errors) {
    std::string result;
    for (const auto &e : errors) {
        if (!result.empty()) {
            result += "; ";
        }
        result += e;
    }
    return result;
}

} // namespace archimedes
