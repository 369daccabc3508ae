#pragma once

/**
 * @file archimedes.hpp
 * @brief Umbrella header for the Archimedes buoyancy simulation
 *
 * Include this header to get access to all Archimedes public APIs,
 * including the physics components.
 */

// Core
#include <archimedes/core/CoreTypes.hpp>
#include <archimedes/core/Error.hpp>
#include <archimedes/core/ErrorLogging.hpp>
#include <archimedes/core/PhysicsConfig.hpp>

// Components
#include <bodies/Sphere.hpp>
#include <dynamics/FloatingSphere.hpp>
#include <environment/Buoyancy.hpp>
#include <environment/Water.hpp>

// Simulation
#include <archimedes/sim/Simulator.hpp>
#include <archimedes/sim/SimulatorConfig.hpp>

// I/O
#include <archimedes/io/Console.hpp>
#include <archimedes/io/LogService.hpp>
#include <archimedes/io/LogSink.hpp>
#include <archimedes/io/SimulationLoader.hpp>

namespace archimedes {
// Version functions are defined in core/CoreTypes.hpp
} // namespace archimedes
