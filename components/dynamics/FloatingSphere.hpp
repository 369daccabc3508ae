#pragma once

/**
 * @file FloatingSphere.hpp
 * @brief Vertical dynamics of a sphere under gravity and buoyancy
 *
 * State: [height, velocity] of a single sphere, plus the fluid and gravity
 * it is immersed in. The update is a semi-implicit (symplectic) Euler step:
 *
 *   v += (F_b / m) * dt      (only while ratio > 0)
 *   v -= g * dt
 *   z += v * dt              (uses the updated v)
 *
 * No validation of dt is done here; hosts reject non-finite or negative
 * deltas before calling Update (see Simulator::Step).
 */

#include <archimedes/core/CoreTypes.hpp>
#include <archimedes/core/Error.hpp>
#include <archimedes/core/PhysicsConfig.hpp>

#include <bodies/Sphere.hpp>
#include <environment/Buoyancy.hpp>
#include <environment/Water.hpp>

#include <cmath>
#include <functional>
#include <optional>
#include <type_traits>

namespace archimedes {
namespace components {

/**
 * @brief Everything one tick reads and writes
 *
 * Value type: copying it takes a snapshot that can be replayed.
 */
template <ArchimedesScalar Scalar> struct SimulationState {
    Sphere<Scalar> sphere;
    Water<Scalar> water;
    Scalar gravity; ///< Magnitude of gravitational acceleration [m/s^2], acts downward
};

/**
 * @brief Intermediate quantities of a single tick
 */
template <ArchimedesScalar Scalar> struct StepDiagnostics {
    Scalar ratio = Scalar(0);          ///< Submersion ratio at the start of the tick
    Scalar buoyant_force = Scalar(0);  ///< [N], zero when not submerged
    Scalar acceleration = Scalar(0);   ///< Net vertical acceleration [m/s^2]
    Scalar height = Scalar(0);         ///< Height after the tick [m]
    Scalar velocity = Scalar(0);       ///< Velocity after the tick [m/s]

    [[nodiscard]] bool Submerged() const { return ratio > Scalar(0); }
};

/// Receives the sphere height after each tick
template <ArchimedesScalar Scalar> using DiagnosticSink = std::function<void(Scalar)>;

/**
 * @brief Build the initial simulation state
 * @throws ConfigError if any constant is invalid
 */
template <ArchimedesScalar Scalar = double>
[[nodiscard]] SimulationState<Scalar> NewSim(const PhysicsConfig &cfg = {}) {
    if (!std::isfinite(cfg.gravity)) {
        throw ConfigError("gravity must be finite");
    }
    return SimulationState<Scalar>{NewSphere<Scalar>(cfg.sphere), NewWater<Scalar>(cfg.water),
                                   static_cast<Scalar>(cfg.gravity)};
}

/**
 * @brief Advance the state by one tick
 *
 * The new velocity and height are committed together, then the resulting
 * height is handed to the sink (if any).
 *
 * @param state        Mutated in place
 * @param elapsed_secs Time since the previous tick [s]
 * @param sink         Diagnostic sink, may be empty
 */
template <ArchimedesScalar Scalar>
StepDiagnostics<Scalar> Update(SimulationState<Scalar> &state,
                               std::type_identity_t<Scalar> elapsed_secs,
                               const std::type_identity_t<DiagnosticSink<Scalar>> &sink = {}) {
    Sphere<Scalar> &sphere = state.sphere;

    StepDiagnostics<Scalar> diag;
    diag.ratio = SubmergedRatio(sphere);

    Scalar velocity = sphere.Velocity();
    if (diag.ratio > Scalar(0)) {
        diag.buoyant_force = BuoyancyForce(sphere, state.water, state.gravity, diag.ratio);
        const Scalar accel = diag.buoyant_force / sphere.Mass();
        velocity += accel * elapsed_secs;
        diag.acceleration = accel;
    }

    // Gravity always acts
    velocity -= state.gravity * elapsed_secs;
    diag.acceleration -= state.gravity;

    const Scalar height = sphere.Height() + velocity * elapsed_secs;

    sphere.SetVelocity(velocity);
    sphere.SetHeight(height);

    diag.velocity = velocity;
    diag.height = height;

    if (sink) {
        sink(height);
    }
    return diag;
}

/**
 * @brief Height at which buoyancy balances weight
 *
 * Solves BuoyancyForce(ratio) = m * g for the ratio:
 *   ratio* = m / (SphereVolume(r) * rho_water)
 *   z*     = r - 2 * r * ratio*
 *
 * @return std::nullopt if the sphere is too dense to float (ratio* > 1)
 */
template <ArchimedesScalar Scalar>
[[nodiscard]] std::optional<Scalar> EquilibriumHeight(const SimulationState<Scalar> &state) {
    const auto &sphere = state.sphere;
    const Scalar ratio =
        sphere.Mass() / (SphereVolume(sphere.Radius()) * state.water.Density());
    if (ratio > Scalar(1)) {
        return std::nullopt;
    }
    return sphere.Radius() - sphere.Diameter() * ratio;
}

} // namespace components
} // namespace archimedes
