#pragma once

/**
 * @file Buoyancy.hpp
 * @brief Piecewise-linear submersion model and buoyant force
 *
 * Frame: local vertical (Z-up), water surface at z = 0.
 *
 * Displaced volume is approximated as full_volume * submerged_ratio, where the
 * ratio varies linearly with the depth of the sphere's lowest point. This is
 * not the spherical-cap volume.
 */

#include <archimedes/core/CoreTypes.hpp>

#include <bodies/Sphere.hpp>
#include <environment/Water.hpp>

namespace archimedes {
namespace components {

/**
 * @brief Fraction of the sphere treated as displacing water, in [0, 1]
 *
 *   bottom = height - radius, diameter = 2 * radius
 *   bottom >= 0          -> 0  (entirely above the surface)
 *   bottom <= -diameter  -> 1  (entirely submerged)
 *   otherwise            -> -bottom / diameter
 *
 * The boundary values are handled by the first two branches, so the division
 * only happens with a strictly positive diameter.
 */
template <ArchimedesScalar Scalar>
[[nodiscard]] Scalar SubmergedRatio(const Sphere<Scalar> &sphere) {
    const Scalar bottom = sphere.Bottom();
    const Scalar diameter = sphere.Diameter();

    if (bottom >= Scalar(0)) {
        return Scalar(0);
    }
    if (bottom <= -diameter) {
        return Scalar(1);
    }
    return -bottom / diameter;
}

/**
 * @brief Upward buoyant force [N]
 *
 *   F = SphereVolume(r) * ratio * rho_water * g
 *
 * Non-negative whenever ratio and gravity are non-negative.
 */
template <ArchimedesScalar Scalar>
[[nodiscard]] Scalar BuoyancyForce(const Sphere<Scalar> &sphere, const Water<Scalar> &water,
                                   Scalar gravity, Scalar ratio) {
    const Scalar volume = SphereVolume(sphere.Radius());
    return volume * ratio * water.Density() * gravity;
}

} // namespace components
} // namespace archimedes
