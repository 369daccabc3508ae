#pragma once

/**
 * @file Sphere.hpp
 * @brief Rigid sphere moving along the vertical axis
 *
 * Frame: 1-D local vertical, Z-up, water surface at z = 0.
 *
 * Radius and mass are fixed at construction and validated there, so every
 * Sphere in the program satisfies radius > 0 and mass > 0.
 */

#include <archimedes/core/CoreTypes.hpp>
#include <archimedes/core/Error.hpp>
#include <archimedes/core/PhysicsConfig.hpp>

#include <cmath>

namespace archimedes {
namespace components {

/// Value of pi used by the volume model
template <ArchimedesScalar Scalar> inline constexpr Scalar kPi = Scalar(3.1415926535897);

/**
 * @brief Reference volume of a sphere of the given radius
 *
 * Uses the coefficient 3/4, not the textbook 4/3. Mass and buoyant force are
 * both derived from this value.
 *
 *   V = 3/4 * pi * r^3
 */
template <ArchimedesScalar Scalar> [[nodiscard]] constexpr Scalar SphereVolume(Scalar radius) {
    return Scalar(3.0) / Scalar(4.0) * kPi<Scalar> * radius * radius * radius;
}

/**
 * @brief Sphere with fixed radius/mass and mutable height/velocity
 *
 * @tparam Scalar Floating point type
 */
template <ArchimedesScalar Scalar> class Sphere {
  public:
    /**
     * @brief Construct from explicit physical properties
     * @throws ConfigError if radius or mass is not strictly positive and finite
     */
    Sphere(Scalar radius, Scalar mass, Scalar height = Scalar(0), Scalar velocity = Scalar(0))
        : radius_(radius), mass_(mass), height_(height), velocity_(velocity) {
        if (!std::isfinite(radius_) || radius_ <= Scalar(0)) {
            throw ConfigError::NotPositive("sphere.radius", static_cast<double>(radius_));
        }
        if (!std::isfinite(mass_) || mass_ <= Scalar(0)) {
            throw ConfigError::NotPositive("sphere.mass", static_cast<double>(mass_));
        }
    }

    // Fixed properties
    [[nodiscard]] Scalar Radius() const { return radius_; }
    [[nodiscard]] Scalar Mass() const { return mass_; }
    [[nodiscard]] Scalar Diameter() const { return Scalar(2) * radius_; }

    /// Height of the lowest point of the sphere
    [[nodiscard]] Scalar Bottom() const { return height_ - radius_; }

    // Kinematic state
    [[nodiscard]] Scalar Height() const { return height_; }
    [[nodiscard]] Scalar Velocity() const { return velocity_; }

    void SetHeight(Scalar height) { height_ = height; }
    void SetVelocity(Scalar velocity) { velocity_ = velocity; }

  private:
    Scalar radius_;
    Scalar mass_;
    Scalar height_;
    Scalar velocity_;
};

/**
 * @brief Build a sphere from its construction constants
 *
 * mass = density * SphereVolume(radius)
 *
 * @throws ConfigError if the config is invalid
 */
template <ArchimedesScalar Scalar = double>
[[nodiscard]] Sphere<Scalar> NewSphere(const SphereConfig &cfg = {}) {
    auto errors = cfg.Validate();
    if (!errors.empty()) {
        throw ConfigError(JoinErrors(errors));
    }

    const Scalar radius = static_cast<Scalar>(cfg.radius);
    const Scalar mass = static_cast<Scalar>(cfg.density) * SphereVolume(radius);
    return Sphere<Scalar>(radius, mass, static_cast<Scalar>(cfg.initial_height),
                          static_cast<Scalar>(cfg.initial_velocity));
}

} // namespace components
} // namespace archimedes
