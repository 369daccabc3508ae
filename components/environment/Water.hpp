#pragma once

/**
 * @file Water.hpp
 * @brief Still water body filling the half-space below z = 0
 */

#include <archimedes/core/CoreTypes.hpp>
#include <archimedes/core/Error.hpp>
#include <archimedes/core/PhysicsConfig.hpp>

#include <cmath>

namespace archimedes {
namespace components {

/**
 * @brief Fluid properties (immutable after construction)
 */
template <ArchimedesScalar Scalar> class Water {
  public:
    /**
     * @throws ConfigError if density is not strictly positive and finite
     */
    explicit Water(Scalar density) : density_(density) {
        if (!std::isfinite(density_) || density_ <= Scalar(0)) {
            throw ConfigError::NotPositive("water.density", static_cast<double>(density_));
        }
    }

    [[nodiscard]] Scalar Density() const { return density_; }

  private:
    Scalar density_;
};

template <ArchimedesScalar Scalar = double>
[[nodiscard]] Water<Scalar> NewWater(const WaterConfig &cfg = {}) {
    return Water<Scalar>(static_cast<Scalar>(cfg.density));
}

} // namespace components
} // namespace archimedes
