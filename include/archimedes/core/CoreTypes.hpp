#pragma once

/**
 * @file CoreTypes.hpp
 * @brief Core type definitions, concepts, and version info for Archimedes
 *
 * All physics components are templated on a Scalar satisfying ArchimedesScalar.
 */

#include <concepts>
#include <cstdint>
#include <string>

namespace archimedes {

// =============================================================================
// Scalar Concepts
// =============================================================================

/**
 * @brief Numeric type usable by the physics components
 *
 * Satisfied by the built-in floating point types (float, double, long double).
 */
template <typename T>
concept ArchimedesScalar = std::floating_point<T>;

// =============================================================================
// Version Information
// =============================================================================

// Single source of truth for version numbers
#define ARCHIMEDES_VERSION_MAJOR 0
#define ARCHIMEDES_VERSION_MINOR 2
#define ARCHIMEDES_VERSION_PATCH 0

// Stringify helper
#define ARCHIMEDES_STRINGIFY(x) #x
#define ARCHIMEDES_VERSION_STR(major, minor, patch)                                                \
    ARCHIMEDES_STRINGIFY(major) "." ARCHIMEDES_STRINGIFY(minor) "." ARCHIMEDES_STRINGIFY(patch)

/// Major version number
constexpr int VersionMajor() { return ARCHIMEDES_VERSION_MAJOR; }

/// Minor version number
constexpr int VersionMinor() { return ARCHIMEDES_VERSION_MINOR; }

/// Patch version number
constexpr int VersionPatch() { return ARCHIMEDES_VERSION_PATCH; }

/// Version string (derived from components)
constexpr const char *Version() {
    return ARCHIMEDES_VERSION_STR(ARCHIMEDES_VERSION_MAJOR, ARCHIMEDES_VERSION_MINOR,
                                  ARCHIMEDES_VERSION_PATCH);
}

// =============================================================================
// Naming Utilities
// =============================================================================

/**
 * @brief Build a full path from entity and name
 *
 * Returns "entity.name" if entity is non-empty, otherwise just "name".
 */
inline std::string MakeFullPath(const std::string &entity, const std::string &name) {
    if (entity.empty())
        return name;
    return entity + "." + name;
}

} // namespace archimedes
