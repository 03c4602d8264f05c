#pragma once

/// @file types.hpp
/// @brief Core type definitions for sonance_math

#define GLM_FORCE_RADIANS

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include <cmath>

namespace sonance_math {

// =============================================================================
// Type Aliases (GLM)
// =============================================================================

using Vec3 = glm::vec3;
using Quat = glm::quat;

// =============================================================================
// Vector Constants
// =============================================================================

namespace vec3 {
    inline constexpr Vec3 ZERO    = Vec3(0.0f, 0.0f, 0.0f);
    inline constexpr Vec3 UP      = Vec3(0.0f, 1.0f, 0.0f);
    inline constexpr Vec3 FORWARD = Vec3(0.0f, 0.0f, -1.0f);  // -Z is forward
}

// =============================================================================
// Utilities
// =============================================================================

/// Check that every component is a finite number
[[nodiscard]] inline bool is_finite(const Vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

/// Rotate the canonical forward axis by a rotation
[[nodiscard]] inline Vec3 forward_of(const Quat& rotation) {
    return rotation * vec3::FORWARD;
}

/// Rotate the canonical up axis by a rotation
[[nodiscard]] inline Vec3 up_of(const Quat& rotation) {
    return rotation * vec3::UP;
}

} // namespace sonance_math
