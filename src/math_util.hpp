#pragma once
#include <cmath>
#include <algorithm>

namespace meadow::math {

constexpr float kPi = 3.1415926535f;

/**
 * @brief Normalizes an angle into the range [-PI, PI].
 */
inline float normalize_angle(float angle) {
    while (angle < -kPi) angle += 2.0f * kPi;
    while (angle >  kPi) angle -= 2.0f * kPi;
    return angle;
}

// Planar point in the XZ plane. Kept separate from ecs::Vec2 so that the
// second component reads as z at every call site.
struct PlanarPoint {
    float x = 0.0f;
    float z = 0.0f;
};

/**
 * @brief Rotates a point from a yawed frame into world space.
 *
 * Matches a quaternion rotation of `yaw` radians about +Y.
 */
inline PlanarPoint to_world_xz(float lx, float lz, float yaw) {
    const float c = std::cos(yaw);
    const float s = std::sin(yaw);
    return { lx * c + lz * s, -lx * s + lz * c };
}

/**
 * @brief Inverse of to_world_xz: world-space offset into the yawed frame.
 */
inline PlanarPoint to_local_xz(float wx, float wz, float yaw) {
    const float c = std::cos(yaw);
    const float s = std::sin(yaw);
    return { wx * c - wz * s, wx * s + wz * c };
}

inline float length_sq_xz(float x, float z) { return x * x + z * z; }

/**
 * @brief Clamps a frame delta into [min_dt, max_dt].
 * NaN and non-positive deltas map to min_dt.
 */
inline float clamp_dt(float dt, float min_dt, float max_dt) {
    if (!(dt > min_dt)) return min_dt;
    return std::min(dt, max_dt);
}

inline bool is_finite_positive(float v) {
    return std::isfinite(v) && v > 0.0f;
}

} // namespace meadow::math
