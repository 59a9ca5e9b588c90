#include "collision_resolver.hpp"
#include "math_util.hpp"
#include <algorithm>
#include <cmath>

namespace meadow {

using math::PlanarPoint;

namespace {

// Circle against an axis-aligned rectangle centred on the origin. (cx, cz) is
// the circle centre in the rectangle's frame; the push is in the same frame.
PushOut circle_vs_local_rect(float cx, float cz, float radius, float hw, float hd) {
    const float closest_x = std::clamp(cx, -hw, hw);
    const float closest_z = std::clamp(cz, -hd, hd);

    const float dx      = cx - closest_x;
    const float dz      = cz - closest_z;
    const float dist_sq = math::length_sq_xz(dx, dz);

    if (dist_sq >= radius * radius) return {};

    PushOut out;
    out.blocked = true;

    if (dist_sq > kSeparationEpsilon * kSeparationEpsilon) {
        const float dist    = std::sqrt(dist_sq);
        const float overlap = radius - dist;
        out.push_x = dx / dist * overlap;
        out.push_z = dz / dist * overlap;
        return out;
    }

    // Centre on or inside the rectangle: leave along the shallower axis.
    const float pen_x = hw - std::abs(cx);
    const float pen_z = hd - std::abs(cz);
    if (pen_x < pen_z) {
        out.push_x = (cx >= 0.0f ? 1.0f : -1.0f) * (pen_x + radius);
    } else {
        out.push_z = (cz >= 0.0f ? 1.0f : -1.0f) * (pen_z + radius);
    }
    return out;
}

} // namespace

PushOut circle_vs_cylinder(const Footprint& p, const CylinderCollider& c) {
    const float dx      = p.x - c.x;
    const float dz      = p.z - c.z;
    const float min_d   = p.radius + c.radius;
    const float dist_sq = math::length_sq_xz(dx, dz);

    if (dist_sq >= min_d * min_d) return {};

    PushOut out;
    out.blocked = true;

    const float dist = std::sqrt(dist_sq);
    if (dist <= kSeparationEpsilon) {
        // Concentric: no separating axis, move the centre to +x at exactly min_d.
        out.push_x = min_d - dx;
        out.push_z = -dz;
        return out;
    }

    const float overlap = min_d - dist;
    out.push_x = dx / dist * overlap;
    out.push_z = dz / dist * overlap;
    return out;
}

PushOut circle_vs_box(const Footprint& p, const BoxCollider& b) {
    const PlanarPoint local = math::to_local_xz(p.x - b.x, p.z - b.z, b.yaw);
    PushOut out = circle_vs_local_rect(local.x, local.z, p.radius, b.half_width, b.half_depth);
    if (!out.blocked) return out;

    const PlanarPoint world = math::to_world_xz(out.push_x, out.push_z, b.yaw);
    out.push_x = world.x;
    out.push_z = world.z;
    return out;
}

PushOut circle_vs_cube(const Footprint& p, const DynamicCube& c) {
    const float half = 0.5f * c.size;
    return circle_vs_local_rect(p.x - c.x, p.z - c.z, p.radius, half, half);
}

PushOut CollisionResolver::first_contact(const ColliderRegistry& registry, const Footprint& p,
                                         bool height_aware, float feet_y) {
    const float stand_limit = feet_y + kStandEpsilon;

    for (const auto& e : registry.cylinders()) {
        if (height_aware && e.shape.height <= stand_limit) continue;
        PushOut r = circle_vs_cylinder(p, e.shape);
        if (r.blocked) return r;
    }

    for (const auto& e : registry.cubes()) {
        if (!e.shape.is_static) continue;
        if (height_aware && e.shape.top() <= stand_limit) continue;
        PushOut r = circle_vs_cube(p, e.shape);
        if (r.blocked) return r;
    }

    for (const auto& e : registry.boxes()) {
        if (height_aware && e.shape.height <= stand_limit) continue;
        PushOut r = circle_vs_box(p, e.shape);
        if (r.blocked) return r;
    }

    return {};
}

PushOut CollisionResolver::resolve_planar(const ColliderRegistry& registry, const Footprint& p) {
    return first_contact(registry, p, false, 0.0f);
}

PushOut CollisionResolver::resolve(const ColliderRegistry& registry, const Footprint& p,
                                   float feet_y) {
    return first_contact(registry, p, true, feet_y);
}

float CollisionResolver::ground_height(const ColliderRegistry& registry, float x, float z,
                                       float feet_y, float base_height) {
    const float reach = feet_y + kStepUpTolerance;
    float best = base_height;

    auto consider = [&](float top) {
        if (top <= reach && top > best) best = top;
    };

    for (const auto& e : registry.cylinders()) {
        const auto& c = e.shape;
        if (math::length_sq_xz(x - c.x, z - c.z) <= c.radius * c.radius)
            consider(c.height);
    }

    for (const auto& e : registry.boxes()) {
        const auto& b = e.shape;
        const PlanarPoint local = math::to_local_xz(x - b.x, z - b.z, b.yaw);
        if (std::abs(local.x) <= b.half_width && std::abs(local.z) <= b.half_depth)
            consider(b.height);
    }

    for (const auto& e : registry.cubes()) {
        const auto& c = e.shape;
        const float half = 0.5f * c.size;
        if (std::abs(x - c.x) <= half && std::abs(z - c.z) <= half)
            consider(c.top());
    }

    return best;
}

} // namespace meadow
