#pragma once
#include "collider_registry.hpp"

namespace meadow {

// Result of a single contact query. Recomputed fresh on every call.
struct PushOut {
    bool  blocked = false;
    float push_x  = 0.0f;
    float push_z  = 0.0f;
};

// Circular player footprint in the XZ plane.
struct Footprint {
    float x      = 0.0f;
    float z      = 0.0f;
    float radius = 0.5f;
};

// Separation below which a direction cannot be derived from the offset.
constexpr float kSeparationEpsilon = 0.01f;

// An obstacle whose top is within this distance of the feet no longer blocks.
constexpr float kStandEpsilon = 0.1f;

// Surfaces more than this above the feet cannot be snapped onto.
constexpr float kStepUpTolerance = 0.1f;

// ---------------------------------------------------------------------------
// Shape-pair tests
// ---------------------------------------------------------------------------

PushOut circle_vs_cylinder(const Footprint& p, const CylinderCollider& c);

// The box is handled in its own frame (inverse yaw), the push is rotated back.
PushOut circle_vs_box(const Footprint& p, const BoxCollider& b);

// Cubes are axis-aligned squares of half-extent size/2 in the XZ plane.
PushOut circle_vs_cube(const Footprint& p, const DynamicCube& c);

// ---------------------------------------------------------------------------
// CollisionResolver: single-contact push-out and ground queries against a
// ColliderRegistry.
//
// Test order is every cylinder, then every static cube, then every box, each
// in registration order. The first overlapping collider wins; there is no
// iterative multi-contact solving.
// ---------------------------------------------------------------------------

class CollisionResolver {
public:
    // Lateral push-out ignoring heights.
    static PushOut resolve_planar(const ColliderRegistry& registry, const Footprint& p);

    // Lateral push-out that skips obstacles whose top is at or below
    // feet_y + kStandEpsilon (the player is standing on or above them).
    static PushOut resolve(const ColliderRegistry& registry, const Footprint& p, float feet_y);

    // Highest standable surface under (x, z) that is at or below
    // feet_y + kStepUpTolerance. Never lower than base_height.
    static float ground_height(const ColliderRegistry& registry, float x, float z,
                               float feet_y, float base_height = 0.0f);

private:
    static PushOut first_contact(const ColliderRegistry& registry, const Footprint& p,
                                 bool height_aware, float feet_y);
};

} // namespace meadow
