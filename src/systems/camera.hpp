#pragma once
#include "../components.hpp"
#include <ecs/ecs.hpp>

// Top-down follow camera: hovers `distance` from the player, tilted by
// `view_angle` degrees toward +z, closing a fixed fraction of the gap each tick.
// Runs last in the Logic phase.
class CameraSystem {
public:
    static void Update(ecs::World& world, float dt);

    // Desired eye position for a player at `target`.
    static ecs::Vec3 desired_position(const MainCamera& cam, const ecs::Vec3& target);
};
