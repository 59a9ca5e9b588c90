#pragma once
#include <ecs/ecs.hpp>

// Plants the local player's own cube on a rising edge of PlayerInput::plant_cube.
//
// One cube per player: re-planting moves it. The cube is registered as a
// non-static dynamic cube (standable, never blocks its owner) under the
// player's feet, snapped on top of whatever surface is already there.
// Runs in the Logic phase after SimulationSystem.
class CubeBuilderSystem {
public:
    static constexpr float kCubeSize = 1.0f;
    static constexpr float kCooldown = 0.25f;
    static constexpr const char* kColliderId = "local-cube";

    static void Update(ecs::World& world, float dt);

    // Centre height for a cube planted under feet_y, resting on support_y or higher.
    static float plant_height(float feet_y, float support_y, float size);
};
