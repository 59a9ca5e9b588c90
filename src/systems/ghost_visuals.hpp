#pragma once
#include <ecs/ecs.hpp>

// Keeps one translucent sphere per remote ghost.
//
// Creates the visual on GhostSpawned, destroys it on GhostDespawned, and
// copies each ghost's smoothed position into its LocalTransform every frame.
// Runs in the Logic phase after SimulationSystem.
class GhostVisualSystem {
public:
    static void Update(ecs::World& world, float dt);
};
