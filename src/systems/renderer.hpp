#pragma once
#include <ecs/ecs.hpp>

// Draws every MeshRenderer entity through its WorldTransform, remote players'
// cubes straight from the collider registry, and the HUD (jump energy,
// ground state, player count, start/pause prompts).
class RenderSystem {
public:
    static void Update(ecs::World& world);
};
