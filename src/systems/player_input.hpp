#pragma once
#include <ecs/ecs.hpp>

// Samples keyboard and the first gamepad into the player's PlayerInput, and
// handles the session keys (Enter: start, P: pause) on the GameFlags resource.
// Runs in the Pre-Update phase.
class PlayerInputSystem {
public:
    static void Update(ecs::World& world);
};
