#pragma once
#include "../components.hpp"
#include "../simulation_context.hpp"
#include "../snapshot_protocol.hpp"
#include <ecs/ecs.hpp>

// Runs SimulationContext::step once per frame.
//
// Reads PlayerInput, GameFlags and the SnapshotStore resource; writes the
// player's LocalTransform and the PlayerPublication resource consumed by the
// renderer, the camera and the outbound network step.
// Must be the first Logic-phase step: builder and ghost visuals read the
// events it produces.
class SimulationSystem {
public:
    static void Update(ecs::World& world, float dt);

    // PlayerInput + GameFlags -> FrameInput. No Raylib dependency.
    static meadow::FrameInput make_frame_input(const PlayerInput* input, const GameFlags* flags);
};
