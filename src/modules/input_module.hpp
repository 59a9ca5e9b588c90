#pragma once
#include "../components.hpp"
#include "../pipeline.hpp"
#include "../systems/player_input.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// InputModule
//
// Creates the GameFlags resource and adds PlayerInputSystem to the
// Pre-Update phase, so PlayerInput is current before the simulation steps.
// ---------------------------------------------------------------------------

struct InputModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        if (!world.try_resource<GameFlags>()) world.set_resource(GameFlags{});
        pipeline.add_pre_update([](ecs::World& w, float) { PlayerInputSystem::Update(w); });
    }
};
