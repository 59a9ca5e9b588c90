#pragma once
#include "../pipeline.hpp"
#include "../systems/builder.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// BuilderModule
//
// Adds CubeBuilderSystem to the Logic phase. Runs after SimulationSystem
// (it plants under the position the player reached this frame).
// ---------------------------------------------------------------------------

struct BuilderModule {
    static void install(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_logic([](ecs::World& w, float dt) { CubeBuilderSystem::Update(w, dt); });
    }
};
