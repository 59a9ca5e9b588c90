#pragma once
#include "../pipeline.hpp"
#include "../simulation_context.hpp"
#include "../systems/ghost_visuals.hpp"
#include "../systems/simulation.hpp"
#include <ecs/ecs.hpp>
#include <memory>

// ---------------------------------------------------------------------------
// SimulationModule
//
// Creates the SimulationContext resource and adds SimulationSystem followed
// by GhostVisualSystem to the Logic phase.
//
// Pipeline placement: install before BuilderModule and CameraModule. Both
// read what SimulationSystem writes this frame.
// ---------------------------------------------------------------------------

struct SimulationModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(std::make_shared<meadow::SimulationContext>());
        world.set_resource(meadow::PlayerPublication{});

        pipeline.add_logic([](ecs::World& w, float dt) { SimulationSystem::Update(w, dt); });
        pipeline.add_logic([](ecs::World& w, float dt) { GhostVisualSystem::Update(w, dt); });
    }
};
