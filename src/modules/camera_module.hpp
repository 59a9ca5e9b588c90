#pragma once
#include "../components.hpp"
#include "../pipeline.hpp"
#include "../systems/camera.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// CameraModule
//
// Creates the MainCamera resource and adds CameraSystem to the Logic phase.
//
// Pipeline placement: install after SimulationModule so the camera follows
// the position published this frame.
// ---------------------------------------------------------------------------

struct CameraModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(MainCamera{});
        pipeline.add_logic([](ecs::World& w, float dt) { CameraSystem::Update(w, dt); });
    }
};
