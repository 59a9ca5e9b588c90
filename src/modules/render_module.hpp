#pragma once
#include "../pipeline.hpp"
#include "../systems/renderer.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform_propagation.hpp>

// ---------------------------------------------------------------------------
// RenderModule
//
// Propagates LocalTransform -> WorldTransform in Post-Update and adds
// RenderSystem to the Render phase.
// ---------------------------------------------------------------------------

struct RenderModule {
    static void install(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_post_update([](ecs::World& w, float) { ecs::propagate_transforms(w); });
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::Update(w); });
    }
};
