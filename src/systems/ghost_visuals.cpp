#include "ghost_visuals.hpp"
#include "../components.hpp"
#include "../simulation_context.hpp"
#include <ecs/modules/transform.hpp>
#include <raylib.h>
#include <memory>
#include <vector>

using namespace ecs;
using meadow::SimulationContext;

static Color4 hue_to_color4(float hue) {
    const Color c = ColorFromHSV(hue, 0.45f, 1.0f);
    return {c.r / 255.0f, c.g / 255.0f, c.b / 255.0f, Colors::Ghost.a};
}

void GhostVisualSystem::Update(World& world, float /*dt*/) {
    auto* ctx_ptr = world.try_resource<std::shared_ptr<SimulationContext>>();
    if (!ctx_ptr || !*ctx_ptr) return;
    auto& ctx = **ctx_ptr;

    // 1. Release visuals of ghosts that left
    if (!ctx.ghosts_despawned.empty()) {
        std::vector<Entity> to_destroy;
        world.each<GhostVisual>([&](Entity e, GhostVisual& gv) {
            for (const auto& ev : ctx.ghosts_despawned.read())
                if (ev.id == gv.id) to_destroy.push_back(e);
        });
        for (auto e : to_destroy) world.destroy(e);
        for (const auto& ev : ctx.ghosts_despawned.read())
            TraceLog(LOG_DEBUG, "GHOST: Player %d left", ev.id);
    }

    // 2. Create visuals for new ghosts
    for (const auto& ev : ctx.ghosts_spawned.read()) {
        auto ent = world.create();
        world.add(ent, LocalTransform{ev.position, {0, 0, 0, 1}, {1, 1, 1}});
        world.add(ent, WorldTransform{});
        world.add(ent, MeshRenderer{ShapeType::Sphere, hue_to_color4(ev.color_hue)});
        world.add(ent, GhostVisual{ev.id});
        world.add(ent, WorldTag{});
        TraceLog(LOG_DEBUG, "GHOST: Player %d joined", ev.id);
    }

    // 3. Follow the smoothed state
    world.each<GhostVisual, LocalTransform>([&](Entity, GhostVisual& gv, LocalTransform& lt) {
        if (const auto* ghost = ctx.reconciler.find(gv.id)) lt.position = ghost->position;
    });
}
