#include "builder.hpp"
#include "../components.hpp"
#include "../simulation_context.hpp"
#include <ecs/modules/transform.hpp>
#include <raylib.h>
#include <algorithm>
#include <memory>

using namespace ecs;
using meadow::CollisionResolver;
using meadow::SimulationContext;

float CubeBuilderSystem::plant_height(float feet_y, float support_y, float size) {
    // Top at the feet, but never sunk into the surface below.
    const float half = 0.5f * size;
    return std::max(feet_y - half, support_y + half);
}

void CubeBuilderSystem::Update(World& world, float dt) {
    auto* ctx_ptr = world.try_resource<std::shared_ptr<SimulationContext>>();
    if (!ctx_ptr || !*ctx_ptr) return;
    auto& ctx = **ctx_ptr;

    const auto* flags = world.try_resource<GameFlags>();
    const bool active = flags && flags->playing && !flags->paused;

    world.each<PlayerTag, PlayerInput, PlayerState>([&](Entity, PlayerTag&, PlayerInput& input,
                                                        PlayerState& state) {
        if (state.build_cooldown > 0) state.build_cooldown -= dt;

        // Detect rising edge of the plant key
        const bool trigger_pressed = input.plant_cube && !state.trigger_was_down;
        state.trigger_was_down = input.plant_cube;

        if (!active || !trigger_pressed || state.build_cooldown > 0) return;
        state.build_cooldown = kCooldown;

        const auto& player = ctx.motion.state().position;
        const float feet_y  = player.y - ctx.tuning.ground_level;

        // The old cube must not support the new one.
        ctx.colliders.remove(kColliderId);
        const float support = CollisionResolver::ground_height(ctx.colliders, player.x, player.z, feet_y);
        const float y       = plant_height(feet_y, support, kCubeSize);

        if (!ctx.colliders.set_dynamic_cube(kColliderId, player.x, y, player.z, kCubeSize, false)) return;

        state.has_cube    = true;
        state.cube_center = {player.x, y, player.z};
        TraceLog(LOG_DEBUG, "BUILD: Cube at (%.2f, %.2f, %.2f)", player.x, y, player.z);
    });

    // Visual: a single LocalCubeTag entity follows the registered cube.
    const auto* cube = ctx.colliders.find_cube(kColliderId);
    if (!cube) return;

    const ecs::Vec3 pos  = {cube->x, cube->y, cube->z};
    const ecs::Vec3 size = {cube->size, cube->size, cube->size};

    bool found = false;
    world.each<LocalCubeTag, LocalTransform>([&](Entity, LocalCubeTag&, LocalTransform& lt) {
        lt.position = pos;
        found = true;
    });
    if (!found) {
        world.deferred().create_with(
            ecs::LocalTransform{pos, {0, 0, 0, 1}, size},
            ecs::WorldTransform{},
            MeshRenderer{ShapeType::Box, Colors::Cube},
            LocalCubeTag{},
            WorldTag{}
        );
    }
}
