#include "renderer.hpp"
#include "../components.hpp"
#include "../simulation_context.hpp"
#include "../snapshot_protocol.hpp"
#include <ecs/modules/transform.hpp>
#include <raylib.h>
#include <rlgl.h>
#include <cstdio>
#include <memory>

using namespace ecs;
using meadow::SimulationContext;

// Convert our engine Color4 to Raylib's Color at draw time.
static inline Color to_raylib(const Color4& c) {
    return Color{
        static_cast<unsigned char>(c.r * 255.0f),
        static_cast<unsigned char>(c.g * 255.0f),
        static_cast<unsigned char>(c.b * 255.0f),
        static_cast<unsigned char>(c.a * 255.0f),
    };
}

static void draw_unit_shape(ShapeType shape, Color col) {
    switch (shape) {
        case ShapeType::Box:
            DrawCube({0, 0, 0}, 1.0f, 1.0f, 1.0f, col);
            DrawCubeWires({0, 0, 0}, 1.0f, 1.0f, 1.0f, Fade(BLACK, 0.3f));
            break;
        case ShapeType::Cylinder:
            DrawCylinder({0, -0.5f, 0}, 0.5f, 0.5f, 1.0f, 16, col);
            break;
        case ShapeType::Sphere:
            DrawSphere({0, 0, 0}, 0.5f, col);
            break;
    }
}

static void draw_hud(World& world, const SimulationContext* ctx) {
    const auto* pub   = world.try_resource<meadow::PlayerPublication>();
    const auto* flags = world.try_resource<GameFlags>();
    const auto* store = world.try_resource<meadow::SnapshotStore>();

    DrawFPS(10, 10);

    if (pub) {
        // Jump energy bar
        const int x = 10, y = 40, w = 200, h = 14;
        DrawRectangle(x, y, w, h, Fade(DARKGRAY, 0.8f));
        const Color fill = pub->jump_energy > 0.05f ? SKYBLUE : MAROON;
        DrawRectangle(x, y, static_cast<int>(w * pub->jump_energy), h, fill);
        DrawRectangleLines(x, y, w, h, LIGHTGRAY);
        DrawText("JUMP", x + w + 8, y, 14, LIGHTGRAY);

        DrawText(pub->grounded ? "GROUNDED" : "AIRBORNE", 10, 60, 16,
                 pub->grounded ? GREEN : YELLOW);
    }

    char line[64];
    const int players = store ? store->player_count() : 0;
    const int ghosts  = ctx ? static_cast<int>(ctx->reconciler.size()) : 0;
    std::snprintf(line, sizeof(line), "PLAYERS: %d  GHOSTS: %d", players, ghosts);
    DrawText(line, 10, 80, 16, LIGHTGRAY);

    DrawText("WASD / ARROWS: Move | SPACE: Jump | E: Plant Cube | P: Pause | R: Reload",
             10, GetScreenHeight() - 30, 18, LIGHTGRAY);

    if (flags && !flags->playing) {
        const char* msg = "PRESS ENTER TO PLAY";
        DrawText(msg, (GetScreenWidth() - MeasureText(msg, 40)) / 2, GetScreenHeight() / 2 - 20, 40, RAYWHITE);
    } else if (flags && flags->paused) {
        const char* msg = "PAUSED";
        DrawText(msg, (GetScreenWidth() - MeasureText(msg, 40)) / 2, GetScreenHeight() / 2 - 20, 40, RAYWHITE);
    }
}

void RenderSystem::Update(World& world) {
    auto* ctx_ptr = world.try_resource<std::shared_ptr<SimulationContext>>();
    const SimulationContext* ctx = (ctx_ptr && *ctx_ptr) ? ctx_ptr->get() : nullptr;

    BeginDrawing();
    ClearBackground({35, 35, 40, 255});

    // 1. Build Camera3D from MainCamera data
    Camera3D camera = {};
    camera.up         = {0, 1, 0};
    camera.fovy       = 50.0f;
    camera.projection = CAMERA_PERSPECTIVE;
    if (auto* cam = world.try_resource<MainCamera>()) {
        camera.position = {cam->position.x, cam->position.y, cam->position.z};
        camera.target   = {cam->target.x,   cam->target.y,   cam->target.z};
    }

    // 2. Render Scene
    BeginMode3D(camera);
        world.each<WorldTransform, MeshRenderer>([&](Entity, WorldTransform& wt, MeshRenderer& mesh) {
            rlPushMatrix();
            rlMultMatrixf((float*)&wt.matrix);
            rlScalef(mesh.scale_offset.x, mesh.scale_offset.y, mesh.scale_offset.z);
            draw_unit_shape(mesh.shape_type, to_raylib(mesh.color));
            rlPopMatrix();
        });

        // Remote cubes have no entity; draw them from the registry.
        if (ctx) {
            for (const auto& e : ctx->colliders.cubes()) {
                if (!e.shape.is_static || e.id.rfind("remote-cube:", 0) != 0) continue;
                const Vector3 p = {e.shape.x, e.shape.y, e.shape.z};
                DrawCube(p, e.shape.size, e.shape.size, e.shape.size, Fade(to_raylib(Colors::Cube), 0.7f));
                DrawCubeWires(p, e.shape.size, e.shape.size, e.shape.size, Fade(BLACK, 0.3f));
            }
        }
    EndMode3D();

    // 3. Render UI
    draw_hud(world, ctx);

    EndDrawing();
}
