#pragma once
#include <ecs/ecs.hpp>
#include <ecs/modules/transform.hpp>

// ---------------------------------------------------------------------------
// Components shared by the scene loader, systems and renderer.
//
// Free of Raylib headers so that the scene loader and its tests build in the
// headless target. Colours are converted to Raylib's Color at draw time.
// ---------------------------------------------------------------------------

struct Color4 {
    float r = 1.0f, g = 1.0f, b = 1.0f, a = 1.0f;
};

namespace Colors {
    inline constexpr Color4 White   = {1.0f, 1.0f, 1.0f, 1.0f};
    inline constexpr Color4 Cube    = {0.69f, 0.19f, 0.38f, 1.0f};
    inline constexpr Color4 Ghost   = {0.53f, 0.67f, 1.0f, 0.5f};
}

// 0 = Box, 1 = Cylinder, 2 = Sphere
enum class ShapeType { Box, Cylinder, Sphere };

// Unit shape scaled by LocalTransform::scale, then by scale_offset.
struct MeshRenderer {
    ShapeType shape_type   = ShapeType::Box;
    Color4    color        = Colors::White;
    ecs::Vec3 scale_offset = {1, 1, 1};
};

// ---------------------------------------------------------------------------
// Gameplay / Input
// ---------------------------------------------------------------------------

struct PlayerInput {
    ecs::Vec2 move_input = {0, 0};  // x = world x, y = world z
    bool jump = false;
    bool plant_cube = false;
};

// Builder bookkeeping for the local player's own cube.
struct PlayerState {
    float build_cooldown   = 0.0f;
    bool  trigger_was_down = false;
    bool  has_cube         = false;
    ecs::Vec3 cube_center  = {0, 0, 0};
};

// Session flags owned by the application shell.
struct GameFlags {
    bool playing = false;
    bool paused  = false;
};

// Top-down follow camera. Smoothed toward the player every Logic tick.
struct MainCamera {
    float distance   = 14.0f;
    float view_angle = 43.0f;   // degrees; 0 = straight down
    float smoothing  = 0.1f;    // fraction of the gap closed per tick at 60 fps

    ecs::Vec3 position = {0, 20, 0};
    ecs::Vec3 target   = {0, 0, 0};
};

// Visual stand-in for a remote player. id is the network player id.
struct GhostVisual {
    int id = 0;
};

struct PlayerTag {};
struct WorldTag {};
struct LocalCubeTag {};
