#include "player_input.hpp"
#include "../components.hpp"
#include <raylib.h>
#include <cmath>

using namespace ecs;

static constexpr float kDeadzone = 0.15f;

void PlayerInputSystem::Update(World& world) {
    if (auto* flags = world.try_resource<GameFlags>()) {
        if (IsKeyPressed(KEY_ENTER) && !flags->playing) {
            flags->playing = true;
            flags->paused  = false;
        }
        if (IsKeyPressed(KEY_P) && flags->playing) flags->paused = !flags->paused;
    }

    world.single<PlayerInput>([&](Entity, PlayerInput& input) {
        // Reset per-frame state
        input.move_input = {0, 0};
        input.jump       = false;
        input.plant_cube = false;

        // 1. Keyboard. Screen up is world -z under the top-down camera
        if (IsKeyDown(KEY_W) || IsKeyDown(KEY_UP))    input.move_input.y -= 1.0f;
        if (IsKeyDown(KEY_S) || IsKeyDown(KEY_DOWN))  input.move_input.y += 1.0f;
        if (IsKeyDown(KEY_A) || IsKeyDown(KEY_LEFT))  input.move_input.x -= 1.0f;
        if (IsKeyDown(KEY_D) || IsKeyDown(KEY_RIGHT)) input.move_input.x += 1.0f;

        if (IsKeyPressed(KEY_SPACE)) input.jump = true;
        if (IsKeyDown(KEY_E))        input.plant_cube = true;

        // 2. Gamepad (first slot only)
        if (IsGamepadAvailable(0)) {
            const float lx = GetGamepadAxisMovement(0, GAMEPAD_AXIS_LEFT_X);
            const float ly = GetGamepadAxisMovement(0, GAMEPAD_AXIS_LEFT_Y);
            if (std::abs(lx) > kDeadzone) input.move_input.x += lx;
            if (std::abs(ly) > kDeadzone) input.move_input.y += ly;

            if (IsGamepadButtonPressed(0, GAMEPAD_BUTTON_RIGHT_FACE_DOWN)) input.jump = true;
            if (IsGamepadButtonDown(0, GAMEPAD_BUTTON_RIGHT_TRIGGER_2))    input.plant_cube = true;
        }

        // 3. Final Input Normalization
        const float mag_sq = input.move_input.x * input.move_input.x +
                             input.move_input.y * input.move_input.y;
        if (mag_sq > 1.0f) {
            const float mag = std::sqrt(mag_sq);
            input.move_input.x /= mag;
            input.move_input.y /= mag;
        }
    });
}
