#include "camera.hpp"
#include "../math_util.hpp"
#include "../simulation_context.hpp"
#include <algorithm>
#include <cmath>

using namespace ecs;

ecs::Vec3 CameraSystem::desired_position(const MainCamera& cam, const ecs::Vec3& target) {
    const float angle = cam.view_angle * meadow::math::kPi / 180.0f;
    return {target.x,
            target.y + cam.distance * std::cos(angle),
            target.z + cam.distance * std::sin(angle)};
}

void CameraSystem::Update(World& world, float dt) {
    auto* cam_ptr = world.try_resource<MainCamera>();
    auto* pub     = world.try_resource<meadow::PlayerPublication>();
    if (!cam_ptr || !pub) return;
    MainCamera& cam = *cam_ptr;

    // Smoothing is tuned per 60 Hz tick; rescale for the actual frame time.
    const float ticks = std::clamp(dt * 60.0f, 0.0f, 6.0f);
    const float alpha = 1.0f - std::pow(1.0f - std::clamp(cam.smoothing, 0.0f, 1.0f), ticks);

    const ecs::Vec3 goal = desired_position(cam, pub->position);
    cam.position.x += (goal.x - cam.position.x) * alpha;
    cam.position.y += (goal.y - cam.position.y) * alpha;
    cam.position.z += (goal.z - cam.position.z) * alpha;

    cam.target.x += (pub->position.x - cam.target.x) * alpha;
    cam.target.y += (pub->position.y - cam.target.y) * alpha;
    cam.target.z += (pub->position.z - cam.target.z) * alpha;
}
