#include "motion_integrator.hpp"
#include "math_util.hpp"
#include <raylib.h>
#include <algorithm>
#include <cmath>

namespace meadow {

JumpOutcome MotionIntegrator::apply_jump_energy(bool grounded, float dt, bool jump_requested,
                                                const MotionTuning& tuning, float& energy) {
    const float rate = grounded ? tuning.ground_recharge_rate : tuning.air_recharge_rate;
    energy = std::clamp(energy + rate * dt, 0.0f, 1.0f);

    JumpOutcome out;
    if (!jump_requested || energy <= tuning.min_jump_energy) return out;

    const float fraction = std::clamp(tuning.jump_energy_per_jump, 0.0f, 1.0f);
    out.energy_used = energy * fraction;
    out.impulse     = tuning.base_jump_impulse * std::sqrt(out.energy_used);
    out.jumped      = true;

    energy = std::clamp(energy - out.energy_used, 0.0f, 1.0f);
    return out;
}

void MotionIntegrator::reset(const MotionTuning& tuning) {
    state_ = PlayerKinematicState{};
    state_.position = tuning.spawn;
}

StepReport MotionIntegrator::step(const FrameInput& input, const MotionTuning& tuning,
                                  const ColliderRegistry& colliders, float raw_dt) {
    StepReport report;
    if (!input.playing) return report;
    report.stepped = true;

    const float dt = math::clamp_dt(raw_dt, tuning.min_dt, tuning.max_dt);
    auto& s = state_;

    // --- 1. Horizontal movement (kinematic) ---
    float ix = input.direction.x;
    float iz = input.direction.y;
    if (!std::isfinite(ix) || !std::isfinite(iz)) ix = iz = 0.0f;

    const float mag_sq = math::length_sq_xz(ix, iz);
    if (mag_sq > 1.0f) {
        const float mag = std::sqrt(mag_sq);
        ix /= mag;
        iz /= mag;
    }

    s.velocity.x = ix * tuning.speed;
    s.velocity.z = iz * tuning.speed;
    s.position.x += s.velocity.x * dt;
    s.position.z += s.velocity.z * dt;

    // --- 2. Support surface and ground state (before vertical integration) ---
    const bool in_bounds = std::abs(s.position.x) < tuning.ground_half_size &&
                           std::abs(s.position.z) < tuning.ground_half_size;

    const float feet_y    = s.position.y - tuning.ground_level;
    const float surface   = CollisionResolver::ground_height(colliders, s.position.x,
                                                             s.position.z, feet_y);
    const bool  on_prop   = surface > 0.0f;
    const bool  supported = in_bounds || on_prop;
    const float support_y = surface + tuning.ground_level;

    s.grounded = supported && s.position.y <= support_y + kGroundedEpsilon;

    // --- 3. Jump energy ---
    report.jump = apply_jump_energy(s.grounded, dt, input.jump_requested, tuning, s.jump_energy);
    if (report.jump.jumped) {
        s.velocity.y = std::max(s.velocity.y, 0.0f) + report.jump.impulse;
    }

    // --- 4. Gravity ---
    s.velocity.y -= tuning.gravity * dt;
    s.position.y += s.velocity.y * dt;

    // --- 5. Ground clamp / fall-through recovery ---
    const bool touching = supported && s.position.y <= support_y + kGroundedEpsilon;
    if (touching && !s.grounded && s.velocity.y < 0.0f) {
        report.landed       = true;
        report.impact_speed = -s.velocity.y;
    }
    if (supported && s.position.y < support_y) {
        s.position.y = support_y;
        s.velocity.y = 0.0f;
    }

    if (s.position.y < tuning.fall_limit) {
        TraceLog(LOG_INFO, "MOTION: Fell below %.1f at (%.2f, %.2f), respawning",
                 tuning.fall_limit, s.position.x, s.position.z);
        report.respawned_from = s.position;
        s.position  = tuning.spawn;
        s.velocity  = {0.0f, 0.0f, 0.0f};
        s.grounded  = false;
        report.respawned = true;
    }

    // --- 6. Lateral push-out (single contact, applied to position) ---
    const Footprint fp{s.position.x, s.position.z, tuning.player_radius};
    report.push = CollisionResolver::resolve(colliders, fp, s.position.y - tuning.ground_level);
    if (report.push.blocked) {
        s.position.x += report.push.push_x;
        s.position.z += report.push.push_z;
    }

    return report;
}

} // namespace meadow
