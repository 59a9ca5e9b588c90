#pragma once
#include "collider_registry.hpp"
#include "collision_resolver.hpp"
#include <ecs/ecs.hpp>

namespace meadow {

// Tunables for the local player. All of them may change between frames.
struct MotionTuning {
    float speed                 = 8.0f;    // m/s at full input
    float gravity               = 20.0f;   // m/s^2
    float base_jump_impulse     = 10.0f;   // m/s for a full-energy jump
    float jump_energy_per_jump  = 0.6f;    // fraction of current energy a jump consumes
    float min_jump_energy       = 0.05f;   // jumps need strictly more than this
    float ground_recharge_rate  = 0.8f;    // energy per second while grounded
    float air_recharge_rate     = 0.25f;   // energy per second while airborne
    float ground_level          = 0.5f;    // resting centre height above a surface
    float ground_half_size      = 50.0f;   // base plane spans [-h, h] on x and z
    float fall_limit            = -20.0f;  // below this the player respawns
    ecs::Vec3 spawn             = {0.0f, 0.5f, 0.0f};
    float player_radius         = 0.5f;
    float max_dt                = 0.1f;
    float min_dt                = 0.0001f;
};

// Owned by MotionIntegrator, mutated once per frame.
struct PlayerKinematicState {
    ecs::Vec3 position    = {0.0f, 0.5f, 0.0f};
    ecs::Vec3 velocity    = {0.0f, 0.0f, 0.0f};
    float     jump_energy = 1.0f;
    bool      grounded    = true;
};

// One frame of externally supplied input.
// direction.x is world x, direction.y is world z.
struct FrameInput {
    ecs::Vec2 direction      = {0.0f, 0.0f};
    bool      jump_requested = false;
    bool      playing        = false;
};

struct JumpOutcome {
    bool  jumped      = false;
    float impulse     = 0.0f;
    float energy_used = 0.0f;
};

struct StepReport {
    bool        stepped   = false;  // false when not playing
    JumpOutcome jump;
    bool        landed    = false;
    float       impact_speed = 0.0f;
    bool        respawned = false;
    ecs::Vec3   respawned_from = {0.0f, 0.0f, 0.0f};  // where the fall limit was crossed
    PushOut     push;
};

// Position counts as on the support surface within this distance.
constexpr float kGroundedEpsilon = 0.01f;

// ---------------------------------------------------------------------------
// MotionIntegrator: kinematic local-player motion.
//
// Per frame: horizontal move, ground test (before vertical integration),
// jump energy recharge/spend, gravity, ground clamp or respawn, and a single
// lateral push-out from the CollisionResolver.
// ---------------------------------------------------------------------------

class MotionIntegrator {
public:
    StepReport step(const FrameInput& input, const MotionTuning& tuning,
                    const ColliderRegistry& colliders, float dt);

    // Pure energy transition, exposed for unit testing.
    // Recharges `energy` for dt, then spends it if a jump is requested and
    // energy exceeds tuning.min_jump_energy.
    static JumpOutcome apply_jump_energy(bool grounded, float dt, bool jump_requested,
                                         const MotionTuning& tuning, float& energy);

    void reset(const MotionTuning& tuning);

    const PlayerKinematicState& state() const { return state_; }
    PlayerKinematicState&       state()       { return state_; }

private:
    PlayerKinematicState state_;
};

} // namespace meadow
