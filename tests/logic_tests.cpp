#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/math_util.hpp"
#include "../src/collider_registry.hpp"
#include "../src/collision_resolver.hpp"
#include "../src/motion_integrator.hpp"
#include "../src/remote_reconciler.hpp"
#include "../src/events.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

// The simulation core has no ECS world or window dependency; everything here
// drives it directly.

using namespace meadow;
using namespace meadow::math;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("Angle Normalization", "[math]") {
    SECTION("Inside range") {
        CHECK_THAT(normalize_angle(1.0f), WithinRel(1.0f));
        CHECK_THAT(normalize_angle(-1.0f), WithinRel(-1.0f));
    }

    SECTION("Outside range (positive)") {
        CHECK_THAT(normalize_angle(1.5f * kPi), WithinRel(-0.5f * kPi));
        CHECK_THAT(normalize_angle(3.0f * kPi), WithinRel(kPi));
    }

    SECTION("Outside range (negative)") {
        CHECK_THAT(normalize_angle(-1.5f * kPi), WithinRel(0.5f * kPi));
        CHECK_THAT(normalize_angle(-3.0f * kPi), WithinRel(-kPi));
    }
}

TEST_CASE("Yaw rotation - local and world frames are inverses", "[math]") {
    const float yaw = 0.7f;
    const PlanarPoint local = to_local_xz(1.5f, -2.0f, yaw);
    const PlanarPoint world = to_world_xz(local.x, local.z, yaw);
    CHECK_THAT(world.x, WithinAbs(1.5f, 1e-5f));
    CHECK_THAT(world.z, WithinAbs(-2.0f, 1e-5f));

    // A quarter turn about +Y maps local +x onto world -z.
    const PlanarPoint q = to_world_xz(1.0f, 0.0f, 0.5f * kPi);
    CHECK_THAT(q.x, WithinAbs(0.0f, 1e-5f));
    CHECK_THAT(q.z, WithinAbs(-1.0f, 1e-5f));
}

TEST_CASE("clamp_dt - stalls, zero and NaN", "[math]") {
    CHECK_THAT(clamp_dt(0.016f, 0.0001f, 0.1f), WithinRel(0.016f));
    CHECK_THAT(clamp_dt(3.0f, 0.0001f, 0.1f), WithinRel(0.1f));
    CHECK_THAT(clamp_dt(0.0f, 0.0001f, 0.1f), WithinRel(0.0001f));
    CHECK_THAT(clamp_dt(-1.0f, 0.0001f, 0.1f), WithinRel(0.0001f));
    CHECK_THAT(clamp_dt(std::numeric_limits<float>::quiet_NaN(), 0.0001f, 0.1f), WithinRel(0.0001f));
}

// ---------------------------------------------------------------------------
// ColliderRegistry
// ---------------------------------------------------------------------------

TEST_CASE("ColliderRegistry - add, contains, remove", "[registry]") {
    ColliderRegistry reg;
    REQUIRE(reg.add_cylinder("well", 8.0f, -6.0f, 2.5f, 2.0f));
    REQUIRE(reg.add_box("shed", 0.0f, 0.0f, 3.0f, 2.0f, 3.0f, 0.3f));
    REQUIRE(reg.set_dynamic_cube("crate", 1.0f, 0.5f, 1.0f, 1.0f, true));

    CHECK(reg.size() == 3);
    CHECK(reg.contains("well"));
    CHECK(reg.contains("shed"));
    CHECK(reg.contains("crate"));

    CHECK(reg.remove("shed"));
    CHECK_FALSE(reg.remove("shed"));
    CHECK_FALSE(reg.contains("shed"));
    CHECK(reg.size() == 2);

    reg.clear();
    CHECK(reg.size() == 0);
}

TEST_CASE("ColliderRegistry - non-positive dimensions are rejected", "[registry]") {
    ColliderRegistry reg;
    CHECK_FALSE(reg.add_cylinder("a", 0, 0, 0.0f, 1.0f));
    CHECK_FALSE(reg.add_cylinder("b", 0, 0, 1.0f, -2.0f));
    CHECK_FALSE(reg.add_box("c", 0, 0, 1.0f, 0.0f, 1.0f, 0.0f));
    CHECK_FALSE(reg.add_box("d", 0, 0, 1.0f, 1.0f, 1.0f, std::numeric_limits<float>::infinity()));
    CHECK_FALSE(reg.set_dynamic_cube("e", 0, 0, 0, std::numeric_limits<float>::quiet_NaN(), true));
    CHECK(reg.size() == 0);
}

TEST_CASE("ColliderRegistry - duplicate id overwrites", "[registry]") {
    ColliderRegistry reg;
    reg.add_cylinder("a", 0, 0, 1.0f, 1.0f);
    reg.add_cylinder("b", 5, 0, 1.0f, 1.0f);
    reg.add_cylinder("a", 2, 3, 0.5f, 4.0f);

    REQUIRE(reg.cylinders().size() == 2);
    // Same kind: keeps its registration slot.
    CHECK(reg.cylinders()[0].id == "a");
    CHECK_THAT(reg.cylinders()[0].shape.x, WithinRel(2.0f));
    CHECK_THAT(reg.cylinders()[0].shape.height, WithinRel(4.0f));

    // Different kind: moves buckets.
    reg.set_dynamic_cube("a", 0, 0.5f, 0, 1.0f, true);
    CHECK(reg.cylinders().size() == 1);
    REQUIRE(reg.find_cube("a") != nullptr);
    CHECK(reg.size() == 2);
}

TEST_CASE("ColliderRegistry - box yaw is normalised", "[registry]") {
    ColliderRegistry reg;
    reg.add_box("b", 0, 0, 1, 1, 1, 2.5f * kPi);
    REQUIRE(reg.boxes().size() == 1);
    CHECK_THAT(reg.boxes()[0].shape.yaw, WithinAbs(0.5f * kPi, 1e-4f));
}

// ---------------------------------------------------------------------------
// Shape-pair tests
// ---------------------------------------------------------------------------

TEST_CASE("circle_vs_cylinder - overlap and separation", "[collision]") {
    const CylinderCollider trunk{0.0f, 0.0f, 1.0f, 2.0f};

    SECTION("Contact at distance 1.0 pushes 0.5 along +x") {
        const PushOut r = circle_vs_cylinder({1.0f, 0.0f, 0.5f}, trunk);
        CHECK(r.blocked);
        CHECK_THAT(r.push_x, WithinAbs(0.5f, 1e-5f));
        CHECK_THAT(r.push_z, WithinAbs(0.0f, 1e-5f));
    }

    SECTION("Distance 1.2 is still inside the combined radius") {
        const PushOut r = circle_vs_cylinder({1.2f, 0.0f, 0.5f}, trunk);
        CHECK(r.blocked);
        CHECK_THAT(r.push_x, WithinAbs(0.3f, 1e-5f));
    }

    SECTION("Touching or beyond the combined radius is free") {
        CHECK_FALSE(circle_vs_cylinder({1.5f, 0.0f, 0.5f}, trunk).blocked);
        CHECK_FALSE(circle_vs_cylinder({1.6f, 0.0f, 0.5f}, trunk).blocked);
        CHECK_FALSE(circle_vs_cylinder({0.0f, -3.0f, 0.5f}, trunk).blocked);
    }

    SECTION("Diagonal push follows the centre offset") {
        const PushOut r = circle_vs_cylinder({0.0f, -1.0f, 0.5f}, trunk);
        CHECK(r.blocked);
        CHECK_THAT(r.push_x, WithinAbs(0.0f, 1e-5f));
        CHECK_THAT(r.push_z, WithinAbs(-0.5f, 1e-5f));
    }

    SECTION("Concentric falls back to +x") {
        const PushOut r = circle_vs_cylinder({0.0f, 0.0f, 0.5f}, trunk);
        CHECK(r.blocked);
        CHECK_THAT(r.push_x, WithinAbs(1.5f, 1e-5f));
        CHECK_THAT(r.push_z, WithinAbs(0.0f, 1e-5f));
    }

    SECTION("Nearly concentric off-axis offset still ends at the combined radius") {
        const float offsets[][2] = {{-0.005f, 0.004f}, {-0.005f, 0.0f}, {0.003f, -0.006f}};
        for (const auto& o : offsets) {
            const PushOut r = circle_vs_cylinder({o[0], o[1], 0.5f}, trunk);
            REQUIRE(r.blocked);

            const float x = o[0] + r.push_x;
            const float z = o[1] + r.push_z;
            CHECK_THAT(x, WithinAbs(1.5f, 1e-5f));
            CHECK_THAT(z, WithinAbs(0.0f, 1e-5f));
            CHECK(std::sqrt(length_sq_xz(x, z)) >= 1.5f - 1e-5f);
        }
    }
}

TEST_CASE("circle_vs_cylinder - push-out clears the overlap from any side", "[collision]") {
    const CylinderCollider well{2.0f, -1.0f, 2.5f, 2.0f};
    for (int i = 0; i < 12; ++i) {
        const float a = i * (2.0f * kPi / 12.0f);
        Footprint p{well.x + 2.2f * std::cos(a), well.z + 2.2f * std::sin(a), 0.5f};

        const PushOut r = circle_vs_cylinder(p, well);
        REQUIRE(r.blocked);

        p.x += r.push_x;
        p.z += r.push_z;
        const float d = std::sqrt(length_sq_xz(p.x - well.x, p.z - well.z));
        CHECK_THAT(d, WithinAbs(3.0f, 1e-4f));
    }
}

TEST_CASE("circle_vs_box - quarter-turned box pushes in world space", "[collision]") {
    // Local x (half_width 2) lies along world z, local z (half_depth 0.5) along world x.
    const BoxCollider wall{0.0f, 0.0f, 2.0f, 0.5f, 1.0f, 0.5f * kPi};

    const PushOut side = circle_vs_box({0.8f, 0.0f, 0.5f}, wall);
    CHECK(side.blocked);
    CHECK_THAT(side.push_x, WithinAbs(0.2f, 1e-4f));
    CHECK_THAT(side.push_z, WithinAbs(0.0f, 1e-4f));

    const PushOut end = circle_vs_box({0.0f, 2.3f, 0.5f}, wall);
    CHECK(end.blocked);
    CHECK_THAT(end.push_x, WithinAbs(0.0f, 1e-4f));
    CHECK_THAT(end.push_z, WithinAbs(0.2f, 1e-4f));

    CHECK_FALSE(circle_vs_box({1.2f, 0.0f, 0.5f}, wall).blocked);
}

TEST_CASE("circle_vs_box - push-out removes the overlap at any yaw", "[collision]") {
    const float yaws[] = {0.0f, 0.3f, -1.1f, 2.4f};
    for (float yaw : yaws) {
        const BoxCollider box{3.0f, -2.0f, 1.5f, 0.75f, 1.0f, yaw};
        // Near a corner, just inside the radius.
        const PlanarPoint offset = to_world_xz(1.8f, 0.9f, yaw);
        Footprint p{box.x + offset.x, box.z + offset.z, 0.5f};

        const PushOut r = circle_vs_box(p, box);
        REQUIRE(r.blocked);

        p.x += r.push_x * 1.001f;
        p.z += r.push_z * 1.001f;
        CHECK_FALSE(circle_vs_box(p, box).blocked);
    }
}

TEST_CASE("circle_vs_box - centre inside leaves along the shallower axis", "[collision]") {
    const BoxCollider box{0.0f, 0.0f, 2.0f, 0.5f, 1.0f, 0.0f};
    const PushOut r = circle_vs_box({0.5f, 0.1f, 0.5f}, box);
    CHECK(r.blocked);
    CHECK_THAT(r.push_x, WithinAbs(0.0f, 1e-5f));
    CHECK_THAT(r.push_z, WithinAbs(0.9f, 1e-5f));
}

TEST_CASE("circle_vs_cube - cubes are axis-aligned squares", "[collision]") {
    const DynamicCube cube{0.0f, 0.5f, 0.0f, 1.0f, true};
    const PushOut r = circle_vs_cube({0.8f, 0.0f, 0.5f}, cube);
    CHECK(r.blocked);
    CHECK_THAT(r.push_x, WithinAbs(0.2f, 1e-5f));
    CHECK_THAT(cube.top(), WithinRel(1.0f));
}

// ---------------------------------------------------------------------------
// CollisionResolver
// ---------------------------------------------------------------------------

TEST_CASE("CollisionResolver - cylinders are tested before boxes", "[collision]") {
    ColliderRegistry reg;
    reg.add_box("box", 1.5f, 0.0f, 0.5f, 0.5f, 1.0f, 0.0f);
    reg.add_cylinder("trunk", 0.0f, 0.0f, 1.0f, 2.0f);

    const PushOut r = CollisionResolver::resolve_planar(reg, {1.1f, 0.0f, 0.5f});
    CHECK(r.blocked);
    CHECK_THAT(r.push_x, WithinAbs(0.4f, 1e-5f));
}

TEST_CASE("CollisionResolver - the player's own cube never blocks", "[collision]") {
    ColliderRegistry reg;
    reg.set_dynamic_cube("local-cube", 0.0f, 0.5f, 0.0f, 1.0f, false);
    CHECK_FALSE(CollisionResolver::resolve_planar(reg, {0.6f, 0.0f, 0.5f}).blocked);

    reg.set_dynamic_cube("local-cube", 0.0f, 0.5f, 0.0f, 1.0f, true);
    CHECK(CollisionResolver::resolve_planar(reg, {0.6f, 0.0f, 0.5f}).blocked);
}

TEST_CASE("CollisionResolver - height-aware blocking skips what the player stands on", "[collision]") {
    ColliderRegistry reg;
    reg.add_cylinder("stump", 0.0f, 0.0f, 1.0f, 1.0f);
    const Footprint p{1.0f, 0.0f, 0.5f};

    CHECK(CollisionResolver::resolve(reg, p, 0.0f).blocked);
    CHECK(CollisionResolver::resolve(reg, p, 0.5f).blocked);
    CHECK_FALSE(CollisionResolver::resolve(reg, p, 0.95f).blocked);
    CHECK_FALSE(CollisionResolver::resolve(reg, p, 3.0f).blocked);

    // The planar query ignores heights altogether.
    CHECK(CollisionResolver::resolve_planar(reg, p).blocked);
}

TEST_CASE("CollisionResolver - ground_height picks the highest reachable surface", "[collision]") {
    ColliderRegistry reg;
    reg.add_cylinder("stump", 0.0f, 0.0f, 1.0f, 1.0f);
    reg.set_dynamic_cube("stacked", 0.0f, 1.5f, 0.0f, 1.0f, true);
    reg.add_box("ramp", 10.0f, 0.0f, 2.0f, 0.5f, 0.6f, 0.5f * kPi);

    SECTION("Outside every footprint the base height is returned") {
        CHECK(CollisionResolver::ground_height(reg, 5.0f, 5.0f, 10.0f) == 0.0f);
        CHECK(CollisionResolver::ground_height(reg, 5.0f, 5.0f, 10.0f, -1.0f) == -1.0f);
    }

    SECTION("Stacked surfaces: the highest one at or below the feet wins") {
        CHECK_THAT(CollisionResolver::ground_height(reg, 0.2f, 0.2f, 2.0f), WithinRel(2.0f));
        CHECK_THAT(CollisionResolver::ground_height(reg, 0.2f, 0.2f, 1.0f), WithinRel(1.0f));
        CHECK_THAT(CollisionResolver::ground_height(reg, 0.2f, 0.2f, 0.95f), WithinRel(1.0f));
    }

    SECTION("Surfaces well above the feet cannot be snapped onto") {
        CHECK(CollisionResolver::ground_height(reg, 0.2f, 0.2f, 0.5f) == 0.0f);
    }

    SECTION("Rotated box footprint") {
        // Long axis along world z after the quarter turn.
        CHECK_THAT(CollisionResolver::ground_height(reg, 10.0f, 1.8f, 1.0f), WithinRel(0.6f));
        CHECK(CollisionResolver::ground_height(reg, 11.8f, 0.0f, 1.0f) == 0.0f);
    }
}

// ---------------------------------------------------------------------------
// MotionIntegrator::apply_jump_energy
// ---------------------------------------------------------------------------

TEST_CASE("apply_jump_energy - full-energy jump", "[jump]") {
    MotionTuning tuning;
    float energy = 1.0f;

    const JumpOutcome out = MotionIntegrator::apply_jump_energy(true, 0.0f, true, tuning, energy);

    CHECK(out.jumped);
    CHECK_THAT(out.energy_used, WithinAbs(0.6f, 1e-5f));
    CHECK_THAT(out.impulse, WithinAbs(7.746f, 1e-3f));
    CHECK_THAT(energy, WithinAbs(0.4f, 1e-5f));
}

TEST_CASE("apply_jump_energy - consecutive jumps get weaker", "[jump]") {
    MotionTuning tuning;
    float energy = 1.0f;

    const JumpOutcome first  = MotionIntegrator::apply_jump_energy(false, 0.0f, true, tuning, energy);
    const JumpOutcome second = MotionIntegrator::apply_jump_energy(false, 0.0f, true, tuning, energy);

    REQUIRE(second.jumped);
    CHECK(second.impulse < first.impulse);
    CHECK_THAT(second.impulse, WithinAbs(10.0f * std::sqrt(0.24f), 1e-3f));
    CHECK_THAT(energy, WithinAbs(0.16f, 1e-5f));
}

TEST_CASE("apply_jump_energy - exhausted budget refuses the jump", "[jump]") {
    MotionTuning tuning;
    float energy = 0.05f;

    const JumpOutcome out = MotionIntegrator::apply_jump_energy(false, 0.0f, true, tuning, energy);

    CHECK_FALSE(out.jumped);
    CHECK(out.impulse == 0.0f);
    CHECK_THAT(energy, WithinAbs(0.05f, 1e-6f));
}

TEST_CASE("apply_jump_energy - recharge rates and clamp", "[jump]") {
    MotionTuning tuning;

    float grounded = 0.2f;
    MotionIntegrator::apply_jump_energy(true, 0.1f, false, tuning, grounded);
    CHECK_THAT(grounded, WithinAbs(0.28f, 1e-5f));

    float airborne = 0.2f;
    MotionIntegrator::apply_jump_energy(false, 0.1f, false, tuning, airborne);
    CHECK_THAT(airborne, WithinAbs(0.225f, 1e-5f));

    float full = 0.95f;
    MotionIntegrator::apply_jump_energy(true, 0.1f, false, tuning, full);
    CHECK(full == 1.0f);
}

// ---------------------------------------------------------------------------
// MotionIntegrator::step
// ---------------------------------------------------------------------------

static FrameInput playing_input(float x = 0.0f, float z = 0.0f, bool jump = false) {
    FrameInput in;
    in.direction      = {x, z};
    in.jump_requested = jump;
    in.playing        = true;
    return in;
}

TEST_CASE("MotionIntegrator - not playing is a no-op", "[motion]") {
    MotionTuning tuning;
    ColliderRegistry reg;
    MotionIntegrator motion;
    motion.reset(tuning);

    FrameInput in = playing_input(1.0f, 0.0f, true);
    in.playing = false;
    const StepReport r = motion.step(in, tuning, reg, 0.016f);

    CHECK_FALSE(r.stepped);
    CHECK(motion.state().position.x == 0.0f);
    CHECK(motion.state().position.y == 0.5f);
    CHECK(motion.state().jump_energy == 1.0f);
}

TEST_CASE("MotionIntegrator - horizontal speed and input normalisation", "[motion]") {
    MotionTuning tuning;
    ColliderRegistry reg;
    MotionIntegrator motion;
    motion.reset(tuning);

    SECTION("Oversized input is normalised") {
        motion.step(playing_input(3.0f, 4.0f), tuning, reg, 0.05f);
        CHECK_THAT(motion.state().velocity.x, WithinAbs(4.8f, 1e-4f));
        CHECK_THAT(motion.state().velocity.z, WithinAbs(6.4f, 1e-4f));
    }

    SECTION("Analog input keeps its magnitude") {
        motion.step(playing_input(0.5f, 0.0f), tuning, reg, 0.05f);
        CHECK_THAT(motion.state().velocity.x, WithinAbs(4.0f, 1e-4f));
        CHECK_THAT(motion.state().position.x, WithinAbs(0.2f, 1e-4f));
    }

    SECTION("A stalled frame is clamped to max_dt") {
        motion.step(playing_input(1.0f, 0.0f), tuning, reg, 5.0f);
        CHECK_THAT(motion.state().position.x, WithinAbs(0.8f, 1e-4f));
    }

    SECTION("NaN dt is replaced by min_dt") {
        motion.step(playing_input(1.0f, 0.0f), tuning, reg, std::numeric_limits<float>::quiet_NaN());
        CHECK(std::isfinite(motion.state().position.x));
        CHECK_THAT(motion.state().position.x, WithinAbs(8.0f * tuning.min_dt, 1e-6f));
    }
}

TEST_CASE("MotionIntegrator - resting on the ground stays put", "[motion]") {
    MotionTuning tuning;
    ColliderRegistry reg;
    MotionIntegrator motion;
    motion.reset(tuning);

    for (int i = 0; i < 30; ++i) {
        const StepReport r = motion.step(playing_input(), tuning, reg, 1.0f / 60.0f);
        CHECK_FALSE(r.landed);
    }
    CHECK(motion.state().grounded);
    CHECK_THAT(motion.state().position.y, WithinAbs(0.5f, 1e-5f));
    CHECK(motion.state().velocity.y == 0.0f);
}

TEST_CASE("MotionIntegrator - jump, arc and single landing", "[motion]") {
    MotionTuning tuning;
    ColliderRegistry reg;
    MotionIntegrator motion;
    motion.reset(tuning);

    const StepReport first = motion.step(playing_input(0, 0, true), tuning, reg, 1.0f / 60.0f);
    REQUIRE(first.jump.jumped);
    CHECK_THAT(first.jump.impulse, WithinAbs(7.746f, 1e-3f));
    CHECK(motion.state().velocity.y > 0.0f);
    CHECK(motion.state().position.y > 0.5f);

    int landings = 0;
    float peak = 0.0f;
    for (int i = 0; i < 120; ++i) {
        const StepReport r = motion.step(playing_input(), tuning, reg, 1.0f / 60.0f);
        if (r.landed) {
            ++landings;
            CHECK(r.impact_speed > 0.0f);
        }
        peak = std::max(peak, motion.state().position.y);
    }

    CHECK(landings == 1);
    // v^2 / 2g above the resting height, give or take integration error.
    CHECK_THAT(peak, WithinAbs(0.5f + 0.6f * 100.0f / 40.0f, 0.15f));
    CHECK(motion.state().grounded);
    CHECK_THAT(motion.state().position.y, WithinAbs(0.5f, 1e-5f));
}

TEST_CASE("MotionIntegrator - jump impulse adds to upward velocity only", "[motion]") {
    MotionTuning tuning;
    ColliderRegistry reg;
    MotionIntegrator motion;
    motion.reset(tuning);
    const float dt       = 1.0f / 60.0f;
    const float gravity  = tuning.gravity * dt;
    const float expected = tuning.base_jump_impulse * std::sqrt(tuning.jump_energy_per_jump);

    motion.state().position    = {0.0f, 5.0f, 0.0f};
    motion.state().grounded    = false;
    motion.state().jump_energy = 1.0f;

    SECTION("Falling: the downward velocity is discarded") {
        motion.state().velocity = {0.0f, -6.0f, 0.0f};
        const StepReport r = motion.step(playing_input(0, 0, true), tuning, reg, dt);
        REQUIRE(r.jump.jumped);
        CHECK_THAT(r.jump.impulse, WithinAbs(expected, 1e-4f));
        CHECK_THAT(motion.state().velocity.y, WithinAbs(expected - gravity, 1e-4f));
    }

    SECTION("Rising: the impulse stacks on top") {
        motion.state().velocity = {0.0f, 3.0f, 0.0f};
        const StepReport r = motion.step(playing_input(0, 0, true), tuning, reg, dt);
        REQUIRE(r.jump.jumped);
        CHECK_THAT(motion.state().velocity.y, WithinAbs(3.0f + expected - gravity, 1e-4f));
    }
}

TEST_CASE("MotionIntegrator - jump energy stays within [0, 1] under spam", "[motion]") {
    MotionTuning tuning;
    ColliderRegistry reg;
    MotionIntegrator motion;
    motion.reset(tuning);

    int jumps = 0;
    for (int i = 0; i < 600; ++i) {
        const StepReport r = motion.step(playing_input(0, 0, true), tuning, reg, 1.0f / 60.0f);
        if (r.jump.jumped) ++jumps;
        CHECK(motion.state().jump_energy >= 0.0f);
        CHECK(motion.state().jump_energy <= 1.0f);
    }
    // Air jumps are allowed, so spamming keeps jumping while energy lasts.
    CHECK(jumps > 1);
}

TEST_CASE("MotionIntegrator - falling off the world respawns", "[motion]") {
    MotionTuning tuning;
    ColliderRegistry reg;
    MotionIntegrator motion;
    motion.reset(tuning);
    motion.state().position = {60.0f, 0.5f, 0.0f};

    bool respawned = false;
    ecs::Vec3 from{};
    float last_y = motion.state().position.y;
    for (int i = 0; i < 100 && !respawned; ++i) {
        last_y = motion.state().position.y;
        const StepReport r = motion.step(playing_input(), tuning, reg, 0.1f);
        respawned = r.respawned;
        from = r.respawned_from;
    }

    REQUIRE(respawned);
    // The reported origin is where the limit was crossed, not the frame start.
    CHECK(from.x == 60.0f);
    CHECK(from.y < tuning.fall_limit);
    CHECK(last_y >= tuning.fall_limit);
    CHECK(motion.state().position.x == tuning.spawn.x);
    CHECK(motion.state().position.y == tuning.spawn.y);
    CHECK(motion.state().position.z == tuning.spawn.z);
    CHECK(motion.state().velocity.y == 0.0f);
}

TEST_CASE("MotionIntegrator - standing on a prop", "[motion]") {
    MotionTuning tuning;
    ColliderRegistry reg;
    reg.add_cylinder("stump", 0.0f, 0.0f, 2.0f, 1.0f);
    MotionIntegrator motion;
    motion.reset(tuning);
    motion.state().position = {0.0f, 1.5f, 0.0f};

    const StepReport r = motion.step(playing_input(), tuning, reg, 1.0f / 60.0f);

    CHECK(motion.state().grounded);
    CHECK_FALSE(r.push.blocked);
    CHECK_THAT(motion.state().position.y, WithinAbs(1.5f, 1e-5f));
}

TEST_CASE("MotionIntegrator - a prop outside the world bounds still supports", "[motion]") {
    MotionTuning tuning;
    ColliderRegistry reg;
    reg.add_box("pier", 55.0f, 0.0f, 3.0f, 3.0f, 1.0f, 0.0f);
    MotionIntegrator motion;
    motion.reset(tuning);
    motion.state().position = {55.0f, 1.5f, 0.0f};

    for (int i = 0; i < 30; ++i) motion.step(playing_input(), tuning, reg, 1.0f / 60.0f);

    CHECK(motion.state().grounded);
    CHECK_THAT(motion.state().position.y, WithinAbs(1.5f, 1e-5f));
}

TEST_CASE("MotionIntegrator - walking into a trunk is pushed back", "[motion]") {
    MotionTuning tuning;
    ColliderRegistry reg;
    reg.add_cylinder("trunk", 2.0f, 0.0f, 1.0f, 2.0f);
    MotionIntegrator motion;
    motion.reset(tuning);
    motion.state().position = {0.6f, 0.5f, 0.0f};

    const StepReport r = motion.step(playing_input(1.0f, 0.0f), tuning, reg, 0.05f);

    CHECK(r.push.blocked);
    CHECK_THAT(r.push.push_x, WithinAbs(-0.5f, 1e-4f));
    CHECK_THAT(motion.state().position.x, WithinAbs(0.5f, 1e-4f));
}

// ---------------------------------------------------------------------------
// RemoteEntityReconciler
// ---------------------------------------------------------------------------

static RemoteSnapshot snapshot_at(float x, float y, float z, float hue = 0.0f) {
    RemoteSnapshot s;
    s.x = x; s.y = y; s.z = z;
    s.color_hue = hue;
    return s;
}

TEST_CASE("Reconciler - critically damped ghost converges without overshoot", "[reconciler]") {
    RemoteEntityReconciler rec;
    SpringTuning tuning;
    Events<GhostSpawned> spawned;
    Events<GhostDespawned> despawned;

    SnapshotMap snaps;
    snaps[7] = snapshot_at(0.0f, 0.5f, 0.0f);
    rec.update(snaps, 1.0f / 60.0f, tuning, spawned, despawned);

    snaps[7] = snapshot_at(10.0f, 0.5f, 0.0f);
    float max_x = 0.0f;
    for (int i = 0; i < 300; ++i) {
        rec.update(snaps, 1.0f / 60.0f, tuning, spawned, despawned);
        max_x = std::max(max_x, rec.find(7)->position.x);
    }

    CHECK(max_x <= 10.0f + 1e-3f);
    CHECK_THAT(rec.find(7)->position.x, WithinAbs(10.0f, 1e-2f));
    CHECK_THAT(rec.find(7)->position.y, WithinAbs(0.5f, 1e-4f));
    CHECK_THAT(rec.find(7)->velocity.x, WithinAbs(0.0f, 1e-2f));
}

TEST_CASE("Reconciler - ghost is seeded at its first snapshot", "[reconciler]") {
    RemoteEntityReconciler rec;
    SpringTuning tuning;
    Events<GhostSpawned> spawned;
    Events<GhostDespawned> despawned;

    SnapshotMap snaps;
    snaps[3] = snapshot_at(4.0f, 0.5f, -2.0f, 120.0f);
    rec.update(snaps, 1.0f / 60.0f, tuning, spawned, despawned);

    REQUIRE(spawned.read().size() == 1);
    CHECK(spawned.read()[0].id == 3);
    CHECK_THAT(spawned.read()[0].color_hue, WithinRel(120.0f));
    REQUIRE(rec.find(3) != nullptr);
    CHECK_THAT(rec.find(3)->position.x, WithinAbs(4.0f, 1e-5f));
    CHECK_THAT(rec.find(3)->position.z, WithinAbs(-2.0f, 1e-5f));
}

TEST_CASE("Reconciler - join/leave cycles create and remove exactly once", "[reconciler]") {
    RemoteEntityReconciler rec;
    SpringTuning tuning;
    Events<GhostSpawned> spawned;
    Events<GhostDespawned> despawned;

    SnapshotMap present;
    present[1] = snapshot_at(0, 0.5f, 0);
    present[2] = snapshot_at(3, 0.5f, 0);
    SnapshotMap without_two;
    without_two[1] = present[1];

    int spawns = 0, despawns = 0;
    for (int cycle = 0; cycle < 5; ++cycle) {
        for (int f = 0; f < 3; ++f) {
            spawned.clear();
            despawned.clear();
            rec.update(present, 1.0f / 60.0f, tuning, spawned, despawned);
            spawns   += static_cast<int>(spawned.read().size());
            despawns += static_cast<int>(despawned.read().size());
        }
        CHECK(rec.size() == 2);

        for (int f = 0; f < 3; ++f) {
            spawned.clear();
            despawned.clear();
            rec.update(without_two, 1.0f / 60.0f, tuning, spawned, despawned);
            spawns   += static_cast<int>(spawned.read().size());
            despawns += static_cast<int>(despawned.read().size());
            for (const auto& e : despawned.read()) CHECK(e.id == 2);
        }
        CHECK(rec.size() == 1);
        CHECK(rec.find(2) == nullptr);
    }

    // Player 1 spawns once; player 2 spawns and leaves every cycle.
    CHECK(spawns == 1 + 5);
    CHECK(despawns == 5);
}

TEST_CASE("Reconciler - empty map removes every ghost", "[reconciler]") {
    RemoteEntityReconciler rec;
    SpringTuning tuning;
    Events<GhostSpawned> spawned;
    Events<GhostDespawned> despawned;

    SnapshotMap snaps;
    snaps[1] = snapshot_at(0, 0.5f, 0);
    snaps[2] = snapshot_at(1, 0.5f, 0);
    rec.update(snaps, 0.016f, tuning, spawned, despawned);
    rec.update({}, 0.016f, tuning, spawned, despawned);

    CHECK(rec.size() == 0);
    CHECK(despawned.read().size() == 2);
}

// ---------------------------------------------------------------------------
// Events<T>
// ---------------------------------------------------------------------------

struct TestEvent { int value; };

TEST_CASE("Events - send and read", "[events]") {
    Events<TestEvent> queue;

    CHECK(queue.empty());
    CHECK(queue.read().empty());

    queue.send({42});
    queue.send({7});

    CHECK_FALSE(queue.empty());
    REQUIRE(queue.read().size() == 2);
    CHECK(queue.read()[0].value == 42);
    CHECK(queue.read()[1].value == 7);
}

TEST_CASE("Events - clear empties the queue", "[events]") {
    Events<TestEvent> queue;
    queue.send({1});
    queue.send({2});
    queue.clear();

    CHECK(queue.empty());
    CHECK(queue.read().empty());
}
