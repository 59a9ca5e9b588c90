#pragma once
#include "collider_registry.hpp"
#include "events.hpp"
#include "motion_integrator.hpp"
#include "remote_reconciler.hpp"
#include <ecs/ecs.hpp>
#include <set>

namespace meadow {

// Edge length of a cube mirrored from a remote player's snapshot.
constexpr float kRemoteCubeSize = 1.0f;

// Local player state published at the end of every step.
struct PlayerPublication {
    ecs::Vec3 position    = {0, 0, 0};
    ecs::Vec3 velocity    = {0, 0, 0};
    bool      grounded    = false;
    float     jump_energy = 1.0f;
};

// ---------------------------------------------------------------------------
// SimulationContext: owns the collider registry, the local-player integrator,
// the remote reconciler, their tuning, and the frame-scoped event queues.
//
// Held by the application as a std::shared_ptr<SimulationContext> world
// resource. step() runs once per rendered frame on the main thread.
// ---------------------------------------------------------------------------

struct SimulationContext {
    ColliderRegistry       colliders;
    MotionIntegrator       motion;
    RemoteEntityReconciler reconciler;

    MotionTuning tuning;
    SpringTuning spring;

    Events<JumpEvent>      jumps;
    Events<LandEvent>      landings;
    Events<RespawnEvent>   respawns;
    Events<GhostSpawned>   ghosts_spawned;
    Events<GhostDespawned> ghosts_despawned;

    PlayerPublication step(const FrameInput& input, const SnapshotMap& snapshots, float dt);

    // Current local state without advancing the simulation.
    PlayerPublication publication() const;

    // Session teardown: ghosts, remote cubes and event queues are discarded,
    // the player returns to spawn. Scene colliders are kept.
    void reset_session();

    static ColliderId remote_cube_id(int player_id);

private:
    void clear_events();
    void sync_remote_cubes(const SnapshotMap& snapshots);

    std::set<int> remote_cube_owners_;
};

} // namespace meadow
