#pragma once
#include "events.hpp"
#include <ecs/ecs.hpp>
#include <map>
#include <optional>

namespace meadow {

// Cube a remote player has placed. (x, y, z) is the cube centre.
struct CubeSnapshot {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

// Authoritative state for one remote player as received from the network.
struct RemoteSnapshot {
    float x  = 0.0f, y  = 0.0f, z  = 0.0f;
    float vx = 0.0f, vy = 0.0f, vz = 0.0f;
    float color_hue = 0.0f;
    std::optional<CubeSnapshot> cube;
};

using SnapshotMap = std::map<int, RemoteSnapshot>;

// Smoothed kinematic state of one remote player.
struct Ghost {
    ecs::Vec3 position        = {0, 0, 0};
    ecs::Vec3 velocity        = {0, 0, 0};
    ecs::Vec3 target_position = {0, 0, 0};
    ecs::Vec3 target_velocity = {0, 0, 0};
    float     color_hue       = 0.0f;
};

struct SpringTuning {
    float stiffness     = 15.0f;  // k
    float damping_ratio = 1.0f;   // zeta; 1 = critical
    float max_dt        = 0.1f;
    float min_dt        = 0.0001f;

    float damping() const;        // c = 2 * zeta * sqrt(k)
};

// ---------------------------------------------------------------------------
// RemoteEntityReconciler: one spring-damped ghost per remote id.
//
// Each update: ghosts whose id is missing from the snapshot map are removed
// (GhostDespawned), new ids get a ghost seeded at the snapshot (GhostSpawned),
// and every ghost is advanced toward its latest target.
// ---------------------------------------------------------------------------

class RemoteEntityReconciler {
public:
    void update(const SnapshotMap& snapshots, float dt, const SpringTuning& tuning,
                Events<GhostSpawned>& spawned, Events<GhostDespawned>& despawned);

    // Semi-implicit Euler step of the spring-damper toward the ghost's target.
    static void spring_step(Ghost& ghost, const SpringTuning& tuning, float dt);

    const Ghost* find(int id) const;
    const std::map<int, Ghost>& ghosts() const { return ghosts_; }
    std::size_t size() const { return ghosts_.size(); }

    // Drops every ghost without emitting events (session teardown).
    void clear() { ghosts_.clear(); }

private:
    std::map<int, Ghost> ghosts_;
};

} // namespace meadow
