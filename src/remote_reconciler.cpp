#include "remote_reconciler.hpp"
#include "math_util.hpp"
#include <raylib.h>
#include <algorithm>
#include <cmath>

namespace meadow {

float SpringTuning::damping() const {
    return 2.0f * damping_ratio * std::sqrt(std::max(stiffness, 0.0f));
}

void RemoteEntityReconciler::spring_step(Ghost& g, const SpringTuning& tuning, float dt) {
    const float k = tuning.stiffness;
    const float c = tuning.damping();

    const float ax = k * (g.target_position.x - g.position.x) + c * (g.target_velocity.x - g.velocity.x);
    const float ay = k * (g.target_position.y - g.position.y) + c * (g.target_velocity.y - g.velocity.y);
    const float az = k * (g.target_position.z - g.position.z) + c * (g.target_velocity.z - g.velocity.z);

    g.velocity.x += ax * dt;
    g.velocity.y += ay * dt;
    g.velocity.z += az * dt;

    g.position.x += g.velocity.x * dt;
    g.position.y += g.velocity.y * dt;
    g.position.z += g.velocity.z * dt;
}

void RemoteEntityReconciler::update(const SnapshotMap& snapshots, float raw_dt,
                                    const SpringTuning& tuning,
                                    Events<GhostSpawned>& spawned,
                                    Events<GhostDespawned>& despawned) {
    const float dt = math::clamp_dt(raw_dt, tuning.min_dt, tuning.max_dt);

    // 1. Ghosts whose id left the snapshot map
    for (auto it = ghosts_.begin(); it != ghosts_.end();) {
        if (snapshots.count(it->first) == 0) {
            TraceLog(LOG_DEBUG, "GHOST: Despawn %d", it->first);
            despawned.send({it->first});
            it = ghosts_.erase(it);
        } else {
            ++it;
        }
    }

    // 2. Create / retarget / advance
    for (const auto& [id, snap] : snapshots) {
        const ecs::Vec3 pos = {snap.x, snap.y, snap.z};
        const ecs::Vec3 vel = {snap.vx, snap.vy, snap.vz};

        auto it = ghosts_.find(id);
        if (it == ghosts_.end()) {
            Ghost ghost;
            ghost.position        = pos;
            ghost.velocity        = vel;
            ghost.target_position = pos;
            ghost.target_velocity = vel;
            ghost.color_hue       = snap.color_hue;
            it = ghosts_.emplace(id, ghost).first;

            TraceLog(LOG_DEBUG, "GHOST: Spawn %d at (%.2f, %.2f, %.2f)", id, pos.x, pos.y, pos.z);
            spawned.send({id, pos, snap.color_hue});
        }

        Ghost& ghost = it->second;
        ghost.target_position = pos;
        ghost.target_velocity = vel;
        ghost.color_hue       = snap.color_hue;

        spring_step(ghost, tuning, dt);
    }
}

const Ghost* RemoteEntityReconciler::find(int id) const {
    auto it = ghosts_.find(id);
    return it == ghosts_.end() ? nullptr : &it->second;
}

} // namespace meadow
