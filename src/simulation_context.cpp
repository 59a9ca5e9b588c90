#include "simulation_context.hpp"
#include <string>

namespace meadow {

ColliderId SimulationContext::remote_cube_id(int player_id) {
    return "remote-cube:" + std::to_string(player_id);
}

void SimulationContext::clear_events() {
    jumps.clear();
    landings.clear();
    respawns.clear();
    ghosts_spawned.clear();
    ghosts_despawned.clear();
}

void SimulationContext::sync_remote_cubes(const SnapshotMap& snapshots) {
    // Drop cubes whose owner left or no longer reports one.
    for (auto it = remote_cube_owners_.begin(); it != remote_cube_owners_.end();) {
        auto snap = snapshots.find(*it);
        if (snap == snapshots.end() || !snap->second.cube) {
            colliders.remove(remote_cube_id(*it));
            it = remote_cube_owners_.erase(it);
        } else {
            ++it;
        }
    }

    for (const auto& [id, snap] : snapshots) {
        if (!snap.cube) continue;
        const CubeSnapshot& c = *snap.cube;
        if (colliders.set_dynamic_cube(remote_cube_id(id), c.x, c.y, c.z, kRemoteCubeSize, true))
            remote_cube_owners_.insert(id);
    }
}

PlayerPublication SimulationContext::publication() const {
    const auto& s = motion.state();
    return {s.position, s.velocity, s.grounded, s.jump_energy};
}

PlayerPublication SimulationContext::step(const FrameInput& input, const SnapshotMap& snapshots,
                                          float dt) {
    clear_events();

    // Remote cubes first so the local player collides with this frame's cubes.
    sync_remote_cubes(snapshots);

    const StepReport report = motion.step(input, tuning, colliders, dt);

    if (report.jump.jumped)
        jumps.send({report.jump.impulse, report.jump.energy_used});
    if (report.landed)
        landings.send({report.impact_speed});
    if (report.respawned)
        respawns.send({report.respawned_from});

    reconciler.update(snapshots, dt, spring, ghosts_spawned, ghosts_despawned);

    return publication();
}

void SimulationContext::reset_session() {
    for (int owner : remote_cube_owners_) colliders.remove(remote_cube_id(owner));
    remote_cube_owners_.clear();
    reconciler.clear();
    motion.reset(tuning);
    clear_events();
}

} // namespace meadow
