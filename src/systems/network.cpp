#include "network.hpp"
#include "../components.hpp"
#include "../snapshot_feed.hpp"
#include "../snapshot_protocol.hpp"
#include <memory>
#include <optional>

using namespace ecs;
using namespace meadow;

void NetworkSystem::Intake(World& world, float dt) {
    auto* feed_ptr = world.try_resource<std::shared_ptr<SnapshotFeed>>();
    auto* store    = world.try_resource<SnapshotStore>();
    if (!feed_ptr || !*feed_ptr || !store) return;
    auto& feed = **feed_ptr;

    if (!feed.connected()) {
        if (!store->snapshots().empty() || store->local_id()) store->disconnect();
        return;
    }

    for (const auto& text : feed.poll(dt)) {
        ServerMessage msg;
        if (protocol::decode(text, msg)) store->apply(msg);
    }
}

void NetworkSystem::Publish(World& world, float dt) {
    auto* feed_ptr  = world.try_resource<std::shared_ptr<SnapshotFeed>>();
    auto* scheduler = world.try_resource<OutboundScheduler>();
    auto* pub       = world.try_resource<PlayerPublication>();
    if (!feed_ptr || !*feed_ptr || !scheduler || !pub) return;
    auto& feed = **feed_ptr;
    if (!feed.connected()) return;

    std::optional<CubeSnapshot> cube;
    world.single<PlayerTag, PlayerState>([&](Entity, PlayerTag&, PlayerState& state) {
        if (state.has_cube)
            cube = CubeSnapshot{state.cube_center.x, state.cube_center.y, state.cube_center.z};
    });

    for (const auto& message : scheduler->update(dt, *pub, cube)) feed.send(message);
}
