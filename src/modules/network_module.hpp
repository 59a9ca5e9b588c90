#pragma once
#include "../pipeline.hpp"
#include "../snapshot_feed.hpp"
#include "../snapshot_protocol.hpp"
#include "../systems/network.hpp"
#include <ecs/ecs.hpp>
#include <memory>

// ---------------------------------------------------------------------------
// NetworkModule
//
// Creates the SnapshotStore and OutboundScheduler resources and, unless the
// application already set one, a LoopbackFeed as the std::shared_ptr<SnapshotFeed>
// resource. Intake runs in Pre-Update, Publish in Post-Update.
// ---------------------------------------------------------------------------

struct NetworkModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        if (!world.try_resource<std::shared_ptr<meadow::SnapshotFeed>>()) {
            std::shared_ptr<meadow::SnapshotFeed> feed = std::make_shared<meadow::LoopbackFeed>();
            world.set_resource(feed);
        }
        world.set_resource(meadow::SnapshotStore{});
        world.set_resource(meadow::OutboundScheduler{});

        pipeline.add_pre_update([](ecs::World& w, float dt)  { NetworkSystem::Intake(w, dt); });
        pipeline.add_post_update([](ecs::World& w, float dt) { NetworkSystem::Publish(w, dt); });
    }
};
