#pragma once
#include <ecs/ecs.hpp>

// Bridges the SnapshotFeed resource and the simulation.
//
// Intake (Pre-Update): decodes every message that arrived since the last
// frame into the SnapshotStore; the simulation reads it in the Logic phase.
// Publish (Post-Update): sends the paced state / ping messages.
class NetworkSystem {
public:
    static void Intake(ecs::World& world, float dt);
    static void Publish(ecs::World& world, float dt);
};
