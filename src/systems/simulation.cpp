#include "simulation.hpp"
#include "../components.hpp"
#include <ecs/modules/transform.hpp>
#include <memory>

using namespace ecs;
using meadow::SimulationContext;

meadow::FrameInput SimulationSystem::make_frame_input(const PlayerInput* input,
                                                      const GameFlags* flags) {
    meadow::FrameInput frame;
    frame.playing = flags && flags->playing && !flags->paused;
    if (input) {
        frame.direction      = input->move_input;
        frame.jump_requested = input->jump;
    }
    return frame;
}

void SimulationSystem::Update(World& world, float dt) {
    auto* ctx_ptr = world.try_resource<std::shared_ptr<SimulationContext>>();
    if (!ctx_ptr || !*ctx_ptr) return;
    auto& ctx = **ctx_ptr;

    const PlayerInput* input = nullptr;
    world.single<PlayerTag, PlayerInput>([&](Entity, PlayerTag&, PlayerInput& in) { input = &in; });

    static const meadow::SnapshotMap kNoSnapshots;
    const auto* store = world.try_resource<meadow::SnapshotStore>();
    const auto& snapshots = store ? store->snapshots() : kNoSnapshots;

    const auto frame = make_frame_input(input, world.try_resource<GameFlags>());
    const auto pub   = ctx.step(frame, snapshots, dt);

    world.single<PlayerTag, LocalTransform>([&](Entity, PlayerTag&, LocalTransform& lt) {
        lt.position = pub.position;
    });

    if (auto* published = world.try_resource<meadow::PlayerPublication>())
        *published = pub;
    else
        world.set_resource(pub);
}
