#pragma once
#include "simulation_context.hpp"
#include <ecs/ecs.hpp>
#include <string>

// ---------------------------------------------------------------------------
// SceneLoader: reads JSON scene files into an ECS World and the collider
// registry of a SimulationContext.
//
// The whole document is parsed and validated before anything is spawned, so
// a rejected scene leaves both the world and the context untouched. An
// optional "tuning" block overrides MotionTuning / SpringTuning defaults.
// No Raylib dependency beyond logging, so it builds in the headless test target.
// ---------------------------------------------------------------------------

class SceneLoader {
public:
    // Load a scene from a JSON file.
    // Returns false if the file cannot be opened or the scene is rejected.
    static bool load(ecs::World& world, meadow::SimulationContext& ctx, const std::string& path);

    // Parse and spawn from a JSON string, identical to load() but avoids
    // file I/O. Intended for unit testing.
    static bool load_from_string(ecs::World& world, meadow::SimulationContext& ctx,
                                 const std::string& json);

    // Destroy all WorldTag entities, clear the collider registry and reset
    // the simulation session.
    static void unload(ecs::World& world, meadow::SimulationContext& ctx);
};
