#include "components.hpp"
#include "pipeline.hpp"
#include "scene.hpp"
#include "simulation_context.hpp"
#include "modules/builder_module.hpp"
#include "modules/camera_module.hpp"
#include "modules/input_module.hpp"
#include "modules/network_module.hpp"
#include "modules/render_module.hpp"
#include "modules/simulation_module.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <memory>
#include <string>

static const char* DEFAULT_SCENE_PATH = "resources/scenes/meadow.json";

int main(int argc, char** argv) {
  const std::string scene_path = argc > 1 ? argv[1] : DEFAULT_SCENE_PATH;

  InitWindow(1280, 720, "Meadow");
  SetTargetFPS(60);

  ecs::World world;
  ecs::Pipeline pipeline;

  // --- Module Setup ---
  // Order matters inside each phase:
  //   Pre-Update:  network intake -> player input
  //   Logic:       simulation -> ghost visuals -> cube builder -> camera
  //   Post-Update: outbound publish -> transform propagation
  NetworkModule::install(world, pipeline);
  InputModule::install(world, pipeline);
  SimulationModule::install(world, pipeline);
  BuilderModule::install(world, pipeline);
  CameraModule::install(world, pipeline);
  RenderModule::install(world, pipeline);

  auto ctx = world.resource<std::shared_ptr<meadow::SimulationContext>>();
  if (!SceneLoader::load(world, *ctx, scene_path)) {
    TraceLog(LOG_ERROR, "SCENE: Failed to load '%s'", scene_path.c_str());
    CloseWindow();
    return 1;
  }

  // --- Main Loop ---
  while (!WindowShouldClose()) {
    if (IsKeyPressed(KEY_R)) {
        SceneLoader::unload(world, *ctx);
        if (!SceneLoader::load(world, *ctx, scene_path))
            TraceLog(LOG_WARNING, "SCENE: Reload of '%s' failed, world is empty", scene_path.c_str());
    }

    pipeline.update(world, GetFrameTime());
    pipeline.render(world);
  }

  CloseWindow();
  return 0;
}
