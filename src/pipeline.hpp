#pragma once
#include <ecs/ecs.hpp>
#include <vector>
#include <functional>

namespace ecs {

/**
 * @brief Manages groups of systems categorized by execution phase.
 *
 * Every phase runs once per rendered frame with the same wall-clock dt:
 * pre-update (input, network intake) -> logic (simulation and its
 * consumers) -> post-update (outbound publish) -> render.
 */
class Pipeline {
public:
    using SystemFunc = std::function<void(World&, float)>;

    void add_pre_update(SystemFunc func)  { pre_update_.push_back(std::move(func)); }
    void add_logic(SystemFunc func)       { logic_.push_back(std::move(func)); }
    void add_post_update(SystemFunc func) { post_update_.push_back(std::move(func)); }
    void add_render(SystemFunc func)      { render_.push_back(std::move(func)); }

    /**
     * @brief Executes the per-frame update flow (everything but rendering).
     */
    void update(World& world, float dt) {
        // 1. Input / network intake
        for (auto& sys : pre_update_) sys(world, dt);

        // 2. Simulation and systems that react to its events
        for (auto& sys : logic_) sys(world, dt);

        // 3. Apply structural changes (planted cubes)
        world.deferred().flush(world);

        // 4. Publish the frame's results
        for (auto& sys : post_update_) sys(world, dt);
    }

    /**
     * @brief Executes rendering systems.
     */
    void render(World& world) {
        for (auto& sys : render_) sys(world, 0.0f);
    }

private:
    std::vector<SystemFunc> pre_update_;
    std::vector<SystemFunc> logic_;
    std::vector<SystemFunc> post_update_;
    std::vector<SystemFunc> render_;
};

} // namespace ecs
