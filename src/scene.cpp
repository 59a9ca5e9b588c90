#include "scene.hpp"
#include "components.hpp"
#include "math_util.hpp"
#include <ecs/modules/transform.hpp>
#include <nlohmann/json.hpp>
#include <raylib.h>
#include <cmath>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace meadow;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static ecs::Vec3 parse_vec3(const json& j) {
    return {j.at(0).get<float>(), j.at(1).get<float>(), j.at(2).get<float>()};
}

static Color4 parse_color4(const json& j) {
    return {j.at(0).get<float>(), j.at(1).get<float>(), j.at(2).get<float>(),
            j.size() > 3 ? j.at(3).get<float>() : 1.0f};
}

static ShapeType parse_shape(const std::string& s) {
    if (s == "Box")      return ShapeType::Box;
    if (s == "Cylinder") return ShapeType::Cylinder;
    if (s == "Sphere")   return ShapeType::Sphere;
    throw std::runtime_error("unknown shape '" + s + "'");
}

static float positive(const json& j, const char* key) {
    const float v = j.at(key).get<float>();
    if (!math::is_finite_positive(v))
        throw std::runtime_error(std::string("'") + key + "' must be positive");
    return v;
}

static ecs::Quat yaw_quat(float yaw) {
    return {0.0f, std::sin(0.5f * yaw), 0.0f, std::cos(0.5f * yaw)};
}

static void parse_tuning(const json& t, MotionTuning& m, SpringTuning& s) {
    m.speed                = t.value("speed",                m.speed);
    m.gravity              = t.value("gravity",              m.gravity);
    m.base_jump_impulse    = t.value("base_jump_impulse",    m.base_jump_impulse);
    m.jump_energy_per_jump = t.value("jump_energy_per_jump", m.jump_energy_per_jump);
    m.min_jump_energy      = t.value("min_jump_energy",      m.min_jump_energy);
    m.ground_recharge_rate = t.value("ground_recharge_rate", m.ground_recharge_rate);
    m.air_recharge_rate    = t.value("air_recharge_rate",    m.air_recharge_rate);
    m.ground_level         = t.value("ground_level",         m.ground_level);
    m.ground_half_size     = t.value("ground_half_size",     m.ground_half_size);
    m.fall_limit           = t.value("fall_limit",           m.fall_limit);
    m.player_radius        = t.value("player_radius",        m.player_radius);
    m.max_dt               = t.value("max_dt",               m.max_dt);
    if (t.contains("spawn")) m.spawn = parse_vec3(t["spawn"]);

    if (t.contains("spring")) {
        const auto& sp = t["spring"];
        s.stiffness     = sp.value("stiffness",     s.stiffness);
        s.damping_ratio = sp.value("damping_ratio", s.damping_ratio);
    }

    if (!(m.max_dt > m.min_dt) || m.player_radius <= 0.0f || m.ground_half_size <= 0.0f)
        throw std::runtime_error("tuning out of range");
}

// ---------------------------------------------------------------------------
// Entity descriptions (parsed first, spawned only if the whole scene is valid)
// ---------------------------------------------------------------------------

enum class ColliderKind { None, Cylinder, Box, Cube };

struct EntityDesc {
    ColliderId   id;
    ecs::Vec3    position = {0, 0, 0};
    ecs::Quat    rotation = {0, 0, 0, 1};
    ecs::Vec3    scale    = {1, 1, 1};

    ColliderKind collider = ColliderKind::None;
    CylinderCollider cylinder;
    BoxCollider      box;
    DynamicCube      cube;

    std::optional<MeshRenderer> mesh;
    bool world_tag  = false;
    bool player_tag = false;
};

static EntityDesc parse_entity(const json& e, std::size_t index) {
    EntityDesc desc;

    if (e.contains("transform")) {
        const auto& t = e["transform"];
        if (t.contains("position")) desc.position = parse_vec3(t["position"]);
        if (t.contains("scale"))    desc.scale    = parse_vec3(t["scale"]);
        if (t.contains("yaw"))      desc.rotation = yaw_quat(t["yaw"].get<float>());
    }
    const float x = desc.position.x;
    const float z = desc.position.z;

    // Colliders drive the visual transform: unit meshes centred on the origin.
    if (e.contains("cylinder_collider")) {
        const auto& c = e["cylinder_collider"];
        desc.collider = ColliderKind::Cylinder;
        desc.cylinder = {x, z, positive(c, "radius"), positive(c, "height")};
        desc.position = {x, 0.5f * desc.cylinder.height, z};
        desc.scale    = {2.0f * desc.cylinder.radius, desc.cylinder.height, 2.0f * desc.cylinder.radius};
    } else if (e.contains("box_collider")) {
        const auto& b = e["box_collider"];
        const float yaw = b.value("yaw", 0.0f);
        desc.collider = ColliderKind::Box;
        desc.box      = {x, z, positive(b, "half_width"), positive(b, "half_depth"),
                         positive(b, "height"), math::normalize_angle(yaw)};
        desc.position = {x, 0.5f * desc.box.height, z};
        desc.rotation = yaw_quat(desc.box.yaw);
        desc.scale    = {2.0f * desc.box.half_width, desc.box.height, 2.0f * desc.box.half_depth};
    } else if (e.contains("cube_collider")) {
        const auto& c = e["cube_collider"];
        desc.collider = ColliderKind::Cube;
        desc.cube     = {x, desc.position.y, z, positive(c, "size"), c.value("static", true)};
        desc.scale    = {desc.cube.size, desc.cube.size, desc.cube.size};
    }

    desc.id = e.value("id", std::string{});
    if (desc.id.empty() && desc.collider != ColliderKind::None)
        desc.id = "collider-" + std::to_string(index);

    if (e.contains("mesh")) {
        const auto& m = e["mesh"];
        MeshRenderer mesh;
        mesh.shape_type   = parse_shape(m.value("shape", std::string("Box")));
        mesh.color        = m.contains("color")        ? parse_color4(m["color"])      : Colors::White;
        mesh.scale_offset = m.contains("scale_offset") ? parse_vec3(m["scale_offset"]) : ecs::Vec3{1, 1, 1};
        desc.mesh = mesh;
    }

    if (e.contains("tags")) {
        for (const auto& tag : e["tags"]) {
            const std::string t = tag.get<std::string>();
            if (t == "World")  desc.world_tag  = true;
            if (t == "Player") desc.player_tag = true;
        }
    }
    return desc;
}

static void spawn_entity(ecs::World& world, SimulationContext& ctx, const EntityDesc& desc) {
    // Values were validated while parsing; the registry cannot reject them here.
    switch (desc.collider) {
        case ColliderKind::Cylinder: {
            const auto& c = desc.cylinder;
            ctx.colliders.add_cylinder(desc.id, c.x, c.z, c.radius, c.height);
            break;
        }
        case ColliderKind::Box: {
            const auto& b = desc.box;
            ctx.colliders.add_box(desc.id, b.x, b.z, b.half_width, b.half_depth, b.height, b.yaw);
            break;
        }
        case ColliderKind::Cube: {
            const auto& c = desc.cube;
            ctx.colliders.set_dynamic_cube(desc.id, c.x, c.y, c.z, c.size, c.is_static);
            break;
        }
        case ColliderKind::None:
            break;
    }

    auto ent = world.create();
    world.add(ent, ecs::LocalTransform{desc.position, desc.rotation, desc.scale});
    world.add(ent, ecs::WorldTransform{});
    if (desc.mesh) world.add(ent, *desc.mesh);
    if (desc.world_tag) world.add(ent, WorldTag{});
    if (desc.player_tag) {
        world.add(ent, PlayerTag{});
        world.add(ent, PlayerInput{});
        world.add(ent, PlayerState{});
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

bool SceneLoader::load_from_string(ecs::World& world, SimulationContext& ctx,
                                   const std::string& json_str) {
    std::vector<EntityDesc> descs;
    MotionTuning motion = ctx.tuning;
    SpringTuning spring = ctx.spring;

    try {
        const json scene = json::parse(json_str);
        if (scene.contains("tuning")) parse_tuning(scene["tuning"], motion, spring);

        const auto& entities = scene.at("entities");
        for (std::size_t i = 0; i < entities.size(); ++i)
            descs.push_back(parse_entity(entities[i], i));
    } catch (const std::exception& e) {
        TraceLog(LOG_WARNING, "SCENE: Rejected scene: %s", e.what());
        return false;
    }

    ctx.tuning = motion;
    ctx.spring = spring;
    for (const auto& desc : descs) spawn_entity(world, ctx, desc);
    ctx.motion.reset(ctx.tuning);

    TraceLog(LOG_INFO, "SCENE: Loaded %d entities, %d colliders",
             static_cast<int>(descs.size()), static_cast<int>(ctx.colliders.size()));
    return true;
}

bool SceneLoader::load(ecs::World& world, SimulationContext& ctx, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        TraceLog(LOG_WARNING, "SCENE: Cannot open '%s'", path.c_str());
        return false;
    }
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return load_from_string(world, ctx, content);
}

void SceneLoader::unload(ecs::World& world, SimulationContext& ctx) {
    std::vector<ecs::Entity> to_destroy;
    world.each<WorldTag>([&](ecs::Entity e, WorldTag&) { to_destroy.push_back(e); });
    for (auto e : to_destroy) world.destroy(e);
    world.deferred().flush(world);

    ctx.colliders.clear();
    ctx.reset_session();
}
