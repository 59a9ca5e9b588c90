#include "collider_registry.hpp"
#include "math_util.hpp"
#include <raylib.h>
#include <algorithm>
#include <cmath>

namespace meadow {

namespace {

template<typename Shape>
bool erase_id(std::vector<ColliderEntry<Shape>>& bucket, const ColliderId& id) {
    auto it = std::find_if(bucket.begin(), bucket.end(),
                           [&](const ColliderEntry<Shape>& e) { return e.id == id; });
    if (it == bucket.end()) return false;
    bucket.erase(it);
    return true;
}

template<typename Shape>
const ColliderEntry<Shape>* find_entry(const std::vector<ColliderEntry<Shape>>& bucket,
                                       const ColliderId& id) {
    for (const auto& e : bucket)
        if (e.id == id) return &e;
    return nullptr;
}

bool reject(const ColliderId& id, const char* kind) {
    TraceLog(LOG_WARNING, "COLLIDER: Rejected %s '%s': dimensions must be positive", kind, id.c_str());
    return false;
}

} // namespace

template<typename Shape>
void ColliderRegistry::upsert(std::vector<ColliderEntry<Shape>>& bucket,
                              const ColliderId& id, const Shape& shape) {
    for (auto& e : bucket) {
        if (e.id == id) {
            e.shape = shape;
            return;
        }
    }
    // Same id under a different kind: the new shape wins.
    remove(id);
    bucket.push_back({id, shape});
}

bool ColliderRegistry::add_cylinder(const ColliderId& id, float x, float z,
                                    float radius, float height) {
    using math::is_finite_positive;
    if (!is_finite_positive(radius) || !is_finite_positive(height))
        return reject(id, "cylinder");

    upsert(cylinders_, id, CylinderCollider{x, z, radius, height});
    return true;
}

bool ColliderRegistry::add_box(const ColliderId& id, float x, float z,
                               float half_width, float half_depth, float height, float yaw) {
    using math::is_finite_positive;
    if (!is_finite_positive(half_width) || !is_finite_positive(half_depth) ||
        !is_finite_positive(height) || !std::isfinite(yaw))
        return reject(id, "box");

    upsert(boxes_, id, BoxCollider{x, z, half_width, half_depth, height,
                                   math::normalize_angle(yaw)});
    return true;
}

bool ColliderRegistry::set_dynamic_cube(const ColliderId& id, float x, float y, float z,
                                        float size, bool is_static) {
    if (!math::is_finite_positive(size)) return reject(id, "cube");

    upsert(cubes_, id, DynamicCube{x, y, z, size, is_static});
    return true;
}

bool ColliderRegistry::remove(const ColliderId& id) {
    // An id lives in at most one bucket.
    return erase_id(cylinders_, id) || erase_id(boxes_, id) || erase_id(cubes_, id);
}

void ColliderRegistry::clear() {
    cylinders_.clear();
    boxes_.clear();
    cubes_.clear();
}

bool ColliderRegistry::contains(const ColliderId& id) const {
    return find_entry(cylinders_, id) || find_entry(boxes_, id) || find_entry(cubes_, id);
}

std::size_t ColliderRegistry::size() const {
    return cylinders_.size() + boxes_.size() + cubes_.size();
}

const DynamicCube* ColliderRegistry::find_cube(const ColliderId& id) const {
    const auto* e = find_entry(cubes_, id);
    return e ? &e->shape : nullptr;
}

} // namespace meadow
