#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace meadow {

// ---------------------------------------------------------------------------
// Collider shapes
//
// All heights are measured from the shared ground plane (y = 0). Shapes are
// immutable once registered; re-registering an id replaces the shape.
// ---------------------------------------------------------------------------

using ColliderId = std::string;

// Vertical obstacle (tree trunk, well).
struct CylinderCollider {
    float x      = 0.0f;
    float z      = 0.0f;
    float radius = 0.5f;
    float height = 1.0f;
};

// Rectangular prop rotated by `yaw` radians about +Y.
struct BoxCollider {
    float x           = 0.0f;
    float z           = 0.0f;
    float half_width  = 0.5f;   // local x extent
    float half_depth  = 0.5f;   // local z extent
    float height      = 1.0f;
    float yaw         = 0.0f;
};

// Axis-aligned cube placed by a player. (x, y, z) is the cube centre.
// is_static == true: another player's cube, blocks the local player.
// is_static == false: the local player's own cube, standable but never blocking.
struct DynamicCube {
    float x         = 0.0f;
    float y         = 0.0f;
    float z         = 0.0f;
    float size      = 1.0f;
    bool  is_static = true;

    float top() const { return y + 0.5f * size; }
};

template<typename Shape>
struct ColliderEntry {
    ColliderId id;
    Shape      shape;
};

// ---------------------------------------------------------------------------
// ColliderRegistry: id-keyed store of obstacle shapes.
//
// Iteration order is registration order per kind. Single writer, single
// reader within one simulation step; no internal locking.
// ---------------------------------------------------------------------------

class ColliderRegistry {
public:
    // Each add returns false (and stores nothing) if a dimension is not a
    // finite positive number.
    bool add_cylinder(const ColliderId& id, float x, float z, float radius, float height);
    bool add_box(const ColliderId& id, float x, float z,
                 float half_width, float half_depth, float height, float yaw);
    bool set_dynamic_cube(const ColliderId& id, float x, float y, float z,
                          float size, bool is_static);

    bool remove(const ColliderId& id);
    void clear();

    bool        contains(const ColliderId& id) const;
    std::size_t size() const;

    const DynamicCube* find_cube(const ColliderId& id) const;

    const std::vector<ColliderEntry<CylinderCollider>>& cylinders() const { return cylinders_; }
    const std::vector<ColliderEntry<BoxCollider>>&      boxes()     const { return boxes_; }
    const std::vector<ColliderEntry<DynamicCube>>&      cubes()     const { return cubes_; }

private:
    template<typename Shape>
    void upsert(std::vector<ColliderEntry<Shape>>& bucket, const ColliderId& id, const Shape& shape);

    std::vector<ColliderEntry<CylinderCollider>> cylinders_;
    std::vector<ColliderEntry<BoxCollider>>      boxes_;
    std::vector<ColliderEntry<DynamicCube>>      cubes_;
};

} // namespace meadow
