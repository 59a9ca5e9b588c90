#pragma once
#include <ecs/ecs.hpp>
#include <vector>

namespace meadow {

// ---------------------------------------------------------------------------
// Events<T>: typed, frame-scoped event queue
//
// Owned by SimulationContext. The simulation emits via send() during step();
// consumers (renderer, HUD) read() afterwards in the same frame. The queue is
// cleared at the top of the next step().
// ---------------------------------------------------------------------------

template<typename T>
struct Events {
    void send(T event)                     { buffer_.push_back(std::move(event)); }
    const std::vector<T>& read()   const  { return buffer_; }
    bool                  empty()  const  { return buffer_.empty(); }
    void                  clear()         { buffer_.clear(); }

private:
    std::vector<T> buffer_;
};

// ---------------------------------------------------------------------------
// Concrete event types
// ---------------------------------------------------------------------------

// A jump was honoured. impulse: vertical velocity added (m/s).
// energy_used: jump energy consumed by this jump.
struct JumpEvent {
    float impulse;
    float energy_used;
};

// Airborne -> grounded transition.
struct LandEvent {
    float impact_speed;
};

// Fell below the fatal threshold and was moved back to spawn.
struct RespawnEvent {
    ecs::Vec3 from;
};

// A remote id appeared in the snapshot map. The rendering side creates the
// visual for this id when it sees this event.
struct GhostSpawned {
    int       id;
    ecs::Vec3 position;
    float     color_hue;
};

// A remote id left the snapshot map; its visual must be released.
struct GhostDespawned {
    int id;
};

} // namespace meadow
