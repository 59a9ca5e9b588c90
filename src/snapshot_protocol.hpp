#pragma once
#include "remote_reconciler.hpp"
#include "simulation_context.hpp"
#include <optional>
#include <string>
#include <vector>

namespace meadow {

// ---------------------------------------------------------------------------
// Snapshot protocol: JSON text messages exchanged with the relay server.
//
// Inbound:  welcome, players, playerLeft, playerCount, pong
// Outbound: state (local position/velocity, optional cube), ping
//
// decode() never throws: malformed input returns false and is logged.
// ---------------------------------------------------------------------------

enum class MessageType { Welcome, Players, PlayerLeft, PlayerCount, Pong, Unknown };

struct ServerMessage {
    MessageType type         = MessageType::Unknown;
    int         id           = 0;       // welcome, playerLeft
    float       color_hue    = 0.0f;    // welcome
    int         player_count = 0;       // playerCount
    SnapshotMap players;                // players
};

namespace protocol {

bool decode(const std::string& text, ServerMessage& out);

std::string encode_state(const PlayerPublication& pub, const std::optional<CubeSnapshot>& cube);
std::string encode_ping();

} // namespace protocol

// ---------------------------------------------------------------------------
// SnapshotStore: the shared remote-player map.
//
// Written by the network collaborator whenever a message arrives; read by
// the simulation at the start of the next frame.
// ---------------------------------------------------------------------------

class SnapshotStore {
public:
    void apply(const ServerMessage& msg);

    // Connection lost: every remote player disappears.
    void disconnect();

    const SnapshotMap&  snapshots()    const { return players_; }
    std::optional<int>  local_id()     const { return local_id_; }
    float               local_hue()    const { return local_hue_; }
    int                 player_count() const { return player_count_; }

private:
    SnapshotMap        players_;
    std::optional<int> local_id_;
    float              local_hue_    = 0.0f;
    int                player_count_ = 0;
};

// ---------------------------------------------------------------------------
// OutboundScheduler: paces outbound traffic: state at 5 Hz, ping at 1 Hz.
// ---------------------------------------------------------------------------

class OutboundScheduler {
public:
    static constexpr float kStateInterval = 0.2f;
    static constexpr float kPingInterval  = 1.0f;

    // Advances the timers and returns the messages due this frame.
    std::vector<std::string> update(float dt, const PlayerPublication& pub,
                                    const std::optional<CubeSnapshot>& cube);

private:
    float state_timer_ = 0.0f;
    float ping_timer_  = 0.0f;
};

} // namespace meadow
