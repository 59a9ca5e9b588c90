#include "snapshot_protocol.hpp"
#include <nlohmann/json.hpp>
#include <raylib.h>
#include <cmath>
#include <stdexcept>

using json = nlohmann::json;

namespace meadow {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static float finite_or_throw(const json& j, const char* key) {
    const float v = j.at(key).get<float>();
    if (!std::isfinite(v)) throw std::runtime_error(std::string("non-finite '") + key + "'");
    return v;
}

static RemoteSnapshot parse_snapshot(const json& j) {
    RemoteSnapshot s;
    s.x  = finite_or_throw(j, "x");
    s.y  = finite_or_throw(j, "y");
    s.z  = finite_or_throw(j, "z");
    s.vx = j.contains("vx") ? finite_or_throw(j, "vx") : 0.0f;
    s.vy = j.contains("vy") ? finite_or_throw(j, "vy") : 0.0f;
    s.vz = j.contains("vz") ? finite_or_throw(j, "vz") : 0.0f;
    s.color_hue = j.value("colorHue", 0.0f);

    if (j.contains("cube") && !j["cube"].is_null()) {
        const auto& c = j["cube"];
        s.cube = CubeSnapshot{finite_or_throw(c, "x"), finite_or_throw(c, "y"), finite_or_throw(c, "z")};
    }
    return s;
}

static int parse_id(const std::string& key) {
    std::size_t used = 0;
    const int id = std::stoi(key, &used);
    if (used != key.size()) throw std::runtime_error("bad player id '" + key + "'");
    return id;
}

static MessageType parse_type(const std::string& s) {
    if (s == "welcome")     return MessageType::Welcome;
    if (s == "players")     return MessageType::Players;
    if (s == "playerLeft")  return MessageType::PlayerLeft;
    if (s == "playerCount") return MessageType::PlayerCount;
    if (s == "pong")        return MessageType::Pong;
    return MessageType::Unknown;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

bool protocol::decode(const std::string& text, ServerMessage& out) {
    try {
        const json msg = json::parse(text);
        ServerMessage parsed;
        parsed.type = parse_type(msg.at("type").get<std::string>());

        switch (parsed.type) {
            case MessageType::Welcome:
                parsed.id        = msg.at("id").get<int>();
                parsed.color_hue = msg.value("colorHue", 0.0f);
                break;
            case MessageType::Players:
                for (const auto& item : msg.at("players").items())
                    parsed.players[parse_id(item.key())] = parse_snapshot(item.value());
                break;
            case MessageType::PlayerLeft:
                parsed.id = msg.at("id").get<int>();
                break;
            case MessageType::PlayerCount:
                parsed.player_count = msg.at("playerCount").get<int>();
                break;
            case MessageType::Pong:
            case MessageType::Unknown:
                break;
        }

        out = std::move(parsed);
        return true;
    } catch (const std::exception& e) {
        TraceLog(LOG_WARNING, "NET: Dropped malformed message: %s", e.what());
        return false;
    }
}

std::string protocol::encode_state(const PlayerPublication& pub,
                                   const std::optional<CubeSnapshot>& cube) {
    json state = {
        {"x",  pub.position.x}, {"y",  pub.position.y}, {"z",  pub.position.z},
        {"vx", pub.velocity.x}, {"vy", pub.velocity.y}, {"vz", pub.velocity.z},
    };
    if (cube) state["cube"] = {{"x", cube->x}, {"y", cube->y}, {"z", cube->z}};
    return json{{"type", "state"}, {"state", state}}.dump();
}

std::string protocol::encode_ping() {
    return json{{"type", "ping"}}.dump();
}

// ---------------------------------------------------------------------------
// SnapshotStore
// ---------------------------------------------------------------------------

void SnapshotStore::apply(const ServerMessage& msg) {
    switch (msg.type) {
        case MessageType::Welcome:
            local_id_  = msg.id;
            local_hue_ = msg.color_hue;
            players_.erase(msg.id);
            TraceLog(LOG_INFO, "NET: Joined as player %d", msg.id);
            break;
        case MessageType::Players:
            players_ = msg.players;
            if (local_id_) players_.erase(*local_id_);
            break;
        case MessageType::PlayerLeft:
            players_.erase(msg.id);
            break;
        case MessageType::PlayerCount:
            player_count_ = msg.player_count;
            break;
        case MessageType::Pong:
        case MessageType::Unknown:
            break;
    }
}

void SnapshotStore::disconnect() {
    TraceLog(LOG_INFO, "NET: Disconnected, dropping %d remote players", static_cast<int>(players_.size()));
    players_.clear();
    local_id_.reset();
    player_count_ = 0;
}

// ---------------------------------------------------------------------------
// OutboundScheduler
// ---------------------------------------------------------------------------

std::vector<std::string> OutboundScheduler::update(float dt, const PlayerPublication& pub,
                                                   const std::optional<CubeSnapshot>& cube) {
    std::vector<std::string> out;
    if (!(dt > 0.0f)) return out;

    state_timer_ += dt;
    ping_timer_  += dt;

    if (state_timer_ >= kStateInterval) {
        state_timer_ = std::fmod(state_timer_, kStateInterval);
        out.push_back(protocol::encode_state(pub, cube));
    }
    if (ping_timer_ >= kPingInterval) {
        ping_timer_ = std::fmod(ping_timer_, kPingInterval);
        out.push_back(protocol::encode_ping());
    }
    return out;
}

} // namespace meadow
