#pragma once
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace meadow {

// ---------------------------------------------------------------------------
// SnapshotFeed: seam to the network transport.
//
// poll() returns the text messages that arrived since the last call; send()
// queues an outbound message. Implementations never block the frame.
// ---------------------------------------------------------------------------

class SnapshotFeed {
public:
    virtual ~SnapshotFeed() = default;

    virtual std::vector<std::string> poll(float dt) = 0;
    virtual void send(const std::string& message) = 0;
    virtual bool connected() const = 0;
};

// ---------------------------------------------------------------------------
// LoopbackFeed: offline stand-in for the relay server.
//
// Simulates a handful of remote players walking circles and broadcasts them
// as "players" messages at ~5 Hz with timing jitter. One bot periodically
// leaves and rejoins, and one reports a placed cube, so every ghost and
// remote-cube path is exercised without a server.
// ---------------------------------------------------------------------------

class LoopbackFeed : public SnapshotFeed {
public:
    struct Config {
        int   local_id       = 1;
        int   bot_count      = 3;
        float broadcast_rate = 5.0f;   // Hz
        float jitter         = 0.05f;  // +/- seconds on each broadcast
        float churn_period   = 12.0f;  // seconds between leave/rejoin of the last bot
        std::uint32_t seed   = 7;
    };

    LoopbackFeed();
    explicit LoopbackFeed(const Config& config);

    std::vector<std::string> poll(float dt) override;
    void send(const std::string& message) override;
    bool connected() const override { return true; }

    std::size_t messages_sent() const { return sent_; }

private:
    struct Bot {
        int   id;
        float center_x, center_z;
        float radius;
        float angular_speed;
        float phase;
        bool  present;
        bool  has_cube;
    };

    std::string players_message() const;

    Config config_;
    std::vector<Bot> bots_;
    std::mt19937 rng_;

    bool  welcomed_        = false;
    float time_            = 0.0f;
    float next_broadcast_  = 0.0f;
    float next_churn_      = 0.0f;
    std::size_t sent_      = 0;
};

} // namespace meadow
