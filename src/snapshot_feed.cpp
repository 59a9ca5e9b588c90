#include "snapshot_feed.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>

using json = nlohmann::json;

namespace meadow {

LoopbackFeed::LoopbackFeed() : LoopbackFeed(Config{}) {}

LoopbackFeed::LoopbackFeed(const Config& config)
    : config_(config), rng_(config.seed) {
    std::uniform_real_distribution<float> pos(-20.0f, 20.0f);
    std::uniform_real_distribution<float> radius(3.0f, 8.0f);
    std::uniform_real_distribution<float> speed(0.4f, 1.0f);
    std::uniform_real_distribution<float> phase(0.0f, 6.2831853f);

    for (int i = 0; i < config_.bot_count; ++i) {
        Bot bot;
        bot.id            = config_.local_id + 1 + i;
        bot.center_x      = pos(rng_);
        bot.center_z      = pos(rng_);
        bot.radius        = radius(rng_);
        bot.angular_speed = speed(rng_) * (i % 2 == 0 ? 1.0f : -1.0f);
        bot.phase         = phase(rng_);
        bot.present       = true;
        bot.has_cube      = (i == 0);
        bots_.push_back(bot);
    }
    next_churn_ = config_.churn_period;
}

std::string LoopbackFeed::players_message() const {
    json players = json::object();
    for (const auto& bot : bots_) {
        if (!bot.present) continue;

        const float a  = bot.phase + bot.angular_speed * time_;
        const float w  = bot.angular_speed * bot.radius;
        json state = {
            {"x",  bot.center_x + bot.radius * std::cos(a)},
            {"y",  0.5f},
            {"z",  bot.center_z + bot.radius * std::sin(a)},
            {"vx", -w * std::sin(a)},
            {"vy", 0.0f},
            {"vz",  w * std::cos(a)},
            {"colorHue", static_cast<float>((bot.id * 97) % 360)},
        };
        if (bot.has_cube)
            state["cube"] = {{"x", bot.center_x}, {"y", 0.5f}, {"z", bot.center_z}};
        players[std::to_string(bot.id)] = state;
    }
    return json{{"type", "players"}, {"players", players}}.dump();
}

std::vector<std::string> LoopbackFeed::poll(float dt) {
    std::vector<std::string> inbox;
    if (!(dt > 0.0f)) return inbox;

    if (!welcomed_) {
        welcomed_ = true;
        inbox.push_back(json{{"type", "welcome"}, {"id", config_.local_id}, {"colorHue", 210.0f}}.dump());
    }

    time_ += dt;

    if (config_.churn_period > 0.0f && time_ >= next_churn_ && !bots_.empty()) {
        next_churn_ += config_.churn_period;
        Bot& bot = bots_.back();
        bot.present = !bot.present;
        if (!bot.present)
            inbox.push_back(json{{"type", "playerLeft"}, {"id", bot.id}}.dump());
    }

    if (time_ >= next_broadcast_) {
        std::uniform_real_distribution<float> jitter(-config_.jitter, config_.jitter);
        const float interval = 1.0f / std::max(config_.broadcast_rate, 0.1f);
        next_broadcast_ = time_ + std::max(0.01f, interval + jitter(rng_));

        const auto present = std::count_if(bots_.begin(), bots_.end(),
                                           [](const Bot& b) { return b.present; });
        inbox.push_back(players_message());
        inbox.push_back(json{{"type", "playerCount"}, {"playerCount", present + 1}}.dump());
    }

    return inbox;
}

void LoopbackFeed::send(const std::string& /*message*/) {
    ++sent_;
}

} // namespace meadow
