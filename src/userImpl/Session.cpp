#include "userImpl/Session.hpp"

#include "userImpl/AchievementCatalog.hpp"
#include "userImpl/Preferences.hpp"

#include <SDL2/SDL_log.h>

namespace tetrys::session {

Session::Session(GlobalSetting setting, storage::KeyValueStore& store)
    : setting_(setting), store_(&store) {}

Session::~Session() {
    if (debug_subscription_) bus_.unsubscribe(*debug_subscription_);
    // バスより先に購読者を外す
    achievements_.reset();
}

tl::expected<std::unique_ptr<Session>, std::string> Session::create(
    GlobalSetting setting, storage::KeyValueStore& store, const clock::Clock& clock,
    const std::vector<achievement::Achievement>& catalog,
    achievement::AchievementEngine::WallClock wall_clock) {
    if (auto valid = achievement::validate(catalog); !valid) {
        return tl::make_unexpected("invalid achievement catalog: " + valid.error());
    }

    std::unique_ptr<Session> s{new Session(setting, store)};

    auto engine = tetris_rule::Engine::create(s->setting_, s->bus_, clock);
    if (!engine) {
        return tl::make_unexpected(engine.error());
    }
    s->engine_.emplace(std::move(*engine));

    s->achievements_ = std::make_unique<achievement::AchievementEngine>(
        s->setting_, store, s->bus_, catalog, std::move(wall_clock));
    s->achievements_->load();

    if (s->setting_.logBusEvents) {
        s->debug_subscription_ = s->bus_.subscribe([](const game_bus::GameEvent& ev) {
            SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "[bus] %s",
                         game_bus::describe(ev).c_str());
        });
    }
    return s;
}

void Session::set_speed_multiplier(double value) {
    engine_->set_speed_multiplier(value);
    if (auto saved = preferences::save_speed(*store_, engine_->speed_multiplier()); !saved) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "speed setting not saved: %s",
                    saved.error().c_str());
    }
}

bool Session::press(game_key::GameKey key) {
    using game_key::GameKey;
    switch (key) {
        case GameKey::LEFT:
            return move(-1, 0);
        case GameKey::RIGHT:
            return move(1, 0);
        case GameKey::DOWN:
            return move(0, 1);
        case GameKey::ROTATE:
            return rotate();
        case GameKey::DROP:
            return hard_drop();
        case GameKey::PAUSE:
            return toggle_pause();
        case GameKey::START:
            start();
            return true;
        case GameKey::RESET:
            reset();
            return true;
        case GameKey::QUIT:
            return false;
    }
    return false;
}

}  // namespace tetrys::session
