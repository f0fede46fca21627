#include "userImpl/Preferences.hpp"

#include <SDL2/SDL_log.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <sstream>

namespace tetrys::preferences {

std::optional<double> parse_speed(std::string_view text) {
    double value = 0.0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || !std::isfinite(value)) return std::nullopt;
    if (value < MIN_SPEED || value > MAX_SPEED) return std::nullopt;
    return value;
}

Preferences load_preferences(const storage::KeyValueStore& store) {
    Preferences prefs;

    if (auto raw = store.get(SPEED_KEY); !raw) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "speed setting load failed: %s",
                     raw.error().c_str());
    } else if (raw->has_value()) {
        if (auto speed = parse_speed(**raw)) {
            prefs.speedMultiplier = *speed;
        } else {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "invalid speed setting '%s', using %.1f",
                        (*raw)->c_str(), DEFAULT_SPEED);
        }
    }

    if (auto raw = store.get(DIFFICULTY_KEY); !raw) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "difficulty setting load failed: %s",
                     raw.error().c_str());
    } else if (raw->has_value()) {
        if (auto d = global_setting::parse_difficulty(**raw)) {
            prefs.difficulty = *d;
        } else {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "unknown difficulty '%s', using normal",
                        (*raw)->c_str());
        }
    }
    return prefs;
}

tl::expected<double, std::string> save_speed(storage::KeyValueStore& store, double speed) {
    if (!std::isfinite(speed)) {
        return tl::make_unexpected(std::string{"speed is not finite"});
    }
    const double clamped = std::clamp(speed, MIN_SPEED, MAX_SPEED);
    std::ostringstream os;
    os << clamped;
    if (auto r = store.set(SPEED_KEY, os.str()); !r) {
        return tl::make_unexpected(r.error());
    }
    return clamped;
}

storage::WriteResult save_difficulty(storage::KeyValueStore& store, Difficulty difficulty) {
    return store.set(DIFFICULTY_KEY, std::string{global_setting::to_string(difficulty)});
}

}  // namespace tetrys::preferences
