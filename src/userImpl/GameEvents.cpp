#include "userImpl/GameEvents.hpp"

#include <sstream>
#include <type_traits>

namespace tetrys::game_bus {

namespace {

template <class>
inline constexpr bool always_false_v = false;

}  // namespace

std::string_view event_name(const GameEvent& ev) noexcept {
    return std::visit(
        [](const auto& e) -> std::string_view {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, GameStarted>) {
                return "game:started";
            } else if constexpr (std::is_same_v<T, GamePaused>) {
                return "game:paused";
            } else if constexpr (std::is_same_v<T, GameOver>) {
                return "game:over";
            } else if constexpr (std::is_same_v<T, GameReset>) {
                return "game:reset";
            } else if constexpr (std::is_same_v<T, LinesCleared>) {
                return "lines:cleared";
            } else if constexpr (std::is_same_v<T, ScoreUpdated>) {
                return "score:updated";
            } else if constexpr (std::is_same_v<T, LevelUp>) {
                return "level:up";
            } else if constexpr (std::is_same_v<T, ComboUpdated>) {
                return "combo:updated";
            } else if constexpr (std::is_same_v<T, PiecePlaced>) {
                return "piece:placed";
            } else if constexpr (std::is_same_v<T, TimeTick>) {
                return "time:tick";
            } else if constexpr (std::is_same_v<T, AchievementUnlocked>) {
                return "achievement:unlocked";
            } else {
                static_assert(always_false_v<T>, "unhandled GameEvent alternative");
            }
        },
        ev);
}

std::string describe(const GameEvent& ev) {
    std::ostringstream os;
    os << event_name(ev) << " {";
    std::visit(
        [&os](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, GameStarted> || std::is_same_v<T, GameReset>) {
                os << "timestamp: " << e.timestamp;
            } else if constexpr (std::is_same_v<T, GamePaused>) {
                os << "isPaused: " << std::boolalpha << e.isPaused << ", timePlayed: " << e.timePlayed;
            } else if constexpr (std::is_same_v<T, GameOver>) {
                os << "score: " << e.score << ", level: " << e.level << ", lines: " << e.lines
                   << ", tetrisCount: " << e.tetrisCount << ", timePlayed: " << e.timePlayed;
            } else if constexpr (std::is_same_v<T, LinesCleared>) {
                os << "count: " << e.count << ", isTetris: " << std::boolalpha << e.isTetris
                   << ", newTotal: " << e.newTotal << ", newLevel: " << e.newLevel;
            } else if constexpr (std::is_same_v<T, ScoreUpdated>) {
                os << "score: " << e.score << ", delta: " << e.delta << ", level: " << e.level;
            } else if constexpr (std::is_same_v<T, LevelUp>) {
                os << "level: " << e.level << ", previousLevel: " << e.previousLevel;
            } else if constexpr (std::is_same_v<T, ComboUpdated>) {
                os << "combo: " << e.combo << ", isReset: " << std::boolalpha << e.isReset;
            } else if constexpr (std::is_same_v<T, PiecePlaced>) {
                os << "type: " << to_char(e.type) << ", x: " << e.x << ", y: " << e.y;
            } else if constexpr (std::is_same_v<T, TimeTick>) {
                os << "timePlayed: " << e.timePlayed;
            } else if constexpr (std::is_same_v<T, AchievementUnlocked>) {
                os << "id: " << e.id << ", rarity: " << achievement::to_string(e.rarity)
                   << ", timestamp: " << e.timestamp;
            }
        },
        ev);
    os << "}";
    return os.str();
}

}  // namespace tetrys::game_bus
