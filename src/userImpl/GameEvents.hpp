#ifndef TETRYS_USERIMPL_GAME_EVENTS_HPP
#define TETRYS_USERIMPL_GAME_EVENTS_HPP

#include "core/EventBus.hpp"
#include "userImpl/AchievementTypes.hpp"
#include "userImpl/Tetrimino.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace tetrys::game_bus {

// =============================
// ゲームのライフサイクル
// =============================
struct GameStarted {
    std::int64_t timestamp{0};
};

struct GamePaused {
    bool isPaused{false};
    std::int64_t timePlayed{0};
};

struct GameOver {
    std::int64_t score{0};
    std::int64_t level{1};
    std::int64_t lines{0};
    std::int64_t tetrisCount{0};
    std::int64_t timePlayed{0};
};

struct GameReset {
    std::int64_t timestamp{0};
};

// =============================
// 盤面・得点
// =============================
struct LinesCleared {
    int count{0};
    bool isTetris{false};
    std::int64_t newTotal{0};
    std::int64_t newLevel{1};
};

struct ScoreUpdated {
    std::int64_t score{0};
    std::int64_t delta{0};
    std::int64_t level{1};
};

struct LevelUp {
    std::int64_t level{1};
    std::int64_t previousLevel{1};
};

struct ComboUpdated {
    std::int64_t combo{0};
    bool isReset{false};
};

// 固定されたピースとそのアンカー位置
struct PiecePlaced {
    PieceType type{PieceType::I};
    int x{0};
    int y{0};
};

struct TimeTick {
    std::int64_t timePlayed{0};
};

// =============================
// 実績
// =============================
struct AchievementUnlocked {
    std::string id;
    achievement::Rarity rarity{achievement::Rarity::Common};
    std::int64_t timestamp{0};
};

using GameEvent = std::variant<GameStarted, GamePaused, GameOver, GameReset, LinesCleared,
                               ScoreUpdated, LevelUp, ComboUpdated, PiecePlaced, TimeTick,
                               AchievementUnlocked>;

using GameBus = EventBus<GameEvent>;

// バス上のイベント名(ログ用)
[[nodiscard]] std::string_view event_name(const GameEvent& ev) noexcept;

// "name {field: value, ...}" 形式(デバッグログ用)
[[nodiscard]] std::string describe(const GameEvent& ev);

}  // namespace tetrys::game_bus

#endif /* TETRYS_USERIMPL_GAME_EVENTS_HPP */
