#ifndef TETRYS_USERIMPL_GLOBAL_SETTING_HPP
#define TETRYS_USERIMPL_GLOBAL_SETTING_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tetrys::global_setting {

enum class Difficulty { Easy, Normal, Hard };

/**
 * @brief 難易度プリセット
 * @param speedFactor 落下速度への倍率(大きいほど速い)
 * @param linesPerLevel レベルアップに必要なライン数
 * @param scoreMultiplier 得点倍率
 * @param pieceWeights 出現重み(PieceType 順: I, O, T, S, Z, J, L)
 */
struct DifficultyPreset {
    Difficulty id;
    std::string_view name;
    double speedFactor;
    int linesPerLevel;
    double scoreMultiplier;
    std::array<int, 7> pieceWeights;
};

inline constexpr std::array<DifficultyPreset, 3> DIFFICULTY_PRESETS{{
    {Difficulty::Easy, "easy", 0.7, 15, 0.75, {15, 12, 10, 6, 6, 10, 10}},
    {Difficulty::Normal, "normal", 1.0, 10, 1.0, {10, 10, 10, 10, 10, 10, 10}},
    {Difficulty::Hard, "hard", 1.5, 8, 1.5, {6, 8, 10, 14, 14, 10, 10}},
}};

[[nodiscard]] constexpr const DifficultyPreset& preset_for(Difficulty d) noexcept {
    for (const auto& p : DIFFICULTY_PRESETS) {
        if (p.id == d) return p;
    }
    return DIFFICULTY_PRESETS[1];
}

[[nodiscard]] constexpr std::string_view to_string(Difficulty d) noexcept {
    return preset_for(d).name;
}

[[nodiscard]] constexpr std::optional<Difficulty> parse_difficulty(std::string_view s) noexcept {
    for (const auto& p : DIFFICULTY_PRESETS) {
        if (p.name == s) return p.id;
    }
    return std::nullopt;
}

struct GlobalSetting {
    const int gridColumns = 10;                // 列数
    const int gridRows = 20;                   // 行数
    const int baseFallMs = 800;                // レベル1の落下間隔(ms)
    const int fallStepPerLevelMs = 50;         // 1レベルごとの短縮量(ms)
    const int minBaseFallMs = 100;             // 倍率適用前の下限(ms)
    const int minFallIntervalMs = 50;          // 倍率適用後の下限(ms)
    const double minSpeedMultiplier = 0.5;     // setSpeedMultiplier の下限
    const double maxSpeedMultiplier = 3.0;     // setSpeedMultiplier の上限
    const std::size_t maxPendingNotifications = 50;  // 通知キュー容量
    const std::size_t cascadePassLimit;        // 連鎖評価の最大パス数(0 ならカタログ件数)
    const Difficulty difficulty;               // 難易度
    const int linesPerLevel;                   // レベルアップに必要なライン数
    const double scoreMultiplier;              // 得点倍率
    const double speedFactor;                  // 難易度による速度倍率
    const std::array<int, 7> pieceWeights;     // 出現重み
    const std::uint32_t rngSeed;               // 0 なら random_device
    const bool logBusEvents;                   // 全イベントを SDL_LogDebug に流す

    explicit GlobalSetting(Difficulty difficulty_ = Difficulty::Normal, std::uint32_t seed = 0,
                           bool log_bus_events = false, std::size_t cascade_pass_limit = 0)
        : cascadePassLimit(cascade_pass_limit),
          difficulty(difficulty_),
          linesPerLevel(preset_for(difficulty_).linesPerLevel),
          scoreMultiplier(preset_for(difficulty_).scoreMultiplier),
          speedFactor(preset_for(difficulty_).speedFactor),
          pieceWeights(preset_for(difficulty_).pieceWeights),
          rngSeed(seed),
          logBusEvents(log_bus_events) {}
};

}  // namespace tetrys::global_setting

#endif /* TETRYS_USERIMPL_GLOBAL_SETTING_HPP */
