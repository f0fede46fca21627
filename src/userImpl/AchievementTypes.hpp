#ifndef TETRYS_USERIMPL_ACHIEVEMENT_TYPES_HPP
#define TETRYS_USERIMPL_ACHIEVEMENT_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tetrys::achievement {

enum class Rarity { Common, Rare, Epic, Legendary };
enum class Category { Progression, Gameplay, Scoring, Skill, Special };

// 条件が参照する統計値
enum class StatField { Score, Level, Lines, TetrisCount, Combo, TimePlayed, GamesPlayed, TotalLines };

enum class Comparator { Gte, Lte, Eq };

[[nodiscard]] constexpr std::string_view to_string(Rarity r) noexcept {
    switch (r) {
        case Rarity::Common:
            return "common";
        case Rarity::Rare:
            return "rare";
        case Rarity::Epic:
            return "epic";
        case Rarity::Legendary:
            return "legendary";
    }
    return "common";
}

[[nodiscard]] constexpr std::string_view to_string(Category c) noexcept {
    switch (c) {
        case Category::Progression:
            return "progression";
        case Category::Gameplay:
            return "gameplay";
        case Category::Scoring:
            return "scoring";
        case Category::Skill:
            return "skill";
        case Category::Special:
            return "special";
    }
    return "gameplay";
}

[[nodiscard]] constexpr std::string_view to_string(StatField f) noexcept {
    switch (f) {
        case StatField::Score:
            return "score";
        case StatField::Level:
            return "level";
        case StatField::Lines:
            return "lines";
        case StatField::TetrisCount:
            return "tetris_count";
        case StatField::Combo:
            return "combo";
        case StatField::TimePlayed:
            return "time_played";
        case StatField::GamesPlayed:
            return "games_played";
        case StatField::TotalLines:
            return "total_lines";
    }
    return "score";
}

/**
 * @brief 単一の解除条件
 * @param field 参照する統計値
 * @param op 比較演算子
 * @param value しきい値
 */
struct Condition {
    StatField field;
    Comparator op;
    std::int64_t value;
};

[[nodiscard]] constexpr bool holds(Comparator op, std::int64_t current, std::int64_t threshold) noexcept {
    switch (op) {
        case Comparator::Gte:
            return current >= threshold;
        case Comparator::Lte:
            return current <= threshold;
        case Comparator::Eq:
            return current == threshold;
    }
    return false;
}

/**
 * @brief カタログの1エントリ(静的)
 * @param additional 主条件に加えて全て満たす必要がある条件
 * @param requires_id 先に解除されている必要がある実績 ID
 */
struct Achievement {
    std::string_view id;
    std::string_view name;
    std::string_view description;
    std::string_view icon;
    Category category;
    Rarity rarity;
    Condition condition;
    std::vector<Condition> additional;
    std::optional<std::string_view> requires_id;
    std::string_view rewardMessage;
};

/**
 * @brief 評価に渡す統計値(未指定のフィールドはその条件を評価しない)
 */
struct StatsInput {
    std::optional<std::int64_t> score;
    std::optional<std::int64_t> level;
    std::optional<std::int64_t> lines;
    std::optional<std::int64_t> tetrisCount;
    std::optional<std::int64_t> combo;
    std::optional<std::int64_t> timePlayed;
    std::optional<std::int64_t> gamesPlayed;
    std::optional<std::int64_t> totalLines;

    [[nodiscard]] std::optional<std::int64_t> value(StatField f) const noexcept {
        switch (f) {
            case StatField::Score:
                return score;
            case StatField::Level:
                return level;
            case StatField::Lines:
                return lines;
            case StatField::TetrisCount:
                return tetrisCount;
            case StatField::Combo:
                return combo;
            case StatField::TimePlayed:
                return timePlayed;
            case StatField::GamesPlayed:
                return gamesPlayed;
            case StatField::TotalLines:
                return totalLines;
        }
        return std::nullopt;
    }
};

// 解除時点のゲーム状況
struct GameStatsSnapshot {
    std::int64_t score{0};
    std::int64_t level{0};
    std::int64_t lines{0};
};

/**
 * @brief 永続化される解除記録(1 ID につき高々1件)
 * @param unlockedAt Unix エポックからのミリ秒
 */
struct UnlockedAchievement {
    std::string achievementId;
    std::int64_t unlockedAt{0};
    std::optional<GameStatsSnapshot> gameStats;
};

struct Progress {
    std::string achievementId;
    std::int64_t currentValue{0};
    std::int64_t targetValue{0};
    int percentage{0};
};

struct Summary {
    std::size_t totalAchievements{0};
    std::size_t unlockedCount{0};
    int percentage{0};
    std::vector<UnlockedAchievement> recentUnlocks;  // 新しい順に最大5件
};

// 全ゲーム通算の統計(永続化)
struct SessionStats {
    std::int64_t linesCleared{0};  // 現在のゲームで消したライン
    std::int64_t tetrisCount{0};
    std::int64_t maxCombo{0};
    std::int64_t gamesPlayed{0};
    std::int64_t totalLines{0};
    std::int64_t timePlayed{0};  // 秒

    bool operator==(const SessionStats&) const = default;
};

struct SessionStatsPatch {
    std::optional<std::int64_t> linesCleared;
    std::optional<std::int64_t> tetrisCount;
    std::optional<std::int64_t> maxCombo;
    std::optional<std::int64_t> gamesPlayed;
    std::optional<std::int64_t> totalLines;
    std::optional<std::int64_t> timePlayed;
};

/**
 * @brief ゲームイベントから組み立てる現在ゲームの集計(永続化しない)
 */
struct EventDrivenStats {
    std::int64_t score{0};
    std::int64_t level{1};
    std::int64_t lines{0};
    std::int64_t tetrisCount{0};
    std::int64_t combo{0};
    std::int64_t timePlayed{0};
};

}  // namespace tetrys::achievement

#endif /* TETRYS_USERIMPL_ACHIEVEMENT_TYPES_HPP */
