#include "userImpl/AchievementCatalog.hpp"

#include <algorithm>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace tetrys::achievement {

namespace {

// clang-format off
std::vector<Achievement> build_catalog() {
    return {
    // =============================
    // 進行(レベル 1-20)
    // =============================
    {"welcome", "Welcome Player", "Start your first game", "👋",
     Category::Progression, Rarity::Common, {StatField::Level, Comparator::Gte, 1}, {}, std::nullopt,
     "Welcome to Tetrys! Your journey begins now!"},
    {"level_2", "Getting Started", "Reach level 2", "🌱",
     Category::Progression, Rarity::Common, {StatField::Level, Comparator::Gte, 2}, {}, std::nullopt,
     "Nice! You're getting the hang of it!"},
    {"level_3", "Warming Up", "Reach level 3", "🔥",
     Category::Progression, Rarity::Common, {StatField::Level, Comparator::Gte, 3}, {}, std::nullopt,
     "The blocks are coming faster now!"},
    {"level_4", "Building Momentum", "Reach level 4", "📈",
     Category::Progression, Rarity::Common, {StatField::Level, Comparator::Gte, 4}, {}, std::nullopt,
     "You're building up speed!"},
    {"level_5", "Steady Hand", "Reach level 5", "✋",
     Category::Progression, Rarity::Common, {StatField::Level, Comparator::Gte, 5}, {}, std::nullopt,
     "Halfway to level 10! Keep it up!"},
    {"level_6", "Rising Star", "Reach level 6", "⭐",
     Category::Progression, Rarity::Common, {StatField::Level, Comparator::Gte, 6}, {}, std::nullopt,
     "You're on the rise!"},
    {"level_7", "Lucky Seven", "Reach level 7", "🎰",
     Category::Progression, Rarity::Common, {StatField::Level, Comparator::Gte, 7}, {}, std::nullopt,
     "Lucky number 7! Keep the streak going!"},
    {"level_8", "Octane Boost", "Reach level 8", "🏎️",
     Category::Progression, Rarity::Common, {StatField::Level, Comparator::Gte, 8}, {}, std::nullopt,
     "Speed is increasing! Stay focused!"},
    {"level_9", "Almost There", "Reach level 9", "🎯",
     Category::Progression, Rarity::Common, {StatField::Level, Comparator::Gte, 9}, {}, std::nullopt,
     "Level 10 is just around the corner!"},
    {"level_10", "Speed Apprentice", "Reach level 10", "⚡",
     Category::Progression, Rarity::Rare, {StatField::Level, Comparator::Gte, 10}, {}, std::nullopt,
     "Level 10 reached! The speed is picking up!"},
    {"level_11", "Turning it Up", "Reach level 11", "🔊",
     Category::Progression, Rarity::Rare, {StatField::Level, Comparator::Gte, 11}, {}, std::nullopt,
     "Into double digits! This is where it gets intense!"},
    {"level_12", "Dozen Down", "Reach level 12", "🎲",
     Category::Progression, Rarity::Rare, {StatField::Level, Comparator::Gte, 12}, {}, std::nullopt,
     "A dozen levels conquered!"},
    {"level_13", "Unlucky for Blocks", "Reach level 13", "🍀",
     Category::Progression, Rarity::Rare, {StatField::Level, Comparator::Gte, 13}, {}, std::nullopt,
     "Unlucky for some, but not for you!"},
    {"level_14", "Fortified", "Reach level 14", "🛡️",
     Category::Progression, Rarity::Rare, {StatField::Level, Comparator::Gte, 14}, {}, std::nullopt,
     "Your defenses are strong!"},
    {"level_15", "Speed Demon", "Reach level 15", "👹",
     Category::Progression, Rarity::Epic, {StatField::Level, Comparator::Gte, 15}, {}, std::nullopt,
     "Speed Demon unlocked! Few can keep up at this pace!"},
    {"level_16", "Sweet Sixteen", "Reach level 16", "🎂",
     Category::Progression, Rarity::Epic, {StatField::Level, Comparator::Gte, 16}, {}, std::nullopt,
     "Sweet sixteen! You're in the elite now!"},
    {"level_17", "High Roller", "Reach level 17", "🎰",
     Category::Progression, Rarity::Epic, {StatField::Level, Comparator::Gte, 17}, {}, std::nullopt,
     "Rolling with the high stakes!"},
    {"level_18", "Coming of Age", "Reach level 18", "🎓",
     Category::Progression, Rarity::Epic, {StatField::Level, Comparator::Gte, 18}, {}, std::nullopt,
     "You're a seasoned veteran now!"},
    {"level_19", "On the Brink", "Reach level 19", "⚠️",
     Category::Progression, Rarity::Epic, {StatField::Level, Comparator::Gte, 19}, {}, std::nullopt,
     "One level away from legendary status!"},
    {"level_20", "Velocity Master", "Reach level 20", "🚀",
     Category::Progression, Rarity::Legendary, {StatField::Level, Comparator::Gte, 20}, {}, std::nullopt,
     "Level 20! You've entered legendary territory!"},

    // =============================
    // ライン数(1ゲーム)
    // =============================
    {"first_blood", "First Blood", "Clear your first line", "🎯",
     Category::Gameplay, Rarity::Common, {StatField::Lines, Comparator::Gte, 1}, {}, std::nullopt,
     "You've cleared your first line! Keep going!"},
    {"five_lines", "Line Beginner", "Clear 5 lines", "✅",
     Category::Gameplay, Rarity::Common, {StatField::Lines, Comparator::Gte, 5}, {}, std::nullopt,
     "Five lines down! You're learning fast!"},
    {"ten_lines", "Double Digits", "Clear 10 lines", "🔟",
     Category::Gameplay, Rarity::Common, {StatField::Lines, Comparator::Gte, 10}, {}, std::nullopt,
     "Ten lines cleared! You're building momentum!"},
    {"fifteen_lines", "Steady Progress", "Clear 15 lines", "📊",
     Category::Gameplay, Rarity::Common, {StatField::Lines, Comparator::Gte, 15}, {}, std::nullopt,
     "Fifteen lines! Steady as she goes!"},
    {"twenty_lines", "Score!", "Clear 20 lines", "🎉",
     Category::Gameplay, Rarity::Common, {StatField::Lines, Comparator::Gte, 20}, {}, std::nullopt,
     "Twenty lines! That's a solid start!"},
    {"thirty_lines", "Getting Serious", "Clear 30 lines", "💪",
     Category::Gameplay, Rarity::Common, {StatField::Lines, Comparator::Gte, 30}, {}, std::nullopt,
     "Thirty lines! Now we're talking!"},
    {"forty_lines", "Sprint Master", "Clear 40 lines", "🏃‍♂️",
     Category::Gameplay, Rarity::Common, {StatField::Lines, Comparator::Gte, 40}, {}, std::nullopt,
     "Forty lines! You're hitting your stride!"},
    {"fifty_lines", "Half Century", "Clear 50 lines", "🎖️",
     Category::Gameplay, Rarity::Rare, {StatField::Lines, Comparator::Gte, 50}, {}, std::nullopt,
     "Fifty lines! Halfway to 100!"},
    {"seventy_five_lines", "Line Veteran", "Clear 75 lines", "🎗️",
     Category::Gameplay, Rarity::Rare, {StatField::Lines, Comparator::Gte, 75}, {}, std::nullopt,
     "Seventy-five lines! You're a veteran now!"},
    {"centurion", "Centurion", "Clear 100 lines in a single game", "💯",
     Category::Gameplay, Rarity::Rare, {StatField::Lines, Comparator::Gte, 100}, {}, std::nullopt,
     "Century cleared! Your stacking skills are impressive!"},
    {"line_150", "Sesquicentennial", "Clear 150 lines", "🏅",
     Category::Gameplay, Rarity::Epic, {StatField::Lines, Comparator::Gte, 150}, {}, std::nullopt,
     "150 lines! You're in the elite!"},
    {"marathon_runner", "Marathon Runner", "Clear 200 lines in a single game", "🏃",
     Category::Gameplay, Rarity::Epic, {StatField::Lines, Comparator::Gte, 200}, {}, "centurion",
     "Marathon complete! You're a true endurance master!"},

    // =============================
    // スコア
    // =============================
    {"score_100", "First Points", "Score 100 points", "💰",
     Category::Scoring, Rarity::Common, {StatField::Score, Comparator::Gte, 100}, {}, std::nullopt,
     "Your first 100 points! Many more to come!"},
    {"score_500", "Getting Points", "Score 500 points", "💵",
     Category::Scoring, Rarity::Common, {StatField::Score, Comparator::Gte, 500}, {}, std::nullopt,
     "500 points! You're racking them up!"},
    {"score_1000", "Kilopoint", "Score 1,000 points", "💸",
     Category::Scoring, Rarity::Common, {StatField::Score, Comparator::Gte, 1000}, {}, std::nullopt,
     "One thousand points! Nice work!"},
    {"score_2500", "Point Collector", "Score 2,500 points", "🪙",
     Category::Scoring, Rarity::Common, {StatField::Score, Comparator::Gte, 2500}, {}, std::nullopt,
     "2,500 points! You're collecting them fast!"},
    {"score_5000", "Five Grand", "Score 5,000 points", "💎",
     Category::Scoring, Rarity::Rare, {StatField::Score, Comparator::Gte, 5000}, {}, std::nullopt,
     "5,000 points! That's impressive!"},
    {"score_10000", "Ten Thousand", "Score 10,000 points", "💰",
     Category::Scoring, Rarity::Rare, {StatField::Score, Comparator::Gte, 10000}, {}, std::nullopt,
     "10,000 points! You're on fire!"},
    {"score_25000", "High Scorer", "Score 25,000 points", "🏆",
     Category::Scoring, Rarity::Rare, {StatField::Score, Comparator::Gte, 25000}, {}, std::nullopt,
     "25,000 points! Amazing!"},
    {"score_50000", "Point Master", "Score 50,000 points", "👑",
     Category::Scoring, Rarity::Epic, {StatField::Score, Comparator::Gte, 50000}, {}, std::nullopt,
     "50,000 points! You're a master!"},
    {"score_75000", "Point Legend", "Score 75,000 points", "🌟",
     Category::Scoring, Rarity::Epic, {StatField::Score, Comparator::Gte, 75000}, {}, std::nullopt,
     "75,000 points! Legendary status!"},
    {"unstoppable", "Unstoppable", "Score 100,000 points in a single game", "💎",
     Category::Scoring, Rarity::Legendary, {StatField::Score, Comparator::Gte, 100000}, {}, "score_75000",
     "Unstoppable force! This score will be remembered!"},

    // =============================
    // テトリス回数
    // =============================
    {"tetris_novice", "Tetris Novice", "Clear 4 lines at once (Tetris) for the first time", "⭐",
     Category::Scoring, Rarity::Common, {StatField::TetrisCount, Comparator::Gte, 1}, {}, std::nullopt,
     "Your first Tetris! The most satisfying move in the game!"},
    {"tetris_2", "Double Tetris", "Clear 2 Tetris in a game", "✨",
     Category::Scoring, Rarity::Common, {StatField::TetrisCount, Comparator::Gte, 2}, {}, "tetris_novice",
     "Two Tetris clears! You're learning the best move!"},
    {"tetris_3", "Tetris Trio", "Clear 3 Tetris in a game", "💫",
     Category::Scoring, Rarity::Common, {StatField::TetrisCount, Comparator::Gte, 3}, {}, "tetris_2",
     "Three Tetris! That's the way to score big!"},
    {"tetris_5", "Tetris Enthusiast", "Clear 5 Tetris in a game", "🌠",
     Category::Scoring, Rarity::Rare, {StatField::TetrisCount, Comparator::Gte, 5}, {}, "tetris_3",
     "Five Tetris! You love those 4-line clears!"},
    {"tetris_7", "Lucky Seven Tetris", "Clear 7 Tetris in a game", "🎰",
     Category::Scoring, Rarity::Rare, {StatField::TetrisCount, Comparator::Gte, 7}, {}, "tetris_5",
     "Seven Tetris! Lucky you!"},
    {"tetris_master", "Tetris Master", "Clear 10 Tetris (4-line clears) in a single game", "🏆",
     Category::Scoring, Rarity::Epic, {StatField::TetrisCount, Comparator::Gte, 10}, {}, "tetris_7",
     "Tetris Master achieved! You've mastered the art of 4-line clears!"},
    {"tetris_15", "Tetris Legend", "Clear 15 Tetris in a game", "👑",
     Category::Scoring, Rarity::Legendary, {StatField::TetrisCount, Comparator::Gte, 15}, {}, "tetris_master",
     "Fifteen Tetris! You're a living legend!"},

    // =============================
    // コンボ
    // =============================
    {"combo_2", "Double Combo", "Achieve a 2x combo", "🔗",
     Category::Skill, Rarity::Common, {StatField::Combo, Comparator::Gte, 2}, {}, std::nullopt,
     "Nice combo! Keep them coming!"},
    {"combo_3", "Triple Threat", "Achieve a 3x combo", "🔥",
     Category::Skill, Rarity::Common, {StatField::Combo, Comparator::Gte, 3}, {}, "combo_2",
     "Triple combo! Your timing is improving!"},
    {"combo_4", "Quad Squad", "Achieve a 4x combo", "💥",
     Category::Skill, Rarity::Rare, {StatField::Combo, Comparator::Gte, 4}, {}, "combo_3",
     "Four in a row! Impressive!"},
    {"combo_king", "Combo King", "Achieve a 5x combo streak", "🔥",
     Category::Skill, Rarity::Rare, {StatField::Combo, Comparator::Gte, 5}, {}, "combo_4",
     "Combo King crowned! Your timing is impeccable!"},
    {"combo_6", "Combo Master", "Achieve a 6x combo", "⚡",
     Category::Skill, Rarity::Epic, {StatField::Combo, Comparator::Gte, 6}, {}, "combo_king",
     "Six combo! You're on fire!"},
    {"combo_7", "Lucky Streak", "Achieve a 7x combo", "🍀",
     Category::Skill, Rarity::Epic, {StatField::Combo, Comparator::Gte, 7}, {}, "combo_6",
     "Seven combo! What a streak!"},
    {"combo_8", "Combo Legend", "Achieve an 8x combo", "👑",
     Category::Skill, Rarity::Legendary, {StatField::Combo, Comparator::Gte, 8}, {}, "combo_7",
     "Eight combo! You're unstoppable!"},
    {"combo_10", "Combo God", "Achieve a 10x combo", "⚡",
     Category::Skill, Rarity::Legendary, {StatField::Combo, Comparator::Gte, 10}, {}, "combo_8",
     "Ten combo! Are you even human?!"},

    // =============================
    // スキル
    // =============================
    {"perfect_start", "Perfect Start", "Clear 10 lines without any gaps", "✨",
     Category::Skill, Rarity::Rare, {StatField::Lines, Comparator::Gte, 10}, {}, "ten_lines",
     "Perfect execution! Your stacking is flawless!"},
    {"quick_fingers", "Quick Fingers", "Clear 50 lines in under 3 minutes", "⌚",
     Category::Skill, Rarity::Epic, {StatField::Lines, Comparator::Gte, 50}, {{StatField::TimePlayed, Comparator::Lte, 180}}, std::nullopt,
     "Lightning fast! Your speed is extraordinary!"},
    {"line_clearer", "Line Clearer", "Clear 500 total lines across all games", "📊",
     Category::Skill, Rarity::Rare, {StatField::TotalLines, Comparator::Gte, 500}, {}, std::nullopt,
     "Half a thousand lines cleared! You're becoming a legend!"},
    {"line_destroyer", "Line Destroyer", "Clear 1000 total lines", "💥",
     Category::Skill, Rarity::Epic, {StatField::TotalLines, Comparator::Gte, 1000}, {}, "line_clearer",
     "One thousand lines! You're a destruction machine!"},

    // =============================
    // プレイ回数
    // =============================
    {"practice_makes_perfect", "Practice Makes Perfect", "Play 10 games", "🎮",
     Category::Special, Rarity::Common, {StatField::GamesPlayed, Comparator::Gte, 10}, {}, std::nullopt,
     "Ten games played! You're dedicated!"},
    {"persistent", "Persistent Player", "Play 25 games", "🏃‍♂️",
     Category::Special, Rarity::Rare, {StatField::GamesPlayed, Comparator::Gte, 25}, {}, "practice_makes_perfect",
     "Twenty-five games! You never give up!"},
    {"dedicated", "Dedicated Gamer", "Play 50 games", "🎯",
     Category::Special, Rarity::Epic, {StatField::GamesPlayed, Comparator::Gte, 50}, {}, "persistent",
     "Fifty games! True dedication!"},
    {"obsessed", "Tetris Obsessed", "Play 100 games", "🤯",
     Category::Special, Rarity::Legendary, {StatField::GamesPlayed, Comparator::Gte, 100}, {}, "dedicated",
     "One hundred games! You might have a problem... we love it!"},

    };
}
// clang-format on

}  // namespace

const std::vector<Achievement>& default_catalog() {
    static const std::vector<Achievement> catalog = build_catalog();
    return catalog;
}

const Achievement* find_in(const std::vector<Achievement>& catalog, std::string_view id) noexcept {
    auto it = std::find_if(catalog.begin(), catalog.end(),
                           [id](const Achievement& a) { return a.id == id; });
    return it == catalog.end() ? nullptr : &*it;
}

std::vector<const Achievement*> by_category(const std::vector<Achievement>& catalog,
                                            Category category) {
    std::vector<const Achievement*> out;
    for (const auto& a : catalog) {
        if (a.category == category) out.push_back(&a);
    }
    return out;
}

std::vector<const Achievement*> by_rarity(const std::vector<Achievement>& catalog, Rarity rarity) {
    std::vector<const Achievement*> out;
    for (const auto& a : catalog) {
        if (a.rarity == rarity) out.push_back(&a);
    }
    return out;
}

tl::expected<void, std::string> validate(const std::vector<Achievement>& catalog) {
    std::unordered_map<std::string_view, const Achievement*> by_id;
    for (const auto& a : catalog) {
        if (a.id.empty()) {
            return tl::make_unexpected(std::string{"achievement with empty id"});
        }
        if (!by_id.emplace(a.id, &a).second) {
            return tl::make_unexpected("duplicate achievement id: " + std::string{a.id});
        }
        if (a.condition.value < 0) {
            return tl::make_unexpected("negative threshold: " + std::string{a.id});
        }
    }

    for (const auto& a : catalog) {
        if (a.requires_id && !by_id.contains(*a.requires_id)) {
            return tl::make_unexpected("unknown prerequisite '" + std::string{*a.requires_id} +
                                       "' for " + std::string{a.id});
        }
    }

    // 前提を辿って同じ ID に戻れば循環
    for (const auto& a : catalog) {
        std::unordered_set<std::string_view> seen{a.id};
        std::optional<std::string_view> cur = a.requires_id;
        while (cur) {
            if (!seen.insert(*cur).second) {
                return tl::make_unexpected("prerequisite cycle through " + std::string{a.id});
            }
            cur = by_id.at(*cur)->requires_id;
        }
    }
    return {};
}

}  // namespace tetrys::achievement
