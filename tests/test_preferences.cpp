// tests/test_preferences.cpp

#include <gtest/gtest.h>

#include <limits>
#include <string>

#include "core/KeyValueStore.hpp"
#include "userImpl/Preferences.hpp"

using tetrys::global_setting::Difficulty;
using tetrys::preferences::DIFFICULTY_KEY;
using tetrys::preferences::SPEED_KEY;
using tetrys::storage::MemoryStore;

// ------------------------------------------------------------
// 1. 保存値が無ければ既定値
// ------------------------------------------------------------
TEST(Preferences, DefaultsWhenNothingStored) {
    MemoryStore store;
    const auto prefs = tetrys::preferences::load_preferences(store);
    EXPECT_DOUBLE_EQ(prefs.speedMultiplier, 1.0);
    EXPECT_EQ(prefs.difficulty, Difficulty::Normal);
}

// ------------------------------------------------------------
// 2. 範囲外・解釈不能・未知の値は既定値に戻す
// ------------------------------------------------------------
TEST(Preferences, InvalidValuesFallBack) {
    MemoryStore store;
    for (const char* bad : {"0.2", "3.5", "fast", "", "1.5x", "nan"}) {
        ASSERT_TRUE(store.set(SPEED_KEY, bad));
        EXPECT_DOUBLE_EQ(tetrys::preferences::load_preferences(store).speedMultiplier, 1.0)
            << "stored speed: '" << bad << "'";
    }

    ASSERT_TRUE(store.set(DIFFICULTY_KEY, "nightmare"));
    EXPECT_EQ(tetrys::preferences::load_preferences(store).difficulty, Difficulty::Normal);

    store.fail_reads(true);
    const auto prefs = tetrys::preferences::load_preferences(store);
    EXPECT_DOUBLE_EQ(prefs.speedMultiplier, 1.0);
    EXPECT_EQ(prefs.difficulty, Difficulty::Normal);
}

// ------------------------------------------------------------
// 3. 保存と再読み込み
// ------------------------------------------------------------
TEST(Preferences, SaveAndReload) {
    MemoryStore store;
    auto saved = tetrys::preferences::save_speed(store, 2.5);
    ASSERT_TRUE(saved.has_value());
    EXPECT_DOUBLE_EQ(*saved, 2.5);
    ASSERT_TRUE(tetrys::preferences::save_difficulty(store, Difficulty::Hard));

    EXPECT_EQ(store.get(SPEED_KEY).value(), std::optional<std::string>{"2.5"});
    EXPECT_EQ(store.get(DIFFICULTY_KEY).value(), std::optional<std::string>{"hard"});

    const auto prefs = tetrys::preferences::load_preferences(store);
    EXPECT_DOUBLE_EQ(prefs.speedMultiplier, 2.5);
    EXPECT_EQ(prefs.difficulty, Difficulty::Hard);
}

TEST(Preferences, SaveSpeedClampsAndRejectsNonFinite) {
    MemoryStore store;
    EXPECT_DOUBLE_EQ(tetrys::preferences::save_speed(store, 9.0).value(), 3.0);
    EXPECT_EQ(store.get(SPEED_KEY).value(), std::optional<std::string>{"3"});
    EXPECT_DOUBLE_EQ(tetrys::preferences::save_speed(store, 0.0).value(), 0.5);

    EXPECT_FALSE(
        tetrys::preferences::save_speed(store, std::numeric_limits<double>::infinity()).has_value());
    EXPECT_EQ(store.get(SPEED_KEY).value(), std::optional<std::string>{"0.5"});

    store.fail_writes(true);
    EXPECT_FALSE(tetrys::preferences::save_speed(store, 1.0).has_value());
}

// ------------------------------------------------------------
// 4. 難易度プリセット
// ------------------------------------------------------------
TEST(GlobalSetting, DifficultyPresets) {
    using tetrys::global_setting::GlobalSetting;
    const GlobalSetting easy{Difficulty::Easy};
    EXPECT_EQ(easy.linesPerLevel, 15);
    EXPECT_DOUBLE_EQ(easy.scoreMultiplier, 0.75);
    EXPECT_DOUBLE_EQ(easy.speedFactor, 0.7);

    const GlobalSetting normal{};
    EXPECT_EQ(normal.linesPerLevel, 10);
    EXPECT_EQ(normal.gridColumns, 10);
    EXPECT_EQ(normal.gridRows, 20);
    EXPECT_EQ(normal.maxPendingNotifications, 50u);

    EXPECT_EQ(tetrys::global_setting::parse_difficulty("hard"), Difficulty::Hard);
    EXPECT_FALSE(tetrys::global_setting::parse_difficulty("HARD").has_value());
    EXPECT_EQ(tetrys::global_setting::to_string(Difficulty::Easy), "easy");
}
