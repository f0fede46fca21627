#ifndef TETRYS_USERIMPL_SESSION_HPP
#define TETRYS_USERIMPL_SESSION_HPP

#include "core/Clock.hpp"
#include "core/KeyValueStore.hpp"
#include "userImpl/Achievements.hpp"
#include "userImpl/GameEvents.hpp"
#include "userImpl/GameKey.hpp"
#include "userImpl/GlobalSetting.hpp"
#include "userImpl/TetrisRule.hpp"

#include <memory>
#include <optional>
#include <string>
#include <tl/expected.hpp>
#include <vector>

namespace tetrys::session {

using global_setting::GlobalSetting;

/**
 * @brief 1プレイヤー分のゲーム文脈
 *
 * バス・Engine・AchievementEngine を1つずつ所有する。
 * 別の Session と状態を共有することはない。
 */
class Session {
   public:
    [[nodiscard]] static tl::expected<std::unique_ptr<Session>, std::string> create(
        GlobalSetting setting, storage::KeyValueStore& store, const clock::Clock& clock,
        const std::vector<achievement::Achievement>& catalog = achievement::default_catalog(),
        achievement::AchievementEngine::WallClock wall_clock = {});

    ~Session();
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // 入力(プレゼンテーション層から)
    void start() { engine_->start(); }
    bool move(int dx, int dy) { return engine_->move(dx, dy); }
    bool rotate() { return engine_->rotate(); }
    bool hard_drop() { return engine_->hard_drop(); }
    bool toggle_pause() { return engine_->toggle_pause(); }
    void reset() { engine_->reset(); }
    void tick() { engine_->tick(); }

    // 倍率を丸めて Engine に反映し、設定として保存する
    void set_speed_multiplier(double value);

    // 抽象キーを Engine の操作に変換する。QUIT と未受理の操作は false
    bool press(game_key::GameKey key);

    [[nodiscard]] const GlobalSetting& setting() const noexcept { return setting_; }
    [[nodiscard]] game_bus::GameBus& bus() noexcept { return bus_; }
    [[nodiscard]] tetris_rule::Engine& engine() noexcept { return *engine_; }
    [[nodiscard]] const tetris_rule::Engine& engine() const noexcept { return *engine_; }
    [[nodiscard]] achievement::AchievementEngine& achievements() noexcept { return *achievements_; }
    [[nodiscard]] const achievement::AchievementEngine& achievements() const noexcept {
        return *achievements_;
    }

   private:
    Session(GlobalSetting setting, storage::KeyValueStore& store);

    const GlobalSetting setting_;
    storage::KeyValueStore* store_;
    game_bus::GameBus bus_;
    std::optional<tetris_rule::Engine> engine_;
    std::unique_ptr<achievement::AchievementEngine> achievements_;
    std::optional<game_bus::GameBus::SubscriptionId> debug_subscription_;
};

}  // namespace tetrys::session

#endif /* TETRYS_USERIMPL_SESSION_HPP */
