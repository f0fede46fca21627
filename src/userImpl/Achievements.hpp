#ifndef TETRYS_USERIMPL_ACHIEVEMENTS_HPP
#define TETRYS_USERIMPL_ACHIEVEMENTS_HPP

#include "core/KeyValueStore.hpp"
#include "userImpl/AchievementCatalog.hpp"
#include "userImpl/AchievementTypes.hpp"
#include "userImpl/GameEvents.hpp"
#include "userImpl/GlobalSetting.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tetrys::achievement {

using global_setting::GlobalSetting;

/**
 * @brief 実績の解除判定・通知キュー・永続化を持つルールエンジン
 *
 * 生成時にバスを購読し、ゲームイベントごとに集計を更新して連鎖評価する。
 * 解除集合と通知キューはこのクラスの公開操作からのみ変更される。
 */
class AchievementEngine {
   public:
    using WallClock = std::function<std::int64_t()>;

    AchievementEngine(const GlobalSetting& setting, storage::KeyValueStore& store,
                      game_bus::GameBus& bus,
                      const std::vector<Achievement>& catalog = default_catalog(),
                      WallClock wall_clock = {});
    ~AchievementEngine();

    AchievementEngine(const AchievementEngine&) = delete;
    AchievementEngine& operator=(const AchievementEngine&) = delete;

    // ストアから解除記録とセッション統計を読み込む。壊れていれば既定値
    void load();

    [[nodiscard]] bool is_unlocked(std::string_view id) const;

    // 新たに解除したときだけ true
    bool unlock(std::string_view id, std::optional<GameStatsSnapshot> snapshot = std::nullopt);

    // 1パス評価。前提はパス開始時の解除集合で判定する。新規解除数を返す
    std::size_t check_achievements(const StatsInput& stats);

    // 新規解除が無くなるか上限パス数に達するまで check_achievements を繰り返す
    std::size_t check_until_stable(const StatsInput& stats);

    [[nodiscard]] Progress get_progress(std::string_view id, std::int64_t current) const;

    // 最も古い通知を取り出す。空なら nullptr
    [[nodiscard]] const Achievement* next_notification();
    void clear_notifications();
    [[nodiscard]] std::size_t pending_count() const noexcept { return notifications_.size(); }

    void reset_all();

    [[nodiscard]] const std::vector<UnlockedAchievement>& unlocked_achievements() const noexcept {
        return records_;
    }
    [[nodiscard]] std::vector<const Achievement*> locked_achievements() const;
    [[nodiscard]] Summary summary() const;

    [[nodiscard]] const SessionStats& session_stats() const noexcept { return session_; }
    void update_session_stats(const SessionStatsPatch& patch);

    [[nodiscard]] const EventDrivenStats& tally() const noexcept { return tally_; }

    // 直近の保存失敗(成功すると消える)
    [[nodiscard]] const std::optional<std::string>& save_error() const noexcept {
        return save_error_;
    }
    void clear_save_error() noexcept { save_error_.reset(); }

    [[nodiscard]] const std::vector<Achievement>& catalog() const noexcept { return *catalog_; }

    // バス購読のハンドラ本体
    void handle(const game_bus::GameEvent& ev);

   private:
    [[nodiscard]] StatsInput stats_from_tally() const;
    void enqueue_notification(const Achievement& a);
    void save_all();
    void save_session_stats();
    void record_save_result(const storage::WriteResult& result);

    const GlobalSetting* setting_;
    storage::KeyValueStore* store_;
    game_bus::GameBus* bus_;
    const std::vector<Achievement>* catalog_;
    WallClock wall_clock_;
    game_bus::GameBus::SubscriptionId subscription_{0};

    std::vector<UnlockedAchievement> records_;
    std::set<std::string, std::less<>> unlocked_ids_;
    std::deque<const Achievement*> notifications_;
    EventDrivenStats tally_;
    SessionStats session_;
    std::optional<std::string> save_error_;
};

}  // namespace tetrys::achievement

#endif /* TETRYS_USERIMPL_ACHIEVEMENTS_HPP */
