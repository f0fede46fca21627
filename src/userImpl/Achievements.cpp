#include "userImpl/Achievements.hpp"

#include "core/Clock.hpp"
#include "userImpl/AchievementCodec.hpp"

#include <SDL2/SDL_log.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <variant>

namespace tetrys::achievement {

namespace {

// =============================
// イベント → 集計
// =============================

/**
 * @brief 1イベントを集計に反映した結果
 * @param counted 連鎖評価の対象になるイベントか
 * @param persist_session セッション統計を保存するか
 */
struct TallyEffect {
    bool counted{false};
    bool persist_session{false};
};

TallyEffect apply(EventDrivenStats& t, SessionStats& s, const game_bus::GameStarted&) {
    t = EventDrivenStats{};
    s.linesCleared = 0;
    return {true, true};
}

TallyEffect apply(EventDrivenStats& t, SessionStats& s, const game_bus::LinesCleared& e) {
    t.lines = e.newTotal;
    t.level = e.newLevel;
    if (e.isTetris) {
        ++t.tetrisCount;
        ++s.tetrisCount;
    }
    s.linesCleared += e.count;
    s.totalLines += e.count;
    return {true, false};
}

TallyEffect apply(EventDrivenStats& t, SessionStats&, const game_bus::ScoreUpdated& e) {
    t.score = e.score;
    t.level = e.level;
    return {true, false};
}

TallyEffect apply(EventDrivenStats& t, SessionStats&, const game_bus::LevelUp& e) {
    t.level = e.level;
    return {true, false};
}

TallyEffect apply(EventDrivenStats& t, SessionStats& s, const game_bus::ComboUpdated& e) {
    t.combo = e.combo;
    s.maxCombo = std::max(s.maxCombo, e.combo);
    return {true, false};
}

TallyEffect apply(EventDrivenStats& t, SessionStats&, const game_bus::TimeTick& e) {
    t.timePlayed = e.timePlayed;
    return {true, false};
}

TallyEffect apply(EventDrivenStats& t, SessionStats& s, const game_bus::GameOver& e) {
    t.score = e.score;
    t.level = e.level;
    t.lines = e.lines;
    t.tetrisCount = e.tetrisCount;
    t.timePlayed = e.timePlayed;
    ++s.gamesPlayed;
    s.timePlayed += std::max<std::int64_t>(0, e.timePlayed);
    return {true, true};
}

// 集計に関係しないイベント
template <class E>
TallyEffect apply(EventDrivenStats&, SessionStats&, const E&) {
    return {};
}

std::optional<std::int64_t> clamp_non_negative(std::optional<std::int64_t> v) {
    if (v && *v < 0) return 0;
    return v;
}

StatsInput clamped(const StatsInput& in) {
    return StatsInput{clamp_non_negative(in.score),       clamp_non_negative(in.level),
                      clamp_non_negative(in.lines),       clamp_non_negative(in.tetrisCount),
                      clamp_non_negative(in.combo),       clamp_non_negative(in.timePlayed),
                      clamp_non_negative(in.gamesPlayed), clamp_non_negative(in.totalLines)};
}

bool conditions_hold(const Achievement& a, const StatsInput& stats) {
    const auto primary = stats.value(a.condition.field);
    if (!primary || !holds(a.condition.op, *primary, a.condition.value)) return false;
    return std::all_of(a.additional.begin(), a.additional.end(), [&](const Condition& c) {
        const auto v = stats.value(c.field);
        return v && holds(c.op, *v, c.value);
    });
}

}  // namespace

// =============================
// 構築・購読
// =============================

AchievementEngine::AchievementEngine(const GlobalSetting& setting, storage::KeyValueStore& store,
                                     game_bus::GameBus& bus,
                                     const std::vector<Achievement>& catalog, WallClock wall_clock)
    : setting_(&setting),
      store_(&store),
      bus_(&bus),
      catalog_(&catalog),
      wall_clock_(wall_clock ? std::move(wall_clock) : WallClock{&clock::wall_clock_ms}) {
    subscription_ = bus_->subscribe([this](const game_bus::GameEvent& ev) { handle(ev); });
}

AchievementEngine::~AchievementEngine() { bus_->unsubscribe(subscription_); }

void AchievementEngine::handle(const game_bus::GameEvent& ev) {
    const TallyEffect effect =
        std::visit([this](const auto& e) { return apply(tally_, session_, e); }, ev);
    if (!effect.counted) return;

    if (effect.persist_session) save_session_stats();
    check_until_stable(stats_from_tally());
}

StatsInput AchievementEngine::stats_from_tally() const {
    return StatsInput{tally_.score,       tally_.level,       tally_.lines,
                      tally_.tetrisCount, tally_.combo,       tally_.timePlayed,
                      session_.gamesPlayed, session_.totalLines};
}

// =============================
// 読み込み
// =============================

void AchievementEngine::load() {
    if (auto raw = store_->get(codec::UNLOCKED_KEY); !raw) {
        // 読めなければ手元の状態を保持する
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "achievement load failed: %s",
                     raw.error().c_str());
    } else if (!raw->has_value()) {
        records_.clear();
        unlocked_ids_.clear();
    } else if (auto decoded = codec::decode_unlocked(**raw, *catalog_); !decoded) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "stored achievements are malformed, starting empty: %s",
                    decoded.error().c_str());
        records_.clear();
        unlocked_ids_.clear();
    } else {
        for (const auto& why : decoded->skipped) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "skipped stored achievement %s",
                        why.c_str());
        }
        records_ = std::move(decoded->records);
        unlocked_ids_.clear();
        for (const auto& rec : records_) unlocked_ids_.insert(rec.achievementId);
    }

    if (auto raw = store_->get(codec::SESSION_STATS_KEY); !raw) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "session stats load failed: %s",
                     raw.error().c_str());
    } else if (!raw->has_value()) {
        session_ = SessionStats{};
    } else if (auto decoded = codec::decode_session_stats(**raw); !decoded) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "stored session stats are malformed, using defaults: %s",
                    decoded.error().c_str());
        session_ = SessionStats{};
    } else {
        session_ = *decoded;
    }
}

// =============================
// 解除
// =============================

bool AchievementEngine::is_unlocked(std::string_view id) const {
    return unlocked_ids_.find(id) != unlocked_ids_.end();
}

bool AchievementEngine::unlock(std::string_view id, std::optional<GameStatsSnapshot> snapshot) {
    if (is_unlocked(id)) return false;
    const Achievement* a = find_in(*catalog_, id);
    if (!a) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "unlock: unknown achievement '%.*s'",
                    static_cast<int>(id.size()), id.data());
        return false;
    }

    const std::int64_t now = wall_clock_();
    records_.push_back(UnlockedAchievement{std::string{a->id}, now, snapshot});
    unlocked_ids_.insert(std::string{a->id});
    enqueue_notification(*a);

    SDL_Log("achievement unlocked: %.*s (%.*s)", static_cast<int>(a->name.size()),
            a->name.data(), static_cast<int>(to_string(a->rarity).size()),
            to_string(a->rarity).data());
    save_all();

    bus_->emit(game_bus::AchievementUnlocked{std::string{a->id}, a->rarity, now});
    return true;
}

std::size_t AchievementEngine::check_achievements(const StatsInput& raw) {
    const StatsInput stats = clamped(raw);
    // 前提判定用のパス開始時スナップショット
    const std::set<std::string, std::less<>> before = unlocked_ids_;

    std::size_t unlocked = 0;
    for (const auto& a : *catalog_) {
        if (is_unlocked(a.id)) continue;
        if (a.requires_id && before.find(*a.requires_id) == before.end()) continue;
        if (!conditions_hold(a, stats)) continue;

        const GameStatsSnapshot snap{stats.score.value_or(0), stats.level.value_or(0),
                                     stats.lines.value_or(0)};
        if (unlock(a.id, snap)) ++unlocked;
    }
    return unlocked;
}

std::size_t AchievementEngine::check_until_stable(const StatsInput& stats) {
    const std::size_t limit =
        setting_->cascadePassLimit > 0 ? setting_->cascadePassLimit : catalog_->size();

    std::size_t total = 0;
    for (std::size_t pass = 0; pass < limit; ++pass) {
        const std::size_t n = check_achievements(stats);
        if (n == 0) break;
        total += n;
    }
    return total;
}

// =============================
// 進捗・通知
// =============================

Progress AchievementEngine::get_progress(std::string_view id, std::int64_t current) const {
    const Achievement* a = find_in(*catalog_, id);
    if (!a || a->condition.value <= 0) {
        return Progress{std::string{id}, 0, 0, 0};
    }
    const std::int64_t cur = std::max<std::int64_t>(0, current);
    const std::int64_t target = a->condition.value;
    const double ratio = static_cast<double>(cur) / static_cast<double>(target) * 100.0;
    return Progress{std::string{id}, cur, target,
                    static_cast<int>(std::lround(std::min(ratio, 100.0)))};
}

void AchievementEngine::enqueue_notification(const Achievement& a) {
    if (notifications_.size() >= setting_->maxPendingNotifications && !notifications_.empty()) {
        const Achievement* dropped = notifications_.front();
        notifications_.pop_front();
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "notification queue full (%zu), dropped %.*s",
                    setting_->maxPendingNotifications, static_cast<int>(dropped->id.size()),
                    dropped->id.data());
    }
    if (setting_->maxPendingNotifications == 0) return;
    notifications_.push_back(&a);
}

const Achievement* AchievementEngine::next_notification() {
    if (notifications_.empty()) return nullptr;
    const Achievement* a = notifications_.front();
    notifications_.pop_front();
    return a;
}

void AchievementEngine::clear_notifications() { notifications_.clear(); }

// =============================
// 照会
// =============================

std::vector<const Achievement*> AchievementEngine::locked_achievements() const {
    std::vector<const Achievement*> out;
    for (const auto& a : *catalog_) {
        if (!is_unlocked(a.id)) out.push_back(&a);
    }
    return out;
}

Summary AchievementEngine::summary() const {
    Summary s;
    s.totalAchievements = catalog_->size();
    s.unlockedCount = records_.size();
    if (s.totalAchievements > 0) {
        s.percentage = static_cast<int>(std::lround(static_cast<double>(s.unlockedCount) * 100.0 /
                                                    static_cast<double>(s.totalAchievements)));
    }

    // 新しい順。同時刻は後に記録された方を先に
    std::vector<std::size_t> order(records_.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [this](std::size_t l, std::size_t r) {
        if (records_[l].unlockedAt != records_[r].unlockedAt) {
            return records_[l].unlockedAt > records_[r].unlockedAt;
        }
        return l > r;
    });
    for (std::size_t i = 0; i < order.size() && i < 5; ++i) {
        s.recentUnlocks.push_back(records_[order[i]]);
    }
    return s;
}

void AchievementEngine::update_session_stats(const SessionStatsPatch& patch) {
    const auto put = [](std::int64_t& dst, const std::optional<std::int64_t>& v) {
        if (v) dst = std::max<std::int64_t>(0, *v);
    };
    put(session_.linesCleared, patch.linesCleared);
    put(session_.tetrisCount, patch.tetrisCount);
    put(session_.maxCombo, patch.maxCombo);
    put(session_.gamesPlayed, patch.gamesPlayed);
    put(session_.totalLines, patch.totalLines);
    put(session_.timePlayed, patch.timePlayed);
    save_session_stats();
}

void AchievementEngine::reset_all() {
    records_.clear();
    unlocked_ids_.clear();
    notifications_.clear();
    tally_ = EventDrivenStats{};
    session_ = SessionStats{};
    SDL_Log("achievements reset");
    save_all();
}

// =============================
// 保存
// =============================

void AchievementEngine::record_save_result(const storage::WriteResult& result) {
    if (result) return;
    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "achievement save failed: %s",
                result.error().c_str());
    save_error_ = result.error();
}

void AchievementEngine::save_session_stats() {
    auto text = codec::encode_session_stats(session_);
    if (!text) {
        record_save_result(tl::make_unexpected(text.error()));
        return;
    }
    const auto result = store_->set(codec::SESSION_STATS_KEY, std::move(*text));
    record_save_result(result);
    if (result) save_error_.reset();
}

void AchievementEngine::save_all() {
    auto text = codec::encode_unlocked(records_);
    if (!text) {
        record_save_result(tl::make_unexpected(text.error()));
        return;
    }
    const auto result = store_->set(codec::UNLOCKED_KEY, std::move(*text));
    record_save_result(result);
    if (!result) return;
    save_session_stats();
}

}  // namespace tetrys::achievement
