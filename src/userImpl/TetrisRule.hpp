#ifndef TETRYS_USERIMPL_TETRIS_RULE_HPP
#define TETRYS_USERIMPL_TETRIS_RULE_HPP

#include "core/Clock.hpp"
#include "core/Command.hpp"
#include "userImpl/GameEvents.hpp"
#include "userImpl/GlobalSetting.hpp"
#include "userImpl/PieceQueue.hpp"
#include "userImpl/Tetrimino.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <tl/expected.hpp>
#include <vector>

namespace tetrys::tetris_rule {

// =============================
// エイリアス
// =============================
using global_setting::GlobalSetting;

enum class Status { NotStarted, Playing, Paused, GameOver };

[[nodiscard]] constexpr const char* to_string(Status s) noexcept {
    switch (s) {
        case Status::NotStarted:
            return "NotStarted";
        case Status::Playing:
            return "Playing";
        case Status::Paused:
            return "Paused";
        case Status::GameOver:
            return "GameOver";
    }
    return "?";
}

// 1..4 ライン同時消去の基本点
inline constexpr std::array<std::int64_t, 5> BASE_SCORE_TABLE{0, 100, 300, 500, 800};

// =============================
// ECS コンポーネント／リソース
// =============================

/**
 * @brief 位置コンポーネント(セル単位、占有行列の左上)
 */
struct Position {
    int x{}, y{};
};

/**
 * @brief 操作対象のテトリミノ
 * @param serial ゲーム開始から何個目のピースか
 */
struct ActivePiece {
    std::uint32_t serial{0};
};

/**
 * @brief テトリミノのメタ情報
 * @param type テトリミノ種別
 * @param rotation 回転テーブル上の添字
 */
struct TetriminoMeta {
    PieceType type{};
    int rotation{0};
};

/**
 * @brief 移動リクエスト(セル単位)
 */
struct MoveIntent {
    int dx{0};
    int dy{0};
};

// 回転リクエスト(時計回りに1段)
struct RotateIntent {
    int steps{1};
};

// 直前のリクエストが受理されたか
struct IntentOutcome {
    bool accepted{false};
};

// 重力で下に動けなかったピースに付く
struct LockRequest {
    std::uint64_t at_ms{0};
};

// 今回のステップで固定が起きた(Grid シングルトンに付く)
struct Locked {
    int pieces{0};
};

// 今回の固定で消えた行数(Grid シングルトンに付く)
struct ClearedRows {
    int count{0};
};

// 盤面占有
enum class CellStatus : std::uint8_t { Empty, Filled };

// グリッド情報＋占有
struct GridResource {
    int rows{};
    int cols{};
    // occ[index] == Filled のときのみ参照する
    std::vector<PieceType> occ_type;  // row-major, same size as occ
    std::vector<CellStatus> occ;      // row-major

    [[nodiscard]] inline int index(int row, int column) const noexcept {
        return row * cols + column;
    }
    [[nodiscard]] inline bool in_bounds(int row, int column) const noexcept {
        return 0 <= row && row < rows && 0 <= column && column < cols;
    }
    [[nodiscard]] inline bool filled(int row, int column) const noexcept {
        return occ[index(row, column)] == CellStatus::Filled;
    }
};

// ctx: 得点系カウンタ
struct ScoreBoard {
    std::int64_t score{0};
    std::int64_t level{1};
    std::int64_t lines{0};
    std::int64_t tetrisCount{0};
    std::int64_t combo{0};
};

/**
 * @brief ctx: 時間管理(ミリ秒は Clock の値)
 * @param startMs ゲーム開始時刻
 * @param pausedTotalMs これまでの一時停止の合計
 * @param pauseStartMs 現在の一時停止の開始時刻
 * @param lastFallMs 最後に重力判定をした時刻
 * @param timePlayed 一時停止を除いたプレイ秒数
 */
struct GameClock {
    std::uint64_t startMs{0};
    std::uint64_t pausedTotalMs{0};
    std::uint64_t pauseStartMs{0};
    std::uint64_t lastFallMs{0};
    std::int64_t timePlayed{0};
};

// ctx: 状態フラグ
struct GameFlags {
    Status status{Status::NotStarted};
    double speedMultiplier{1.0};
    std::uint32_t spawned{0};
};

// ctx: 操作の終わりにバスへ流すイベント
struct PendingEvents {
    std::vector<game_bus::GameEvent> events;
};

/**
 * @brief ワールドハンドル
 * @param registry ECS レジストリ
 * @param grid_singleton グリッドリソースエンティティ
 */
struct World {
    std::shared_ptr<entt::registry> registry;
    entt::entity grid_singleton{entt::null};
};

/**
 * @brief 共通リソース
 * @param setting 設定
 * @param grid_e グリッドリソースエンティティ
 * @param now_ms 現在時刻
 */
struct TetrisResources {
    const GlobalSetting& setting;
    entt::entity grid_e{entt::null};
    std::uint64_t now_ms{0};
};

// =============================
// 純粋ヘルパ
// =============================

// 全セルが盤面内かつ空きマスならば置ける
[[nodiscard]] bool can_place(const GridResource& grid, PieceType type, int rotation, int x, int y);

// スポーン位置: 横中央、最上段、回転 0
[[nodiscard]] Position spawn_position(const GridResource& grid, PieceType type);

// 重力の間隔(ミリ秒)
[[nodiscard]] std::uint64_t fall_interval_ms(const GlobalSetting& setting, std::int64_t level,
                                             double speed_multiplier);

// k 行同時消去の得点
[[nodiscard]] std::int64_t score_for_lines(const GlobalSetting& setting, int cleared,
                                           std::int64_t level);

[[nodiscard]] std::int64_t level_for_lines(const GlobalSetting& setting, std::int64_t lines);

// 満杯の行を消して上を詰める。消した行数を返す
int clear_full_rows(GridResource& grid);

// =============================
// ワールド
// =============================

[[nodiscard]] tl::expected<World, std::string> make_world(const GlobalSetting& setting);

// 盤面と得点を初期化する(PieceQueue の乱数状態と速度倍率は引き継ぐ)
void reset_world(World& w, const GlobalSetting& setting);

// 1ステップ(時間・重力・固定・消去・得点・スポーン・ゲームオーバー)
void step_world(const World& w, const GlobalSetting& setting, std::uint64_t now_ms);

[[nodiscard]] std::optional<entt::entity> active_entity(const World& w);

// =============================
// Engine
// =============================

struct ActivePieceView {
    PieceType type{};
    int rotation{0};
    int x{0};
    int y{0};
};

/**
 * @brief 盤面とピースの状態機械
 *
 * 全操作は呼び出し元のスレッドで同期的に完了し、
 * 操作中に発生したイベントは戻る前に発生順でバスへ流す。
 */
class Engine {
   public:
    [[nodiscard]] static tl::expected<Engine, std::string> create(const GlobalSetting& setting,
                                                                  game_bus::GameBus& bus,
                                                                  const clock::Clock& clock);

    // 盤面を空にして Playing へ(どの状態からでも成功する)
    void start();
    bool move(int dx, int dy);
    bool rotate();
    // 下へ動けなくなるまで move(0, +1)。1段でも落ちれば true
    bool hard_drop();
    bool pause();
    bool resume();
    bool toggle_pause();
    // NotStarted に戻す(自動では開始しない)
    void reset();
    // 外部クロックから周期的に呼ぶ
    void tick();
    void set_speed_multiplier(double value);

    [[nodiscard]] Status status() const;
    [[nodiscard]] const ScoreBoard& score_board() const;
    [[nodiscard]] std::int64_t time_played() const;
    [[nodiscard]] double speed_multiplier() const;
    [[nodiscard]] std::uint64_t current_fall_interval_ms() const;
    [[nodiscard]] std::optional<ActivePieceView> active_piece() const;
    [[nodiscard]] std::optional<PieceType> next_piece() const;
    [[nodiscard]] std::optional<PieceType> cell(int row, int col) const;

    [[nodiscard]] World& world() noexcept { return world_; }
    [[nodiscard]] const World& world() const noexcept { return world_; }

   private:
    Engine(const GlobalSetting& setting, game_bus::GameBus& bus, const clock::Clock& clock,
           World world);

    bool submit_move(int dx, int dy);
    void refresh_time_played(bool force_tick);
    void push_event(game_bus::GameEvent ev);
    void flush_events();

    const GlobalSetting* setting_;
    game_bus::GameBus* bus_;
    const clock::Clock* clock_;
    World world_;
};

}  // namespace tetrys::tetris_rule

#endif /* TETRYS_USERIMPL_TETRIS_RULE_HPP */
