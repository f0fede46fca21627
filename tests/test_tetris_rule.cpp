// tests/test_tetris_rule.cpp

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <string_view>
#include <vector>

#include "core/Clock.hpp"
#include "userImpl/GameEvents.hpp"
#include "userImpl/GlobalSetting.hpp"
#include "userImpl/TetrisRule.hpp"

using tetrys::PieceType;
using tetrys::clock::ManualClock;
using tetrys::game_bus::GameBus;
using tetrys::game_bus::GameEvent;
using tetrys::global_setting::Difficulty;
using tetrys::global_setting::GlobalSetting;
using tetrys::tetris_rule::CellStatus;
using tetrys::tetris_rule::Engine;
using tetrys::tetris_rule::GridResource;
using tetrys::tetris_rule::Position;
using tetrys::tetris_rule::ScoreBoard;
using tetrys::tetris_rule::Status;
using tetrys::tetris_rule::TetriminoMeta;

// Engine とバスの購読をまとめたテスト用ハーネス
struct Harness {
    GlobalSetting setting;
    GameBus bus;
    ManualClock clock{1000};
    std::vector<GameEvent> events;
    std::optional<Engine> engine;

    explicit Harness(GlobalSetting s = GlobalSetting{Difficulty::Normal, 42}) : setting(s) {
        bus.subscribe([this](const GameEvent& ev) { events.push_back(ev); });
        auto created = Engine::create(setting, bus, clock);
        if (created) engine.emplace(std::move(*created));
    }

    entt::registry& reg() { return *engine->world().registry; }
    GridResource& grid() { return reg().get<GridResource>(engine->world().grid_singleton); }

    // 重力1回分だけ時間を進めて tick
    void step_gravity() {
        clock.advance(engine->current_fall_interval_ms());
        engine->tick();
    }

    // ハードドロップして次の重力ステップで固定させる
    void drop_and_lock() {
        engine->hard_drop();
        step_gravity();
    }

    // アクティブピースを任意の種類・向き・位置に置き換える
    void place_active(PieceType type, int rotation, int x, int y) {
        const auto e = tetrys::tetris_rule::active_entity(engine->world());
        ASSERT_TRUE(e.has_value());
        reg().replace<TetriminoMeta>(*e, TetriminoMeta{type, rotation});
        reg().replace<Position>(*e, Position{x, y});
    }

    void fill(int row, int col) {
        auto& g = grid();
        g.occ[g.index(row, col)] = CellStatus::Filled;
        g.occ_type[g.index(row, col)] = PieceType::O;
    }

    // row を except_col 以外すべて埋める
    void fill_row_except(int row, int except_col) {
        for (int c = 0; c < grid().cols; ++c) {
            if (c != except_col) fill(row, c);
        }
    }

    // time:tick を除いたイベント名の列
    std::vector<std::string_view> names() const {
        std::vector<std::string_view> out;
        for (const auto& ev : events) {
            if (std::holds_alternative<tetrys::game_bus::TimeTick>(ev)) continue;
            out.push_back(tetrys::game_bus::event_name(ev));
        }
        return out;
    }

    template <class T>
    std::vector<T> of() const {
        std::vector<T> out;
        for (const auto& ev : events) {
            if (const auto* p = std::get_if<T>(&ev)) out.push_back(*p);
        }
        return out;
    }
};

// ハードドロップ後のピースの最下段を除いて底の行を埋め、1行だけ消えるようにする
static void prepare_single_clear(Harness& h) {
    h.engine->hard_drop();
    const auto piece = h.engine->active_piece();
    ASSERT_TRUE(piece.has_value());
    const int bottom = h.grid().rows - 1;
    std::vector<bool> covered(static_cast<std::size_t>(h.grid().cols), false);
    for (auto [rr, cc] : tetrys::cells_for(piece->type, piece->rotation)) {
        if (piece->y + rr == bottom) covered[static_cast<std::size_t>(piece->x + cc)] = true;
    }
    for (int c = 0; c < h.grid().cols; ++c) {
        if (!covered[static_cast<std::size_t>(c)]) h.fill(bottom, c);
    }
}

// ------------------------------------------------------------
// 1. clear_full_rows: 満杯の行が消え、上の行が詰められること
// ------------------------------------------------------------
TEST(TetrisRuleHelpers, ClearFullRowsShiftsRowsDown) {
    GridResource grid;
    grid.rows = 4;
    grid.cols = 4;
    grid.occ.assign(16, CellStatus::Empty);
    grid.occ_type.assign(16, PieceType::I);

    // 最下段を満杯、その上の行に1セルだけ
    for (int c = 0; c < 4; ++c) grid.occ[grid.index(3, c)] = CellStatus::Filled;
    grid.occ[grid.index(2, 1)] = CellStatus::Filled;
    grid.occ_type[grid.index(2, 1)] = PieceType::T;

    EXPECT_EQ(tetrys::tetris_rule::clear_full_rows(grid), 1);

    EXPECT_TRUE(grid.filled(3, 1));
    EXPECT_EQ(grid.occ_type[grid.index(3, 1)], PieceType::T);
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 4; ++c) {
            EXPECT_FALSE(grid.filled(r, c)) << "row=" << r << " col=" << c;
        }
    }
}

// ------------------------------------------------------------
// 2. 落下間隔と得点の計算式
// ------------------------------------------------------------
TEST(TetrisRuleHelpers, FallIntervalFollowsLevelAndMultiplier) {
    const GlobalSetting normal{};
    EXPECT_EQ(tetrys::tetris_rule::fall_interval_ms(normal, 1, 1.0), 800u);
    EXPECT_EQ(tetrys::tetris_rule::fall_interval_ms(normal, 5, 1.0), 600u);
    EXPECT_EQ(tetrys::tetris_rule::fall_interval_ms(normal, 1, 2.0), 400u);
    // 倍率適用前の下限 100ms
    EXPECT_EQ(tetrys::tetris_rule::fall_interval_ms(normal, 20, 1.0), 100u);
    // 倍率適用後の下限 50ms
    EXPECT_EQ(tetrys::tetris_rule::fall_interval_ms(normal, 20, 3.0), 50u);
    EXPECT_EQ(tetrys::tetris_rule::fall_interval_ms(normal, 1, 0.5), 1600u);
}

TEST(TetrisRuleHelpers, ScoreAndLevelTables) {
    const GlobalSetting normal{};
    EXPECT_EQ(tetrys::tetris_rule::score_for_lines(normal, 0, 3), 0);
    EXPECT_EQ(tetrys::tetris_rule::score_for_lines(normal, 1, 1), 100);
    EXPECT_EQ(tetrys::tetris_rule::score_for_lines(normal, 2, 2), 600);
    EXPECT_EQ(tetrys::tetris_rule::score_for_lines(normal, 3, 1), 500);
    EXPECT_EQ(tetrys::tetris_rule::score_for_lines(normal, 4, 3), 2400);
    EXPECT_EQ(tetrys::tetris_rule::level_for_lines(normal, 0), 1);
    EXPECT_EQ(tetrys::tetris_rule::level_for_lines(normal, 9), 1);
    EXPECT_EQ(tetrys::tetris_rule::level_for_lines(normal, 10), 2);
    EXPECT_EQ(tetrys::tetris_rule::level_for_lines(normal, 25), 3);

    const GlobalSetting hard{Difficulty::Hard};
    EXPECT_EQ(tetrys::tetris_rule::score_for_lines(hard, 1, 2), 300);
    EXPECT_EQ(tetrys::tetris_rule::level_for_lines(hard, 8), 2);
}

// ------------------------------------------------------------
// 3. make_world: 小さすぎる盤面は拒否
// ------------------------------------------------------------
TEST(TetrisRuleWorld, MakeWorldBuildsEmptyGrid) {
    const GlobalSetting setting{};
    auto w = tetrys::tetris_rule::make_world(setting);
    ASSERT_TRUE(w.has_value());
    const auto& grid = w->registry->get<GridResource>(w->grid_singleton);
    EXPECT_EQ(grid.rows, 20);
    EXPECT_EQ(grid.cols, 10);
    EXPECT_TRUE(std::all_of(grid.occ.begin(), grid.occ.end(),
                            [](CellStatus c) { return c == CellStatus::Empty; }));
    EXPECT_FALSE(tetrys::tetris_rule::active_entity(*w).has_value());
}

// ------------------------------------------------------------
// 4. start: 中央上端に回転 0 でスポーンし、game:started が流れる
// ------------------------------------------------------------
TEST(TetrisRuleEngine, StartSpawnsCenteredPiece) {
    Harness h;
    ASSERT_TRUE(h.engine.has_value());
    EXPECT_EQ(h.engine->status(), Status::NotStarted);

    h.engine->start();
    EXPECT_EQ(h.engine->status(), Status::Playing);

    const auto piece = h.engine->active_piece();
    ASSERT_TRUE(piece.has_value());
    EXPECT_EQ(piece->rotation, 0);
    EXPECT_EQ(piece->y, 0);
    EXPECT_EQ(piece->x, (10 - tetrys::shape_width(piece->type)) / 2);
    EXPECT_TRUE(h.engine->next_piece().has_value());

    ASSERT_FALSE(h.events.empty());
    EXPECT_TRUE(std::holds_alternative<tetrys::game_bus::GameStarted>(h.events.front()));
}

// ------------------------------------------------------------
// 5. move: 盤面外や上方向への移動は拒否され状態は変わらない
// ------------------------------------------------------------
TEST(TetrisRuleEngine, MoveRejectsOutOfBounds) {
    Harness h;
    h.engine->start();
    h.place_active(PieceType::O, 0, 4, 0);

    EXPECT_FALSE(h.engine->move(0, -1));
    EXPECT_EQ(h.engine->active_piece()->y, 0);

    int moves = 0;
    while (h.engine->move(-1, 0)) ++moves;
    EXPECT_EQ(moves, 4);
    EXPECT_EQ(h.engine->active_piece()->x, 0);

    while (h.engine->move(1, 0)) {
    }
    EXPECT_EQ(h.engine->active_piece()->x, 8);
    EXPECT_FALSE(h.engine->move(1, 0));
    EXPECT_EQ(h.engine->active_piece()->x, 8);
}

TEST(TetrisRuleEngine, MoveRejectsLockedCells) {
    Harness h;
    h.engine->start();
    h.place_active(PieceType::O, 0, 4, 0);
    h.fill(1, 3);

    EXPECT_FALSE(h.engine->move(-1, 0));
    EXPECT_EQ(h.engine->active_piece()->x, 4);
    EXPECT_TRUE(h.engine->move(1, 0));
}

TEST(TetrisRuleEngine, InputsRejectedUnlessPlaying) {
    Harness h;
    EXPECT_FALSE(h.engine->move(1, 0));
    EXPECT_FALSE(h.engine->rotate());
    EXPECT_FALSE(h.engine->hard_drop());
    EXPECT_FALSE(h.engine->pause());

    h.engine->start();
    ASSERT_TRUE(h.engine->pause());
    EXPECT_FALSE(h.engine->move(1, 0));
    EXPECT_FALSE(h.engine->rotate());
    EXPECT_FALSE(h.engine->hard_drop());
}

// ------------------------------------------------------------
// 6. rotate: 回転表に従い、置けない向きは拒否(壁蹴りなし)
// ------------------------------------------------------------
TEST(TetrisRuleEngine, RotateCyclesThroughTable) {
    Harness h;
    h.engine->start();
    h.place_active(PieceType::T, 0, 4, 5);

    for (int expected : {1, 2, 3, 0}) {
        EXPECT_TRUE(h.engine->rotate());
        EXPECT_EQ(h.engine->active_piece()->rotation, expected);
    }

    h.place_active(PieceType::O, 0, 4, 5);
    EXPECT_TRUE(h.engine->rotate());
    EXPECT_EQ(h.engine->active_piece()->rotation, 0);
}

TEST(TetrisRuleEngine, RotateRejectedAtWall) {
    Harness h;
    h.engine->start();
    // 縦の I を右端に置くと横向きは盤面外
    h.place_active(PieceType::I, 1, 9, 5);

    EXPECT_FALSE(h.engine->rotate());
    const auto piece = h.engine->active_piece();
    EXPECT_EQ(piece->rotation, 1);
    EXPECT_EQ(piece->x, 9);
    EXPECT_EQ(piece->y, 5);
}

// ------------------------------------------------------------
// 7. hard_drop: 最下段まで落ちるが、固定は次の重力ステップ
// ------------------------------------------------------------
TEST(TetrisRuleEngine, HardDropRestsOnFloor) {
    Harness h;
    h.engine->start();
    h.place_active(PieceType::O, 0, 4, 0);

    EXPECT_TRUE(h.engine->hard_drop());
    EXPECT_EQ(h.engine->active_piece()->y, 18);
    EXPECT_FALSE(h.engine->hard_drop());
    EXPECT_FALSE(h.engine->cell(19, 4).has_value());

    h.step_gravity();
    EXPECT_EQ(h.engine->cell(19, 4), PieceType::O);
    EXPECT_EQ(h.engine->cell(18, 5), PieceType::O);
    EXPECT_TRUE(h.engine->active_piece().has_value());
    EXPECT_EQ(h.engine->active_piece()->y, 0);
}

// ------------------------------------------------------------
// 8. 重力: 間隔が経過するまで落ちない
// ------------------------------------------------------------
TEST(TetrisRuleEngine, GravityWaitsForInterval) {
    Harness h;
    h.engine->start();
    h.place_active(PieceType::O, 0, 4, 0);

    h.clock.advance(799);
    h.engine->tick();
    EXPECT_EQ(h.engine->active_piece()->y, 0);

    h.clock.advance(1);
    h.engine->tick();
    EXPECT_EQ(h.engine->active_piece()->y, 1);
}

// ------------------------------------------------------------
// 9. 1行消去: lines:cleared{1,false}、lines == 1、score == 100
// ------------------------------------------------------------
TEST(TetrisRuleEngine, SingleLineClearScores100) {
    Harness h;
    h.engine->start();
    prepare_single_clear(h);
    h.events.clear();

    h.step_gravity();

    const auto cleared = h.of<tetrys::game_bus::LinesCleared>();
    ASSERT_EQ(cleared.size(), 1u);
    EXPECT_EQ(cleared[0].count, 1);
    EXPECT_FALSE(cleared[0].isTetris);
    EXPECT_EQ(cleared[0].newTotal, 1);
    EXPECT_EQ(cleared[0].newLevel, 1);

    const auto& sb = h.engine->score_board();
    EXPECT_EQ(sb.lines, 1);
    EXPECT_EQ(sb.score, 100);
    EXPECT_EQ(sb.combo, 1);

    const std::vector<std::string_view> expected{"piece:placed", "lines:cleared",
                                                 "score:updated", "combo:updated"};
    EXPECT_EQ(h.names(), expected);

    const auto score = h.of<tetrys::game_bus::ScoreUpdated>();
    ASSERT_EQ(score.size(), 1u);
    EXPECT_EQ(score[0].delta, 100);
    EXPECT_EQ(score[0].score, 100);
}

// ------------------------------------------------------------
// 10. 10ライン到達でレベル 2、得点は消去前のレベルで計算
// ------------------------------------------------------------
TEST(TetrisRuleEngine, TenthLineRaisesLevel) {
    Harness h;
    h.engine->start();
    h.reg().ctx().get<ScoreBoard>().lines = 9;
    prepare_single_clear(h);
    h.events.clear();

    h.step_gravity();

    const auto& sb = h.engine->score_board();
    EXPECT_EQ(sb.lines, 10);
    EXPECT_EQ(sb.level, 2);
    EXPECT_EQ(sb.score, 100);

    const auto ups = h.of<tetrys::game_bus::LevelUp>();
    ASSERT_EQ(ups.size(), 1u);
    EXPECT_EQ(ups[0].level, 2);
    EXPECT_EQ(ups[0].previousLevel, 1);

    const std::vector<std::string_view> expected{"piece:placed", "lines:cleared",
                                                 "score:updated", "level:up", "combo:updated"};
    EXPECT_EQ(h.names(), expected);
    EXPECT_EQ(h.engine->current_fall_interval_ms(), 750u);
}

// ------------------------------------------------------------
// 11. テトリス: 4行同時消去で isTetris、tetrisCount+1、800×level
// ------------------------------------------------------------
TEST(TetrisRuleEngine, FourLinesIsTetris) {
    Harness h;
    h.engine->start();
    for (int r = 16; r < 20; ++r) h.fill_row_except(r, 0);
    h.place_active(PieceType::I, 1, 0, 0);
    h.events.clear();

    h.drop_and_lock();

    const auto cleared = h.of<tetrys::game_bus::LinesCleared>();
    ASSERT_EQ(cleared.size(), 1u);
    EXPECT_EQ(cleared[0].count, 4);
    EXPECT_TRUE(cleared[0].isTetris);

    const auto& sb = h.engine->score_board();
    EXPECT_EQ(sb.tetrisCount, 1);
    EXPECT_EQ(sb.score, 800);
    EXPECT_EQ(sb.lines, 4);
    for (int r = 0; r < 20; ++r) {
        for (int c = 0; c < 10; ++c) {
            EXPECT_FALSE(h.engine->cell(r, c).has_value()) << "row=" << r << " col=" << c;
        }
    }
}

// ------------------------------------------------------------
// 12. コンボ: 連続消去で増え、消去なしの固定で 0 に戻る
// ------------------------------------------------------------
TEST(TetrisRuleEngine, ComboIncrementsAndResets) {
    Harness h;
    h.engine->start();

    prepare_single_clear(h);
    h.step_gravity();
    EXPECT_EQ(h.engine->score_board().combo, 1);

    prepare_single_clear(h);
    h.step_gravity();
    EXPECT_EQ(h.engine->score_board().combo, 2);

    h.events.clear();
    h.drop_and_lock();
    EXPECT_EQ(h.engine->score_board().combo, 0);

    const auto combos = h.of<tetrys::game_bus::ComboUpdated>();
    ASSERT_EQ(combos.size(), 1u);
    EXPECT_EQ(combos[0].combo, 0);
    EXPECT_TRUE(combos[0].isReset);
}

// ------------------------------------------------------------
// 13. ゲームオーバー: スポーン位置が埋まっていれば GameOver と game:over
// ------------------------------------------------------------
TEST(TetrisRuleEngine, BlockedSpawnEndsGame) {
    Harness h;
    h.engine->start();
    h.reg().ctx().get<ScoreBoard>().score = 1234;
    for (int r = 0; r < 4; ++r) h.fill_row_except(r, 0);
    h.events.clear();

    h.step_gravity();

    EXPECT_EQ(h.engine->status(), Status::GameOver);
    const std::vector<std::string_view> expected{"piece:placed", "combo:updated", "game:over"};
    EXPECT_EQ(h.names(), expected);

    const auto over = h.of<tetrys::game_bus::GameOver>();
    ASSERT_EQ(over.size(), 1u);
    EXPECT_EQ(over[0].score, 1234);
    EXPECT_EQ(over[0].level, 1);

    // GameOver からは reset 以外で抜けない
    EXPECT_FALSE(h.engine->move(1, 0));
    EXPECT_FALSE(h.engine->toggle_pause());
    h.events.clear();
    h.step_gravity();
    EXPECT_TRUE(h.events.empty());
    EXPECT_EQ(h.engine->status(), Status::GameOver);
}

// ------------------------------------------------------------
// 14. 一時停止: 停止区間はプレイ時間に含まれない
// ------------------------------------------------------------
TEST(TetrisRuleEngine, PausedSpanExcludedFromTimePlayed) {
    Harness h;
    h.engine->start();

    h.clock.advance(2500);
    h.engine->tick();
    EXPECT_EQ(h.engine->time_played(), 2);

    ASSERT_TRUE(h.engine->pause());
    EXPECT_EQ(h.engine->status(), Status::Paused);
    const auto piece_before = h.engine->active_piece();

    h.clock.advance(10'000);
    h.engine->tick();
    EXPECT_EQ(h.engine->time_played(), 2);
    EXPECT_EQ(h.engine->active_piece()->y, piece_before->y);

    ASSERT_TRUE(h.engine->resume());
    EXPECT_EQ(h.engine->time_played(), 2);

    h.clock.advance(1500);
    h.engine->tick();
    EXPECT_EQ(h.engine->time_played(), 4);

    const auto paused = h.of<tetrys::game_bus::GamePaused>();
    ASSERT_EQ(paused.size(), 2u);
    EXPECT_TRUE(paused[0].isPaused);
    EXPECT_FALSE(paused[1].isPaused);
}

TEST(TetrisRuleEngine, TimeTickOnWholeSeconds) {
    Harness h;
    h.engine->start();
    h.events.clear();

    h.clock.advance(400);
    h.engine->tick();
    EXPECT_TRUE(h.of<tetrys::game_bus::TimeTick>().empty());

    h.clock.advance(700);
    h.engine->tick();
    const auto ticks = h.of<tetrys::game_bus::TimeTick>();
    ASSERT_EQ(ticks.size(), 1u);
    EXPECT_EQ(ticks[0].timePlayed, 1);
}

// ------------------------------------------------------------
// 15. reset: NotStarted に戻り、盤面と得点が消える
// ------------------------------------------------------------
TEST(TetrisRuleEngine, ResetReturnsToNotStarted) {
    Harness h;
    h.engine->start();
    prepare_single_clear(h);
    h.step_gravity();
    ASSERT_GT(h.engine->score_board().score, 0);

    h.events.clear();
    h.engine->reset();

    EXPECT_EQ(h.engine->status(), Status::NotStarted);
    EXPECT_EQ(h.engine->score_board().score, 0);
    EXPECT_EQ(h.engine->score_board().lines, 0);
    EXPECT_EQ(h.engine->time_played(), 0);
    EXPECT_FALSE(h.engine->active_piece().has_value());
    const std::vector<std::string_view> expected{"game:reset"};
    EXPECT_EQ(h.names(), expected);

    // 自動では開始しない
    h.step_gravity();
    EXPECT_EQ(h.engine->status(), Status::NotStarted);
}

// ------------------------------------------------------------
// 16. 速度倍率: [0.5, 3] に丸め、非有限値は無視
// ------------------------------------------------------------
TEST(TetrisRuleEngine, SpeedMultiplierIsClamped) {
    Harness h;
    h.engine->set_speed_multiplier(10.0);
    EXPECT_DOUBLE_EQ(h.engine->speed_multiplier(), 3.0);
    h.engine->set_speed_multiplier(0.1);
    EXPECT_DOUBLE_EQ(h.engine->speed_multiplier(), 0.5);
    h.engine->set_speed_multiplier(std::numeric_limits<double>::quiet_NaN());
    EXPECT_DOUBLE_EQ(h.engine->speed_multiplier(), 0.5);
    h.engine->set_speed_multiplier(2.0);
    EXPECT_EQ(h.engine->current_fall_interval_ms(), 400u);

    // reset しても倍率は保持される
    h.engine->reset();
    EXPECT_DOUBLE_EQ(h.engine->speed_multiplier(), 2.0);
}

// ------------------------------------------------------------
// 17. 同じシードなら同じピース列
// ------------------------------------------------------------
TEST(TetrisRuleEngine, SeededRunsAreReproducible) {
    Harness a{GlobalSetting{Difficulty::Normal, 7}};
    Harness b{GlobalSetting{Difficulty::Normal, 7}};
    a.engine->start();
    b.engine->start();

    for (int i = 0; i < 10; ++i) {
        ASSERT_EQ(a.engine->active_piece()->type, b.engine->active_piece()->type);
        ASSERT_EQ(a.engine->next_piece(), b.engine->next_piece());
        a.drop_and_lock();
        b.drop_and_lock();
        if (a.engine->status() != Status::Playing) break;
    }
}
