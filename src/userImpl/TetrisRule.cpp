#include "userImpl/TetrisRule.hpp"

#include <SDL2/SDL_log.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace tetrys::tetris_rule {

using ecs::CommandList;
using ecs::make_system;
using ecs::Phase;
using ecs::ReadOnlyView;
using ecs::run_schedule;
using ecs::Schedule;
using ecs::WriteCommands;
using game_bus::GameEvent;

// =============================
// 純粋ヘルパ
// =============================

bool can_place(const GridResource& grid, PieceType type, int rotation, int x, int y) {
    for (auto [rr, cc] : cells_for(type, rotation)) {
        const int col = x + cc;
        const int row = y + rr;
        // 盤面外なら不可(上端より上も含む)
        if (!grid.in_bounds(row, col)) return false;
        // 既に固定ブロックがあるなら不可
        if (grid.filled(row, col)) return false;
    }
    return true;
}

Position spawn_position(const GridResource& grid, PieceType type) {
    return Position{(grid.cols - shape_width(type, 0)) / 2, 0};
}

std::uint64_t fall_interval_ms(const GlobalSetting& setting, std::int64_t level,
                               double speed_multiplier) {
    const std::int64_t stepped =
        setting.baseFallMs - (std::max<std::int64_t>(level, 1) - 1) * setting.fallStepPerLevelMs;
    const std::int64_t base = std::max<std::int64_t>(setting.minBaseFallMs, stepped);
    const double factor = speed_multiplier * setting.speedFactor;
    const auto scaled = static_cast<std::int64_t>(std::floor(static_cast<double>(base) / factor));
    return static_cast<std::uint64_t>(std::max<std::int64_t>(setting.minFallIntervalMs, scaled));
}

std::int64_t score_for_lines(const GlobalSetting& setting, int cleared, std::int64_t level) {
    const auto k = static_cast<std::size_t>(std::clamp(cleared, 0, 4));
    const double points =
        static_cast<double>(BASE_SCORE_TABLE[k] * level) * setting.scoreMultiplier;
    return static_cast<std::int64_t>(std::floor(points));
}

std::int64_t level_for_lines(const GlobalSetting& setting, std::int64_t lines) {
    return lines / setting.linesPerLevel + 1;
}

int clear_full_rows(GridResource& grid) {
    int cleared = 0;
    int write = grid.rows - 1;
    for (int r0 = grid.rows - 1; r0 >= 0; --r0) {
        bool full = true;
        for (int c0 = 0; c0 < grid.cols; ++c0) {
            if (!grid.filled(r0, c0)) {
                full = false;
                break;
            }
        }
        if (full) {
            ++cleared;
            continue;
        }
        if (write != r0) {
            for (int c0 = 0; c0 < grid.cols; ++c0) {
                const int src = grid.index(r0, c0);
                const int dst = grid.index(write, c0);
                grid.occ[dst] = grid.occ[src];
                grid.occ_type[dst] = grid.occ_type[src];
            }
        }
        --write;
    }
    // 上に空行を詰める
    for (int r0 = write; r0 >= 0; --r0) {
        for (int c0 = 0; c0 < grid.cols; ++c0) {
            const int idx = grid.index(r0, c0);
            grid.occ[idx] = CellStatus::Empty;
            grid.occ_type[idx] = PieceType::I;
        }
    }
    return cleared;
}

namespace {

std::int64_t played_seconds(const GameClock& gc, std::uint64_t now_ms) {
    const std::uint64_t offset = gc.startMs + gc.pausedTotalMs;
    if (now_ms <= offset) return 0;
    return static_cast<std::int64_t>((now_ms - offset) / 1000);
}

ecs::Command push_events(std::vector<GameEvent> evs) {
    return ecs::cmd::update_ctx<PendingEvents>([evs = std::move(evs)](PendingEvents& p) {
        p.events.insert(p.events.end(), evs.begin(), evs.end());
    });
}

}  // namespace

// =============================
// Systems(純粋版)
// =============================

/**
 * @brief プレイ秒数の更新。整数秒が進んだら time:tick
 */
static CommandList timeSystem_pure(ReadOnlyView<GameClock, GameFlags> ro,
                                   WriteCommands<GameClock, PendingEvents> wr,
                                   const TetrisResources& res) {
    CommandList out;
    const auto* flags = ro.ctx<GameFlags>();
    const auto* gc = ro.ctx<GameClock>();
    if (!flags || !gc || flags->status != Status::Playing) return out;

    const std::int64_t played = played_seconds(*gc, res.now_ms);
    if (played <= gc->timePlayed) return out;

    out.emplace_back(wr.update_ctx<GameClock>([played](GameClock& c) { c.timePlayed = played; }));
    out.emplace_back(wr.update_ctx<PendingEvents>([played](PendingEvents& p) {
        p.events.emplace_back(game_bus::TimeTick{played});
    }));
    return out;
}

/**
 * @brief 重力(純粋)：間隔が経過していれば1段落とす。落とせなければ LockRequest
 */
static CommandList gravitySystem_pure(
    ReadOnlyView<GridResource, ActivePiece, Position, TetriminoMeta, GameClock, GameFlags,
                 ScoreBoard>
        ro,
    WriteCommands<Position, LockRequest, GameClock> wr, const TetrisResources& res) {
    CommandList out;
    const auto* grid = ro.valid(res.grid_e) ? ro.try_get<GridResource>(res.grid_e) : nullptr;
    const auto* gc = ro.ctx<GameClock>();
    const auto* flags = ro.ctx<GameFlags>();
    const auto* sb = ro.ctx<ScoreBoard>();
    if (!grid || !gc || !flags || !sb || flags->status != Status::Playing) return out;

    const std::uint64_t interval = fall_interval_ms(res.setting, sb->level, flags->speedMultiplier);
    if (res.now_ms < gc->lastFallMs || res.now_ms - gc->lastFallMs < interval) return out;

    out.emplace_back(
        wr.update_ctx<GameClock>([now = res.now_ms](GameClock& c) { c.lastFallMs = now; }));

    auto v = ro.view<ActivePiece, Position, TetriminoMeta>();
    for (auto e : v) {
        const auto& pos = v.template get<Position>(e);
        const auto& meta = v.template get<TetriminoMeta>(e);

        if (can_place(*grid, meta.type, meta.rotation, pos.x, pos.y + 1)) {
            out.emplace_back(wr.emplace_or_replace<Position>(e, Position{pos.x, pos.y + 1}));
        } else {
            out.emplace_back(wr.emplace_or_replace<LockRequest>(e, LockRequest{res.now_ms}));
        }
    }
    return out;
}

// =============================
// ロック & マージ(純粋)
// =============================
static CommandList lockAndMergeSystem_pure(
    ReadOnlyView<GridResource, ActivePiece, Position, TetriminoMeta, LockRequest> ro,
    WriteCommands<GridResource, Locked, PendingEvents> wr, const TetrisResources& res) {
    CommandList out;
    if (!ro.valid(res.grid_e)) return out;

    auto v = ro.view<ActivePiece, Position, TetriminoMeta, LockRequest>();
    if (v.begin() == v.end()) return out;

    auto grid = ro.get<GridResource>(res.grid_e);  // 書換え用コピー(最後に置換コマンドで反映)
    std::vector<GameEvent> evs;
    int pieces = 0;

    for (auto e : v) {
        const auto& pos = v.template get<Position>(e);
        const auto& meta = v.template get<TetriminoMeta>(e);

        for (auto [rr, cc] : cells_for(meta.type, meta.rotation)) {
            const int col = pos.x + cc;
            const int row = pos.y + rr;
            if (grid.in_bounds(row, col)) {
                const int idx = grid.index(row, col);
                grid.occ[idx] = CellStatus::Filled;
                grid.occ_type[idx] = meta.type;
            }
        }
        evs.emplace_back(game_bus::PiecePlaced{meta.type, pos.x, pos.y});
        ++pieces;

        // アクティブピース破棄(次のスポーンは spawnSystem)
        out.emplace_back(wr.destroy(e));
    }

    out.emplace_back(wr.emplace_or_replace<GridResource>(res.grid_e, grid));
    out.emplace_back(wr.emplace_or_replace<Locked>(res.grid_e, Locked{pieces}));
    out.emplace_back(push_events(std::move(evs)));
    return out;
}

// =============================
// ライン消去(純粋)
// =============================
static CommandList lineClearSystem_pure(ReadOnlyView<GridResource, Locked> ro,
                                        WriteCommands<GridResource, ClearedRows> wr,
                                        const TetrisResources& res) {
    CommandList out;
    if (!ro.valid(res.grid_e) || !ro.try_get<Locked>(res.grid_e)) return out;

    auto grid = ro.get<GridResource>(res.grid_e);  // コピーを編集し、最後に置換
    const int cleared = clear_full_rows(grid);

    out.emplace_back(wr.emplace_or_replace<GridResource>(res.grid_e, grid));
    out.emplace_back(wr.emplace_or_replace<ClearedRows>(res.grid_e, ClearedRows{cleared}));
    return out;
}

// =============================
// 得点(純粋)
// lines:cleared → score:updated → level:up → combo:updated の順
// =============================
static CommandList scoringSystem_pure(ReadOnlyView<ClearedRows, ScoreBoard> ro,
                                      WriteCommands<ScoreBoard, ClearedRows, Locked, PendingEvents> wr,
                                      const TetrisResources& res) {
    CommandList out;
    if (!ro.valid(res.grid_e)) return out;
    const auto* cleared = ro.try_get<ClearedRows>(res.grid_e);
    const auto* sb = ro.ctx<ScoreBoard>();
    if (!cleared || !sb) return out;

    ScoreBoard next = *sb;
    std::vector<GameEvent> evs;
    const int k = cleared->count;

    if (k > 0) {
        const std::int64_t previous_level = next.level;
        const std::int64_t points = score_for_lines(res.setting, k, next.level);
        next.lines += k;
        next.score += points;
        next.level = level_for_lines(res.setting, next.lines);
        if (k == 4) ++next.tetrisCount;
        ++next.combo;

        evs.emplace_back(game_bus::LinesCleared{k, k == 4, next.lines, next.level});
        evs.emplace_back(game_bus::ScoreUpdated{next.score, points, next.level});
        if (next.level > previous_level) {
            evs.emplace_back(game_bus::LevelUp{next.level, previous_level});
        }
        evs.emplace_back(game_bus::ComboUpdated{next.combo, false});
    } else {
        next.combo = 0;
        evs.emplace_back(game_bus::ComboUpdated{0, true});
    }

    out.emplace_back(wr.update_ctx<ScoreBoard>([next](ScoreBoard& s) { s = next; }));
    out.emplace_back(push_events(std::move(evs)));
    out.emplace_back(wr.remove<ClearedRows>(res.grid_e));
    out.emplace_back(wr.remove<Locked>(res.grid_e));
    return out;
}

// =============================
// スポーン(純粋)
// 先読みのピースを出し、新しい先読みを引く
// =============================
static CommandList spawnSystem_pure(ReadOnlyView<ActivePiece, GameFlags> ro, WriteCommands<> wr,
                                    const TetrisResources& res) {
    CommandList out;
    const auto* flags = ro.ctx<GameFlags>();
    if (!flags || flags->status != Status::Playing) return out;

    auto v = ro.view<ActivePiece>();
    if (v.begin() != v.end()) return out;

    out.emplace_back(wr.create_then([grid_e = res.grid_e](entt::registry& r, entt::entity ne) {
        const auto& grid = r.get<GridResource>(grid_e);
        auto& piece_queue = r.ctx().get<PieceQueue>();
        auto& game_flags = r.ctx().get<GameFlags>();

        const PieceType next_type = take_next(piece_queue);
        r.emplace<Position>(ne, spawn_position(grid, next_type));
        r.emplace<TetriminoMeta>(ne, next_type, 0);
        r.emplace<ActivePiece>(ne, ++game_flags.spawned);
    }));
    return out;
}

// =============================
// ゲームオーバー判定(純粋)
// 生成された ActivePiece が置けない場合に GameOver
// =============================
static CommandList gameOverCheckSystem_pure(
    ReadOnlyView<GridResource, ActivePiece, Position, TetriminoMeta, GameFlags, ScoreBoard,
                 GameClock>
        ro,
    WriteCommands<GameFlags, PendingEvents> wr, const TetrisResources& res) {
    CommandList out;
    const auto* grid = ro.valid(res.grid_e) ? ro.try_get<GridResource>(res.grid_e) : nullptr;
    const auto* flags = ro.ctx<GameFlags>();
    const auto* sb = ro.ctx<ScoreBoard>();
    const auto* gc = ro.ctx<GameClock>();
    if (!grid || !flags || !sb || !gc) return out;

    // 既に GameOver 済みなら何もしない
    if (flags->status != Status::Playing) return out;

    auto v = ro.view<ActivePiece, Position, TetriminoMeta>();
    for (auto e : v) {
        const auto& pos = v.template get<Position>(e);
        const auto& meta = v.template get<TetriminoMeta>(e);
        if (can_place(*grid, meta.type, meta.rotation, pos.x, pos.y)) continue;

        out.emplace_back(
            wr.update_ctx<GameFlags>([](GameFlags& f) { f.status = Status::GameOver; }));
        out.emplace_back(push_events({game_bus::GameOver{sb->score, sb->level, sb->lines,
                                                         sb->tetrisCount, gc->timePlayed}}));
        // 単一アクティブ前提
        break;
    }
    return out;
}

// =============================
// 入力解決(純粋)
// =============================
static CommandList resolveRotationSystem_pure(
    ReadOnlyView<GridResource, ActivePiece, Position, TetriminoMeta, RotateIntent> ro,
    WriteCommands<TetriminoMeta, RotateIntent, IntentOutcome> wr, const TetrisResources& res) {
    CommandList out;
    const auto* grid = ro.valid(res.grid_e) ? ro.try_get<GridResource>(res.grid_e) : nullptr;
    if (!grid) return out;

    auto v = ro.view<ActivePiece, Position, TetriminoMeta, RotateIntent>();
    for (auto e : v) {
        const auto& pos = v.template get<Position>(e);
        auto meta = v.template get<TetriminoMeta>(e);
        const auto& ri = v.template get<RotateIntent>(e);

        int next = meta.rotation;
        for (int i = 0; i < ri.steps; ++i) next = next_rotation(meta.type, next);

        // 壁蹴りなし。置けなければ向きはそのまま
        const bool accepted = can_place(*grid, meta.type, next, pos.x, pos.y);
        if (accepted) {
            meta.rotation = next;
            out.emplace_back(wr.emplace_or_replace<TetriminoMeta>(e, meta));
        }
        out.emplace_back(wr.emplace_or_replace<IntentOutcome>(e, IntentOutcome{accepted}));
        out.emplace_back(wr.remove<RotateIntent>(e));
    }
    return out;
}

static CommandList resolveMoveSystem_pure(
    ReadOnlyView<GridResource, ActivePiece, Position, TetriminoMeta, MoveIntent> ro,
    WriteCommands<Position, MoveIntent, IntentOutcome> wr, const TetrisResources& res) {
    CommandList out;
    const auto* grid = ro.valid(res.grid_e) ? ro.try_get<GridResource>(res.grid_e) : nullptr;
    if (!grid) return out;

    auto v = ro.view<ActivePiece, Position, TetriminoMeta, MoveIntent>();
    for (auto e : v) {
        const auto& pos = v.template get<Position>(e);
        const auto& meta = v.template get<TetriminoMeta>(e);
        const auto& mi = v.template get<MoveIntent>(e);

        const Position target{pos.x + mi.dx, pos.y + mi.dy};
        const bool accepted = can_place(*grid, meta.type, meta.rotation, target.x, target.y);
        if (accepted) {
            out.emplace_back(wr.emplace_or_replace<Position>(e, target));
        }
        out.emplace_back(wr.emplace_or_replace<IntentOutcome>(e, IntentOutcome{accepted}));
        out.emplace_back(wr.remove<MoveIntent>(e));
    }
    return out;
}

// =============================
// 外部公開 API
// =============================

tl::expected<World, std::string> make_world(const GlobalSetting& setting) {
    if (setting.gridColumns < 4 || setting.gridRows < 4) {
        return tl::make_unexpected("grid must be at least 4x4 (got " +
                                   std::to_string(setting.gridColumns) + "x" +
                                   std::to_string(setting.gridRows) + ")");
    }
    if (setting.linesPerLevel <= 0) {
        return tl::make_unexpected(std::string{"linesPerLevel must be positive"});
    }

    World world{};
    world.registry = std::make_shared<entt::registry>();
    auto& registry = *world.registry;

    // GridResource(singleton 的エンティティ)
    world.grid_singleton = registry.create();
    auto& grid = registry.emplace<GridResource>(world.grid_singleton);
    grid.rows = setting.gridRows;
    grid.cols = setting.gridColumns;
    grid.occ.assign(static_cast<std::size_t>(grid.rows * grid.cols), CellStatus::Empty);
    grid.occ_type.assign(static_cast<std::size_t>(grid.rows * grid.cols), PieceType::I);

    registry.ctx().emplace<PieceQueue>(make_piece_queue(setting.pieceWeights, setting.rngSeed));
    registry.ctx().emplace<ScoreBoard>();
    registry.ctx().emplace<GameClock>();
    registry.ctx().emplace<GameFlags>();
    registry.ctx().emplace<PendingEvents>();
    return world;
}

void reset_world(World& w, const GlobalSetting& setting) {
    auto& r = *w.registry;

    auto& grid = r.get<GridResource>(w.grid_singleton);
    grid.rows = setting.gridRows;
    grid.cols = setting.gridColumns;
    grid.occ.assign(static_cast<std::size_t>(grid.rows * grid.cols), CellStatus::Empty);
    grid.occ_type.assign(static_cast<std::size_t>(grid.rows * grid.cols), PieceType::I);
    r.remove<Locked, ClearedRows>(w.grid_singleton);

    auto active = r.view<ActivePiece>();
    const std::vector<entt::entity> doomed(active.begin(), active.end());
    r.destroy(doomed.begin(), doomed.end());

    r.ctx().get<PieceQueue>().next.reset();
    r.ctx().get<ScoreBoard>() = ScoreBoard{};
    r.ctx().get<GameClock>() = GameClock{};
    auto& flags = r.ctx().get<GameFlags>();
    flags.status = Status::NotStarted;
    flags.spawned = 0;
}

void step_world(const World& w, const GlobalSetting& setting, std::uint64_t now_ms) {
    if (!w.registry) return;
    auto& world = *w.registry;
    if (!world.valid(w.grid_singleton)) return;

    TetrisResources res{setting, w.grid_singleton, now_ms};

    Schedule<TetrisResources> sch{{
        Phase<TetrisResources>{{make_system<TetrisResources>(timeSystem_pure)}},
        Phase<TetrisResources>{{make_system<TetrisResources>(gravitySystem_pure)}},
        Phase<TetrisResources>{{make_system<TetrisResources>(lockAndMergeSystem_pure)}},
        Phase<TetrisResources>{{make_system<TetrisResources>(lineClearSystem_pure)}},
        Phase<TetrisResources>{{make_system<TetrisResources>(scoringSystem_pure)}},
        Phase<TetrisResources>{{make_system<TetrisResources>(spawnSystem_pure)}},
        Phase<TetrisResources>{{make_system<TetrisResources>(gameOverCheckSystem_pure)}},
    }};

    run_schedule(world, res, sch);
}

std::optional<entt::entity> active_entity(const World& w) {
    if (!w.registry) return std::nullopt;
    const entt::registry& r = *w.registry;
    auto v = r.view<const ActivePiece>();
    if (v.begin() == v.end()) return std::nullopt;
    return *v.begin();
}

// =============================
// Engine
// =============================

Engine::Engine(const GlobalSetting& setting, game_bus::GameBus& bus, const clock::Clock& clock,
               World world)
    : setting_(&setting), bus_(&bus), clock_(&clock), world_(std::move(world)) {}

tl::expected<Engine, std::string> Engine::create(const GlobalSetting& setting,
                                                 game_bus::GameBus& bus,
                                                 const clock::Clock& clock) {
    auto world = make_world(setting);
    if (!world) {
        return tl::make_unexpected(world.error());
    }
    return Engine{setting, bus, clock, std::move(*world)};
}

void Engine::start() {
    reset_world(world_, *setting_);
    auto& r = *world_.registry;

    const std::uint64_t now = clock_->now_ms();
    r.ctx().get<GameClock>() = GameClock{now, 0, 0, now, 0};
    r.ctx().get<GameFlags>().status = Status::Playing;

    push_event(game_bus::GameStarted{clock::wall_clock_ms()});
    SDL_Log("game started (difficulty=%s, speed=%.2f)",
            global_setting::to_string(setting_->difficulty).data(), speed_multiplier());

    TetrisResources res{*setting_, world_.grid_singleton, now};
    Schedule<TetrisResources> sch{{
        Phase<TetrisResources>{{make_system<TetrisResources>(spawnSystem_pure)}},
        Phase<TetrisResources>{{make_system<TetrisResources>(gameOverCheckSystem_pure)}},
    }};
    run_schedule(r, res, sch);

    flush_events();
}

bool Engine::submit_move(int dx, int dy) {
    const auto e = active_entity(world_);
    if (!e) return false;
    auto& r = *world_.registry;

    r.emplace_or_replace<MoveIntent>(*e, MoveIntent{dx, dy});
    TetrisResources res{*setting_, world_.grid_singleton, clock_->now_ms()};
    Schedule<TetrisResources> sch{{
        Phase<TetrisResources>{{make_system<TetrisResources>(resolveMoveSystem_pure)}},
    }};
    run_schedule(r, res, sch);

    const auto* outcome = r.try_get<IntentOutcome>(*e);
    const bool accepted = outcome && outcome->accepted;
    r.remove<IntentOutcome>(*e);
    return accepted;
}

bool Engine::move(int dx, int dy) {
    if (status() != Status::Playing) return false;
    return submit_move(dx, dy);
}

bool Engine::rotate() {
    if (status() != Status::Playing) return false;
    const auto e = active_entity(world_);
    if (!e) return false;
    auto& r = *world_.registry;

    r.emplace_or_replace<RotateIntent>(*e, RotateIntent{1});
    TetrisResources res{*setting_, world_.grid_singleton, clock_->now_ms()};
    Schedule<TetrisResources> sch{{
        Phase<TetrisResources>{{make_system<TetrisResources>(resolveRotationSystem_pure)}},
    }};
    run_schedule(r, res, sch);

    const auto* outcome = r.try_get<IntentOutcome>(*e);
    const bool accepted = outcome && outcome->accepted;
    r.remove<IntentOutcome>(*e);
    return accepted;
}

bool Engine::hard_drop() {
    if (status() != Status::Playing) return false;
    int dropped = 0;
    while (submit_move(0, 1)) ++dropped;
    return dropped > 0;
}

bool Engine::pause() {
    if (status() != Status::Playing) return false;
    auto& r = *world_.registry;
    auto& gc = r.ctx().get<GameClock>();

    gc.pauseStartMs = clock_->now_ms();
    r.ctx().get<GameFlags>().status = Status::Paused;

    push_event(game_bus::GamePaused{true, gc.timePlayed});
    flush_events();
    return true;
}

bool Engine::resume() {
    if (status() != Status::Paused) return false;
    auto& r = *world_.registry;
    auto& gc = r.ctx().get<GameClock>();

    // 一時停止区間をプレイ時間と重力の両方から除外する
    const std::uint64_t now = clock_->now_ms();
    const std::uint64_t span = now > gc.pauseStartMs ? now - gc.pauseStartMs : 0;
    gc.pausedTotalMs += span;
    gc.lastFallMs += span;
    gc.pauseStartMs = 0;
    r.ctx().get<GameFlags>().status = Status::Playing;

    refresh_time_played(true);
    push_event(game_bus::GamePaused{false, gc.timePlayed});
    flush_events();
    return true;
}

bool Engine::toggle_pause() {
    switch (status()) {
        case Status::Playing:
            return pause();
        case Status::Paused:
            return resume();
        default:
            return false;
    }
}

void Engine::reset() {
    reset_world(world_, *setting_);
    push_event(game_bus::GameReset{clock::wall_clock_ms()});
    SDL_Log("game reset");
    flush_events();
}

void Engine::tick() {
    if (status() != Status::Playing) return;

    step_world(world_, *setting_, clock_->now_ms());

    if (status() == Status::GameOver) {
        const auto& sb = score_board();
        SDL_Log("game over: score=%lld level=%lld lines=%lld time=%llds",
                static_cast<long long>(sb.score), static_cast<long long>(sb.level),
                static_cast<long long>(sb.lines), static_cast<long long>(time_played()));
    }
    flush_events();
}

void Engine::set_speed_multiplier(double value) {
    if (!std::isfinite(value)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "ignoring non-finite speed multiplier");
        return;
    }
    const double clamped =
        std::clamp(value, setting_->minSpeedMultiplier, setting_->maxSpeedMultiplier);
    world_.registry->ctx().get<GameFlags>().speedMultiplier = clamped;
}

Status Engine::status() const { return world_.registry->ctx().get<GameFlags>().status; }

const ScoreBoard& Engine::score_board() const {
    return world_.registry->ctx().get<ScoreBoard>();
}

std::int64_t Engine::time_played() const {
    return world_.registry->ctx().get<GameClock>().timePlayed;
}

double Engine::speed_multiplier() const {
    return world_.registry->ctx().get<GameFlags>().speedMultiplier;
}

std::uint64_t Engine::current_fall_interval_ms() const {
    return fall_interval_ms(*setting_, score_board().level, speed_multiplier());
}

std::optional<ActivePieceView> Engine::active_piece() const {
    const auto e = active_entity(world_);
    if (!e) return std::nullopt;
    const entt::registry& r = *world_.registry;
    const auto& pos = r.get<Position>(*e);
    const auto& meta = r.get<TetriminoMeta>(*e);
    return ActivePieceView{meta.type, meta.rotation, pos.x, pos.y};
}

std::optional<PieceType> Engine::next_piece() const {
    return world_.registry->ctx().get<PieceQueue>().next;
}

std::optional<PieceType> Engine::cell(int row, int col) const {
    const auto& grid = world_.registry->get<GridResource>(world_.grid_singleton);
    if (!grid.in_bounds(row, col) || !grid.filled(row, col)) return std::nullopt;
    return grid.occ_type[static_cast<std::size_t>(grid.index(row, col))];
}

void Engine::refresh_time_played(bool force_tick) {
    auto& gc = world_.registry->ctx().get<GameClock>();
    const std::int64_t played = played_seconds(gc, clock_->now_ms());
    if (!force_tick && played <= gc.timePlayed) return;
    gc.timePlayed = played;
    push_event(game_bus::TimeTick{played});
}

void Engine::push_event(game_bus::GameEvent ev) {
    world_.registry->ctx().get<PendingEvents>().events.push_back(std::move(ev));
}

void Engine::flush_events() {
    auto& pending = world_.registry->ctx().get<PendingEvents>();
    if (pending.events.empty()) return;

    // ハンドラから Engine が再度呼ばれても安全なように先に取り出す
    std::vector<GameEvent> batch;
    batch.swap(pending.events);
    for (auto& ev : batch) {
        bus_->emit(std::move(ev));
    }
}

}  // namespace tetrys::tetris_rule
