#include <SDL2/SDL.h>

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <random>
#include <string>
#include <string_view>

#include "core/Clock.hpp"
#include "core/KeyValueStore.hpp"
#include "userImpl/GlobalSetting.hpp"
#include "userImpl/Preferences.hpp"
#include "userImpl/Session.hpp"

namespace {

struct Options {
    std::string save_path = "tetrys-save.json";
    std::uint32_t seed = 0;
    bool debug = false;
    std::uint64_t time_limit_ms = 120'000;
};

Options parse_options(int argc, char** argv) {
    Options opt;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (arg == "--debug") {
            opt.debug = true;
        } else if (arg == "--seed" && i + 1 < argc) {
            opt.seed = static_cast<std::uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (arg == "--limit" && i + 1 < argc) {
            opt.time_limit_ms = std::strtoull(argv[++i], nullptr, 10) * 1000;
        } else {
            opt.save_path = std::string{arg};
        }
    }
    return opt;
}

// 出てきたピースごとに回転数と列をランダムに決めてハードドロップ
void autoplay(tetrys::session::Session& session, std::mt19937& rng) {
    auto& engine = session.engine();
    const auto piece = engine.active_piece();
    if (!piece) return;

    const int turns = std::uniform_int_distribution<int>{0, 3}(rng);
    for (int i = 0; i < turns; ++i) {
        if (!session.press(tetrys::game_key::GameKey::ROTATE)) break;
    }
    const int target = std::uniform_int_distribution<int>{0, session.setting().gridColumns - 1}(rng);
    const auto key = target < piece->x ? tetrys::game_key::GameKey::LEFT
                                       : tetrys::game_key::GameKey::RIGHT;
    for (int steps = std::abs(target - piece->x); steps > 0; --steps) {
        if (!session.press(key)) break;
    }
    session.press(tetrys::game_key::GameKey::DROP);
}

}  // namespace

int main(int argc, char** argv) {
    const Options opt = parse_options(argc, argv);

    if (SDL_Init(SDL_INIT_TIMER) < 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL could not initialize! SDL_Error: %s",
                     SDL_GetError());
        return EXIT_FAILURE;
    }
    if (opt.debug) {
        SDL_LogSetPriority(SDL_LOG_CATEGORY_APPLICATION, SDL_LOG_PRIORITY_DEBUG);
    }

    // 保存ファイルが読めなくてもゲームは止めず、メモリ上のストアで続ける
    std::unique_ptr<tetrys::storage::KeyValueStore> store;
    if (auto opened = tetrys::storage::JsonFileStore::open(opt.save_path)) {
        store = std::move(*opened);
    } else {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "cannot open save file: %s; progress will not be saved",
                     opened.error().c_str());
        store = std::make_unique<tetrys::storage::MemoryStore>();
    }

    const auto prefs = tetrys::preferences::load_preferences(*store);
    tetrys::clock::SdlClock clock;

    auto session = tetrys::session::Session::create(
        tetrys::global_setting::GlobalSetting{prefs.difficulty, opt.seed, opt.debug}, *store,
        clock);
    if (!session) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "session could not be created! reason: %s",
                     session.error().c_str());
        SDL_Quit();
        return EXIT_FAILURE;
    }
    auto& s = **session;
    s.engine().set_speed_multiplier(prefs.speedMultiplier);

    std::mt19937 rng{opt.seed != 0 ? opt.seed : std::random_device{}()};
    const std::uint64_t begin = clock.now_ms();
    std::uint32_t handled = 0;

    s.start();
    while (s.engine().status() != tetrys::tetris_rule::Status::GameOver &&
           clock.now_ms() - begin < opt.time_limit_ms) {
        const auto spawned =
            s.engine().world().registry->ctx().get<tetrys::tetris_rule::GameFlags>().spawned;
        if (spawned != handled) {
            handled = spawned;
            autoplay(s, rng);
        }
        s.tick();

        while (const auto* a = s.achievements().next_notification()) {
            SDL_Log("%.*s %.*s: %.*s", static_cast<int>(a->icon.size()), a->icon.data(),
                    static_cast<int>(a->name.size()), a->name.data(),
                    static_cast<int>(a->rewardMessage.size()), a->rewardMessage.data());
        }
        SDL_Delay(1);
    }

    const auto& sb = s.engine().score_board();
    const auto summary = s.achievements().summary();
    SDL_Log("final: score=%lld level=%lld lines=%lld tetris=%lld, achievements %zu/%zu (%d%%)",
            static_cast<long long>(sb.score), static_cast<long long>(sb.level),
            static_cast<long long>(sb.lines), static_cast<long long>(sb.tetrisCount),
            summary.unlockedCount, summary.totalAchievements, summary.percentage);

    // SDL_Quit の前に破棄する
    session.value().reset();
    SDL_Quit();
    return EXIT_SUCCESS;
}
