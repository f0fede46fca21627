#ifndef TETRYS_CORE_COMMAND_HPP
#define TETRYS_CORE_COMMAND_HPP

#include "core/entt_assert_with_stacktrace.hpp"

#include <entt/entt.hpp>
#include <functional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace tetrys::ecs {

// ------------------------------
// 共通ユーティリティ
// ------------------------------
namespace detail {

// 型 T が List... のいずれかに含まれるかどうか
template <class T, class... List>
struct is_in : std::bool_constant<(std::is_same_v<T, List> || ...)> {};

template <class T, class... List>
inline constexpr bool is_in_v = is_in<T, List...>::value;

}  // namespace detail

// ------------------------------
// Command とコマンドユーティリティ
// ------------------------------

// registry へ遅延適用する副作用
struct Command {
    std::function<void(entt::registry&)> apply;
};

using CommandList = std::vector<Command>;

namespace cmd {

// emplace_or_replace<T>(entity, args...)
template <class T, class... Args>
Command emplace_or_replace(entt::entity e, Args&&... args) {
    std::tuple<std::decay_t<Args>...> pack{std::forward<Args>(args)...};
    return Command{[e, pack = std::move(pack)](entt::registry& r) {
        std::apply([&](const auto&... xs) { r.emplace_or_replace<T>(e, xs...); }, pack);
    }};
}

template <class T>
Command remove(entt::entity e) {
    return Command{[=](entt::registry& r) {
        if (r.valid(e) && r.any_of<T>(e)) r.remove<T>(e);
    }};
}

inline Command destroy(entt::entity e) {
    return Command{[=](entt::registry& r) {
        if (r.valid(e)) r.destroy(e);
    }};
}

inline Command create_then(std::function<void(entt::registry&, entt::entity)> f) {
    return Command{[f = std::move(f)](entt::registry& r) {
        const auto e = r.create();
        f(r, e);
    }};
}

// registry.ctx() 上のリソース T を書き換える(存在しなければ既定構築)
template <class T, class Fn>
Command update_ctx(Fn&& fn) {
    return Command{[f = std::forward<Fn>(fn)](entt::registry& r) {
        auto* res = r.ctx().find<T>();
        if (!res) res = &r.ctx().emplace<T>();
        f(*res);
    }};
}

}  // namespace cmd

// ------------------------------
// System 用の型安全ラッパ
// ------------------------------

// 宣言したコンポーネント／リソースだけ読み取れるビュー
template <class... ReadComponents>
struct ReadOnlyView {
    const entt::registry& reg;

    template <class T>
    const T& get(entt::entity e) const {
        static_assert(detail::is_in_v<T, ReadComponents...>,
                      "System is not allowed to READ this component type");
        return reg.get<T>(e);
    }

    template <class T>
    const T* try_get(entt::entity e) const {
        static_assert(detail::is_in_v<T, ReadComponents...>,
                      "System is not allowed to READ this component type");
        return reg.try_get<T>(e);
    }

    template <class... Ts>
    auto view() const {
        static_assert((detail::is_in_v<Ts, ReadComponents...> && ...),
                      "View contains a type that is not declared as READable");
        return reg.view<const Ts...>();
    }

    // ctx リソースの読み取り(未登録なら nullptr)
    template <class T>
    const T* ctx() const {
        static_assert(detail::is_in_v<T, ReadComponents...>,
                      "System is not allowed to READ this resource type");
        return reg.ctx().find<T>();
    }

    bool valid(entt::entity e) const { return reg.valid(e); }
};

// 宣言したコンポーネント／リソースだけ書き込めるコマンドファクトリ
template <class... WriteComponents>
struct WriteCommands {
    template <class T, class... Args>
    Command emplace_or_replace(entt::entity e, Args&&... args) const {
        static_assert(detail::is_in_v<T, WriteComponents...>,
                      "System is not allowed to WRITE this component type");
        return cmd::emplace_or_replace<T>(e, std::forward<Args>(args)...);
    }

    template <class T>
    Command remove(entt::entity e) const {
        static_assert(detail::is_in_v<T, WriteComponents...>,
                      "System is not allowed to REMOVE this component type");
        return cmd::remove<T>(e);
    }

    template <class T, class Fn>
    Command update_ctx(Fn&& fn) const {
        static_assert(detail::is_in_v<T, WriteComponents...>,
                      "System is not allowed to WRITE this resource type");
        return cmd::update_ctx<T>(std::forward<Fn>(fn));
    }

    Command destroy(entt::entity e) const { return cmd::destroy(e); }

    Command create_then(std::function<void(entt::registry&, entt::entity)> f) const {
        return cmd::create_then(std::move(f));
    }
};

// ------------------------------
// System, Phase, Schedule
// ------------------------------

// 純粋 System: const registry + Resources -> CommandList
template <class Resources>
using PureSystem = std::function<CommandList(const entt::registry& view, const Resources& res)>;

// フェーズ内の System は同じ registry スナップショットを読む
template <class Resources>
struct Phase {
    std::vector<PureSystem<Resources>> systems;
};

template <class Resources>
struct Schedule {
    std::vector<Phase<Resources>> phases;
};

//   func: CommandList (ReadOnlyView<ReadComponents...>,
//                      WriteCommands<WriteComponents...>,
//                      const Resources&)
template <class Resources, class... ReadComponents, class... WriteComponents>
PureSystem<Resources> make_system(CommandList (*func)(ReadOnlyView<ReadComponents...>,
                                                      WriteCommands<WriteComponents...>,
                                                      const Resources&)) {
    return [func](const entt::registry& reg, const Resources& res) -> CommandList {
        ReadOnlyView<ReadComponents...> ro{reg};
        WriteCommands<WriteComponents...> wr{};
        return func(ro, wr, res);
    };
}

// 各フェーズで全 System のコマンドを集め、フェーズ末尾で発行順に適用する
template <class Resources>
inline void run_schedule(entt::registry& world, const Resources& res,
                         const Schedule<Resources>& sch) {
    for (const auto& ph : sch.phases) {
        CommandList buf;
        const entt::registry& view = world;
        for (const auto& sys : ph.systems) {
            auto out = sys(view, res);
            buf.insert(buf.end(), std::make_move_iterator(out.begin()),
                       std::make_move_iterator(out.end()));
        }
        for (auto& c : buf) c.apply(world);
    }
}

}  // namespace tetrys::ecs

#endif /* TETRYS_CORE_COMMAND_HPP */
