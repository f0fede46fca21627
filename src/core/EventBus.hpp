#ifndef TETRYS_CORE_EVENT_BUS_HPP
#define TETRYS_CORE_EVENT_BUS_HPP

#include <algorithm>
#include <cstdint>
#include <deque>
#include <functional>
#include <utility>
#include <variant>
#include <vector>

namespace tetrys::game_bus {

/**
 * @brief 閉じた variant 型 Event を購読者リストへ同期配信するバス
 *
 * emit() は全購読者の処理が終わるまで戻らない。
 * 配信中に発行された Event はキューに積まれ、外側の emit() が戻る前に発行順で配信される。
 * ハンドラの例外は emit() の呼び出し元へ伝わり、その時点の未配信キューは破棄される。
 *
 * @tparam Event std::variant<...>
 */
template <class Event>
class EventBus {
   public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = std::uint32_t;

    SubscriptionId subscribe(Handler handler) {
        const SubscriptionId id = next_id_++;
        subscribers_.push_back(Subscriber{id, std::move(handler), true});
        return id;
    }

    // 特定の alternative だけを受け取る購読
    template <class T, class Fn>
    SubscriptionId subscribe_to(Fn&& fn) {
        return subscribe([f = std::forward<Fn>(fn)](const Event& ev) {
            if (const auto* payload = std::get_if<T>(&ev)) f(*payload);
        });
    }

    bool unsubscribe(SubscriptionId id) {
        auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                               [id](const Subscriber& s) { return s.id == id && s.active; });
        if (it == subscribers_.end()) return false;
        if (dispatching_) {
            it->active = false;  // 配信ループ終了後に掃除
        } else {
            subscribers_.erase(it);
        }
        return true;
    }

    void emit(Event ev) {
        pending_.push_back(std::move(ev));
        if (dispatching_) return;

        DispatchGuard guard{*this};
        while (!pending_.empty()) {
            Event current = std::move(pending_.front());
            pending_.pop_front();
            // 配信中の subscribe は次の Event から対象にする
            const std::size_t count = subscribers_.size();
            for (std::size_t i = 0; i < count; ++i) {
                if (!subscribers_[i].active) continue;
                // 呼び出し中の subscribe で vector が再確保されても安全なようにコピーして呼ぶ
                const Handler handler = subscribers_[i].handler;
                handler(current);
            }
        }
    }

    [[nodiscard]] std::size_t subscriber_count() const noexcept {
        return static_cast<std::size_t>(
            std::count_if(subscribers_.begin(), subscribers_.end(),
                          [](const Subscriber& s) { return s.active; }));
    }

   private:
    struct Subscriber {
        SubscriptionId id;
        Handler handler;
        bool active;
    };

    struct DispatchGuard {
        EventBus& bus;
        explicit DispatchGuard(EventBus& b) : bus(b) { bus.dispatching_ = true; }
        ~DispatchGuard() {
            bus.dispatching_ = false;
            // ハンドラが例外で抜けた場合、中断した配信の残りは次の emit に持ち越さない
            bus.pending_.clear();
            std::erase_if(bus.subscribers_, [](const Subscriber& s) { return !s.active; });
        }
    };

    std::vector<Subscriber> subscribers_;
    std::deque<Event> pending_;
    bool dispatching_ = false;
    SubscriptionId next_id_ = 1;
};

}  // namespace tetrys::game_bus

#endif /* TETRYS_CORE_EVENT_BUS_HPP */
