#ifndef TETRYS_CORE_CLOCK_HPP
#define TETRYS_CORE_CLOCK_HPP

#include <cstdint>

namespace tetrys::clock {

/**
 * @brief ミリ秒単位の時刻源
 *
 * 値は単調増加であればよく、起点は実装ごとに異なる。
 */
class Clock {
   public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual std::uint64_t now_ms() const = 0;
};

// SDL_GetTicks64 による実時間
class SdlClock final : public Clock {
   public:
    [[nodiscard]] std::uint64_t now_ms() const override;
};

// テスト・リプレイ用の手動クロック
class ManualClock final : public Clock {
   public:
    explicit ManualClock(std::uint64_t start_ms = 0) : now_(start_ms) {}

    [[nodiscard]] std::uint64_t now_ms() const override { return now_; }

    void advance(std::uint64_t delta_ms) { now_ += delta_ms; }
    void set(std::uint64_t ms) { now_ = ms; }

   private:
    std::uint64_t now_;
};

// Unix エポックからのミリ秒(解除記録のタイムスタンプ用)
[[nodiscard]] std::int64_t wall_clock_ms();

}  // namespace tetrys::clock

#endif /* TETRYS_CORE_CLOCK_HPP */
