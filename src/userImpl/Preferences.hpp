#ifndef TETRYS_USERIMPL_PREFERENCES_HPP
#define TETRYS_USERIMPL_PREFERENCES_HPP

#include "core/KeyValueStore.hpp"
#include "userImpl/GlobalSetting.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace tetrys::preferences {

using global_setting::Difficulty;

inline constexpr std::string_view SPEED_KEY = "tetrys-speed-setting";
inline constexpr std::string_view DIFFICULTY_KEY = "tetrys-difficulty-setting";

inline constexpr double DEFAULT_SPEED = 1.0;
inline constexpr double MIN_SPEED = 0.5;
inline constexpr double MAX_SPEED = 3.0;

/**
 * @brief プレイヤーの設定(ゲームをまたいで保持)
 * @param speedMultiplier 落下速度の倍率 [0.5, 3]
 * @param difficulty 次に作る GlobalSetting の難易度
 */
struct Preferences {
    double speedMultiplier{DEFAULT_SPEED};
    Difficulty difficulty{Difficulty::Normal};
};

// "1.5" のような10進表記。範囲外・解釈できなければ nullopt
[[nodiscard]] std::optional<double> parse_speed(std::string_view text);

// 読めない・範囲外・未知の値は既定値に戻す(ログのみ)
[[nodiscard]] Preferences load_preferences(const storage::KeyValueStore& store);

// [0.5, 3] に丸めてから保存する。保存した値を返す
tl::expected<double, std::string> save_speed(storage::KeyValueStore& store, double speed);
storage::WriteResult save_difficulty(storage::KeyValueStore& store, Difficulty difficulty);

}  // namespace tetrys::preferences

#endif /* TETRYS_USERIMPL_PREFERENCES_HPP */
