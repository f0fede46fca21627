#ifndef TETRYS_USERIMPL_ACHIEVEMENT_CODEC_HPP
#define TETRYS_USERIMPL_ACHIEVEMENT_CODEC_HPP

#include "userImpl/AchievementTypes.hpp"

#include <string>
#include <string_view>
#include <tl/expected.hpp>
#include <vector>

namespace tetrys::achievement::codec {

// ストアのキー
inline constexpr std::string_view UNLOCKED_KEY = "tetris_achievements";
inline constexpr std::string_view SESSION_STATS_KEY = "tetris_achievement_stats";

/**
 * @brief 解除記録のデコード結果
 * @param records 有効な記録(保存順、ID 重複は先勝ち)
 * @param skipped 読み飛ばしたエントリの理由
 */
struct DecodedUnlocks {
    std::vector<UnlockedAchievement> records;
    std::vector<std::string> skipped;
};

[[nodiscard]] tl::expected<std::string, std::string> encode_unlocked(
    const std::vector<UnlockedAchievement>& records);

// 文書全体が配列でなければ unexpected。壊れたエントリ・未知の ID は skipped へ
[[nodiscard]] tl::expected<DecodedUnlocks, std::string> decode_unlocked(
    std::string_view text, const std::vector<Achievement>& catalog);

[[nodiscard]] tl::expected<std::string, std::string> encode_session_stats(const SessionStats& s);

// 欠けている・数値でないフィールドは 0 のまま
[[nodiscard]] tl::expected<SessionStats, std::string> decode_session_stats(std::string_view text);

}  // namespace tetrys::achievement::codec

#endif /* TETRYS_USERIMPL_ACHIEVEMENT_CODEC_HPP */
