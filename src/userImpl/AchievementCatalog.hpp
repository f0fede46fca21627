#ifndef TETRYS_USERIMPL_ACHIEVEMENT_CATALOG_HPP
#define TETRYS_USERIMPL_ACHIEVEMENT_CATALOG_HPP

#include "userImpl/AchievementTypes.hpp"

#include <string>
#include <string_view>
#include <tl/expected.hpp>
#include <vector>

namespace tetrys::achievement {

// 組み込みカタログ(評価順)
[[nodiscard]] const std::vector<Achievement>& default_catalog();

[[nodiscard]] const Achievement* find_in(const std::vector<Achievement>& catalog,
                                         std::string_view id) noexcept;

[[nodiscard]] std::vector<const Achievement*> by_category(const std::vector<Achievement>& catalog,
                                                          Category category);
[[nodiscard]] std::vector<const Achievement*> by_rarity(const std::vector<Achievement>& catalog,
                                                        Rarity rarity);

/**
 * @brief カタログの整合性検査
 *
 * ID の重複、未知の前提 ID、前提の循環、しきい値の符号を検査する。
 */
[[nodiscard]] tl::expected<void, std::string> validate(const std::vector<Achievement>& catalog);

}  // namespace tetrys::achievement

#endif /* TETRYS_USERIMPL_ACHIEVEMENT_CATALOG_HPP */
