#ifndef TETRYS_USERIMPL_GAME_KEY_HPP
#define TETRYS_USERIMPL_GAME_KEY_HPP

namespace tetrys::game_key {

// プレゼンテーション層から渡される抽象キー。物理キーとの対応は入力側で持つ
enum class GameKey {
    LEFT,
    RIGHT,
    DOWN,
    ROTATE,
    DROP,
    PAUSE,
    START,
    RESET,
    QUIT,
};

}  // namespace tetrys::game_key

#endif /* TETRYS_USERIMPL_GAME_KEY_HPP */
