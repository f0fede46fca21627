#ifndef TETRYS_USERIMPL_PIECE_QUEUE_HPP
#define TETRYS_USERIMPL_PIECE_QUEUE_HPP

#include "userImpl/Tetrimino.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <random>

namespace tetrys {

/**
 * @brief 重み付きテトリミノキュー(次の1個を先読みで保持)
 * @param weights 出現重み(PieceType 順)
 * @param next 先読み済みの次ピース
 * @param rng 乱数生成器
 */
struct PieceQueue {
    std::array<int, 7> weights{1, 1, 1, 1, 1, 1, 1};
    std::optional<PieceType> next;
    std::mt19937 rng;
};

// seed == 0 なら random_device で初期化
[[nodiscard]] PieceQueue make_piece_queue(const std::array<int, 7>& weights, std::uint32_t seed);

// 重みに従って1個引く(キューの先読みは変更しない)
[[nodiscard]] PieceType draw_weighted(PieceQueue& pq);

// 先読みを返し、新しい先読みを引き直す
PieceType take_next(PieceQueue& pq);

// 先読みを引き直さずに参照する(未充填なら充填する)
PieceType peek_next(PieceQueue& pq);

}  // namespace tetrys

#endif /* TETRYS_USERIMPL_PIECE_QUEUE_HPP */
