#include "userImpl/PieceQueue.hpp"

#include <algorithm>

namespace tetrys {

PieceQueue make_piece_queue(const std::array<int, 7>& weights, std::uint32_t seed) {
    PieceQueue pq;
    pq.weights = weights;
    // 全部 0 以下だと分布が作れないので均等に戻す
    if (std::none_of(weights.begin(), weights.end(), [](int w) { return w > 0; })) {
        pq.weights.fill(1);
    }
    pq.rng.seed(seed != 0 ? seed : std::random_device{}());
    return pq;
}

PieceType draw_weighted(PieceQueue& pq) {
    std::array<int, 7> w{};
    std::transform(pq.weights.begin(), pq.weights.end(), w.begin(),
                   [](int x) { return std::max(0, x); });
    std::discrete_distribution<std::size_t> dist(w.begin(), w.end());
    return ALL_PIECE_TYPES[dist(pq.rng)];
}

PieceType take_next(PieceQueue& pq) {
    const PieceType t = peek_next(pq);
    pq.next = draw_weighted(pq);
    return t;
}

PieceType peek_next(PieceQueue& pq) {
    if (!pq.next) {
        pq.next = draw_weighted(pq);
    }
    return *pq.next;
}

}  // namespace tetrys
