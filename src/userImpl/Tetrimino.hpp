#ifndef TETRYS_USERIMPL_TETRIMINO_HPP
#define TETRYS_USERIMPL_TETRIMINO_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <utility>

namespace tetrys {

// テトリミノ種別(GlobalSetting::pieceWeights もこの順)
enum class PieceType : std::uint8_t { I, O, T, S, Z, J, L };

inline constexpr std::array<PieceType, 7> ALL_PIECE_TYPES{
    PieceType::I, PieceType::O, PieceType::T, PieceType::S,
    PieceType::Z, PieceType::J, PieceType::L};

// =============================
// 形状ヘルパ
// =============================

// {row, col}: ピースのアンカー(左上)からの相対セル
using Coord = std::pair<std::int8_t, std::int8_t>;
using Cells = std::array<Coord, 4>;

[[nodiscard]] constexpr char to_char(PieceType type) noexcept {
    switch (type) {
        case PieceType::I:
            return 'I';
        case PieceType::O:
            return 'O';
        case PieceType::T:
            return 'T';
        case PieceType::S:
            return 'S';
        case PieceType::Z:
            return 'Z';
        case PieceType::J:
            return 'J';
        case PieceType::L:
            return 'L';
    }
    return '?';
}

[[nodiscard]] constexpr std::optional<PieceType> piece_from_char(char c) noexcept {
    for (auto t : ALL_PIECE_TYPES) {
        if (to_char(t) == c) return t;
    }
    return std::nullopt;
}

// 回転テーブルの長さ。I/S/Z は 2、O は 1、T/J/L は 4
[[nodiscard]] constexpr int rotation_count(PieceType type) noexcept {
    switch (type) {
        case PieceType::O:
            return 1;
        case PieceType::I:
        case PieceType::S:
        case PieceType::Z:
            return 2;
        case PieceType::T:
        case PieceType::J:
        case PieceType::L:
            return 4;
    }
    return 1;
}

[[nodiscard]] constexpr int next_rotation(PieceType type, int rotation) noexcept {
    return (rotation + 1) % rotation_count(type);
}

constexpr Cells cells_i(int rotation) noexcept {
    if (rotation == 1) return {Coord{0, 0}, Coord{1, 0}, Coord{2, 0}, Coord{3, 0}};
    return {Coord{0, 0}, Coord{0, 1}, Coord{0, 2}, Coord{0, 3}};
}

constexpr Cells cells_o(int) noexcept {
    return {Coord{0, 0}, Coord{0, 1}, Coord{1, 0}, Coord{1, 1}};
}

constexpr Cells cells_t(int rotation) noexcept {
    switch (rotation) {
        case 1:
            return {Coord{0, 0}, Coord{1, 0}, Coord{1, 1}, Coord{2, 0}};
        case 2:
            return {Coord{0, 0}, Coord{0, 1}, Coord{0, 2}, Coord{1, 1}};
        case 3:
            return {Coord{0, 1}, Coord{1, 0}, Coord{1, 1}, Coord{2, 1}};
        default:
            return {Coord{0, 1}, Coord{1, 0}, Coord{1, 1}, Coord{1, 2}};
    }
}

constexpr Cells cells_s(int rotation) noexcept {
    if (rotation == 1) return {Coord{0, 0}, Coord{1, 0}, Coord{1, 1}, Coord{2, 1}};
    return {Coord{0, 1}, Coord{0, 2}, Coord{1, 0}, Coord{1, 1}};
}

constexpr Cells cells_z(int rotation) noexcept {
    if (rotation == 1) return {Coord{0, 1}, Coord{1, 0}, Coord{1, 1}, Coord{2, 0}};
    return {Coord{0, 0}, Coord{0, 1}, Coord{1, 1}, Coord{1, 2}};
}

constexpr Cells cells_j(int rotation) noexcept {
    switch (rotation) {
        case 1:
            return {Coord{0, 0}, Coord{0, 1}, Coord{1, 0}, Coord{2, 0}};
        case 2:
            return {Coord{0, 0}, Coord{0, 1}, Coord{0, 2}, Coord{1, 2}};
        case 3:
            return {Coord{0, 1}, Coord{1, 1}, Coord{2, 0}, Coord{2, 1}};
        default:
            return {Coord{0, 0}, Coord{1, 0}, Coord{1, 1}, Coord{1, 2}};
    }
}

constexpr Cells cells_l(int rotation) noexcept {
    switch (rotation) {
        case 1:
            return {Coord{0, 0}, Coord{1, 0}, Coord{2, 0}, Coord{2, 1}};
        case 2:
            return {Coord{0, 0}, Coord{0, 1}, Coord{0, 2}, Coord{1, 0}};
        case 3:
            return {Coord{0, 0}, Coord{0, 1}, Coord{1, 1}, Coord{2, 1}};
        default:
            return {Coord{0, 2}, Coord{1, 0}, Coord{1, 1}, Coord{1, 2}};
    }
}

// 占有セルは常に type + rotation から導出する
[[nodiscard]] constexpr Cells cells_for(PieceType type, int rotation) noexcept {
    switch (type) {
        case PieceType::I:
            return cells_i(rotation);
        case PieceType::O:
            return cells_o(rotation);
        case PieceType::T:
            return cells_t(rotation);
        case PieceType::S:
            return cells_s(rotation);
        case PieceType::Z:
            return cells_z(rotation);
        case PieceType::J:
            return cells_j(rotation);
        case PieceType::L:
            return cells_l(rotation);
    }
    return {};
}

// 形状の横幅(セル数)。スポーン位置の中央寄せに使う
[[nodiscard]] constexpr int shape_width(PieceType type, int rotation = 0) noexcept {
    int width = 0;
    for (const auto& c : cells_for(type, rotation)) {
        if (c.second + 1 > width) width = c.second + 1;
    }
    return width;
}

}  // namespace tetrys

#endif /* TETRYS_USERIMPL_TETRIMINO_HPP */
