/**
 * @file group.hpp
 * @brief Coordinate views over rows, columns and blocks.
 *
 * Groups are not stored; each is computed on demand as the 9 coordinates
 * it covers. Block i has its top-left corner at row (i / 3) * 3 and
 * column (i % 3) * 3 and is enumerated row-major.
 */

#ifndef SUDOKU_GROUP_HPP
#define SUDOKU_GROUP_HPP

#include <array>

#include "config.hpp"

namespace sudoku {

/**
 * @brief Grid position.
 */
struct Coord {
    std::size_t row = 0; ///< Row (0-8)
    std::size_t col = 0; ///< Column (0-8)

    /// Row-major flat index
    [[nodiscard]] constexpr std::size_t index() const noexcept {
        return row * GRID_SIZE + col;
    }

    [[nodiscard]] constexpr bool operator==(const Coord& other) const noexcept {
        return row == other.row && col == other.col;
    }

    [[nodiscard]] constexpr bool operator!=(const Coord& other) const noexcept {
        return !(*this == other);
    }
};

/// The 9 coordinates of one row, column or block
using Group = std::array<Coord, GRID_SIZE>;

enum class GroupKind {
    Row,
    Column,
    Block
};

/**
 * @brief Coordinates of row i.
 */
constexpr Group row_group(std::size_t i) noexcept {
    Group group{};
    for (std::size_t k = 0; k < GRID_SIZE; ++k) {
        group[k] = Coord{i, k};
    }
    return group;
}

/**
 * @brief Coordinates of column i.
 */
constexpr Group column_group(std::size_t i) noexcept {
    Group group{};
    for (std::size_t k = 0; k < GRID_SIZE; ++k) {
        group[k] = Coord{k, i};
    }
    return group;
}

/**
 * @brief Coordinates of block i, row-major within the block.
 */
constexpr Group block_group(std::size_t i) noexcept {
    std::size_t top = (i / BLOCK_SIZE) * BLOCK_SIZE;
    std::size_t left = (i % BLOCK_SIZE) * BLOCK_SIZE;

    Group group{};
    for (std::size_t k = 0; k < GRID_SIZE; ++k) {
        group[k] = Coord{top + k / BLOCK_SIZE, left + k % BLOCK_SIZE};
    }
    return group;
}

/**
 * @brief Coordinates of group i of the given kind.
 */
constexpr Group group(GroupKind kind, std::size_t i) noexcept {
    switch (kind) {
    case GroupKind::Row:
        return row_group(i);
    case GroupKind::Column:
        return column_group(i);
    case GroupKind::Block:
        return block_group(i);
    }
    return block_group(i);
}

/**
 * @brief Index of the block containing a position.
 */
constexpr std::size_t block_of(Coord coord) noexcept {
    return (coord.row / BLOCK_SIZE) * BLOCK_SIZE + coord.col / BLOCK_SIZE;
}

} // namespace sudoku

#endif // SUDOKU_GROUP_HPP
