/**
 * @file board.hpp
 * @brief 9x9 grid of candidate cells and its validity classification.
 *
 * A Board is a plain value: 81 Cells in row-major order with no heap
 * storage, so copies are fully independent.
 *
 * @par Classification
 * Each group is checked by accumulating the masks of its final cells. A
 * final cell whose bit is already in the accumulator is a duplicate
 * (Invalid); a contradiction cell is also Invalid. A group with no
 * duplicate but some non-final cell is Incomplete, otherwise Valid.
 */

#ifndef SUDOKU_BOARD_HPP
#define SUDOKU_BOARD_HPP

#include <array>

#include "cell.hpp"
#include "config.hpp"
#include "error.hpp"
#include "group.hpp"
#include "value.hpp"

namespace sudoku {

/**
 * @brief Validity of a group or of a whole board.
 */
enum class Solution {
    Valid,     ///< Every cell final, each digit exactly once per group
    Invalid,   ///< A duplicate final digit or a contradiction cell
    Incomplete ///< Consistent so far, some cells still open
};

/**
 * @brief Name of a classification ("Valid", "Invalid" or "Incomplete").
 */
const char* solution_string(Solution solution) noexcept;

/**
 * @brief 9x9 Sudoku grid.
 */
class Board {
public:
    /**
     * @brief Default constructor - every cell unknown.
     */
    Board() noexcept = default;

    /**
     * @brief Get a cell.
     *
     * @param row Row (0-8)
     * @param col Column (0-8)
     * @throws std::out_of_range if row or col is outside the grid
     */
    [[nodiscard]] const Cell& get(std::size_t row, std::size_t col) const {
        return cells_[checked_index(row, col)];
    }

    /**
     * @brief Get a cell by row-major index (0-80).
     */
    [[nodiscard]] const Cell& get(std::size_t index) const {
        if (index >= CELL_COUNT) [[unlikely]] {
            detail::out_of_bounds("Board::get: index outside grid");
        }
        return cells_[index];
    }

    /**
     * @brief Get a mutable cell.
     *
     * @param row Row (0-8)
     * @param col Column (0-8)
     * @throws std::out_of_range if row or col is outside the grid
     */
    [[nodiscard]] Cell& cell(std::size_t row, std::size_t col) {
        return cells_[checked_index(row, col)];
    }

    /**
     * @brief Get a mutable cell by row-major index (0-80).
     */
    [[nodiscard]] Cell& cell(std::size_t index) {
        if (index >= CELL_COUNT) [[unlikely]] {
            detail::out_of_bounds("Board::cell: index outside grid");
        }
        return cells_[index];
    }

    /**
     * @brief Force a cell to a digit.
     */
    void set(std::size_t row, std::size_t col, Value value) {
        cell(row, col).set(value);
    }

    /**
     * @brief Classify one group.
     *
     * @param coords The 9 coordinates of the group
     * @return Invalid, Incomplete or Valid
     * @throws std::out_of_range if a coordinate is outside the grid
     */
    [[nodiscard]] Solution validate_group(const Group& coords) const;

    /**
     * @brief Classify the whole board.
     *
     * Checks row i, column i and block i for i = 0..8. The first Invalid
     * group ends the scan.
     *
     * @return Invalid if any group is Invalid, else Incomplete if any group
     *         is Incomplete, else Valid
     */
    [[nodiscard]] Solution validate() const noexcept;

    /**
     * @brief Check for a complete, consistent solution.
     */
    [[nodiscard]] bool valid() const noexcept {
        return validate() == Solution::Valid;
    }

    /**
     * @brief Number of final cells.
     */
    [[nodiscard]] std::size_t count_final() const noexcept;

    [[nodiscard]] bool operator==(const Board& other) const noexcept {
        return cells_ == other.cells_;
    }

    [[nodiscard]] bool operator!=(const Board& other) const noexcept {
        return cells_ != other.cells_;
    }

private:
    std::array<Cell, CELL_COUNT> cells_{};

    static std::size_t checked_index(std::size_t row, std::size_t col) {
        if (row >= GRID_SIZE || col >= GRID_SIZE) [[unlikely]] {
            detail::out_of_bounds("Board: row or column outside grid");
        }
        return row * GRID_SIZE + col;
    }
};

} // namespace sudoku

#endif // SUDOKU_BOARD_HPP
