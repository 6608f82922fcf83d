/**
 * @file solver.hpp
 * @brief Recursive backtracking solver.
 *
 * Depth-first search over board copies. At each node the board is
 * classified; an Incomplete board branches on its first open cell (in
 * row-major order from the cursor), trying its candidate digits in
 * ascending order. The first Valid board found is returned, so the result
 * is deterministic for a given input.
 *
 * There is no constraint propagation: pruning relies only on the validity
 * check, and pathological inputs can take exponential time.
 */

#ifndef SUDOKU_SOLVER_HPP
#define SUDOKU_SOLVER_HPP

#include <optional>

#include "board.hpp"
#include "config.hpp"

namespace sudoku {

/**
 * @brief Search statistics.
 */
struct SolveStats {
    std::size_t nodes = 0;     ///< Boards classified (calls to backtrack)
    std::size_t max_depth = 0; ///< Deepest recursion level reached
};

/**
 * @brief Search from a cursor position.
 *
 * Cells before the cursor are expected to be final already; the cursor
 * only skips forward over final cells.
 *
 * @param board Board to complete (copied, never modified)
 * @param index Row-major index of the first cell to consider (0-80)
 * @param stats Optional statistics accumulator (nullptr = none)
 * @return Solved board, or std::nullopt if no solution along this branch
 */
[[nodiscard]] std::optional<Board> backtrack(const Board& board, std::size_t index,
                                             SolveStats* stats = nullptr) noexcept;

/**
 * @brief Solve a board.
 *
 * @param board Puzzle
 * @param stats Optional statistics accumulator (nullptr = none)
 * @return The first solution in digit-ascending order, or std::nullopt
 */
[[nodiscard]] inline std::optional<Board> solve(const Board& board,
                                                SolveStats* stats = nullptr) noexcept {
    return backtrack(board, 0, stats);
}

} // namespace sudoku

#endif // SUDOKU_SOLVER_HPP
