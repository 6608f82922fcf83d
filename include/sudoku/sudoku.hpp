/**
 * @file sudoku.hpp
 * @brief High-level Sudoku API.
 *
 * Pulls in every component and provides a text-to-text solve() for
 * callers that only deal in the grid text format.
 */

#ifndef SUDOKU_HPP
#define SUDOKU_HPP

#include <optional>
#include <string>
#include <string_view>

#include "board.hpp"
#include "cell.hpp"
#include "config.hpp"
#include "error.hpp"
#include "format.hpp"
#include "group.hpp"
#include "solver.hpp"
#include "value.hpp"

namespace sudoku {

/**
 * @brief Solve a puzzle given in grid text format.
 *
 * An unsolvable puzzle is not an error: the function returns Error::Ok and
 * leaves @p solution empty.
 *
 * @param puzzle Grid text
 * @param[out] solution Solved grid text, or std::nullopt if no solution
 * @param stats Optional statistics accumulator (nullptr = none)
 * @return Error::Ok, or the parse error
 */
inline Error solve_text(std::string_view puzzle, std::optional<std::string>& solution,
                        SolveStats* stats = nullptr) {
    Board board;
    Error result = parse(puzzle, board);
    if (result != Error::Ok) {
        return result;
    }

    auto solved = solve(board, stats);
    if (solved.has_value()) {
        solution = format(*solved);
    } else {
        solution.reset();
    }
    return Error::Ok;
}

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace sudoku

#endif // SUDOKU_HPP
