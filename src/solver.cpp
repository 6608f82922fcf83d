/**
 * @file solver.cpp
 * @brief Recursive backtracking over board copies.
 */

#include <sudoku/solver.hpp>

namespace sudoku {

namespace {

std::optional<Board> search(const Board& board, std::size_t index, std::size_t depth,
                            SolveStats* stats) noexcept {
    if (stats != nullptr) {
        ++stats->nodes;
        if (depth > stats->max_depth) {
            stats->max_depth = depth;
        }
    }

    switch (board.validate()) {
    case Solution::Valid:
        return board;
    case Solution::Invalid:
        return std::nullopt;
    case Solution::Incomplete:
        break;
    }

    // Advance to the next decision point
    while (index < CELL_COUNT && board.get(index).is_final()) {
        ++index;
    }
    if (index >= CELL_COUNT) [[unlikely]] {
        return std::nullopt;
    }

    // Remaining candidates, lowest digit first; loop bounded by popcount
    unsigned int open = board.get(index).candidates();
    for (int remaining = __builtin_popcount(open); remaining > 0; --remaining) {
        int lowest = __builtin_ctz(open);
        open &= open - 1U; // Clear LSB
        Value value = Value::from_bit(static_cast<mask_t>(1U << lowest));

        Board candidate = board;
        candidate.cell(index).set(value);

        auto solution = search(candidate, index + 1, depth + 1, stats);
        if (solution.has_value()) {
            return solution;
        }
    }

    return std::nullopt;
}

} // namespace

std::optional<Board> backtrack(const Board& board, std::size_t index, SolveStats* stats) noexcept {
    return search(board, index, 0, stats);
}

} // namespace sudoku
