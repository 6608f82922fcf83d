/**
 * @file board.cpp
 * @brief Board validation.
 */

#include <sudoku/board.hpp>

#include <initializer_list>

namespace sudoku {

const char* solution_string(Solution solution) noexcept {
    switch (solution) {
    case Solution::Valid:
        return "Valid";
    case Solution::Invalid:
        return "Invalid";
    case Solution::Incomplete:
        return "Incomplete";
    default:
        return "Unknown";
    }
}

Solution Board::validate_group(const Group& coords) const {
    mask_t seen = 0;
    bool incomplete = false;

    for (const Coord& coord : coords) {
        if (coord.row >= GRID_SIZE || coord.col >= GRID_SIZE) [[unlikely]] {
            detail::out_of_bounds("Board::validate_group: coordinate outside grid");
        }
        const Cell& current = cells_[coord.index()];

        if (current.is_empty()) {
            return Solution::Invalid;
        }

        if (!current.is_final()) {
            incomplete = true;
            continue;
        }

        mask_t bit = current.candidates();
        if ((seen & bit) != 0U) {
            return Solution::Invalid;
        }
        seen = static_cast<mask_t>(seen | bit);
    }

    // Nine distinct final digits necessarily cover ALL_CANDIDATES
    if (incomplete || seen != ALL_CANDIDATES) {
        return Solution::Incomplete;
    }
    return Solution::Valid;
}

Solution Board::validate() const noexcept {
    bool incomplete = false;

    for (std::size_t i = 0; i < GRID_SIZE; ++i) {
        for (GroupKind kind : {GroupKind::Row, GroupKind::Column, GroupKind::Block}) {
            switch (validate_group(group(kind, i))) {
            case Solution::Invalid:
                return Solution::Invalid;
            case Solution::Incomplete:
                incomplete = true;
                break;
            case Solution::Valid:
                break;
            }
        }
    }

    return incomplete ? Solution::Incomplete : Solution::Valid;
}

std::size_t Board::count_final() const noexcept {
    std::size_t count = 0;
    for (const Cell& current : cells_) {
        if (current.is_final()) {
            ++count;
        }
    }
    return count;
}

} // namespace sudoku
