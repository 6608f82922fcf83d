/**
 * @file format.cpp
 * @brief Grid text parsing and formatting.
 */

#include <sudoku/format.hpp>

#include <ostream>

namespace sudoku {

Error parse(std::string_view text, Board& board) noexcept {
    Board parsed;
    std::size_t row = 0;
    std::size_t col = 0;

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];

        if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
            continue;
        }
        if (c == '\n') {
            ++row;
            col = 0;
            continue;
        }

        if (row >= GRID_SIZE || col >= GRID_SIZE) {
            return Error::InvalidShape;
        }

        if (c != ' ') {
            Value value;
            Error result = Value::from_char(c, value);
            if (result != Error::Ok) {
                return result;
            }
            parsed.set(row, col, value);
        }
        ++col;
    }

    board = parsed;
    return Error::Ok;
}

#if !SUDOKU_NO_EXCEPTIONS
Board parse_board(std::string_view text) {
    Board board;
    throw_if_error(parse(text, board), "Cannot parse grid");
    return board;
}
#endif

std::string format(const Board& board) {
    std::string out;
    out.reserve(CELL_COUNT + GRID_SIZE);

    for (std::size_t row = 0; row < GRID_SIZE; ++row) {
        for (std::size_t col = 0; col < GRID_SIZE; ++col) {
            auto value = board.get(row, col).value();
            out.push_back(value.has_value() ? value->to_char() : ' ');
        }
        out.push_back('\n');
    }

    return out;
}

std::ostream& operator<<(std::ostream& os, const Board& board) {
    return os << format(board);
}

} // namespace sudoku
