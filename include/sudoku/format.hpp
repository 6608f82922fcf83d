/**
 * @file format.hpp
 * @brief Canonical text form of a board.
 *
 * @par Grid Text Format
 * Nine newline-separated lines of nine characters. Each character is a
 * digit '1'-'9' (a final cell) or a space (an unknown cell). Output always
 * terminates every line with '\n'; a non-final cell is written as a space
 * whatever its candidates, so only fully specified boards round-trip
 * exactly.
 *
 * @par Parsing Rules
 * - '0' is out of range; any other character outside ' ', '1'-'9' fails to
 *   parse.
 * - A 10th row or a 10th character in a row is a shape error.
 * - A '\r' immediately before '\n' is ignored, as is a trailing newline.
 * - Short rows and missing rows leave the remaining cells unknown.
 */

#ifndef SUDOKU_FORMAT_HPP
#define SUDOKU_FORMAT_HPP

#include <iosfwd>
#include <string>
#include <string_view>

#include "board.hpp"
#include "error.hpp"

namespace sudoku {

/**
 * @brief Parse a textual grid.
 *
 * @param text Grid text
 * @param[out] board Receives the parsed board; untouched on error
 * @return Error::Ok, Error::ValueOutOfRange, Error::ParseFailure or
 *         Error::InvalidShape
 */
Error parse(std::string_view text, Board& board) noexcept;

#if !SUDOKU_NO_EXCEPTIONS
/**
 * @brief Parse a textual grid.
 *
 * @param text Grid text
 * @return Parsed board
 * @throws ValueOutOfRangeException, ParseException or InvalidShapeException
 */
Board parse_board(std::string_view text);
#endif

/**
 * @brief Render a board in canonical text form.
 */
std::string format(const Board& board);

std::ostream& operator<<(std::ostream& os, const Board& board);

} // namespace sudoku

#endif // SUDOKU_FORMAT_HPP
