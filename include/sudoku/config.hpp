/**
 * @file config.hpp
 * @brief Sudoku compile-time configuration.
 *
 * Grid geometry, version information and the exception switch shared by
 * every component of the library.
 */

#ifndef SUDOKU_CONFIG_HPP
#define SUDOKU_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace sudoku {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Side length of a block (3 for classic 9x9 Sudoku)
inline constexpr std::size_t BLOCK_SIZE = 3U;

/// Side length of the grid and number of digits
inline constexpr std::size_t GRID_SIZE = BLOCK_SIZE * BLOCK_SIZE;

/// Number of cells on a board
inline constexpr std::size_t CELL_COUNT = GRID_SIZE * GRID_SIZE;

/// Number of groups (rows, columns and blocks)
inline constexpr std::size_t GROUP_COUNT = GRID_SIZE * 3U;

/// Candidate mask storage, bit (d - 1) represents digit d
using mask_t = std::uint16_t;

/// Mask with every digit present
inline constexpr mask_t ALL_CANDIDATES = static_cast<mask_t>((1U << GRID_SIZE) - 1U);

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define SUDOKU_NO_EXCEPTIONS=1 to build without exceptions. Parsing and
 * value construction are then available only through the Error-returning
 * functions.
 * @{
 */
#ifndef SUDOKU_NO_EXCEPTIONS
#define SUDOKU_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace sudoku

#endif // SUDOKU_CONFIG_HPP
