/**
 * @file cell.hpp
 * @brief Candidate set for one grid position.
 *
 * A Cell stores the digits still possible at its position as a 9-bit mask
 * (bit d-1 set means digit d is a candidate). The same representation
 * covers an unknown cell (all bits), a partially constrained cell and a
 * final cell (exactly one bit).
 *
 * @par Contradiction
 * A mask of zero means no digit fits. It is never a valid state and is
 * reported by is_empty(); it is not final even though the power-of-two
 * test alone would accept it.
 */

#ifndef SUDOKU_CELL_HPP
#define SUDOKU_CELL_HPP

#include <optional>

#include "config.hpp"
#include "value.hpp"

namespace sudoku {

/**
 * @brief Bitset of candidate digits.
 */
class Cell {
public:
    /**
     * @brief Default constructor - all 9 candidates present.
     */
    constexpr Cell() noexcept : bits_(ALL_CANDIDATES) {}

    /**
     * @brief Build a cell from a raw candidate mask.
     *
     * Bits above the ninth are discarded. A zero mask yields a
     * contradiction cell.
     *
     * @param mask Candidate mask
     */
    static constexpr Cell from_mask(mask_t mask) noexcept {
        Cell cell;
        cell.bits_ = static_cast<mask_t>(mask & ALL_CANDIDATES);
        return cell;
    }

    [[nodiscard]] constexpr bool contains(Value value) const noexcept {
        return (bits_ & value.bit()) != 0U;
    }

    /**
     * @brief Force the cell to a single digit.
     *
     * Unconditional: the assignment is not checked against neighbours.
     */
    constexpr void set(Value value) noexcept {
        bits_ = value.bit();
    }

    /**
     * @brief Eliminate a candidate.
     *
     * No-op on a final cell, so a forced digit survives elimination.
     */
    constexpr void remove(Value value) noexcept {
        if (is_final()) {
            return;
        }
        bits_ = static_cast<mask_t>(bits_ & ~value.bit());
    }

    /**
     * @brief Check whether exactly one candidate remains.
     */
    [[nodiscard]] constexpr bool is_final() const noexcept {
        return bits_ != 0U && (bits_ & (bits_ - 1U)) == 0U;
    }

    /**
     * @brief Check for a contradiction (no candidate left).
     */
    [[nodiscard]] constexpr bool is_empty() const noexcept {
        return bits_ == 0U;
    }

    /**
     * @brief Get the digit of a final cell.
     * @return The single candidate, or std::nullopt if not final
     */
    [[nodiscard]] std::optional<Value> value() const noexcept {
        if (!is_final()) {
            return std::nullopt;
        }
        return Value::from_bit(bits_);
    }

    /// Raw candidate mask
    [[nodiscard]] constexpr mask_t candidates() const noexcept {
        return bits_;
    }

    /// Number of candidates
    [[nodiscard]] std::size_t count() const noexcept {
        return static_cast<std::size_t>(__builtin_popcount(bits_));
    }

    [[nodiscard]] constexpr bool operator==(const Cell& other) const noexcept {
        return bits_ == other.bits_;
    }

    [[nodiscard]] constexpr bool operator!=(const Cell& other) const noexcept {
        return bits_ != other.bits_;
    }

private:
    mask_t bits_;
};

} // namespace sudoku

#endif // SUDOKU_CELL_HPP
