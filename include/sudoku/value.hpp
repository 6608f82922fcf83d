/**
 * @file value.hpp
 * @brief A single Sudoku digit.
 *
 * A Value is always in the range 1-9. Out-of-range digits are rejected at
 * construction, either through the Error-returning factories or through
 * the throwing constructor.
 */

#ifndef SUDOKU_VALUE_HPP
#define SUDOKU_VALUE_HPP

#include "config.hpp"
#include "error.hpp"

namespace sudoku {

/**
 * @brief Digit in the range 1-9.
 */
class Value {
public:
    /// Digit 1, so that out-parameters can be declared before create()
    constexpr Value() noexcept : digit_(1) {}

#if !SUDOKU_NO_EXCEPTIONS
    /**
     * @brief Construct from a digit.
     *
     * @param digit Digit (1-9)
     * @throws ValueOutOfRangeException if digit is outside 1-9
     */
    explicit Value(int digit) : digit_(1) {
        Error result = create(digit, *this);
        if (result != Error::Ok) {
            throw_if_error(result, "Value " + std::to_string(digit));
        }
    }
#endif

    /**
     * @brief Create a value from a digit.
     *
     * @param digit Digit (1-9)
     * @param[out] out Receives the value on success, untouched otherwise
     * @return Error::Ok, or Error::ValueOutOfRange
     */
    static Error create(int digit, Value& out) noexcept {
        if (digit < 1 || digit > static_cast<int>(GRID_SIZE)) {
            return Error::ValueOutOfRange;
        }
        out = Value(static_cast<std::uint8_t>(digit), Unchecked{});
        return Error::Ok;
    }

    /**
     * @brief Create a value from a grid character.
     *
     * '0' is a digit but not a valid value, so it is reported as out of
     * range. Anything else that is not '1'-'9' does not parse.
     *
     * @param c Character to convert
     * @param[out] out Receives the value on success, untouched otherwise
     * @return Error::Ok, Error::ValueOutOfRange or Error::ParseFailure
     */
    static Error from_char(char c, Value& out) noexcept {
        if (c < '0' || c > '9') {
            return Error::ParseFailure;
        }
        return create(c - '0', out);
    }

    /**
     * @brief Recover a value from a single-bit candidate mask.
     *
     * @warning Caller must ensure exactly one of the low 9 bits is set.
     */
    static Value from_bit(mask_t bit) noexcept {
        return Value(static_cast<std::uint8_t>(__builtin_ctz(bit) + 1), Unchecked{});
    }

    [[nodiscard]] constexpr int digit() const noexcept {
        return digit_;
    }

    /// Candidate mask with only this digit set
    [[nodiscard]] constexpr mask_t bit() const noexcept {
        return static_cast<mask_t>(1U << (digit_ - 1U));
    }

    [[nodiscard]] constexpr char to_char() const noexcept {
        return static_cast<char>('0' + digit_);
    }

    [[nodiscard]] constexpr bool operator==(const Value& other) const noexcept {
        return digit_ == other.digit_;
    }

    [[nodiscard]] constexpr bool operator!=(const Value& other) const noexcept {
        return digit_ != other.digit_;
    }

private:
    struct Unchecked {};

    constexpr Value(std::uint8_t digit, Unchecked) noexcept : digit_(digit) {}

    std::uint8_t digit_;
};

} // namespace sudoku

#endif // SUDOKU_VALUE_HPP
