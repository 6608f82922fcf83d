/**
 * @file error.hpp
 * @brief Sudoku error handling.
 *
 * Provides both exception-based and error-code-based error handling.
 * Only value construction and parsing can fail; validation and solving
 * never report errors.
 */

#ifndef SUDOKU_ERROR_HPP
#define SUDOKU_ERROR_HPP

#include "config.hpp"

#if !SUDOKU_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

#include <cstdlib>

namespace sudoku {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,              ///< Success
    ValueOutOfRange = -1, ///< Digit outside 1-9
    ParseFailure = -2,    ///< Character is neither a digit nor a space
    InvalidShape = -3,    ///< Too many rows or columns in a textual grid
    InvalidArg = -4       ///< Invalid argument
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::ValueOutOfRange:
        return "Value out of range";
    case Error::ParseFailure:
        return "Parse failure";
    case Error::InvalidShape:
        return "Malformed grid dimensions";
    case Error::InvalidArg:
        return "Invalid argument";
    default:
        return "Unknown error";
    }
}

#if !SUDOKU_NO_EXCEPTIONS

/**
 * @brief Base exception for Sudoku errors.
 */
class SudokuException : public std::runtime_error {
public:
    explicit SudokuException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for digits outside 1-9.
 */
class ValueOutOfRangeException : public SudokuException {
public:
    explicit ValueOutOfRangeException(const std::string& message)
        : SudokuException(message, Error::ValueOutOfRange) {}
};

/**
 * @brief Exception for unparseable grid characters.
 */
class ParseException : public SudokuException {
public:
    explicit ParseException(const std::string& message)
        : SudokuException(message, Error::ParseFailure) {}
};

/**
 * @brief Exception for grids with too many rows or columns.
 */
class InvalidShapeException : public SudokuException {
public:
    explicit InvalidShapeException(const std::string& message)
        : SudokuException(message, Error::InvalidShape) {}
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgumentException : public SudokuException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : SudokuException(message, Error::InvalidArg) {}
};

/**
 * @brief Throw the exception matching an error code.
 *
 * Does nothing for Error::Ok.
 *
 * @param error Error code
 * @param context Text prefixed to the error message
 */
inline void throw_if_error(Error error, const std::string& context) {
    if (error == Error::Ok) {
        return;
    }
    std::string message = context + ": " + error_string(error);
    switch (error) {
    case Error::ValueOutOfRange:
        throw ValueOutOfRangeException(message);
    case Error::ParseFailure:
        throw ParseException(message);
    case Error::InvalidShape:
        throw InvalidShapeException(message);
    default:
        throw InvalidArgumentException(message);
    }
}

#endif // !SUDOKU_NO_EXCEPTIONS

namespace detail {

/**
 * @brief Report an out-of-bounds grid access.
 *
 * Indexing outside the grid is a programming error, not a recoverable
 * condition: it throws std::out_of_range, or aborts when exceptions are
 * disabled.
 */
[[noreturn]] inline void out_of_bounds(const char* what) {
#if !SUDOKU_NO_EXCEPTIONS
    throw std::out_of_range(what);
#else
    (void)what;
    std::abort();
#endif
}

} // namespace detail

} // namespace sudoku

#endif // SUDOKU_ERROR_HPP
