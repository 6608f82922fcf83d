/**
 * @file test_board.cpp
 * @brief Unit tests for Board access and validation.
 */

#include <sudoku/board.hpp>
#include <sudoku/format.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace sudoku;

static const char* const SOLVED = "534678912\n"
                                  "672195348\n"
                                  "198342567\n"
                                  "859761423\n"
                                  "426853791\n"
                                  "713924856\n"
                                  "961537284\n"
                                  "287419635\n"
                                  "345286179";

TEST_CASE("Board construction", "[board]") {
    Board board;
    for (std::size_t row = 0; row < GRID_SIZE; ++row) {
        for (std::size_t col = 0; col < GRID_SIZE; ++col) {
            REQUIRE(board.get(row, col) == Cell());
        }
    }
    REQUIRE(board.count_final() == 0);
    REQUIRE(board.validate() == Solution::Incomplete);
}

TEST_CASE("Board access", "[board]") {
    Board board;

    SECTION("set and get") {
        board.set(2, 7, Value(4));
        REQUIRE(board.get(2, 7).value() == Value(4));
        REQUIRE(board.get(2 * GRID_SIZE + 7).value() == Value(4));
        REQUIRE(board.count_final() == 1);
    }

    SECTION("mutable cell access") {
        board.cell(8, 8).remove(Value(1));
        REQUIRE_FALSE(board.get(8, 8).contains(Value(1)));
        board.cell(80).set(Value(2));
        REQUIRE(board.get(8, 8).value() == Value(2));
    }

    SECTION("copies are independent") {
        board.set(0, 0, Value(1));
        Board copy = board;
        copy.set(0, 0, Value(2));
        copy.set(4, 4, Value(3));
        REQUIRE(board.get(0, 0).value() == Value(1));
        REQUIRE_FALSE(board.get(4, 4).is_final());
        REQUIRE(board != copy);
    }

    SECTION("out of range access is a contract violation") {
        REQUIRE_THROWS_AS(board.get(9, 0), std::out_of_range);
        REQUIRE_THROWS_AS(board.get(0, 9), std::out_of_range);
        REQUIRE_THROWS_AS(board.get(81), std::out_of_range);
        REQUIRE_THROWS_AS(board.cell(3, 12), std::out_of_range);
        REQUIRE_THROWS_AS(board.set(10, 10, Value(1)), std::out_of_range);
    }

    SECTION("groups outside the grid are a contract violation") {
        REQUIRE_THROWS_AS(board.validate_group(row_group(12)), std::out_of_range);
        REQUIRE_THROWS_AS(board.validate_group(column_group(9)), std::out_of_range);
        REQUIRE_THROWS_AS(board.validate_group(block_group(9)), std::out_of_range);

        Group stray = row_group(8);
        stray[8] = Coord{9, 9};
        REQUIRE_THROWS_AS(board.validate_group(stray), std::out_of_range);
    }
}

TEST_CASE("Board validate complete grid", "[board]") {
    Board board = parse_board(SOLVED);
    REQUIRE(board.validate() == Solution::Valid);
    REQUIRE(board.valid());
    REQUIRE(board.count_final() == CELL_COUNT);
}

TEST_CASE("Board validate duplicates", "[board]") {
    Board board = parse_board(SOLVED);

    SECTION("swap within a row breaks columns and blocks") {
        // Row 0 stays a permutation, columns 0 and 1 get duplicates
        board.set(0, 0, Value(3));
        board.set(0, 1, Value(5));
        REQUIRE(board.validate() == Solution::Invalid);
        REQUIRE_FALSE(board.valid());
    }

    SECTION("duplicate in a row") {
        board.set(4, 0, Value(2));
        REQUIRE(board.validate_group(row_group(4)) == Solution::Invalid);
        REQUIRE(board.validate() == Solution::Invalid);
    }

    SECTION("duplicate in a column only") {
        Board partial;
        partial.set(0, 3, Value(7));
        partial.set(8, 3, Value(7));
        REQUIRE(partial.validate_group(column_group(3)) == Solution::Invalid);
        REQUIRE(partial.validate_group(row_group(0)) == Solution::Incomplete);
        REQUIRE(partial.validate() == Solution::Invalid);
    }

    SECTION("duplicate in a block only") {
        Board partial;
        partial.set(6, 6, Value(9));
        partial.set(8, 8, Value(9));
        REQUIRE(partial.validate_group(block_group(8)) == Solution::Invalid);
        REQUIRE(partial.validate_group(row_group(6)) == Solution::Incomplete);
        REQUIRE(partial.validate_group(column_group(6)) == Solution::Incomplete);
        REQUIRE(partial.validate() == Solution::Invalid);
    }
}

TEST_CASE("Board validate partial grid", "[board]") {
    Board board = parse_board(SOLVED);

    SECTION("one open cell") {
        board.cell(4, 4) = Cell();
        REQUIRE(board.validate() == Solution::Incomplete);
        REQUIRE(board.validate_group(row_group(4)) == Solution::Incomplete);
        REQUIRE(board.validate_group(row_group(3)) == Solution::Valid);
    }

    SECTION("partially constrained cell is not final") {
        board.cell(0, 0) = Cell::from_mask(0x018); // {4, 5}
        REQUIRE(board.validate() == Solution::Incomplete);
    }

    SECTION("open cell before a duplicate in the same group") {
        board.cell(0, 0) = Cell();
        board.set(0, 8, Value(3));
        REQUIRE(board.validate_group(row_group(0)) == Solution::Invalid);
    }
}

TEST_CASE("Board validate contradiction", "[board]") {
    Board board;
    board.cell(5, 5) = Cell::from_mask(0);
    REQUIRE(board.validate_group(row_group(5)) == Solution::Invalid);
    REQUIRE(board.validate_group(column_group(5)) == Solution::Invalid);
    REQUIRE(board.validate_group(block_group(4)) == Solution::Invalid);
    REQUIRE(board.validate() == Solution::Invalid);
}

TEST_CASE("Solution names", "[board]") {
    REQUIRE(std::string(solution_string(Solution::Valid)) == "Valid");
    REQUIRE(std::string(solution_string(Solution::Invalid)) == "Invalid");
    REQUIRE(std::string(solution_string(Solution::Incomplete)) == "Incomplete");
}
