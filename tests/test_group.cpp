/**
 * @file test_group.cpp
 * @brief Unit tests for row, column and block coordinate views.
 */

#include <sudoku/group.hpp>

#include <catch2/catch_test_macros.hpp>

#include <set>
#include <utility>

using namespace sudoku;

TEST_CASE("Block 0 enumeration order", "[group]") {
    Group expected = {Coord{0, 0}, Coord{0, 1}, Coord{0, 2}, Coord{1, 0}, Coord{1, 1},
                      Coord{1, 2}, Coord{2, 0}, Coord{2, 1}, Coord{2, 2}};
    REQUIRE(block_group(0) == expected);
}

TEST_CASE("Block corners", "[group]") {
    SECTION("block 1 is the top-middle square") {
        REQUIRE(block_group(1)[0] == Coord{0, 3});
        REQUIRE(block_group(1)[8] == Coord{2, 5});
    }

    SECTION("block 5 is the middle-right square") {
        REQUIRE(block_group(5)[0] == Coord{3, 6});
        REQUIRE(block_group(5)[3] == Coord{4, 6});
        REQUIRE(block_group(5)[8] == Coord{5, 8});
    }

    SECTION("block 8 is the bottom-right square") {
        REQUIRE(block_group(8)[0] == Coord{6, 6});
        REQUIRE(block_group(8)[8] == Coord{8, 8});
    }
}

TEST_CASE("Row and column enumeration", "[group]") {
    Group row = row_group(4);
    Group col = column_group(7);
    for (std::size_t k = 0; k < GRID_SIZE; ++k) {
        REQUIRE(row[k] == Coord{4, k});
        REQUIRE(col[k] == Coord{k, 7});
    }
}

TEST_CASE("Group dispatch by kind", "[group]") {
    REQUIRE(group(GroupKind::Row, 2) == row_group(2));
    REQUIRE(group(GroupKind::Column, 6) == column_group(6));
    REQUIRE(group(GroupKind::Block, 3) == block_group(3));
}

TEST_CASE("Each kind of group partitions the grid", "[group]") {
    for (GroupKind kind : {GroupKind::Row, GroupKind::Column, GroupKind::Block}) {
        std::set<std::pair<std::size_t, std::size_t>> seen;
        for (std::size_t i = 0; i < GRID_SIZE; ++i) {
            for (const Coord& coord : group(kind, i)) {
                REQUIRE(coord.row < GRID_SIZE);
                REQUIRE(coord.col < GRID_SIZE);
                seen.insert({coord.row, coord.col});
            }
        }
        REQUIRE(seen.size() == CELL_COUNT);
    }
}

TEST_CASE("Block lookup and flat index", "[group]") {
    for (std::size_t i = 0; i < GRID_SIZE; ++i) {
        for (const Coord& coord : block_group(i)) {
            REQUIRE(block_of(coord) == i);
        }
    }

    REQUIRE(Coord{0, 0}.index() == 0);
    REQUIRE(Coord{1, 0}.index() == 9);
    REQUIRE(Coord{8, 8}.index() == 80);
}

TEST_CASE("Groups are usable at compile time", "[group]") {
    constexpr Group block = block_group(4);
    static_assert(block[0].row == 3 && block[0].col == 3);
    static_assert(block[8].row == 5 && block[8].col == 5);
    REQUIRE(block[4] == Coord{4, 4});
}
