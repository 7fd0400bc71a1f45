#include <catch2/catch.hpp>

#include "core/Board.hpp"
#include "core/Types.hpp"

#include <stdexcept>

using namespace rustycubes::core;

namespace {

Block landed(int x, int y, PieceKind kind = PieceKind::T) {
    Block b;
    b.kind = kind;
    b.position = GridPosition{x, y};
    b.active = true;
    b.rendered = true;
    return b;
}

} // namespace

TEST_CASE("Board basic cell operations", "[board]") {
    Board b{10, 20};

    REQUIRE(b.columns() == 10);
    REQUIRE(b.rows() == 20);
    REQUIRE(b.occupiedCount() == 0);

    for (int y = 0; y < b.rows(); ++y) {
        for (int x = 0; x < b.columns(); ++x) {
            const Cell& c = b.cell({x, y});
            REQUIRE(c.position == GridPosition{x, y});
            REQUIRE_FALSE(c.occupied);
            REQUIRE_FALSE(c.block.has_value());
        }
    }
}

TEST_CASE("Board rejects non-positive dimensions", "[board]") {
    REQUIRE_THROWS_AS(Board(0, 20), std::invalid_argument);
    REQUIRE_THROWS_AS(Board(10, -1), std::invalid_argument);
}

TEST_CASE("Board accessors are bounds-checked", "[board]") {
    Board b{10, 20};

    REQUIRE(b.contains({0, 0}));
    REQUIRE(b.contains({9, 19}));
    REQUIRE_FALSE(b.contains({10, 0}));
    REQUIRE_FALSE(b.contains({0, 20}));
    REQUIRE_FALSE(b.contains({-1, 5}));

    REQUIRE_THROWS_AS(b.isOccupied({10, 0}), std::out_of_range);
    REQUIRE_THROWS_AS(b.isOccupied({0, 20}), std::out_of_range);
    REQUIRE_THROWS_AS(b.cell({-1, 0}), std::out_of_range);
}

TEST_CASE("Board stores a frozen copy of placed blocks", "[board]") {
    Board b{10, 20};

    b.place(landed(3, 19, PieceKind::L));

    REQUIRE(b.isOccupied({3, 19}));
    const Cell& c = b.cell({3, 19});
    REQUIRE(c.occupied);
    REQUIRE(c.block.has_value());
    CHECK(c.block->kind == PieceKind::L);
    CHECK_FALSE(c.block->active);
    CHECK(c.block->rendered);
    CHECK(b.occupiedCount() == 1);
}

TEST_CASE("Board occupancy is a set", "[board]") {
    Board b{10, 20};

    b.place(landed(0, 0));
    b.place(landed(0, 0));

    REQUIRE(b.occupiedCount() == 1);
}

TEST_CASE("Board rejects placing outside its bounds", "[board]") {
    Board b{10, 20};

    REQUIRE_THROWS_AS(b.place(landed(10, 5)), std::out_of_range);
    REQUIRE_THROWS_AS(b.place(landed(2, 20)), std::out_of_range);
    REQUIRE(b.occupiedCount() == 0);
}

TEST_CASE("Board clears a single full row", "[board][rows]") {
    Board b{4, 4};

    // Fill bottom row (row 3)
    for (int x = 0; x < 4; ++x) {
        b.place(landed(x, 3));
    }

    // Place a block above to check it falls down after the clear
    b.place(landed(0, 2, PieceKind::Z));

    REQUIRE(b.isRowFull(3));
    REQUIRE(b.clearFullRows() == 1);

    // Row 3 should now have what row 2 had before
    REQUIRE(b.isOccupied({0, 3}));
    CHECK(b.cell({0, 3}).block->kind == PieceKind::Z);
    CHECK(b.cell({0, 3}).block->position == GridPosition{0, 3});
    for (int x = 1; x < 4; ++x) {
        REQUIRE_FALSE(b.isOccupied({x, 3}));
    }

    // Row 2 should now be empty
    for (int x = 0; x < 4; ++x) {
        REQUIRE_FALSE(b.isOccupied({x, 2}));
    }
    REQUIRE(b.occupiedCount() == 1);
}

TEST_CASE("Board can clear multiple rows at once", "[board][rows]") {
    Board b{4, 4};

    for (int x = 0; x < 4; ++x) {
        b.place(landed(x, 2));
        b.place(landed(x, 3));
    }
    b.place(landed(1, 1));

    REQUIRE(b.clearFullRows() == 2);

    REQUIRE(b.isOccupied({1, 3}));
    REQUIRE(b.occupiedCount() == 1);
    for (int y = 0; y < 3; ++y) {
        for (int x = 0; x < 4; ++x) {
            REQUIRE_FALSE(b.isOccupied({x, y}));
        }
    }
}

TEST_CASE("Board leaves partial rows alone", "[board][rows]") {
    Board b{4, 4};

    for (int x = 0; x < 3; ++x) {
        b.place(landed(x, 3));
    }

    REQUIRE_FALSE(b.isRowFull(3));
    REQUIRE(b.clearFullRows() == 0);
    REQUIRE(b.occupiedCount() == 3);
    REQUIRE_THROWS_AS(b.isRowFull(4), std::out_of_range);
}
