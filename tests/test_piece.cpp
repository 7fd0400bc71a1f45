#include <catch2/catch.hpp>

#include "core/Piece.hpp"
#include "core/ShapeCatalog.hpp"
#include "core/Types.hpp"

#include <stdexcept>

using namespace rustycubes::core;

TEST_CASE("Spawned piece has exactly the catalog's active blocks", "[piece]") {
    for (PieceKind kind : allPieceKinds()) {
        Piece p = Piece::spawn(kind);

        REQUIRE(p.kind() == kind);
        REQUIRE(p.anchor() == GridPosition{4, 0});
        REQUIRE_FALSE(p.isLocked());

        int active = 0;
        for (int row = 0; row < PieceFrameSize; ++row) {
            for (int col = 0; col < PieceFrameSize; ++col) {
                const Block& b = p.block(col, row);
                CHECK(b.kind == kind);
                CHECK(b.offset == GridPosition{col, row});
                CHECK(b.active == b.rendered);
                if (b.active) {
                    ++active;
                }
            }
        }
        REQUIRE(active == BlocksPerPiece);

        for (const auto& cell : shapeFor(kind)) {
            CHECK(p.block(cell.x, cell.y).active);
        }
    }
}

TEST_CASE("Positions are anchor plus offset after recompute", "[piece]") {
    Piece p = Piece::spawn(PieceKind::T, GridPosition{2, 3});

    auto checkAll = [&p]() {
        for (const auto& row : p.blocks()) {
            for (const auto& b : row) {
                REQUIRE(b.position == p.anchor() + b.offset);
            }
        }
    };

    checkAll();

    p.translate(3, 5);
    p.recomputePositions();
    REQUIRE(p.anchor() == GridPosition{5, 8});
    checkAll();

    p.translate(-5, -8);
    p.recomputePositions();
    checkAll();
}

TEST_CASE("translate moves the anchor only", "[piece]") {
    Piece p = Piece::spawn(PieceKind::O);
    const GridPosition before = p.block(0, 0).position;

    p.translate(1, 1);

    CHECK(p.anchor() == GridPosition{5, 1});
    // Blocks keep their old positions until recomputed
    CHECK(p.block(0, 0).position == before);

    p.recomputePositions();
    CHECK(p.block(0, 0).position == GridPosition{5, 1});
}

TEST_CASE("activeBlocks lists the shape in row-major order", "[piece]") {
    Piece p = Piece::spawn(PieceKind::O);
    const auto blocks = p.activeBlocks();

    REQUIRE(blocks.size() == 4);
    CHECK(blocks[0].position == GridPosition{4, 0});
    CHECK(blocks[1].position == GridPosition{5, 0});
    CHECK(blocks[2].position == GridPosition{4, 1});
    CHECK(blocks[3].position == GridPosition{5, 1});
    for (const auto& b : blocks) {
        CHECK(b.active);
        CHECK(b.rendered);
        CHECK(b.kind == PieceKind::O);
    }
}

TEST_CASE("Locking a piece is terminal", "[piece]") {
    Piece p = Piece::spawn(PieceKind::S);
    p.markLocked();
    REQUIRE(p.isLocked());

    p.translate(0, 1);
    p.recomputePositions();
    REQUIRE(p.isLocked());
}

TEST_CASE("Block access outside the 4x4 frame throws", "[piece]") {
    Piece p = Piece::spawn(PieceKind::I);

    REQUIRE_THROWS_AS(p.block(4, 0), std::out_of_range);
    REQUIRE_THROWS_AS(p.block(0, 4), std::out_of_range);
    REQUIRE_THROWS_AS(p.block(-1, 0), std::out_of_range);
}
