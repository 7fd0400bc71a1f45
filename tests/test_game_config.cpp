#include <catch2/catch.hpp>

#include "core/GameConfig.hpp"
#include "core/GameState.hpp"

#include <chrono>
#include <limits>
#include <stdexcept>

using namespace rustycubes::core;
using Ms = std::chrono::milliseconds;

TEST_CASE("Default configuration is the classic 10x20 board", "[config]") {
    GameConfig config;

    CHECK(config.columns == 10);
    CHECK(config.rows == 20);
    CHECK(config.spawnAnchor == GridPosition{4, 0});
    CHECK_FALSE(config.clearFullRows);
    CHECK(config.gravityInterval() == Ms{1000});
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Gravity interval derives from updates per second", "[config]") {
    GameConfig config;

    config.updatesPerSecond = 3.0f;
    CHECK(config.gravityInterval() == Ms{333});

    config.updatesPerSecond = 6.0f;
    CHECK(config.gravityInterval() == Ms{166});

    config.updatesPerSecond = 0.0f;
    CHECK_THROWS_AS(config.gravityInterval(), std::invalid_argument);
}

TEST_CASE("Invalid configurations are rejected", "[config]") {
    SECTION("Non-positive board") {
        GameConfig config;
        config.rows = 0;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Board narrower than a piece") {
        GameConfig config;
        config.columns = 3;
        config.spawnAnchor = GridPosition{0, 0};
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Spawn anchor off the board") {
        GameConfig config;
        config.spawnAnchor = GridPosition{10, 0};
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Negative update rate") {
        GameConfig config;
        config.updatesPerSecond = -1.0f;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("NaN update rate") {
        GameConfig config;
        config.updatesPerSecond = std::numeric_limits<float>::quiet_NaN();
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
        REQUIRE_THROWS_AS(config.gravityInterval(), std::invalid_argument);
    }

    SECTION("Infinite update rate") {
        GameConfig config;
        config.updatesPerSecond = std::numeric_limits<float>::infinity();
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Update rate so high the interval is under 1 ms") {
        GameConfig config;
        config.updatesPerSecond = 5000.0f;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Update rate so low the interval does not fit in milliseconds") {
        GameConfig config;
        config.updatesPerSecond = 1e-30f;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
        REQUIRE_THROWS_AS(config.gravityInterval(), std::invalid_argument);
    }

    SECTION("GameState refuses to build from an invalid configuration") {
        GameConfig config;
        config.columns = -4;
        REQUIRE_THROWS_AS(GameState{config}, std::invalid_argument);
    }
}
