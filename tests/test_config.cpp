// Peg Engine - Configuration Tests

#include <catch2/catch_test_macros.hpp>

#include <spdlog/spdlog.h>

#include "peg/config.hpp"
#include "fixtures.hpp"

using namespace peg;
using namespace peg::test;

namespace {

const char* VALID_CONFIG = R"({
    "log_level": "warn",
    "debt_token": "0x0000000000000000000000000000000000000d5c",
    "collateral_assets": [
        "0x0000000000000000000000000000000000000e7e",
        "0x0000000000000000000000000000000000000b7c"
    ],
    "price_feeds": [
        "0x00000000000000000000000000000000000000f1",
        "0x00000000000000000000000000000000000000f2"
    ],
    "symbols": ["WETH", "WBTC"],
    "liquidation_threshold": 60,
    "liquidation_bonus": 5,
    "min_health_factor": "1.5",
    "oracle": { "max_staleness_seconds": 3600 }
})";

} // anonymous namespace

TEST_CASE("Config from JSON", "[config]") {
    SECTION("All fields") {
        EngineConfig config = EngineConfig::from_json(VALID_CONFIG);

        REQUIRE(config.log_level == "warn");
        REQUIRE(config.debt_token == addresses::from_u64(0xD5C));
        REQUIRE(config.collateral_assets.size() == 2);
        REQUIRE(config.collateral_assets[0] == AssetId{addresses::from_u64(0xE7E)});
        REQUIRE(config.price_feeds[1] == PriceFeedId{addresses::from_u64(0xF2)});
        REQUIRE(config.engine.liquidation_threshold == 60);
        REQUIRE(config.engine.liquidation_bonus == 5);
        REQUIRE(config.engine.min_health_factor_x18 == X18_ONE + X18_ONE / 2);
        REQUIRE(config.oracle.max_staleness == 3600);

        REQUIRE(config.symbol_of(config.collateral_assets[1]) == "WBTC");
        AssetId unknown{addresses::from_u64(0x999)};
        REQUIRE(config.symbol_of(unknown) == unknown.to_hex());
    }

    SECTION("Defaults") {
        EngineConfig config = EngineConfig::from_json("{}");

        REQUIRE(config.log_level == "info");
        REQUIRE(config.collateral_assets.empty());
        REQUIRE(config.engine.liquidation_threshold == 50);
        REQUIRE(config.engine.liquidation_bonus == 10);
        REQUIRE(config.engine.min_health_factor_x18 == MIN_HEALTH_FACTOR);
        REQUIRE(config.oracle.max_staleness == 10800);
    }

    SECTION("Registry from config") {
        EngineConfig config = EngineConfig::from_json(VALID_CONFIG);
        CollateralRegistry registry = config.make_registry();

        REQUIRE(registry.size() == 2);
        REQUIRE(registry.enumerate()[0] == config.collateral_assets[0]);
        REQUIRE(registry.price_feed_of(config.collateral_assets[1]) == config.price_feeds[1]);
    }
}

TEST_CASE("Config rejects bad input", "[config]") {
    SECTION("Malformed JSON") {
        REQUIRE(error_code_of([] { EngineConfig::from_json("{ not json"); }) == ErrorCode::INVALID_CONFIG);
    }

    SECTION("Wrong field type") {
        REQUIRE(error_code_of([] { EngineConfig::from_json(R"({"liquidation_threshold": "fifty"})"); }) ==
                ErrorCode::INVALID_CONFIG);
        REQUIRE(error_code_of([] { EngineConfig::from_json(R"({"collateral_assets": "0x00"})"); }) ==
                ErrorCode::INVALID_CONFIG);
    }

    SECTION("Percentage out of range") {
        REQUIRE(error_code_of([] { EngineConfig::from_json(R"({"liquidation_bonus": 101})"); }) ==
                ErrorCode::INVALID_CONFIG);
    }

    SECTION("Bad address") {
        REQUIRE(error_code_of([] { EngineConfig::from_json(R"({"debt_token": "0x1234"})"); }) ==
                ErrorCode::INVALID_CONFIG);
    }

    SECTION("Symbols do not match assets") {
        REQUIRE(error_code_of([] {
            EngineConfig::from_json(R"({
                "collateral_assets": ["0x0000000000000000000000000000000000000e7e"],
                "price_feeds": ["0x00000000000000000000000000000000000000f1"],
                "symbols": ["WETH", "WBTC"]
            })");
        }) == ErrorCode::LENGTH_MISMATCH);
    }

    SECTION("Feeds do not match assets") {
        EngineConfig config = EngineConfig::from_json(R"({
            "collateral_assets": ["0x0000000000000000000000000000000000000e7e"],
            "price_feeds": []
        })");
        REQUIRE(error_code_of([&] { config.make_registry(); }) == ErrorCode::LENGTH_MISMATCH);
    }

    SECTION("Missing file") {
        REQUIRE(error_code_of([] { EngineConfig::from_file("/nonexistent/peg.json"); }) ==
                ErrorCode::INVALID_CONFIG);
    }
}

TEST_CASE("Logging level", "[config]") {
    auto previous = spdlog::get_level();

    configure_logging("debug");
    REQUIRE(spdlog::get_level() == spdlog::level::debug);

    configure_logging("off");
    REQUIRE(spdlog::get_level() == spdlog::level::off);

    REQUIRE(error_code_of([] { configure_logging("loud"); }) == ErrorCode::INVALID_CONFIG);

    spdlog::set_level(previous);
}
