// Peg Engine - Liquidation Tests

#include <catch2/catch_test_macros.hpp>

#include <vector>

#include "fixtures.hpp"

using namespace peg;
using namespace peg::test;

namespace {

// `user` holds 10 WETH against 100 debt. `liquidator` holds 100 debt tokens
// minted against WBTC, so WETH price moves leave its position untouched.
struct LiquidationFixture : EngineFixture {
    LiquidationFixture() {
        engine.deposit_collateral_and_mint(user, weth, ether(10), ether(100));
        engine.deposit_collateral_and_mint(liquidator, wbtc, ether(100), ether(100));
    }

    void require_unchanged() {
        REQUIRE(engine.collateral_balance(user, weth) == ether(10));
        REQUIRE(engine.account_information(user).debt_x18 == ether(100));
        REQUIRE(dsc.balance_of(liquidator) == ether(100));
        REQUIRE(dsc.total_supply() == ether(200));
        REQUIRE(dsc.custody() == 0);
        REQUIRE(bank.balance_of(weth, liquidator) == ether(1000));
        REQUIRE(bank.custody(weth) == ether(10));
    }
};

} // anonymous namespace

TEST_CASE_METHOD(LiquidationFixture, "Liquidating an undercollateralized position", "[liquidation]") {
    set_weth_price(18);
    U128 before = engine.health_factor(user);
    REQUIRE(before == X18_ONE * 9 / 10);

    SECTION("Full cover") {
        LiquidationResult result = engine.liquidate(liquidator, weth, user, ether(100));

        // 100 / 18 = 5.555555555555555555 WETH plus a 10% bonus
        REQUIRE(result.debt_covered_x18 == ether(100));
        REQUIRE(result.bonus_x18 == 555555555555555555ULL);
        REQUIRE(result.collateral_seized_x18 == 6111111111111111110ULL);
        REQUIRE(result.health_factor_before_x18 == before);
        REQUIRE(result.health_factor_after_x18 == U128_MAX);

        REQUIRE(engine.account_information(user).debt_x18 == 0);
        REQUIRE(engine.collateral_balance(user, weth) == ether(10) - 6111111111111111110ULL);
        REQUIRE(bank.balance_of(weth, liquidator) == ether(1000) + 6111111111111111110ULL);
        REQUIRE(dsc.balance_of(liquidator) == 0);
        REQUIRE(dsc.total_supply() == ether(100));
        REQUIRE(dsc.custody() == 0);

        // Seized collateral leaves the ledger; it is not credited to the liquidator's position
        REQUIRE(engine.collateral_balance(liquidator, weth) == 0);
    }

    SECTION("Partial cover") {
        LiquidationResult result = engine.liquidate(liquidator, weth, user, ether(50));

        REQUIRE(result.collateral_seized_x18 == 3055555555555555554ULL);
        REQUIRE(result.health_factor_after_x18 > before);
        REQUIRE(engine.health_factor(user) == result.health_factor_after_x18);
        REQUIRE(engine.account_information(user).debt_x18 == ether(50));
        REQUIRE(dsc.balance_of(liquidator) == ether(50));
    }

    SECTION("Collateral redeemed event names the liquidator") {
        std::vector<LedgerEvent> events;
        ledger.subscribe([&events](const LedgerEvent& event) { events.push_back(event); });

        engine.liquidate(liquidator, weth, user, ether(100));

        REQUIRE(events.size() == 1);
        const auto& redeemed = std::get<CollateralRedeemed>(events[0]);
        REQUIRE(redeemed.from == user);
        REQUIRE(redeemed.to == liquidator);
        REQUIRE(redeemed.amount_x18 == 6111111111111111110ULL);
    }
}

TEST_CASE_METHOD(LiquidationFixture, "Healthy positions cannot be liquidated", "[liquidation]") {
    try {
        engine.liquidate(liquidator, weth, user, ether(10));
        FAIL("liquidation should have been rejected");
    } catch (const LiquidationError& e) {
        REQUIRE(e.code() == ErrorCode::HEALTH_FACTOR_OK);
        REQUIRE(e.health_factor() == ether(100));
    }
    require_unchanged();

    SECTION("Account without debt") {
        REQUIRE(error_code_of([&] { engine.liquidate(user, weth, addresses::from_u64(0xCAFE), ether(1)); }) ==
                ErrorCode::HEALTH_FACTOR_OK);
    }
}

TEST_CASE_METHOD(LiquidationFixture, "Liquidation must improve the target", "[liquidation]") {
    // 10 WETH at $10 backs 100 debt at a health factor of 0.5
    set_weth_price(10);

    SECTION("Cover that worsens the ratio") {
        // Seizes 5.5 WETH for 50 debt: 45 * 0.5 / 50 = 0.45
        try {
            engine.liquidate(liquidator, weth, user, ether(50));
            FAIL("liquidation should have been rejected");
        } catch (const LiquidationError& e) {
            REQUIRE(e.code() == ErrorCode::HEALTH_FACTOR_NOT_IMPROVED);
            REQUIRE(e.health_factor() == X18_ONE * 45 / 100);
        }
        require_unchanged();
    }

    SECTION("Seizure larger than the balance") {
        // 100 debt = 10 WETH, plus 1 WETH bonus
        REQUIRE(error_code_of([&] { engine.liquidate(liquidator, weth, user, ether(100)); }) ==
                ErrorCode::INSUFFICIENT_COLLATERAL);
        require_unchanged();
    }
}

TEST_CASE_METHOD(LiquidationFixture, "Liquidation input validation", "[liquidation]") {
    set_weth_price(18);

    SECTION("Zero cover") {
        REQUIRE(error_code_of([&] { engine.liquidate(liquidator, weth, user, 0); }) == ErrorCode::ZERO_AMOUNT);
    }

    SECTION("Disallowed asset") {
        AssetId other{addresses::from_u64(0x999)};
        REQUIRE(error_code_of([&] { engine.liquidate(liquidator, other, user, ether(1)); }) ==
                ErrorCode::ASSET_NOT_ALLOWED);
    }

    SECTION("Asset the target never deposited") {
        REQUIRE(error_code_of([&] { engine.liquidate(liquidator, wbtc, user, ether(1)); }) ==
                ErrorCode::INSUFFICIENT_COLLATERAL);
    }

    SECTION("Liquidator without debt tokens") {
        REQUIRE(dsc.transfer(liquidator, user, ether(100)));
        REQUIRE(error_code_of([&] { engine.liquidate(liquidator, weth, user, ether(100)); }) ==
                ErrorCode::TRANSFER_FAILED);
        REQUIRE(engine.collateral_balance(user, weth) == ether(10));
        REQUIRE(engine.account_information(user).debt_x18 == ether(100));
        REQUIRE(bank.custody(weth) == ether(10));
    }

    SECTION("Stale price") {
        clock.advance(oracle.params().max_staleness + 1);
        REQUIRE(error_code_of([&] { engine.liquidate(liquidator, weth, user, ether(100)); }) ==
                ErrorCode::ORACLE_STALE);
    }

    REQUIRE(dsc.total_supply() == ether(200));
}

TEST_CASE_METHOD(EngineFixture, "Liquidator must stay healthy", "[liquidation]") {
    AccountId target = addresses::from_u64(0x7A6);
    bank.fund(weth, target, ether(10));

    engine.deposit_collateral_and_mint(target, weth, ether(10), ether(100));
    // Liquidator backs its debt tokens with WETH as well
    engine.deposit_collateral_and_mint(liquidator, weth, ether(1), ether(100));

    set_weth_price(18);

    try {
        engine.liquidate(liquidator, weth, target, ether(100));
        FAIL("liquidation should have been rejected");
    } catch (const InvariantViolation& e) {
        REQUIRE(e.code() == ErrorCode::BREAKS_HEALTH_FACTOR);
        REQUIRE(e.health_factor() == X18_ONE * 9 / 100);
    }

    REQUIRE(engine.account_information(target).debt_x18 == ether(100));
    REQUIRE(engine.collateral_balance(target, weth) == ether(10));
    REQUIRE(dsc.balance_of(liquidator) == ether(100));
}
