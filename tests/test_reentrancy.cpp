// Peg Engine - Reentrancy and Concurrency Tests

#include <catch2/catch_test_macros.hpp>

#include <functional>
#include <thread>
#include <vector>

#include "fixtures.hpp"

using namespace peg;
using namespace peg::test;

namespace {

// Collateral bank that runs a callback from inside transfer_in
class CallbackBank : public sim::SimCollateralBank {
public:
    std::function<void()> on_transfer_in;

    bool transfer_in(const AssetId& asset, const AccountId& from, U128 amount_x18) override {
        if (on_transfer_in) {
            auto callback = std::move(on_transfer_in);
            on_transfer_in = nullptr;
            callback();
        }
        return SimCollateralBank::transfer_in(asset, from, amount_x18);
    }
};

struct ReentrancyFixture : MarketFixture {
    CallbackBank bank;
    AccountingEngine engine{ledger, oracle, dsc, bank};

    ReentrancyFixture() {
        bank.fund(weth, user, ether(100));
    }
};

} // anonymous namespace

TEST_CASE_METHOD(ReentrancyFixture, "Nested mutation from a collaborator is rejected", "[reentrancy]") {
    SECTION("Collaborator swallows the rejection") {
        ErrorCode nested = ErrorCode::OK;
        bank.on_transfer_in = [&] {
            try {
                engine.deposit_collateral(user, weth, ether(1));
            } catch (const ReentrancyError& e) {
                nested = e.code();
            }
        };

        engine.deposit_collateral(user, weth, ether(10));

        REQUIRE(nested == ErrorCode::REENTRANCY);
        REQUIRE(engine.collateral_balance(user, weth) == ether(10));
        REQUIRE(bank.custody(weth) == ether(10));
    }

    SECTION("Rejection propagates and the outer call rolls back") {
        bank.on_transfer_in = [&] { engine.mint(user, ether(1)); };

        REQUIRE(error_code_of([&] { engine.deposit_collateral(user, weth, ether(10)); }) ==
                ErrorCode::REENTRANCY);
        REQUIRE(engine.collateral_balance(user, weth) == 0);
        REQUIRE(engine.account_information(user).debt_x18 == 0);
        REQUIRE(bank.balance_of(weth, user) == ether(100));
        REQUIRE(bank.custody(weth) == 0);
    }

    SECTION("Every mutating entry point is guarded") {
        engine.deposit_collateral_and_mint(user, weth, ether(10), ether(100));

        std::vector<std::function<void()>> nested_calls = {
            [&] { engine.deposit_collateral(user, weth, ether(1)); },
            [&] { engine.deposit_collateral_and_mint(user, weth, ether(1), ether(1)); },
            [&] { engine.redeem_collateral(user, weth, ether(1)); },
            [&] { engine.redeem_collateral_for_debt(user, weth, ether(1), ether(1)); },
            [&] { engine.mint(user, ether(1)); },
            [&] { engine.burn(user, ether(1)); },
            [&] { engine.liquidate(liquidator, weth, user, ether(1)); },
        };

        for (const auto& call : nested_calls) {
            ErrorCode nested = ErrorCode::OK;
            bank.on_transfer_in = [&] { nested = error_code_of(call); };
            engine.deposit_collateral(user, weth, ether(1));
            REQUIRE(nested == ErrorCode::REENTRANCY);
        }

        REQUIRE(engine.collateral_balance(user, weth) == ether(17));
        REQUIRE(engine.account_information(user).debt_x18 == ether(100));
    }
}

TEST_CASE_METHOD(ReentrancyFixture, "Queries from a collaborator see in-progress state", "[reentrancy]") {
    U128 seen = 0;
    bank.on_transfer_in = [&] { seen = engine.collateral_balance(user, weth); };

    engine.deposit_collateral(user, weth, ether(4));

    REQUIRE(seen == ether(4));
}

TEST_CASE("Concurrent deposits are serialized", "[reentrancy]") {
    MarketFixture m;
    sim::SimCollateralBank bank;
    AccountingEngine engine(m.ledger, m.oracle, m.dsc, bank);

    constexpr int THREADS = 4;
    constexpr int DEPOSITS = 50;

    std::vector<AccountId> accounts;
    for (int t = 0; t < THREADS; ++t) {
        accounts.push_back(addresses::from_u64(0x1000 + t));
        bank.fund(m.wbtc, accounts.back(), ether(DEPOSITS));
    }

    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&engine, &m, account = accounts[t]] {
            for (int i = 0; i < DEPOSITS; ++i) {
                engine.deposit_collateral(account, m.wbtc, ether(1));
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    for (const auto& account : accounts) {
        REQUIRE(engine.collateral_balance(account, m.wbtc) == ether(DEPOSITS));
    }
    REQUIRE(bank.custody(m.wbtc) == ether(THREADS * DEPOSITS));
}
