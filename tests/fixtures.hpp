// Peg Engine - Shared Test Fixtures

#ifndef PEG_TESTS_FIXTURES_HPP
#define PEG_TESTS_FIXTURES_HPP

#include <catch2/catch_tostring.hpp>

#include <memory>
#include <string>

#include "peg/engine.hpp"
#include "peg/errors.hpp"
#include "peg/ledger.hpp"
#include "peg/oracle.hpp"
#include "peg/registry.hpp"
#include "peg/sim.hpp"
#include "peg/x18.hpp"

namespace Catch {

template <>
struct StringMaker<unsigned __int128> {
    static std::string convert(unsigned __int128 value) {
        return peg::x18::to_raw_string(value);
    }
};

template <>
struct StringMaker<peg::ErrorCode> {
    static std::string convert(peg::ErrorCode code) {
        return peg::to_string(code);
    }
};

} // namespace Catch

namespace peg {
namespace test {

constexpr uint64_t START_TIME = 1700000000;

inline U128 ether(uint64_t n) { return x18::from_int(n); }

// 8-decimal aggregator answer for a whole-dollar price
inline I128 feed_price(uint64_t usd) { return static_cast<I128>(usd) * 100000000; }

// Code of the peg::Error thrown by `fn`, or OK if it returns normally
template <typename Fn>
ErrorCode error_code_of(Fn&& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.code();
    }
    return ErrorCode::OK;
}

// Registry of two assets (WETH at $2000, WBTC at $1000), manual clock,
// oracle, ledger and debt token.
struct MarketFixture {
    AssetId weth{addresses::from_u64(0xE7E)};
    AssetId wbtc{addresses::from_u64(0xB7C)};
    PriceFeedId weth_feed_id{addresses::from_u64(0xF1)};
    PriceFeedId wbtc_feed_id{addresses::from_u64(0xF2)};

    AccountId user = addresses::from_u64(0xA11CE);
    AccountId liquidator = addresses::from_u64(0xB0B);

    CollateralRegistry registry{{weth, wbtc}, {weth_feed_id, wbtc_feed_id}};
    sim::ManualClock clock{START_TIME};
    std::shared_ptr<sim::SimPriceFeed> weth_feed =
        std::make_shared<sim::SimPriceFeed>(8, feed_price(2000), START_TIME);
    std::shared_ptr<sim::SimPriceFeed> wbtc_feed =
        std::make_shared<sim::SimPriceFeed>(8, feed_price(1000), START_TIME);
    PriceOracleAdapter oracle{registry,
                              PriceFeedMap{{weth_feed_id, weth_feed}, {wbtc_feed_id, wbtc_feed}},
                              OracleParams{}, clock.clock()};
    PositionLedger ledger{registry};
    sim::SimDebtToken dsc;

    void set_weth_price(uint64_t usd) { weth_feed->update_answer(feed_price(usd), clock.now()); }
    void set_wbtc_price(uint64_t usd) { wbtc_feed->update_answer(feed_price(usd), clock.now()); }
};

// Engine over the market; `user` and `liquidator` hold 1000 of each asset.
struct EngineFixture : MarketFixture {
    sim::SimCollateralBank bank;
    AccountingEngine engine{ledger, oracle, dsc, bank};

    EngineFixture() {
        for (const auto& holder : {user, liquidator}) {
            bank.fund(weth, holder, ether(1000));
            bank.fund(wbtc, holder, ether(1000));
        }
    }
};

} // namespace test
} // namespace peg

#endif // PEG_TESTS_FIXTURES_HPP
