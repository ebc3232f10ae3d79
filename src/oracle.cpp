// =============================================================================
// oracle.cpp - PriceOracleAdapter Implementation
// =============================================================================

#include "peg/oracle.hpp"
#include "peg/errors.hpp"
#include "peg/x18.hpp"

#include <chrono>
#include <string>

#include <spdlog/spdlog.h>

namespace peg {

Clock system_clock() {
    return [] {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()
            ).count()
        );
    };
}

// =============================================================================
// Constructor
// =============================================================================

PriceOracleAdapter::PriceOracleAdapter(const CollateralRegistry& registry, PriceFeedMap feeds,
                                       OracleParams params, Clock clock)
    : registry_(registry), params_(params), clock_(std::move(clock)) {
    for (const auto& asset : registry_.enumerate()) {
        PriceFeedId feed_id = *registry_.price_feed_of(asset);
        auto it = feeds.find(feed_id);
        if (it == feeds.end() || !it->second) {
            throw ValidationError(ErrorCode::INVALID_CONFIG,
                                  "no price feed " + feed_id.to_hex() + " for asset " + asset.to_hex());
        }

        uint8_t decimals = it->second->decimals();
        if (decimals > 18) {
            throw ValidationError(ErrorCode::INVALID_CONFIG,
                                  "price feed " + feed_id.to_hex() + " reports " +
                                  std::to_string(decimals) + " decimals (max 18)");
        }
        feeds_[asset] = BoundFeed{it->second, x18::pow10(18u - decimals)};
    }
}

// =============================================================================
// Price Queries
// =============================================================================

const PriceOracleAdapter::BoundFeed& PriceOracleAdapter::bound_feed(const AssetId& asset) const {
    auto it = feeds_.find(asset);
    if (it == feeds_.end()) {
        throw OracleError(ErrorCode::ORACLE_UNAVAILABLE, "no price feed for asset " + asset.to_hex());
    }
    return it->second;
}

U128 PriceOracleAdapter::price(const AssetId& asset) const {
    const BoundFeed& bound = bound_feed(asset);

    auto reading = bound.feed->latest_round();
    if (!reading) {
        spdlog::warn("price feed unavailable for asset {}", asset.to_hex());
        throw OracleError(ErrorCode::ORACLE_UNAVAILABLE, "price feed unavailable for asset " + asset.to_hex());
    }

    uint64_t now = clock_();
    uint64_t age = now > reading->updated_at ? now - reading->updated_at : 0;
    if (age > params_.max_staleness) {
        spdlog::warn("stale price for asset {}: age {}s exceeds {}s",
                     asset.to_hex(), age, params_.max_staleness);
        throw OracleError(ErrorCode::ORACLE_STALE,
                          "stale price for asset " + asset.to_hex() + " (age " + std::to_string(age) + "s)");
    }

    if (reading->answer <= 0) {
        throw OracleError(ErrorCode::INVALID_PRICE, "non-positive price for asset " + asset.to_hex());
    }

    U128 answer = static_cast<U128>(reading->answer);
    if (answer > U128_MAX / bound.multiplier) {
        throw OracleError(ErrorCode::INVALID_PRICE, "price out of range for asset " + asset.to_hex());
    }
    return answer * bound.multiplier;
}

U128 PriceOracleAdapter::usd_value(const AssetId& asset, U128 amount_x18) const {
    return x18::mul_div(amount_x18, price(asset), X18_ONE);
}

U128 PriceOracleAdapter::token_amount_for_usd(const AssetId& asset, U128 usd_x18) const {
    return x18::mul_div(usd_x18, X18_ONE, price(asset));
}

U128 PriceOracleAdapter::feed_precision_multiplier(const AssetId& asset) const {
    return bound_feed(asset).multiplier;
}

} // namespace peg
