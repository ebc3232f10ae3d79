#ifndef PEG_ORACLE_HPP
#define PEG_ORACLE_HPP

#include <functional>
#include <map>
#include <memory>
#include <optional>

#include "types.hpp"
#include "registry.hpp"

namespace peg {

// =============================================================================
// Price Feed Interface (external aggregator)
// =============================================================================

struct PriceReading {
    I128 answer;          // Feed-native scale (e.g., 8 decimals)
    uint64_t updated_at;  // Seconds since epoch
};

class IPriceFeed {
public:
    virtual ~IPriceFeed() = default;

    virtual uint8_t decimals() const = 0;

    // Latest round; nullopt when the source cannot be reached
    virtual std::optional<PriceReading> latest_round() = 0;
};

using PriceFeedMap = std::map<PriceFeedId, std::shared_ptr<IPriceFeed>>;

// Current time in seconds
using Clock = std::function<uint64_t()>;

Clock system_clock();

// =============================================================================
// Oracle Configuration
// =============================================================================

struct OracleParams {
    uint64_t max_staleness = 3 * 60 * 60;  // Maximum reading age in seconds
};

// =============================================================================
// PriceOracleAdapter - Normalized Prices and USD Conversion
// =============================================================================

// All conversions are integer-only and floor.
class PriceOracleAdapter {
public:
    // Every asset in `registry` must have its feed in `feeds`.
    // Throws ValidationError(INVALID_CONFIG) otherwise.
    PriceOracleAdapter(const CollateralRegistry& registry, PriceFeedMap feeds,
                       OracleParams params = {}, Clock clock = system_clock());

    // Non-copyable
    PriceOracleAdapter(const PriceOracleAdapter&) = delete;
    PriceOracleAdapter& operator=(const PriceOracleAdapter&) = delete;

    // Normalized x18 unit price. Throws OracleError.
    U128 price(const AssetId& asset) const;

    // amount * price / 1e18
    U128 usd_value(const AssetId& asset, U128 amount_x18) const;

    // usd * 1e18 / price
    U128 token_amount_for_usd(const AssetId& asset, U128 usd_x18) const;

    // Multiplier lifting the feed-native scale to 18 decimals (1e10 for 8-decimal feeds)
    U128 feed_precision_multiplier(const AssetId& asset) const;

    const CollateralRegistry& registry() const { return registry_; }
    const OracleParams& params() const { return params_; }
    uint64_t now() const { return clock_(); }

private:
    struct BoundFeed {
        std::shared_ptr<IPriceFeed> feed;
        U128 multiplier;
    };

    const CollateralRegistry& registry_;
    std::map<AssetId, BoundFeed> feeds_;
    OracleParams params_;
    Clock clock_;

    const BoundFeed& bound_feed(const AssetId& asset) const;
};

} // namespace peg

#endif // PEG_ORACLE_HPP
