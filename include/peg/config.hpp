#ifndef PEG_CONFIG_HPP
#define PEG_CONFIG_HPP

#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"
#include "engine.hpp"
#include "oracle.hpp"
#include "registry.hpp"

namespace peg {

// =============================================================================
// Engine Configuration (JSON)
// =============================================================================

// {
//   "log_level": "info",
//   "debt_token": "0x...",
//   "collateral_assets": ["0x...", ...],
//   "price_feeds": ["0x...", ...],
//   "symbols": ["WETH", ...],
//   "liquidation_threshold": 50,
//   "liquidation_bonus": 10,
//   "min_health_factor": "1",
//   "oracle": { "max_staleness_seconds": 10800 }
// }
struct EngineConfig {
    std::string log_level = "info";
    Address debt_token{};
    std::vector<AssetId> collateral_assets;
    std::vector<PriceFeedId> price_feeds;
    std::vector<std::string> symbols;  // Optional, parallel to collateral_assets
    EngineParams engine;
    OracleParams oracle;

    // Throw ValidationError(INVALID_CONFIG) on unreadable or malformed input
    static EngineConfig from_file(std::string_view path);
    static EngineConfig from_json(std::string_view content);

    // Throws ValidationError(LENGTH_MISMATCH) if the parallel arrays differ
    CollateralRegistry make_registry() const;

    // Symbol for an asset, or its hex address if none was configured
    std::string symbol_of(const AssetId& asset) const;
};

// Set the spdlog level ("trace", "debug", "info", "warn", "error", "critical", "off")
void configure_logging(const std::string& level);

} // namespace peg

#endif // PEG_CONFIG_HPP
