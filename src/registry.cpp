// =============================================================================
// registry.cpp - CollateralRegistry Implementation
// =============================================================================

#include "peg/registry.hpp"
#include "peg/errors.hpp"

#include <string>

namespace peg {

CollateralRegistry::CollateralRegistry(const std::vector<AssetId>& assets,
                                       const std::vector<PriceFeedId>& price_feeds) {
    if (assets.size() != price_feeds.size()) {
        throw ValidationError(ErrorCode::LENGTH_MISMATCH,
                              "collateral assets (" + std::to_string(assets.size()) +
                              ") and price feeds (" + std::to_string(price_feeds.size()) +
                              ") differ in length");
    }

    for (size_t i = 0; i < assets.size(); ++i) {
        if (!price_feeds_.emplace(assets[i], price_feeds[i]).second) {
            throw ValidationError(ErrorCode::INVALID_CONFIG,
                                  "duplicate collateral asset " + assets[i].to_hex());
        }
        assets_.push_back(assets[i]);
    }
}

bool CollateralRegistry::is_allowed(const AssetId& asset) const {
    return price_feeds_.find(asset) != price_feeds_.end();
}

std::optional<PriceFeedId> CollateralRegistry::price_feed_of(const AssetId& asset) const {
    auto it = price_feeds_.find(asset);
    if (it == price_feeds_.end()) return std::nullopt;
    return it->second;
}

} // namespace peg
