#ifndef PEG_REGISTRY_HPP
#define PEG_REGISTRY_HPP

#include <map>
#include <optional>
#include <vector>

#include "types.hpp"

namespace peg {

// =============================================================================
// CollateralRegistry - Approved Collateral Assets
// =============================================================================

// Immutable after construction. Enumeration follows registration order so
// every full-portfolio valuation sums in the same order.
class CollateralRegistry {
public:
    // Parallel sequences: assets[i] is priced by price_feeds[i].
    // Throws ValidationError(LENGTH_MISMATCH) or (INVALID_CONFIG) on duplicates.
    CollateralRegistry(const std::vector<AssetId>& assets,
                       const std::vector<PriceFeedId>& price_feeds);

    bool is_allowed(const AssetId& asset) const;
    const std::vector<AssetId>& enumerate() const { return assets_; }
    std::optional<PriceFeedId> price_feed_of(const AssetId& asset) const;
    size_t size() const { return assets_.size(); }

private:
    std::vector<AssetId> assets_;
    std::map<AssetId, PriceFeedId> price_feeds_;
};

} // namespace peg

#endif // PEG_REGISTRY_HPP
