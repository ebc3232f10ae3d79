#ifndef PEG_COLLABORATORS_HPP
#define PEG_COLLABORATORS_HPP

#include "types.hpp"

namespace peg {

// =============================================================================
// Debt Token Interface
// =============================================================================

// The pegged token. The engine is its only minter; tokens pulled for burning
// sit in engine custody until burn() or refund().
class IDebtToken {
public:
    virtual ~IDebtToken() = default;

    virtual Address id() const = 0;

    virtual bool mint(const AccountId& to, U128 amount_x18) = 0;

    // Move `amount` from `from` into engine custody
    virtual bool pull_for_burn(const AccountId& from, U128 amount_x18) = 0;

    // Destroy `amount` held in engine custody
    virtual void burn(U128 amount_x18) = 0;

    // Return pulled, not yet burned tokens (used when an operation unwinds)
    virtual bool refund(const AccountId& to, U128 amount_x18) = 0;
};

// =============================================================================
// Collateral Transfer Interface
// =============================================================================

class ICollateralTransfer {
public:
    virtual ~ICollateralTransfer() = default;

    // Pull `amount` of `asset` from `from` into engine custody
    virtual bool transfer_in(const AssetId& asset, const AccountId& from, U128 amount_x18) = 0;

    // Send `amount` of `asset` from engine custody to `to`
    virtual bool transfer_out(const AssetId& asset, const AccountId& to, U128 amount_x18) = 0;
};

} // namespace peg

#endif // PEG_COLLABORATORS_HPP
