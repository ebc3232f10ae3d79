#ifndef PEG_ENGINE_HPP
#define PEG_ENGINE_HPP

#include <atomic>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <thread>
#include <vector>

#include "types.hpp"
#include "collaborators.hpp"
#include "errors.hpp"
#include "health.hpp"
#include "ledger.hpp"
#include "oracle.hpp"

namespace peg {

// =============================================================================
// Engine Parameters
// =============================================================================

struct EngineParams {
    uint32_t liquidation_threshold = 50;           // % of collateral value counted toward solvency
    uint32_t liquidation_bonus = 10;               // % of seized collateral paid to the liquidator
    U128 min_health_factor_x18 = MIN_HEALTH_FACTOR;
};

// =============================================================================
// Query Results
// =============================================================================

struct AccountInfo {
    U128 debt_x18;
    U128 collateral_value_usd_x18;
};

struct LiquidationResult {
    AccountId liquidator;
    AccountId target;
    AssetId asset;
    U128 debt_covered_x18;
    U128 collateral_seized_x18;  // Includes bonus
    U128 bonus_x18;
    U128 health_factor_before_x18;
    U128 health_factor_after_x18;
};

// =============================================================================
// AccountingEngine - Collateralized Debt Positions
// =============================================================================

// Every mutating operation is atomic: ledger effects are journaled, the
// health factor is verified, collaborators are called last, and any failure
// unwinds collaborator calls and rolls the journal back. A nested mutating call
// from inside a collaborator fails with ReentrancyError.
class AccountingEngine {
public:
    // `ledger` and `oracle` must be built on the same CollateralRegistry.
    AccountingEngine(PositionLedger& ledger, PriceOracleAdapter& oracle,
                     IDebtToken& debt_token, ICollateralTransfer& collateral,
                     EngineParams params = {});
    ~AccountingEngine();

    // Non-copyable
    AccountingEngine(const AccountingEngine&) = delete;
    AccountingEngine& operator=(const AccountingEngine&) = delete;

    // =========================================================================
    // Collateral
    // =========================================================================

    void deposit_collateral(const AccountId& account, const AssetId& asset, U128 amount_x18);

    void deposit_collateral_and_mint(const AccountId& account, const AssetId& asset,
                                     U128 collateral_x18, U128 debt_x18);

    void redeem_collateral(const AccountId& account, const AssetId& asset, U128 amount_x18);

    // Withdraw from `from`'s position and send the collateral to `to`
    void redeem_collateral(const AccountId& from, const AccountId& to,
                           const AssetId& asset, U128 amount_x18);

    // Burn `debt_x18` then redeem `collateral_x18`, as one unit
    void redeem_collateral_for_debt(const AccountId& account, const AssetId& asset,
                                    U128 collateral_x18, U128 debt_x18);

    // =========================================================================
    // Debt
    // =========================================================================

    void mint(const AccountId& account, U128 amount_x18);
    void burn(const AccountId& account, U128 amount_x18);

    // =========================================================================
    // Liquidation
    // =========================================================================

    LiquidationResult liquidate(const AccountId& liquidator, const AssetId& collateral_asset,
                                const AccountId& target, U128 debt_to_cover_x18);

    // =========================================================================
    // Read-only Queries
    // =========================================================================

    AccountInfo account_information(const AccountId& account) const;
    U128 collateral_value_usd(const AccountId& account) const;
    U128 collateral_balance(const AccountId& account, const AssetId& asset) const;
    U128 health_factor(const AccountId& account) const;
    U128 calculate_health_factor(U128 debt_x18, U128 collateral_usd_x18) const;

    std::vector<AssetId> collateral_assets() const;
    std::optional<PriceFeedId> price_feed_of(const AssetId& asset) const;

    U128 price(const AssetId& asset) const;
    U128 usd_value(const AssetId& asset, U128 amount_x18) const;
    U128 token_amount_for_usd(const AssetId& asset, U128 usd_x18) const;

    // =========================================================================
    // Constants
    // =========================================================================

    U128 precision() const { return X18_ONE; }
    U128 additional_feed_precision(const AssetId& asset) const;
    U128 liquidation_threshold() const { return params_.liquidation_threshold; }
    U128 liquidation_bonus() const { return params_.liquidation_bonus; }
    U128 liquidation_precision() const { return LIQUIDATION_PRECISION; }
    U128 min_health_factor() const { return params_.min_health_factor_x18; }
    Address debt_token() const { return debt_token_.id(); }
    const EngineParams& params() const { return params_; }

private:
    class Interactions;
    class ReadGuard;
    using Operation = std::function<void(Interactions&)>;

    PositionLedger& ledger_;
    PriceOracleAdapter& oracle_;
    IDebtToken& debt_token_;
    ICollateralTransfer& collateral_;
    EngineParams params_;

    // Serializes mutations; readers share. `owner_` is the thread running the
    // current mutation, if any.
    mutable std::shared_mutex mutex_;
    std::atomic<std::thread::id> owner_{};

    // Run `op` as one atomic unit
    void run_atomic(const char* name, const Operation& op);

    // Effects (ledger only, journaled)
    void deposit_effects(const AccountId& account, const AssetId& asset, U128 amount_x18);
    void mint_effects(const AccountId& account, U128 amount_x18);
    void burn_effects(const AccountId& on_behalf_of, U128 amount_x18);
    void redeem_effects(const AccountId& from, const AccountId& to,
                        const AssetId& asset, U128 amount_x18);

    // Invariant checks against the current (uncommitted) ledger state
    void require_health_factor(const AccountId& account, ErrorCode code) const;

    // Unlocked valuation helpers
    U128 collateral_value_of(const AccountId& account) const;
    U128 health_factor_of(const AccountId& account) const;

    void require_allowed(const AssetId& asset) const;
};

} // namespace peg

#endif // PEG_ENGINE_HPP
