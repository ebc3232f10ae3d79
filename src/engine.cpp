// =============================================================================
// engine.cpp - AccountingEngine Implementation
// =============================================================================

#include "peg/engine.hpp"
#include "peg/x18.hpp"

#include <mutex>
#include <string>

#include <spdlog/spdlog.h>

namespace peg {

// =============================================================================
// Interactions - Collaborator Calls with Compensation
// =============================================================================

// Calls are issued pull-first, push-after, mint/burn last. Every completed
// reversible call records its compensating call; unwind() replays them in
// reverse when a later step fails.
class AccountingEngine::Interactions {
public:
    Interactions(IDebtToken& debt_token, ICollateralTransfer& collateral)
        : debt_token_(debt_token), collateral_(collateral) {}

    void pull_collateral(const AssetId& asset, const AccountId& from, U128 amount_x18) {
        if (!collateral_.transfer_in(asset, from, amount_x18)) {
            throw CollaboratorError(ErrorCode::TRANSFER_FAILED,
                                    "collateral transfer in refused for " + addresses::to_hex(from));
        }
        compensations_.push_back({"return collateral", [this, asset, from, amount_x18] {
            return collateral_.transfer_out(asset, from, amount_x18);
        }});
    }

    void push_collateral(const AssetId& asset, const AccountId& to, U128 amount_x18) {
        if (!collateral_.transfer_out(asset, to, amount_x18)) {
            throw CollaboratorError(ErrorCode::TRANSFER_FAILED,
                                    "collateral transfer out refused for " + addresses::to_hex(to));
        }
        compensations_.push_back({"recover collateral", [this, asset, to, amount_x18] {
            return collateral_.transfer_in(asset, to, amount_x18);
        }});
    }

    void pull_debt(const AccountId& from, U128 amount_x18) {
        if (!debt_token_.pull_for_burn(from, amount_x18)) {
            throw CollaboratorError(ErrorCode::TRANSFER_FAILED,
                                    "debt token transfer refused for " + addresses::to_hex(from));
        }
        compensations_.push_back({"refund debt token", [this, from, amount_x18] {
            return debt_token_.refund(from, amount_x18);
        }});
    }

    void mint_debt(const AccountId& to, U128 amount_x18) {
        if (!debt_token_.mint(to, amount_x18)) {
            throw CollaboratorError(ErrorCode::MINT_FAILED,
                                    "debt token mint refused for " + addresses::to_hex(to));
        }
    }

    void burn_debt(U128 amount_x18) {
        debt_token_.burn(amount_x18);
    }

    void unwind() {
        for (auto it = compensations_.rbegin(); it != compensations_.rend(); ++it) {
            try {
                if (!it->undo()) {
                    spdlog::critical("compensation failed: {}", it->description);
                }
            } catch (const std::exception& e) {
                spdlog::critical("compensation threw: {}: {}", it->description, e.what());
            }
        }
        compensations_.clear();
    }

private:
    struct Compensation {
        std::string description;
        std::function<bool()> undo;
    };

    IDebtToken& debt_token_;
    ICollateralTransfer& collateral_;
    std::vector<Compensation> compensations_;
};

// =============================================================================
// ReadGuard - Shared Lock Unless Called From Inside an Operation
// =============================================================================

class AccountingEngine::ReadGuard {
public:
    explicit ReadGuard(const AccountingEngine& engine) {
        if (engine.owner_.load() != std::this_thread::get_id()) {
            lock_ = std::shared_lock<std::shared_mutex>(engine.mutex_);
        }
    }

private:
    std::shared_lock<std::shared_mutex> lock_;
};

namespace {

class OwnerScope {
public:
    explicit OwnerScope(std::atomic<std::thread::id>& owner) : owner_(owner) {
        owner_.store(std::this_thread::get_id());
    }
    ~OwnerScope() { owner_.store(std::thread::id()); }

    OwnerScope(const OwnerScope&) = delete;
    OwnerScope& operator=(const OwnerScope&) = delete;

private:
    std::atomic<std::thread::id>& owner_;
};

} // anonymous namespace

// =============================================================================
// Constructor
// =============================================================================

AccountingEngine::AccountingEngine(PositionLedger& ledger, PriceOracleAdapter& oracle,
                                   IDebtToken& debt_token, ICollateralTransfer& collateral,
                                   EngineParams params)
    : ledger_(ledger), oracle_(oracle), debt_token_(debt_token),
      collateral_(collateral), params_(params) {
    if (&ledger_.registry() != &oracle_.registry()) {
        throw ValidationError(ErrorCode::INVALID_CONFIG, "ledger and oracle use different registries");
    }
    if (params_.liquidation_threshold == 0 || params_.liquidation_threshold > LIQUIDATION_PRECISION) {
        throw ValidationError(ErrorCode::INVALID_CONFIG, "liquidation threshold must be in 1..100");
    }
    if (params_.liquidation_bonus >= LIQUIDATION_PRECISION) {
        throw ValidationError(ErrorCode::INVALID_CONFIG, "liquidation bonus must be below 100");
    }
    if (params_.min_health_factor_x18 == 0) {
        throw ValidationError(ErrorCode::INVALID_CONFIG, "minimum health factor must be positive");
    }

    spdlog::info("accounting engine ready: {} collateral assets, threshold {}%, bonus {}%",
                 ledger_.registry().size(), params_.liquidation_threshold, params_.liquidation_bonus);
}

AccountingEngine::~AccountingEngine() = default;

// =============================================================================
// Atomic Execution
// =============================================================================

void AccountingEngine::run_atomic(const char* name, const Operation& op) {
    if (owner_.load() == std::this_thread::get_id()) {
        spdlog::warn("{} rejected: operation already in progress", name);
        throw ReentrancyError(std::string(name) + ": reentrant call rejected");
    }

    std::vector<LedgerEvent> events;
    {
        std::unique_lock lock(mutex_);
        OwnerScope owner(owner_);

        ledger_.begin();
        Interactions interactions(debt_token_, collateral_);

        try {
            op(interactions);
        } catch (...) {
            spdlog::warn("{} failed, rolling back", name);
            ledger_.rollback();
            interactions.unwind();
            throw;
        }

        events = ledger_.commit();
        spdlog::debug("{} committed", name);
    }

    // Listeners run outside the lock and may call back into the engine
    ledger_.publish(events);
}

// =============================================================================
// Collateral
// =============================================================================

void AccountingEngine::deposit_collateral(const AccountId& account, const AssetId& asset, U128 amount_x18) {
    run_atomic("deposit_collateral", [&](Interactions& io) {
        deposit_effects(account, asset, amount_x18);
        io.pull_collateral(asset, account, amount_x18);
    });
}

void AccountingEngine::deposit_collateral_and_mint(const AccountId& account, const AssetId& asset,
                                                   U128 collateral_x18, U128 debt_x18) {
    run_atomic("deposit_collateral_and_mint", [&](Interactions& io) {
        deposit_effects(account, asset, collateral_x18);
        mint_effects(account, debt_x18);
        require_health_factor(account, ErrorCode::BREAKS_HEALTH_FACTOR);

        io.pull_collateral(asset, account, collateral_x18);
        io.mint_debt(account, debt_x18);
    });
}

void AccountingEngine::redeem_collateral(const AccountId& account, const AssetId& asset, U128 amount_x18) {
    redeem_collateral(account, account, asset, amount_x18);
}

void AccountingEngine::redeem_collateral(const AccountId& from, const AccountId& to,
                                         const AssetId& asset, U128 amount_x18) {
    run_atomic("redeem_collateral", [&](Interactions& io) {
        redeem_effects(from, to, asset, amount_x18);
        require_health_factor(from, ErrorCode::HEALTH_FACTOR_BROKEN);

        io.push_collateral(asset, to, amount_x18);
    });
}

void AccountingEngine::redeem_collateral_for_debt(const AccountId& account, const AssetId& asset,
                                                  U128 collateral_x18, U128 debt_x18) {
    run_atomic("redeem_collateral_for_debt", [&](Interactions& io) {
        burn_effects(account, debt_x18);
        redeem_effects(account, account, asset, collateral_x18);
        require_health_factor(account, ErrorCode::HEALTH_FACTOR_BROKEN);

        io.pull_debt(account, debt_x18);
        io.push_collateral(asset, account, collateral_x18);
        io.burn_debt(debt_x18);
    });
}

// =============================================================================
// Debt
// =============================================================================

void AccountingEngine::mint(const AccountId& account, U128 amount_x18) {
    run_atomic("mint", [&](Interactions& io) {
        mint_effects(account, amount_x18);
        require_health_factor(account, ErrorCode::BREAKS_HEALTH_FACTOR);

        io.mint_debt(account, amount_x18);
    });
}

void AccountingEngine::burn(const AccountId& account, U128 amount_x18) {
    run_atomic("burn", [&](Interactions& io) {
        burn_effects(account, amount_x18);
        // Burning only lowers debt; kept so the invariant is checked on every path
        require_health_factor(account, ErrorCode::BREAKS_HEALTH_FACTOR);

        io.pull_debt(account, amount_x18);
        io.burn_debt(amount_x18);
    });
}

// =============================================================================
// Liquidation
// =============================================================================

LiquidationResult AccountingEngine::liquidate(const AccountId& liquidator, const AssetId& collateral_asset,
                                              const AccountId& target, U128 debt_to_cover_x18) {
    LiquidationResult result{};

    run_atomic("liquidate", [&](Interactions& io) {
        if (debt_to_cover_x18 == 0) {
            throw ValidationError(ErrorCode::ZERO_AMOUNT, "debt to cover must be greater than zero");
        }
        require_allowed(collateral_asset);

        U128 before = health_factor_of(target);
        if (HealthFactorCalculator::is_healthy(before, params_.min_health_factor_x18)) {
            throw LiquidationError(ErrorCode::HEALTH_FACTOR_OK,
                                   "target health factor " + x18::to_string(before) + " is not below minimum",
                                   before);
        }

        U128 equivalent = oracle_.token_amount_for_usd(collateral_asset, debt_to_cover_x18);
        U128 bonus = x18::mul_div(equivalent, params_.liquidation_bonus, LIQUIDATION_PRECISION);
        U128 seized = x18::checked_add(equivalent, bonus);

        U128 available = ledger_.collateral_balance(target, collateral_asset);
        if (seized > available) {
            throw LedgerError(ErrorCode::INSUFFICIENT_COLLATERAL,
                              "seizure of " + x18::to_string(seized) + " exceeds target balance " +
                              x18::to_string(available));
        }

        redeem_effects(target, liquidator, collateral_asset, seized);
        burn_effects(target, debt_to_cover_x18);

        U128 after = health_factor_of(target);
        if (after <= before) {
            throw LiquidationError(ErrorCode::HEALTH_FACTOR_NOT_IMPROVED,
                                   "target health factor " + x18::to_string(after) +
                                   " not above " + x18::to_string(before),
                                   after);
        }
        require_health_factor(liquidator, ErrorCode::BREAKS_HEALTH_FACTOR);

        io.pull_debt(liquidator, debt_to_cover_x18);
        io.push_collateral(collateral_asset, liquidator, seized);
        io.burn_debt(debt_to_cover_x18);

        result = LiquidationResult{liquidator, target, collateral_asset, debt_to_cover_x18,
                                   seized, bonus, before, after};
    });

    spdlog::info("liquidated {}: covered {} debt, seized {} of {} (bonus {})",
                 addresses::to_hex(target), x18::to_string(debt_to_cover_x18),
                 x18::to_string(result.collateral_seized_x18), collateral_asset.to_hex(),
                 x18::to_string(result.bonus_x18));
    return result;
}

// =============================================================================
// Read-only Queries
// =============================================================================

AccountInfo AccountingEngine::account_information(const AccountId& account) const {
    ReadGuard guard(*this);
    return AccountInfo{ledger_.debt_of(account), collateral_value_of(account)};
}

U128 AccountingEngine::collateral_value_usd(const AccountId& account) const {
    ReadGuard guard(*this);
    return collateral_value_of(account);
}

U128 AccountingEngine::collateral_balance(const AccountId& account, const AssetId& asset) const {
    ReadGuard guard(*this);
    return ledger_.collateral_balance(account, asset);
}

U128 AccountingEngine::health_factor(const AccountId& account) const {
    ReadGuard guard(*this);
    return health_factor_of(account);
}

U128 AccountingEngine::calculate_health_factor(U128 debt_x18, U128 collateral_usd_x18) const {
    return HealthFactorCalculator::compute(debt_x18, collateral_usd_x18, params_.liquidation_threshold);
}

std::vector<AssetId> AccountingEngine::collateral_assets() const {
    return ledger_.registry().enumerate();
}

std::optional<PriceFeedId> AccountingEngine::price_feed_of(const AssetId& asset) const {
    return ledger_.registry().price_feed_of(asset);
}

U128 AccountingEngine::price(const AssetId& asset) const {
    return oracle_.price(asset);
}

U128 AccountingEngine::usd_value(const AssetId& asset, U128 amount_x18) const {
    return oracle_.usd_value(asset, amount_x18);
}

U128 AccountingEngine::token_amount_for_usd(const AssetId& asset, U128 usd_x18) const {
    return oracle_.token_amount_for_usd(asset, usd_x18);
}

U128 AccountingEngine::additional_feed_precision(const AssetId& asset) const {
    return oracle_.feed_precision_multiplier(asset);
}

// =============================================================================
// Effects
// =============================================================================

void AccountingEngine::deposit_effects(const AccountId& account, const AssetId& asset, U128 amount_x18) {
    ledger_.deposit_collateral(account, asset, amount_x18);
}

void AccountingEngine::mint_effects(const AccountId& account, U128 amount_x18) {
    ledger_.record_mint(account, amount_x18);
}

void AccountingEngine::burn_effects(const AccountId& on_behalf_of, U128 amount_x18) {
    ledger_.record_burn(on_behalf_of, amount_x18);
}

void AccountingEngine::redeem_effects(const AccountId& from, const AccountId& to,
                                      const AssetId& asset, U128 amount_x18) {
    require_allowed(asset);
    ledger_.withdraw_collateral(from, to, asset, amount_x18);
}

// =============================================================================
// Internal Helpers
// =============================================================================

void AccountingEngine::require_health_factor(const AccountId& account, ErrorCode code) const {
    U128 hf = health_factor_of(account);
    if (!HealthFactorCalculator::is_healthy(hf, params_.min_health_factor_x18)) {
        throw InvariantViolation(code,
                                 "health factor " + x18::to_string(hf) + " of " + addresses::to_hex(account) +
                                 " is below minimum " + x18::to_string(params_.min_health_factor_x18),
                                 hf);
    }
}

U128 AccountingEngine::collateral_value_of(const AccountId& account) const {
    U128 total = 0;
    for (const auto& asset : ledger_.registry().enumerate()) {
        U128 balance = ledger_.collateral_balance(account, asset);
        if (balance == 0) continue;
        total = x18::checked_add(total, oracle_.usd_value(asset, balance));
    }
    return total;
}

U128 AccountingEngine::health_factor_of(const AccountId& account) const {
    U128 debt = ledger_.debt_of(account);
    if (debt == 0) {
        return U128_MAX;
    }
    return HealthFactorCalculator::compute(debt, collateral_value_of(account), params_.liquidation_threshold);
}

void AccountingEngine::require_allowed(const AssetId& asset) const {
    if (!ledger_.registry().is_allowed(asset)) {
        throw ValidationError(ErrorCode::ASSET_NOT_ALLOWED, "collateral asset not allowed: " + asset.to_hex());
    }
}

} // namespace peg
