// =============================================================================
// ledger.cpp - PositionLedger Implementation
// =============================================================================

#include "peg/ledger.hpp"
#include "peg/errors.hpp"
#include "peg/x18.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace peg {

PositionLedger::PositionLedger(const CollateralRegistry& registry) : registry_(registry) {}

// =============================================================================
// Mutations
// =============================================================================

void PositionLedger::deposit_collateral(const AccountId& account, const AssetId& asset, U128 amount_x18) {
    if (amount_x18 == 0) {
        throw ValidationError(ErrorCode::ZERO_AMOUNT, "deposit amount must be greater than zero");
    }
    if (!registry_.is_allowed(asset)) {
        throw ValidationError(ErrorCode::ASSET_NOT_ALLOWED, "collateral asset not allowed: " + asset.to_hex());
    }

    AccountPosition& state = get_or_create_account(account);
    U128 current = 0;
    auto it = state.collateral.find(asset);
    if (it != state.collateral.end()) current = it->second;

    set_collateral(state, account, asset, x18::checked_add(current, amount_x18));
    emit(CollateralDeposited{account, asset, amount_x18});
}

void PositionLedger::withdraw_collateral(const AccountId& from, const AccountId& to,
                                         const AssetId& asset, U128 amount_x18) {
    if (amount_x18 == 0) {
        throw ValidationError(ErrorCode::ZERO_AMOUNT, "withdraw amount must be greater than zero");
    }

    U128 current = collateral_balance(from, asset);
    if (amount_x18 > current) {
        throw LedgerError(ErrorCode::INSUFFICIENT_COLLATERAL,
                          "withdraw " + x18::to_string(amount_x18) + " exceeds balance " +
                          x18::to_string(current) + " of asset " + asset.to_hex());
    }

    AccountPosition& state = get_or_create_account(from);
    set_collateral(state, from, asset, current - amount_x18);
    emit(CollateralRedeemed{from, to, asset, amount_x18});
}

void PositionLedger::record_mint(const AccountId& account, U128 amount_x18) {
    if (amount_x18 == 0) {
        throw ValidationError(ErrorCode::ZERO_AMOUNT, "mint amount must be greater than zero");
    }
    AccountPosition& state = get_or_create_account(account);
    set_debt(state, account, x18::checked_add(state.debt_x18, amount_x18));
}

void PositionLedger::record_burn(const AccountId& account, U128 amount_x18) {
    if (amount_x18 == 0) {
        throw ValidationError(ErrorCode::ZERO_AMOUNT, "burn amount must be greater than zero");
    }

    U128 current = debt_of(account);
    if (amount_x18 > current) {
        throw LedgerError(ErrorCode::INSUFFICIENT_DEBT,
                          "burn " + x18::to_string(amount_x18) + " exceeds debt " + x18::to_string(current));
    }

    AccountPosition& state = get_or_create_account(account);
    set_debt(state, account, current - amount_x18);
}

// =============================================================================
// Queries
// =============================================================================

U128 PositionLedger::collateral_balance(const AccountId& account, const AssetId& asset) const {
    const AccountPosition* state = get_account(account);
    if (!state) return 0;

    auto it = state->collateral.find(asset);
    return (it != state->collateral.end()) ? it->second : 0;
}

U128 PositionLedger::debt_of(const AccountId& account) const {
    const AccountPosition* state = get_account(account);
    return state ? state->debt_x18 : 0;
}

std::optional<AccountPosition> PositionLedger::position(const AccountId& account) const {
    const AccountPosition* state = get_account(account);
    if (!state) return std::nullopt;
    return *state;
}

bool PositionLedger::has_account(const AccountId& account) const {
    return get_account(account) != nullptr;
}

// =============================================================================
// Journal
// =============================================================================

void PositionLedger::begin() {
    if (journaling_) {
        throw std::logic_error("PositionLedger: journal already open");
    }
    journaling_ = true;
    undo_.clear();
    held_events_.clear();
}

std::vector<LedgerEvent> PositionLedger::commit() {
    journaling_ = false;
    undo_.clear();

    std::vector<LedgerEvent> events;
    events.swap(held_events_);
    return events;
}

void PositionLedger::rollback() {
    for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
        switch (it->kind) {
            case UndoEntry::Kind::CREATED:
                accounts_.erase(it->account);
                break;
            case UndoEntry::Kind::COLLATERAL: {
                auto& collateral = accounts_[it->account].collateral;
                if (it->previous == 0) {
                    collateral.erase(it->asset);
                } else {
                    collateral[it->asset] = it->previous;
                }
                break;
            }
            case UndoEntry::Kind::DEBT:
                accounts_[it->account].debt_x18 = it->previous;
                break;
        }
    }

    journaling_ = false;
    undo_.clear();
    held_events_.clear();
}

// =============================================================================
// Events
// =============================================================================

void PositionLedger::subscribe(EventListener listener) {
    listeners_.push_back(std::move(listener));
}

void PositionLedger::emit(LedgerEvent event) {
    if (journaling_) {
        held_events_.push_back(std::move(event));
    } else {
        notify(event);
    }
}

void PositionLedger::publish(const std::vector<LedgerEvent>& events) const {
    for (const auto& event : events) {
        notify(event);
    }
}

void PositionLedger::notify(const LedgerEvent& event) const {
    for (const auto& listener : listeners_) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            spdlog::warn("event listener threw: {}", e.what());
        }
    }
}

// =============================================================================
// Internal Helpers
// =============================================================================

AccountPosition& PositionLedger::get_or_create_account(const AccountId& account) {
    auto it = accounts_.find(account);
    if (it != accounts_.end()) return it->second;

    if (journaling_) {
        undo_.push_back(UndoEntry{UndoEntry::Kind::CREATED, account, AssetId{}, 0});
    }
    return accounts_[account];
}

const AccountPosition* PositionLedger::get_account(const AccountId& account) const {
    auto it = accounts_.find(account);
    return (it != accounts_.end()) ? &it->second : nullptr;
}

void PositionLedger::set_collateral(AccountPosition& state, const AccountId& account,
                                    const AssetId& asset, U128 value) {
    U128& slot = state.collateral[asset];
    if (journaling_) {
        undo_.push_back(UndoEntry{UndoEntry::Kind::COLLATERAL, account, asset, slot});
    }
    slot = value;
}

void PositionLedger::set_debt(AccountPosition& state, const AccountId& account, U128 value) {
    if (journaling_) {
        undo_.push_back(UndoEntry{UndoEntry::Kind::DEBT, account, AssetId{}, state.debt_x18});
    }
    state.debt_x18 = value;
}

} // namespace peg
