// =============================================================================
// sim.cpp - In-memory Collaborators for Simulation and Tests
// =============================================================================

#include "peg/sim.hpp"
#include "peg/x18.hpp"

#include <stdexcept>

namespace peg {
namespace sim {

// =============================================================================
// SimDebtToken
// =============================================================================

SimDebtToken::SimDebtToken(Address id) : id_(id) {}

bool SimDebtToken::mint(const AccountId& to, U128 amount_x18) {
    if (amount_x18 == 0 || amount_x18 > U128_MAX - total_supply_) {
        return false;
    }
    balances_[to] += amount_x18;
    total_supply_ += amount_x18;
    return true;
}

bool SimDebtToken::pull_for_burn(const AccountId& from, U128 amount_x18) {
    auto it = balances_.find(from);
    if (amount_x18 == 0 || it == balances_.end() || it->second < amount_x18) {
        return false;
    }
    it->second -= amount_x18;
    custody_ += amount_x18;
    return true;
}

void SimDebtToken::burn(U128 amount_x18) {
    if (amount_x18 > custody_) {
        throw std::logic_error("SimDebtToken: burn amount exceeds custody");
    }
    custody_ -= amount_x18;
    total_supply_ -= amount_x18;
}

bool SimDebtToken::refund(const AccountId& to, U128 amount_x18) {
    if (amount_x18 > custody_) {
        return false;
    }
    custody_ -= amount_x18;
    balances_[to] += amount_x18;
    return true;
}

U128 SimDebtToken::balance_of(const AccountId& holder) const {
    auto it = balances_.find(holder);
    return (it != balances_.end()) ? it->second : 0;
}

bool SimDebtToken::transfer(const AccountId& from, const AccountId& to, U128 amount_x18) {
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount_x18) {
        return false;
    }
    it->second -= amount_x18;
    balances_[to] += amount_x18;
    return true;
}

// =============================================================================
// SimCollateralBank
// =============================================================================

bool SimCollateralBank::transfer_in(const AssetId& asset, const AccountId& from, U128 amount_x18) {
    auto it = wallets_.find({asset, from});
    if (it == wallets_.end() || it->second < amount_x18) {
        return false;
    }
    it->second -= amount_x18;
    custody_[asset] += amount_x18;
    return true;
}

bool SimCollateralBank::transfer_out(const AssetId& asset, const AccountId& to, U128 amount_x18) {
    auto it = custody_.find(asset);
    if (it == custody_.end() || it->second < amount_x18) {
        return false;
    }
    it->second -= amount_x18;
    wallets_[{asset, to}] += amount_x18;
    return true;
}

void SimCollateralBank::fund(const AssetId& asset, const AccountId& holder, U128 amount_x18) {
    U128& wallet = wallets_[{asset, holder}];
    wallet = x18::checked_add(wallet, amount_x18);
}

U128 SimCollateralBank::balance_of(const AssetId& asset, const AccountId& holder) const {
    auto it = wallets_.find({asset, holder});
    return (it != wallets_.end()) ? it->second : 0;
}

U128 SimCollateralBank::custody(const AssetId& asset) const {
    auto it = custody_.find(asset);
    return (it != custody_.end()) ? it->second : 0;
}

// =============================================================================
// SimPriceFeed
// =============================================================================

SimPriceFeed::SimPriceFeed(uint8_t decimals, I128 answer, uint64_t updated_at)
    : decimals_(decimals), answer_(answer), updated_at_(updated_at) {}

std::optional<PriceReading> SimPriceFeed::latest_round() {
    if (!available_) return std::nullopt;
    return PriceReading{answer_, updated_at_};
}

void SimPriceFeed::update_answer(I128 answer, uint64_t updated_at) {
    answer_ = answer;
    updated_at_ = updated_at;
}

} // namespace sim
} // namespace peg
