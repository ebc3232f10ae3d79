#ifndef PEG_SIM_HPP
#define PEG_SIM_HPP

#include <map>
#include <optional>
#include <utility>

#include "types.hpp"
#include "collaborators.hpp"
#include "oracle.hpp"

namespace peg {
namespace sim {

// =============================================================================
// SimDebtToken - In-memory Pegged Token
// =============================================================================

class SimDebtToken : public IDebtToken {
public:
    explicit SimDebtToken(Address id = addresses::from_u64(0xD5C));

    Address id() const override { return id_; }
    bool mint(const AccountId& to, U128 amount_x18) override;
    bool pull_for_burn(const AccountId& from, U128 amount_x18) override;
    void burn(U128 amount_x18) override;
    bool refund(const AccountId& to, U128 amount_x18) override;

    U128 balance_of(const AccountId& holder) const;
    U128 total_supply() const { return total_supply_; }
    U128 custody() const { return custody_; }

    // Holder-to-holder transfer (e.g., a liquidator buying tokens)
    bool transfer(const AccountId& from, const AccountId& to, U128 amount_x18);

private:
    Address id_;
    std::map<AccountId, U128> balances_;
    U128 total_supply_{0};
    U128 custody_{0};
};

// =============================================================================
// SimCollateralBank - In-memory Collateral Tokens
// =============================================================================

class SimCollateralBank : public ICollateralTransfer {
public:
    bool transfer_in(const AssetId& asset, const AccountId& from, U128 amount_x18) override;
    bool transfer_out(const AssetId& asset, const AccountId& to, U128 amount_x18) override;

    // Credit a holder's wallet (faucet)
    void fund(const AssetId& asset, const AccountId& holder, U128 amount_x18);

    U128 balance_of(const AssetId& asset, const AccountId& holder) const;
    U128 custody(const AssetId& asset) const;

private:
    std::map<std::pair<AssetId, AccountId>, U128> wallets_;
    std::map<AssetId, U128> custody_;
};

// =============================================================================
// SimPriceFeed - Settable Aggregator
// =============================================================================

class SimPriceFeed : public IPriceFeed {
public:
    SimPriceFeed(uint8_t decimals, I128 answer, uint64_t updated_at);

    uint8_t decimals() const override { return decimals_; }
    std::optional<PriceReading> latest_round() override;

    void update_answer(I128 answer, uint64_t updated_at);
    void set_available(bool available) { available_ = available; }

private:
    uint8_t decimals_;
    I128 answer_;
    uint64_t updated_at_;
    bool available_{true};
};

// =============================================================================
// ManualClock
// =============================================================================

class ManualClock {
public:
    explicit ManualClock(uint64_t now = 0) : now_(now) {}

    uint64_t now() const { return now_; }
    void set(uint64_t now) { now_ = now; }
    void advance(uint64_t seconds) { now_ += seconds; }

    // Clock bound to this instance; the instance must outlive its users
    Clock clock() const {
        return [this] { return now_; };
    }

private:
    uint64_t now_;
};

} // namespace sim
} // namespace peg

#endif // PEG_SIM_HPP
