#ifndef PEG_LEDGER_HPP
#define PEG_LEDGER_HPP

#include <functional>
#include <map>
#include <optional>
#include <variant>
#include <vector>

#include "types.hpp"
#include "registry.hpp"

namespace peg {

// =============================================================================
// Collateral Events
// =============================================================================

struct CollateralDeposited {
    AccountId account;
    AssetId asset;
    U128 amount_x18;
};

struct CollateralRedeemed {
    AccountId from;
    AccountId to;
    AssetId asset;
    U128 amount_x18;
};

using LedgerEvent = std::variant<CollateralDeposited, CollateralRedeemed>;
using EventListener = std::function<void(const LedgerEvent&)>;

// =============================================================================
// Account Position
// =============================================================================

struct AccountPosition {
    std::map<AssetId, U128> collateral;  // asset -> balance_x18
    U128 debt_x18 = 0;
};

// =============================================================================
// PositionLedger - Authoritative Per-Account State
// =============================================================================

// Not synchronized; the owning engine serializes access.
class PositionLedger {
public:
    explicit PositionLedger(const CollateralRegistry& registry);

    // Non-copyable
    PositionLedger(const PositionLedger&) = delete;
    PositionLedger& operator=(const PositionLedger&) = delete;

    // =========================================================================
    // Mutations
    // =========================================================================

    // amount > 0 and asset allowed, else ValidationError
    void deposit_collateral(const AccountId& account, const AssetId& asset, U128 amount_x18);

    // LedgerError(INSUFFICIENT_COLLATERAL) if amount exceeds the balance
    void withdraw_collateral(const AccountId& from, const AccountId& to,
                             const AssetId& asset, U128 amount_x18);

    void record_mint(const AccountId& account, U128 amount_x18);

    // LedgerError(INSUFFICIENT_DEBT) if amount exceeds the debt
    void record_burn(const AccountId& account, U128 amount_x18);

    // =========================================================================
    // Queries
    // =========================================================================

    U128 collateral_balance(const AccountId& account, const AssetId& asset) const;
    U128 debt_of(const AccountId& account) const;
    std::optional<AccountPosition> position(const AccountId& account) const;
    bool has_account(const AccountId& account) const;
    size_t account_count() const { return accounts_.size(); }

    const CollateralRegistry& registry() const { return registry_; }

    // =========================================================================
    // Journal (undo log for atomic operations)
    // =========================================================================

    // Start recording undo entries; events are held until commit().
    // Throws std::logic_error if a journal is already open.
    void begin();

    // Drop the undo log and hand back the held events for publish()
    std::vector<LedgerEvent> commit();

    // Restore every value touched since begin() and drop held events
    void rollback();

    bool in_journal() const { return journaling_; }

    // =========================================================================
    // Events
    // =========================================================================

    void subscribe(EventListener listener);

    // Deliver events to every listener in order. A listener that throws is
    // logged and skipped; the remaining listeners and events still run.
    void publish(const std::vector<LedgerEvent>& events) const;

private:
    struct UndoEntry {
        enum class Kind : uint8_t { CREATED, COLLATERAL, DEBT };
        Kind kind;
        AccountId account;
        AssetId asset;
        U128 previous;
    };

    const CollateralRegistry& registry_;
    std::map<AccountId, AccountPosition> accounts_;

    bool journaling_{false};
    std::vector<UndoEntry> undo_;
    std::vector<LedgerEvent> held_events_;
    std::vector<EventListener> listeners_;

    AccountPosition& get_or_create_account(const AccountId& account);
    const AccountPosition* get_account(const AccountId& account) const;

    void set_collateral(AccountPosition& state, const AccountId& account,
                        const AssetId& asset, U128 value);
    void set_debt(AccountPosition& state, const AccountId& account, U128 value);

    void emit(LedgerEvent event);
    void notify(const LedgerEvent& event) const;
};

} // namespace peg

#endif // PEG_LEDGER_HPP
