#ifndef SYNX_LEDGER_HPP
#define SYNX_LEDGER_HPP

#include <map>
#include <optional>
#include <vector>

#include "types.hpp"
#include "authority.hpp"
#include "config.hpp"
#include "feed.hpp"

namespace synx {

class SXLedger;

// =============================================================================
// LedgerTxn - Staged Position and Total Writes
//
// Operations validate and stage into a transaction; nothing reaches the
// ledger until commit(). A transaction destroyed uncommitted is discarded.
// =============================================================================

class LedgerTxn {
public:
    explicit LedgerTxn(SXLedger& ledger);
    ~LedgerTxn() = default;

    LedgerTxn(const LedgerTxn&) = delete;
    LedgerTxn& operator=(const LedgerTxn&) = delete;

    // Staged copy of the account's position (fresh zero position if absent)
    Position& stage(const Identity& account);

    bool is_staged(const Identity& account) const;

    // Checked against the staged totals
    void add_collateral(Amount amount);
    void add_supply(Amount amount);
    void sub_supply(Amount amount);

    Amount total_collateral() const noexcept { return total_collateral_; }
    Amount total_synthetic_supply() const noexcept { return total_supply_; }

    void commit();
    bool committed() const noexcept { return committed_; }

private:
    SXLedger& ledger_;
    std::map<Identity, Position> staged_;
    Amount total_collateral_;
    Amount total_supply_;
    bool committed_ = false;
};

// =============================================================================
// SXLedger - Per-Account Collateral/Debt Bookkeeping
//
// Exclusively owns every Position and the global collateral/supply totals.
// Not internally synchronized; SX serializes access.
// =============================================================================

class SXLedger {
public:
    SXLedger(const SXAuthority& authority, const ProtocolParams& params);

    SXLedger(const SXLedger&) = delete;
    SXLedger& operator=(const SXLedger&) = delete;

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<Position> get(const Identity& account) const;

    // Existing position or a fresh zero one; never persisted by this call
    Position open_or_get(const Identity& account) const;

    bool exists(const Identity& account) const;
    size_t size() const { return positions_.size(); }
    std::vector<std::pair<Identity, Position>> positions() const;

    Amount total_collateral() const noexcept { return total_collateral_; }
    Amount total_synthetic_supply() const noexcept { return total_supply_; }

    // =========================================================================
    // Transitions
    // =========================================================================

    LedgerTxn begin() { return LedgerTxn(*this); }

    // ContractPaused, InvalidAmount
    void apply_deposit(LedgerTxn& txn, const Identity& account, Amount amount, BlockHeight now);
    void apply_deposit(const Identity& account, Amount amount, BlockHeight now);

    // PositionNotFound, ContractPaused, InvalidAmount, StalePrice,
    // InsufficientCollateral, InvalidAmount (cooldown).
    // Returns amount net of the minting fee.
    Amount apply_mint(LedgerTxn& txn, const Identity& account, Amount amount,
                      BlockHeight now, const PriceQuote& quote);
    Amount apply_mint(const Identity& account, Amount amount,
                      BlockHeight now, const PriceQuote& quote);

    Amount minting_fee(Amount amount) const;

    const ProtocolParams& params() const noexcept { return params_; }

private:
    friend class LedgerTxn;

    const SXAuthority& authority_;
    ProtocolParams params_;

    std::map<Identity, Position> positions_;
    Amount total_collateral_ = 0;
    Amount total_supply_ = 0;
};

} // namespace synx

#endif // SYNX_LEDGER_HPP
