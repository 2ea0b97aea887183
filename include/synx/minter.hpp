#ifndef SYNX_MINTER_HPP
#define SYNX_MINTER_HPP

#include "types.hpp"
#include "feed.hpp"
#include "host.hpp"
#include "ledger.hpp"

namespace synx {

// =============================================================================
// Mint Result
// =============================================================================

struct MintResult {
    Amount gross = 0;     // added to position debt and total supply
    Amount fee = 0;       // retained by the protocol
    Amount net = 0;       // credited to the minter
    Health health = Health::unbounded();   // position health after the mint
};

// =============================================================================
// SXMinter - Collateral Deposit and Synthetic Minting
// =============================================================================

class SXMinter {
public:
    SXMinter(SXLedger& ledger, const SXFeed& feed, IHost& host);

    SXMinter(const SXMinter&) = delete;
    SXMinter& operator=(const SXMinter&) = delete;

    // Moves `amount` from the depositor to custody, then credits the position.
    // ContractPaused, InvalidAmount, ArithmeticError, TransferFailed
    void deposit(const Identity& account, Amount amount, BlockHeight now);

    // Returns the amount net of the minting fee
    Amount mint(const Identity& account, Amount amount, BlockHeight now);
    MintResult mint_detailed(const Identity& account, Amount amount, BlockHeight now);

    // Remaining debt capacity at the current price; 0 when stale or absent
    Amount headroom(const Identity& account, BlockHeight now) const;

    Amount fees_collected() const noexcept { return fees_collected_; }

private:
    SXLedger& ledger_;
    const SXFeed& feed_;
    IHost& host_;

    Amount fees_collected_ = 0;
};

} // namespace synx

#endif // SYNX_MINTER_HPP
