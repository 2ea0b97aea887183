#ifndef SYNX_LIQUIDATOR_HPP
#define SYNX_LIQUIDATOR_HPP

#include <map>
#include <optional>
#include <vector>

#include "types.hpp"
#include "authority.hpp"
#include "feed.hpp"
#include "host.hpp"
#include "ledger.hpp"

namespace synx {

// =============================================================================
// Liquidation Quote
// =============================================================================

struct LiquidationQuote {
    Amount collateral_value;   // debt_to_cover * 1e8 / price
    Amount reward;             // paid from custody to the liquidator
    Amount penalty;            // removed from the position, paid to nobody
    Amount collateral_seized;  // collateral_value + penalty
};

// =============================================================================
// SXLiquidator - Partial Liquidation of Unhealthy Positions
// =============================================================================

class SXLiquidator {
public:
    SXLiquidator(SXLedger& ledger, const SXFeed& feed, const SXAuthority& authority,
                 IHost& host, const ProtocolParams& params);

    SXLiquidator(const SXLiquidator&) = delete;
    SXLiquidator& operator=(const SXLiquidator&) = delete;

    // Returns the liquidation id. First failure wins: ContractPaused,
    // PositionNotFound, LiquidationNotAllowed, StalePrice, InvalidAmount,
    // ArithmeticError, TransferFailed.
    uint64_t liquidate(const Identity& liquidator, const Identity& account,
                       Amount debt_to_cover, BlockHeight now);

    // Health at the live price
    Health current_health(const Identity& account) const;
    bool is_liquidatable(const Identity& account) const;

    // Accounts currently below the liquidation threshold
    std::vector<Identity> scan() const;

    LiquidationQuote quote(Amount debt_to_cover, Amount price) const;

    // =========================================================================
    // History
    // =========================================================================

    std::optional<LiquidationRecord> get(uint64_t liquidation_id) const;
    std::vector<LiquidationRecord> history_for(const Identity& account) const;
    uint64_t liquidation_nonce() const noexcept { return nonce_; }
    size_t count() const noexcept { return history_.size(); }

    Amount penalties_burned() const noexcept { return penalties_burned_; }

private:
    SXLedger& ledger_;
    const SXFeed& feed_;
    const SXAuthority& authority_;
    IHost& host_;
    ProtocolParams params_;

    std::map<uint64_t, LiquidationRecord> history_;
    uint64_t nonce_ = 0;
    Amount penalties_burned_ = 0;
};

} // namespace synx

#endif // SYNX_LIQUIDATOR_HPP
