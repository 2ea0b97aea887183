#ifndef SYNX_DIVERSIFIER_HPP
#define SYNX_DIVERSIFIER_HPP

#include <vector>

#include "types.hpp"
#include "authority.hpp"
#include "feed.hpp"
#include "host.hpp"
#include "ledger.hpp"

namespace synx {

enum class BasketOp : uint8_t {
    MINT = 0,          // commit basket collateral and debt
    DEPOSIT_ONLY = 1   // quote only, commits nothing
};

struct DiversifiedRequest {
    std::vector<uint64_t> asset_ids;
    std::vector<Amount> amounts;
    std::vector<uint64_t> risk_scores;
    BasketOp operation = BasketOp::DEPOSIT_ONLY;
    Amount synthetic_amount = 0;
};

struct DiversifiedResult {
    Health health_ratio = Health::unbounded();
    uint64_t diversification_bonus = 0;
    Amount max_additional_mintable = 0;
    uint64_t avg_risk_score = 0;
    Amount collateral_locked = 0;
    bool committed = false;
};

// =============================================================================
// SXDiversifier - Multi-Asset Positions with Risk-Weighted Ratio
// =============================================================================

class SXDiversifier {
public:
    SXDiversifier(SXLedger& ledger, const SXFeed& feed, const SXAuthority& authority,
                  IHost& host, const ProtocolParams& params);

    SXDiversifier(const SXDiversifier&) = delete;
    SXDiversifier& operator=(const SXDiversifier&) = delete;

    // A MINT moves the summed amounts from the account to custody before
    // committing. DEPOSIT_ONLY moves nothing.
    // InvalidAmount, ContractPaused, StalePrice, ArithmeticError,
    // ExceedsMaxPosition, InsufficientCollateral, TransferFailed
    DiversifiedResult manage(const Identity& account, const DiversifiedRequest& request,
                             BlockHeight now);

    // 10 for more than two assets, otherwise 5
    static uint64_t diversification_bonus(size_t asset_count);

private:
    SXLedger& ledger_;
    const SXFeed& feed_;
    const SXAuthority& authority_;
    IHost& host_;
    ProtocolParams params_;
};

} // namespace synx

#endif // SYNX_DIVERSIFIER_HPP
