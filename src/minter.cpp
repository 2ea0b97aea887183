// =============================================================================
// minter.cpp - SXMinter Deposit and Mint
// =============================================================================

#include "synx/minter.hpp"
#include "synx/math.hpp"

namespace synx {

SXMinter::SXMinter(SXLedger& ledger, const SXFeed& feed, IHost& host)
    : ledger_(ledger), feed_(feed), host_(host) {}

void SXMinter::deposit(const Identity& account, Amount amount, BlockHeight now) {
    LedgerTxn txn = ledger_.begin();
    ledger_.apply_deposit(txn, account, amount, now);

    if (!host_.transfer(amount, account, host_.custody())) {
        throw SXError(Errc::TransferFailed, "collateral transfer from " + account.str());
    }

    txn.commit();
}

Amount SXMinter::mint(const Identity& account, Amount amount, BlockHeight now) {
    return mint_detailed(account, amount, now).net;
}

MintResult SXMinter::mint_detailed(const Identity& account, Amount amount, BlockHeight now) {
    LedgerTxn txn = ledger_.begin();
    Amount net = ledger_.apply_mint(txn, account, amount, now, feed_.quote(now));

    Amount fee = math::sub(amount, net);
    Amount fees_after = math::add(fees_collected_, fee);

    Health health = txn.stage(account).position_health;

    txn.commit();
    fees_collected_ = fees_after;

    return MintResult{amount, fee, net, health};
}

Amount SXMinter::headroom(const Identity& account, BlockHeight now) const {
    auto pos = ledger_.get(account);
    PriceQuote q = feed_.quote(now);
    if (!pos || !q.fresh) return 0;

    Amount max_mint = math::max_mintable(pos->collateral_deposited, q.price,
                                         ledger_.params().min_collateral_ratio);
    return max_mint > pos->synthetic_minted ? max_mint - pos->synthetic_minted : 0;
}

} // namespace synx
