// =============================================================================
// ledger.cpp - SXLedger Position Bookkeeping
// =============================================================================

#include "synx/ledger.hpp"
#include "synx/math.hpp"

namespace synx {

// =============================================================================
// LedgerTxn
// =============================================================================

LedgerTxn::LedgerTxn(SXLedger& ledger)
    : ledger_(ledger),
      total_collateral_(ledger.total_collateral_),
      total_supply_(ledger.total_supply_) {}

Position& LedgerTxn::stage(const Identity& account) {
    auto it = staged_.find(account);
    if (it != staged_.end()) return it->second;
    return staged_.emplace(account, ledger_.open_or_get(account)).first->second;
}

bool LedgerTxn::is_staged(const Identity& account) const {
    return staged_.find(account) != staged_.end();
}

void LedgerTxn::add_collateral(Amount amount) {
    total_collateral_ = math::add(total_collateral_, amount);
}

void LedgerTxn::add_supply(Amount amount) {
    total_supply_ = math::add(total_supply_, amount);
}

void LedgerTxn::sub_supply(Amount amount) {
    total_supply_ = math::sub(total_supply_, amount);
}

void LedgerTxn::commit() {
    if (committed_) return;

    for (auto& [account, position] : staged_) {
        ledger_.positions_[account] = position;
    }
    ledger_.total_collateral_ = total_collateral_;
    ledger_.total_supply_ = total_supply_;
    committed_ = true;
}

// =============================================================================
// SXLedger
// =============================================================================

SXLedger::SXLedger(const SXAuthority& authority, const ProtocolParams& params)
    : authority_(authority), params_(params) {}

std::optional<Position> SXLedger::get(const Identity& account) const {
    auto it = positions_.find(account);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

Position SXLedger::open_or_get(const Identity& account) const {
    auto it = positions_.find(account);
    if (it != positions_.end()) return it->second;
    return Position{};
}

bool SXLedger::exists(const Identity& account) const {
    return positions_.find(account) != positions_.end();
}

std::vector<std::pair<Identity, Position>> SXLedger::positions() const {
    return {positions_.begin(), positions_.end()};
}

// =============================================================================
// Deposit
// =============================================================================

void SXLedger::apply_deposit(LedgerTxn& txn, const Identity& account, Amount amount, BlockHeight now) {
    authority_.require_running();

    if (amount == 0) {
        throw SXError(Errc::InvalidAmount, "deposit amount must be positive");
    }

    Position& pos = txn.stage(account);
    pos.collateral_deposited = math::add(pos.collateral_deposited, amount);
    pos.last_interaction_block = now;
    txn.add_collateral(amount);
}

void SXLedger::apply_deposit(const Identity& account, Amount amount, BlockHeight now) {
    LedgerTxn txn(*this);
    apply_deposit(txn, account, amount, now);
    txn.commit();
}

// =============================================================================
// Mint
// =============================================================================

Amount SXLedger::minting_fee(Amount amount) const {
    return math::bps(amount, params_.minting_fee_bps);
}

Amount SXLedger::apply_mint(LedgerTxn& txn, const Identity& account, Amount amount,
                            BlockHeight now, const PriceQuote& quote) {
    if (!exists(account) && !txn.is_staged(account)) {
        throw SXError(Errc::PositionNotFound, account.str());
    }

    authority_.require_running();

    if (amount == 0) {
        throw SXError(Errc::InvalidAmount, "mint amount must be positive");
    }
    if (!quote.fresh) {
        throw SXError(Errc::StalePrice, "price last updated at block " +
                                        std::to_string(quote.last_update));
    }

    const Position current = txn.stage(account);

    Amount new_minted = math::add(current.synthetic_minted, amount);
    Amount max_mint = math::max_mintable(current.collateral_deposited, quote.price,
                                         params_.min_collateral_ratio);
    if (new_minted > max_mint) {
        throw SXError(Errc::InsufficientCollateral,
                      "minted " + math::to_string(new_minted) + " exceeds max " + math::to_string(max_mint));
    }

    if (math::elapsed(current.last_interaction_block, now) < params_.cooldown_blocks) {
        throw SXError(Errc::InvalidAmount, "cooldown active until block " +
                      std::to_string(current.last_interaction_block + params_.cooldown_blocks));
    }

    Health health = math::position_health(current.collateral_deposited, new_minted, quote.price);
    Amount fee = minting_fee(amount);
    Amount net = math::sub(amount, fee);

    txn.add_supply(amount);

    Position& pos = txn.stage(account);
    pos.synthetic_minted = new_minted;
    pos.position_health = health;
    pos.last_interaction_block = now;

    return net;
}

Amount SXLedger::apply_mint(const Identity& account, Amount amount,
                            BlockHeight now, const PriceQuote& quote) {
    LedgerTxn txn(*this);
    Amount net = apply_mint(txn, account, amount, now, quote);
    txn.commit();
    return net;
}

} // namespace synx
