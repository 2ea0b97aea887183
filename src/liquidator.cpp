// =============================================================================
// liquidator.cpp - SXLiquidator Partial Liquidations
// =============================================================================

#include "synx/liquidator.hpp"
#include "synx/math.hpp"

namespace synx {

SXLiquidator::SXLiquidator(SXLedger& ledger, const SXFeed& feed, const SXAuthority& authority,
                           IHost& host, const ProtocolParams& params)
    : ledger_(ledger), feed_(feed), authority_(authority), host_(host), params_(params) {}

// =============================================================================
// Health
// =============================================================================

Health SXLiquidator::current_health(const Identity& account) const {
    auto pos = ledger_.get(account);
    if (!pos) return Health::unbounded();
    return math::position_health(pos->collateral_deposited, pos->synthetic_minted,
                                 feed_.current_price());
}

bool SXLiquidator::is_liquidatable(const Identity& account) const {
    return current_health(account).below(params_.liquidation_threshold);
}

std::vector<Identity> SXLiquidator::scan() const {
    std::vector<Identity> targets;
    for (const auto& [account, pos] : ledger_.positions()) {
        Health h = math::position_health(pos.collateral_deposited, pos.synthetic_minted,
                                         feed_.current_price());
        if (h.below(params_.liquidation_threshold)) {
            targets.push_back(account);
        }
    }
    return targets;
}

LiquidationQuote SXLiquidator::quote(Amount debt_to_cover, Amount price) const {
    LiquidationQuote q;
    q.collateral_value = math::collateral_for_debt(debt_to_cover, price);
    q.reward = math::percent_of(q.collateral_value, PERCENT + params_.liquidation_bonus);
    q.penalty = math::percent_of(q.collateral_value, params_.liquidation_penalty);
    q.collateral_seized = math::add(q.collateral_value, q.penalty);
    return q;
}

// =============================================================================
// Liquidation
// =============================================================================

uint64_t SXLiquidator::liquidate(const Identity& liquidator, const Identity& account,
                                 Amount debt_to_cover, BlockHeight now) {
    authority_.require_running();

    auto existing = ledger_.get(account);
    if (!existing) {
        throw SXError(Errc::PositionNotFound, account.str());
    }

    Amount price = feed_.current_price();
    Health health = math::position_health(existing->collateral_deposited,
                                          existing->synthetic_minted, price);
    if (!health.below(params_.liquidation_threshold)) {
        throw SXError(Errc::LiquidationNotAllowed, account.str() + " is healthy");
    }

    feed_.require_fresh(now);

    if (debt_to_cover == 0 || debt_to_cover > existing->synthetic_minted / 2) {
        throw SXError(Errc::InvalidAmount, "debt_to_cover must be in (0, " +
                      math::to_string(existing->synthetic_minted / 2) + "]");
    }

    LiquidationQuote q = quote(debt_to_cover, price);

    LedgerTxn txn = ledger_.begin();
    Position& pos = txn.stage(account);
    pos.collateral_deposited = math::sub(pos.collateral_deposited, q.collateral_seized);
    pos.synthetic_minted = math::sub(pos.synthetic_minted, debt_to_cover);
    pos.position_health = math::position_health(pos.collateral_deposited, pos.synthetic_minted, price);
    pos.last_interaction_block = now;

    // total_collateral is not reduced by liquidation
    txn.sub_supply(debt_to_cover);

    uint64_t id = nonce_ + 1;
    Amount burned_after = math::add(penalties_burned_, q.penalty);

    LiquidationRecord record;
    record.liquidated = account;
    record.liquidator = liquidator;
    record.collateral_seized = q.collateral_seized;
    record.debt_covered = debt_to_cover;
    record.reward = q.reward;
    record.block_height = now;

    if (!host_.transfer(q.reward, host_.custody(), liquidator)) {
        throw SXError(Errc::TransferFailed, "reward transfer to " + liquidator.str());
    }

    txn.commit();
    history_.emplace(id, record);
    nonce_ = id;
    penalties_burned_ = burned_after;

    return id;
}

// =============================================================================
// History
// =============================================================================

std::optional<LiquidationRecord> SXLiquidator::get(uint64_t liquidation_id) const {
    auto it = history_.find(liquidation_id);
    if (it == history_.end()) return std::nullopt;
    return it->second;
}

std::vector<LiquidationRecord> SXLiquidator::history_for(const Identity& account) const {
    std::vector<LiquidationRecord> results;
    for (const auto& [id, record] : history_) {
        if (record.liquidated == account) results.push_back(record);
    }
    return results;
}

} // namespace synx
