// =============================================================================
// diversifier.cpp - SXDiversifier Basket Deposits and Mints
// =============================================================================

#include "synx/diversifier.hpp"
#include "synx/math.hpp"

namespace synx {

SXDiversifier::SXDiversifier(SXLedger& ledger, const SXFeed& feed, const SXAuthority& authority,
                             IHost& host, const ProtocolParams& params)
    : ledger_(ledger), feed_(feed), authority_(authority), host_(host), params_(params) {}

uint64_t SXDiversifier::diversification_bonus(size_t asset_count) {
    return asset_count > 2 ? DIVERSIFICATION_BONUS_BROAD : DIVERSIFICATION_BONUS_NARROW;
}

DiversifiedResult SXDiversifier::manage(const Identity& account, const DiversifiedRequest& request,
                                        BlockHeight now) {
    const size_t count = request.asset_ids.size();

    if (request.amounts.size() != count || request.risk_scores.size() != count) {
        throw SXError(Errc::InvalidAmount, "asset, amount and risk arrays differ in length");
    }
    if (count < 2) {
        throw SXError(Errc::InvalidAmount, "single-asset positions use deposit/mint");
    }
    if (count > params_.max_basket_assets) {
        throw SXError(Errc::InvalidAmount, "at most " + std::to_string(params_.max_basket_assets) +
                                           " assets per basket");
    }

    authority_.require_running();
    Amount price = feed_.require_fresh(now);

    Amount total_value = 0;
    for (Amount a : request.amounts) {
        total_value = math::add(total_value, a);
    }

    Amount risk_sum = 0;
    for (uint64_t r : request.risk_scores) {
        risk_sum = math::add(risk_sum, r);
    }
    uint64_t avg_risk = static_cast<uint64_t>(math::div(risk_sum, count));

    uint64_t bonus = diversification_bonus(count);
    Amount adjusted_ratio = math::sub(params_.min_collateral_ratio, bonus);
    Amount max_mint = math::max_mintable(total_value, price, adjusted_ratio);

    const Position current = ledger_.open_or_get(account);
    const bool minting = request.operation == BasketOp::MINT;

    Amount projected_debt = minting
        ? math::add(current.synthetic_minted, request.synthetic_amount)
        : current.synthetic_minted;
    Amount projected_collateral = math::add(current.collateral_deposited, total_value);

    Health new_health = math::position_health(projected_collateral, projected_debt, price);
    Amount position_share = math::div(math::mul(projected_collateral, PERCENT),
                                      ledger_.total_collateral());

    if (position_share > params_.max_position_percentage) {
        throw SXError(Errc::ExceedsMaxPosition, "position share " + math::to_string(position_share) + "%");
    }
    if (new_health.below(params_.min_collateral_ratio)) {
        throw SXError(Errc::InsufficientCollateral, "projected health below minimum ratio");
    }
    if (request.synthetic_amount > max_mint) {
        throw SXError(Errc::InsufficientCollateral,
                      "synthetic amount exceeds basket capacity " + math::to_string(max_mint));
    }
    if (avg_risk < params_.min_avg_risk_score) {
        throw SXError(Errc::InvalidAmount, "average risk score " + std::to_string(avg_risk) +
                                           " below " + std::to_string(params_.min_avg_risk_score));
    }

    DiversifiedResult result;
    result.health_ratio = new_health;
    result.diversification_bonus = bonus;
    result.max_additional_mintable = max_mint;
    result.avg_risk_score = avg_risk;
    result.collateral_locked = projected_collateral;

    if (!minting) {
        return result;
    }

    LedgerTxn txn = ledger_.begin();
    Position& pos = txn.stage(account);
    pos.collateral_deposited = projected_collateral;
    pos.synthetic_minted = projected_debt;
    pos.position_health = new_health;
    pos.liquidation_protected = bonus > 8;
    pos.last_interaction_block = now;
    txn.add_collateral(total_value);
    txn.add_supply(request.synthetic_amount);

    if (!host_.transfer(total_value, account, host_.custody())) {
        throw SXError(Errc::TransferFailed, "basket collateral transfer from " + account.str());
    }

    txn.commit();

    result.committed = true;
    return result;
}

} // namespace synx
