// =============================================================================
// synx.cpp - SX Unified Protocol Controller
// =============================================================================

#include "synx/synx.hpp"
#include "synx/logger.hpp"
#include "synx/math.hpp"

#include <mutex>
#include <nlohmann/json.hpp>

namespace synx {

using json = nlohmann::json;

namespace {

json health_to_json(const Health& h) {
    json out;
    out["unbounded"] = h.is_unbounded();
    out["encoded"] = math::to_string(h.encoded());
    return out;
}

json position_to_json(const Identity& account, const Position& pos) {
    json out;
    out["account"] = account.str();
    out["collateral_deposited"] = math::to_string(pos.collateral_deposited);
    out["synthetic_minted"] = math::to_string(pos.synthetic_minted);
    out["last_interaction_block"] = pos.last_interaction_block;
    out["position_health"] = health_to_json(pos.position_health);
    out["liquidation_protected"] = pos.liquidation_protected;
    return out;
}

json global_to_json(const GlobalState& g) {
    json out;
    out["total_collateral"] = math::to_string(g.total_collateral);
    out["total_synthetic_supply"] = math::to_string(g.total_synthetic_supply);
    out["current_price"] = math::to_string(g.current_price);
    out["last_price_update"] = g.last_price_update;
    out["paused"] = g.paused;
    out["submission_nonce"] = g.submission_nonce;
    out["liquidation_nonce"] = g.liquidation_nonce;
    return out;
}

}  // namespace

std::string ProtocolSnapshot::to_json() const {
    json out;
    out["global"] = global_to_json(global);
    out["positions"] = json::array();
    for (const auto& [account, pos] : positions) {
        out["positions"].push_back(position_to_json(account, pos));
    }
    return out.dump();
}

// =============================================================================
// Construction
// =============================================================================

SX::SX(IHost& host, const Config& config)
    : host_(host), config_(config) {
    config_.validate();

    const ProtocolParams& p = config_.protocol;
    authority_ = std::make_unique<SXAuthority>(config_.admin);
    registry_ = std::make_unique<SXRegistry>(*authority_, p.initial_credibility);
    feed_ = std::make_unique<SXFeed>(*registry_, *authority_, p.min_oracle_confidence,
                                     p.oracle_staleness_limit);
    ledger_ = std::make_unique<SXLedger>(*authority_, p);
    minter_ = std::make_unique<SXMinter>(*ledger_, *feed_, host_);
    liquidator_ = std::make_unique<SXLiquidator>(*ledger_, *feed_, *authority_, host_, p);
    diversifier_ = std::make_unique<SXDiversifier>(*ledger_, *feed_, *authority_, host_, p);

    Logger::Info("synx " + std::string(version()) + " ready, admin " + config_.admin.str() +
                 ", custody " + host_.custody().str());
}

SX::~SX() = default;

void SX::log_rejection(const char* operation, const Identity& caller, const SXError& e) {
    std::string line = std::string(operation) + " rejected for " + caller.str() + ": " + e.what();
    switch (e.code()) {
        case Errc::NotAuthorized:
        case Errc::ContractPaused:
        case Errc::TransferFailed:
        case Errc::ArithmeticError:
            Logger::Warning(line);
            break;
        default:
            Logger::Debug(line);
            break;
    }
}

// =============================================================================
// Administration
// =============================================================================

void SX::register_oracle(const Identity& oracle) {
    std::unique_lock lock(mutex_);
    Identity caller = host_.caller();
    try {
        registry_->register_oracle(caller, oracle);
    } catch (const SXError& e) {
        log_rejection("register_oracle", caller, e);
        throw;
    }

    Logger::Info("oracle " + oracle.str() + " registered");
    json ev;
    ev["event"] = "oracle_registered";
    ev["oracle"] = oracle.str();
    ev["block"] = host_.block_height();
    Logger::Event(ev);
}

void SX::pause() {
    std::unique_lock lock(mutex_);
    Identity caller = host_.caller();
    try {
        authority_->pause(caller);
    } catch (const SXError& e) {
        log_rejection("pause", caller, e);
        throw;
    }

    Logger::Info("protocol paused by " + caller.str());
    json ev;
    ev["event"] = "paused";
    ev["block"] = host_.block_height();
    Logger::Event(ev);
}

void SX::resume() {
    std::unique_lock lock(mutex_);
    Identity caller = host_.caller();
    try {
        authority_->resume(caller);
    } catch (const SXError& e) {
        log_rejection("resume", caller, e);
        throw;
    }

    Logger::Info("protocol resumed by " + caller.str());
    json ev;
    ev["event"] = "resumed";
    ev["block"] = host_.block_height();
    Logger::Event(ev);
}

// =============================================================================
// Mutations
// =============================================================================

uint64_t SX::submit_price(uint64_t asset_id, Amount price, uint64_t confidence) {
    std::unique_lock lock(mutex_);
    Identity caller = host_.caller();
    BlockHeight now = host_.block_height();

    uint64_t id;
    try {
        id = feed_->submit(caller, asset_id, price, confidence, now);
    } catch (const SXError& e) {
        log_rejection("submit_price", caller, e);
        throw;
    }

    json ev;
    ev["event"] = "price_submission";
    ev["oracle"] = caller.str();
    ev["asset_id"] = asset_id;
    ev["submission_id"] = id;
    ev["price"] = math::to_string(price);
    ev["confidence"] = confidence;
    ev["block"] = now;
    Logger::Event(ev);
    return id;
}

void SX::deposit(Amount amount) {
    std::unique_lock lock(mutex_);
    Identity caller = host_.caller();
    BlockHeight now = host_.block_height();
    try {
        minter_->deposit(caller, amount, now);
    } catch (const SXError& e) {
        log_rejection("deposit", caller, e);
        throw;
    }

    json ev;
    ev["event"] = "deposit";
    ev["account"] = caller.str();
    ev["amount"] = math::to_string(amount);
    ev["block"] = now;
    Logger::Event(ev);
}

Amount SX::mint(Amount amount) {
    std::unique_lock lock(mutex_);
    Identity caller = host_.caller();
    BlockHeight now = host_.block_height();

    MintResult result;
    try {
        result = minter_->mint_detailed(caller, amount, now);
    } catch (const SXError& e) {
        log_rejection("mint", caller, e);
        throw;
    }

    json ev;
    ev["event"] = "mint";
    ev["account"] = caller.str();
    ev["gross"] = math::to_string(result.gross);
    ev["fee"] = math::to_string(result.fee);
    ev["net"] = math::to_string(result.net);
    ev["health"] = health_to_json(result.health);
    ev["block"] = now;
    Logger::Event(ev);
    return result.net;
}

uint64_t SX::liquidate(const Identity& account, Amount debt_to_cover) {
    std::unique_lock lock(mutex_);
    Identity caller = host_.caller();
    BlockHeight now = host_.block_height();

    uint64_t id;
    try {
        id = liquidator_->liquidate(caller, account, debt_to_cover, now);
    } catch (const SXError& e) {
        log_rejection("liquidate", caller, e);
        throw;
    }

    auto record = liquidator_->get(id);
    Logger::Info("liquidation #" + std::to_string(id) + " of " + account.str() + " by " +
                 caller.str() + ", debt " + math::to_string(debt_to_cover));

    json ev;
    ev["event"] = "liquidation";
    ev["liquidation_id"] = id;
    ev["account"] = account.str();
    ev["liquidator"] = caller.str();
    ev["debt_covered"] = math::to_string(debt_to_cover);
    ev["collateral_seized"] = math::to_string(record->collateral_seized);
    ev["reward"] = math::to_string(record->reward);
    ev["block"] = now;
    Logger::Event(ev);
    return id;
}

DiversifiedResult SX::manage_diversified(const DiversifiedRequest& request) {
    std::unique_lock lock(mutex_);
    Identity caller = host_.caller();
    BlockHeight now = host_.block_height();

    DiversifiedResult result;
    try {
        result = diversifier_->manage(caller, request, now);
    } catch (const SXError& e) {
        log_rejection("manage_diversified", caller, e);
        throw;
    }

    if (result.committed) {
        json ev;
        ev["event"] = "diversified_mint";
        ev["account"] = caller.str();
        ev["assets"] = request.asset_ids;
        ev["synthetic_amount"] = math::to_string(request.synthetic_amount);
        ev["collateral_locked"] = math::to_string(result.collateral_locked);
        ev["diversification_bonus"] = result.diversification_bonus;
        ev["health"] = health_to_json(result.health_ratio);
        ev["block"] = now;
        Logger::Event(ev);
    }
    return result;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<Position> SX::get_position(const Identity& account) const {
    std::shared_lock lock(mutex_);
    return ledger_->get(account);
}

Amount SX::get_current_price() const {
    std::shared_lock lock(mutex_);
    return feed_->current_price();
}

BlockHeight SX::last_price_update() const {
    std::shared_lock lock(mutex_);
    return feed_->last_update();
}

bool SX::is_paused() const {
    return authority_->is_paused();
}

bool SX::is_price_fresh() const {
    std::shared_lock lock(mutex_);
    return feed_->is_fresh(host_.block_height());
}

std::optional<Oracle> SX::get_oracle(const Identity& oracle) const {
    std::shared_lock lock(mutex_);
    return registry_->get(oracle);
}

std::optional<PriceSubmission> SX::get_submission(uint64_t asset_id, uint64_t submission_id) const {
    std::shared_lock lock(mutex_);
    return feed_->get_submission(asset_id, submission_id);
}

std::optional<LiquidationRecord> SX::get_liquidation(uint64_t liquidation_id) const {
    std::shared_lock lock(mutex_);
    return liquidator_->get(liquidation_id);
}

Amount SX::max_mintable(const Identity& account) const {
    std::shared_lock lock(mutex_);
    return minter_->headroom(account, host_.block_height());
}

std::optional<Amount> SX::weighted_price(uint64_t asset_id) const {
    std::shared_lock lock(mutex_);
    return feed_->weighted_price(asset_id, host_.block_height());
}

std::vector<Identity> SX::liquidatable_accounts() const {
    std::shared_lock lock(mutex_);
    return liquidator_->scan();
}

GlobalState SX::global_state_locked() const {
    GlobalState g;
    g.total_collateral = ledger_->total_collateral();
    g.total_synthetic_supply = ledger_->total_synthetic_supply();
    g.current_price = feed_->current_price();
    g.last_price_update = feed_->last_update();
    g.paused = authority_->is_paused();
    g.submission_nonce = feed_->submission_nonce();
    g.liquidation_nonce = liquidator_->liquidation_nonce();
    return g;
}

GlobalState SX::global_state() const {
    std::shared_lock lock(mutex_);
    return global_state_locked();
}

ProtocolSnapshot SX::snapshot() const {
    std::shared_lock lock(mutex_);
    return ProtocolSnapshot{global_state_locked(), ledger_->positions()};
}

ReconciliationReport SX::reconcile() const {
    std::shared_lock lock(mutex_);

    ReconciliationReport r;
    r.total_collateral = ledger_->total_collateral();
    r.total_synthetic_supply = ledger_->total_synthetic_supply();
    for (const auto& [account, pos] : ledger_->positions()) {
        r.position_collateral = math::add(r.position_collateral, pos.collateral_deposited);
        r.position_debt = math::add(r.position_debt, pos.synthetic_minted);
    }

    r.collateral_drift = r.total_collateral >= r.position_collateral
        ? r.total_collateral - r.position_collateral
        : r.position_collateral - r.total_collateral;
    r.collateral_balanced = r.total_collateral == r.position_collateral;
    r.supply_balanced = r.total_synthetic_supply == r.position_debt;
    return r;
}

SX::Stats SX::get_stats() const {
    std::shared_lock lock(mutex_);
    Stats s;
    s.positions = ledger_->size();
    s.oracles = registry_->size();
    s.submissions = feed_->submission_nonce();
    s.liquidations = liquidator_->count();
    s.fees_collected = minter_->fees_collected();
    s.penalties_burned = liquidator_->penalties_burned();
    s.paused = authority_->is_paused();
    return s;
}

} // namespace synx
