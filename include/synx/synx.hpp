#ifndef SYNX_SYNX_HPP
#define SYNX_SYNX_HPP

// =============================================================================
// SX - Synthetic Asset Solvency Engine
//
// Components:
//   SXAuthority   (Administrator & Circuit Breaker)
//   SXRegistry    (Oracle Registry)
//   SXFeed        (Price Submissions)
//   SXLedger      (Positions & Global Totals)
//   SXMinter      (Deposit & Mint)
//   SXLiquidator  (Partial Liquidations)
//   SXDiversifier (Multi-Asset Baskets)
//
// =============================================================================

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "types.hpp"
#include "authority.hpp"
#include "config.hpp"
#include "diversifier.hpp"
#include "feed.hpp"
#include "host.hpp"
#include "ledger.hpp"
#include "liquidator.hpp"
#include "minter.hpp"
#include "registry.hpp"

namespace synx {

// Consistent copy of global state and every position
struct ProtocolSnapshot {
    GlobalState global;
    std::vector<std::pair<Identity, Position>> positions;

    std::string to_json() const;
};

struct ReconciliationReport {
    Amount total_collateral = 0;
    Amount position_collateral = 0;   // sum over positions
    Amount collateral_drift = 0;      // |total - sum|, grows with liquidation penalties
    Amount total_synthetic_supply = 0;
    Amount position_debt = 0;         // sum over positions
    bool collateral_balanced = false;
    bool supply_balanced = false;
};

// =============================================================================
// SX - Unified Protocol Controller
//
// Every mutation runs under one exclusive lock; queries take a shared lock.
// Caller identity and block height come from the host.
// =============================================================================

class SX {
public:
    SX(IHost& host, const Config& config);
    ~SX();

    // Non-copyable
    SX(const SX&) = delete;
    SX& operator=(const SX&) = delete;

    // =========================================================================
    // Administration
    // =========================================================================

    void register_oracle(const Identity& oracle);
    void pause();
    void resume();

    // =========================================================================
    // Mutations
    // =========================================================================

    // Caller is the oracle. Returns the submission id.
    uint64_t submit_price(uint64_t asset_id, Amount price, uint64_t confidence);

    void deposit(Amount amount);

    // Returns the amount minted net of fee
    Amount mint(Amount amount);

    // Caller is the liquidator. Returns the liquidation id.
    uint64_t liquidate(const Identity& account, Amount debt_to_cover);

    DiversifiedResult manage_diversified(const DiversifiedRequest& request);

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<Position> get_position(const Identity& account) const;
    Amount get_current_price() const;
    BlockHeight last_price_update() const;
    bool is_paused() const;
    bool is_price_fresh() const;

    std::optional<Oracle> get_oracle(const Identity& oracle) const;
    std::optional<PriceSubmission> get_submission(uint64_t asset_id, uint64_t submission_id) const;
    std::optional<LiquidationRecord> get_liquidation(uint64_t liquidation_id) const;

    // Remaining debt capacity at the current price
    Amount max_mintable(const Identity& account) const;

    std::optional<Amount> weighted_price(uint64_t asset_id) const;

    // Accounts below the liquidation threshold at the live price
    std::vector<Identity> liquidatable_accounts() const;

    GlobalState global_state() const;
    ProtocolSnapshot snapshot() const;
    ReconciliationReport reconcile() const;

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t positions;
        uint64_t oracles;
        uint64_t submissions;
        uint64_t liquidations;
        Amount fees_collected;
        Amount penalties_burned;
        bool paused;
    };
    Stats get_stats() const;

    const Identity& admin() const { return authority_->admin(); }
    const ProtocolParams& params() const { return config_.protocol; }

    static constexpr const char* version() { return "1.0.0"; }

private:
    IHost& host_;
    Config config_;

    std::unique_ptr<SXAuthority> authority_;
    std::unique_ptr<SXRegistry> registry_;
    std::unique_ptr<SXFeed> feed_;
    std::unique_ptr<SXLedger> ledger_;
    std::unique_ptr<SXMinter> minter_;
    std::unique_ptr<SXLiquidator> liquidator_;
    std::unique_ptr<SXDiversifier> diversifier_;

    mutable std::shared_mutex mutex_;

    GlobalState global_state_locked() const;
    static void log_rejection(const char* operation, const Identity& caller, const SXError& e);
};

} // namespace synx

#endif // SYNX_SYNX_HPP
