#ifndef SYNX_FEED_HPP
#define SYNX_FEED_HPP

#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "types.hpp"
#include "authority.hpp"
#include "registry.hpp"

namespace synx {

// =============================================================================
// Price Quote (value copy handed to consumers)
// =============================================================================

struct PriceQuote {
    Amount price;
    BlockHeight last_update;
    bool fresh;
};

// =============================================================================
// SXFeed - Oracle Price Submissions
//
// The feed is single-asset-authoritative: asset_id is recorded with each
// submission for audit, but every accepted submission overwrites the one
// global current price.
// =============================================================================

class SXFeed {
public:
    SXFeed(SXRegistry& registry, const SXAuthority& authority,
           uint64_t min_confidence = 60, uint64_t staleness_limit = 100);

    SXFeed(const SXFeed&) = delete;
    SXFeed& operator=(const SXFeed&) = delete;

    // =========================================================================
    // Submission
    // =========================================================================

    // Returns the new submission id. First failure wins:
    // OracleNotRegistered, NotAuthorized, ContractPaused, InvalidAmount.
    uint64_t submit(const Identity& oracle, uint64_t asset_id, Amount price,
                    uint64_t confidence, BlockHeight now);

    // =========================================================================
    // Current Price
    // =========================================================================

    Amount current_price() const noexcept { return current_price_; }
    BlockHeight last_update() const noexcept { return last_update_; }
    bool has_price() const noexcept { return current_price_ > 0; }

    // now - last_update < limit
    static bool is_fresh(BlockHeight last_update, BlockHeight now, uint64_t limit);
    bool is_fresh(BlockHeight now) const;

    PriceQuote quote(BlockHeight now) const;

    // Throws StalePrice when stale or no price was ever accepted
    Amount require_fresh(BlockHeight now) const;

    uint64_t staleness_limit() const noexcept { return staleness_limit_; }

    // =========================================================================
    // Submission History
    // =========================================================================

    std::optional<PriceSubmission> get_submission(uint64_t asset_id, uint64_t submission_id) const;
    std::vector<std::pair<uint64_t, PriceSubmission>> submissions_for(uint64_t asset_id) const;
    uint64_t submission_nonce() const noexcept { return nonce_; }

    // Weighted median of each active oracle's latest fresh submission for
    // the asset. The weight is the oracle's credibility score, which stays at
    // the registry's initial credibility, so with one registry setting every
    // oracle weighs the same and this is the plain (lower) median. Oracles
    // with zero credibility are ignored. Diagnostic only.
    std::optional<Amount> weighted_price(uint64_t asset_id, BlockHeight now) const;

private:
    SXRegistry& registry_;
    const SXAuthority& authority_;
    uint64_t min_confidence_;
    uint64_t staleness_limit_;

    // (asset_id, submission_id) -> submission
    std::map<std::pair<uint64_t, uint64_t>, PriceSubmission> submissions_;
    uint64_t nonce_ = 0;

    Amount current_price_ = 0;
    BlockHeight last_update_ = 0;

    static Amount aggregate_weighted_median(std::vector<std::pair<Amount, uint64_t>> prices);
};

} // namespace synx

#endif // SYNX_FEED_HPP
