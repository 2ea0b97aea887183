// =============================================================================
// feed.cpp - SXFeed Price Submission and Staleness Gating
// =============================================================================

#include "synx/feed.hpp"
#include <algorithm>
#include <unordered_map>

namespace synx {

SXFeed::SXFeed(SXRegistry& registry, const SXAuthority& authority,
               uint64_t min_confidence, uint64_t staleness_limit)
    : registry_(registry), authority_(authority),
      min_confidence_(min_confidence), staleness_limit_(staleness_limit) {}

// =============================================================================
// Submission
// =============================================================================

uint64_t SXFeed::submit(const Identity& oracle, uint64_t asset_id, Amount price,
                        uint64_t confidence, BlockHeight now) {
    if (!registry_.is_registered(oracle)) {
        throw SXError(Errc::OracleNotRegistered, oracle.str());
    }
    if (!registry_.is_active(oracle)) {
        throw SXError(Errc::NotAuthorized, "oracle " + oracle.str() + " is inactive");
    }

    authority_.require_running();

    if (confidence < min_confidence_ || confidence > 100) {
        throw SXError(Errc::InvalidAmount, "confidence " + std::to_string(confidence) +
                                           " outside [" + std::to_string(min_confidence_) + ", 100]");
    }
    if (price == 0) {
        throw SXError(Errc::InvalidAmount, "price must be positive");
    }

    uint64_t id = nonce_ + 1;

    PriceSubmission record;
    record.oracle = oracle;
    record.price = price;
    record.confidence = static_cast<uint8_t>(confidence);
    record.timestamp = now;

    submissions_.emplace(std::make_pair(asset_id, id), record);
    registry_.record_submission(oracle);
    nonce_ = id;

    current_price_ = price;
    last_update_ = now;

    return id;
}

// =============================================================================
// Staleness
// =============================================================================

bool SXFeed::is_fresh(BlockHeight last_update, BlockHeight now, uint64_t limit) {
    BlockHeight age = now > last_update ? now - last_update : 0;
    return age < limit;
}

bool SXFeed::is_fresh(BlockHeight now) const {
    return is_fresh(last_update_, now, staleness_limit_);
}

PriceQuote SXFeed::quote(BlockHeight now) const {
    return PriceQuote{current_price_, last_update_, has_price() && is_fresh(now)};
}

Amount SXFeed::require_fresh(BlockHeight now) const {
    if (!has_price()) {
        throw SXError(Errc::StalePrice, "no price has been accepted");
    }
    if (!is_fresh(now)) {
        throw SXError(Errc::StalePrice, "last update at block " + std::to_string(last_update_) +
                                        ", now " + std::to_string(now));
    }
    return current_price_;
}

// =============================================================================
// History
// =============================================================================

std::optional<PriceSubmission> SXFeed::get_submission(uint64_t asset_id, uint64_t submission_id) const {
    auto it = submissions_.find({asset_id, submission_id});
    if (it == submissions_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::pair<uint64_t, PriceSubmission>> SXFeed::submissions_for(uint64_t asset_id) const {
    std::vector<std::pair<uint64_t, PriceSubmission>> results;
    auto it = submissions_.lower_bound({asset_id, 0});
    for (; it != submissions_.end() && it->first.first == asset_id; ++it) {
        results.emplace_back(it->first.second, it->second);
    }
    return results;
}

std::optional<Amount> SXFeed::weighted_price(uint64_t asset_id, BlockHeight now) const {
    // Latest fresh submission per oracle (ids increase with time)
    std::unordered_map<Identity, Amount, IdentityHash> latest;
    for (const auto& [id, sub] : submissions_for(asset_id)) {
        if (!is_fresh(sub.timestamp, now, staleness_limit_)) continue;
        latest[sub.oracle] = sub.price;
    }

    std::vector<std::pair<Amount, uint64_t>> weighted;
    for (const auto& [oracle, price] : latest) {
        auto entry = registry_.get(oracle);
        if (!entry || !entry->is_active || entry->credibility_score == 0) continue;
        weighted.emplace_back(price, entry->credibility_score);
    }

    if (weighted.empty()) return std::nullopt;
    return aggregate_weighted_median(std::move(weighted));
}

Amount SXFeed::aggregate_weighted_median(std::vector<std::pair<Amount, uint64_t>> prices) {
    std::sort(prices.begin(), prices.end());

    Amount total_weight = 0;
    for (const auto& [p, w] : prices) {
        total_weight += w;
    }

    Amount half_weight = total_weight / 2;
    Amount cumulative = 0;

    for (const auto& [price, weight] : prices) {
        cumulative += weight;
        if (cumulative >= half_weight) {
            return price;
        }
    }

    return prices.back().first;
}

} // namespace synx
