// =============================================================================
// registry.cpp - SXRegistry Oracle Authorization
// =============================================================================

#include "synx/registry.hpp"
#include <algorithm>

namespace synx {

SXRegistry::SXRegistry(const SXAuthority& authority, uint64_t initial_credibility)
    : authority_(authority), initial_credibility_(initial_credibility) {}

void SXRegistry::register_oracle(const Identity& caller, const Identity& oracle) {
    authority_.require_admin(caller);

    if (oracle.empty()) {
        throw SXError(Errc::InvalidAmount, "empty oracle identity");
    }

    auto it = oracles_.find(oracle);
    if (it != oracles_.end()) {
        it->second.is_active = true;
        return;
    }

    Oracle entry;
    entry.is_active = true;
    entry.total_submissions = 0;
    entry.credibility_score = initial_credibility_;
    oracles_.emplace(oracle, entry);
}

bool SXRegistry::is_registered(const Identity& oracle) const {
    return oracles_.find(oracle) != oracles_.end();
}

bool SXRegistry::is_active(const Identity& oracle) const {
    auto it = oracles_.find(oracle);
    return it != oracles_.end() && it->second.is_active;
}

std::optional<Oracle> SXRegistry::get(const Identity& oracle) const {
    auto it = oracles_.find(oracle);
    if (it == oracles_.end()) return std::nullopt;
    return it->second;
}

void SXRegistry::record_submission(const Identity& oracle) {
    auto it = oracles_.find(oracle);
    if (it == oracles_.end()) {
        throw SXError(Errc::OracleNotRegistered, oracle.str());
    }
    it->second.total_submissions++;
}

std::vector<Identity> SXRegistry::oracles() const {
    std::vector<Identity> ids;
    ids.reserve(oracles_.size());
    for (const auto& [id, oracle] : oracles_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace synx
