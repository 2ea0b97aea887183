#ifndef SYNX_REGISTRY_HPP
#define SYNX_REGISTRY_HPP

#include <optional>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "authority.hpp"

namespace synx {

// =============================================================================
// SXRegistry - Authorized Price Submitters
//
// Not internally synchronized; SX serializes access.
// =============================================================================

class SXRegistry {
public:
    SXRegistry(const SXAuthority& authority, uint64_t initial_credibility = 100);

    SXRegistry(const SXRegistry&) = delete;
    SXRegistry& operator=(const SXRegistry&) = delete;

    // Admin only. Re-registration reactivates and keeps counters.
    void register_oracle(const Identity& caller, const Identity& oracle);

    bool is_registered(const Identity& oracle) const;
    bool is_active(const Identity& oracle) const;
    std::optional<Oracle> get(const Identity& oracle) const;

    // Called by SXFeed after a submission is accepted
    void record_submission(const Identity& oracle);

    size_t size() const { return oracles_.size(); }
    std::vector<Identity> oracles() const;

private:
    const SXAuthority& authority_;
    uint64_t initial_credibility_;
    std::unordered_map<Identity, Oracle, IdentityHash> oracles_;
};

} // namespace synx

#endif // SYNX_REGISTRY_HPP
