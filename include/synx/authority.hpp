#ifndef SYNX_AUTHORITY_HPP
#define SYNX_AUTHORITY_HPP

#include <atomic>

#include "types.hpp"

namespace synx {

// =============================================================================
// SXAuthority - Administrator Identity and Global Circuit Breaker
// =============================================================================

class SXAuthority {
public:
    explicit SXAuthority(Identity admin) : admin_(std::move(admin)) {}

    SXAuthority(const SXAuthority&) = delete;
    SXAuthority& operator=(const SXAuthority&) = delete;

    const Identity& admin() const noexcept { return admin_; }
    bool is_admin(const Identity& caller) const noexcept { return caller == admin_; }

    // Throws NotAuthorized
    void require_admin(const Identity& caller) const {
        if (!is_admin(caller)) {
            throw SXError(Errc::NotAuthorized, caller.str() + " is not the administrator");
        }
    }

    // Throws ContractPaused
    void require_running() const {
        if (is_paused()) {
            throw SXError(Errc::ContractPaused);
        }
    }

    bool is_paused() const noexcept { return paused_.load(std::memory_order_acquire); }

    void pause(const Identity& caller) {
        require_admin(caller);
        paused_.store(true, std::memory_order_release);
    }

    void resume(const Identity& caller) {
        require_admin(caller);
        paused_.store(false, std::memory_order_release);
    }

private:
    Identity admin_;
    std::atomic<bool> paused_{false};
};

} // namespace synx

#endif // SYNX_AUTHORITY_HPP
