#ifndef SYNX_HOST_HPP
#define SYNX_HOST_HPP

#include <mutex>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace synx {

// =============================================================================
// Host Capability Interface
//
// Supplied by the embedding chain/runtime: caller authentication, the
// logical block clock and the value-transfer substrate.
// =============================================================================

class IHost {
public:
    virtual ~IHost() = default;

    // Authenticated caller of the current operation
    virtual Identity caller() const = 0;

    // Monotonic, non-decreasing block counter
    virtual BlockHeight block_height() const = 0;

    // Atomic value movement; false aborts the calling operation
    virtual bool transfer(Amount amount, const Identity& from, const Identity& to) = 0;

    // Identity holding protocol funds
    virtual Identity custody() const = 0;
};

// =============================================================================
// SimHost - In-Memory Host for Simulation and Tests
// =============================================================================

struct TransferRecord {
    Amount amount;
    Identity from;
    Identity to;
    BlockHeight block_height;
};

class SimHost : public IHost {
public:
    explicit SimHost(Identity custody = Identity("custody"));

    Identity caller() const override;
    BlockHeight block_height() const override;
    bool transfer(Amount amount, const Identity& from, const Identity& to) override;
    Identity custody() const override;

    // Control
    void set_caller(const Identity& id);
    void set_block_height(BlockHeight height);
    void advance_blocks(BlockHeight blocks);
    void fail_transfers(bool fail);

    // Balances
    void credit(const Identity& id, Amount amount);
    Amount balance(const Identity& id) const;

    std::vector<TransferRecord> transfers() const;

private:
    mutable std::mutex mutex_;
    Identity custody_;
    Identity caller_;
    BlockHeight height_ = 0;
    bool fail_transfers_ = false;
    std::unordered_map<Identity, Amount, IdentityHash> balances_;
    std::vector<TransferRecord> history_;
};

} // namespace synx

#endif // SYNX_HOST_HPP
