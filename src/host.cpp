// =============================================================================
// host.cpp - In-Memory Host Capabilities
// =============================================================================

#include "synx/host.hpp"

namespace synx {

SimHost::SimHost(Identity custody) : custody_(std::move(custody)) {}

Identity SimHost::caller() const {
    std::lock_guard lock(mutex_);
    return caller_;
}

BlockHeight SimHost::block_height() const {
    std::lock_guard lock(mutex_);
    return height_;
}

Identity SimHost::custody() const {
    return custody_;
}

bool SimHost::transfer(Amount amount, const Identity& from, const Identity& to) {
    std::lock_guard lock(mutex_);

    if (fail_transfers_) return false;

    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        return false;
    }

    it->second -= amount;
    balances_[to] += amount;
    history_.push_back(TransferRecord{amount, from, to, height_});
    return true;
}

void SimHost::set_caller(const Identity& id) {
    std::lock_guard lock(mutex_);
    caller_ = id;
}

void SimHost::set_block_height(BlockHeight height) {
    std::lock_guard lock(mutex_);
    // Clock never moves backwards
    if (height > height_) height_ = height;
}

void SimHost::advance_blocks(BlockHeight blocks) {
    std::lock_guard lock(mutex_);
    height_ += blocks;
}

void SimHost::fail_transfers(bool fail) {
    std::lock_guard lock(mutex_);
    fail_transfers_ = fail;
}

void SimHost::credit(const Identity& id, Amount amount) {
    std::lock_guard lock(mutex_);
    balances_[id] += amount;
}

Amount SimHost::balance(const Identity& id) const {
    std::lock_guard lock(mutex_);
    auto it = balances_.find(id);
    return it != balances_.end() ? it->second : 0;
}

std::vector<TransferRecord> SimHost::transfers() const {
    std::lock_guard lock(mutex_);
    return history_;
}

} // namespace synx
