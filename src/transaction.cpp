// =============================================================================
// transaction.cpp - Staged reads and writes over the world state
// =============================================================================

#include "lend/transaction.hpp"
#include "lend/accrual.hpp"

#include <stdexcept>

namespace lend {

Transaction::Transaction(WorldState& state, uint64_t now)
    : state_(state), writable_(&state), now_(now) {}

Transaction::Transaction(const WorldState& state, uint64_t now)
    : state_(state), writable_(nullptr), now_(now) {}

Reserve* Transaction::reserve_for_update(const Currency& asset) {
    auto it = reserves_.find(asset);
    if (it != reserves_.end()) {
        return &it->second;
    }

    auto stored = state_.get_reserve(asset);
    if (!stored) return nullptr;

    Reserve accrued = AccrualEngine::project(*stored, now_);
    auto inserted = reserves_.emplace(asset, accrued);
    return &inserted.first->second;
}

std::optional<Reserve> Transaction::reserve_view(const Currency& asset) const {
    auto it = reserves_.find(asset);
    if (it != reserves_.end()) {
        return it->second;
    }

    auto stored = state_.get_reserve(asset);
    if (!stored) return std::nullopt;
    return AccrualEngine::project(*stored, now_);
}

std::optional<UserPosition> Transaction::position(const PositionKey& key) const {
    auto it = positions_.find(key);
    if (it != positions_.end()) {
        return it->second;
    }
    return state_.get_position(key);
}

void Transaction::put_position(const PositionKey& key, const UserPosition& position) {
    positions_[key] = position;
}

void Transaction::erase_position(const PositionKey& key) {
    positions_[key] = std::nullopt;
}

std::vector<std::pair<PositionKey, UserPosition>> Transaction::user_positions(const Address& user) const {
    std::map<PositionKey, UserPosition> merged;
    for (const auto& [key, position] : state_.user_positions(user)) {
        merged[key] = position;
    }
    for (const auto& [key, staged] : positions_) {
        if (key.user != user) continue;
        if (staged) {
            merged[key] = *staged;
        } else {
            merged.erase(key);
        }
    }
    return std::vector<std::pair<PositionKey, UserPosition>>(merged.begin(), merged.end());
}

bool Transaction::has_borrows(const Address& user) const {
    for (const auto& [key, position] : user_positions(user)) {
        if (key.side == PositionSide::BORROW && position.principal_x18 > 0) return true;
    }
    return false;
}

void Transaction::commit() {
    if (!writable_) {
        throw std::logic_error("Transaction: read-only");
    }
    if (committed_) {
        throw std::logic_error("Transaction: already committed");
    }
    committed_ = true;

    for (const auto& [asset, reserve] : reserves_) {
        writable_->put_reserve(reserve);
    }
    for (const auto& [key, staged] : positions_) {
        if (staged) {
            writable_->put_position(key, *staged);
        } else {
            writable_->erase_position(key);
        }
    }
}

} // namespace lend
