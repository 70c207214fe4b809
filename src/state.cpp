// =============================================================================
// state.cpp - World state storage and access tracking
// =============================================================================

#include "lend/state.hpp"

#include <algorithm>

namespace lend {

namespace {

template <typename T>
bool intersects(const std::set<T>& a, const std::set<T>& b) {
    auto ia = a.begin();
    auto ib = b.begin();
    while (ia != a.end() && ib != b.end()) {
        if (*ia < *ib) ++ia;
        else if (*ib < *ia) ++ib;
        else return true;
    }
    return false;
}

bool writes_scanned_user(const std::set<PositionKey>& written, const std::set<Address>& scanned) {
    return std::any_of(written.begin(), written.end(), [&](const PositionKey& key) {
        return scanned.count(key.user) > 0;
    });
}

} // namespace

// =============================================================================
// AccessFootprint
// =============================================================================

void AccessFootprint::clear() {
    reserves_read.clear();
    reserves_written.clear();
    positions_read.clear();
    positions_written.clear();
    users_scanned.clear();
}

bool AccessFootprint::conflicts_with(const AccessFootprint& other) const {
    if (intersects(reserves_written, other.reserves_written) ||
        intersects(reserves_written, other.reserves_read) ||
        intersects(other.reserves_written, reserves_read)) {
        return true;
    }
    if (intersects(positions_written, other.positions_written) ||
        intersects(positions_written, other.positions_read) ||
        intersects(other.positions_written, positions_read)) {
        return true;
    }
    return writes_scanned_user(positions_written, other.users_scanned) ||
           writes_scanned_user(other.positions_written, users_scanned);
}

// =============================================================================
// Reserves
// =============================================================================

bool WorldState::has_reserve(const Currency& asset) const {
    if (tracker_) tracker_->reserves_read.insert(asset);
    return reserves_.find(asset) != reserves_.end();
}

std::optional<Reserve> WorldState::get_reserve(const Currency& asset) const {
    if (tracker_) tracker_->reserves_read.insert(asset);
    auto it = reserves_.find(asset);
    if (it == reserves_.end()) return std::nullopt;
    return it->second;
}

void WorldState::put_reserve(const Reserve& reserve) {
    if (tracker_) tracker_->reserves_written.insert(reserve.config.asset);
    reserves_[reserve.config.asset] = reserve;
}

std::vector<Currency> WorldState::reserve_assets() const {
    std::vector<Currency> assets;
    assets.reserve(reserves_.size());
    for (const auto& [asset, reserve] : reserves_) {
        if (tracker_) tracker_->reserves_read.insert(asset);
        assets.push_back(asset);
    }
    return assets;
}

// =============================================================================
// Positions
// =============================================================================

std::optional<UserPosition> WorldState::get_position(const PositionKey& key) const {
    if (tracker_) tracker_->positions_read.insert(key);
    auto it = positions_.find(key);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

void WorldState::put_position(const PositionKey& key, const UserPosition& position) {
    if (tracker_) tracker_->positions_written.insert(key);
    positions_[key] = position;
}

void WorldState::erase_position(const PositionKey& key) {
    if (tracker_) tracker_->positions_written.insert(key);
    positions_.erase(key);
}

std::vector<std::pair<PositionKey, UserPosition>> WorldState::user_positions(const Address& user) const {
    if (tracker_) tracker_->users_scanned.insert(user);

    std::vector<std::pair<PositionKey, UserPosition>> result;
    PositionKey first{user, PositionSide::DEPOSIT, Currency{}};
    for (auto it = positions_.lower_bound(first); it != positions_.end() && it->first.user == user; ++it) {
        if (tracker_) tracker_->positions_read.insert(it->first);
        result.emplace_back(it->first, it->second);
    }
    return result;
}

} // namespace lend
