#ifndef LEND_STATE_HPP
#define LEND_STATE_HPP

#include <map>
#include <set>
#include <vector>
#include <optional>

#include "reserve.hpp"
#include "position.hpp"

namespace lend {

// =============================================================================
// Access Footprint - read/write sets of one operation
// =============================================================================

struct AccessFootprint {
    std::set<Currency> reserves_read;
    std::set<Currency> reserves_written;
    std::set<PositionKey> positions_read;
    std::set<PositionKey> positions_written;
    std::set<Address> users_scanned;    // Range reads over a user's positions

    void clear();

    // True when either footprint writes something the other reads or writes
    bool conflicts_with(const AccessFootprint& other) const;
};

// =============================================================================
// WorldState - reserves and positions keyed by asset and (user, side, asset)
// =============================================================================

class WorldState {
public:
    WorldState() = default;

    // Reserves
    bool has_reserve(const Currency& asset) const;
    std::optional<Reserve> get_reserve(const Currency& asset) const;
    void put_reserve(const Reserve& reserve);
    std::vector<Currency> reserve_assets() const;

    // Positions
    std::optional<UserPosition> get_position(const PositionKey& key) const;
    void put_position(const PositionKey& key, const UserPosition& position);
    void erase_position(const PositionKey& key);

    // All positions of one user, touching no other user's entries
    std::vector<std::pair<PositionKey, UserPosition>> user_positions(const Address& user) const;

    size_t reserve_count() const { return reserves_.size(); }
    size_t position_count() const { return positions_.size(); }

    // Footprint recording; pass nullptr to stop
    void set_tracker(AccessFootprint* tracker) { tracker_ = tracker; }

private:
    std::map<Currency, Reserve> reserves_;
    std::map<PositionKey, UserPosition> positions_;

    AccessFootprint* tracker_{nullptr};
};

} // namespace lend

#endif // LEND_STATE_HPP
