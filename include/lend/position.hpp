#ifndef LEND_POSITION_HPP
#define LEND_POSITION_HPP

#include <tuple>

#include "types.hpp"

namespace lend {

enum class PositionSide : uint8_t {
    DEPOSIT = 0,
    BORROW = 1
};

// =============================================================================
// Position Key - ordered by user first so one user's positions are contiguous
// =============================================================================

struct PositionKey {
    Address user;
    PositionSide side;
    Currency asset;

    bool operator==(const PositionKey& other) const {
        return user == other.user && side == other.side && asset == other.asset;
    }

    bool operator<(const PositionKey& other) const {
        return std::tie(user, side, asset) < std::tie(other.user, other.side, other.asset);
    }
};

// =============================================================================
// UserPosition - principal paired with the index at last rebase
// =============================================================================

struct UserPosition {
    I128 principal_x18;
    I128 index_snapshot_x18;
    bool use_as_collateral;     // Deposits only

    // principal * index / snapshot, truncated
    I128 current_balance(I128 reserve_index_x18) const;

    // Rebase to the current index and add `delta`
    void increase(I128 delta_x18, I128 reserve_index_x18);

    // Rebase and subtract `delta`; errors::INSUFFICIENT_BALANCE leaves the
    // position untouched
    int32_t decrease(I128 delta_x18, I128 reserve_index_x18);

    static UserPosition open(I128 amount_x18, I128 reserve_index_x18);
};

} // namespace lend

#endif // LEND_POSITION_HPP
