#ifndef LEND_TRANSACTION_HPP
#define LEND_TRANSACTION_HPP

#include <map>
#include <optional>
#include <vector>

#include "state.hpp"

namespace lend {

// =============================================================================
// Transaction - staged view over WorldState
//
// Reads see staged writes first, then the world state with reserves projected
// to `now`. Nothing reaches the world state until commit(); dropping the
// transaction discards every staged change. A transaction built over a const
// world state is read-only and cannot commit.
// =============================================================================

class Transaction {
public:
    Transaction(WorldState& state, uint64_t now);
    Transaction(const WorldState& state, uint64_t now);

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    uint64_t now() const { return now_; }

    // Reserve accrued to now() and staged for write. nullptr if unknown.
    // Pointers stay valid for the lifetime of the transaction.
    // Throws MathError if accrual overflows.
    Reserve* reserve_for_update(const Currency& asset);

    // Reserve projected to now() without staging it
    std::optional<Reserve> reserve_view(const Currency& asset) const;

    std::optional<UserPosition> position(const PositionKey& key) const;
    void put_position(const PositionKey& key, const UserPosition& position);
    void erase_position(const PositionKey& key);

    // The user's positions with staged changes applied
    std::vector<std::pair<PositionKey, UserPosition>> user_positions(const Address& user) const;

    bool has_borrows(const Address& user) const;

    // Write every staged reserve and position to the world state.
    // Throws std::logic_error on a read-only or already committed transaction.
    void commit();

private:
    const WorldState& state_;
    WorldState* writable_;
    uint64_t now_;

    std::map<Currency, Reserve> reserves_;
    std::map<PositionKey, std::optional<UserPosition>> positions_;  // nullopt = erase
    bool committed_{false};
};

} // namespace lend

#endif // LEND_TRANSACTION_HPP
