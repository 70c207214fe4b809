// World state storage, staged transactions, access footprints

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

#include <stdexcept>

using namespace lend;
using lend::test::dec;

namespace {

constexpr uint64_t T0 = 1000;

const Address ALICE = address_from_id(100);
const Address BOB = address_from_id(101);
const Currency USDC{address_from_id(0xA0)};
const Currency ETH{address_from_id(0xE0)};

Reserve make_reserve(const Currency& asset) {
    ReserveConfig config = test::make_reserve_config(
        asset, RateConfig{RateModelKind::FIXED, dec("0.001"), 0, 0, 0, 0}, "0.8", "0.85", "0.05");
    Reserve reserve = Reserve::create(config, T0);
    reserve.total_deposits_x18 = x18::from_int(1000);
    reserve.total_borrows_x18 = x18::from_int(500);
    return reserve;
}

} // namespace

// =============================================================================
// WorldState
// =============================================================================

TEST_CASE("Reserves are keyed by asset", "[state]") {
    WorldState state;
    REQUIRE_FALSE(state.has_reserve(USDC));
    REQUIRE_FALSE(state.get_reserve(USDC).has_value());

    state.put_reserve(make_reserve(USDC));
    state.put_reserve(make_reserve(ETH));

    REQUIRE(state.has_reserve(USDC));
    REQUIRE(state.reserve_count() == 2);
    REQUIRE(state.reserve_assets() == std::vector<Currency>{USDC, ETH});
}

TEST_CASE("User position scan stays within one user", "[state]") {
    WorldState state;
    state.put_position({ALICE, PositionSide::DEPOSIT, ETH}, UserPosition::open(X18_ONE, X18_ONE));
    state.put_position({ALICE, PositionSide::BORROW, USDC}, UserPosition::open(X18_ONE, X18_ONE));
    state.put_position({BOB, PositionSide::DEPOSIT, USDC}, UserPosition::open(X18_ONE, X18_ONE));

    auto positions = state.user_positions(ALICE);
    REQUIRE(positions.size() == 2);
    for (const auto& entry : positions) {
        REQUIRE(entry.first.user == ALICE);
    }

    state.erase_position({ALICE, PositionSide::BORROW, USDC});
    REQUIRE(state.user_positions(ALICE).size() == 1);
    REQUIRE(state.position_count() == 2);
    REQUIRE(state.user_positions(address_from_id(999)).empty());
}

// =============================================================================
// Transaction
// =============================================================================

TEST_CASE("Dropped transaction changes nothing", "[transaction]") {
    WorldState state;
    state.put_reserve(make_reserve(USDC));

    {
        Transaction tx(state, T0 + 100);
        Reserve* reserve = tx.reserve_for_update(USDC);
        REQUIRE(reserve != nullptr);
        REQUIRE(reserve->borrow_index_x18 == dec("1.1"));
        reserve->total_deposits_x18 = 0;
        tx.put_position({ALICE, PositionSide::DEPOSIT, USDC}, UserPosition::open(X18_ONE, X18_ONE));
    }

    auto stored = state.get_reserve(USDC);
    REQUIRE(stored->borrow_index_x18 == X18_ONE);
    REQUIRE(stored->last_update_timestamp == T0);
    REQUIRE(state.position_count() == 0);
}

TEST_CASE("Commit writes staged reserves and positions", "[transaction]") {
    WorldState state;
    state.put_reserve(make_reserve(USDC));
    state.put_position({ALICE, PositionSide::BORROW, USDC}, UserPosition::open(X18_ONE, X18_ONE));

    Transaction tx(state, T0 + 100);
    REQUIRE(tx.reserve_for_update(USDC) != nullptr);
    tx.put_position({ALICE, PositionSide::DEPOSIT, ETH}, UserPosition::open(X18_ONE, X18_ONE));
    tx.erase_position({ALICE, PositionSide::BORROW, USDC});

    REQUIRE_FALSE(tx.has_borrows(ALICE));
    REQUIRE(state.get_position({ALICE, PositionSide::BORROW, USDC}).has_value());

    tx.commit();

    REQUIRE(state.get_reserve(USDC)->last_update_timestamp == T0 + 100);
    REQUIRE(state.get_position({ALICE, PositionSide::DEPOSIT, ETH}).has_value());
    REQUIRE_FALSE(state.get_position({ALICE, PositionSide::BORROW, USDC}).has_value());
    REQUIRE_THROWS_AS(tx.commit(), std::logic_error);
}

TEST_CASE("Reads see staged writes first", "[transaction]") {
    WorldState state;
    state.put_reserve(make_reserve(USDC));
    state.put_position({ALICE, PositionSide::DEPOSIT, USDC}, UserPosition::open(X18_ONE, X18_ONE));

    Transaction tx(state, T0 + 100);
    Reserve* reserve = tx.reserve_for_update(USDC);
    reserve->total_deposits_x18 = x18::from_int(7);
    REQUIRE(tx.reserve_for_update(USDC) == reserve);
    REQUIRE(tx.reserve_view(USDC)->total_deposits_x18 == x18::from_int(7));

    tx.put_position({ALICE, PositionSide::DEPOSIT, USDC}, UserPosition::open(x18::from_int(3), X18_ONE));
    REQUIRE(tx.position({ALICE, PositionSide::DEPOSIT, USDC})->principal_x18 == x18::from_int(3));

    tx.put_position({ALICE, PositionSide::BORROW, ETH}, UserPosition::open(X18_ONE, X18_ONE));
    REQUIRE(tx.user_positions(ALICE).size() == 2);
    REQUIRE(tx.has_borrows(ALICE));

    REQUIRE_FALSE(tx.reserve_view(ETH).has_value());
    REQUIRE(tx.reserve_for_update(ETH) == nullptr);
}

TEST_CASE("Read-only transaction projects but cannot commit", "[transaction]") {
    WorldState state;
    state.put_reserve(make_reserve(USDC));
    const WorldState& view = state;

    Transaction tx(view, T0 + 100);
    REQUIRE(tx.reserve_view(USDC)->borrow_index_x18 == dec("1.1"));
    REQUIRE(state.get_reserve(USDC)->borrow_index_x18 == X18_ONE);
    REQUIRE_THROWS_AS(tx.commit(), std::logic_error);
}

// =============================================================================
// AccessFootprint
// =============================================================================

TEST_CASE("Footprints record reads and writes", "[state]") {
    WorldState state;
    state.put_reserve(make_reserve(USDC));

    AccessFootprint footprint;
    state.set_tracker(&footprint);

    Transaction tx(state, T0 + 10);
    tx.reserve_for_update(USDC);
    tx.position({ALICE, PositionSide::DEPOSIT, USDC});
    tx.put_position({ALICE, PositionSide::DEPOSIT, USDC}, UserPosition::open(X18_ONE, X18_ONE));
    tx.user_positions(ALICE);
    tx.commit();
    state.set_tracker(nullptr);

    REQUIRE(footprint.reserves_read.count(USDC) == 1);
    REQUIRE(footprint.reserves_written.count(USDC) == 1);
    REQUIRE(footprint.positions_written.size() == 1);
    REQUIRE(footprint.users_scanned.count(ALICE) == 1);
    REQUIRE(footprint.reserves_read.count(ETH) == 0);

    footprint.clear();
    REQUIRE(footprint.reserves_read.empty());
    REQUIRE(footprint.positions_written.empty());
}

TEST_CASE("Footprint conflicts", "[state]") {
    AccessFootprint a;
    AccessFootprint b;

    SECTION("disjoint writes do not conflict") {
        a.reserves_written.insert(USDC);
        b.reserves_written.insert(ETH);
        REQUIRE_FALSE(a.conflicts_with(b));
    }

    SECTION("shared reads do not conflict") {
        a.reserves_read.insert(USDC);
        b.reserves_read.insert(USDC);
        REQUIRE_FALSE(a.conflicts_with(b));
    }

    SECTION("write against read conflicts") {
        a.reserves_written.insert(USDC);
        b.reserves_read.insert(USDC);
        REQUIRE(a.conflicts_with(b));
        REQUIRE(b.conflicts_with(a));
    }

    SECTION("position write against a scan of that user conflicts") {
        a.positions_written.insert({ALICE, PositionSide::BORROW, USDC});
        b.users_scanned.insert(ALICE);
        REQUIRE(a.conflicts_with(b));

        AccessFootprint c;
        c.users_scanned.insert(BOB);
        REQUIRE_FALSE(a.conflicts_with(c));
    }
}
