// Shared fixtures for the lend test suite

#pragma once

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_tostring.hpp>
#include <map>
#include <string>

#include "lend/lend.hpp"

namespace Catch {
template <>
struct StringMaker<__int128> {
    static std::string convert(__int128 value) {
        return lend::x18::to_string(value);
    }
};
}  // namespace Catch

namespace lend::test {

inline I128 dec(const char* s) { return x18::from_string(s); }

inline ReserveConfig make_reserve_config(const Currency& asset, RateConfig rate,
                                         const char* collateral_factor,
                                         const char* liquidation_threshold,
                                         const char* liquidation_bonus,
                                         const char* close_factor = "0.5") {
    ReserveConfig config;
    config.asset = asset;
    config.rate = rate;
    config.liquidation.collateral_factor_x18 = dec(collateral_factor);
    config.liquidation.liquidation_threshold_x18 = dec(liquidation_threshold);
    config.liquidation.liquidation_bonus_x18 = dec(liquidation_bonus);
    config.liquidation.close_factor_x18 = dec(close_factor);
    config.active = true;
    config.borrowing_enabled = true;
    return config;
}

inline RateConfig kinked_annual(const char* base, const char* optimal, const char* slope1,
                                const char* slope2, const char* reserve_factor) {
    return RateConfig::from_annual(RateModelKind::KINKED, dec(base), dec(optimal),
                                   dec(slope1), dec(slope2), dec(reserve_factor));
}

inline RateConfig fixed_annual(const char* apr, const char* reserve_factor = "0") {
    return RateConfig::from_annual(RateModelKind::FIXED, dec(apr), 0, 0, 0, dec(reserve_factor));
}

// Two-asset market: USDC ($1, CF 80%) and ETH ($2000, CF 75%, bonus 10%).
// The clock is manual; advance() re-stamps every price so quotes stay fresh.
struct MarketFixture {
    Address admin = address_from_id(1);
    Address pool_account = address_from_id(2);
    Address alice = address_from_id(100);
    Address bob = address_from_id(101);
    Address carol = address_from_id(102);

    Currency usdc{address_from_id(0xA0)};
    Currency eth{address_from_id(0xE0)};

    uint64_t clock = 1700000000;
    std::map<Currency, I128> marks;

    PriceBook prices;
    InMemoryLedger ledger;
    LendingPool pool;

    MarketFixture() : pool(admin, pool_account, prices, ledger) {
        pool.set_clock([this] { return clock; });

        REQUIRE(pool.init_reserve(admin, make_reserve_config(
            usdc, kinked_annual("0", "0.8", "0.04", "0.6", "0.1"), "0.8", "0.85", "0.05")) == errors::OK);
        REQUIRE(pool.init_reserve(admin, make_reserve_config(
            eth, kinked_annual("0", "0.8", "0.04", "0.6", "0.1"), "0.75", "0.8", "0.1")) == errors::OK);

        set_price(usdc, "1");
        set_price(eth, "2000");

        for (const auto& user : {alice, bob, carol}) {
            ledger.mint(usdc, user, x18::from_int(1000000));
            ledger.mint(eth, user, x18::from_int(1000));
        }
    }

    void set_price(const Currency& asset, const char* price) {
        marks[asset] = dec(price);
        prices.set_price(asset, marks[asset], clock);
    }

    void advance(uint64_t seconds) {
        clock += seconds;
        for (const auto& [asset, price] : marks) {
            prices.set_price(asset, price, clock);
        }
    }

    ReserveData reserve(const Currency& asset) const {
        auto data = pool.get_reserve_data(asset);
        REQUIRE(data.has_value());
        return *data;
    }

    // alice: 10 ETH collateral, 5000 USDC debt; carol supplies 10000 USDC
    void open_eth_backed_loan() {
        REQUIRE(pool.deposit(carol, usdc, x18::from_int(10000)) == errors::OK);
        REQUIRE(pool.deposit(alice, eth, x18::from_int(10)) == errors::OK);
        REQUIRE(pool.borrow(alice, usdc, x18::from_int(5000)) == errors::OK);
    }
};

}  // namespace lend::test
