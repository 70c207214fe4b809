// Interest rate curves

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

using namespace lend;
using lend::test::dec;

namespace {

RateConfig raw_kinked(const char* base, const char* optimal, const char* slope1,
                      const char* slope2, const char* reserve_factor) {
    return RateConfig{RateModelKind::KINKED, dec(base), dec(optimal),
                      dec(slope1), dec(slope2), dec(reserve_factor)};
}

} // namespace

TEST_CASE("Utilization", "[rate_model]") {
    SECTION("no borrows is zero") {
        REQUIRE(RateModel::utilization(0, x18::from_int(100)) == 0);
        REQUIRE(RateModel::utilization(0, 0) == 0);
    }

    SECTION("borrows over borrows plus cash") {
        REQUIRE(RateModel::utilization(x18::from_int(500), x18::from_int(500)) == X18_HALF);
        REQUIRE(RateModel::utilization(x18::from_int(900), x18::from_int(100)) == dec("0.9"));
    }

    SECTION("fully drained pool is one") {
        REQUIRE(RateModel::utilization(x18::from_int(100), 0) == X18_ONE);
        REQUIRE(RateModel::utilization(x18::from_int(100), -x18::from_int(5)) == X18_ONE);
    }
}

TEST_CASE("Kinked curve", "[rate_model]") {
    RateConfig config = raw_kinked("0", "0.8", "0.04", "0.6", "0");

    SECTION("above the kink") {
        REQUIRE(RateModel::borrow_rate(config, dec("0.9")) == dec("0.34"));
    }

    SECTION("below the kink") {
        REQUIRE(RateModel::borrow_rate(config, dec("0.4")) == dec("0.02"));
        REQUIRE(RateModel::borrow_rate(config, 0) == 0);
    }

    SECTION("at the kink") {
        REQUIRE(RateModel::borrow_rate(config, dec("0.8")) == dec("0.04"));
    }

    SECTION("full utilization") {
        REQUIRE(RateModel::borrow_rate(config, X18_ONE) == dec("0.64"));
    }

    SECTION("out of range utilization is clamped") {
        REQUIRE(RateModel::borrow_rate(config, dec("1.5")) == dec("0.64"));
        REQUIRE(RateModel::borrow_rate(config, -X18_ONE) == 0);
    }

    SECTION("rate never decreases with utilization") {
        I128 previous = 0;
        for (int pct = 0; pct <= 100; ++pct) {
            I128 rate = RateModel::borrow_rate(config, X18_ONE / 100 * pct);
            REQUIRE(rate >= previous);
            previous = rate;
        }
    }
}

TEST_CASE("Kinked curve edge kinks", "[rate_model]") {
    SECTION("optimal at zero uses only the second slope") {
        RateConfig config = raw_kinked("0.01", "0", "0.04", "0.6", "0");
        REQUIRE(RateModel::borrow_rate(config, 0) == dec("0.01"));
        REQUIRE(RateModel::borrow_rate(config, X18_HALF) == dec("0.31"));
        REQUIRE(RateModel::borrow_rate(config, X18_ONE) == dec("0.61"));
        // No step as utilization leaves zero
        REQUIRE(RateModel::borrow_rate(config, 1) == dec("0.01"));
    }

    SECTION("optimal at one never reaches the second slope") {
        RateConfig config = raw_kinked("0", "1", "0.04", "0.6", "0");
        REQUIRE(RateModel::borrow_rate(config, X18_ONE) == dec("0.04"));
        REQUIRE(RateModel::borrow_rate(config, X18_HALF) == dec("0.02"));
    }
}

TEST_CASE("Linear and fixed curves", "[rate_model]") {
    RateConfig linear{RateModelKind::LINEAR, dec("0.02"), 0, dec("0.1"), 0, 0};
    REQUIRE(RateModel::borrow_rate(linear, 0) == dec("0.02"));
    REQUIRE(RateModel::borrow_rate(linear, X18_HALF) == dec("0.07"));

    RateConfig fixed{RateModelKind::FIXED, dec("0.05"), 0, dec("9"), dec("9"), 0};
    REQUIRE(RateModel::borrow_rate(fixed, 0) == dec("0.05"));
    REQUIRE(RateModel::borrow_rate(fixed, X18_ONE) == dec("0.05"));
}

TEST_CASE("Supply rate", "[rate_model]") {
    RateConfig config{RateModelKind::FIXED, dec("0.1"), 0, 0, 0, dec("0.2")};

    // 0.1 * 0.5 * (1 - 0.2)
    REQUIRE(RateModel::supply_rate(config, X18_HALF) == dec("0.04"));
    REQUIRE(RateModel::supply_rate(config, 0) == 0);

    Rates rates = RateModel::rates(config, X18_HALF);
    REQUIRE(rates.borrow_rate_x18 == dec("0.1"));
    REQUIRE(rates.supply_rate_x18 <= x18::mul(rates.borrow_rate_x18, X18_HALF));
}

TEST_CASE("Annual figures become per-second rates", "[rate_model]") {
    RateConfig config = RateConfig::from_annual(RateModelKind::FIXED, dec("0.1"), 0, 0, 0, 0);
    REQUIRE(config.base_rate_x18 == dec("0.1") / static_cast<I128>(SECONDS_PER_YEAR));
    REQUIRE(config.base_rate_x18 == 3170979198);
}

TEST_CASE("Rate config validation", "[rate_model]") {
    REQUIRE(RateModel::validate(raw_kinked("0", "0.8", "0.04", "0.6", "0.1")) == errors::OK);
    REQUIRE(RateModel::validate(raw_kinked("0", "1.2", "0.04", "0.6", "0.1")) == errors::INVALID_CONFIG);
    REQUIRE(RateModel::validate(raw_kinked("0", "0.8", "0.04", "0.6", "1.1")) == errors::INVALID_CONFIG);
    REQUIRE(RateModel::validate(raw_kinked("-0.01", "0.8", "0.04", "0.6", "0")) == errors::INVALID_CONFIG);
    REQUIRE(RateModel::validate(raw_kinked("0", "0.8", "-0.04", "0.6", "0")) == errors::INVALID_CONFIG);
}
