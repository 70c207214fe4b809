// =============================================================================
// config.cpp - Market setup loading
// =============================================================================

#include "lend/config.hpp"
#include "lend/pool.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace lend {

namespace {

using nlohmann::json;

I128 decimal_field(const json& obj, const char* key, I128 fallback) {
    auto it = obj.find(key);
    if (it == obj.end()) return fallback;

    if (it->is_string()) return x18::from_string(it->get<std::string>());
    if (it->is_number_integer()) return x18::from_int(it->get<int64_t>());
    if (it->is_number_float()) return x18::from_string(it->dump());
    throw std::runtime_error(std::string("expected a decimal for '") + key + "'");
}

RateModelKind parse_kind(const std::string& kind) {
    if (kind == "kinked") return RateModelKind::KINKED;
    if (kind == "linear") return RateModelKind::LINEAR;
    if (kind == "fixed") return RateModelKind::FIXED;
    throw std::runtime_error("unknown rate model kind: " + kind);
}

ReserveSetup parse_reserve(const json& obj) {
    ReserveSetup setup;
    setup.symbol = obj.value("symbol", std::string{});
    setup.config.asset = Currency(parse_address(obj.at("asset").get<std::string>()));

    const json& rate = obj.at("rate_model");
    setup.config.rate = RateConfig::from_annual(
        parse_kind(rate.value("kind", std::string("kinked"))),
        decimal_field(rate, "base_apr", 0),
        decimal_field(rate, "optimal_utilization", x18::from_string("0.8")),
        decimal_field(rate, "slope1_apr", 0),
        decimal_field(rate, "slope2_apr", 0),
        decimal_field(rate, "reserve_factor", 0));

    const json& liq = obj.at("liquidation");
    setup.config.liquidation.collateral_factor_x18 = decimal_field(liq, "collateral_factor", 0);
    setup.config.liquidation.liquidation_threshold_x18 =
        decimal_field(liq, "liquidation_threshold", setup.config.liquidation.collateral_factor_x18);
    setup.config.liquidation.liquidation_bonus_x18 = decimal_field(liq, "liquidation_bonus", 0);
    setup.config.liquidation.close_factor_x18 = decimal_field(liq, "close_factor", X18_HALF);

    setup.config.active = obj.value("active", true);
    setup.config.borrowing_enabled = obj.value("borrowing_enabled", true);
    return setup;
}

} // namespace

MarketSetup MarketSetup::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open market config: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

MarketSetup MarketSetup::from_json(std::string_view content) {
    MarketSetup setup;
    try {
        json root = json::parse(content.begin(), content.end());

        if (root.contains("price_policy")) {
            const json& policy = root.at("price_policy");
            setup.price_policy.max_price_age =
                policy.value("max_price_age", setup.price_policy.max_price_age);
            setup.price_policy.max_confidence_ratio_x18 =
                decimal_field(policy, "max_confidence_ratio", 0);
        }

        for (const auto& reserve : root.at("reserves")) {
            setup.reserves.push_back(parse_reserve(reserve));
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid market config: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid market config: ") + e.what());
    }
    return setup;
}

int32_t apply_market_setup(LendingPool& pool, const Address& admin, const MarketSetup& setup) {
    int32_t result = pool.set_price_policy(admin, setup.price_policy);
    if (result != errors::OK) return result;

    for (const auto& reserve : setup.reserves) {
        result = pool.init_reserve(admin, reserve.config);
        if (result != errors::OK) return result;
    }
    return errors::OK;
}

} // namespace lend
