// =============================================================================
// reserve.cpp - Reserve construction and configuration checks
// =============================================================================

#include "lend/reserve.hpp"

namespace lend {

int32_t validate_liquidation_config(const LiquidationConfig& config) {
    const auto in_unit_range = [](I128 v) { return v >= 0 && v <= X18_ONE; };

    if (!in_unit_range(config.collateral_factor_x18) ||
        !in_unit_range(config.liquidation_threshold_x18)) {
        return errors::INVALID_CONFIG;
    }
    if (config.liquidation_threshold_x18 < config.collateral_factor_x18) {
        return errors::INVALID_CONFIG;
    }
    if (config.liquidation_bonus_x18 < 0) {
        return errors::INVALID_CONFIG;
    }
    if (config.close_factor_x18 <= 0 || config.close_factor_x18 > X18_ONE) {
        return errors::INVALID_CONFIG;
    }
    return errors::OK;
}

int32_t validate_reserve_config(const ReserveConfig& config) {
    int32_t result = RateModel::validate(config.rate);
    if (result != errors::OK) return result;
    return validate_liquidation_config(config.liquidation);
}

Reserve Reserve::create(const ReserveConfig& config, uint64_t now) {
    Reserve reserve;
    reserve.config = config;
    reserve.total_deposits_x18 = 0;
    reserve.total_borrows_x18 = 0;
    reserve.borrow_index_x18 = X18_ONE;
    reserve.supply_index_x18 = X18_ONE;
    reserve.treasury_x18 = 0;
    reserve.last_update_timestamp = now;
    return reserve;
}

} // namespace lend
