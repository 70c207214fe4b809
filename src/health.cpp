// =============================================================================
// health.cpp - Collateral and debt aggregation
// =============================================================================

#include "lend/health.hpp"

namespace lend {

HealthCalculator::HealthCalculator(const IPriceSource& prices, const PricePolicy& policy)
    : prices_(prices), policy_(policy) {}

I128 HealthCalculator::health_factor(I128 collateral_value_x18, I128 debt_value_x18) {
    if (debt_value_x18 <= 0) return HEALTH_FACTOR_MAX;
    if (collateral_value_x18 <= 0) return 0;
    // Dust debt: the X18 ratio would not fit
    if (collateral_value_x18 / debt_value_x18 >= HEALTH_FACTOR_MAX / X18_ONE) {
        return HEALTH_FACTOR_MAX;
    }
    return x18::div(collateral_value_x18, debt_value_x18);
}

int32_t HealthCalculator::compute(const Transaction& tx, const Address& user,
                                  HealthSnapshot& out) const {
    HealthSnapshot snapshot{};

    for (const auto& [key, position] : tx.user_positions(user)) {
        bool is_deposit = key.side == PositionSide::DEPOSIT;
        if (is_deposit && !position.use_as_collateral) continue;

        auto reserve = tx.reserve_view(key.asset);
        if (!reserve) {
            return errors::ASSET_NOT_FOUND;
        }

        I128 index = is_deposit ? reserve->supply_index_x18 : reserve->borrow_index_x18;
        I128 balance = position.current_balance(index);
        if (balance == 0) continue;

        I128 price = 0;
        int32_t result = checked_price(prices_, policy_, key.asset, tx.now(), price);
        if (result != errors::OK) {
            return result;
        }

        I128 value = x18::mul(balance, price);
        if (is_deposit) {
            const LiquidationConfig& lc = reserve->config.liquidation;
            snapshot.collateral_value_x18 += x18::mul(value, lc.collateral_factor_x18);
            snapshot.liquidation_threshold_value_x18 += x18::mul(value, lc.liquidation_threshold_x18);
        } else {
            snapshot.debt_value_x18 += value;
        }
    }

    snapshot.health_factor_x18 = health_factor(snapshot.collateral_value_x18, snapshot.debt_value_x18);

    I128 headroom = snapshot.collateral_value_x18 - snapshot.debt_value_x18;
    snapshot.available_to_borrow_x18 = headroom > 0 ? headroom : 0;

    out = snapshot;
    return errors::OK;
}

} // namespace lend
