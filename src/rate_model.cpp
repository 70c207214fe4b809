// =============================================================================
// rate_model.cpp - Utilization-driven interest rate curves
// =============================================================================

#include "lend/rate_model.hpp"

namespace lend {

RateConfig RateConfig::from_annual(RateModelKind kind, I128 base_apr_x18,
                                   I128 optimal_utilization_x18,
                                   I128 slope1_apr_x18, I128 slope2_apr_x18,
                                   I128 reserve_factor_x18) {
    const I128 year = static_cast<I128>(SECONDS_PER_YEAR);
    RateConfig config;
    config.kind = kind;
    config.base_rate_x18 = base_apr_x18 / year;
    config.optimal_utilization_x18 = optimal_utilization_x18;
    config.slope1_x18 = slope1_apr_x18 / year;
    config.slope2_x18 = slope2_apr_x18 / year;
    config.reserve_factor_x18 = reserve_factor_x18;
    return config;
}

I128 RateModel::utilization(I128 total_borrows_x18, I128 available_liquidity_x18) {
    if (total_borrows_x18 <= 0) return 0;
    if (available_liquidity_x18 < 0) available_liquidity_x18 = 0;

    I128 denominator = total_borrows_x18 + available_liquidity_x18;
    if (denominator == 0) return 0;

    I128 u = x18::div(total_borrows_x18, denominator);
    if (u > X18_ONE) return X18_ONE;
    return u;
}

I128 RateModel::borrow_rate(const RateConfig& config, I128 utilization_x18) {
    I128 u = utilization_x18;
    if (u < 0) u = 0;
    if (u > X18_ONE) u = X18_ONE;

    switch (config.kind) {
        case RateModelKind::FIXED:
            return config.base_rate_x18;

        case RateModelKind::LINEAR:
            return config.base_rate_x18 + x18::mul(u, config.slope1_x18);

        case RateModelKind::KINKED: {
            const I128 optimal = config.optimal_utilization_x18;
            if (optimal == 0) {
                return config.base_rate_x18 + x18::mul(u, config.slope2_x18);
            }
            if (u <= optimal) {
                return config.base_rate_x18 + x18::mul_div(u, config.slope1_x18, optimal);
            }
            // u > optimal implies optimal < 1, so the excess span is non-zero
            I128 excess = u - optimal;
            I128 span = X18_ONE - optimal;
            return config.base_rate_x18 + config.slope1_x18 +
                   x18::mul_div(excess, config.slope2_x18, span);
        }
    }
    return config.base_rate_x18;
}

I128 RateModel::supply_rate(const RateConfig& config, I128 utilization_x18) {
    return rates(config, utilization_x18).supply_rate_x18;
}

Rates RateModel::rates(const RateConfig& config, I128 utilization_x18) {
    Rates r;
    r.borrow_rate_x18 = borrow_rate(config, utilization_x18);

    I128 u = utilization_x18;
    if (u < 0) u = 0;
    if (u > X18_ONE) u = X18_ONE;

    I128 gross = x18::mul(r.borrow_rate_x18, u);
    r.supply_rate_x18 = x18::mul(gross, X18_ONE - config.reserve_factor_x18);
    return r;
}

int32_t RateModel::validate(const RateConfig& config) {
    if (config.base_rate_x18 < 0 || config.slope1_x18 < 0 || config.slope2_x18 < 0) {
        return errors::INVALID_CONFIG;
    }
    if (config.reserve_factor_x18 < 0 || config.reserve_factor_x18 > X18_ONE) {
        return errors::INVALID_CONFIG;
    }
    if (config.kind == RateModelKind::KINKED &&
        (config.optimal_utilization_x18 < 0 || config.optimal_utilization_x18 > X18_ONE)) {
        return errors::INVALID_CONFIG;
    }
    return errors::OK;
}

} // namespace lend
