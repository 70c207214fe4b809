#ifndef LEND_RESERVE_HPP
#define LEND_RESERVE_HPP

#include "types.hpp"
#include "rate_model.hpp"

namespace lend {

// =============================================================================
// Liquidation Parameters
// =============================================================================

struct LiquidationConfig {
    I128 collateral_factor_x18;       // LTV, e.g., 0.75 = 75%
    I128 liquidation_threshold_x18;   // Must be >= collateral factor
    I128 liquidation_bonus_x18;       // e.g., 0.1 = 10% extra collateral
    I128 close_factor_x18;            // e.g., 0.5 = 50% of a debt per call
};

// =============================================================================
// Reserve Configuration
// =============================================================================

struct ReserveConfig {
    Currency asset;
    RateConfig rate;
    LiquidationConfig liquidation;
    bool active;              // Inactive reserves reject every mutation
    bool borrowing_enabled;
};

// Returns errors::OK or errors::INVALID_CONFIG
int32_t validate_liquidation_config(const LiquidationConfig& config);
int32_t validate_reserve_config(const ReserveConfig& config);

// =============================================================================
// Reserve - per-asset aggregate state
// =============================================================================

struct Reserve {
    ReserveConfig config;
    I128 total_deposits_x18;    // Depositor balances plus treasury
    I128 total_borrows_x18;
    I128 borrow_index_x18;      // Starts at 1.0, never decreases
    I128 supply_index_x18;      // Starts at 1.0, never decreases
    I128 treasury_x18;          // Reserve-factor share of interest
    uint64_t last_update_timestamp;

    static Reserve create(const ReserveConfig& config, uint64_t now);

    // Tokens held by the pool for this asset
    I128 available_liquidity() const {
        I128 available = total_deposits_x18 - total_borrows_x18;
        return available > 0 ? available : 0;
    }

    I128 utilization() const {
        return RateModel::utilization(total_borrows_x18, available_liquidity());
    }

    Rates current_rates() const {
        return RateModel::rates(config.rate, utilization());
    }
};

} // namespace lend

#endif // LEND_RESERVE_HPP
