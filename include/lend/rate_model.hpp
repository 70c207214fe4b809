#ifndef LEND_RATE_MODEL_HPP
#define LEND_RATE_MODEL_HPP

#include "types.hpp"

namespace lend {

// =============================================================================
// Rate Model Variants
// =============================================================================

enum class RateModelKind : uint8_t {
    KINKED = 0,   // Two slopes joined at optimal utilization
    LINEAR = 1,   // base + u * slope1
    FIXED = 2     // base only
};

// All rates are X18 per second. Use from_annual() to build a config from
// yearly figures; the division by SECONDS_PER_YEAR happens there, once.
struct RateConfig {
    RateModelKind kind;
    I128 base_rate_x18;
    I128 optimal_utilization_x18;   // e.g., 0.8 = 80%
    I128 slope1_x18;
    I128 slope2_x18;
    I128 reserve_factor_x18;        // Protocol share of interest

    static RateConfig from_annual(RateModelKind kind, I128 base_apr_x18,
                                  I128 optimal_utilization_x18,
                                  I128 slope1_apr_x18, I128 slope2_apr_x18,
                                  I128 reserve_factor_x18);
};

struct Rates {
    I128 borrow_rate_x18;
    I128 supply_rate_x18;
};

// =============================================================================
// RateModel - pure functions of utilization
// =============================================================================

class RateModel {
public:
    // totalBorrows / (totalBorrows + available), clamped to [0, 1]
    static I128 utilization(I128 total_borrows_x18, I128 available_liquidity_x18);

    static I128 borrow_rate(const RateConfig& config, I128 utilization_x18);
    static I128 supply_rate(const RateConfig& config, I128 utilization_x18);
    static Rates rates(const RateConfig& config, I128 utilization_x18);

    // Returns errors::OK or errors::INVALID_CONFIG
    static int32_t validate(const RateConfig& config);
};

} // namespace lend

#endif // LEND_RATE_MODEL_HPP
