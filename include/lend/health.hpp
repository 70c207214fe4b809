#ifndef LEND_HEALTH_HPP
#define LEND_HEALTH_HPP

#include "types.hpp"
#include "oracle.hpp"
#include "transaction.hpp"

namespace lend {

// Returned when the user has no debt
constexpr I128 HEALTH_FACTOR_MAX = I128_MAX;

// =============================================================================
// Health Snapshot (derived, never stored)
// =============================================================================

struct HealthSnapshot {
    I128 collateral_value_x18;              // Σ deposit value * collateral factor
    I128 liquidation_threshold_value_x18;   // Σ deposit value * liquidation threshold
    I128 debt_value_x18;                    // Σ borrow value
    I128 health_factor_x18;                 // collateral / debt, X18
    I128 available_to_borrow_x18;           // Value units, floored at zero

    bool liquidatable() const { return health_factor_x18 < X18_ONE; }
};

// =============================================================================
// HealthCalculator
// =============================================================================

class HealthCalculator {
public:
    HealthCalculator(const IPriceSource& prices, const PricePolicy& policy);

    // Aggregates every position of `user` as seen through the transaction.
    // Positions with a zero balance, and deposits not used as collateral, need
    // no price. Any price failure aborts with its error code.
    int32_t compute(const Transaction& tx, const Address& user, HealthSnapshot& out) const;

    static I128 health_factor(I128 collateral_value_x18, I128 debt_value_x18);

private:
    const IPriceSource& prices_;
    const PricePolicy& policy_;
};

} // namespace lend

#endif // LEND_HEALTH_HPP
