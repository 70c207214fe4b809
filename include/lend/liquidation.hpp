#ifndef LEND_LIQUIDATION_HPP
#define LEND_LIQUIDATION_HPP

#include "types.hpp"
#include "health.hpp"
#include "oracle.hpp"
#include "transaction.hpp"

namespace lend {

// =============================================================================
// Liquidation Request / Quote / Record
// =============================================================================

struct LiquidationRequest {
    Address liquidator;
    Address borrower;
    Currency debt_asset;
    Currency collateral_asset;
    I128 repay_amount_x18;
};

struct LiquidationQuote {
    I128 debt_balance_x18;
    I128 max_repay_x18;           // debt_balance * close_factor
    I128 actual_repaid_x18;       // min(requested, max_repay)
    I128 repay_value_x18;         // actual_repaid * debt price
    I128 collateral_seized_x18;   // repay_value * (1 + bonus) / collateral price
    I128 health_factor_before_x18;
};

struct LiquidationRecord {
    Address liquidator;
    Address borrower;
    Currency debt_asset;
    Currency collateral_asset;
    I128 actual_repaid_x18;
    I128 collateral_seized_x18;
    I128 health_factor_before_x18;
    I128 health_factor_after_x18;
    uint64_t timestamp;
};

// =============================================================================
// LiquidationEngine
// =============================================================================

class LiquidationEngine {
public:
    LiquidationEngine(const IPriceSource& prices, const PricePolicy& policy);

    // Steps 1-6: accrue both reserves, check health, bound the repayment and
    // size the seizure. Only reserve accrual is staged in `tx`.
    int32_t quote(Transaction& tx, const LiquidationRequest& request,
                  LiquidationQuote& out) const;

    // Step 7: stage the position and reserve changes of a quote in `tx`
    int32_t apply(Transaction& tx, const LiquidationRequest& request,
                  const LiquidationQuote& quote) const;

private:
    const IPriceSource& prices_;
    const PricePolicy& policy_;
};

} // namespace lend

#endif // LEND_LIQUIDATION_HPP
