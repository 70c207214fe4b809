#ifndef LEND_LEND_HPP
#define LEND_LEND_HPP

// =============================================================================
// lend - Lending Pool Engine
//
//   RateModel          utilization -> borrow / supply rate
//   AccrualEngine      index growth over elapsed time
//   WorldState         reserves and (user, side, asset) positions
//   Transaction        staged, all-or-nothing view over WorldState
//   HealthCalculator   collateral and debt valuation
//   LiquidationEngine  bounded partial liquidation
//   LendingPool        public operations over all of the above
//
// Fixed point: X18 throughout (1e18 = 1.0). Rates are per second.
// =============================================================================

#include "types.hpp"
#include "rate_model.hpp"
#include "reserve.hpp"
#include "accrual.hpp"
#include "position.hpp"
#include "state.hpp"
#include "transaction.hpp"
#include "oracle.hpp"
#include "ledger.hpp"
#include "health.hpp"
#include "liquidation.hpp"
#include "pool.hpp"
#include "config.hpp"

namespace lend {

constexpr const char* version() { return "1.0.0"; }

} // namespace lend

#endif // LEND_LEND_HPP
