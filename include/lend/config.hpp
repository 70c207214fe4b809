#ifndef LEND_CONFIG_HPP
#define LEND_CONFIG_HPP

#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"
#include "reserve.hpp"
#include "oracle.hpp"

namespace lend {

class LendingPool;

// =============================================================================
// Market Setup (JSON)
//
// {
//   "price_policy": { "max_price_age": 3600, "max_confidence_ratio": "0.02" },
//   "reserves": [{
//     "asset": "0x...", "symbol": "USDC",
//     "rate_model": { "kind": "kinked", "base_apr": "0", "optimal_utilization": "0.8",
//                     "slope1_apr": "0.04", "slope2_apr": "0.6", "reserve_factor": "0.1" },
//     "liquidation": { "collateral_factor": "0.75", "liquidation_threshold": "0.8",
//                      "liquidation_bonus": "0.1", "close_factor": "0.5" },
//     "active": true, "borrowing_enabled": true
//   }]
// }
//
// Rates are annual and converted to per-second on load. Decimals may be given
// as strings (exact) or JSON numbers.
// =============================================================================

struct ReserveSetup {
    std::string symbol;
    ReserveConfig config;
};

struct MarketSetup {
    PricePolicy price_policy = PricePolicy::defaults();
    std::vector<ReserveSetup> reserves;

    // Throw std::runtime_error on unreadable files or malformed content
    static MarketSetup from_file(std::string_view path);
    static MarketSetup from_json(std::string_view content);
};

// Set the price policy and register every reserve. Stops at the first error.
int32_t apply_market_setup(LendingPool& pool, const Address& admin, const MarketSetup& setup);

} // namespace lend

#endif // LEND_CONFIG_HPP
