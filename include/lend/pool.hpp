#ifndef LEND_POOL_HPP
#define LEND_POOL_HPP

#include <atomic>
#include <deque>
#include <functional>
#include <optional>
#include <vector>

#include "types.hpp"
#include "reserve.hpp"
#include "state.hpp"
#include "oracle.hpp"
#include "ledger.hpp"
#include "health.hpp"
#include "liquidation.hpp"

namespace lend {

// =============================================================================
// Reserve Data (read-only view, projected to the current time)
// =============================================================================

struct ReserveData {
    Currency asset;
    I128 total_deposits_x18;
    I128 total_borrows_x18;
    I128 available_liquidity_x18;
    I128 utilization_x18;
    I128 borrow_rate_x18;     // Per second
    I128 supply_rate_x18;     // Per second
    I128 borrow_index_x18;
    I128 supply_index_x18;
    I128 treasury_x18;
    uint64_t last_update_timestamp;
};

// =============================================================================
// LendingPool - deposits, borrows, accrual and liquidation over one WorldState
//
// Every mutating call runs in a Transaction: reserves are accrued, checks run,
// changes are staged, the token transfer is made and only then is the world
// state written. Any error leaves the world state untouched.
// =============================================================================

class LendingPool {
public:
    using Clock = std::function<uint64_t()>;
    using LiquidationCallback = std::function<void(const LiquidationRecord&)>;

    LendingPool(const Address& admin, const Address& pool_account,
                const IPriceSource& prices, ITokenLedger& ledger);
    ~LendingPool() = default;

    // Non-copyable
    LendingPool(const LendingPool&) = delete;
    LendingPool& operator=(const LendingPool&) = delete;

    // =========================================================================
    // Administration (admin only)
    // =========================================================================

    int32_t init_reserve(const Address& caller, const ReserveConfig& config);
    int32_t update_rate_config(const Address& caller, const Currency& asset, const RateConfig& rate);
    int32_t update_liquidation_config(const Address& caller, const Currency& asset,
                                      const LiquidationConfig& liquidation);
    int32_t set_reserve_active(const Address& caller, const Currency& asset, bool active);
    int32_t set_borrowing_enabled(const Address& caller, const Currency& asset, bool enabled);
    int32_t set_price_policy(const Address& caller, const PricePolicy& policy);

    // Pay out accrued reserve-factor income
    int32_t withdraw_treasury(const Address& caller, const Currency& asset,
                              const Address& to, I128 amount_x18);

    // =========================================================================
    // User Operations
    // =========================================================================

    int32_t deposit(const Address& user, const Currency& asset, I128 amount_x18);
    int32_t withdraw(const Address& user, const Currency& asset, I128 amount_x18);
    int32_t borrow(const Address& user, const Currency& asset, I128 amount_x18);
    int32_t repay(const Address& user, const Currency& asset, I128 amount_x18);

    // Withdraw or repay the exact current balance; `amount_x18` receives it
    int32_t withdraw_all(const Address& user, const Currency& asset, I128& amount_x18);
    int32_t repay_all(const Address& user, const Currency& asset, I128& amount_x18);

    int32_t set_use_as_collateral(const Address& user, const Currency& asset, bool enabled);

    // =========================================================================
    // Liquidation
    // =========================================================================

    int32_t liquidate(const LiquidationRequest& request, LiquidationRecord& record);

    // Quote without touching state
    int32_t preview_liquidation(const LiquidationRequest& request, LiquidationQuote& quote) const;

    // Users with health factor below 1.0 and their health factors. Users whose
    // health cannot be computed (e.g. stale price) are skipped.
    std::vector<std::pair<Address, I128>> scan_liquidatable(const std::vector<Address>& users) const;

    void set_liquidation_callback(LiquidationCallback callback);
    std::vector<LiquidationRecord> recent_liquidations() const;

    // =========================================================================
    // Read-only Views
    // =========================================================================

    // Reserve and balance views project accrual to now() and throw MathError
    // when that projection overflows; the other views report MATH_OVERFLOW.
    std::optional<ReserveData> get_reserve_data(const Currency& asset) const;
    std::optional<ReserveConfig> get_reserve_config(const Currency& asset) const;

    int32_t get_user_health_factor(const Address& user, I128& health_factor_x18) const;
    int32_t get_user_account_data(const Address& user, HealthSnapshot& data) const;

    I128 get_deposit_balance(const Address& user, const Currency& asset) const;
    I128 get_borrow_balance(const Address& user, const Currency& asset) const;

    const PricePolicy& price_policy() const { return policy_; }
    const Address& admin() const { return admin_; }
    const Address& pool_account() const { return pool_account_; }

    // =========================================================================
    // Environment
    // =========================================================================

    void set_clock(Clock clock);
    uint64_t now() const;

    // Record reads/writes of subsequent calls; nullptr stops recording
    void set_access_tracker(AccessFootprint* tracker) { state_.set_tracker(tracker); }

    // =========================================================================
    // Statistics
    // =========================================================================

    // Process-local counters, kept outside the world state
    struct Stats {
        uint64_t total_reserves;
        uint64_t total_positions;
        uint64_t total_deposits;
        uint64_t total_withdrawals;
        uint64_t total_borrows;
        uint64_t total_repays;
        uint64_t total_liquidations;
    };
    Stats get_stats() const;

    static constexpr size_t MAX_RECENT_LIQUIDATIONS = 64;

private:
    Address admin_;
    Address pool_account_;
    const IPriceSource& prices_;
    ITokenLedger& ledger_;

    WorldState state_;
    PricePolicy policy_;
    Clock clock_;

    LiquidationCallback liquidation_callback_;
    std::deque<LiquidationRecord> recent_liquidations_;

    std::atomic<uint64_t> deposits_{0};
    std::atomic<uint64_t> withdrawals_{0};
    std::atomic<uint64_t> borrows_{0};
    std::atomic<uint64_t> repays_{0};
    std::atomic<uint64_t> liquidations_{0};

    // Shared bodies of withdraw/withdraw_all and repay/repay_all.
    // A negative amount means "the full balance".
    int32_t do_withdraw(const Address& user, const Currency& asset, I128 amount_x18, I128& withdrawn_x18);
    int32_t do_repay(const Address& user, const Currency& asset, I128 amount_x18, I128& repaid_x18);

    // Health of `user` after the staged changes; HEALTH_FACTOR_TOO_LOW below 1.0
    int32_t require_healthy(const Transaction& tx, const Address& user) const;

    // Accrue the reserve under the old config, then let `update` change it
    int32_t update_reserve(const Address& caller, const Currency& asset,
                           const std::function<int32_t(Reserve&)>& update);
};

} // namespace lend

#endif // LEND_POOL_HPP
