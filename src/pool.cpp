// =============================================================================
// pool.cpp - LendingPool Implementation
// =============================================================================

#include "lend/pool.hpp"
#include "lend/transaction.hpp"

#include <chrono>

namespace lend {

namespace {

// Arithmetic faults surface as an error code; nothing has been committed yet
template <typename F>
int32_t guarded(F&& body) {
    try {
        return body();
    } catch (const MathError&) {
        return errors::MATH_OVERFLOW;
    }
}

} // namespace

// =============================================================================
// Constructor
// =============================================================================

LendingPool::LendingPool(const Address& admin, const Address& pool_account,
                         const IPriceSource& prices, ITokenLedger& ledger)
    : admin_(admin),
      pool_account_(pool_account),
      prices_(prices),
      ledger_(ledger),
      policy_(PricePolicy::defaults()) {}

// =============================================================================
// Administration
// =============================================================================

int32_t LendingPool::init_reserve(const Address& caller, const ReserveConfig& config) {
    if (caller != admin_) {
        return errors::UNAUTHORIZED;
    }

    int32_t result = validate_reserve_config(config);
    if (result != errors::OK) return result;

    if (state_.has_reserve(config.asset)) {
        return errors::RESERVE_EXISTS;
    }

    state_.put_reserve(Reserve::create(config, now()));
    return errors::OK;
}

int32_t LendingPool::update_reserve(const Address& caller, const Currency& asset,
                                    const std::function<int32_t(Reserve&)>& update) {
    if (caller != admin_) {
        return errors::UNAUTHORIZED;
    }

    return guarded([&]() -> int32_t {
        Transaction tx(state_, now());

        // Interest up to now is owed under the old parameters
        Reserve* reserve = tx.reserve_for_update(asset);
        if (!reserve) return errors::ASSET_NOT_FOUND;

        int32_t result = update(*reserve);
        if (result != errors::OK) return result;

        tx.commit();
        return errors::OK;
    });
}

int32_t LendingPool::update_rate_config(const Address& caller, const Currency& asset,
                                        const RateConfig& rate) {
    return update_reserve(caller, asset, [&](Reserve& reserve) {
        int32_t result = RateModel::validate(rate);
        if (result != errors::OK) return result;
        reserve.config.rate = rate;
        return errors::OK;
    });
}

int32_t LendingPool::update_liquidation_config(const Address& caller, const Currency& asset,
                                               const LiquidationConfig& liquidation) {
    return update_reserve(caller, asset, [&](Reserve& reserve) {
        int32_t result = validate_liquidation_config(liquidation);
        if (result != errors::OK) return result;
        reserve.config.liquidation = liquidation;
        return errors::OK;
    });
}

int32_t LendingPool::set_reserve_active(const Address& caller, const Currency& asset, bool active) {
    return update_reserve(caller, asset, [&](Reserve& reserve) {
        reserve.config.active = active;
        return errors::OK;
    });
}

int32_t LendingPool::set_borrowing_enabled(const Address& caller, const Currency& asset, bool enabled) {
    return update_reserve(caller, asset, [&](Reserve& reserve) {
        reserve.config.borrowing_enabled = enabled;
        return errors::OK;
    });
}

int32_t LendingPool::set_price_policy(const Address& caller, const PricePolicy& policy) {
    if (caller != admin_) {
        return errors::UNAUTHORIZED;
    }
    if (policy.max_confidence_ratio_x18 < 0) {
        return errors::INVALID_CONFIG;
    }
    policy_ = policy;
    return errors::OK;
}

int32_t LendingPool::withdraw_treasury(const Address& caller, const Currency& asset,
                                       const Address& to, I128 amount_x18) {
    if (caller != admin_) {
        return errors::UNAUTHORIZED;
    }
    if (amount_x18 <= 0) {
        return errors::ZERO_AMOUNT;
    }

    return guarded([&]() -> int32_t {
        Transaction tx(state_, now());
        Reserve* reserve = tx.reserve_for_update(asset);
        if (!reserve) return errors::ASSET_NOT_FOUND;

        if (amount_x18 > reserve->treasury_x18) {
            return errors::INSUFFICIENT_BALANCE;
        }
        if (amount_x18 > reserve->available_liquidity()) {
            return errors::INSUFFICIENT_LIQUIDITY;
        }

        reserve->treasury_x18 -= amount_x18;
        reserve->total_deposits_x18 -= amount_x18;

        int32_t result = ledger_.transfer(asset, pool_account_, to, amount_x18);
        if (result != errors::OK) return result;

        tx.commit();
        return errors::OK;
    });
}

// =============================================================================
// User Operations
// =============================================================================

int32_t LendingPool::deposit(const Address& user, const Currency& asset, I128 amount_x18) {
    if (amount_x18 <= 0) {
        return errors::ZERO_AMOUNT;
    }

    return guarded([&]() -> int32_t {
        Transaction tx(state_, now());
        Reserve* reserve = tx.reserve_for_update(asset);
        if (!reserve) return errors::ASSET_NOT_FOUND;
        if (!reserve->config.active) return errors::RESERVE_INACTIVE;

        PositionKey key{user, PositionSide::DEPOSIT, asset};
        auto position = tx.position(key);
        if (position) {
            position->increase(amount_x18, reserve->supply_index_x18);
        } else {
            position = UserPosition::open(amount_x18, reserve->supply_index_x18);
        }
        tx.put_position(key, *position);
        reserve->total_deposits_x18 += amount_x18;

        int32_t result = ledger_.transfer(asset, user, pool_account_, amount_x18);
        if (result != errors::OK) return result;

        tx.commit();
        deposits_.fetch_add(1, std::memory_order_relaxed);
        return errors::OK;
    });
}

int32_t LendingPool::withdraw(const Address& user, const Currency& asset, I128 amount_x18) {
    if (amount_x18 <= 0) {
        return errors::ZERO_AMOUNT;
    }
    I128 withdrawn = 0;
    return do_withdraw(user, asset, amount_x18, withdrawn);
}

int32_t LendingPool::withdraw_all(const Address& user, const Currency& asset, I128& amount_x18) {
    return do_withdraw(user, asset, -1, amount_x18);
}

int32_t LendingPool::do_withdraw(const Address& user, const Currency& asset,
                                 I128 amount_x18, I128& withdrawn_x18) {
    return guarded([&]() -> int32_t {
        Transaction tx(state_, now());
        Reserve* reserve = tx.reserve_for_update(asset);
        if (!reserve) return errors::ASSET_NOT_FOUND;
        if (!reserve->config.active) return errors::RESERVE_INACTIVE;

        PositionKey key{user, PositionSide::DEPOSIT, asset};
        auto position = tx.position(key);
        if (!position) return errors::POSITION_NOT_FOUND;

        I128 balance = position->current_balance(reserve->supply_index_x18);
        I128 amount = amount_x18 < 0 ? balance : amount_x18;
        if (amount == 0) return errors::ZERO_AMOUNT;
        if (amount > balance) return errors::INSUFFICIENT_BALANCE;
        if (amount > reserve->available_liquidity()) return errors::INSUFFICIENT_LIQUIDITY;

        int32_t result = position->decrease(amount, reserve->supply_index_x18);
        if (result != errors::OK) return result;

        if (position->principal_x18 == 0) {
            tx.erase_position(key);
        } else {
            tx.put_position(key, *position);
        }
        reserve->total_deposits_x18 -= amount;
        if (reserve->total_deposits_x18 < 0) reserve->total_deposits_x18 = 0;

        if (position->use_as_collateral && tx.has_borrows(user)) {
            result = require_healthy(tx, user);
            if (result != errors::OK) return result;
        }

        result = ledger_.transfer(asset, pool_account_, user, amount);
        if (result != errors::OK) return result;

        tx.commit();
        withdrawn_x18 = amount;
        withdrawals_.fetch_add(1, std::memory_order_relaxed);
        return errors::OK;
    });
}

int32_t LendingPool::borrow(const Address& user, const Currency& asset, I128 amount_x18) {
    if (amount_x18 <= 0) {
        return errors::ZERO_AMOUNT;
    }

    return guarded([&]() -> int32_t {
        Transaction tx(state_, now());
        Reserve* reserve = tx.reserve_for_update(asset);
        if (!reserve) return errors::ASSET_NOT_FOUND;
        if (!reserve->config.active) return errors::RESERVE_INACTIVE;
        if (!reserve->config.borrowing_enabled) return errors::BORROWING_DISABLED;
        if (amount_x18 > reserve->available_liquidity()) return errors::INSUFFICIENT_LIQUIDITY;

        PositionKey key{user, PositionSide::BORROW, asset};
        auto position = tx.position(key);
        if (position) {
            position->increase(amount_x18, reserve->borrow_index_x18);
        } else {
            position = UserPosition::open(amount_x18, reserve->borrow_index_x18);
        }
        tx.put_position(key, *position);
        reserve->total_borrows_x18 += amount_x18;

        int32_t result = require_healthy(tx, user);
        if (result != errors::OK) return result;

        result = ledger_.transfer(asset, pool_account_, user, amount_x18);
        if (result != errors::OK) return result;

        tx.commit();
        borrows_.fetch_add(1, std::memory_order_relaxed);
        return errors::OK;
    });
}

int32_t LendingPool::repay(const Address& user, const Currency& asset, I128 amount_x18) {
    if (amount_x18 <= 0) {
        return errors::ZERO_AMOUNT;
    }
    I128 repaid = 0;
    return do_repay(user, asset, amount_x18, repaid);
}

int32_t LendingPool::repay_all(const Address& user, const Currency& asset, I128& amount_x18) {
    return do_repay(user, asset, -1, amount_x18);
}

int32_t LendingPool::do_repay(const Address& user, const Currency& asset,
                              I128 amount_x18, I128& repaid_x18) {
    return guarded([&]() -> int32_t {
        Transaction tx(state_, now());
        Reserve* reserve = tx.reserve_for_update(asset);
        if (!reserve) return errors::ASSET_NOT_FOUND;
        if (!reserve->config.active) return errors::RESERVE_INACTIVE;

        PositionKey key{user, PositionSide::BORROW, asset};
        auto position = tx.position(key);
        if (!position) return errors::POSITION_NOT_FOUND;

        I128 debt = position->current_balance(reserve->borrow_index_x18);
        I128 amount = amount_x18 < 0 ? debt : amount_x18;
        if (amount == 0) return errors::ZERO_AMOUNT;

        int32_t result = position->decrease(amount, reserve->borrow_index_x18);
        if (result != errors::OK) return result;

        if (position->principal_x18 == 0) {
            tx.erase_position(key);
        } else {
            tx.put_position(key, *position);
        }
        reserve->total_borrows_x18 -= amount;
        if (reserve->total_borrows_x18 < 0) reserve->total_borrows_x18 = 0;

        result = ledger_.transfer(asset, user, pool_account_, amount);
        if (result != errors::OK) return result;

        tx.commit();
        repaid_x18 = amount;
        repays_.fetch_add(1, std::memory_order_relaxed);
        return errors::OK;
    });
}

int32_t LendingPool::set_use_as_collateral(const Address& user, const Currency& asset, bool enabled) {
    return guarded([&]() -> int32_t {
        Transaction tx(state_, now());
        if (!tx.reserve_view(asset)) return errors::ASSET_NOT_FOUND;

        PositionKey key{user, PositionSide::DEPOSIT, asset};
        auto position = tx.position(key);
        if (!position) return errors::POSITION_NOT_FOUND;
        if (position->use_as_collateral == enabled) return errors::OK;

        position->use_as_collateral = enabled;
        tx.put_position(key, *position);

        if (!enabled && tx.has_borrows(user)) {
            int32_t result = require_healthy(tx, user);
            if (result != errors::OK) return result;
        }

        tx.commit();
        return errors::OK;
    });
}

int32_t LendingPool::require_healthy(const Transaction& tx, const Address& user) const {
    HealthSnapshot health{};
    int32_t result = HealthCalculator(prices_, policy_).compute(tx, user, health);
    if (result != errors::OK) return result;
    if (health.liquidatable()) {
        return errors::HEALTH_FACTOR_TOO_LOW;
    }
    return errors::OK;
}

// =============================================================================
// Liquidation
// =============================================================================

int32_t LendingPool::liquidate(const LiquidationRequest& request, LiquidationRecord& record) {
    int32_t status = guarded([&]() -> int32_t {
        Transaction tx(state_, now());
        LiquidationEngine engine(prices_, policy_);

        LiquidationQuote quote{};
        int32_t result = engine.quote(tx, request, quote);
        if (result != errors::OK) return result;

        result = engine.apply(tx, request, quote);
        if (result != errors::OK) return result;

        HealthSnapshot after{};
        result = HealthCalculator(prices_, policy_).compute(tx, request.borrower, after);
        if (result != errors::OK) return result;

        result = ledger_.transfer(request.debt_asset, request.liquidator, pool_account_,
                                  quote.actual_repaid_x18);
        if (result != errors::OK) return result;

        tx.commit();

        record.liquidator = request.liquidator;
        record.borrower = request.borrower;
        record.debt_asset = request.debt_asset;
        record.collateral_asset = request.collateral_asset;
        record.actual_repaid_x18 = quote.actual_repaid_x18;
        record.collateral_seized_x18 = quote.collateral_seized_x18;
        record.health_factor_before_x18 = quote.health_factor_before_x18;
        record.health_factor_after_x18 = after.health_factor_x18;
        record.timestamp = tx.now();
        return errors::OK;
    });
    if (status != errors::OK) return status;

    liquidations_.fetch_add(1, std::memory_order_relaxed);
    recent_liquidations_.push_back(record);
    if (recent_liquidations_.size() > MAX_RECENT_LIQUIDATIONS) {
        recent_liquidations_.pop_front();
    }
    if (liquidation_callback_) {
        liquidation_callback_(record);
    }
    return errors::OK;
}

int32_t LendingPool::preview_liquidation(const LiquidationRequest& request,
                                         LiquidationQuote& quote) const {
    return guarded([&]() -> int32_t {
        Transaction tx(state_, now());
        return LiquidationEngine(prices_, policy_).quote(tx, request, quote);
    });
}

std::vector<std::pair<Address, I128>> LendingPool::scan_liquidatable(const std::vector<Address>& users) const {
    std::vector<std::pair<Address, I128>> result;
    for (const auto& user : users) {
        HealthSnapshot health{};
        if (get_user_account_data(user, health) != errors::OK) continue;
        if (health.liquidatable()) {
            result.emplace_back(user, health.health_factor_x18);
        }
    }
    return result;
}

void LendingPool::set_liquidation_callback(LiquidationCallback callback) {
    liquidation_callback_ = std::move(callback);
}

std::vector<LiquidationRecord> LendingPool::recent_liquidations() const {
    return std::vector<LiquidationRecord>(recent_liquidations_.begin(), recent_liquidations_.end());
}

// =============================================================================
// Read-only Views
// =============================================================================

std::optional<ReserveData> LendingPool::get_reserve_data(const Currency& asset) const {
    Transaction tx(state_, now());
    auto reserve = tx.reserve_view(asset);
    if (!reserve) return std::nullopt;

    Rates rates = reserve->current_rates();
    return ReserveData{
        asset,
        reserve->total_deposits_x18,
        reserve->total_borrows_x18,
        reserve->available_liquidity(),
        reserve->utilization(),
        rates.borrow_rate_x18,
        rates.supply_rate_x18,
        reserve->borrow_index_x18,
        reserve->supply_index_x18,
        reserve->treasury_x18,
        reserve->last_update_timestamp
    };
}

std::optional<ReserveConfig> LendingPool::get_reserve_config(const Currency& asset) const {
    auto reserve = state_.get_reserve(asset);
    if (!reserve) return std::nullopt;
    return reserve->config;
}

int32_t LendingPool::get_user_health_factor(const Address& user, I128& health_factor_x18) const {
    HealthSnapshot health{};
    int32_t result = get_user_account_data(user, health);
    if (result != errors::OK) return result;
    health_factor_x18 = health.health_factor_x18;
    return errors::OK;
}

int32_t LendingPool::get_user_account_data(const Address& user, HealthSnapshot& data) const {
    return guarded([&]() -> int32_t {
        Transaction tx(state_, now());
        return HealthCalculator(prices_, policy_).compute(tx, user, data);
    });
}

I128 LendingPool::get_deposit_balance(const Address& user, const Currency& asset) const {
    Transaction tx(state_, now());
    auto reserve = tx.reserve_view(asset);
    auto position = tx.position({user, PositionSide::DEPOSIT, asset});
    if (!reserve || !position) return 0;
    return position->current_balance(reserve->supply_index_x18);
}

I128 LendingPool::get_borrow_balance(const Address& user, const Currency& asset) const {
    Transaction tx(state_, now());
    auto reserve = tx.reserve_view(asset);
    auto position = tx.position({user, PositionSide::BORROW, asset});
    if (!reserve || !position) return 0;
    return position->current_balance(reserve->borrow_index_x18);
}

// =============================================================================
// Environment
// =============================================================================

void LendingPool::set_clock(Clock clock) {
    clock_ = std::move(clock);
}

uint64_t LendingPool::now() const {
    if (clock_) return clock_();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

// =============================================================================
// Statistics
// =============================================================================

LendingPool::Stats LendingPool::get_stats() const {
    return Stats{
        state_.reserve_count(),
        state_.position_count(),
        deposits_.load(std::memory_order_relaxed),
        withdrawals_.load(std::memory_order_relaxed),
        borrows_.load(std::memory_order_relaxed),
        repays_.load(std::memory_order_relaxed),
        liquidations_.load(std::memory_order_relaxed)
    };
}

} // namespace lend
