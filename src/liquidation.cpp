// =============================================================================
// liquidation.cpp - Bounded partial liquidation
// =============================================================================

#include "lend/liquidation.hpp"

#include <algorithm>

namespace lend {

LiquidationEngine::LiquidationEngine(const IPriceSource& prices, const PricePolicy& policy)
    : prices_(prices), policy_(policy) {}

int32_t LiquidationEngine::quote(Transaction& tx, const LiquidationRequest& request,
                                 LiquidationQuote& out) const {
    if (request.liquidator == request.borrower) {
        return errors::INVALID_ACCOUNT;
    }
    if (request.repay_amount_x18 < 0) {
        return errors::ZERO_AMOUNT;
    }

    // 1. Accrue both reserves
    Reserve* debt_reserve = tx.reserve_for_update(request.debt_asset);
    Reserve* collateral_reserve = tx.reserve_for_update(request.collateral_asset);
    if (!debt_reserve || !collateral_reserve) {
        return errors::ASSET_NOT_FOUND;
    }
    if (!debt_reserve->config.active || !collateral_reserve->config.active) {
        return errors::RESERVE_INACTIVE;
    }

    // 2. Only liquidatable borrowers
    HealthSnapshot health{};
    int32_t result = HealthCalculator(prices_, policy_).compute(tx, request.borrower, health);
    if (result != errors::OK) return result;
    if (!health.liquidatable()) {
        return errors::NOT_LIQUIDATABLE;
    }

    // 3-4. Bound the repayment by the close factor
    LiquidationQuote q{};
    q.health_factor_before_x18 = health.health_factor_x18;

    auto debt_position = tx.position({request.borrower, PositionSide::BORROW, request.debt_asset});
    q.debt_balance_x18 = debt_position ? debt_position->current_balance(debt_reserve->borrow_index_x18) : 0;
    q.max_repay_x18 = x18::mul(q.debt_balance_x18, debt_reserve->config.liquidation.close_factor_x18);
    q.actual_repaid_x18 = std::min(request.repay_amount_x18, q.max_repay_x18);
    if (q.actual_repaid_x18 <= 0) {
        return errors::ZERO_LIQUIDATION;
    }

    // 5. Size the seizure
    I128 debt_price = 0;
    result = checked_price(prices_, policy_, request.debt_asset, tx.now(), debt_price);
    if (result != errors::OK) return result;

    I128 collateral_price = 0;
    result = checked_price(prices_, policy_, request.collateral_asset, tx.now(), collateral_price);
    if (result != errors::OK) return result;

    q.repay_value_x18 = x18::mul(q.actual_repaid_x18, debt_price);
    I128 bonus_multiplier = X18_ONE + collateral_reserve->config.liquidation.liquidation_bonus_x18;
    q.collateral_seized_x18 = x18::div(x18::mul(q.repay_value_x18, bonus_multiplier), collateral_price);
    if (q.collateral_seized_x18 <= 0) {
        return errors::ZERO_LIQUIDATION;
    }

    // 6. The borrower must hold that much enabled collateral
    auto collateral_position = tx.position({request.borrower, PositionSide::DEPOSIT, request.collateral_asset});
    if (!collateral_position || !collateral_position->use_as_collateral) {
        return errors::INSUFFICIENT_COLLATERAL;
    }
    I128 collateral_balance = collateral_position->current_balance(collateral_reserve->supply_index_x18);
    if (q.collateral_seized_x18 > collateral_balance) {
        return errors::INSUFFICIENT_COLLATERAL;
    }

    out = q;
    return errors::OK;
}

int32_t LiquidationEngine::apply(Transaction& tx, const LiquidationRequest& request,
                                 const LiquidationQuote& quote) const {
    if (quote.actual_repaid_x18 <= 0 || quote.collateral_seized_x18 <= 0) {
        return errors::ZERO_LIQUIDATION;
    }
    Reserve* debt_reserve = tx.reserve_for_update(request.debt_asset);
    Reserve* collateral_reserve = tx.reserve_for_update(request.collateral_asset);
    if (!debt_reserve || !collateral_reserve) {
        return errors::ASSET_NOT_FOUND;
    }

    PositionKey debt_key{request.borrower, PositionSide::BORROW, request.debt_asset};
    PositionKey seized_key{request.borrower, PositionSide::DEPOSIT, request.collateral_asset};
    PositionKey reward_key{request.liquidator, PositionSide::DEPOSIT, request.collateral_asset};

    auto debt_position = tx.position(debt_key);
    auto seized_position = tx.position(seized_key);
    if (!debt_position || !seized_position) {
        return errors::POSITION_NOT_FOUND;
    }

    // Borrower debt
    int32_t result = debt_position->decrease(quote.actual_repaid_x18, debt_reserve->borrow_index_x18);
    if (result != errors::OK) return result;

    // Borrower collateral
    result = seized_position->decrease(quote.collateral_seized_x18, collateral_reserve->supply_index_x18);
    if (result != errors::OK) return result;

    if (debt_position->principal_x18 == 0) {
        tx.erase_position(debt_key);
    } else {
        tx.put_position(debt_key, *debt_position);
    }

    if (seized_position->principal_x18 == 0) {
        tx.erase_position(seized_key);
    } else {
        tx.put_position(seized_key, *seized_position);
    }

    // Liquidator collateral keeps its collateral flag if it already existed
    auto reward_position = tx.position(reward_key);
    if (reward_position) {
        reward_position->increase(quote.collateral_seized_x18, collateral_reserve->supply_index_x18);
    } else {
        reward_position = UserPosition::open(quote.collateral_seized_x18, collateral_reserve->supply_index_x18);
    }
    tx.put_position(reward_key, *reward_position);

    // Debt reserve; collateral only changes owner so its totals stay put
    debt_reserve->total_borrows_x18 -= quote.actual_repaid_x18;
    if (debt_reserve->total_borrows_x18 < 0) debt_reserve->total_borrows_x18 = 0;

    return errors::OK;
}

} // namespace lend
