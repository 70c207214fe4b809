// =============================================================================
// accrual.cpp - Index-based interest accrual
// =============================================================================

#include "lend/accrual.hpp"

namespace lend {

I128 AccrualEngine::growth_factor(I128 rate_x18, uint64_t elapsed) {
    if (rate_x18 <= 0 || elapsed == 0) return X18_ONE;

    I128 span = static_cast<I128>(elapsed);
    if (rate_x18 > (I128_MAX - X18_ONE) / span) {
        throw MathError("AccrualEngine: growth factor overflow");
    }
    return X18_ONE + rate_x18 * span;
}

void AccrualEngine::accrue(Reserve& reserve, uint64_t now) {
    if (now <= reserve.last_update_timestamp) {
        return;
    }
    uint64_t elapsed = now - reserve.last_update_timestamp;

    // Rates come from the utilization at the start of the step
    Rates rates = reserve.current_rates();
    I128 borrow_factor = growth_factor(rates.borrow_rate_x18, elapsed);
    I128 supply_factor = growth_factor(rates.supply_rate_x18, elapsed);

    // Compute everything before writing so a MathError leaves the reserve intact
    I128 borrow_index = x18::mul(reserve.borrow_index_x18, borrow_factor);
    I128 supply_index = x18::mul(reserve.supply_index_x18, supply_factor);

    I128 total_borrows = x18::mul(reserve.total_borrows_x18, borrow_factor);
    I128 interest = total_borrows - reserve.total_borrows_x18;

    // The treasury is paid from the remainder, not through the supply index
    I128 depositor_base = reserve.total_deposits_x18 - reserve.treasury_x18;
    if (depositor_base < 0) depositor_base = 0;
    I128 depositor_interest = x18::mul(depositor_base, supply_factor) - depositor_base;
    if (depositor_interest > interest) depositor_interest = interest;

    reserve.borrow_index_x18 = borrow_index;
    reserve.supply_index_x18 = supply_index;
    reserve.total_borrows_x18 = total_borrows;
    // All borrow interest lands in deposits; what depositors do not earn
    // through the supply index belongs to the treasury.
    reserve.total_deposits_x18 += interest;
    reserve.treasury_x18 += interest - depositor_interest;
    reserve.last_update_timestamp = now;
}

Reserve AccrualEngine::project(const Reserve& reserve, uint64_t now) {
    Reserve copy = reserve;
    accrue(copy, now);
    return copy;
}

} // namespace lend
