// =============================================================================
// position.cpp - Principal / index-snapshot accounting
// =============================================================================

#include "lend/position.hpp"

namespace lend {

I128 UserPosition::current_balance(I128 reserve_index_x18) const {
    if (principal_x18 == 0 || index_snapshot_x18 == 0) return 0;
    return x18::mul_div(principal_x18, reserve_index_x18, index_snapshot_x18);
}

void UserPosition::increase(I128 delta_x18, I128 reserve_index_x18) {
    I128 balance = current_balance(reserve_index_x18);
    principal_x18 = balance + delta_x18;
    index_snapshot_x18 = reserve_index_x18;
}

int32_t UserPosition::decrease(I128 delta_x18, I128 reserve_index_x18) {
    I128 balance = current_balance(reserve_index_x18);
    if (delta_x18 > balance) {
        return errors::INSUFFICIENT_BALANCE;
    }
    principal_x18 = balance - delta_x18;
    index_snapshot_x18 = reserve_index_x18;
    return errors::OK;
}

UserPosition UserPosition::open(I128 amount_x18, I128 reserve_index_x18) {
    UserPosition position;
    position.principal_x18 = amount_x18;
    position.index_snapshot_x18 = reserve_index_x18;
    position.use_as_collateral = true;
    return position;
}

} // namespace lend
