// =============================================================================
// ledger.cpp - In-memory token balances
// =============================================================================

#include "lend/ledger.hpp"

namespace lend {

void InMemoryLedger::mint(const Currency& asset, const Address& to, I128 amount_x18) {
    balances_[{asset, to}] += amount_x18;
}

I128 InMemoryLedger::balance_of(const Currency& asset, const Address& owner) const {
    auto it = balances_.find({asset, owner});
    return (it != balances_.end()) ? it->second : 0;
}

int32_t InMemoryLedger::transfer(const Currency& asset, const Address& from,
                                 const Address& to, I128 amount_x18) {
    if (amount_x18 < 0) {
        return errors::INSUFFICIENT_BALANCE;
    }

    auto it = balances_.find({asset, from});
    if (it == balances_.end() || it->second < amount_x18) {
        return errors::INSUFFICIENT_BALANCE;
    }

    it->second -= amount_x18;
    balances_[{asset, to}] += amount_x18;
    return errors::OK;
}

} // namespace lend
