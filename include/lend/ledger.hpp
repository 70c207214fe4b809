#ifndef LEND_LEDGER_HPP
#define LEND_LEDGER_HPP

#include <map>
#include <utility>

#include "types.hpp"

namespace lend {

// =============================================================================
// Token Ledger Interface
// =============================================================================

class ITokenLedger {
public:
    virtual ~ITokenLedger() = default;

    // errors::OK, or errors::INSUFFICIENT_BALANCE with nothing moved
    virtual int32_t transfer(const Currency& asset, const Address& from,
                             const Address& to, I128 amount_x18) = 0;
};

// =============================================================================
// InMemoryLedger - balances held in a map
// =============================================================================

class InMemoryLedger : public ITokenLedger {
public:
    InMemoryLedger() = default;

    void mint(const Currency& asset, const Address& to, I128 amount_x18);
    I128 balance_of(const Currency& asset, const Address& owner) const;

    int32_t transfer(const Currency& asset, const Address& from,
                     const Address& to, I128 amount_x18) override;

private:
    std::map<std::pair<Currency, Address>, I128> balances_;
};

} // namespace lend

#endif // LEND_LEDGER_HPP
