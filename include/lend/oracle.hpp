#ifndef LEND_ORACLE_HPP
#define LEND_ORACLE_HPP

#include <map>
#include <optional>

#include "types.hpp"

namespace lend {

// =============================================================================
// Price Quote
// =============================================================================

struct PriceQuote {
    I128 price_x18;          // Value units per whole token
    I128 confidence_x18;     // Half-width of the confidence interval
    uint64_t timestamp;
};

// =============================================================================
// Price Policy
// =============================================================================

struct PricePolicy {
    uint64_t max_price_age;               // Seconds
    I128 max_confidence_ratio_x18;        // confidence / price; 0 disables the check

    static PricePolicy defaults() {
        return PricePolicy{3600, 0};
    }
};

// =============================================================================
// Price Source Interface
// =============================================================================

class IPriceSource {
public:
    virtual ~IPriceSource() = default;

    // std::nullopt when no price is known for the asset
    virtual std::optional<PriceQuote> get_price(const Currency& asset) const = 0;
};

// Fetch and vet a price against the policy. On OK, `price_x18` holds the price.
int32_t checked_price(const IPriceSource& source, const PricePolicy& policy,
                      const Currency& asset, uint64_t now, I128& price_x18);

// =============================================================================
// PriceBook - directly written quotes
// =============================================================================

class PriceBook : public IPriceSource {
public:
    PriceBook() = default;

    void set_price(const Currency& asset, I128 price_x18, uint64_t timestamp,
                   I128 confidence_x18 = 0);
    void remove_price(const Currency& asset);

    std::optional<PriceQuote> get_price(const Currency& asset) const override;

private:
    std::map<Currency, PriceQuote> quotes_;
};

} // namespace lend

#endif // LEND_ORACLE_HPP
