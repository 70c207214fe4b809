// =============================================================================
// oracle.cpp - Price freshness and confidence checks
// =============================================================================

#include "lend/oracle.hpp"

namespace lend {

int32_t checked_price(const IPriceSource& source, const PricePolicy& policy,
                      const Currency& asset, uint64_t now, I128& price_x18) {
    auto quote = source.get_price(asset);
    if (!quote) {
        return errors::PRICE_UNAVAILABLE;
    }
    if (quote->price_x18 <= 0) {
        return errors::INVALID_PRICE;
    }

    // Quotes stamped in the future count as fresh
    uint64_t age = now > quote->timestamp ? now - quote->timestamp : 0;
    if (age > policy.max_price_age) {
        return errors::PRICE_STALE;
    }

    if (policy.max_confidence_ratio_x18 > 0) {
        I128 confidence = quote->confidence_x18 < 0 ? -quote->confidence_x18 : quote->confidence_x18;
        if (x18::div(confidence, quote->price_x18) > policy.max_confidence_ratio_x18) {
            return errors::PRICE_DEVIATION_TOO_HIGH;
        }
    }

    price_x18 = quote->price_x18;
    return errors::OK;
}

void PriceBook::set_price(const Currency& asset, I128 price_x18, uint64_t timestamp,
                          I128 confidence_x18) {
    quotes_[asset] = PriceQuote{price_x18, confidence_x18, timestamp};
}

void PriceBook::remove_price(const Currency& asset) {
    quotes_.erase(asset);
}

std::optional<PriceQuote> PriceBook::get_price(const Currency& asset) const {
    auto it = quotes_.find(asset);
    if (it == quotes_.end()) return std::nullopt;
    return it->second;
}

} // namespace lend
