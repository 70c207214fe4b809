#ifndef LEND_ACCRUAL_HPP
#define LEND_ACCRUAL_HPP

#include "reserve.hpp"

namespace lend {

// =============================================================================
// AccrualEngine - advances reserve indices by elapsed time
//
// Interest is simple over each step: factor = 1 + rate * elapsed. Compounding
// happens only across steps, so the result depends on how often a reserve is
// touched. Throws MathError if an index or total overflows.
// =============================================================================

class AccrualEngine {
public:
    // Mutates the reserve in place. now <= last_update_timestamp is a no-op.
    static void accrue(Reserve& reserve, uint64_t now);

    // Same computation on a copy; the input is left untouched
    static Reserve project(const Reserve& reserve, uint64_t now);

    // Interest factor for `elapsed` seconds at `rate_x18` per second
    static I128 growth_factor(I128 rate_x18, uint64_t elapsed);
};

} // namespace lend

#endif // LEND_ACCRUAL_HPP
