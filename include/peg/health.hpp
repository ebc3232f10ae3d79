#ifndef PEG_HEALTH_HPP
#define PEG_HEALTH_HPP

#include "types.hpp"
#include "x18.hpp"

namespace peg {

// =============================================================================
// Health Factor
// =============================================================================

constexpr U128 LIQUIDATION_PRECISION = 100;
constexpr U128 MIN_HEALTH_FACTOR = X18_ONE;

// Ratio of threshold-adjusted collateral value to debt, scaled by `precision`.
//   debt == 0  -> U128_MAX (no debt is unconditionally healthy)
//   otherwise  -> floor(floor(collateral_usd * threshold_pct / 100) * precision / debt)
// A ratio beyond 128 bits saturates to U128_MAX.
class HealthFactorCalculator {
public:
    static U128 compute(U128 debt_x18, U128 collateral_usd_x18,
                        U128 threshold_pct, U128 precision = X18_ONE);

    static bool is_healthy(U128 health_factor_x18, U128 min_health_factor_x18 = MIN_HEALTH_FACTOR) {
        return health_factor_x18 >= min_health_factor_x18;
    }
};

} // namespace peg

#endif // PEG_HEALTH_HPP
