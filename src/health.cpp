// =============================================================================
// health.cpp - Health Factor Calculation
// =============================================================================

#include "peg/health.hpp"

namespace peg {

U128 HealthFactorCalculator::compute(U128 debt_x18, U128 collateral_usd_x18,
                                     U128 threshold_pct, U128 precision) {
    if (debt_x18 == 0) {
        return U128_MAX;
    }

    U128 adjusted = x18::mul_div(collateral_usd_x18, threshold_pct, LIQUIDATION_PRECISION);
    return x18::mul_div_saturating(adjusted, precision, debt_x18);
}

} // namespace peg
