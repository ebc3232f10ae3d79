#ifndef PEG_X18_HPP
#define PEG_X18_HPP

#include <string>
#include <string_view>

#include "types.hpp"

namespace peg {

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places, unsigned)
// =============================================================================

constexpr U128 X18_ONE = 1000000000000000000ULL;  // 1e18
constexpr U128 U128_MAX = ~U128(0);

namespace x18 {

constexpr U128 from_int(uint64_t v) {
    return static_cast<U128>(v) * X18_ONE;
}

// 10^exp for exp <= 38
constexpr U128 pow10(unsigned exp) {
    U128 r = 1;
    for (unsigned i = 0; i < exp; ++i) r *= 10;
    return r;
}

// Checked add/sub; throw ArithmeticError on wrap
U128 checked_add(U128 a, U128 b);
U128 checked_sub(U128 a, U128 b);

// floor(a * b / denom) with a 256-bit intermediate product.
// Throws ArithmeticError on denom == 0 or when the quotient exceeds 128 bits.
U128 mul_div(U128 a, U128 b, U128 denom);

// Same as mul_div, but a quotient beyond 128 bits saturates to U128_MAX
U128 mul_div_saturating(U128 a, U128 b, U128 denom);

// Decimal string <-> x18 ("2000.5" <-> 2000500000000000000000).
// At most 18 fractional digits; throws ValidationError otherwise.
U128 parse(std::string_view text);
std::string to_string(U128 v);

// Plain base-10 integer formatting of a raw value
std::string to_raw_string(U128 v);
U128 parse_raw(std::string_view text);

} // namespace x18

} // namespace peg

#endif // PEG_X18_HPP
