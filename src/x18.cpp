// =============================================================================
// x18.cpp - 18-decimal Fixed-Point Arithmetic
// =============================================================================

#include "peg/x18.hpp"
#include "peg/errors.hpp"

#include <algorithm>

namespace peg {
namespace x18 {

namespace {

// =============================================================================
// 256-bit Arithmetic (U256 via two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits
};

// Multiply two U128 values to produce U256
U256 mul_u128(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + (mid >> 64);
    return result;
}

// Floor division of U256 by U128. Returns false if the quotient does not fit.
bool div_u256_u128(U256 num, U128 denom, U128& quot) {
    if (num.hi == 0) {
        quot = num.lo / denom;
        return true;
    }
    if (num.hi >= denom) {
        return false;
    }

    // Restoring long division over the low limb; rem < denom throughout
    U128 rem = num.hi;
    U128 q = 0;
    for (int i = 127; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | ((num.lo >> i) & 1);
        q <<= 1;
        if (carry || rem >= denom) {
            rem -= denom;
            q |= 1;
        }
    }
    quot = q;
    return true;
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

U128 parse_digits(std::string_view digits, std::string_view original) {
    U128 v = 0;
    for (char c : digits) {
        if (!is_digit(c)) {
            throw ValidationError(ErrorCode::INVALID_AMOUNT,
                                  "not a decimal amount: " + std::string(original));
        }
        U128 d = static_cast<U128>(c - '0');
        if (v > (U128_MAX - d) / 10) {
            throw ArithmeticError(ErrorCode::ARITHMETIC_OVERFLOW,
                                  "amount out of range: " + std::string(original));
        }
        v = v * 10 + d;
    }
    return v;
}

} // anonymous namespace

// =============================================================================
// Checked Arithmetic
// =============================================================================

U128 checked_add(U128 a, U128 b) {
    if (a > U128_MAX - b) {
        throw ArithmeticError(ErrorCode::ARITHMETIC_OVERFLOW, "x18 addition overflow");
    }
    return a + b;
}

U128 checked_sub(U128 a, U128 b) {
    if (b > a) {
        throw ArithmeticError(ErrorCode::ARITHMETIC_OVERFLOW, "x18 subtraction underflow");
    }
    return a - b;
}

U128 mul_div(U128 a, U128 b, U128 denom) {
    if (denom == 0) {
        throw ArithmeticError(ErrorCode::DIVISION_BY_ZERO, "x18 mul_div by zero");
    }
    U128 quot = 0;
    if (!div_u256_u128(mul_u128(a, b), denom, quot)) {
        throw ArithmeticError(ErrorCode::ARITHMETIC_OVERFLOW, "x18 mul_div overflow");
    }
    return quot;
}

U128 mul_div_saturating(U128 a, U128 b, U128 denom) {
    if (denom == 0) {
        throw ArithmeticError(ErrorCode::DIVISION_BY_ZERO, "x18 mul_div by zero");
    }
    U128 quot = 0;
    if (!div_u256_u128(mul_u128(a, b), denom, quot)) {
        return U128_MAX;
    }
    return quot;
}

// =============================================================================
// Decimal Conversion
// =============================================================================

U128 parse(std::string_view text) {
    if (text.empty()) {
        throw ValidationError(ErrorCode::INVALID_AMOUNT, "empty amount");
    }

    auto dot = text.find('.');
    std::string_view int_part = text.substr(0, dot);
    std::string_view frac_part = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);

    if (int_part.empty() && frac_part.empty()) {
        throw ValidationError(ErrorCode::INVALID_AMOUNT, "not a decimal amount: " + std::string(text));
    }
    if (frac_part.size() > 18) {
        throw ValidationError(ErrorCode::INVALID_AMOUNT,
                              "more than 18 fractional digits: " + std::string(text));
    }

    U128 whole = parse_digits(int_part, text);
    U128 frac = parse_digits(frac_part, text) * pow10(static_cast<unsigned>(18 - frac_part.size()));

    if (whole > (U128_MAX - frac) / X18_ONE) {
        throw ArithmeticError(ErrorCode::ARITHMETIC_OVERFLOW, "amount out of range: " + std::string(text));
    }
    return whole * X18_ONE + frac;
}

std::string to_raw_string(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

U128 parse_raw(std::string_view text) {
    if (text.empty()) {
        throw ValidationError(ErrorCode::INVALID_AMOUNT, "empty amount");
    }
    return parse_digits(text, text);
}

std::string to_string(U128 v) {
    std::string out = to_raw_string(v / X18_ONE);
    U128 frac = v % X18_ONE;
    if (frac == 0) return out;

    std::string digits = to_raw_string(frac);
    digits.insert(0, 18 - digits.size(), '0');
    while (!digits.empty() && digits.back() == '0') digits.pop_back();
    return out + "." + digits;
}

} // namespace x18
} // namespace peg
