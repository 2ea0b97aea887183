#ifndef SYNX_MATH_HPP
#define SYNX_MATH_HPP

#include <string>
#include <string_view>

#include "types.hpp"

namespace synx {
namespace math {

// =============================================================================
// Checked Integer Arithmetic
//
// All operations throw SXError{ArithmeticError} instead of wrapping.
// Division truncates toward zero.
// =============================================================================

inline Amount add(Amount a, Amount b) {
    Amount r;
    if (__builtin_add_overflow(a, b, &r)) {
        throw SXError(Errc::ArithmeticError, "addition overflow");
    }
    return r;
}

inline Amount sub(Amount a, Amount b) {
    if (b > a) {
        throw SXError(Errc::ArithmeticError, "subtraction underflow");
    }
    return a - b;
}

inline Amount mul(Amount a, Amount b) {
    Amount r;
    if (__builtin_mul_overflow(a, b, &r)) {
        throw SXError(Errc::ArithmeticError, "multiplication overflow");
    }
    return r;
}

inline Amount div(Amount a, Amount b) {
    if (b == 0) {
        throw SXError(Errc::ArithmeticError, "division by zero");
    }
    return a / b;
}

inline BlockHeight elapsed(BlockHeight since, BlockHeight now) {
    if (since > now) {
        throw SXError(Errc::ArithmeticError, "clock went backwards");
    }
    return now - since;
}

// amount * bps / 10000
inline Amount bps(Amount amount, Amount basis_points) {
    return div(mul(amount, basis_points), BPS_DENOMINATOR);
}

// amount * pct / 100
inline Amount percent_of(Amount amount, Amount pct) {
    return div(mul(amount, pct), PERCENT);
}

// =============================================================================
// Collateral Math
// =============================================================================

// (collateral * price * 100) / (debt * 1e8); Unbounded when debt == 0
Health position_health(Amount collateral, Amount debt, Amount price);

// (collateral * price) / (ratio * 1e6)
Amount max_mintable(Amount collateral, Amount price, Amount ratio);

// debt_units * 1e8 / price
Amount collateral_for_debt(Amount debt, Amount price);

// =============================================================================
// Decimal Codec
// =============================================================================

std::string to_string(Amount v);

// Throws std::invalid_argument on malformed input, std::out_of_range on overflow
Amount from_string(std::string_view s);

} // namespace math
} // namespace synx

#endif // SYNX_MATH_HPP
