// =============================================================================
// math.cpp - Fixed-Point Collateral Math
// =============================================================================

#include "synx/math.hpp"
#include <algorithm>
#include <stdexcept>

namespace synx {
namespace math {

Health position_health(Amount collateral, Amount debt, Amount price) {
    if (debt == 0) {
        return Health::unbounded();
    }
    Amount value = mul(mul(collateral, price), PERCENT);
    return Health::ratio(div(value, mul(debt, PRICE_ONE)));
}

Amount max_mintable(Amount collateral, Amount price, Amount ratio) {
    return div(mul(collateral, price), mul(ratio, RATIO_SCALE));
}

Amount collateral_for_debt(Amount debt, Amount price) {
    return div(mul(debt, PRICE_ONE), price);
}

std::string to_string(Amount v) {
    if (v == 0) return "0";

    std::string out;
    while (v > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

Amount from_string(std::string_view s) {
    if (s.empty()) {
        throw std::invalid_argument("empty amount");
    }

    Amount result = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("malformed amount: " + std::string(s));
        }
        Amount digit = static_cast<Amount>(c - '0');
        if (__builtin_mul_overflow(result, Amount(10), &result) ||
            __builtin_add_overflow(result, digit, &result)) {
            throw std::out_of_range("amount overflow: " + std::string(s));
        }
    }
    return result;
}

} // namespace math
} // namespace synx
