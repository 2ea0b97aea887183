#ifndef SYNX_TEST_SUPPORT_HPP
#define SYNX_TEST_SUPPORT_HPP

// Shared helpers for the synx test suite

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_tostring.hpp>

#include <synx/math.hpp>
#include <synx/types.hpp>

namespace Catch {

template <>
struct StringMaker<synx::Amount> {
    static std::string convert(synx::Amount v) { return synx::math::to_string(v); }
};

template <>
struct StringMaker<synx::Errc> {
    static std::string convert(synx::Errc e) { return synx::to_string(e); }
};

} // namespace Catch

namespace synx::testing {

constexpr Amount PRICE(uint64_t whole) { return Amount(whole) * PRICE_ONE; }

// Runs fn and returns the error kind it raised
template <typename Fn>
Errc error_of(Fn&& fn) {
    try {
        fn();
    } catch (const SXError& e) {
        return e.code();
    }
    FAIL("expected SXError");
    return Errc::InvalidAmount;
}

} // namespace synx::testing

#endif // SYNX_TEST_SUPPORT_HPP
