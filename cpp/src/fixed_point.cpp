#include "transmuter/fixed_point.hpp"
#include "transmuter/errors.hpp"

#include <limits>

namespace transmuter {

namespace {

// Magnitude of a fee known to be strictly negative and above -BASE_9
uint64_t rebate_of(int64_t fees) {
    if (fees <= -static_cast<int64_t>(BASE_9)) {
        throw TransmuterError(ErrorKind::InvalidSwap, "rebate of 100% or more");
    }
    return static_cast<uint64_t>(-fees);
}

} // namespace

uint256 FixedPoint::mul_div(
    const uint256& a,
    const uint256& b,
    const uint256& d,
    Rounding rounding
) {
    if (d == 0) {
        throw std::overflow_error("math: mul_div division by zero");
    }
    uint512 prod = uint512(a) * uint512(b);
    uint512 den(d);
    uint512 q = prod / den;
    if (rounding == Rounding::Up && q * den != prod) {
        ++q;
    }
    static const uint512 max_u256((std::numeric_limits<uint256>::max)());
    if (q > max_u256) {
        throw std::overflow_error("math: mul_div overflow");
    }
    return uint256(q);
}

uint256 FixedPoint::convert_decimal_to(
    const uint256& amount,
    uint32_t from_decimals,
    uint32_t to_decimals
) {
    if (from_decimals > to_decimals) {
        return amount / boost::multiprecision::pow(uint256(10), from_decimals - to_decimals);
    }
    if (from_decimals < to_decimals) {
        return amount * boost::multiprecision::pow(uint256(10), to_decimals - from_decimals);
    }
    return amount;
}

uint256 FixedPoint::sqrt(const uint256& x, Rounding rounding) {
    uint256 r = boost::multiprecision::sqrt(x);
    if (rounding == Rounding::Up && r * r < x) {
        ++r;
    }
    return r;
}

// ------------------------------- mint side -----------------------------------

uint256 FixedPoint::apply_fee_mint(const uint256& amount_in, int64_t fees) {
    if (fees >= 0) {
        // Fees at or above BASE_12 stand for an infinite fee
        if (static_cast<uint64_t>(fees) >= BASE_12) {
            throw TransmuterError(ErrorKind::InvalidSwap, "mint fee too high");
        }
        return amount_in * BASE_9 / (BASE_9 + static_cast<uint64_t>(fees));
    }
    return amount_in * BASE_9 / (BASE_9 - rebate_of(fees));
}

uint256 FixedPoint::invert_fee_mint(const uint256& amount_out, int64_t fees) {
    if (fees >= 0) {
        if (static_cast<uint64_t>(fees) >= BASE_12) {
            throw TransmuterError(ErrorKind::InvalidSwap, "mint fee too high");
        }
        return mul_div(amount_out, uint256(BASE_9 + static_cast<uint64_t>(fees)), uint256(BASE_9), Rounding::Up);
    }
    return mul_div(amount_out, uint256(BASE_9 - rebate_of(fees)), uint256(BASE_9), Rounding::Up);
}

// ------------------------------- burn side -----------------------------------

uint256 FixedPoint::apply_fee_burn(const uint256& amount_in, int64_t fees) {
    if (fees >= 0) {
        if (static_cast<uint64_t>(fees) >= BASE_9) {
            throw TransmuterError(ErrorKind::InvalidSwap, "burn fee too high");
        }
        return (BASE_9 - static_cast<uint64_t>(fees)) * amount_in / BASE_9;
    }
    return (BASE_9 + rebate_of(fees)) * amount_in / BASE_9;
}

uint256 FixedPoint::invert_fee_burn(const uint256& amount_out, int64_t fees) {
    if (fees >= 0) {
        if (static_cast<uint64_t>(fees) >= BASE_9) {
            throw TransmuterError(ErrorKind::InvalidSwap, "burn fee too high");
        }
        return mul_div(amount_out, uint256(BASE_9), uint256(BASE_9 - static_cast<uint64_t>(fees)), Rounding::Up);
    }
    return mul_div(amount_out, uint256(BASE_9), uint256(BASE_9 + rebate_of(fees)), Rounding::Up);
}

} // namespace transmuter
