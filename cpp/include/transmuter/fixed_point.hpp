#ifndef TRANSMUTER_FIXED_POINT_HPP
#define TRANSMUTER_FIXED_POINT_HPP

#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <stdexcept>

namespace transmuter {

// Checked types: overflow throws std::overflow_error, a negative unsigned
// result throws std::range_error. Nothing wraps.
using uint256 = boost::multiprecision::checked_uint256_t;
using int256 = boost::multiprecision::checked_int256_t;
using uint512 = boost::multiprecision::checked_uint512_t;

constexpr uint64_t BASE_6 = 1000000ULL;
constexpr uint64_t BASE_8 = 100000000ULL;
constexpr uint64_t BASE_9 = 1000000000ULL;
constexpr uint64_t BASE_12 = 1000000000000ULL;
constexpr uint64_t BASE_18 = 1000000000000000000ULL;

inline const uint256& BASE_27() { static const uint256 v("1000000000000000000000000000"); return v; }
inline const uint256& BASE_36() { static const uint256 v("1000000000000000000000000000000000000"); return v; }

enum class Rounding { Down, Up };

class FixedPoint {
public:
    // a * b / d with a 512-bit intermediate product
    static uint256 mul_div(
        const uint256& a,
        const uint256& b,
        const uint256& d,
        Rounding rounding = Rounding::Down
    );

    static uint256 convert_decimal_to(
        const uint256& amount,
        uint32_t from_decimals,
        uint32_t to_decimals
    );

    static uint256 sqrt(const uint256& x, Rounding rounding = Rounding::Down);

    // Fees are signed and in BASE_9. Mint fees are taken on the stablecoins
    // minted, burn fees on the collateral value paid out.
    static uint256 apply_fee_mint(const uint256& amount_in, int64_t fees);
    static uint256 invert_fee_mint(const uint256& amount_out, int64_t fees);
    static uint256 apply_fee_burn(const uint256& amount_in, int64_t fees);
    static uint256 invert_fee_burn(const uint256& amount_out, int64_t fees);
};

} // namespace transmuter

#endif // TRANSMUTER_FIXED_POINT_HPP
