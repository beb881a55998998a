#include "transmuter/fee_curve.hpp"
#include "transmuter/errors.hpp"
#include "transmuter/trace.hpp"

#include <algorithm>
#include <functional>
#include <iostream>

namespace transmuter {

namespace {

// Stables that must be issued against a collateral for its exposure to be
// `exposure` when `other` stables are issued against everything else:
// s / (s + other) = x  <=>  s = other * x / (1 - x)
uint256 issued_at_exposure(const uint256& other, uint64_t exposure) {
    return other * exposure / (BASE_9 - exposure);
}

// Rounding on the exposure side can put us a unit past a breakpoint
uint256 clamped_sub(const uint256& a, const uint256& b) {
    return a > b ? uint256(a - b) : uint256(0);
}

int64_t to_fee(const int256& v) {
    return v.convert_to<int64_t>();
}

} // namespace

std::size_t FeeCurve::find_lower_bound(
    bool increasing,
    const std::vector<uint64_t>& array,
    uint64_t element
) {
    if (array.empty()) {
        return 0;
    }
    // Searching from index 1 keeps the answer at 0 or above
    auto first_past = increasing
        ? std::upper_bound(array.begin() + 1, array.end(), element)
        : std::upper_bound(array.begin() + 1, array.end(), element, std::greater<uint64_t>());
    return static_cast<std::size_t>(first_past - array.begin()) - 1;
}

uint256 FeeCurve::compute_fee(QuoteType quote_type, const uint256& amount, int64_t fees) {
    switch (quote_type) {
        case QuoteType::MintExactInput:  return FixedPoint::apply_fee_mint(amount, fees);
        case QuoteType::MintExactOutput: return FixedPoint::invert_fee_mint(amount, fees);
        case QuoteType::BurnExactInput:  return FixedPoint::apply_fee_burn(amount, fees);
        case QuoteType::BurnExactOutput: return FixedPoint::invert_fee_burn(amount, fees);
    }
    throw std::invalid_argument("unknown quote type");
}

uint256 FeeCurve::quote_fees(
    const Collateral& collat,
    const uint256& normalized_stables_total,
    const uint256& normalizer,
    QuoteType quote_type,
    uint256 amount_stable
) {
    const bool mint = is_mint(quote_type);
    const bool exact = is_exact(quote_type);
    const auto& x_fee = mint ? collat.x_fee_mint : collat.x_fee_burn;
    const auto& y_fee = mint ? collat.y_fee_mint : collat.y_fee_burn;
    const std::size_t n = y_fee.size();
    if (n == 0 || x_fee.size() != n) {
        throw TransmuterError(ErrorKind::InvalidParams, "fee curve not set");
    }
    if (amount_stable == 0) {
        return 0;
    }

    // First swap ever or constant fees: nothing to integrate over
    if (normalized_stables_total == 0 || n == 1) {
        return compute_fee(quote_type, amount_stable, y_fee[0]);
    }

    uint64_t current_exposure = (
        collat.normalized_stables * BASE_9 / normalized_stables_total
    ).convert_to<uint64_t>();
    std::size_t i = find_lower_bound(mint, x_fee, current_exposure);

    // A swap on this collateral only moves `issued`; `other` stays fixed
    uint256 issued = collat.normalized_stables * normalizer / BASE_27();
    uint256 other = (normalized_stables_total - collat.normalized_stables) * normalizer / BASE_27();

    const bool trace = trace_enabled();
    uint256 amount = 0;

    while (i + 1 < n) {
        const uint64_t lower_exposure = x_fee[i];
        const uint64_t upper_exposure = x_fee[i + 1];
        const int64_t lower_fees = y_fee[i];
        const int64_t upper_fees = y_fee[i + 1];

        // Burn exposures decrease along the curve
        const uint256 upper_level = issued_at_exposure(other, upper_exposure);
        const uint256 amount_to_next = mint
            ? clamped_sub(upper_level, issued)
            : clamped_sub(issued, upper_level);

        // Fee at the current exposure, linear in the amount swapped
        int64_t current_fees = lower_fees;
        if (current_exposure != lower_exposure && lower_fees != upper_fees && lower_exposure < BASE_9) {
            const uint256 lower_level = issued_at_exposure(other, lower_exposure);
            const uint256 amount_from_prev = mint
                ? clamped_sub(issued, lower_level)
                : clamped_sub(lower_level, issued);
            const uint256 span = amount_to_next + amount_from_prev;
            if (span > 0) {
                const uint256 rise = static_cast<uint64_t>(upper_fees - lower_fees);
                current_fees = lower_fees + (rise * amount_from_prev / span).convert_to<int64_t>();
            }
        }

        // Trapezoid over the rest of the segment
        const int64_t segment_fees = (upper_fees + current_fees) / 2;
        const uint256 capacity = exact
            ? amount_to_next
            : (mint ? FixedPoint::invert_fee_mint(amount_to_next, segment_fees)
                    : FixedPoint::apply_fee_burn(amount_to_next, segment_fees));

        if (trace) {
            std::cout << "TRACE qf_segment i=" << i
                      << " exposure=" << current_exposure
                      << " issued=" << issued
                      << " to_next=" << amount_to_next
                      << " current_fees=" << current_fees
                      << " capacity=" << capacity
                      << " remaining=" << amount_stable
                      << std::endl;
        }

        if (capacity >= amount_stable) {
            int64_t mid_fees;
            if (exact) {
                // Average fee over [0, a] of a line going from current to upper over [0, T]
                const int256 a(amount_stable);
                const int256 two_t(2 * amount_to_next);
                mid_fees = to_fee(
                    (int256(upper_fees) * a + int256(current_fees) * (two_t - a)) / two_t
                );
            } else {
                // The consumed span is unknown: solve the quadratic on the average fee
                const uint256 ac4 = FixedPoint::mul_div(
                    uint256(BASE_9),
                    2 * amount_stable * static_cast<uint64_t>(upper_fees - current_fees),
                    amount_to_next,
                    Rounding::Up
                );
                if (mint) {
                    const uint256 base_plus = static_cast<uint64_t>(static_cast<int64_t>(BASE_9) + current_fees);
                    const int256 root(FixedPoint::sqrt(base_plus * base_plus + ac4, Rounding::Up));
                    mid_fees = to_fee((root + current_fees - int256(BASE_9)) / 2);
                } else {
                    const uint256 base_minus = static_cast<uint64_t>(static_cast<int64_t>(BASE_9) - current_fees);
                    const uint256 base_minus_sq = base_minus * base_minus;
                    // Only reachable through rounding
                    if (base_minus_sq < ac4) {
                        mid_fees = (current_fees + static_cast<int64_t>(BASE_9)) / 2;
                    } else {
                        const int256 root(FixedPoint::sqrt(base_minus_sq - ac4, Rounding::Down));
                        mid_fees = to_fee((int256(BASE_9) + current_fees - root) / 2);
                    }
                }
            }
            if (trace) {
                std::cout << "TRACE qf_final i=" << i << " mid_fees=" << mid_fees << std::endl;
            }
            return amount + compute_fee(quote_type, amount_stable, mid_fees);
        }

        amount_stable -= capacity;
        amount += exact
            ? (mint ? FixedPoint::invert_fee_mint(amount_to_next, segment_fees)
                    : FixedPoint::apply_fee_burn(amount_to_next, segment_fees))
            : amount_to_next;
        issued = mint ? uint256(issued + amount_to_next) : uint256(issued - amount_to_next);
        current_exposure = upper_exposure;
        ++i;
    }

    // Past the last breakpoint the fee is flat
    return amount + compute_fee(quote_type, amount_stable, y_fee[n - 1]);
}

} // namespace transmuter
