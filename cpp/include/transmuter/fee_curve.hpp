#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "transmuter/fixed_point.hpp"
#include "transmuter/types.hpp"

namespace transmuter {

class FeeCurve {
public:
    // Index i of the segment holding `element`: x[i] <= element < x[i+1] for
    // increasing arrays, x[i] >= element > x[i+1] for decreasing ones. Past the
    // last breakpoint the last index is returned.
    static std::size_t find_lower_bound(
        bool increasing,
        const std::vector<uint64_t>& array,
        uint64_t element
    );

    // Single-rate conversion matching the quote type
    static uint256 compute_fee(QuoteType quote_type, const uint256& amount, int64_t fees);

    // Integrates the collateral's fee curve over `amount_stable` (18 decimals,
    // stablecoin value) and returns the counter-amount, also in stablecoin value.
    static uint256 quote_fees(
        const Collateral& collat,
        const uint256& normalized_stables_total,
        const uint256& normalizer,
        QuoteType quote_type,
        uint256 amount_stable
    );
};

} // namespace transmuter
