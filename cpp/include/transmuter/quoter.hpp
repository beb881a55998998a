#pragma once

#include <string>

#include "transmuter/collaborators.hpp"
#include "transmuter/types.hpp"

namespace transmuter {

struct BurnOracle {
    uint256 min_deviation;  // BASE_18
    uint256 oracle_value;   // BASE_18
};

// Read-only pricing. Amounts on the collateral side are in the collateral's
// own decimals, amounts on the stablecoin side in 18 decimals.
class Quoter {
public:
    explicit Quoter(const Oracle& oracle) : oracle_(oracle) {}

    uint256 quote_mint_exact_input(const Ledger& ledger, const Collateral& collat, const uint256& amount_in) const;
    uint256 quote_mint_exact_output(const Ledger& ledger, const Collateral& collat, const uint256& amount_out) const;
    uint256 quote_burn_exact_input(const Ledger& ledger, const std::string& asset, const uint256& amount_in) const;
    uint256 quote_burn_exact_output(const Ledger& ledger, const std::string& asset, const uint256& amount_out) const;

    // Price of `asset` for redemptions together with the worst deviation seen
    // across every collateral priced by the same oracle configuration.
    BurnOracle get_burn_oracle(const Ledger& ledger, const std::string& asset) const;

private:
    const Oracle& oracle_;
};

} // namespace transmuter
