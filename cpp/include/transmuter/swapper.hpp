#pragma once

#include <cstdint>
#include <string>

#include "transmuter/collaborators.hpp"
#include "transmuter/quoter.hpp"
#include "transmuter/types.hpp"

namespace transmuter {

struct SwapDirection {
    bool mint = false;
    std::string collateral;
};

// Swap settlement. Holds the collaborators; the ledger is handed in by the
// caller for the duration of each call.
class Swapper {
public:
    Swapper(const Oracle& oracle, Manager& manager, TokenGateway& tokens)
        : quoter_(oracle), manager_(manager), tokens_(tokens) {}

    // Which side is the stablecoin decides mint vs burn
    static SwapDirection get_mint_burn(
        const Ledger& ledger,
        const std::string& token_in,
        const std::string& token_out
    );

    static void check_deadline(uint64_t now, uint64_t deadline);

    // Fails when a managed collateral cannot pay `amount_out` right away
    void check_amounts(const Ledger& ledger, const std::string& asset, const uint256& amount_out) const;

    uint256 quote_in(const Ledger& ledger, const uint256& amount_in, const std::string& token_in, const std::string& token_out) const;
    uint256 quote_out(const Ledger& ledger, const uint256& amount_out, const std::string& token_in, const std::string& token_out) const;

    uint256 swap_exact_input(
        Ledger& ledger,
        const std::string& caller,
        const uint256& amount_in,
        const uint256& amount_out_min,
        const std::string& token_in,
        const std::string& token_out,
        const std::string& to,
        uint64_t deadline,
        uint64_t now
    );

    uint256 swap_exact_output(
        Ledger& ledger,
        const std::string& caller,
        const uint256& amount_out,
        const uint256& amount_in_max,
        const std::string& token_in,
        const std::string& token_out,
        const std::string& to,
        uint64_t deadline,
        uint64_t now
    );

    const Quoter& quoter() const { return quoter_; }

private:
    void settle(
        Ledger& ledger,
        const SwapDirection& direction,
        const uint256& amount_in,
        const uint256& amount_out,
        const std::string& caller,
        const std::string& to
    );

    Quoter quoter_;
    Manager& manager_;
    TokenGateway& tokens_;
};

} // namespace transmuter
