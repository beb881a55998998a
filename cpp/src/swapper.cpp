#include "transmuter/swapper.hpp"
#include "transmuter/errors.hpp"
#include "transmuter/trace.hpp"

#include <iostream>

namespace transmuter {

SwapDirection Swapper::get_mint_burn(
    const Ledger& ledger,
    const std::string& token_in,
    const std::string& token_out
) {
    SwapDirection direction;
    if (token_in == ledger.stablecoin) {
        direction.mint = false;
        direction.collateral = token_out;
    } else if (token_out == ledger.stablecoin) {
        direction.mint = true;
        direction.collateral = token_in;
    } else {
        throw TransmuterError(ErrorKind::InvalidTokens, token_in + " -> " + token_out);
    }

    const Collateral& collat = ledger.collateral(direction.collateral);
    if (direction.mint ? !collat.is_mint_live : !collat.is_burn_live) {
        throw TransmuterError(ErrorKind::Paused, direction.collateral);
    }
    return direction;
}

void Swapper::check_deadline(uint64_t now, uint64_t deadline) {
    if (now > deadline) {
        throw TransmuterError(ErrorKind::TooLate);
    }
}

void Swapper::check_amounts(const Ledger& ledger, const std::string& asset, const uint256& amount_out) const {
    const Collateral& collat = ledger.collateral(asset);
    if (collat.is_managed && manager_.max_available(asset) < amount_out) {
        throw TransmuterError(ErrorKind::InvalidSwap, "manager cannot cover payout");
    }
}

// ------------------------------- quotes --------------------------------------

uint256 Swapper::quote_in(
    const Ledger& ledger,
    const uint256& amount_in,
    const std::string& token_in,
    const std::string& token_out
) const {
    SwapDirection direction = get_mint_burn(ledger, token_in, token_out);
    if (direction.mint) {
        return quoter_.quote_mint_exact_input(ledger, ledger.collateral(direction.collateral), amount_in);
    }
    uint256 amount_out = quoter_.quote_burn_exact_input(ledger, direction.collateral, amount_in);
    check_amounts(ledger, direction.collateral, amount_out);
    return amount_out;
}

uint256 Swapper::quote_out(
    const Ledger& ledger,
    const uint256& amount_out,
    const std::string& token_in,
    const std::string& token_out
) const {
    SwapDirection direction = get_mint_burn(ledger, token_in, token_out);
    if (direction.mint) {
        return quoter_.quote_mint_exact_output(ledger, ledger.collateral(direction.collateral), amount_out);
    }
    check_amounts(ledger, direction.collateral, amount_out);
    return quoter_.quote_burn_exact_output(ledger, direction.collateral, amount_out);
}

// ------------------------------- swaps ---------------------------------------

uint256 Swapper::swap_exact_input(
    Ledger& ledger,
    const std::string& caller,
    const uint256& amount_in,
    const uint256& amount_out_min,
    const std::string& token_in,
    const std::string& token_out,
    const std::string& to,
    uint64_t deadline,
    uint64_t now
) {
    check_deadline(now, deadline);
    SwapDirection direction = get_mint_burn(ledger, token_in, token_out);
    uint256 amount_out = direction.mint
        ? quoter_.quote_mint_exact_input(ledger, ledger.collateral(direction.collateral), amount_in)
        : quoter_.quote_burn_exact_input(ledger, direction.collateral, amount_in);
    if (amount_out < amount_out_min) {
        throw TransmuterError(ErrorKind::TooSmallAmountOut);
    }
    settle(ledger, direction, amount_in, amount_out, caller, to);
    return amount_out;
}

uint256 Swapper::swap_exact_output(
    Ledger& ledger,
    const std::string& caller,
    const uint256& amount_out,
    const uint256& amount_in_max,
    const std::string& token_in,
    const std::string& token_out,
    const std::string& to,
    uint64_t deadline,
    uint64_t now
) {
    check_deadline(now, deadline);
    SwapDirection direction = get_mint_burn(ledger, token_in, token_out);
    uint256 amount_in = direction.mint
        ? quoter_.quote_mint_exact_output(ledger, ledger.collateral(direction.collateral), amount_out)
        : quoter_.quote_burn_exact_output(ledger, direction.collateral, amount_out);
    if (amount_in > amount_in_max) {
        throw TransmuterError(ErrorKind::TooBigAmountIn);
    }
    settle(ledger, direction, amount_in, amount_out, caller, to);
    return amount_in;
}

void Swapper::settle(
    Ledger& ledger,
    const SwapDirection& direction,
    const uint256& amount_in,
    const uint256& amount_out,
    const std::string& caller,
    const std::string& to
) {
    Collateral& collat = ledger.collateral(direction.collateral);
    const std::string manager_target = collat.is_managed ? collat.manager_config : std::string();

    const uint256 collat_before = collat.normalized_stables;
    const uint256 total_before = ledger.normalized_stables;

    // Same delta on both counters so that they keep summing up
    uint256 change;
    if (direction.mint) {
        change = ledger.to_normalized(amount_out, Rounding::Up);
        // the total is the larger counter and overflows first
        ledger.normalized_stables += change;
        collat.normalized_stables += change;
    } else {
        check_amounts(ledger, direction.collateral, amount_out);
        change = ledger.to_normalized(amount_in, Rounding::Down);
        if (change > collat.normalized_stables) {
            throw TransmuterError(ErrorKind::InvalidSwap, "burning more than was issued from " + direction.collateral);
        }
        ledger.normalized_stables -= change;
        collat.normalized_stables -= change;
    }

    if (trace_enabled()) {
        std::cout << "TRACE settle mint=" << direction.mint
                  << " asset=" << direction.collateral
                  << " amount_in=" << amount_in
                  << " amount_out=" << amount_out
                  << " change=" << change
                  << " collat_normalized=" << collat.normalized_stables
                  << " total_normalized=" << ledger.normalized_stables
                  << std::endl;
    }

    try {
        if (direction.mint) {
            tokens_.transfer_collateral(direction.collateral, manager_target, caller, amount_in, true);
            tokens_.mint(to, amount_out);
        } else {
            tokens_.burn_self(amount_in, caller);
            tokens_.transfer_collateral(direction.collateral, manager_target, to, amount_out, false);
        }
    } catch (...) {
        collat.normalized_stables = collat_before;
        ledger.normalized_stables = total_before;
        throw;
    }
}

} // namespace transmuter
