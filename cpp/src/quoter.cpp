#include "transmuter/quoter.hpp"
#include "transmuter/errors.hpp"
#include "transmuter/fee_curve.hpp"
#include "transmuter/trace.hpp"

#include <iostream>

namespace transmuter {

namespace {

void require_price(const uint256& oracle_value, const std::string& where) {
    if (oracle_value == 0) {
        throw TransmuterError(ErrorKind::InvalidSwap, "zero oracle price in " + where);
    }
}

} // namespace

// -------------------------------- mint ---------------------------------------

uint256 Quoter::quote_mint_exact_input(
    const Ledger& ledger,
    const Collateral& collat,
    const uint256& amount_in
) const {
    uint256 oracle_value = oracle_.read_mint(collat.oracle_config, collat.oracle_storage);
    require_price(oracle_value, "mint");
    uint256 amount_out = FixedPoint::convert_decimal_to(oracle_value * amount_in, 18 + collat.decimals, 18);
    return FeeCurve::quote_fees(collat, ledger.normalized_stables, ledger.normalizer, QuoteType::MintExactInput, amount_out);
}

uint256 Quoter::quote_mint_exact_output(
    const Ledger& ledger,
    const Collateral& collat,
    const uint256& amount_out
) const {
    uint256 oracle_value = oracle_.read_mint(collat.oracle_config, collat.oracle_storage);
    require_price(oracle_value, "mint");
    uint256 amount_in = FeeCurve::quote_fees(collat, ledger.normalized_stables, ledger.normalizer, QuoteType::MintExactOutput, amount_out);
    amount_in = FixedPoint::mul_div(amount_in, uint256(BASE_18), oracle_value, Rounding::Up);
    return FixedPoint::convert_decimal_to(amount_in, 18, collat.decimals);
}

// -------------------------------- burn ---------------------------------------

uint256 Quoter::quote_burn_exact_input(
    const Ledger& ledger,
    const std::string& asset,
    const uint256& amount_in
) const {
    const Collateral& collat = ledger.collateral(asset);
    BurnOracle burn = get_burn_oracle(ledger, asset);
    require_price(burn.oracle_value, "burn");
    uint256 amount_out = FixedPoint::mul_div(amount_in, burn.min_deviation, uint256(BASE_18));
    amount_out = FeeCurve::quote_fees(collat, ledger.normalized_stables, ledger.normalizer, QuoteType::BurnExactInput, amount_out);
    return FixedPoint::convert_decimal_to(amount_out * BASE_18 / burn.oracle_value, 18, collat.decimals);
}

uint256 Quoter::quote_burn_exact_output(
    const Ledger& ledger,
    const std::string& asset,
    const uint256& amount_out
) const {
    const Collateral& collat = ledger.collateral(asset);
    BurnOracle burn = get_burn_oracle(ledger, asset);
    if (burn.min_deviation == 0) {
        throw TransmuterError(ErrorKind::InvalidSwap, "zero burn deviation");
    }
    uint256 amount_in = FixedPoint::convert_decimal_to(amount_out * burn.oracle_value, 18 + collat.decimals, 18);
    amount_in = FeeCurve::quote_fees(collat, ledger.normalized_stables, ledger.normalizer, QuoteType::BurnExactOutput, amount_in);
    return FixedPoint::mul_div(amount_in, uint256(BASE_18), burn.min_deviation, Rounding::Up);
}

BurnOracle Quoter::get_burn_oracle(const Ledger& ledger, const std::string& asset) const {
    const Collateral& collat = ledger.collateral(asset);
    BurnOracle result{uint256(BASE_18), uint256(0)};

    // No caching: deviations move with every oracle update
    for (const auto& peer_asset : ledger.collateral_list) {
        uint256 deviation;
        if (peer_asset == asset) {
            BurnReading reading = oracle_.read_burn(collat.oracle_config, collat.oracle_storage);
            result.oracle_value = reading.price;
            deviation = reading.deviation;
        } else {
            const Collateral& peer = ledger.collateral(peer_asset);
            if (peer.oracle_config_hash != collat.oracle_config_hash) {
                continue;
            }
            deviation = oracle_.read_burn(peer.oracle_config, peer.oracle_storage).deviation;
        }
        if (trace_enabled()) {
            std::cout << "TRACE burn_oracle asset=" << asset
                      << " peer=" << peer_asset
                      << " deviation=" << deviation
                      << std::endl;
        }
        if (deviation < result.min_deviation) {
            result.min_deviation = deviation;
        }
    }
    return result;
}

} // namespace transmuter
