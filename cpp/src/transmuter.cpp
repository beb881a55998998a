#include "transmuter/transmuter.hpp"
#include "transmuter/errors.hpp"

#include <chrono>

namespace transmuter {

Transmuter::NonReentrant::NonReentrant(bool& entered) : entered_(entered) {
    if (entered_) {
        throw TransmuterError(ErrorKind::ReentrantCall);
    }
    entered_ = true;
}

Transmuter::Transmuter(std::string stablecoin, const Oracle& oracle, Manager& manager, TokenGateway& tokens)
    : oracle_(oracle), manager_(manager), swapper_(oracle, manager, tokens) {
    ledger_.stablecoin = std::move(stablecoin);
    block_timestamp_ = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

// ------------------------------- swaps ---------------------------------------

uint256 Transmuter::swap_exact_input(
    const std::string& caller,
    const uint256& amount_in,
    const uint256& amount_out_min,
    const std::string& token_in,
    const std::string& token_out,
    const std::string& to,
    uint64_t deadline
) {
    NonReentrant guard(entered_);
    return swapper_.swap_exact_input(ledger_, caller, amount_in, amount_out_min, token_in, token_out, to, deadline, block_timestamp_);
}

uint256 Transmuter::swap_exact_output(
    const std::string& caller,
    const uint256& amount_out,
    const uint256& amount_in_max,
    const std::string& token_in,
    const std::string& token_out,
    const std::string& to,
    uint64_t deadline
) {
    NonReentrant guard(entered_);
    return swapper_.swap_exact_output(ledger_, caller, amount_out, amount_in_max, token_in, token_out, to, deadline, block_timestamp_);
}

uint256 Transmuter::quote_in(const uint256& amount_in, const std::string& token_in, const std::string& token_out) const {
    return swapper_.quote_in(ledger_, amount_in, token_in, token_out);
}

uint256 Transmuter::quote_out(const uint256& amount_out, const std::string& token_in, const std::string& token_out) const {
    return swapper_.quote_out(ledger_, amount_out, token_in, token_out);
}

// --------------------------- administration ----------------------------------

void Transmuter::add_collateral(const std::string& asset, uint8_t decimals) {
    NonReentrant guard(entered_);
    Setters::add_collateral(ledger_, asset, decimals);
}

void Transmuter::revoke_collateral(const std::string& asset) {
    NonReentrant guard(entered_);
    Setters::revoke_collateral(ledger_, manager_, asset);
}

void Transmuter::set_fees(
    const std::string& asset,
    const std::vector<uint64_t>& x_fee,
    const std::vector<int64_t>& y_fee,
    ActionType action
) {
    NonReentrant guard(entered_);
    Setters::set_fees(ledger_, asset, x_fee, y_fee, action);
}

void Transmuter::toggle_pause(const std::string& asset, ActionType action) {
    NonReentrant guard(entered_);
    Setters::toggle_pause(ledger_, asset, action);
}

void Transmuter::toggle_trusted(const std::string& address, bool seller) {
    NonReentrant guard(entered_);
    Setters::toggle_trusted(ledger_, address, seller);
}

void Transmuter::set_oracle(const std::string& asset, const std::string& oracle_config, const std::string& oracle_storage) {
    NonReentrant guard(entered_);
    Setters::set_oracle(ledger_, asset, oracle_config, oracle_storage);
}

void Transmuter::set_manager(const std::string& asset, const std::string& manager_config) {
    NonReentrant guard(entered_);
    Setters::set_manager(ledger_, manager_, asset, manager_config);
}

void Transmuter::adjust_stablecoins(const std::string& asset, const uint256& amount, bool increase) {
    NonReentrant guard(entered_);
    Setters::adjust_stablecoins(ledger_, asset, amount, increase);
}

uint256 Transmuter::update_normalizer(const std::string& caller, const uint256& amount, bool increase) {
    NonReentrant guard(entered_);
    return Setters::update_normalizer(ledger_, caller, amount, increase);
}

// ------------------------------- views ---------------------------------------

std::pair<uint256, uint256> Transmuter::get_issued_by_collateral(const std::string& asset) const {
    const Collateral& collat = ledger_.collateral(asset);
    return {ledger_.to_stables(collat.normalized_stables), ledger_.to_stables(ledger_.normalized_stables)};
}

uint256 Transmuter::get_total_issued() const {
    return ledger_.to_stables(ledger_.normalized_stables);
}

std::pair<std::vector<uint64_t>, std::vector<int64_t>> Transmuter::get_collateral_mint_fees(const std::string& asset) const {
    const Collateral& collat = ledger_.collateral(asset);
    return {collat.x_fee_mint, collat.y_fee_mint};
}

std::pair<std::vector<uint64_t>, std::vector<int64_t>> Transmuter::get_collateral_burn_fees(const std::string& asset) const {
    const Collateral& collat = ledger_.collateral(asset);
    return {collat.x_fee_burn, collat.y_fee_burn};
}

bool Transmuter::is_paused(const std::string& asset, ActionType action) const {
    const Collateral& collat = ledger_.collateral(asset);
    return action == ActionType::Mint ? !collat.is_mint_live : !collat.is_burn_live;
}

bool Transmuter::is_trusted(const std::string& address) const {
    return ledger_.is_trusted.count(address) > 0;
}

bool Transmuter::is_trusted_seller(const std::string& address) const {
    return ledger_.is_seller_trusted.count(address) > 0;
}

OracleValues Transmuter::get_oracle_values(const std::string& asset) const {
    const Collateral& collat = ledger_.collateral(asset);
    BurnOracle burn = swapper_.quoter().get_burn_oracle(ledger_, asset);
    return {oracle_.read_mint(collat.oracle_config, collat.oracle_storage), burn.oracle_value, burn.min_deviation};
}

} // namespace transmuter
