// Transmuter: mints a stablecoin against several collaterals and burns it back,
// charging fees that depend on how exposed the system is to each collateral.
//
// Owns the ledger and serializes every call on it; oracle, manager and token
// movements are external collaborators.
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "transmuter/collaborators.hpp"
#include "transmuter/setters.hpp"
#include "transmuter/swapper.hpp"
#include "transmuter/types.hpp"

namespace transmuter {

struct OracleValues {
    uint256 mint;
    uint256 burn;
    uint256 min_deviation;
};

class Transmuter {
public:
    Transmuter(std::string stablecoin, const Oracle& oracle, Manager& manager, TokenGateway& tokens);

    // ------------------------------ Swaps ------------------------------------
    uint256 swap_exact_input(
        const std::string& caller,
        const uint256& amount_in,
        const uint256& amount_out_min,
        const std::string& token_in,
        const std::string& token_out,
        const std::string& to,
        uint64_t deadline
    );

    uint256 swap_exact_output(
        const std::string& caller,
        const uint256& amount_out,
        const uint256& amount_in_max,
        const std::string& token_in,
        const std::string& token_out,
        const std::string& to,
        uint64_t deadline
    );

    uint256 quote_in(const uint256& amount_in, const std::string& token_in, const std::string& token_out) const;
    uint256 quote_out(const uint256& amount_out, const std::string& token_in, const std::string& token_out) const;

    // --------------------------- Administration ------------------------------
    void add_collateral(const std::string& asset, uint8_t decimals);
    void revoke_collateral(const std::string& asset);
    void set_fees(const std::string& asset, const std::vector<uint64_t>& x_fee, const std::vector<int64_t>& y_fee, ActionType action);
    void toggle_pause(const std::string& asset, ActionType action);
    void toggle_trusted(const std::string& address, bool seller = false);
    void set_oracle(const std::string& asset, const std::string& oracle_config, const std::string& oracle_storage);
    void set_manager(const std::string& asset, const std::string& manager_config);
    void unset_manager(const std::string& asset) { set_manager(asset, std::string()); }
    void adjust_stablecoins(const std::string& asset, const uint256& amount, bool increase);
    uint256 update_normalizer(const std::string& caller, const uint256& amount, bool increase);

    // ------------------------------ Views ------------------------------------
    const Ledger& ledger() const { return ledger_; }
    const std::string& stablecoin() const { return ledger_.stablecoin; }
    const std::vector<std::string>& get_collateral_list() const { return ledger_.collateral_list; }
    const Collateral& get_collateral_info(const std::string& asset) const { return ledger_.collateral(asset); }

    // (issued from `asset`, issued in total), in stablecoins
    std::pair<uint256, uint256> get_issued_by_collateral(const std::string& asset) const;
    uint256 get_total_issued() const;

    std::pair<std::vector<uint64_t>, std::vector<int64_t>> get_collateral_mint_fees(const std::string& asset) const;
    std::pair<std::vector<uint64_t>, std::vector<int64_t>> get_collateral_burn_fees(const std::string& asset) const;
    bool is_paused(const std::string& asset, ActionType action) const;
    bool is_trusted(const std::string& address) const;
    bool is_trusted_seller(const std::string& address) const;
    OracleValues get_oracle_values(const std::string& asset) const;

    // ------------------------ Testing helpers --------------------------------
    void set_block_timestamp(uint64_t ts) { block_timestamp_ = ts; }
    void advance_time(uint64_t seconds) { block_timestamp_ += seconds; }
    uint64_t block_timestamp() const { return block_timestamp_; }

private:
    // Rejects nested state-changing calls coming back through a collaborator
    class NonReentrant {
    public:
        explicit NonReentrant(bool& entered);
        ~NonReentrant() { entered_ = false; }
        NonReentrant(const NonReentrant&) = delete;
        NonReentrant& operator=(const NonReentrant&) = delete;

    private:
        bool& entered_;
    };

    Ledger ledger_;
    const Oracle& oracle_;
    Manager& manager_;
    Swapper swapper_;
    uint64_t block_timestamp_ = 0;
    bool entered_ = false;
};

} // namespace transmuter
