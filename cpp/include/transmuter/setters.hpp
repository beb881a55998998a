#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "transmuter/collaborators.hpp"
#include "transmuter/types.hpp"

namespace transmuter {

// Administrative updates of the ledger. Access control lives outside the
// engine, except for the normalizer which only trusted callers may move.
class Setters {
public:
    static void add_collateral(Ledger& ledger, const std::string& asset, uint8_t decimals);

    // Only for collaterals that no longer back any stablecoin
    static void revoke_collateral(Ledger& ledger, Manager& manager, const std::string& asset);

    // Throws InvalidParams unless the curve is usable by the curve evaluator
    static void check_fees(
        const Ledger& ledger,
        const std::vector<uint64_t>& x_fee,
        const std::vector<int64_t>& y_fee,
        ActionType action
    );

    static void set_fees(
        Ledger& ledger,
        const std::string& asset,
        const std::vector<uint64_t>& x_fee,
        const std::vector<int64_t>& y_fee,
        ActionType action
    );

    static void toggle_pause(Ledger& ledger, const std::string& asset, ActionType action);
    static void toggle_trusted(Ledger& ledger, const std::string& address, bool seller);

    static void set_oracle(
        Ledger& ledger,
        const std::string& asset,
        const std::string& oracle_config,
        const std::string& oracle_storage
    );

    // An empty config detaches the manager and pulls every fund back
    static void set_manager(
        Ledger& ledger,
        Manager& manager,
        const std::string& asset,
        const std::string& manager_config
    );

    static void adjust_stablecoins(Ledger& ledger, const std::string& asset, const uint256& amount, bool increase);

    // Rebases every stablecoin balance by `amount` in total; returns the new normalizer
    static uint256 update_normalizer(Ledger& ledger, const std::string& caller, const uint256& amount, bool increase);
};

} // namespace transmuter
