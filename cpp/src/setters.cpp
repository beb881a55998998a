#include "transmuter/setters.hpp"
#include "transmuter/errors.hpp"
#include "transmuter/trace.hpp"

#include <algorithm>
#include <functional>
#include <iostream>

namespace transmuter {

void Setters::add_collateral(Ledger& ledger, const std::string& asset, uint8_t decimals) {
    if (asset == ledger.stablecoin) {
        throw TransmuterError(ErrorKind::InvalidParams, "stablecoin cannot back itself");
    }
    if (decimals == 0) {
        throw TransmuterError(ErrorKind::InvalidParams, "zero decimals");
    }
    if (ledger.is_collateral(asset)) {
        throw TransmuterError(ErrorKind::AlreadyAdded, asset);
    }
    Collateral collat;
    collat.decimals = decimals;
    ledger.collaterals[asset] = collat;
    ledger.collateral_list.push_back(asset);
}

void Setters::revoke_collateral(Ledger& ledger, Manager& manager, const std::string& asset) {
    const Collateral& collat = ledger.collateral(asset);
    if (collat.normalized_stables > 0) {
        throw TransmuterError(ErrorKind::NotCollateral, asset + " still backs stablecoins");
    }
    if (collat.is_managed) {
        manager.pull_all(asset, collat.manager_config);
    }

    auto& list = ledger.collateral_list;
    auto it = std::find(list.begin(), list.end(), asset);
    if (it != list.end()) {
        *it = list.back();
        list.pop_back();
    }
    ledger.collaterals.erase(asset);
}

void Setters::check_fees(
    const Ledger& ledger,
    const std::vector<uint64_t>& x_fee,
    const std::vector<int64_t>& y_fee,
    ActionType action
) {
    const std::size_t n = x_fee.size();
    if (n == 0 || n != y_fee.size()) {
        throw TransmuterError(ErrorKind::InvalidParams, "fee arrays");
    }

    const bool mint = action == ActionType::Mint;
    const int64_t min_fee = -static_cast<int64_t>(BASE_9);
    const int64_t max_fee = mint ? static_cast<int64_t>(BASE_12) : static_cast<int64_t>(BASE_9);

    // Mint breakpoints live in [0, BASE_9[ starting at 0. Burn breakpoints start
    // at BASE_9 and the first burn segment is flat.
    if (mint && (x_fee[0] != 0 || x_fee[n - 1] >= BASE_9)) {
        throw TransmuterError(ErrorKind::InvalidParams, "mint breakpoints");
    }
    if (!mint && (x_fee[0] != BASE_9 || (n > 1 && y_fee[0] != y_fee[1]))) {
        throw TransmuterError(ErrorKind::InvalidParams, "burn breakpoints");
    }

    for (std::size_t i = 0; i < n; ++i) {
        if (y_fee[i] <= min_fee || y_fee[i] > max_fee) {
            throw TransmuterError(ErrorKind::InvalidParams, "fee out of bounds");
        }
        if (i + 1 == n) {
            break;
        }
        const bool x_ordered = mint ? x_fee[i] < x_fee[i + 1] : x_fee[i] > x_fee[i + 1];
        if (!x_ordered || y_fee[i + 1] < y_fee[i]) {
            throw TransmuterError(ErrorKind::InvalidParams, "fee curve not monotonic");
        }
    }

    // A mint followed by a burn, through any pair of collaterals, must not
    // return more than it cost
    if (y_fee[0] < 0) {
        for (const auto& asset : ledger.collateral_list) {
            const Collateral& collat = ledger.collateral(asset);
            const auto& counterpart = mint ? collat.y_fee_burn : collat.y_fee_mint;
            if (!counterpart.empty() && y_fee[0] + counterpart[0] < 0) {
                throw TransmuterError(ErrorKind::InvalidParams, "negative fees open an arbitrage with " + asset);
            }
        }
    }
}

void Setters::set_fees(
    Ledger& ledger,
    const std::string& asset,
    const std::vector<uint64_t>& x_fee,
    const std::vector<int64_t>& y_fee,
    ActionType action
) {
    Collateral& collat = ledger.collateral(asset);
    check_fees(ledger, x_fee, y_fee, action);
    if (action == ActionType::Mint) {
        collat.x_fee_mint = x_fee;
        collat.y_fee_mint = y_fee;
    } else {
        collat.x_fee_burn = x_fee;
        collat.y_fee_burn = y_fee;
    }
}

void Setters::toggle_pause(Ledger& ledger, const std::string& asset, ActionType action) {
    Collateral& collat = ledger.collateral(asset);
    if (action == ActionType::Mint) {
        collat.is_mint_live = !collat.is_mint_live;
    } else {
        collat.is_burn_live = !collat.is_burn_live;
    }
}

void Setters::toggle_trusted(Ledger& ledger, const std::string& address, bool seller) {
    auto& trusted = seller ? ledger.is_seller_trusted : ledger.is_trusted;
    if (trusted.count(address)) {
        trusted.erase(address);
    } else {
        trusted.insert(address);
    }
}

void Setters::set_oracle(
    Ledger& ledger,
    const std::string& asset,
    const std::string& oracle_config,
    const std::string& oracle_storage
) {
    Collateral& collat = ledger.collateral(asset);
    collat.oracle_config = oracle_config;
    collat.oracle_storage = oracle_storage;
    collat.oracle_config_hash = std::hash<std::string>{}(oracle_config);
}

void Setters::set_manager(
    Ledger& ledger,
    Manager& manager,
    const std::string& asset,
    const std::string& manager_config
) {
    Collateral& collat = ledger.collateral(asset);
    if (manager_config.empty()) {
        if (collat.is_managed) {
            manager.pull_all(asset, collat.manager_config);
        }
        collat.is_managed = false;
        collat.manager_config.clear();
        return;
    }
    collat.is_managed = true;
    collat.manager_config = manager_config;
}

void Setters::adjust_stablecoins(Ledger& ledger, const std::string& asset, const uint256& amount, bool increase) {
    Collateral& collat = ledger.collateral(asset);
    const uint256 normalized = amount * BASE_27() / ledger.normalizer;
    if (increase) {
        // total first: it overflows before any single collateral does
        ledger.normalized_stables += normalized;
        collat.normalized_stables += normalized;
        return;
    }
    if (normalized > collat.normalized_stables) {
        throw TransmuterError(ErrorKind::InvalidParams, "adjustment below zero");
    }
    ledger.normalized_stables -= normalized;
    collat.normalized_stables -= normalized;
}

uint256 Setters::update_normalizer(Ledger& ledger, const std::string& caller, const uint256& amount, bool increase) {
    if (!ledger.is_trusted.count(caller) && !ledger.is_seller_trusted.count(caller)) {
        throw TransmuterError(ErrorKind::NotTrusted, caller);
    }

    uint256 new_normalizer;
    if (ledger.normalized_stables == 0) {
        new_normalizer = BASE_27();
    } else if (increase) {
        new_normalizer = ledger.normalizer + amount * BASE_27() / ledger.normalized_stables;
    } else {
        new_normalizer = ledger.normalizer - amount * BASE_27() / ledger.normalized_stables;
    }

    // Far from BASE_27, rounding errors start to compound: fold the normalizer
    // into every counter and start over from BASE_27
    if (new_normalizer <= BASE_18 || new_normalizer >= BASE_36()) {
        std::vector<uint256> rescaled;
        rescaled.reserve(ledger.collateral_list.size());
        uint256 new_total = 0;
        for (const auto& asset : ledger.collateral_list) {
            rescaled.push_back(ledger.collateral(asset).normalized_stables * new_normalizer / BASE_27());
            new_total += rescaled.back();
        }
        for (std::size_t i = 0; i < rescaled.size(); ++i) {
            ledger.collateral(ledger.collateral_list[i]).normalized_stables = rescaled[i];
        }
        ledger.normalized_stables = new_total;
        new_normalizer = BASE_27();
    }
    ledger.normalizer = new_normalizer;

    if (trace_enabled()) {
        std::cout << "TRACE normalizer value=" << ledger.normalizer
                  << " total_normalized=" << ledger.normalized_stables
                  << std::endl;
    }
    return ledger.normalizer;
}

} // namespace transmuter
