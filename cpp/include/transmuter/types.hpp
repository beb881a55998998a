#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "transmuter/fixed_point.hpp"

namespace transmuter {

enum class ActionType { Mint, Burn };

enum class QuoteType {
    MintExactInput,
    MintExactOutput,
    BurnExactInput,
    BurnExactOutput
};

inline bool is_mint(QuoteType t) {
    return t == QuoteType::MintExactInput || t == QuoteType::MintExactOutput;
}

// True when the amount walked along the curve is the stablecoin amount itself
inline bool is_exact(QuoteType t) {
    return t == QuoteType::MintExactOutput || t == QuoteType::BurnExactInput;
}

struct Collateral {
    // zero means not registered
    uint8_t decimals = 0;
    bool is_mint_live = false;
    bool is_burn_live = false;

    // share of Ledger::normalized_stables
    uint256 normalized_stables = 0;

    // Mint: x increasing from 0. Burn: x decreasing from BASE_9.
    std::vector<uint64_t> x_fee_mint;
    std::vector<int64_t> y_fee_mint;
    std::vector<uint64_t> x_fee_burn;
    std::vector<int64_t> y_fee_burn;

    // Opaque to the engine, interpreted by the oracle
    std::string oracle_config;
    std::string oracle_storage;
    std::size_t oracle_config_hash = 0;

    bool is_managed = false;
    std::string manager_config;
};

// Process-wide state. Only settlement and the admin setters mutate it, and
// always through an exclusive reference.
struct Ledger {
    std::string stablecoin;
    uint256 normalized_stables = 0;
    uint256 normalizer = BASE_27();

    std::vector<std::string> collateral_list;
    std::unordered_map<std::string, Collateral> collaterals;

    std::set<std::string> is_trusted;
    std::set<std::string> is_seller_trusted;

    // Throws NotCollateral for unknown assets and revoked records
    const Collateral& collateral(const std::string& asset) const;
    Collateral& collateral(const std::string& asset);

    bool is_collateral(const std::string& asset) const;

    uint256 to_normalized(const uint256& stables, Rounding rounding) const;
    uint256 to_stables(const uint256& normalized) const;
};

} // namespace transmuter
