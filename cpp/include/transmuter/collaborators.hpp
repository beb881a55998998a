#pragma once

#include <string>
#include <utility>

#include "transmuter/fixed_point.hpp"

namespace transmuter {

struct BurnReading {
    uint256 price;      // BASE_18
    uint256 deviation;  // BASE_18, 1.0 means on peg
};

class Oracle {
public:
    virtual ~Oracle() = default;
    virtual uint256 read_mint(const std::string& config, const std::string& storage) const = 0;
    virtual BurnReading read_burn(const std::string& config, const std::string& storage) const = 0;
};

// Holds the collateral that is deployed to yield strategies
class Manager {
public:
    virtual ~Manager() = default;
    // Collateral that can be paid out right away
    virtual uint256 max_available(const std::string& asset) const = 0;
    virtual void pull_all(const std::string& asset, const std::string& manager_config) = 0;
};

class TokenGateway {
public:
    virtual ~TokenGateway() = default;
    // is_mint: pull `amount` of `asset` from `account` into custody (the
    // manager target when non-empty). Otherwise pay it out of custody to `account`.
    virtual void transfer_collateral(
        const std::string& asset,
        const std::string& manager_target,
        const std::string& account,
        const uint256& amount,
        bool is_mint
    ) = 0;
    virtual void mint(const std::string& to, const uint256& amount) = 0;
    virtual void burn_self(const uint256& amount, const std::string& from) = 0;
};

} // namespace transmuter
