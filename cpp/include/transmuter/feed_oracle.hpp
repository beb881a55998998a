#pragma once

#include <map>
#include <string>

#include "transmuter/collaborators.hpp"

namespace transmuter {

// Oracle over named price feeds (BASE_18). A collateral's oracle config names
// its peg target feed, its oracle storage names its spot feed.
class FeedOracle : public Oracle {
public:
    FeedOracle() = default;
    FeedOracle(uint256 user_deviation, uint256 burn_ratio_deviation)
        : user_deviation_(std::move(user_deviation)), burn_ratio_deviation_(std::move(burn_ratio_deviation)) {}

    void set_feed(const std::string& name, const uint256& price);
    const uint256& feed(const std::string& name) const;

    uint256 read_mint(const std::string& config, const std::string& storage) const override;
    BurnReading read_burn(const std::string& config, const std::string& storage) const override;

private:
    // spot, snapped to the target when within user_deviation_ of it
    uint256 read_spot(const uint256& target, const std::string& storage) const;

    std::map<std::string, uint256> feeds_;
    uint256 user_deviation_ = 0;
    uint256 burn_ratio_deviation_ = 0;
};

} // namespace transmuter
