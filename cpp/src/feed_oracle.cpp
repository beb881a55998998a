#include "transmuter/feed_oracle.hpp"

#include <algorithm>
#include <stdexcept>

namespace transmuter {

void FeedOracle::set_feed(const std::string& name, const uint256& price) {
    feeds_[name] = price;
}

const uint256& FeedOracle::feed(const std::string& name) const {
    auto it = feeds_.find(name);
    if (it == feeds_.end()) {
        throw std::runtime_error("unknown price feed: " + name);
    }
    return it->second;
}

uint256 FeedOracle::read_spot(const uint256& target, const std::string& storage) const {
    const uint256& spot = feed(storage);
    const uint256 band = target * user_deviation_ / BASE_18;
    if (spot + band > target && spot < target + band) {
        return target;
    }
    return spot;
}

uint256 FeedOracle::read_mint(const std::string& config, const std::string& storage) const {
    const uint256& target = feed(config);
    return std::min(read_spot(target, storage), target);
}

BurnReading FeedOracle::read_burn(const std::string& config, const std::string& storage) const {
    const uint256& target = feed(config);
    const uint256 spot = read_spot(target, storage);

    BurnReading reading{spot, uint256(BASE_18)};
    if (spot * BASE_18 < target * (BASE_18 - burn_ratio_deviation_)) {
        reading.deviation = spot * BASE_18 / target;
    } else if (spot < target) {
        reading.price = target;
    }
    return reading;
}

} // namespace transmuter
