#include "transmuter/types.hpp"
#include "transmuter/errors.hpp"

namespace transmuter {

const Collateral& Ledger::collateral(const std::string& asset) const {
    auto it = collaterals.find(asset);
    if (it == collaterals.end() || it->second.decimals == 0) {
        throw TransmuterError(ErrorKind::NotCollateral, asset);
    }
    return it->second;
}

Collateral& Ledger::collateral(const std::string& asset) {
    auto it = collaterals.find(asset);
    if (it == collaterals.end() || it->second.decimals == 0) {
        throw TransmuterError(ErrorKind::NotCollateral, asset);
    }
    return it->second;
}

bool Ledger::is_collateral(const std::string& asset) const {
    auto it = collaterals.find(asset);
    return it != collaterals.end() && it->second.decimals != 0;
}

uint256 Ledger::to_normalized(const uint256& stables, Rounding rounding) const {
    return FixedPoint::mul_div(stables, BASE_27(), normalizer, rounding);
}

uint256 Ledger::to_stables(const uint256& normalized) const {
    return normalized * normalizer / BASE_27();
}

} // namespace transmuter
